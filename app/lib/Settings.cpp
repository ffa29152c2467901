#include "Settings.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "RenamePlanner.hpp"
#include "Utils.hpp"

#include <cstdlib>
#include <system_error>

#include <fmt/format.h>
#ifdef _WIN32
    #include <shlobj.h>
    #include <windows.h>
#endif

namespace {
constexpr const char* kAppName = "EbookRenamer";
constexpr const char* kConfigDirEnv = "EBOOK_RENAMER_CONFIG_DIR";

constexpr const char* kNormalizationSection = "Normalization";
constexpr const char* kOutputSection = "Output";
constexpr const char* kLoggingSection = "Logging";

const char* bool_to_string(bool value)
{
    return value ? "true" : "false";
}

std::string normalize_extension(std::string value)
{
    value = Utils::trim(value);
    if (!value.empty() && value.front() != '.') {
        value.insert(value.begin(), '.');
    }
    return value;
}
}


std::optional<AuthorOrder> author_order_from_string(std::string_view value)
{
    const std::string key = Utils::to_lower_ascii(Utils::trim(std::string(value)));
    if (key == "as-is" || key == "asis" || key == "as_is") {
        return AuthorOrder::AsIs;
    }
    if (key == "firstlast" || key == "first-last" || key == "first_last") {
        return AuthorOrder::FirstLast;
    }
    if (key == "lastfirst" || key == "last-first" || key == "last_first") {
        return AuthorOrder::LastFirst;
    }
    return std::nullopt;
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = Utils::utf8_to_path(config_path).parent_path();
}


std::string Settings::define_config_path() const
{
    if (const char* override_root = std::getenv(kConfigDirEnv)) {
        if (*override_root != '\0') {
            std::filesystem::path base = Utils::utf8_to_path(override_root);
            return Utils::path_to_utf8(base / kAppName / "config.ini");
        }
    }
#ifdef _WIN32
    char appDataPath[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_APPDATA, NULL, 0, appDataPath))) {
        return std::string(appDataPath) + "\\" + kAppName + "\\config.ini";
    }
#else
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config/" + kAppName + "/config.ini";
    }
#endif
    return "config.ini";
}


std::string Settings::get_config_path() const
{
    return config_path;
}


std::string Settings::get_config_dir() const
{
    return Utils::path_to_utf8(config_dir);
}


bool Settings::read_bool(const std::string& section, const std::string& key, bool fallback) const
{
    if (!config.hasValue(section, key)) {
        return fallback;
    }
    const std::string raw = config.getValue(section, key);
    if (auto parsed = Utils::parse_bool(raw)) {
        return *parsed;
    }
    THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID,
                    fmt::format("[{}] {} = '{}' is not a boolean", section, key, raw));
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("No config at '{}', using defaults", config_path);
        }
        return false;
    }

    strip_diacritics = read_bool(kNormalizationSection, "StripDiacritics", strip_diacritics);
    title_case = read_bool(kNormalizationSection, "TitleCase", title_case);

    if (config.hasValue(kNormalizationSection, "AuthorFormat")) {
        const std::string raw = config.getValue(kNormalizationSection, "AuthorFormat");
        auto parsed = author_order_from_string(raw);
        if (!parsed) {
            THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID,
                            fmt::format("[Normalization] AuthorFormat = '{}' is not one of "
                                        "as-is, firstlast, lastfirst", raw));
        }
        author_order = *parsed;
    }

    if (config.hasValue(kOutputSection, "DefaultExtension")) {
        const std::string raw = config.getValue(kOutputSection, "DefaultExtension");
        const std::string extension = normalize_extension(raw);
        if (!RenamePlanner::is_plausible_extension(extension)) {
            THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID,
                            fmt::format("[Output] DefaultExtension = '{}' is not a file extension", raw));
        }
        default_extension = extension;
    }

    if (config.hasValue(kLoggingSection, "Level")) {
        const std::string raw = config.getValue(kLoggingSection, "Level");
        auto parsed = Logger::parse_level(raw);
        if (!parsed) {
            THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID,
                            fmt::format("[Logging] Level = '{}' is not a log level", raw));
        }
        log_level = *parsed;
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded settings from '{}' (ascii: {}, titlecase: {}, authorformat: {}, extension: {})",
                     config_path, strip_diacritics, title_case, to_string(author_order),
                     default_extension);
    }
    return true;
}


void Settings::save()
{
    config.setValue(kNormalizationSection, "StripDiacritics", bool_to_string(strip_diacritics));
    config.setValue(kNormalizationSection, "TitleCase", bool_to_string(title_case));
    config.setValue(kNormalizationSection, "AuthorFormat", to_string(author_order));
    config.setValue(kOutputSection, "DefaultExtension", default_extension);
    config.setValue(kLoggingSection, "Level",
                    std::string(spdlog::level::to_string_view(log_level).data(),
                                spdlog::level::to_string_view(log_level).size()));

    std::error_code ec;
    std::filesystem::create_directories(config_dir, ec);
    if (ec) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED,
                        fmt::format("{}: {}", get_config_dir(), ec.message()));
    }
    if (!config.save(config_path)) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, config_path);
    }
}


bool Settings::get_strip_diacritics() const
{
    return strip_diacritics;
}


void Settings::set_strip_diacritics(bool value)
{
    strip_diacritics = value;
}


bool Settings::get_title_case() const
{
    return title_case;
}


void Settings::set_title_case(bool value)
{
    title_case = value;
}


AuthorOrder Settings::get_author_order() const
{
    return author_order;
}


void Settings::set_author_order(AuthorOrder value)
{
    author_order = value;
}


std::string Settings::get_default_extension() const
{
    return default_extension;
}


void Settings::set_default_extension(const std::string& value)
{
    const std::string extension = normalize_extension(value);
    if (RenamePlanner::is_plausible_extension(extension)) {
        default_extension = extension;
    }
}


spdlog::level::level_enum Settings::get_log_level() const
{
    return log_level;
}


void Settings::set_log_level(spdlog::level::level_enum value)
{
    log_level = value;
}


NormalizationOptions Settings::get_normalization_options() const
{
    NormalizationOptions options;
    options.strip_diacritics = strip_diacritics;
    options.apply_title_case = title_case;
    options.author_order = author_order;
    return options;
}
