#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>

#include <filesystem>
#include <string>

#include <spdlog/common.h>


class Settings
{
public:
    Settings();

    /**
     * @brief Read config.ini. A missing file keeps the defaults and returns false.
     * @throws ErrorCodes::AppException CONFIG_INVALID for an unparseable value.
     */
    bool load();

    /**
     * @throws ErrorCodes::AppException CONFIG_SAVE_FAILED when the file cannot be written.
     */
    void save();

    bool get_strip_diacritics() const;
    void set_strip_diacritics(bool value);

    bool get_title_case() const;
    void set_title_case(bool value);

    AuthorOrder get_author_order() const;
    void set_author_order(AuthorOrder value);

    std::string get_default_extension() const;
    void set_default_extension(const std::string& value);

    spdlog::level::level_enum get_log_level() const;
    void set_log_level(spdlog::level::level_enum value);

    NormalizationOptions get_normalization_options() const;

    std::string define_config_path() const;
    std::string get_config_path() const;
    std::string get_config_dir() const;

private:
    bool read_bool(const std::string& section, const std::string& key, bool fallback) const;

    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    bool strip_diacritics{false};
    bool title_case{true};
    AuthorOrder author_order{AuthorOrder::FirstLast};
    std::string default_extension{".epub"};
    spdlog::level::level_enum log_level{spdlog::level::info};
};

#endif
