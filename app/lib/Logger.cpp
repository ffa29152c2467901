#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

const std::vector<std::string> kLoggerNames = {"core_logger"};
}


void Logger::setup_loggers(const std::string& log_dir, spdlog::level::level_enum level)
{
    const std::filesystem::path dir = Utils::utf8_to_path(log_dir);
    std::filesystem::create_directories(dir);
    const std::string log_file = Utils::path_to_utf8(dir / kLogFileName);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);
    console_sink->set_pattern("[%^%l%$] %v");

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_level(level);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");

    for (const auto& name : kLoggerNames) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


std::optional<spdlog::level::level_enum> Logger::parse_level(const std::string& value)
{
    const std::string token = Utils::to_lower_ascii(Utils::trim(value));
    if (token == "trace") return spdlog::level::trace;
    if (token == "debug") return spdlog::level::debug;
    if (token == "info") return spdlog::level::info;
    if (token == "warn" || token == "warning") return spdlog::level::warn;
    if (token == "error") return spdlog::level::err;
    if (token == "critical") return spdlog::level::critical;
    if (token == "off") return spdlog::level::off;
    return std::nullopt;
}
