#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

/**
 * @brief Registers the application's spdlog loggers and hands them out by name.
 *
 * Library code only logs when get_logger() returns a logger, so the pipeline
 * can run (and be tested) without setup_loggers() ever being called.
 */
class Logger {
public:
    /**
     * @brief Create "core_logger" with a stderr sink and a rotating file sink.
     * @param log_dir Directory for the log file; created when missing.
     * @param level Minimum level for both sinks.
     * @throws std::exception when the directory or file sink cannot be created.
     */
    static void setup_loggers(const std::string& log_dir,
                              spdlog::level::level_enum level = spdlog::level::info);

    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    /**
     * @brief Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
     */
    static std::optional<spdlog::level::level_enum> parse_level(const std::string& value);

    static constexpr const char* kLogFileName = "ebook-renamer.log";
};

#endif
