/**
 * @file TestHelpers.hpp
 * @brief Common utilities for unit tests (temp paths, env guards, fixtures).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "Types.hpp"

/**
 * @brief Build a unique token string with the given prefix.
 * @param prefix Prefix to include in the token.
 * @return Unique token string that is safe for filenames.
 */
inline std::string make_unique_token(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    const uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::string(prefix) + std::to_string(now) + "-" + std::to_string(value);
}

/**
 * @brief RAII helper that sets and restores environment variables.
 */
class EnvVarGuard {
public:
    /**
     * @param key Environment variable name.
     * @param value New value; unset when std::nullopt.
     */
    EnvVarGuard(std::string key, std::optional<std::string> value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = existing;
        }
        apply(value);
    }

    ~EnvVarGuard() {
        apply(original_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    void apply(const std::optional<std::string>& value) {
#ifdef _WIN32
        _putenv_s(key_.c_str(), value ? value->c_str() : "");
#else
        if (value) {
            setenv(key_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
#endif
    }

    std::string key_;
    std::optional<std::string> original_;
};

/**
 * @brief Creates a temporary directory and removes it on destruction.
 */
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                make_unique_token("ebren-test-")) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Write @p contents to @p path, creating parent directories.
 */
inline void write_text_file(const std::filesystem::path& path, const std::string& contents) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline BookRecord make_record(std::string file_name,
                              std::optional<std::string> title,
                              std::vector<std::string> authors) {
    BookRecord record;
    record.source_id = file_name;
    record.source_file_name = std::move(file_name);
    record.metadata.title = std::move(title);
    record.metadata.authors = std::move(authors);
    return record;
}
