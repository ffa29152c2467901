#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cstdio>
#include <fstream>
#include <optional>
#include <utility>

#include <fmt/format.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* format, Args&&... args)
{
    auto message = fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::err) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

bool is_comment_or_blank(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}

std::optional<std::string> section_name(const std::string& line)
{
    if (line.size() < 2 || line.front() != '[' || line.back() != ']') {
        return std::nullopt;
    }
    return Utils::trim(line.substr(1, line.size() - 2));
}

std::optional<std::pair<std::string, std::string>> split_assignment(const std::string& line)
{
    const auto equals = line.find('=');
    if (equals == std::string::npos) {
        return std::nullopt;
    }
    std::string key = Utils::trim(line.substr(0, equals));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), Utils::trim(line.substr(equals + 1)));
}
}


bool IniConfig::load(const std::string& filename)
{
    std::ifstream file(Utils::utf8_to_path(filename));
    if (!file.is_open()) {
        ini_log(spdlog::level::debug, "Config file not readable: {}", filename);
        return false;
    }

    std::string raw_line;
    std::string section;
    std::size_t line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        if (!raw_line.empty() && raw_line.back() == '\r') {
            raw_line.pop_back();
        }
        const std::string line = Utils::trim(raw_line);
        if (is_comment_or_blank(line)) {
            continue;
        }
        if (auto name = section_name(line)) {
            section = std::move(*name);
            continue;
        }
        if (auto assignment = split_assignment(line)) {
            data[section][assignment->first] = std::move(assignment->second);
        } else {
            ini_log(spdlog::level::warn, "{}:{}: ignoring line without '='", filename, line_number);
        }
    }
    return true;
}


std::string IniConfig::getValue(const std::string& section,
                                const std::string& key,
                                const std::string& default_value) const
{
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        auto key_it = sec_it->second.find(key);
        if (key_it != sec_it->second.end()) {
            return key_it->second;
        }
    }
    return default_value;
}


void IniConfig::setValue(const std::string& section, const std::string& key, const std::string& value)
{
    data[section][key] = value;
}


bool IniConfig::save(const std::string& filename) const
{
    std::ofstream file(Utils::utf8_to_path(filename), std::ios::trunc);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file for writing: {}", filename);
        return false;
    }

    for (const auto& [section, values] : data) {
        file << "[" << section << "]\n";
        for (const auto& [key, value] : values) {
            file << key << " = " << value << "\n";
        }
        file << "\n";
    }
    return static_cast<bool>(file);
}


bool IniConfig::hasValue(const std::string& section, const std::string& key) const
{
    const auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return false;
    }
    return sec_it->second.find(key) != sec_it->second.end();
}
