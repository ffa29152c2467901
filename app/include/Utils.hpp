#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief UTF-8 / code point helpers shared by the naming pipeline.
 *
 * Strings travel through the application as UTF-8. Transforms that need to
 * classify characters work on std::u32string, one element per code point;
 * ill-formed UTF-8 decodes to U+FFFD.
 */
namespace Utils {

std::u32string to_code_points(std::string_view utf8);
std::string from_code_points(const std::u32string& code_points);
std::size_t code_point_count(std::string_view utf8);

bool is_whitespace(char32_t ch);
bool is_letter(char32_t ch);
bool is_letter_or_digit(char32_t ch);
bool is_upper(char32_t ch);
char32_t to_upper(char32_t ch);
char32_t to_lower(char32_t ch);

/**
 * @brief Replace every whitespace run with a single space. Does not trim.
 */
std::u32string collapse_whitespace(const std::u32string& text);
std::string collapse_whitespace(const std::string& text);

std::u32string trim(const std::u32string& text);
std::string trim(const std::string& text);

/**
 * @brief Unicode default case folding, used as the key for case-insensitive comparisons.
 */
std::string fold_case(std::string_view text);
std::string to_lower_ascii(std::string value);

/**
 * @brief Lenient boolean parsing: 1/0, true/false, yes/no, y/n (case-insensitive).
 */
std::optional<bool> parse_bool(std::string_view value);

std::filesystem::path utf8_to_path(const std::string& value);
std::string path_to_utf8(const std::filesystem::path& path);

} // namespace Utils

#endif
