#include "Utils.hpp"

#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

#include <algorithm>
#include <cctype>

namespace Utils {

std::u32string to_code_points(std::string_view utf8)
{
    const icu::UnicodeString text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));

    std::u32string code_points;
    code_points.reserve(static_cast<std::size_t>(text.length()));
    for (int32_t i = 0; i < text.length();) {
        const UChar32 ch = text.char32At(i);
        code_points.push_back(static_cast<char32_t>(ch));
        i += U16_LENGTH(ch);
    }
    return code_points;
}


std::string from_code_points(const std::u32string& code_points)
{
    icu::UnicodeString text;
    for (const char32_t ch : code_points) {
        text.append(static_cast<UChar32>(ch));
    }
    std::string utf8;
    text.toUTF8String(utf8);
    return utf8;
}


std::size_t code_point_count(std::string_view utf8)
{
    return to_code_points(utf8).size();
}


bool is_whitespace(char32_t ch)
{
    return u_isUWhiteSpace(static_cast<UChar32>(ch)) != 0;
}

bool is_letter(char32_t ch)
{
    return u_isalpha(static_cast<UChar32>(ch)) != 0;
}

bool is_letter_or_digit(char32_t ch)
{
    return u_isalnum(static_cast<UChar32>(ch)) != 0;
}

bool is_upper(char32_t ch)
{
    return u_isupper(static_cast<UChar32>(ch)) != 0;
}

char32_t to_upper(char32_t ch)
{
    return static_cast<char32_t>(u_toupper(static_cast<UChar32>(ch)));
}

char32_t to_lower(char32_t ch)
{
    return static_cast<char32_t>(u_tolower(static_cast<UChar32>(ch)));
}


std::u32string collapse_whitespace(const std::u32string& text)
{
    std::u32string collapsed;
    collapsed.reserve(text.size());
    bool last_space = false;
    for (const char32_t ch : text) {
        if (is_whitespace(ch)) {
            if (!last_space) {
                collapsed.push_back(U' ');
                last_space = true;
            }
        } else {
            collapsed.push_back(ch);
            last_space = false;
        }
    }
    return collapsed;
}


std::string collapse_whitespace(const std::string& text)
{
    return from_code_points(collapse_whitespace(to_code_points(text)));
}


std::u32string trim(const std::u32string& text)
{
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_whitespace(text[begin])) {
        ++begin;
    }
    while (end > begin && is_whitespace(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}


std::string trim(const std::string& text)
{
    return from_code_points(trim(to_code_points(text)));
}


std::string fold_case(std::string_view text)
{
    icu::UnicodeString folded = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    folded.foldCase(U_FOLD_CASE_DEFAULT);
    std::string utf8;
    folded.toUTF8String(utf8);
    return utf8;
}


std::string to_lower_ascii(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}


std::optional<bool> parse_bool(std::string_view value)
{
    const std::string token = to_lower_ascii(trim(std::string(value)));
    if (token == "1" || token == "true" || token == "yes" || token == "y") {
        return true;
    }
    if (token == "0" || token == "false" || token == "no" || token == "n") {
        return false;
    }
    return std::nullopt;
}


std::filesystem::path utf8_to_path(const std::string& value)
{
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
}


std::string path_to_utf8(const std::filesystem::path& path)
{
    const std::u8string utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
}

} // namespace Utils
