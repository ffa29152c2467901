#include "FilenameSanitizer.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

#include <array>
#include <unordered_set>

namespace {

bool is_blank(const std::u32string& text)
{
    for (const char32_t ch : text) {
        if (!Utils::is_whitespace(ch)) {
            return false;
        }
    }
    return true;
}

bool is_combining_mark(UChar32 ch)
{
    const int8_t category = u_charType(ch);
    return category == U_NON_SPACING_MARK
        || category == U_COMBINING_SPACING_MARK
        || category == U_ENCLOSING_MARK;
}

bool is_trailing_clutter(char32_t ch)
{
    return ch == U'.' || ch == U' ' || ch == U';' || ch == U':' || ch == U',';
}

const std::unordered_set<std::string>& reserved_device_names()
{
    static const std::unordered_set<std::string> names = {
        "con", "prn", "aux", "nul",
        "com1", "com2", "com3", "com4", "com5", "com6", "com7", "com8", "com9",
        "lpt1", "lpt2", "lpt3", "lpt4", "lpt5", "lpt6", "lpt7", "lpt8", "lpt9"
    };
    return names;
}

} // namespace


std::string FilenameSanitizer::sanitize(const std::string& input, bool strip_diacritics)
{
    if (is_blank(Utils::to_code_points(input))) {
        return kFallbackName;
    }

    std::string normalized = normalize_punctuation(input);
    if (strip_diacritics) {
        normalized = remove_diacritics(normalized);
    }

    std::u32string replaced = Utils::to_code_points(normalized);
    for (char32_t& ch : replaced) {
        if (is_forbidden_char(ch)) {
            ch = U' ';
        }
    }

    std::u32string cleaned = Utils::trim(Utils::collapse_whitespace(replaced));
    while (!cleaned.empty() && is_trailing_clutter(cleaned.back())) {
        cleaned.pop_back();
    }

    if (cleaned.empty()) {
        return kFallbackName;
    }

    std::string result = Utils::from_code_points(cleaned);
    if (is_reserved_device_name(result)) {
        result.insert(result.begin(), '_');
    }
    return result;
}


std::string FilenameSanitizer::normalize_punctuation(const std::string& input)
{
    std::u32string text = Utils::to_code_points(input);
    for (char32_t& ch : text) {
        switch (ch) {
            case U'—': // em dash
            case U'–': // en dash
            case U'―': // horizontal bar
                ch = U'-';
                break;
            case U'…':
                ch = U'.';
                break;
            case U'“':
            case U'”':
                ch = U'"';
                break;
            case U'‘':
            case U'’':
                ch = U'\'';
                break;
            default:
                break;
        }
    }
    return Utils::from_code_points(text);
}


std::string FilenameSanitizer::remove_diacritics(const std::string& input)
{
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfd = icu::Normalizer2::getNFDInstance(status);
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("ICU normalizer unavailable ({}); keeping diacritics", u_errorName(status));
        }
        return input;
    }

    const icu::UnicodeString source = icu::UnicodeString::fromUTF8(input);
    const icu::UnicodeString decomposed = nfd->normalize(source, status);
    if (U_FAILURE(status)) {
        return input;
    }

    icu::UnicodeString stripped;
    for (int32_t i = 0; i < decomposed.length();) {
        const UChar32 ch = decomposed.char32At(i);
        if (!is_combining_mark(ch)) {
            stripped.append(ch);
        }
        i += U16_LENGTH(ch);
    }

    const icu::UnicodeString composed = nfc->normalize(stripped, status);
    if (U_FAILURE(status)) {
        return input;
    }

    std::string result;
    composed.toUTF8String(result);
    return result;
}


bool FilenameSanitizer::is_forbidden_char(char32_t ch)
{
    static constexpr std::array<char32_t, 9> kForbidden = {
        U'"', U'<', U'>', U'|', U':', U'*', U'?', U'\\', U'/'
    };
    if (ch < 0x20) {
        return true;
    }
    for (const char32_t forbidden : kForbidden) {
        if (ch == forbidden) {
            return true;
        }
    }
    return false;
}


bool FilenameSanitizer::is_reserved_device_name(const std::string& name)
{
    return reserved_device_names().contains(Utils::to_lower_ascii(name));
}
