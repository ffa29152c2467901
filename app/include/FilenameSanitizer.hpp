#ifndef FILENAME_SANITIZER_HPP
#define FILENAME_SANITIZER_HPP

#include <string>

/**
 * @brief Turns arbitrary text into a portable file or folder name.
 *
 * The forbidden character set is the Windows one (control characters and
 * `" < > | : * ? \ /`), so a name that passes here is valid on every common
 * filesystem. sanitize() is total: it never throws and never returns an empty string.
 */
class FilenameSanitizer {
public:
    static constexpr const char* kFallbackName = "Untitled";

    /**
     * @brief Full sanitization pass.
     *
     * Steps, in order: typographic punctuation to ASCII, optional diacritic
     * stripping, forbidden characters to spaces, whitespace collapse and trim,
     * trailing ". ;:," clutter removal, "Untitled" fallback, reserved device
     * name prefixing.
     *
     * @param input Raw text, any UTF-8.
     * @param strip_diacritics Decompose and drop combining marks ("é" -> "e").
     */
    static std::string sanitize(const std::string& input, bool strip_diacritics);

    /**
     * @brief Map dashes to '-', the ellipsis glyph to '.', curly quotes to straight ones.
     */
    static std::string normalize_punctuation(const std::string& input);

    /**
     * @brief NFD, drop combining marks, NFC. Returns the input unchanged if ICU
     *        normalization data is unavailable.
     */
    static std::string remove_diacritics(const std::string& input);

    static bool is_forbidden_char(char32_t ch);
    static bool is_reserved_device_name(const std::string& name);
};

#endif
