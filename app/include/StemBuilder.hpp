#ifndef STEM_BUILDER_HPP
#define STEM_BUILDER_HPP

#include <cstddef>
#include <string>

/**
 * @brief Composes "{title} - {authors}" filename stems.
 */
class StemBuilder {
public:
    static constexpr std::size_t kMaxStemLength = 120;

    /**
     * @brief Sanitize title and authors separately, join them, cap the length.
     * @return Stem of at most kMaxStemLength code points, never ending in '.' or ' '.
     */
    static std::string build_stem(const std::string& title,
                                  const std::string& authors_joined,
                                  bool strip_diacritics);

    /**
     * @brief Sanitize the assembled name again, extension included.
     */
    static std::string build_file_name(const std::string& stem,
                                       const std::string& extension,
                                       bool strip_diacritics);

    /**
     * @brief Cut to @p max_length code points, then drop trailing dots and spaces.
     *        A cut that leaves nothing yields FilenameSanitizer::kFallbackName.
     */
    static std::string truncate_stem(const std::string& stem,
                                     std::size_t max_length = kMaxStemLength);
};

#endif
