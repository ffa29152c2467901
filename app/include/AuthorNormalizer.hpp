#ifndef AUTHOR_NORMALIZER_HPP
#define AUTHOR_NORMALIZER_HPP

#include "Types.hpp"

#include <string>
#include <vector>

/**
 * @brief Conservative "Last, First" reordering for single author fields.
 *
 * Reordering only happens when a comma makes the structure explicit and the
 * field cannot be two authors joined by a comma; otherwise the cleaned input
 * comes back unchanged.
 */
class AuthorNormalizer {
public:
    static std::string normalize(const std::string& author, AuthorOrder order);

    /**
     * @brief "Doe ,  Jane,,Jr." -> "Doe, Jane, Jr."
     */
    static std::string normalize_comma_spacing(const std::string& text);

    /**
     * @brief "J.Kent Layton" -> "J. Kent Layton"; "e.g." is left alone.
     */
    static std::string insert_space_after_initials(const std::string& text);

    static bool is_name_suffix(const std::string& segment);

private:
    static std::vector<std::string> split_segments(const std::string& text);
    static std::size_t word_count(const std::string& text);
};

#endif
