#ifndef METADATA_SOURCE_HPP
#define METADATA_SOURCE_HPP

#include "Types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

struct AuthorListField {
    std::vector<std::string> names;
};

struct AuthorsField {
    std::vector<std::string> names;
};

struct SingleAuthorField {
    std::string name;
};

struct NoAuthorField {};

/**
 * @brief Where a metadata source stored its authors. Resolved once, at the
 *        boundary, so the pipeline only ever sees RawMetadata.
 */
using AuthorField = std::variant<AuthorListField, AuthorsField, SingleAuthorField, NoAuthorField>;

class MetadataSource {
public:
    /**
     * @brief Pick the first populated field: author list, then authors, then a
     *        single author. Blank entries do not count as populated.
     */
    static AuthorField select_author_field(const std::vector<std::string>& author_list,
                                           const std::vector<std::string>& authors,
                                           const std::optional<std::string>& single_author);

    /**
     * @brief Trimmed title (absent when blank) and trimmed, non-blank authors.
     */
    static RawMetadata to_raw_metadata(const std::optional<std::string>& title,
                                       const AuthorField& field);

    static std::string describe(const AuthorField& field);
};

#endif
