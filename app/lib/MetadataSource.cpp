#include "MetadataSource.hpp"
#include "Utils.hpp"

#include <type_traits>
#include <utility>

namespace {

std::vector<std::string> clean_names(const std::vector<std::string>& names)
{
    std::vector<std::string> cleaned;
    cleaned.reserve(names.size());
    for (const auto& name : names) {
        std::string trimmed = Utils::trim(name);
        if (!trimmed.empty()) {
            cleaned.push_back(std::move(trimmed));
        }
    }
    return cleaned;
}

} // namespace


AuthorField MetadataSource::select_author_field(const std::vector<std::string>& author_list,
                                                const std::vector<std::string>& authors,
                                                const std::optional<std::string>& single_author)
{
    if (!clean_names(author_list).empty()) {
        return AuthorListField{author_list};
    }
    if (!clean_names(authors).empty()) {
        return AuthorsField{authors};
    }
    if (single_author && !Utils::trim(*single_author).empty()) {
        return SingleAuthorField{*single_author};
    }
    return NoAuthorField{};
}


RawMetadata MetadataSource::to_raw_metadata(const std::optional<std::string>& title,
                                            const AuthorField& field)
{
    RawMetadata metadata;
    if (title) {
        std::string trimmed = Utils::trim(*title);
        if (!trimmed.empty()) {
            metadata.title = std::move(trimmed);
        }
    }

    metadata.authors = std::visit([](const auto& source) -> std::vector<std::string> {
        using T = std::decay_t<decltype(source)>;
        if constexpr (std::is_same_v<T, AuthorListField> || std::is_same_v<T, AuthorsField>) {
            return clean_names(source.names);
        } else if constexpr (std::is_same_v<T, SingleAuthorField>) {
            return clean_names({source.name});
        } else {
            return {};
        }
    }, field);

    return metadata;
}


std::string MetadataSource::describe(const AuthorField& field)
{
    switch (field.index()) {
        case 0: return "author list";
        case 1: return "authors";
        case 2: return "single author";
        default: return "none";
    }
}
