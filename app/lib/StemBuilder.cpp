#include "StemBuilder.hpp"
#include "FilenameSanitizer.hpp"
#include "Utils.hpp"


std::string StemBuilder::build_stem(const std::string& title,
                                    const std::string& authors_joined,
                                    bool strip_diacritics)
{
    const std::string title_part = FilenameSanitizer::sanitize(title, strip_diacritics);
    const std::string authors_part = FilenameSanitizer::sanitize(authors_joined, strip_diacritics);

    std::string stem = Utils::trim(Utils::collapse_whitespace(title_part + " - " + authors_part));
    return truncate_stem(stem);
}


std::string StemBuilder::build_file_name(const std::string& stem,
                                         const std::string& extension,
                                         bool strip_diacritics)
{
    return FilenameSanitizer::sanitize(stem + extension, strip_diacritics);
}


std::string StemBuilder::truncate_stem(const std::string& stem, std::size_t max_length)
{
    std::u32string text = Utils::to_code_points(stem);
    if (text.size() <= max_length) {
        return stem;
    }

    text.resize(max_length);
    while (!text.empty() && (text.back() == U'.' || text.back() == U' ')) {
        text.pop_back();
    }
    if (text.empty()) {
        return FilenameSanitizer::kFallbackName;
    }
    return Utils::from_code_points(text);
}
