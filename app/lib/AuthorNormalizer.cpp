#include "AuthorNormalizer.hpp"
#include "Utils.hpp"

#include <unordered_set>
#include <utility>

namespace {
constexpr std::size_t kMaxSegments = 3;

const std::unordered_set<std::string> kNameSuffixes = {
    "jr", "sr", "ii", "iii", "iv", "v"
};
}


std::string AuthorNormalizer::normalize(const std::string& author, AuthorOrder order)
{
    std::string cleaned = Utils::trim(Utils::collapse_whitespace(author));
    if (cleaned.empty()) {
        return cleaned;
    }

    cleaned = normalize_comma_spacing(cleaned);
    cleaned = insert_space_after_initials(cleaned);

    if (order == AuthorOrder::AsIs || cleaned.find(',') == std::string::npos) {
        return cleaned;
    }

    const std::vector<std::string> parts = split_segments(cleaned);
    if (parts.size() < 2 || parts.size() > kMaxSegments) {
        // More than three segments is a list of authors in one field
        return cleaned;
    }

    const std::string& last = parts[0];
    const std::string& first_middle = parts[1];
    std::string suffix;
    if (parts.size() == 3) {
        if (!is_name_suffix(parts[2])) {
            return cleaned;
        }
        suffix = parts[2];
    }

    // "Foo Bar, Zoo Goo" is two authors, not "Last, First"
    if (word_count(last) >= 2 && word_count(first_middle) >= 2) {
        return cleaned;
    }

    std::string result = order == AuthorOrder::FirstLast
        ? first_middle + " " + last
        : last + ", " + first_middle;
    if (!suffix.empty()) {
        result += ", " + suffix;
    }
    return Utils::trim(Utils::collapse_whitespace(result));
}


std::string AuthorNormalizer::normalize_comma_spacing(const std::string& text)
{
    const std::u32string input = Utils::to_code_points(text);
    std::u32string out;
    out.reserve(input.size() + 4);

    for (std::size_t i = 0; i < input.size(); ++i) {
        const char32_t ch = input[i];
        if (ch != U',') {
            out.push_back(ch);
            continue;
        }

        while (!out.empty() && out.back() == U' ') {
            out.pop_back();
        }
        if (out.empty() || out.back() != U',') {
            out.push_back(U',');
        }
        while (i + 1 < input.size() && input[i + 1] == U' ') {
            ++i;
        }
        if (i + 1 < input.size() && input[i + 1] != U',') {
            out.push_back(U' ');
        }
    }
    return Utils::from_code_points(out);
}


std::string AuthorNormalizer::insert_space_after_initials(const std::string& text)
{
    const std::u32string input = Utils::to_code_points(text);
    std::u32string out;
    out.reserve(input.size() + 4);

    for (std::size_t i = 0; i < input.size(); ++i) {
        out.push_back(input[i]);
        if (input[i] == U'.' && i > 0 && i + 1 < input.size()
            && Utils::is_letter(input[i - 1]) && Utils::is_upper(input[i + 1])) {
            out.push_back(U' ');
        }
    }
    return Utils::from_code_points(out);
}


bool AuthorNormalizer::is_name_suffix(const std::string& segment)
{
    std::string value = Utils::trim(segment);
    while (!value.empty() && value.back() == '.') {
        value.pop_back();
    }
    return kNameSuffixes.contains(Utils::fold_case(value));
}


std::vector<std::string> AuthorNormalizer::split_segments(const std::string& text)
{
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string::npos) {
            comma = text.size();
        }
        std::string segment = Utils::trim(Utils::collapse_whitespace(text.substr(start, comma - start)));
        if (!segment.empty()) {
            segments.push_back(std::move(segment));
        }
        start = comma + 1;
    }
    return segments;
}


std::size_t AuthorNormalizer::word_count(const std::string& text)
{
    std::size_t count = 0;
    bool in_word = false;
    for (const char32_t ch : Utils::to_code_points(text)) {
        if (ch == U' ') {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++count;
        }
    }
    return count;
}
