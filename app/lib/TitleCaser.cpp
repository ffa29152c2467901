#include "TitleCaser.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <string_view>
#include <utility>

namespace {

const std::unordered_set<std::string> kMinorWords = {
    "and", "or", "the", "a", "an", "in", "on", "of", "to", "at", "by", "for", "from",
    "nor", "but", "as", "per", "vs", "via", "with", "into", "onto", "off", "up", "down"
};

// Lowercase name particles ("Vincent van Gogh", "Guillermo del Toro")
const std::unordered_set<std::string> kNameParticles = {
    "del", "de", "della", "van", "von", "der", "den", "da", "du", "di"
};

// Acronyms commonly scraped in lowercase; only consulted for titles
const std::unordered_set<std::string> kKnownAcronyms = {
    "nasa", "cia", "fbi", "nsa", "kgb", "nato", "ussr", "usa", "bbc",
    "dna", "ufo", "nypd", "lapd", "mi5", "mi6"
};

std::string folded_key(const std::u32string& segment)
{
    return Utils::fold_case(Utils::from_code_points(segment));
}

std::u32string upper_all(const std::u32string& segment)
{
    std::u32string out = segment;
    for (char32_t& ch : out) {
        ch = Utils::to_upper(ch);
    }
    return out;
}

std::u32string lower_all(const std::u32string& segment)
{
    std::u32string out = segment;
    for (char32_t& ch : out) {
        ch = Utils::to_lower(ch);
    }
    return out;
}

bool contains_any(const std::u32string& text, std::u32string_view chars)
{
    return text.find_first_of(chars.data(), 0, chars.size()) != std::u32string::npos;
}

bool starts_with_upper(const std::u32string& token)
{
    for (const char32_t ch : token) {
        if (Utils::is_letter(ch)) {
            return Utils::is_upper(ch);
        }
    }
    return false;
}

std::vector<std::u32string> split(const std::u32string& text, char32_t separator)
{
    std::vector<std::u32string> parts;
    std::u32string current;
    for (const char32_t ch : text) {
        if (ch == separator) {
            parts.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    parts.push_back(std::move(current));
    return parts;
}

std::u32string join(const std::vector<std::u32string>& parts, char32_t separator)
{
    std::u32string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined.push_back(separator);
        }
        joined += parts[i];
    }
    return joined;
}

} // namespace


TitleCaser::TitleCaser(TitleCaseDomain domain)
    : domain_(domain)
{
    auto minor = std::make_shared<WordSet>(kMinorWords);
    if (domain_ == TitleCaseDomain::Author) {
        minor->insert(kNameParticles.begin(), kNameParticles.end());
    }
    minor_words_ = std::move(minor);
    known_acronyms_ = std::make_shared<const WordSet>(
        domain_ == TitleCaseDomain::Title ? kKnownAcronyms : WordSet{});

    auto acronyms = known_acronyms_;
    auto minor_words = minor_words_;
    rules_ = {
        {"acronym",
         [acronyms](const std::u32string& segment, const SegmentContext&) {
             return is_all_caps_acronym(segment) || acronyms->contains(folded_key(segment));
         },
         upper_all},
        // "A." is an initial, never the article
        {"initial",
         [](const std::u32string& segment, const SegmentContext& context) {
             return segment.size() == 1
                 && !context.token.trailing.empty()
                 && context.token.trailing.front() == U'.';
         },
         upper_all},
        {"minor-word",
         [minor_words](const std::u32string& segment, const SegmentContext& context) {
             return !context.first_token
                 && !context.last_token
                 && !context.after_clause_boundary
                 && minor_words->contains(folded_key(segment));
         },
         lower_all},
        {"capitalize",
         [](const std::u32string&, const SegmentContext&) { return true; },
         capitalize_word},
    };
}


std::string TitleCaser::title_case(const std::string& input, TitleCaseDomain domain)
{
    return TitleCaser(domain).apply(input);
}


std::string TitleCaser::apply(const std::string& input) const
{
    const std::u32string text = Utils::to_code_points(input);
    if (Utils::trim(text).empty()) {
        return input;
    }

    std::vector<std::u32string> parts = split(text, U' ');

    std::size_t first_index = parts.size();
    std::size_t last_index = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (!parts[i].empty()) {
            first_index = std::min(first_index, i);
            last_index = i;
        }
    }

    bool new_clause = true;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty()) {
            continue;
        }

        const std::u32string* next = i + 1 < parts.size() ? &parts[i + 1] : nullptr;
        TitleToken token = split_token(parts[i]);
        if (!token.has_core()) {
            new_clause = ends_clause(token, next);
            continue;
        }

        const SegmentContext context{token, i == first_index, i == last_index, new_clause};
        std::vector<std::u32string> segments = token.hyphen_segments;
        for (auto& segment : segments) {
            if (!segment.empty()) {
                segment = transform_segment(segment, context);
            }
        }

        parts[i] = token.leading + join(segments, U'-') + token.trailing;
        new_clause = ends_clause(token, next);
    }

    return Utils::from_code_points(join(parts, U' '));
}


std::u32string TitleCaser::transform_segment(const std::u32string& segment,
                                             const SegmentContext& context) const
{
    for (const auto& rule : rules_) {
        if (rule.matches(segment, context)) {
            return rule.transform(segment);
        }
    }
    return segment;
}


TitleToken TitleCaser::split_token(const std::u32string& token)
{
    TitleToken result;
    std::size_t start = 0;
    while (start < token.size() && !Utils::is_letter_or_digit(token[start])) {
        ++start;
    }
    if (start == token.size()) {
        // No alphanumerics: the whole token counts as trailing punctuation
        result.trailing = token;
        return result;
    }

    std::size_t end = token.size();
    while (end > start && !Utils::is_letter_or_digit(token[end - 1])) {
        --end;
    }

    result.leading = token.substr(0, start);
    result.core = token.substr(start, end - start);
    result.trailing = token.substr(end);
    result.hyphen_segments = split(result.core, U'-');
    return result;
}


bool TitleCaser::is_all_caps_acronym(const std::u32string& segment)
{
    int letters = 0;
    for (const char32_t ch : segment) {
        if (Utils::is_letter(ch)) {
            ++letters;
            if (!Utils::is_upper(ch)) {
                return false;
            }
        }
    }
    return letters >= 2;
}


bool TitleCaser::looks_intentionally_cased(const std::u32string& segment)
{
    std::size_t i = 0;
    while (i < segment.size() && !Utils::is_letter(segment[i])) {
        ++i;
    }
    for (++i; i < segment.size(); ++i) {
        if (Utils::is_upper(segment[i])) {
            return true;
        }
    }
    return false;
}


std::u32string TitleCaser::capitalize_word(const std::u32string& segment)
{
    if (looks_intentionally_cased(segment)) {
        return segment;
    }

    const std::u32string lower = lower_all(segment);
    std::u32string result;
    result.reserve(lower.size());

    // Only a leading letter is raised, so "19th" stays "19th"
    bool capitalize_next = !lower.empty() && Utils::is_letter(lower.front());
    int letters_seen = 0;
    char32_t first_letter = 0;
    for (std::size_t i = 0; i < lower.size(); ++i) {
        const char32_t ch = lower[i];
        if (capitalize_next && Utils::is_letter(ch)) {
            result.push_back(Utils::to_upper(ch));
            capitalize_next = false;
        } else {
            result.push_back(ch);
        }

        if (Utils::is_letter(ch)) {
            ++letters_seen;
            if (first_letter == 0) {
                first_letter = Utils::to_upper(ch);
            }
        }

        // O'Brien, D'Artagnan, L'Étranger; never Hitchhiker's or don't
        const bool apostrophe = ch == U'\'' || ch == U'’';
        if (apostrophe && i + 1 < lower.size() && Utils::is_letter(lower[i + 1])
            && letters_seen == 1
            && (first_letter == U'O' || first_letter == U'D' || first_letter == U'L')) {
            capitalize_next = true;
        }
    }

    if (result.size() >= 3 && (result[0] == U'M' || result[0] == U'm')
        && (result[1] == U'c' || result[1] == U'C') && Utils::is_letter(result[2])) {
        result[2] = Utils::to_upper(result[2]);
    }

    return result;
}


bool TitleCaser::ends_clause(const TitleToken& token, const std::u32string* next_token)
{
    static constexpr std::u32string_view kBoundaryMarks = U":·\"”»";
    if (contains_any(token.trailing, kBoundaryMarks)) {
        return true;
    }
    // "Narcissus, The Secret Agent": a comma before a capitalized word opens a new segment
    return token.trailing.find(U',') != std::u32string::npos
        && next_token != nullptr
        && starts_with_upper(*next_token);
}
