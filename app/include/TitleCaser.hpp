#ifndef TITLE_CASER_HPP
#define TITLE_CASER_HPP

#include "Types.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief One space-separated word of a title, split around its alphanumeric core.
 *
 * "(out-of-print)," becomes leading "(", core "out-of-print", trailing "),"
 * and hyphen segments {"out", "of", "print"}.
 */
struct TitleToken {
    std::u32string leading;
    std::u32string core;
    std::u32string trailing;
    std::vector<std::u32string> hyphen_segments;

    bool has_core() const { return !core.empty(); }
};

/**
 * @brief Smart title casing for book titles and author names.
 *
 * Each hyphen segment of each token is passed through an ordered rule list
 * (acronym, initial, minor word, capitalize); the first rule whose predicate
 * matches rewrites the segment. A clause flag carried across tokens keeps minor
 * words capitalized at the start of a subtitle ("The Hunt: The Secret Agent").
 */
class TitleCaser {
public:
    struct SegmentContext {
        const TitleToken& token;
        bool first_token;
        bool last_token;
        bool after_clause_boundary;
    };

    struct SegmentRule {
        std::string name;
        std::function<bool(const std::u32string&, const SegmentContext&)> matches;
        std::function<std::u32string(const std::u32string&)> transform;
    };

    explicit TitleCaser(TitleCaseDomain domain);

    std::string apply(const std::string& input) const;

    TitleCaseDomain domain() const { return domain_; }
    const std::vector<SegmentRule>& rules() const { return rules_; }

    static std::string title_case(const std::string& input, TitleCaseDomain domain);

    static TitleToken split_token(const std::u32string& token);
    static bool is_all_caps_acronym(const std::u32string& segment);
    static bool looks_intentionally_cased(const std::u32string& segment);
    static std::u32string capitalize_word(const std::u32string& segment);
    static bool ends_clause(const TitleToken& token, const std::u32string* next_token);

private:
    using WordSet = std::unordered_set<std::string>;

    std::u32string transform_segment(const std::u32string& segment,
                                     const SegmentContext& context) const;

    TitleCaseDomain domain_;
    std::shared_ptr<const WordSet> minor_words_;
    std::shared_ptr<const WordSet> known_acronyms_;
    std::vector<SegmentRule> rules_;
};

#endif
