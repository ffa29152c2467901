#ifndef RENAME_PLANNER_HPP
#define RENAME_PLANNER_HPP

#include "CollisionResolver.hpp"
#include "TitleCaser.hpp"
#include "Types.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Per-batch notes about metadata gaps and what the pipeline changed.
 */
struct PlanSummary {
    std::vector<std::string> missing_title;
    std::vector<std::string> missing_author;
    std::vector<std::string> inferred_authors;
    std::vector<std::string> author_format_changes;
    std::vector<std::string> title_case_changes;

    bool empty() const {
        return missing_title.empty() && missing_author.empty() && inferred_authors.empty()
            && author_format_changes.empty() && title_case_changes.empty();
    }
};

struct RenamePlan {
    std::vector<ProposedName> names;
    PlanSummary summary;
    bool cancelled{false};
};

/**
 * @brief Runs the naming pipeline over a batch of books.
 *
 * Items are processed strictly in input order: author normalization, title
 * casing, stem building, then collision resolution against a fresh used-name
 * set and the caller's existence probe.
 */
class RenamePlanner {
public:
    static constexpr const char* kUnknownAuthor = "Unknown Author";
    static constexpr const char* kAuthorJoiner = ", ";
    static constexpr const char* kDefaultExtension = ".epub";

    explicit RenamePlanner(NormalizationOptions options,
                           std::string default_extension = kDefaultExtension);

    /**
     * @brief Plan names for the whole batch.
     * @param cancel_flag Checked before each item; once set, planning stops and
     *        the plan is marked cancelled. Items already planned are still resolved.
     */
    RenamePlan plan(const std::vector<BookRecord>& records,
                    const ExistingNamesProbe& probe,
                    const std::atomic<bool>* cancel_flag = nullptr) const;

    /**
     * @brief Build the unresolved name for one item, recording notes in @p summary.
     */
    ProposedName propose(const BookRecord& record, PlanSummary& summary) const;

    const NormalizationOptions& options() const { return options_; }

    /**
     * @brief "A New Day -- Mike Barnes" -> "Mike Barnes". Declines anything that
     *        looks like an id or a metadata dump.
     */
    static std::optional<std::string> infer_author_from_file_name(const std::string& stem);

    /**
     * @brief ".epub", ".azw3": a dot followed by 1-10 ASCII letters or digits.
     *        Anything else ("." alone, ". Tolkien notes") is part of the name.
     */
    static bool is_plausible_extension(const std::string& extension);

    static std::string abbreviate(const std::string& value, std::size_t max_length = 80);

private:
    std::string extension_for(const std::string& source_file_name) const;

    NormalizationOptions options_;
    std::string default_extension_;
    TitleCaser title_caser_;
    TitleCaser author_caser_;
};

#endif
