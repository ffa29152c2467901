#include "RenamePlanner.hpp"
#include "AuthorNormalizer.hpp"
#include "Logger.hpp"
#include "StemBuilder.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>

namespace {
constexpr const char* kAuthorSeparatorInFileName = " -- ";
constexpr std::size_t kMaxInferredAuthorLength = 60;
constexpr std::size_t kMaxExtensionLength = 10;

std::string join(const std::vector<std::string>& values, const std::string& separator)
{
    std::string joined;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += values[i];
    }
    return joined;
}

std::vector<std::string> cleaned_authors(const std::vector<std::string>& authors)
{
    std::vector<std::string> result;
    result.reserve(authors.size());
    for (const auto& author : authors) {
        std::string trimmed = Utils::trim(author);
        if (!trimmed.empty()) {
            result.push_back(std::move(trimmed));
        }
    }
    return result;
}
}


RenamePlanner::RenamePlanner(NormalizationOptions options, std::string default_extension)
    : options_(options),
      default_extension_(std::move(default_extension)),
      title_caser_(TitleCaseDomain::Title),
      author_caser_(TitleCaseDomain::Author)
{
    if (!default_extension_.empty() && default_extension_.front() != '.') {
        default_extension_.insert(default_extension_.begin(), '.');
    }
    if (!is_plausible_extension(default_extension_)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Ignoring default extension '{}'; using '{}'", default_extension_, kDefaultExtension);
        }
        default_extension_ = kDefaultExtension;
    }
}


RenamePlan RenamePlanner::plan(const std::vector<BookRecord>& records,
                               const ExistingNamesProbe& probe,
                               const std::atomic<bool>* cancel_flag) const
{
    auto logger = Logger::get_logger("core_logger");
    if (logger) {
        logger->info("Planning names for {} item(s) (ascii={}, titlecase={}, authorformat={})",
                     records.size(), options_.strip_diacritics, options_.apply_title_case,
                     to_string(options_.author_order));
    }

    RenamePlan plan;
    plan.names.reserve(records.size());
    UsedNameSet used_names;

    for (const auto& record : records) {
        if (cancel_flag && cancel_flag->load()) {
            plan.cancelled = true;
            if (logger) {
                logger->warn("Planning cancelled after {} of {} item(s)", plan.names.size(), records.size());
            }
            break;
        }

        ProposedName name = propose(record, plan.summary);
        CollisionResolver::resolve_proposed(name, used_names, probe);
        if (logger) {
            logger->debug("'{}' => '{}'", record.source_file_name, name.file_name());
        }
        plan.names.push_back(std::move(name));
    }

    if (logger) {
        logger->info("Planned {} name(s)", plan.names.size());
    }
    return plan;
}


ProposedName RenamePlanner::propose(const BookRecord& record, PlanSummary& summary) const
{
    auto logger = Logger::get_logger("core_logger");
    const std::filesystem::path source_path = Utils::utf8_to_path(record.source_file_name);
    const std::string display_name = Utils::path_to_utf8(source_path.filename());
    const std::string source_stem = Utils::path_to_utf8(source_path.stem());

    std::optional<std::string> title;
    if (record.metadata.title) {
        std::string trimmed = Utils::trim(*record.metadata.title);
        if (!trimmed.empty()) {
            title = std::move(trimmed);
        }
    }
    std::vector<std::string> authors = cleaned_authors(record.metadata.authors);

    if (!title) {
        summary.missing_title.push_back(display_name);
    }

    if (authors.empty()) {
        if (auto inferred = infer_author_from_file_name(source_stem)) {
            summary.inferred_authors.push_back(fmt::format(
                "File: {} | Inferred author from filename: \"{}\"", display_name, abbreviate(*inferred)));
            if (logger) {
                logger->info("Inferred author '{}' from file name '{}'", *inferred, display_name);
            }
            authors.push_back(std::move(*inferred));
        } else {
            summary.missing_author.push_back(display_name);
            if (logger) {
                logger->warn("No author metadata for '{}'", display_name);
            }
        }
    }

    if (!authors.empty()) {
        const std::string before = join(authors, kAuthorJoiner);
        for (auto& author : authors) {
            author = AuthorNormalizer::normalize(author, options_.author_order);
        }
        const std::string after = join(authors, kAuthorJoiner);
        if (options_.author_order != AuthorOrder::AsIs && before != after) {
            summary.author_format_changes.push_back(fmt::format(
                "File: {} | AuthorFormat Authors: \"{}\" -> \"{}\"",
                display_name, abbreviate(before), abbreviate(after)));
        }
    }

    std::string working_title = title ? *title : source_stem;

    if (options_.apply_title_case) {
        const std::string cased_title = title_caser_.apply(working_title);
        const std::string authors_before = join(authors, kAuthorJoiner);
        for (auto& author : authors) {
            author = author_caser_.apply(author);
        }
        const std::string authors_after = join(authors, kAuthorJoiner);

        std::vector<std::string> pieces;
        if (cased_title != working_title) {
            pieces.push_back(fmt::format("TitleCase Title: \"{}\" -> \"{}\"",
                                         abbreviate(working_title), abbreviate(cased_title)));
        }
        if (authors_before != authors_after) {
            pieces.push_back(fmt::format("TitleCase Authors: \"{}\" -> \"{}\"",
                                         abbreviate(authors_before), abbreviate(authors_after)));
        }
        if (!pieces.empty()) {
            summary.title_case_changes.push_back(
                fmt::format("File: {} | {}", display_name, join(pieces, "; ")));
        }
        working_title = cased_title;
    }

    const std::string authors_joined = authors.empty() ? std::string(kUnknownAuthor)
                                                       : join(authors, kAuthorJoiner);

    const std::string stem = StemBuilder::build_stem(working_title, authors_joined,
                                                     options_.strip_diacritics);
    std::string extension = extension_for(record.source_file_name);
    std::string file_name = StemBuilder::build_file_name(stem, extension, options_.strip_diacritics);

    // Stem is whatever precedes the extension that was actually appended
    if (!extension.empty() && file_name.size() > extension.size() && file_name.ends_with(extension)) {
        file_name.resize(file_name.size() - extension.size());
    } else {
        if (logger) {
            logger->warn("Extension '{}' did not survive sanitizing for '{}'", extension, display_name);
        }
        extension.clear();
    }
    return ProposedName{record.source_id, std::move(file_name), std::move(extension)};
}


std::optional<std::string> RenamePlanner::infer_author_from_file_name(const std::string& stem)
{
    const std::string separator = kAuthorSeparatorInFileName;
    const auto idx = stem.rfind(separator);
    if (idx == std::string::npos) {
        return std::nullopt;
    }

    const std::u32string candidate = Utils::trim(Utils::to_code_points(stem.substr(idx + separator.size())));
    if (candidate.empty() || candidate.size() > kMaxInferredAuthorLength) {
        return std::nullopt;
    }

    // Tails that are mostly digits are ids, not names
    std::size_t letters = 0;
    std::size_t digits = 0;
    for (const char32_t ch : candidate) {
        if (Utils::is_letter(ch)) {
            ++letters;
        } else if (Utils::is_letter_or_digit(ch)) {
            ++digits;
        }
    }
    if (letters < 2 || digits > letters) {
        return std::nullopt;
    }

    return Utils::from_code_points(Utils::collapse_whitespace(candidate));
}


std::string RenamePlanner::abbreviate(const std::string& value, std::size_t max_length)
{
    const std::u32string text = Utils::to_code_points(value);
    if (text.size() <= max_length) {
        return value;
    }
    if (max_length <= 3) {
        return Utils::from_code_points(text.substr(0, max_length));
    }
    return Utils::from_code_points(text.substr(0, max_length - 3)) + "...";
}


bool RenamePlanner::is_plausible_extension(const std::string& extension)
{
    if (extension.size() < 2 || extension.size() > kMaxExtensionLength + 1 || extension.front() != '.') {
        return false;
    }
    return std::all_of(extension.begin() + 1, extension.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0;
    });
}


std::string RenamePlanner::extension_for(const std::string& source_file_name) const
{
    const std::string extension = Utils::path_to_utf8(Utils::utf8_to_path(source_file_name).extension());
    return is_plausible_extension(extension) ? extension : default_extension_;
}
