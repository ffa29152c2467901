#include "PlanReporter.hpp"
#include "Utils.hpp"

#include <ostream>
#include <unordered_map>

#include <fmt/format.h>


std::string PlanReporter::render(const std::vector<BookRecord>& records, const RenamePlan& plan)
{
    std::unordered_map<std::string, std::string> original_names;
    for (const auto& record : records) {
        original_names.emplace(record.source_id,
                               Utils::path_to_utf8(Utils::utf8_to_path(record.source_file_name).filename()));
    }

    const std::string rule(kRuleWidth, '-');
    std::string out;
    out += "Planned renames (preview):\n";
    out += rule + "\n";
    for (const auto& name : plan.names) {
        const auto it = original_names.find(name.source_id);
        const std::string& original = it != original_names.end() ? it->second : name.source_id;
        out += fmt::format("{}  =>  {}\n", original, name.file_name());
    }
    out += rule + "\n";
    out += fmt::format("Total: {} file(s)\n", plan.names.size());
    if (plan.cancelled) {
        out += fmt::format("Cancelled: {} of {} item(s) planned\n", plan.names.size(), records.size());
    }

    if (!plan.summary.empty()) {
        out += "\nSummary:\n";
        append_section(out, "Missing author", plan.summary.missing_author);
        append_section(out, "Missing title", plan.summary.missing_title);
        append_section(out, "Author inferred from filename", plan.summary.inferred_authors);
        append_section(out, "Authorformat-adjusted", plan.summary.author_format_changes);
        append_section(out, "Titlecase-adjusted", plan.summary.title_case_changes);
    }
    return out;
}


void PlanReporter::print(const std::vector<BookRecord>& records, const RenamePlan& plan, std::ostream& out)
{
    out << render(records, plan);
    out.flush();
}


void PlanReporter::append_section(std::string& out,
                                  const char* heading,
                                  const std::vector<std::string>& lines)
{
    if (lines.empty()) {
        return;
    }
    out += fmt::format("{} ({}):\n", heading, lines.size());
    for (const auto& line : lines) {
        out += fmt::format("  - {}\n", line);
    }
}
