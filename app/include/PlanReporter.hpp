#ifndef PLAN_REPORTER_HPP
#define PLAN_REPORTER_HPP

#include "RenamePlanner.hpp"
#include "Types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

/**
 * @brief Human-readable preview of a plan: one "old  =>  new" line per item,
 *        a total, then the non-empty summary sections.
 */
class PlanReporter {
public:
    static constexpr std::size_t kRuleWidth = 80;

    static std::string render(const std::vector<BookRecord>& records, const RenamePlan& plan);
    static void print(const std::vector<BookRecord>& records, const RenamePlan& plan, std::ostream& out);

private:
    static void append_section(std::string& out,
                               const char* heading,
                               const std::vector<std::string>& lines);
};

#endif
