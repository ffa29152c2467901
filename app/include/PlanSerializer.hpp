#ifndef PLAN_SERIALIZER_HPP
#define PLAN_SERIALIZER_HPP

#include "RenamePlanner.hpp"
#include "Types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

/**
 * @brief JSON in and out of the planner.
 *
 * Manifest: {"items": [{"id", "file", "title", "author_list", "authors", "author"}]}.
 * Plan: {"items": [{"id", "file_name", "stem", "extension"}], "cancelled", "summary"}.
 */
class PlanSerializer {
public:
    /**
     * @throws ErrorCodes::AppException FILE_NOT_FOUND when the file cannot be opened,
     *         MANIFEST_INVALID when its content is not a manifest.
     */
    static std::vector<BookRecord> load_manifest(const std::string& path);
    static std::vector<BookRecord> parse_manifest(std::istream& input);

    static std::string to_json_string(const RenamePlan& plan);
    static void write_plan(const RenamePlan& plan, std::ostream& output);

    /**
     * @throws ErrorCodes::AppException FILE_WRITE_FAILED
     */
    static void save_plan(const RenamePlan& plan, const std::string& path);
};

#endif
