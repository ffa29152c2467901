#include "PlanSerializer.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "MetadataSource.hpp"
#include "Utils.hpp"

#include <fstream>
#include <istream>
#include <optional>
#include <ostream>

#include <fmt/format.h>
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {

[[noreturn]] void fail_manifest(const std::string& detail)
{
    THROW_APP_ERROR(ErrorCodes::Code::MANIFEST_INVALID, detail);
}

std::optional<std::string> optional_string(const Json::Value& item,
                                           const char* key,
                                           Json::ArrayIndex index)
{
    const Json::Value& value = item[key];
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isString()) {
        fail_manifest(fmt::format("items[{}].{} must be a string", index, key));
    }
    return value.asString();
}

std::vector<std::string> string_list(const Json::Value& item,
                                     const char* key,
                                     Json::ArrayIndex index)
{
    std::vector<std::string> values;
    const Json::Value& list = item[key];
    if (list.isNull()) {
        return values;
    }
    if (!list.isArray()) {
        fail_manifest(fmt::format("items[{}].{} must be an array of strings", index, key));
    }
    for (const auto& entry : list) {
        if (!entry.isString()) {
            fail_manifest(fmt::format("items[{}].{} must be an array of strings", index, key));
        }
        values.push_back(entry.asString());
    }
    return values;
}

BookRecord parse_item(const Json::Value& item, Json::ArrayIndex index)
{
    if (!item.isObject()) {
        fail_manifest(fmt::format("items[{}] is not an object", index));
    }
    auto file = optional_string(item, "file", index);
    if (!file || Utils::trim(*file).empty()) {
        fail_manifest(fmt::format("items[{}] has no \"file\"", index));
    }

    const auto field = MetadataSource::select_author_field(string_list(item, "author_list", index),
                                                           string_list(item, "authors", index),
                                                           optional_string(item, "author", index));

    BookRecord record;
    record.source_file_name = *file;
    record.source_id = optional_string(item, "id", index).value_or(*file);
    record.metadata = MetadataSource::to_raw_metadata(optional_string(item, "title", index), field);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Manifest item {} '{}': authors from {}",
                      index, record.source_file_name, MetadataSource::describe(field));
    }
    return record;
}

Json::Value to_json_array(const std::vector<std::string>& values)
{
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

Json::Value summary_to_json(const PlanSummary& summary)
{
    Json::Value obj(Json::objectValue);
    obj["missing_title"] = to_json_array(summary.missing_title);
    obj["missing_author"] = to_json_array(summary.missing_author);
    obj["inferred_authors"] = to_json_array(summary.inferred_authors);
    obj["author_format_changes"] = to_json_array(summary.author_format_changes);
    obj["title_case_changes"] = to_json_array(summary.title_case_changes);
    return obj;
}

} // namespace


std::vector<BookRecord> PlanSerializer::load_manifest(const std::string& path)
{
    std::ifstream file(Utils::utf8_to_path(path));
    if (!file.is_open()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_NOT_FOUND, path);
    }
    return parse_manifest(file);
}


std::vector<BookRecord> PlanSerializer::parse_manifest(std::istream& input)
{
    Json::CharReaderBuilder reader;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(reader, input, &root, &errors)) {
        fail_manifest(Utils::trim(errors));
    }

    if (!root.isObject() || !root["items"].isArray()) {
        fail_manifest("expected an object with an \"items\" array");
    }

    const Json::Value& items = root["items"];
    std::vector<BookRecord> records;
    records.reserve(items.size());
    for (Json::ArrayIndex i = 0; i < items.size(); ++i) {
        records.push_back(parse_item(items[i], i));
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded {} manifest item(s)", records.size());
    }
    return records;
}


std::string PlanSerializer::to_json_string(const RenamePlan& plan)
{
    Json::Value root(Json::objectValue);
    Json::Value items(Json::arrayValue);
    for (const auto& name : plan.names) {
        Json::Value entry(Json::objectValue);
        entry["id"] = name.source_id;
        entry["file_name"] = name.file_name();
        entry["stem"] = name.stem;
        entry["extension"] = name.extension;
        items.append(entry);
    }
    root["items"] = items;
    root["cancelled"] = plan.cancelled;
    root["summary"] = summary_to_json(plan.summary);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, root);
}


void PlanSerializer::write_plan(const RenamePlan& plan, std::ostream& output)
{
    output << to_json_string(plan) << '\n';
}


void PlanSerializer::save_plan(const RenamePlan& plan, const std::string& path)
{
    std::ofstream file(Utils::utf8_to_path(path), std::ios::trunc);
    if (!file.is_open()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, path);
    }
    write_plan(plan, file);
    if (!file) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, path);
    }
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Wrote plan with {} item(s) to '{}'", plan.names.size(), path);
    }
}
