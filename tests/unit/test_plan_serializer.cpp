#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "PlanSerializer.hpp"
#include "TestHelpers.hpp"

#include <sstream>
#include <string>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {
ErrorCodes::Code manifest_error(const std::string& text)
{
    std::istringstream input(text);
    try {
        PlanSerializer::parse_manifest(input);
    } catch (const ErrorCodes::AppException& ex) {
        return ex.get_error_code();
    }
    return ErrorCodes::Code::SUCCESS;
}
}

TEST_CASE("manifest items map to book records") {
    std::istringstream input(R"({
        "items": [
            {"id": "42", "file": "dune.epub", "title": " Dune ",
             "author_list": ["Herbert, Frank"], "author": "Ignored"},
            {"file": "b.epub", "authors": ["", "Jane Doe"]},
            {"file": "c.epub", "title": null, "author": "Solo Writer"},
            {"file": "d.epub", "author_list": [], "authors": []}
        ]
    })");

    const auto records = PlanSerializer::parse_manifest(input);
    REQUIRE(records.size() == 4);

    CHECK(records[0].source_id == "42");
    CHECK(records[0].source_file_name == "dune.epub");
    REQUIRE(records[0].metadata.title.has_value());
    CHECK(*records[0].metadata.title == "Dune");
    CHECK(records[0].metadata.authors == std::vector<std::string>{"Herbert, Frank"});

    CHECK(records[1].source_id == "b.epub");
    CHECK_FALSE(records[1].metadata.title.has_value());
    CHECK(records[1].metadata.authors == std::vector<std::string>{"Jane Doe"});

    CHECK(records[2].metadata.authors == std::vector<std::string>{"Solo Writer"});
    CHECK(records[3].metadata.authors.empty());
}

TEST_CASE("invalid manifests are rejected") {
    CHECK(manifest_error("{ not json") == ErrorCodes::Code::MANIFEST_INVALID);
    CHECK(manifest_error("[]") == ErrorCodes::Code::MANIFEST_INVALID);
    CHECK(manifest_error(R"({"files": []})") == ErrorCodes::Code::MANIFEST_INVALID);
    CHECK(manifest_error(R"({"items": [{"title": "No file"}]})") == ErrorCodes::Code::MANIFEST_INVALID);
    CHECK(manifest_error(R"({"items": [{"file": "a.epub", "authors": "not a list"}]})")
          == ErrorCodes::Code::MANIFEST_INVALID);
    CHECK(manifest_error(R"({"items": [42]})") == ErrorCodes::Code::MANIFEST_INVALID);
    CHECK(manifest_error(R"({"items": []})") == ErrorCodes::Code::SUCCESS);
}

TEST_CASE("missing manifest file reports FILE_NOT_FOUND") {
    TempDir temp_dir;
    try {
        PlanSerializer::load_manifest((temp_dir.path() / "absent.json").string());
        FAIL("expected FILE_NOT_FOUND");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::FILE_NOT_FOUND);
    }
}

TEST_CASE("manifest file is loaded from disk") {
    TempDir temp_dir;
    const auto path = temp_dir.path() / "manifest.json";
    write_text_file(path, R"({"items": [{"file": "Été.epub", "title": "Été"}]})");

    const auto records = PlanSerializer::load_manifest(path.string());
    REQUIRE(records.size() == 1);
    CHECK(records[0].source_file_name == "Été.epub");
}

TEST_CASE("plan json lists items, cancellation and summary") {
    RenamePlan plan;
    plan.names.push_back(ProposedName{"42", "Dune - Frank Herbert", ".epub"});
    plan.summary.missing_author.push_back("x.epub");
    plan.cancelled = true;

    const std::string text = PlanSerializer::to_json_string(plan);
    Json::CharReaderBuilder reader;
    Json::Value root;
    std::string errors;
    std::istringstream input(text);
    REQUIRE(Json::parseFromStream(reader, input, &root, &errors));

    REQUIRE(root["items"].isArray());
    REQUIRE(root["items"].size() == 1);
    CHECK(root["items"][0]["id"].asString() == "42");
    CHECK(root["items"][0]["file_name"].asString() == "Dune - Frank Herbert.epub");
    CHECK(root["items"][0]["stem"].asString() == "Dune - Frank Herbert");
    CHECK(root["items"][0]["extension"].asString() == ".epub");
    CHECK(root["cancelled"].asBool());
    CHECK(root["summary"]["missing_author"][0].asString() == "x.epub");
    CHECK(root["summary"]["title_case_changes"].empty());
}

TEST_CASE("save_plan writes a file and reports unwritable paths") {
    TempDir temp_dir;
    RenamePlan plan;
    plan.names.push_back(ProposedName{"1", "Book", ".epub"});

    const auto path = temp_dir.path() / "plan.json";
    PlanSerializer::save_plan(plan, path.string());
    CHECK(std::filesystem::exists(path));

    try {
        PlanSerializer::save_plan(plan, (temp_dir.path() / "missing" / "plan.json").string());
        FAIL("expected FILE_WRITE_FAILED");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::FILE_WRITE_FAILED);
    }
}
