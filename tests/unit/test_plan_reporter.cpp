#include <catch2/catch_test_macros.hpp>
#include "PlanReporter.hpp"
#include "TestHelpers.hpp"

#include <sstream>
#include <string>

TEST_CASE("preview lists each rename and a total") {
    const std::vector<BookRecord> records = {
        make_record("in/dune.epub", std::string("dune"), {"Frank Herbert"})
    };
    RenamePlan plan;
    plan.names.push_back(ProposedName{"in/dune.epub", "Dune - Frank Herbert", ".epub"});

    const std::string rule(80, '-');
    const std::string expected =
        "Planned renames (preview):\n" + rule + "\n"
        "dune.epub  =>  Dune - Frank Herbert.epub\n" + rule + "\n"
        "Total: 1 file(s)\n";
    CHECK(PlanReporter::render(records, plan) == expected);
}

TEST_CASE("summary sections appear only when populated") {
    RenamePlan plan;
    plan.summary.missing_author = {"a.epub", "b.epub"};
    plan.summary.title_case_changes = {"File: c.epub | TitleCase Title: \"c\" -> \"C\""};

    std::ostringstream out;
    PlanReporter::print({}, plan, out);
    const std::string text = out.str();

    CHECK(text.find("Total: 0 file(s)\n") != std::string::npos);
    CHECK(text.find("\nSummary:\n") != std::string::npos);
    CHECK(text.find("Missing author (2):\n  - a.epub\n  - b.epub\n") != std::string::npos);
    CHECK(text.find("Titlecase-adjusted (1):\n  - File: c.epub") != std::string::npos);
    CHECK(text.find("Missing title") == std::string::npos);
    CHECK(text.find("Authorformat-adjusted") == std::string::npos);
}

TEST_CASE("cancelled plans say how far they got") {
    const std::vector<BookRecord> records = {
        make_record("a.epub", std::string("A"), {}),
        make_record("b.epub", std::string("B"), {})
    };
    RenamePlan plan;
    plan.names.push_back(ProposedName{"a.epub", "A - Unknown Author", ".epub"});
    plan.cancelled = true;

    const std::string text = PlanReporter::render(records, plan);
    CHECK(text.find("a.epub  =>  A - Unknown Author.epub\n") != std::string::npos);
    CHECK(text.find("Cancelled: 1 of 2 item(s) planned\n") != std::string::npos);
}
