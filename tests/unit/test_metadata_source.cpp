#include <catch2/catch_test_macros.hpp>
#include "MetadataSource.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

TEST_CASE("author list takes precedence over other fields") {
    const auto field = MetadataSource::select_author_field({"A One"}, {"B Two"}, std::string("C Three"));
    REQUIRE(std::holds_alternative<AuthorListField>(field));
    CHECK(MetadataSource::describe(field) == "author list");
}

TEST_CASE("blank lists fall through to the next field") {
    auto field = MetadataSource::select_author_field({" ", ""}, {"B Two"}, std::nullopt);
    REQUIRE(std::holds_alternative<AuthorsField>(field));

    field = MetadataSource::select_author_field({}, {"  "}, std::string("C Three"));
    REQUIRE(std::holds_alternative<SingleAuthorField>(field));
    CHECK(MetadataSource::describe(field) == "single author");

    field = MetadataSource::select_author_field({}, {}, std::string("   "));
    CHECK(std::holds_alternative<NoAuthorField>(field));
    CHECK(MetadataSource::describe(field) == "none");
}

TEST_CASE("raw metadata is trimmed and blank entries dropped") {
    const auto field = MetadataSource::select_author_field({"  Herbert, Frank ", "", " "}, {}, std::nullopt);
    const RawMetadata metadata = MetadataSource::to_raw_metadata(std::string("  Dune  "), field);
    REQUIRE(metadata.title.has_value());
    CHECK(*metadata.title == "Dune");
    CHECK(metadata.authors == std::vector<std::string>{"Herbert, Frank"});
}

TEST_CASE("blank title becomes absent") {
    const RawMetadata metadata = MetadataSource::to_raw_metadata(std::string(" \t "), NoAuthorField{});
    CHECK_FALSE(metadata.title.has_value());
    CHECK(metadata.authors.empty());

    const RawMetadata missing = MetadataSource::to_raw_metadata(std::nullopt, SingleAuthorField{" Jane Doe "});
    CHECK_FALSE(missing.title.has_value());
    CHECK(missing.authors == std::vector<std::string>{"Jane Doe"});
}
