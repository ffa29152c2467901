#include <catch2/catch_test_macros.hpp>
#include "Utils.hpp"
#include "TestHelpers.hpp"

#include <filesystem>

TEST_CASE("code point round trip keeps multibyte text intact") {
    const std::string text = "Les Misérables – Ünïcödé 📚";
    const std::u32string code_points = Utils::to_code_points(text);
    CHECK(code_points.size() == Utils::code_point_count(text));
    CHECK(Utils::from_code_points(code_points) == text);
    CHECK(Utils::code_point_count("é") == 1);
}

TEST_CASE("collapse_whitespace does not trim") {
    CHECK(Utils::collapse_whitespace(std::string("  a \t\n b  ")) == " a b ");
    CHECK(Utils::trim(std::string("  a  b \t")) == "a  b");
    CHECK(Utils::trim(std::string(" \t ")).empty());
}

TEST_CASE("fold_case compares names case-insensitively") {
    CHECK(Utils::fold_case("Book.EPUB") == Utils::fold_case("book.epub"));
    CHECK(Utils::fold_case("ÉCOLE") == Utils::fold_case("école"));
}

TEST_CASE("parse_bool accepts the lenient forms") {
    CHECK(Utils::parse_bool("1") == true);
    CHECK(Utils::parse_bool(" YES ") == true);
    CHECK(Utils::parse_bool("y") == true);
    CHECK(Utils::parse_bool("False") == false);
    CHECK(Utils::parse_bool("n") == false);
    CHECK_FALSE(Utils::parse_bool("maybe").has_value());
    CHECK_FALSE(Utils::parse_bool("").has_value());
}

TEST_CASE("utf8 paths survive conversion") {
    TempDir temp_dir;
    const std::string name = "Réveil – Été.epub";
    const auto path = temp_dir.path() / Utils::utf8_to_path(name);
    write_text_file(path, "x");
    REQUIRE(std::filesystem::exists(path));
    CHECK(Utils::path_to_utf8(path.filename()) == name);
}
