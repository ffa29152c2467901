#include <catch2/catch_test_macros.hpp>
#include "AuthorNormalizer.hpp"

TEST_CASE("Last, First is reordered for FirstLast") {
    CHECK(AuthorNormalizer::normalize("Tolkien, John", AuthorOrder::FirstLast) == "John Tolkien");
    CHECK(AuthorNormalizer::normalize("Austen, Jane", AuthorOrder::FirstLast) == "Jane Austen");
    CHECK(AuthorNormalizer::normalize("Le Guin, Ursula", AuthorOrder::FirstLast) == "Ursula Le Guin");
}

TEST_CASE("LastFirst keeps the surname first with clean spacing") {
    CHECK(AuthorNormalizer::normalize("Austen ,Jane", AuthorOrder::LastFirst) == "Austen, Jane");
    CHECK(AuthorNormalizer::normalize("Jane Austen", AuthorOrder::LastFirst) == "Jane Austen");
}

TEST_CASE("name suffixes stay at the end") {
    CHECK(AuthorNormalizer::normalize("Doe, Jane, Jr.", AuthorOrder::FirstLast) == "Jane Doe, Jr.");
    CHECK(AuthorNormalizer::normalize("King, Martin Luther, Jr.", AuthorOrder::FirstLast)
          == "Martin Luther King, Jr.");
    CHECK(AuthorNormalizer::normalize("Doe, Jane, III", AuthorOrder::LastFirst) == "Doe, Jane, III");
    CHECK(AuthorNormalizer::is_name_suffix("sr."));
    CHECK(AuthorNormalizer::is_name_suffix("IV"));
    CHECK_FALSE(AuthorNormalizer::is_name_suffix("Smith"));
}

TEST_CASE("two authors in one field are not reordered") {
    CHECK(AuthorNormalizer::normalize("Foo Bar, Zoo Goo", AuthorOrder::FirstLast) == "Foo Bar, Zoo Goo");
    CHECK(AuthorNormalizer::normalize("Doe, Jane, Smith", AuthorOrder::FirstLast) == "Doe, Jane, Smith");
    CHECK(AuthorNormalizer::normalize("A, B, C, D", AuthorOrder::FirstLast) == "A, B, C, D");
}

TEST_CASE("AsIs only cleans whitespace and initials") {
    CHECK(AuthorNormalizer::normalize("  Tolkien ,  J.R.R.  ", AuthorOrder::AsIs) == "Tolkien, J. R. R.");
    CHECK(AuthorNormalizer::normalize("Tolkien, J.R.R.", AuthorOrder::FirstLast) == "J. R. R. Tolkien");
}

TEST_CASE("names without a comma come back cleaned") {
    CHECK(AuthorNormalizer::normalize("  Mary   Shelley ", AuthorOrder::FirstLast) == "Mary Shelley");
    CHECK(AuthorNormalizer::normalize("", AuthorOrder::FirstLast).empty());
    CHECK(AuthorNormalizer::normalize("   ", AuthorOrder::LastFirst).empty());
}

TEST_CASE("comma spacing is normalized") {
    CHECK(AuthorNormalizer::normalize_comma_spacing("Doe ,  Jane,,Jr.") == "Doe, Jane, Jr.");
    CHECK(AuthorNormalizer::normalize_comma_spacing("Doe,Jane") == "Doe, Jane");
}

TEST_CASE("a space is inserted after glued initials") {
    CHECK(AuthorNormalizer::insert_space_after_initials("J.Kent Layton") == "J. Kent Layton");
    CHECK(AuthorNormalizer::insert_space_after_initials("e.g. nothing") == "e.g. nothing");
    CHECK(AuthorNormalizer::insert_space_after_initials("J. Kent") == "J. Kent");
}
