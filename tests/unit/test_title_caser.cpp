#include <catch2/catch_test_macros.hpp>
#include "TitleCaser.hpp"
#include "Utils.hpp"

#include <string>
#include <vector>

namespace {
std::string title(const std::string& input)
{
    return TitleCaser::title_case(input, TitleCaseDomain::Title);
}

std::string author(const std::string& input)
{
    return TitleCaser::title_case(input, TitleCaseDomain::Author);
}
}

TEST_CASE("minor words stay lowercase inside a title") {
    CHECK(title("the lord of the rings") == "The Lord of the Rings");
    CHECK(title("war and peace") == "War and Peace");
    CHECK(title("a tale of two cities") == "A Tale of Two Cities");
}

TEST_CASE("first and last words are always capitalized") {
    CHECK(title("of mice and men") == "Of Mice and Men");
    CHECK(title("something to think of") == "Something to Think Of");
    CHECK(title("  the end  ") == "  The End  ");
}

TEST_CASE("acronyms are preserved or restored") {
    CHECK(title("a history of nasa and the cia") == "A History of NASA and the CIA");
    CHECK(title("NASA plan") == "NASA Plan");
    CHECK(title(title("NASA plan")) == "NASA Plan");
    CHECK(title("the FBI files") == "The FBI Files");
}

TEST_CASE("a clause boundary restarts capitalization") {
    CHECK(title("the hunt: the secret agent") == "The Hunt: The Secret Agent");
    CHECK(title("dune · the butlerian jihad") == "Dune · The Butlerian Jihad");
    CHECK(title("narcissus, The secret agent") == "Narcissus, The Secret Agent");
    CHECK(title("salt, pepper and the rest") == "Salt, Pepper and the Rest");
}

TEST_CASE("hyphenated words are cased per segment") {
    CHECK(title("the out-of-print stories") == "The Out-of-Print Stories");
    CHECK(title("out-of-print") == "Out-Of-Print");
    CHECK(title("the self-made man") == "The Self-Made Man");
}

TEST_CASE("surrounding punctuation is kept") {
    CHECK(title("(the) lost files") == "(The) Lost Files");
    CHECK(title("\"quoted\" words") == "\"Quoted\" Words");
}

TEST_CASE("intentionally cased words are left alone") {
    CHECK(title("the iPhone story") == "The iPhone Story");
    CHECK(title("the eBay years") == "The eBay Years");
    CHECK(title("19th century tales") == "19th Century Tales");
}

TEST_CASE("apostrophe and Mc prefixes") {
    CHECK(author("john o'brien") == "John O'Brien");
    CHECK(author("old mcdonald") == "Old McDonald");
    CHECK(title("the hitchhiker's guide") == "The Hitchhiker's Guide");
    CHECK(title("don't look") == "Don't Look");
}

TEST_CASE("single letters followed by a period are initials") {
    CHECK(author("j. r. r. tolkien") == "J. R. R. Tolkien");
    CHECK(author("george a. romero") == "George A. Romero");
}

TEST_CASE("name particles are minor words only for authors") {
    CHECK(author("vincent van gogh") == "Vincent van Gogh");
    CHECK(author("guillermo del toro") == "Guillermo del Toro");
    CHECK(title("the man from del rio") == "The Man from Del Rio");
}

TEST_CASE("known lowercase acronyms apply to titles only") {
    CHECK(author("nasa smith") == "Nasa Smith");
    CHECK(title("nasa smith") == "NASA Smith");
}

TEST_CASE("blank input is returned unchanged") {
    CHECK(title("").empty());
    CHECK(title("   ") == "   ");
}

TEST_CASE("title casing is stable on its own output") {
    const std::vector<std::string> inputs = {
        "the lord of the rings",
        "a tale of two cities",
        "the hunt: the secret agent",
        "war and peace",
        "out-of-print stories",
        "NASA plan",
        "of mice and men"
    };
    for (const auto& input : inputs) {
        const std::string once = title(input);
        INFO(input << " -> " << once);
        CHECK(title(once) == once);
    }
}

TEST_CASE("split_token separates punctuation from the core") {
    const TitleToken token = TitleCaser::split_token(Utils::to_code_points("(out-of-print),"));
    CHECK(token.leading == U"(");
    CHECK(token.core == U"out-of-print");
    CHECK(token.trailing == U"),");
    REQUIRE(token.hyphen_segments.size() == 3);
    CHECK(token.hyphen_segments[1] == U"of");

    const TitleToken dash = TitleCaser::split_token(U"--");
    CHECK_FALSE(dash.has_core());
    CHECK(dash.trailing == U"--");
}

TEST_CASE("segment rules are evaluated in a fixed order") {
    const TitleCaser caser(TitleCaseDomain::Title);
    REQUIRE(caser.rules().size() == 4);
    CHECK(caser.rules()[0].name == "acronym");
    CHECK(caser.rules()[1].name == "initial");
    CHECK(caser.rules()[2].name == "minor-word");
    CHECK(caser.rules()[3].name == "capitalize");
}
