#include "palincheck/symmetry.h"

#include "catch.hpp"

#include <algorithm>
#include <list>
#include <string>
#include <vector>

using namespace palincheck;

TEST_CASE("Empty and single-character sequences are symmetric", "[symmetry]")
{
    REQUIRE(is_symmetric(CharacterSequence()));
    REQUIRE(is_symmetric(CharacterSequence(U"a")));
    REQUIRE(is_symmetric(CharacterSequence(U"?")));
    REQUIRE(is_symmetric(CharacterSequence(U" ")));
    REQUIRE(is_symmetric(CanonicalSequence()));
}

TEST_CASE("Two-index walk", "[symmetry]")
{
    REQUIRE(is_symmetric(CharacterSequence(U"aa")));
    REQUIRE_FALSE(is_symmetric(CharacterSequence(U"ab")));
    REQUIRE(is_symmetric(CharacterSequence(U"aba")));
    REQUIRE(is_symmetric(CharacterSequence(U"abba")));
    REQUIRE_FALSE(is_symmetric(CharacterSequence(U"abca")));
    REQUIRE_FALSE(is_symmetric(CharacterSequence(U"Racecar")));
    REQUIRE(is_symmetric(CharacterSequence(U"12321")));

    // Not normalized: spaces and punctuation take part in the comparison
    REQUIRE(is_symmetric(CharacterSequence(U"a, ,a")));
    REQUIRE_FALSE(is_symmetric(CharacterSequence(U"a ,a")));
}

TEST_CASE("Symmetry of the predicate under reversal", "[symmetry]")
{
    const std::vector<CharacterSequence> samples = {
        U"", U"x", U"xy", U"xyx", U"abcba", U"abccba", U"abcdba", U"Was it a car or a cat I saw?",
        U"été", U"été!", U"\U0001D11Ex\U0001D11E",
    };
    for (const auto& s : samples) {
        CharacterSequence reversed(s.rbegin(), s.rend());
        REQUIRE(is_symmetric(s) == is_symmetric(reversed));
        REQUIRE(is_symmetric(s) == (s == reversed));
    }
}

TEST_CASE("Generic iterator ranges", "[symmetry]")
{
    std::vector<int> numbers = { 1, 2, 3, 2, 1 };
    REQUIRE(is_symmetric(numbers.begin(), numbers.end()));
    numbers.push_back(1);
    REQUIRE_FALSE(is_symmetric(numbers.begin(), numbers.end()));

    std::list<std::string> words = { "step", "on", "no", "on", "step" };
    REQUIRE(is_symmetric(words.begin(), words.end()));

    std::list<char> empty;
    REQUIRE(is_symmetric(empty.begin(), empty.end()));

    std::string text = "abxba";
    auto mismatch = find_asymmetry(text.begin(), text.end());
    REQUIRE(mismatch.first == text.end());
    text = "abxca";
    mismatch = find_asymmetry(text.begin(), text.end());
    REQUIRE(mismatch.first == text.begin() + 1);
    REQUIRE(mismatch.second == text.begin() + 3);
}

TEST_CASE("SymmetryChecker reports the first mismatch", "[symmetry]")
{
    SymmetryChecker checker;
    REQUIRE(checker(U"level"));

    SymmetryResult ok = checker.check(U"level");
    REQUIRE(ok.symmetric);
    REQUIRE(ok.compared == U"level");
    REQUIRE_FALSE(ok.first_mismatch.has_value());

    SymmetryResult bad = checker.check(U"racecars");
    REQUIRE_FALSE(bad.symmetric);
    REQUIRE(bad.compared == U"racecars");
    REQUIRE(bad.first_mismatch.value() == 0);

    bad = checker.check(U"abcXba");
    REQUIRE_FALSE(bad.symmetric);
    REQUIRE(bad.first_mismatch.value() == 2);

    SymmetryResult empty = checker.check(CharacterSequence());
    REQUIRE(empty.symmetric);
    REQUIRE(empty.compared.empty());
}
