#include <catch2/catch.hpp>

#include "cliffkp/core/score.hpp"

using cliffkp::core::CliffScore;

TEST_CASE("Scores compare correctly", "[score]") {
    CHECK(CliffScore::of(3) < CliffScore::of(5));
    CHECK(CliffScore::of(8) > CliffScore::of(5));
    CHECK(CliffScore::of(3) == CliffScore::of(3));
    CHECK(CliffScore::of(3) > CliffScore::overloaded());
    CHECK(CliffScore::overloaded() < CliffScore::of(0));
    CHECK(CliffScore::overloaded() == CliffScore::overloaded());
    CHECK(CliffScore::overloaded() != CliffScore::of(0));
}

TEST_CASE("Default score is Overloaded", "[score]") {
    const CliffScore score;
    CHECK(score.isOverloaded());
    CHECK_FALSE(score.value().has_value());
}

TEST_CASE("Value scores expose their total", "[score]") {
    const CliffScore score = CliffScore::of(42);
    CHECK_FALSE(score.isOverloaded());
    REQUIRE(score.value().has_value());
    CHECK(*score.value() == 42);
}

TEST_CASE("Overloaded ranks below every value, including the largest", "[score]") {
    CHECK(CliffScore::overloaded() < CliffScore::of(std::numeric_limits<std::uint64_t>::max()));
    CHECK(CliffScore::of(std::numeric_limits<std::uint64_t>::max()) > CliffScore::of(0));
}

TEST_CASE("Score order is total and transitive", "[score]") {
    const std::vector<CliffScore> scores = {
        CliffScore::overloaded(), CliffScore::of(0), CliffScore::of(1),
        CliffScore::of(7), CliffScore::of(7), CliffScore::overloaded(), CliffScore::of(100),
    };

    for (const auto& a : scores) {
        for (const auto& b : scores) {
            const int holds = (a < b ? 1 : 0) + (a == b ? 1 : 0) + (a > b ? 1 : 0);
            CHECK(holds == 1);
            CHECK((a < b) == (b > a));

            for (const auto& c : scores) {
                if (a < b && b < c) CHECK(a < c);
                if (a == b && b == c) CHECK(a == c);
            }
        }
    }
}

TEST_CASE("Value order matches numeric order", "[score]") {
    for (std::uint64_t a = 0; a < 5; a++) {
        for (std::uint64_t b = 0; b < 5; b++) {
            CHECK((CliffScore::of(a) < CliffScore::of(b)) == (a < b));
        }
    }
}

TEST_CASE("Scores print their variant", "[score]") {
    CHECK(cliffkp::core::toString(CliffScore::overloaded()) == "Overloaded");
    CHECK(cliffkp::core::toString(CliffScore::of(9)) == "Value(9)");
}
