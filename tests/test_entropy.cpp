#include <catch2/catch.hpp>

#include "cliffkp/core/method.hpp"
#include "cliffkp/stats/entropy.hpp"

using cliffkp::core::ParseChoices;
using cliffkp::core::TIndividual;
using cliffkp::stats::GenomeEntropy;

namespace {

    std::vector<TIndividual> population(std::initializer_list<const char*> bits) {
        std::vector<TIndividual> pop;
        for (const char* b : bits) pop.emplace_back(ParseChoices(b));
        return pop;
    }

} // namespace

TEST_CASE("Entropy of an empty or uniform population is zero", "[entropy]") {
    const GenomeEntropy entropy;
    CHECK(entropy.measure({}) == 0.0);
    CHECK(entropy.measure(population({"0101", "0101", "0101"})) == 0.0);
}

TEST_CASE("Entropy of distinct candidates is log2 of the population size", "[entropy]") {
    const GenomeEntropy entropy;
    CHECK(entropy.measure(population({"00", "01", "10", "11"})) == Approx(2.0));
    CHECK(entropy.measure(population({"101", "010", "110"})) == Approx(std::log2(3.0)));
}

TEST_CASE("Entropy weighs candidates by frequency", "[entropy]") {
    const GenomeEntropy entropy;
    // p = {1/2, 1/4, 1/4}
    CHECK(entropy.measure(population({"1", "1", "0", "10"})) == Approx(1.5));
}

TEST_CASE("Entropy ignores scores", "[entropy]") {
    const GenomeEntropy entropy;
    auto pop = population({"00", "11"});
    pop[0].score = cliffkp::core::CliffScore::of(3);

    CHECK(entropy.measure(pop) == Approx(1.0));
}
