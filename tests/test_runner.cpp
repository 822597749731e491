#include <catch2/catch.hpp>

#include "cliffkp/core/runner.hpp"

namespace {

    const std::string dataDir = CLIFFKP_TEST_DATA_DIR;

    int initWith(cliffkp::Runner& runner, std::vector<std::string> args) {
        args.insert(args.begin(), "cliffkp");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        return runner.init(static_cast<int>(argv.size()), argv.data());
    }

} // namespace

TEST_CASE("Runner replays a population file", "[runner]") {
    cliffkp::Runner runner;
    REQUIRE(initWith(runner, {"-i", dataDir + "/tiny.txt", "-p", dataDir + "/population.txt"}) == 0);
    REQUIRE(runner.run() == 0);

    REQUIRE(runner.getBestInRun().has_value());
    CHECK(runner.getBestInRun()->score == cliffkp::core::CliffScore::of(12));
}

TEST_CASE("Runner scores choice strings", "[runner]") {
    cliffkp::Runner runner;
    REQUIRE(initWith(runner, {"-i", dataDir + "/tiny.txt", "-x", "001", "-x", "111"}) == 0);
    CHECK(runner.run() == 0);
    CHECK_FALSE(runner.getBestInRun().has_value());
}

TEST_CASE("Runner applies the YAML configuration and flags", "[runner]") {
    cliffkp::Runner runner;
    REQUIRE(initWith(runner, {"-i", dataDir + "/tiny.txt", "-c", dataDir + "/config_empty.yaml", "-d"}) == 0);

    CHECK(runner.getRunData().debug == 1);
    CHECK_FALSE(runner.getRunData().strictLength);
    CHECK(runner.getRunData().parallelEvaluation);
}

TEST_CASE("Strict mode rejects short candidates before any evaluation", "[runner]") {
    cliffkp::Runner lenient;
    CHECK(initWith(lenient, {"-i", dataDir + "/tiny.txt", "-x", "01"}) == 0);

    cliffkp::Runner strict;
    CHECK(initWith(strict, {"-i", dataDir + "/tiny.txt", "-x", "01", "--strict"}) < 0);
}

TEST_CASE("Strict mode checks every candidate of a replayed population", "[runner]") {
    cliffkp::Runner lenient;
    REQUIRE(initWith(lenient, {"-i", dataDir + "/tiny.txt", "-p", dataDir + "/population_short.txt"}) == 0);
    CHECK(lenient.run() == 0);

    cliffkp::Runner strict;
    CHECK(initWith(strict, {"-i", dataDir + "/tiny.txt", "-p", dataDir + "/population_short.txt", "-s"}) < 0);
    CHECK_FALSE(strict.getBestInRun().has_value());

    // the file setting alone is enough
    cliffkp::Runner fromConfig;
    CHECK(initWith(fromConfig, {"-i", dataDir + "/tiny.txt", "-p", dataDir + "/population_short.txt",
                                "-c", dataDir + "/config_full.yaml"}) < 0);
}

TEST_CASE("Command line flags override values set in the configuration file", "[runner]") {
    cliffkp::Runner fileOnly;
    REQUIRE(initWith(fileOnly, {"-i", dataDir + "/tiny.txt", "-c", dataDir + "/config_quiet.yaml"}) == 0);
    CHECK(fileOnly.getRunData().debug == 0);
    CHECK_FALSE(fileOnly.getRunData().strictLength);

    cliffkp::Runner overridden;
    REQUIRE(initWith(overridden, {"-i", dataDir + "/tiny.txt", "-c", dataDir + "/config_quiet.yaml", "-d", "-s"}) == 0);
    CHECK(overridden.getRunData().debug == 1);
    CHECK(overridden.getRunData().strictLength);

    // keys without a flag keep the file value
    CHECK_FALSE(overridden.getRunData().parallelEvaluation);
    CHECK(overridden.getRunData().threads == 1);
}

TEST_CASE("Load errors abort initialization", "[runner]") {
    cliffkp::Runner badInstance;
    CHECK(initWith(badInstance, {"-i", dataDir + "/missing_capacity.txt"}) < 0);

    cliffkp::Runner badChoices;
    CHECK(initWith(badChoices, {"-i", dataDir + "/tiny.txt", "-x", "0x1"}) < 0);

    cliffkp::Runner missingArgument;
    CHECK(initWith(missingArgument, {}) < 0);
}

TEST_CASE("Help exits successfully", "[runner]") {
    cliffkp::Runner runner;
    CHECK(initWith(runner, {"--help"}) > 0);
}
