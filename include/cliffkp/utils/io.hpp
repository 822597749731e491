#pragma once

#include "cliffkp/core/data.hpp"
#include "cliffkp/core/knapsack.hpp"

namespace cliffkp::utils {

    using Population = std::vector<cliffkp::core::TIndividual>;

    /**
     * Reads a recorded run: generations are blocks of choice strings ("0101..."),
     * one candidate per line, separated by blank lines. Lines starting with '#'
     * are comments. Candidates come back unscored.
     *
     * Throws IoError if the file cannot be opened, FormatError (BadChoices) on
     * a malformed candidate line.
     */
    std::vector<Population> ReadPopulations(const std::string& path);

    // Same as ReadPopulations over an open stream; sourceName is used in messages.
    std::vector<Population> ReadPopulations(std::istream& in, const std::string& sourceName);

    /**
     * Outputs the instance summary to the screen.
     */
    void WriteKnapsackScreen(std::ostream& out, const std::string& instance,
                             const cliffkp::core::Knapsack& knapsack);

    /**
     * Outputs a scored candidate with its weight and value to the screen.
     */
    void WriteCandidateScreen(std::ostream& out, const cliffkp::core::Knapsack& knapsack,
                              const cliffkp::core::TIndividual& ind);

    /**
     * Appends a tab separated summary line to a results file:
     * instance, generations, best in final generation, best in run.
     * Throws IoError if the file cannot be opened for appending.
     */
    void WriteResults(const std::string& resultsFile, const std::string& instance,
                      std::size_t numGenerations,
                      const cliffkp::core::CliffScore& bestFinal,
                      const std::optional<cliffkp::core::TIndividual>& bestInRun);

} // namespace cliffkp::utils
