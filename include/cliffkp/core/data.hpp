#pragma once

#include "cliffkp/core/common.hpp"
#include "cliffkp/core/score.hpp"

namespace cliffkp::core {

    // One bit per item: bit i set means item i is packed.
    using Choices = std::vector<bool>;

    //--------------------------------------------------------------------------
    // Struct: TIndividual
    // Description: A candidate of the external optimizer with its score
    //--------------------------------------------------------------------------
    struct TIndividual
    {
        Choices choices;                        // candidate choice vector
        CliffScore score;                       // Overloaded until evaluated

        TIndividual() = default;
        explicit TIndividual(Choices c) : choices(std::move(c)) {}
        TIndividual(Choices c, CliffScore s) : choices(std::move(c)), score(s) {}
    };

    //--------------------------------------------------------------------------
    // Struct: TRunData
    // Description: Configuration variables of an evaluation run
    //--------------------------------------------------------------------------
    struct TRunData
    {
        bool parallelEvaluation = true;         // evaluate each generation with OpenMP
        int threads = 0;                        // OpenMP threads (0 - runtime default)
        bool strictLength = false;              // reject candidates whose length != number of items
        int debug = 0;                          // define the run mode (0 - report only; 1 - verbose)
        std::string resultsFile;                // append a summary line here when not empty
    };

} // namespace cliffkp::core
