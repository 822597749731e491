#pragma once

#include "cliffkp/core/data.hpp"
#include "cliffkp/stats/entropy.hpp"

namespace cliffkp::core {

    /**
     * @brief Per-generation report and best-ever bookkeeping.
     *
     * Called once per generation, after the whole population has been scored.
     * The best-ever record belongs to the caller and is passed in explicitly so
     * that the only place it changes is reportOnGeneration().
     */
    class GenerationTracker {
    public:
        explicit GenerationTracker(const stats::IDiversityMeasure& diversity,
                                   std::ostream& out = std::cout)
            : diversity_(diversity), out_(out) {}

        /**
         * Prints the best score of the generation and the population entropy,
         * then updates bestInRun. Returns true if bestInRun changed.
         */
        bool reportOnGeneration(std::size_t generation,
                                const std::vector<TIndividual>& population,
                                std::optional<TIndividual>& bestInRun) const;

        // Prints the best of the final population and the best of the whole run.
        void reportSummary(const std::vector<TIndividual>& finalPopulation,
                           const std::optional<TIndividual>& bestInRun) const;

    private:
        const stats::IDiversityMeasure& diversity_;
        std::ostream& out_;
    };

    std::ostream& operator<<(std::ostream& os, const TIndividual& ind);

} // namespace cliffkp::core
