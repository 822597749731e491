#include "cliffkp/core/tracker.hpp"
#include "cliffkp/core/method.hpp"

namespace cliffkp::core {

    bool GenerationTracker::reportOnGeneration(std::size_t generation,
                                               const std::vector<TIndividual>& population,
                                               std::optional<TIndividual>& bestInRun) const
    {
        const TIndividual* best = SelectBest(population);
        if (best == nullptr) {
            out_ << "Generation " << generation << " had no individuals\n";
            return false;
        }

        out_ << "Best score in generation " << generation << " was " << best->score << "\n";
        out_ << "\tEntropy of the population was " << diversity_.measure(population) << "\n";

        return UpdateBestInRun(bestInRun, *best);
    }

    void GenerationTracker::reportSummary(const std::vector<TIndividual>& finalPopulation,
                                          const std::optional<TIndividual>& bestInRun) const
    {
        const TIndividual* best = SelectBest(finalPopulation);

        out_ << "Best in final generation: ";
        if (best != nullptr) out_ << *best << "\n";
        else out_ << "none\n";

        out_ << "Best in overall run: ";
        if (bestInRun.has_value()) out_ << *bestInRun << "\n";
        else out_ << "none\n";
    }

    std::ostream& operator<<(std::ostream& os, const TIndividual& ind)
    {
        return os << "[" << FormatChoices(ind.choices) << "] " << ind.score;
    }

} // namespace cliffkp::core
