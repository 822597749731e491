#include "cliffkp/stats/entropy.hpp"

#include <unordered_map>

namespace cliffkp::stats {

    double GenomeEntropy::measure(const std::vector<core::TIndividual>& population) const
    {
        if (population.empty()) return 0.0;

        std::unordered_map<core::Choices, std::size_t> counts;
        for (const auto& ind : population) {
            counts[ind.choices]++;
        }

        const double size = static_cast<double>(population.size());
        double entropy = 0.0;
        for (const auto& [choices, count] : counts) {
            const double p = static_cast<double>(count) / size;
            entropy -= p * std::log2(p);
        }

        // a single genotype gives -1 * log2(1) = -0.0
        return entropy == 0.0 ? 0.0 : entropy;
    }

} // namespace cliffkp::stats
