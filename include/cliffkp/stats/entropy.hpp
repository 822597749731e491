#pragma once

#include "cliffkp/core/data.hpp"

namespace cliffkp::stats {

    /**
     * @brief Diversity statistic over a population, reported once per generation.
     */
    class IDiversityMeasure {
    public:
        virtual ~IDiversityMeasure() = default;

        virtual double measure(const std::vector<core::TIndividual>& population) const = 0;
    };

    /**
     * @brief Shannon entropy (in bits) of the distribution of distinct choice
     * vectors in the population.
     *
     * 0 for an empty population or one where every candidate is identical,
     * log2(size) when all candidates differ.
     */
    class GenomeEntropy : public IDiversityMeasure {
    public:
        double measure(const std::vector<core::TIndividual>& population) const override;
    };

} // namespace cliffkp::stats
