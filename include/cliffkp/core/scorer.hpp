#pragma once

#include "cliffkp/core/iscorer.hpp"
#include "cliffkp/core/knapsack.hpp"

namespace cliffkp::core {

    /**
     * Method: Score
     * Description: cliff scoring. Overloaded when the chosen weight exceeds the
     * capacity, otherwise Value(total chosen value). No partial credit.
     */
    CliffScore Score(const Knapsack& knapsack, const Choices& choices);

    //--------------------------------------------------------------------------
    // Class: CliffScorer
    // Description: IScorer over an owned knapsack instance
    //--------------------------------------------------------------------------
    class CliffScorer : public IScorer {
    public:
        explicit CliffScorer(Knapsack knapsack) : knapsack_(std::move(knapsack)) {}

        CliffScore evaluate(const Choices& choices) const override;

        std::size_t getDimension() const override { return knapsack_.numItems(); }

        const Knapsack& knapsack() const { return knapsack_; }

    private:
        const Knapsack knapsack_;
    };

} // namespace cliffkp::core
