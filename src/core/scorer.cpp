#include "cliffkp/core/scorer.hpp"

namespace cliffkp::core {

    CliffScore Score(const Knapsack& knapsack, const Choices& choices)
    {
        // a weight too large for 64 bits is past any capacity
        const std::optional<std::uint64_t> weight = knapsack.checkedWeight(choices);
        if (!weight || *weight > knapsack.capacity()) {
            return CliffScore::overloaded();
        }
        return CliffScore::of(knapsack.value(choices));
    }

    CliffScore CliffScorer::evaluate(const Choices& choices) const
    {
        return Score(knapsack_, choices);
    }

} // namespace cliffkp::core
