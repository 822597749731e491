#pragma once

#include "cliffkp/core/common.hpp"

namespace cliffkp::core {

    /**
     * @brief Result of cliff scoring a candidate.
     *
     * Either the candidate is Overloaded (its weight exceeds the capacity) or
     * it has a Value: the total value of the chosen items. Overloaded ranks
     * below every Value, Value(0) included; values rank numerically.
     * A default-constructed score is Overloaded.
     */
    class CliffScore {
    public:
        CliffScore() = default;

        static CliffScore overloaded() { return CliffScore(); }
        static CliffScore of(std::uint64_t total) { return CliffScore(total); }

        bool isOverloaded() const { return std::holds_alternative<Overloaded>(state_); }

        // Total value, absent for an Overloaded score.
        std::optional<std::uint64_t> value() const;

        std::strong_ordering operator<=>(const CliffScore& other) const;
        bool operator==(const CliffScore& other) const;

    private:
        struct Overloaded {};

        explicit CliffScore(std::uint64_t total) : state_(total) {}

        std::variant<Overloaded, std::uint64_t> state_;
    };

    // Prints "Overloaded" or "Value(n)".
    std::ostream& operator<<(std::ostream& os, const CliffScore& score);

    std::string toString(const CliffScore& score);

} // namespace cliffkp::core
