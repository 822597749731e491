#pragma once
#include "cliffkp/core/data.hpp"

namespace cliffkp::core {

    // Abstract interface through which an optimizer evaluates candidates
    class IScorer {
        public:
            virtual ~IScorer() = default;

            // Must be pure: safe to call concurrently from several threads.
            virtual CliffScore evaluate(const Choices& choices) const = 0;

            // Number of bits a candidate is expected to have.
            virtual std::size_t getDimension() const = 0;
        };

}
