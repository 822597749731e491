#include "cliffkp/core/score.hpp"

namespace cliffkp::core {

    std::optional<std::uint64_t> CliffScore::value() const
    {
        if (const auto* total = std::get_if<std::uint64_t>(&state_)) {
            return *total;
        }
        return std::nullopt;
    }

    std::strong_ordering CliffScore::operator<=>(const CliffScore& other) const
    {
        const bool lhsOver = isOverloaded();
        const bool rhsOver = other.isOverloaded();

        if (lhsOver && rhsOver) return std::strong_ordering::equal;
        if (lhsOver) return std::strong_ordering::less;
        if (rhsOver) return std::strong_ordering::greater;

        return std::get<std::uint64_t>(state_) <=> std::get<std::uint64_t>(other.state_);
    }

    bool CliffScore::operator==(const CliffScore& other) const
    {
        return (*this <=> other) == std::strong_ordering::equal;
    }

    std::ostream& operator<<(std::ostream& os, const CliffScore& score)
    {
        if (score.isOverloaded()) return os << "Overloaded";
        return os << "Value(" << *score.value() << ")";
    }

    std::string toString(const CliffScore& score)
    {
        std::ostringstream oss;
        oss << score;
        return oss.str();
    }

} // namespace cliffkp::core
