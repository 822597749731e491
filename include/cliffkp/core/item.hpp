#pragma once

#include "cliffkp/core/common.hpp"

namespace cliffkp::core {

    //--------------------------------------------------------------------------
    // Class: Item
    // Description: One item of a knapsack instance. The id is informational
    //              only; scoring uses value and weight.
    //--------------------------------------------------------------------------
    class Item {
    public:
        constexpr Item(std::uint64_t id, std::uint64_t value, std::uint64_t weight)
            : id_(id), value_(value), weight_(weight) {}

        constexpr std::uint64_t id() const { return id_; }
        constexpr std::uint64_t value() const { return value_; }
        constexpr std::uint64_t weight() const { return weight_; }

        friend constexpr bool operator==(const Item&, const Item&) = default;

        /**
         * Method: parse
         * Description: build an Item from a line "<id> <value> <weight>".
         * Throws FormatError (BadItem) on a wrong field count or a token that
         * is not an unsigned integer.
         */
        static Item parse(std::string_view line);

    private:
        std::uint64_t id_;
        std::uint64_t value_;
        std::uint64_t weight_;
    };

    std::ostream& operator<<(std::ostream& os, const Item& item);

    // Strict unsigned parse of a whole token: at most one leading '+', no trailing characters.
    bool parseUnsigned(std::string_view token, std::uint64_t& out);

    // Strip leading/trailing blanks, tabs and carriage returns.
    std::string_view trim(std::string_view text);

} // namespace cliffkp::core
