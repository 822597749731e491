#pragma once

#include "cliffkp/core/common.hpp"
#include "cliffkp/core/data.hpp"
#include "cliffkp/core/item.hpp"

namespace cliffkp::core {

    /**
     * @brief A 0/1 knapsack instance: an ordered list of items and a capacity.
     *
     * Item i corresponds to bit i of a choice vector. The instance is built once
     * and only read afterwards, so it can be shared by concurrent scorers.
     */
    class Knapsack {
    public:
        Knapsack(std::vector<Item> items, std::uint64_t capacity)
            : items_(std::move(items)), capacity_(capacity) {}

        std::span<const Item> items() const { return items_; }
        std::size_t numItems() const { return items_.size(); }

        // Absent when index is out of range.
        std::optional<Item> getItem(std::size_t index) const;

        // Maximum total weight the knapsack can hold.
        std::uint64_t capacity() const { return capacity_; }

        /**
         * Sum of the values of the chosen items. Items and bits are zipped to the
         * shorter of the two sequences: items without a bit, and bits without an
         * item, are ignored. A total past 2^64 - 1 saturates at that maximum.
         */
        std::uint64_t value(const Choices& choices) const;

        // Same aggregation as value(), over the weights.
        std::uint64_t weight(const Choices& choices) const;

        // As value() and weight(), but empty when the total overflows 64 bits.
        std::optional<std::uint64_t> checkedValue(const Choices& choices) const;
        std::optional<std::uint64_t> checkedWeight(const Choices& choices) const;

        /**
         * Method: fromFile
         * Description: load an instance in the format
         *
         *     3
         *     1 3 8
         *     2 2 8
         *     3 9 1
         *     10
         *
         * The first line is the number of items N, the next N lines are
         * "<id> <value> <weight>", the line after them is the capacity.
         * Anything after the capacity line is ignored.
         *
         * Throws IoError if the file cannot be opened or read, FormatError for
         * malformed contents.
         */
        static Knapsack fromFile(const std::string& path);

        // Same as fromFile over an already opened stream; sourceName is used in messages.
        static Knapsack parse(std::istream& in, const std::string& sourceName);

    private:
        std::vector<Item> items_;
        std::uint64_t capacity_;
    };

} // namespace cliffkp::core
