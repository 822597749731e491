#include "cliffkp/core/knapsack.hpp"
#include "cliffkp/core/errors.hpp"

namespace cliffkp::core {

    namespace {

        // Forward-only line cursor: false at EOF, IoError on a stream failure.
        bool NextLine(std::istream& in, std::string& line, const std::string& sourceName)
        {
            if (std::getline(in, line)) return true;
            if (in.bad()) {
                throw IoError("Failed to read from " + sourceName);
            }
            return false;
        }

        // Empty when the sum does not fit in 64 bits.
        template <typename Sum>
        std::optional<std::uint64_t> Aggregate(std::span<const Item> items, const Choices& choices, Sum field)
        {
            constexpr std::uint64_t maxTotal = std::numeric_limits<std::uint64_t>::max();
            const std::size_t n = std::min(items.size(), choices.size());
            std::uint64_t total = 0;
            for (std::size_t i = 0; i < n; i++) {
                if (!choices[i]) continue;
                const std::uint64_t term = field(items[i]);
                if (term > maxTotal - total) return std::nullopt;
                total += term;
            }
            return total;
        }

        std::uint64_t ValueOf(const Item& item)  { return item.value(); }
        std::uint64_t WeightOf(const Item& item) { return item.weight(); }

    } // namespace

    std::optional<Item> Knapsack::getItem(std::size_t index) const
    {
        if (index >= items_.size()) return std::nullopt;
        return items_[index];
    }

    std::uint64_t Knapsack::value(const Choices& choices) const
    {
        return checkedValue(choices).value_or(std::numeric_limits<std::uint64_t>::max());
    }

    std::uint64_t Knapsack::weight(const Choices& choices) const
    {
        return checkedWeight(choices).value_or(std::numeric_limits<std::uint64_t>::max());
    }

    std::optional<std::uint64_t> Knapsack::checkedValue(const Choices& choices) const
    {
        return Aggregate(items_, choices, ValueOf);
    }

    std::optional<std::uint64_t> Knapsack::checkedWeight(const Choices& choices) const
    {
        return Aggregate(items_, choices, WeightOf);
    }

    Knapsack Knapsack::fromFile(const std::string& path)
    {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw IoError("File (" + path + ") not found or not readable");
        }
        return parse(file, path);
    }

    Knapsack Knapsack::parse(std::istream& in, const std::string& sourceName)
    {
        std::string line;

        // number of items
        if (!NextLine(in, line, sourceName)) {
            throw FormatError(FormatError::Kind::EmptyFile,
                "The input file " + sourceName + " was empty");
        }
        std::uint64_t numItems = 0;
        if (!parseUnsigned(trim(line), numItems)) {
            throw FormatError(FormatError::Kind::BadItemCount,
                "The first line '" + line + "' of " + sourceName
                + " is not a valid number of items");
        }

        // the item lines, one per item
        std::vector<Item> items;
        for (std::uint64_t k = 0; k < numItems; k++) {
            if (!NextLine(in, line, sourceName)) {
                throw FormatError(FormatError::Kind::MissingItems,
                    "Expected " + std::to_string(numItems) + " items in " + sourceName
                    + " but only found " + std::to_string(items.size())
                    + "; is the number of items on the first line correct?");
            }
            try {
                items.push_back(Item::parse(line));
            } catch (const FormatError& e) {
                throw FormatError(e.kind(),
                    sourceName + ", line " + std::to_string(k + 2) + ": " + e.what());
            }
        }

        // capacity
        if (!NextLine(in, line, sourceName)) {
            throw FormatError(FormatError::Kind::MissingCapacity,
                "There was no capacity line in the input file " + sourceName
                + "; this might be because the number of items was set incorrectly");
        }
        std::uint64_t capacity = 0;
        if (!parseUnsigned(trim(line), capacity)) {
            throw FormatError(FormatError::Kind::BadCapacity,
                "The capacity line '" + line + "' of " + sourceName
                + " is not an unsigned integer");
        }

        return Knapsack(std::move(items), capacity);
    }

} // namespace cliffkp::core
