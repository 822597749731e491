#include "cliffkp/core/item.hpp"
#include "cliffkp/core/errors.hpp"

namespace cliffkp::core {

    bool parseUnsigned(std::string_view token, std::uint64_t& out)
    {
        // one explicit plus sign is allowed, as in "+5"
        if (!token.empty() && token.front() == '+') token.remove_prefix(1);
        if (token.empty()) return false;

        const char* first = token.data();
        const char* last = token.data() + token.size();
        auto [ptr, ec] = std::from_chars(first, last, out);

        // reject partial conversions ("12ab") and overflow
        return ec == std::errc() && ptr == last;
    }

    std::string_view trim(std::string_view text)
    {
        const std::string_view blanks = " \t\r\n\v\f";
        const auto begin = text.find_first_not_of(blanks);
        if (begin == std::string_view::npos) return {};
        const auto end = text.find_last_not_of(blanks);
        return text.substr(begin, end - begin + 1);
    }

    Item Item::parse(std::string_view line)
    {
        std::istringstream iss{std::string(line)};
        std::vector<std::uint64_t> fields;
        std::string token;

        while (iss >> token) {
            std::uint64_t aux = 0;
            if (!parseUnsigned(token, aux)) {
                throw FormatError(FormatError::Kind::BadItem,
                    "Failed to parse line '" + std::string(line) + "' into an item: '"
                    + token + "' is not an unsigned integer");
            }
            fields.push_back(aux);
        }

        if (fields.size() != 3) {
            throw FormatError(FormatError::Kind::BadItem,
                "The item specification line '" + std::string(line)
                + "' should have had 3 whitespace separated fields, found "
                + std::to_string(fields.size()));
        }

        return Item(fields[0], fields[1], fields[2]);
    }

    std::ostream& operator<<(std::ostream& os, const Item& item)
    {
        return os << "Item { id: " << item.id() << ", value: " << item.value()
                  << ", weight: " << item.weight() << " }";
    }

} // namespace cliffkp::core
