#pragma once

#include "cliffkp/core/common.hpp"

namespace cliffkp::core {

    /**
     * @brief An instance or population file could not be opened or read.
     */
    class IoError : public std::runtime_error {
    public:
        explicit IoError(const std::string& message) : std::runtime_error(message) {}
    };

    /**
     * @brief Malformed text input: instance files, choice strings, population files.
     *
     * The kind tells callers (and tests) which rule was broken; the message
     * carries the offending line or the expected vs. actual count.
     */
    class FormatError : public std::runtime_error {
    public:
        enum class Kind {
            EmptyFile,        // no item-count line at all
            BadItemCount,     // item-count line is not an unsigned integer
            MissingItems,     // EOF before the declared number of item lines
            BadItem,          // item line is not exactly three unsigned integers
            MissingCapacity,  // no line after the item lines
            BadCapacity,      // capacity line is not an unsigned integer
            BadChoices,       // choice string holds something other than '0'/'1'
            LengthMismatch    // strict mode: choice string length != number of items
        };

        FormatError(Kind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        Kind kind() const noexcept { return kind_; }

    private:
        Kind kind_;
    };

    /**
     * @brief The YAML run configuration is malformed or holds a value of the wrong type.
     */
    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
    };

    const char* toString(FormatError::Kind kind);

} // namespace cliffkp::core
