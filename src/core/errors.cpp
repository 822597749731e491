#include "cliffkp/core/errors.hpp"

namespace cliffkp::core {

    const char* toString(FormatError::Kind kind)
    {
        switch (kind) {
            case FormatError::Kind::EmptyFile:       return "EmptyFile";
            case FormatError::Kind::BadItemCount:    return "BadItemCount";
            case FormatError::Kind::MissingItems:    return "MissingItems";
            case FormatError::Kind::BadItem:         return "BadItem";
            case FormatError::Kind::MissingCapacity: return "MissingCapacity";
            case FormatError::Kind::BadCapacity:     return "BadCapacity";
            case FormatError::Kind::BadChoices:      return "BadChoices";
            case FormatError::Kind::LengthMismatch:  return "LengthMismatch";
        }
        return "Unknown";
    }

} // namespace cliffkp::core
