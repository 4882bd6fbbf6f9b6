#include "error.hpp"

namespace sqlbatch {

std::string Error::getCategoryName() const {
    switch (category) {
        case ErrorCategory::Configuration:
            return "Configuration";
        case ErrorCategory::Validation:
            return "Validation";
        case ErrorCategory::SourceRead:
            return "SourceRead";
        case ErrorCategory::Database:
            return "Database";
        case ErrorCategory::Internal:
            return "Internal";
        default:
            return "Unknown";
    }
}

std::string Error::toString() const {
    if (details.empty()) {
        return message;
    }
    return message + ": " + details;
}

} // namespace sqlbatch
