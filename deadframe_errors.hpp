#ifndef DEADFRAME_ERRORS_H
#define DEADFRAME_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

enum ValidationRule {
    EMPTY_SYSTEM,
    IDENTITY,
    INSTANCE_COUNT,
    DIMENSION,
    NEGATIVE_VALUE,
    CONSERVATION,
    REQUEST_EXCEEDS_TOTAL,
    FORMAT
};

/**
 * Raised while building a SystemState. row and column point at the offending
 * entry, -1 where the rule has no such coordinate.
 */
class ValidationError : public std::invalid_argument {
    public:
        ValidationRule rule;
        int row;
        int column;
        ValidationError(ValidationRule rule, const std::string& message, int row = -1, int column = -1)
            : std::invalid_argument(message), rule(rule), row(row), column(column) {}
};

// Caller-side misuse of the engine.
class PreconditionError : public std::logic_error {
    public:
        explicit PreconditionError(const std::string& message) : std::logic_error(message) {}
};

class SearchBoundError : public std::runtime_error {
    public:
        size_t limit;
        size_t required;
        SearchBoundError(const std::string& message, size_t limit, size_t required)
            : std::runtime_error(message), limit(limit), required(required) {}
};

#endif
