#include "errors/IntegrationErrors.hpp"

namespace errors {

std::string to_string(ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::BadBounds:        return "bad_bounds";
        case ValidationErrorKind::BadPointCount:    return "bad_point_count";
        case ValidationErrorKind::UnknownMethod:    return "unknown_method";
        case ValidationErrorKind::MalformedRequest: return "malformed_request";
    }
    return "unknown";
}

std::string to_string(ExpressionErrorKind kind) {
    switch (kind) {
        case ExpressionErrorKind::SyntaxError:   return "syntax_error";
        case ExpressionErrorKind::UnknownSymbol: return "unknown_symbol";
    }
    return "unknown";
}

std::string to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Validation: return "Invalid request";
        case ErrorCategory::Expression: return "Invalid function expression";
        case ErrorCategory::Evaluation: return "Evaluation failed";
    }
    return "Error";
}

std::string IntegrationError::describe() const {
    // e.g. "Invalid function expression: unknown symbol 'foo' at position 0"
    return to_string(category) + ": " + message;
}

} // namespace errors
