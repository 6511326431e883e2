/**
 * @file IntegrationErrors.hpp
 * @brief Defines the error taxonomy reported by the integration core.
 *
 * Three families of errors can result from a request:
 * - ValidationError: the request itself is malformed (bounds, point count, method, field types).
 * - ExpressionError: the expression text cannot be compiled (syntax or unknown symbol).
 * - EvaluationError: the expression hit a domain fault while being sampled.
 *
 * Inside the core they travel as exceptions derived from IntegrationException. The request
 * handler converts them into the IntegrationError value, which the transports render as a
 * flat human-readable message.
 */
#ifndef NUMINT_INTEGRATION_ERRORS_HPP
#define NUMINT_INTEGRATION_ERRORS_HPP

#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace errors {

/**
 * @enum ErrorCategory
 * @brief Family an error belongs to.
 */
enum class ErrorCategory
{
    Validation,
    Expression,
    Evaluation
};

enum class ValidationErrorKind
{
    BadBounds,
    BadPointCount,
    UnknownMethod,
    MalformedRequest
};

enum class ExpressionErrorKind
{
    SyntaxError,
    UnknownSymbol
};

enum class EvaluationErrorKind
{
    DomainError
};

/**
 * @brief Common base of every error raised by the integration core.
 */
class IntegrationException : public std::runtime_error {
public:
    IntegrationException(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Raised when a request violates bounds, point count or method constraints.
 */
class ValidationError final : public IntegrationException {
public:
    ValidationError(ValidationErrorKind kind, const std::string& message)
        : IntegrationException(ErrorCategory::Validation, message), kind_(kind) {}

    ValidationErrorKind kind() const noexcept { return kind_; }

private:
    ValidationErrorKind kind_;
};

/**
 * @brief Raised by the expression compiler.
 *
 * The position is the zero-based character offset in the source text where the
 * offending token starts.
 */
class ExpressionError final : public IntegrationException {
public:
    ExpressionError(ExpressionErrorKind kind, const std::string& message, std::size_t position)
        : IntegrationException(ErrorCategory::Expression, message), kind_(kind), position_(position) {}

    ExpressionErrorKind kind() const noexcept { return kind_; }
    std::size_t position() const noexcept { return position_; }

private:
    ExpressionErrorKind kind_;
    std::size_t position_;
};

/**
 * @brief Raised when an expression produces an undefined or non-finite value at x.
 */
class EvaluationError final : public IntegrationException {
public:
    EvaluationError(const std::string& message, double at)
        : IntegrationException(ErrorCategory::Evaluation, message),
          kind_(EvaluationErrorKind::DomainError), at_(at) {}

    EvaluationErrorKind kind() const noexcept { return kind_; }
    double at() const noexcept { return at_; }

private:
    EvaluationErrorKind kind_;
    double at_;
};

/**
 * @brief Value form of an error, as returned by the request handler.
 *
 * The kind always belongs to the category; asking for a kind of another family yields
 * nullopt. `at` is set for evaluation errors.
 */
struct IntegrationError
{
    using Kind = std::variant<ValidationErrorKind, ExpressionErrorKind, EvaluationErrorKind>;

    ErrorCategory category;
    Kind kind;
    std::string message;
    std::optional<double> at;

    static IntegrationError from(const ValidationError& e)
    {
        return {ErrorCategory::Validation, e.kind(), e.what(), std::nullopt};
    }

    static IntegrationError from(const ExpressionError& e)
    {
        return {ErrorCategory::Expression, e.kind(), e.what(), std::nullopt};
    }

    static IntegrationError from(const EvaluationError& e)
    {
        std::optional<double> at;
        if (!std::isnan(e.at())) {
            at = e.at();
        }
        return {ErrorCategory::Evaluation, e.kind(), e.what(), at};
    }

    std::optional<ValidationErrorKind> validation_kind() const { return kind_as<ValidationErrorKind>(); }
    std::optional<ExpressionErrorKind> expression_kind() const { return kind_as<ExpressionErrorKind>(); }
    std::optional<EvaluationErrorKind> evaluation_kind() const { return kind_as<EvaluationErrorKind>(); }

    /**
     * @brief Renders the error as the single message sent in the error envelope.
     */
    std::string describe() const;

private:
    template<typename K>
    std::optional<K> kind_as() const
    {
        if (const K* value = std::get_if<K>(&kind)) {
            return *value;
        }
        return std::nullopt;
    }
};

std::string to_string(ValidationErrorKind kind);
std::string to_string(ExpressionErrorKind kind);
std::string to_string(ErrorCategory category);

} // namespace errors

#endif // NUMINT_INTEGRATION_ERRORS_HPP
