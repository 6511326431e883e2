/**
 * @file CompiledExpression.hpp
 * @brief Compiled, re-evaluable form of a single-variable expression.
 *
 * A CompiledExpression owns the AST produced by the Parser. It is immutable once built
 * and evaluating it has no side effects, so one instance can be evaluated any number of
 * times, from any thread. Instances are move-only: each request compiles and owns its own.
 *
 * Usage Example:
 * @code
 * auto f = expression::compile("sin(x) * exp(-x)");
 * double y = f.evaluate(0.5);
 * @endcode
 */
#ifndef NUMINT_COMPILED_EXPRESSION_HPP
#define NUMINT_COMPILED_EXPRESSION_HPP

#include <string>

#include "../traits/NUMINT_traits.hpp"
#include "ExpressionNodes.hpp"

namespace expression {

class CompiledExpression {
public:
    using StoringVector = traits::DataType::StoringVector;

    /**
     * @brief Tokenizes and parses the text. Does not evaluate it.
     * @param text The expression, e.g. "x**2 + 1".
     * @return The compiled expression.
     * @throws errors::ExpressionError if the text is not a valid expression.
     */
    static CompiledExpression compile(const std::string& text);

    CompiledExpression(CompiledExpression&&) noexcept = default;
    CompiledExpression& operator=(CompiledExpression&&) noexcept = default;
    CompiledExpression(const CompiledExpression&) = delete;
    CompiledExpression& operator=(const CompiledExpression&) = delete;

    /**
     * @brief Evaluates the expression with x bound to the given value.
     * @throws errors::EvaluationError on a domain fault.
     */
    double evaluate(double x) const;

    /**
     * @brief Evaluates the expression at every node, in ascending index order.
     * Stops at the first domain fault.
     * @throws errors::EvaluationError on a domain fault.
     */
    StoringVector evaluate(const StoringVector& xs) const;

    double operator()(double x) const { return evaluate(x); }

    const std::string& source() const noexcept { return source_; }

private:
    CompiledExpression(std::string source, NodePtr root);

    std::string source_;
    NodePtr root_;
};

/**
 * @brief Shorthand for CompiledExpression::compile.
 */
inline CompiledExpression compile(const std::string& text) {
    return CompiledExpression::compile(text);
}

} // namespace expression

#endif // NUMINT_COMPILED_EXPRESSION_HPP
