/**
 * @file ExpressionNodes.hpp
 * @brief Abstract syntax tree of the restricted expression language.
 *
 * The tree is closed over six node kinds: numbers, the variable x, the constants pi and e,
 * unary minus, the binary operators + - * / ** and calls to one of six functions.
 * Every node checks its own result, so a domain fault is reported at the node where it
 * happens and never propagates as NaN or infinity.
 *
 * Classes:
 * - IExpressionNode: interface evaluating a subtree at a given x.
 * - NumberNode, VariableNode, ConstantNode: leaves.
 * - UnaryMinusNode, BinaryNode, CallNode: interior nodes owning their operands.
 */
#ifndef NUMINT_EXPRESSION_NODES_HPP
#define NUMINT_EXPRESSION_NODES_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace expression {

enum class BinaryOperator
{
    Add,
    Subtract,
    Multiply,
    Divide,
    Power
};

enum class MathFunction
{
    Sin,
    Cos,
    Tan,
    Exp,
    Log, ///< Natural logarithm
    Sqrt
};

enum class MathConstant
{
    Pi,
    E
};

/**
 * @brief Looks up a supported function by name.
 * @return The function, or std::nullopt if the name is not one of sin cos tan exp log sqrt.
 */
std::optional<MathFunction> lookup_function(std::string_view name) noexcept;

/**
 * @brief Looks up a supported constant by name ("pi" or "e").
 */
std::optional<MathConstant> lookup_constant(std::string_view name) noexcept;

std::string_view to_string(MathFunction function) noexcept;

/**
 * @brief Interface of every AST node.
 */
class IExpressionNode {
public:
    virtual ~IExpressionNode() = default;

    /**
     * @brief Recursively evaluates the subtree.
     * @param x Value bound to the variable x.
     * @return The finite value of the subtree.
     * @throws errors::EvaluationError on a domain fault or a non-finite intermediate.
     */
    virtual double evaluate(double x) const = 0;
};

using NodePtr = std::unique_ptr<const IExpressionNode>;

class NumberNode final : public IExpressionNode {
public:
    explicit NumberNode(double value) : value_(value) {}

    double evaluate(double) const override { return value_; }

private:
    double value_;
};

class VariableNode final : public IExpressionNode {
public:
    double evaluate(double x) const override { return x; }
};

class ConstantNode final : public IExpressionNode {
public:
    explicit ConstantNode(MathConstant constant) : constant_(constant) {}

    double evaluate(double x) const override;

private:
    MathConstant constant_;
};

class UnaryMinusNode final : public IExpressionNode {
public:
    explicit UnaryMinusNode(NodePtr operand) : operand_(std::move(operand)) {}

    double evaluate(double x) const override { return -operand_->evaluate(x); }

private:
    NodePtr operand_;
};

class BinaryNode final : public IExpressionNode {
public:
    BinaryNode(BinaryOperator op, NodePtr left, NodePtr right)
        : op_(op), left_(std::move(left)), right_(std::move(right)) {}

    double evaluate(double x) const override;

private:
    BinaryOperator op_;
    NodePtr left_;
    NodePtr right_;
};

class CallNode final : public IExpressionNode {
public:
    CallNode(MathFunction function, NodePtr argument)
        : function_(function), argument_(std::move(argument)) {}

    double evaluate(double x) const override;

private:
    MathFunction function_;
    NodePtr argument_;
};

} // namespace expression

#endif // NUMINT_EXPRESSION_NODES_HPP
