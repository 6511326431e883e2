#include "expression/ExpressionNodes.hpp"

#include <array>
#include <boost/math/constants/constants.hpp>
#include <boost/math/special_functions/fpclassify.hpp>
#include <cmath>
#include <sstream>
#include <utility>

#include "errors/IntegrationErrors.hpp"

namespace expression {

namespace {

constexpr std::array<std::pair<std::string_view, MathFunction>, 6> kFunctions = {{
    {"sin", MathFunction::Sin},
    {"cos", MathFunction::Cos},
    {"tan", MathFunction::Tan},
    {"exp", MathFunction::Exp},
    {"log", MathFunction::Log},
    {"sqrt", MathFunction::Sqrt},
}};

[[noreturn]] void domainError(const std::string& what, double x) {
    std::ostringstream message;
    message << what << " at x = " << x;
    throw errors::EvaluationError(message.str(), x);
}

// Every node result passes through here.
double checked(double value, const char* operation, double x) {
    if (!(boost::math::isfinite)(value)) {
        domainError(std::string(operation) + " produced a non-finite value", x);
    }
    return value;
}

} // namespace

std::optional<MathFunction> lookup_function(std::string_view name) noexcept {
    for (const auto& [functionName, function] : kFunctions) {
        if (functionName == name) {
            return function;
        }
    }
    return std::nullopt;
}

std::optional<MathConstant> lookup_constant(std::string_view name) noexcept {
    if (name == "pi") {
        return MathConstant::Pi;
    }
    if (name == "e") {
        return MathConstant::E;
    }
    return std::nullopt;
}

std::string_view to_string(MathFunction function) noexcept {
    for (const auto& [functionName, candidate] : kFunctions) {
        if (candidate == function) {
            return functionName;
        }
    }
    return "unknown";
}

double ConstantNode::evaluate(double) const {
    switch (constant_) {
    case MathConstant::Pi:
        return boost::math::constants::pi<double>();
    case MathConstant::E:
        return boost::math::constants::e<double>();
    }
    return 0.0;
}

double BinaryNode::evaluate(double x) const {
    const double leftValue = left_->evaluate(x);
    const double rightValue = right_->evaluate(x);

    switch (op_) {
    case BinaryOperator::Add:
        return checked(leftValue + rightValue, "addition", x);
    case BinaryOperator::Subtract:
        return checked(leftValue - rightValue, "subtraction", x);
    case BinaryOperator::Multiply:
        return checked(leftValue * rightValue, "multiplication", x);
    case BinaryOperator::Divide:
        if (rightValue == 0.0) {
            domainError("division by zero", x);
        }
        return checked(leftValue / rightValue, "division", x);
    case BinaryOperator::Power:
        // A negative base with a fractional exponent yields NaN and is rejected here.
        return checked(std::pow(leftValue, rightValue), "power", x);
    }
    domainError("unknown binary operator", x);
}

double CallNode::evaluate(double x) const {
    const double arg = argument_->evaluate(x);

    switch (function_) {
    case MathFunction::Sin:
        return checked(std::sin(arg), "sin", x);
    case MathFunction::Cos:
        return checked(std::cos(arg), "cos", x);
    case MathFunction::Tan:
        return checked(std::tan(arg), "tan", x);
    case MathFunction::Exp:
        return checked(std::exp(arg), "exp", x);
    case MathFunction::Log:
        if (arg <= 0.0) {
            domainError("log of non-positive value", x);
        }
        return checked(std::log(arg), "log", x);
    case MathFunction::Sqrt:
        if (arg < 0.0) {
            domainError("sqrt of negative value", x);
        }
        return checked(std::sqrt(arg), "sqrt", x);
    }
    domainError("unknown function", x);
}

} // namespace expression
