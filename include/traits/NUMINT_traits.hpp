/*!
 * @file NUMINT_traits.hpp
 * @brief Defines core type aliases, enumerations and limits for the NUMINT library.
 *
 * This header provides the type definitions shared by every NUMINT subsystem:
 * the scalar field and the Eigen storage used for sampled grids, the closed set of
 * integration methods accepted on the wire, the adaptive reference integrators, and
 * the point count limits enforced by the request handler.
 */

#ifndef NUMINT_TRAITS_HPP
#define NUMINT_TRAITS_HPP

#include <Eigen/Dense>
#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace traits
/*!
 * @namespace traits
 * @brief Contains all type aliases, enumerations and limits used across the NUMINT library.
 */
{

/*!
 * @struct DataType
 * @brief Central container of type aliases for the sampled data handled by NUMINT.
 */
struct DataType
{
public:
    using Real = double; ///< Scalar field used for evaluation and aggregation.

    using StoringVector = Eigen::Matrix<Real, Eigen::Dynamic, 1>; ///< Dynamic-size column vector (x or y samples).

    using StoringArray = Eigen::Array<Real, Eigen::Dynamic, 1>; ///< Dynamic-size array for element-wise operations.
};

/*!
 * @enum IntegrationMethod
 * @brief Closed set of quadrature algorithms a request can select.
 */
enum class IntegrationMethod
{
    Trapezoidal, ///< Composite trapezoidal rule on n equally spaced nodes.
    Simpson,     ///< Composite Simpson 1/3 rule on an even number of subintervals.
    Midpoint,    ///< Composite midpoint rule on n subinterval centres.
    MonteCarlo   ///< Plain Monte Carlo with uniform draws on [a, b].
};

/*!
 * @enum QuadratureMethod
 * @brief Adaptive reference integrators used to cross-check a rule.
 */
enum class QuadratureMethod
{
    TanhSinh, ///< Boost.Math tanh-sinh quadrature.
    QAGS      ///< GSL adaptive Gauss-Kronrod with extrapolation (QUADPACK QAGS).
};

/*!
 * @struct Limits
 * @brief Bounds on the number of sample points accepted by the request handler.
 */
struct Limits
{
    static constexpr int kMinPoints = 10;
    static constexpr int kMaxPoints = 1000;
    static constexpr int kDefaultPoints = 100;
};

/**
 * @brief Enumerates every integration method, in wire order.
 */
constexpr std::array<IntegrationMethod, 4> all_integration_methods() noexcept
{
    return {IntegrationMethod::Trapezoidal, IntegrationMethod::Simpson,
            IntegrationMethod::Midpoint, IntegrationMethod::MonteCarlo};
}

/**
 * @brief Returns the wire name of an integration method.
 */
constexpr std::string_view to_string(IntegrationMethod method) noexcept
{
    switch (method) {
        case IntegrationMethod::Trapezoidal: return "trapezoidal";
        case IntegrationMethod::Simpson:     return "simpson";
        case IntegrationMethod::Midpoint:    return "midpoint";
        case IntegrationMethod::MonteCarlo:  return "monte_carlo";
    }
    return "unknown";
}

/**
 * @brief Parses a wire name into an integration method.
 * @param name The method name, e.g. "simpson".
 * @return The method, or std::nullopt if the name is not part of the closed set.
 */
inline std::optional<IntegrationMethod> parse_integration_method(std::string_view name) noexcept
{
    for (IntegrationMethod method : all_integration_methods()) {
        if (to_string(method) == name) {
            return method;
        }
    }
    return std::nullopt;
}

constexpr std::string_view to_string(QuadratureMethod method) noexcept
{
    switch (method) {
        case QuadratureMethod::TanhSinh: return "tanh_sinh";
        case QuadratureMethod::QAGS:     return "qags";
    }
    return "unknown";
}

/**
 * @brief Parses the name of a reference integrator.
 * @throws std::invalid_argument If the name is neither "tanh_sinh" nor "qags".
 */
inline QuadratureMethod parse_quadrature_method(std::string_view name)
{
    if (name == to_string(QuadratureMethod::TanhSinh)) {
        return QuadratureMethod::TanhSinh;
    }
    if (name == to_string(QuadratureMethod::QAGS)) {
        return QuadratureMethod::QAGS;
    }
    throw std::invalid_argument("Unsupported quadrature method: " + std::string(name));
}

} // namespace traits

#endif // NUMINT_TRAITS_HPP
