/**
 * @file QuadratureRuleAbstract.hpp
 * @brief Defines the abstract interface for adaptive reference quadrature rules.
 *
 * A reference rule integrates a single-variable function over a finite interval to a
 * requested tolerance, and reports the estimate of its own absolute error. It is used to
 * measure how far a sampled rule is from the true integral.
 */
#ifndef NUMINT_I_QUADRATURE_RULE_HPP
#define NUMINT_I_QUADRATURE_RULE_HPP

#include <functional>
#include <memory>

namespace quadrature {

/**
 * @brief Result of an adaptive integration.
 */
template<typename NumericType>
struct ReferenceEstimate {
    NumericType value;
    NumericType absolute_error; ///< Error estimate reported by the backend.
};

/**
 * @brief Abstract interface for adaptive reference quadrature rules.
 *
 * @tparam NumericType The numeric type used for integration (e.g., double, float).
 */
template<typename NumericType>
class IQuadratureRule {
public:
    virtual ~IQuadratureRule() = default;

    /**
     * @brief Integrates the given function over the specified finite interval.
     * @param integrand A callable function object taking NumericType, returning NumericType.
     * @param lower_bound The lower integration limit.
     * @param upper_bound The upper integration limit.
     * @return The approximate value of the definite integral and its error estimate.
     */
    virtual ReferenceEstimate<NumericType> integrate(
        const std::function<NumericType(NumericType)>& integrand,
        NumericType lower_bound,
        NumericType upper_bound) const = 0;

    /**
     * @brief Creates a copy of the underlying rule object.
     * Needed for value semantics of the QuadratureRuleHolder.
     * @return A std::unique_ptr to the new IQuadratureRule object.
     */
    virtual std::unique_ptr<IQuadratureRule<NumericType>> clone() const = 0;
};
} // namespace quadrature
#endif // NUMINT_I_QUADRATURE_RULE_HPP
