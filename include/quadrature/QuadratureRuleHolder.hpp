/**
 * @file QuadratureRuleHolder.hpp
 * @brief Value-semantic holder selecting an adaptive reference rule at runtime.
 *
 * The holder owns one IQuadratureRule, chosen by traits::QuadratureMethod, and deep-copies it
 * through clone(). It is what the command line tool uses to compare a sampled rule with a
 * high-accuracy reference.
 */
#ifndef NUMINT_QUADRATURE_RULE_HOLDER_HPP
#define NUMINT_QUADRATURE_RULE_HOLDER_HPP

#include <memory>
#include <stdexcept>
#include <utility>
#include "QuadratureRule.hpp"
#include "../traits/NUMINT_traits.hpp"

namespace quadrature {
using QuadratureType = traits::QuadratureMethod;

/**
 * @brief A holder class for the adaptive reference rules.
 *
 * @tparam R The floating-point type used for integration (e.g., float, double).
 */
template<typename R = traits::DataType::Real>
class QuadratureRuleHolder {
private:
    std::unique_ptr<IQuadratureRule<R>> p_rule_;

public:
    /**
     * @brief Constructor selecting the rule based on enum, with its default tolerances.
     * @param type The enum value specifying which quadrature rule to use.
     * @throws std::invalid_argument If an unsupported quadrature type is specified.
     */
    explicit QuadratureRuleHolder(QuadratureType type = QuadratureType::TanhSinh) {
        switch (type) {
            case QuadratureType::TanhSinh:
                p_rule_ = std::make_unique<BoostTanhSinhQuadrature<R>>();
                break;
            case QuadratureType::QAGS:
                p_rule_ = std::make_unique<GSLQuadrature<R>>();
                break;
            default:
                throw std::invalid_argument("Unsupported QuadratureType specified.");
        }
    }

    /**
     * @brief Adopts an already configured rule.
     * @throws std::invalid_argument If the rule is null.
     */
    explicit QuadratureRuleHolder(std::unique_ptr<IQuadratureRule<R>> rule)
        : p_rule_(std::move(rule)) {
        if (!p_rule_) {
            throw std::invalid_argument("QuadratureRuleHolder requires a rule.");
        }
    }

    // Deep copy through the clone interface
    QuadratureRuleHolder(const QuadratureRuleHolder& other)
        : p_rule_(other.p_rule_ ? other.p_rule_->clone() : nullptr) {}

    QuadratureRuleHolder& operator=(const QuadratureRuleHolder& other) {
        if (this != &other) {
            p_rule_ = other.p_rule_ ? other.p_rule_->clone() : nullptr;
        }
        return *this;
    }

    QuadratureRuleHolder(QuadratureRuleHolder&& other) noexcept = default;
    QuadratureRuleHolder& operator=(QuadratureRuleHolder&& other) noexcept = default;

    /**
     * @brief Integrates the given function over [lower_bound, upper_bound] with the held rule.
     * @throws std::runtime_error If the holder has been moved from.
     */
    ReferenceEstimate<R> integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const
    {
        if (!p_rule_) {
            throw std::runtime_error("QuadratureRuleHolder is not initialized with a rule.");
        }
        return p_rule_->integrate(integrand, lower_bound, upper_bound);
    }

    bool is_initialized() const {
        return p_rule_ != nullptr;
    }
};

} // namespace quadrature
#endif // NUMINT_QUADRATURE_RULE_HOLDER_HPP
