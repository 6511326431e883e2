/**
 * @file QuadratureRule.hpp
 * @brief Adaptive reference quadrature rules backed by Boost.Math and GSL.
 *
 * This header defines two rules implementing quadrature::IQuadratureRule:
 * - quadrature::BoostTanhSinhQuadrature: Boost.Math's tanh_sinh quadrature.
 * - quadrature::GSLQuadrature: GSL's QAGS adaptive Gauss-Kronrod routine with a per-call workspace.
 *
 * Both only accept finite intervals with lower_bound < upper_bound. Exceptions thrown by the
 * integrand (errors::EvaluationError in practice) reach the caller unchanged: Boost lets them
 * propagate, and the GSL adapter stores them while inside the C library and rethrows them once
 * GSL has returned.
 *
 * Usage Example:
 * @code
 * quadrature::BoostTanhSinhQuadrature<double> boost_quad;
 * auto estimate = boost_quad.integrate([](double x) { return std::exp(-x * x); }, 0.0, 1.0);
 * @endcode
 */
#ifndef NUMINT_QUADRATURE_RULE_HPP
#define NUMINT_QUADRATURE_RULE_HPP

#include <cmath>
#include <exception>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/math/quadrature/tanh_sinh.hpp>
#include <boost/math/special_functions/fpclassify.hpp>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_integration.h>
#include "../traits/NUMINT_traits.hpp"
#include "QuadratureRuleAbstract.hpp"

namespace quadrature {

namespace detail {

template<typename R>
void require_finite_interval(R lower_bound, R upper_bound)
{
    if (!(boost::math::isfinite)(lower_bound) || !(boost::math::isfinite)(upper_bound)) {
        throw std::invalid_argument("Reference quadrature requires finite bounds.");
    }
    if (!(lower_bound < upper_bound)) {
        throw std::invalid_argument("Reference quadrature requires lower_bound < upper_bound.");
    }
}

} // namespace detail

template<typename R = traits::DataType::Real>
class BoostTanhSinhQuadrature final : public IQuadratureRule<R> {
    R target_relative_error_;
    std::size_t max_refinements_;

public:
    /**
     * @brief Constructor for the Boost tanh_sinh adapter.
     * @param relative_error Target relative error for the integration.
     * @param max_refinements Maximum number of interval halvings.
     */
    explicit BoostTanhSinhQuadrature(R relative_error = std::sqrt(std::numeric_limits<R>::epsilon()),
                                     std::size_t max_refinements = 15)
        : target_relative_error_(relative_error), max_refinements_(max_refinements) {}

    ReferenceEstimate<R> integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const override
    {
        detail::require_finite_interval(lower_bound, upper_bound);

        boost::math::quadrature::tanh_sinh<R> integrator(max_refinements_);
        R error_estimate = 0;
        R L1_norm = 0;
        R result = integrator.integrate(integrand, lower_bound, upper_bound,
                                        target_relative_error_, &error_estimate, &L1_norm);
        return {result, error_estimate};
    }

    std::unique_ptr<IQuadratureRule<R>> clone() const override {
        return std::make_unique<BoostTanhSinhQuadrature<R>>(*this);
    }
};

// --- C-style adapter for GSL ---
template<typename R = traits::DataType::Real>
struct GSLIntegrationWrapper {
    const std::function<R(R)>* integrand;
    std::exception_ptr failure;

    // Must be static to be convertible to a C function pointer.
    static double gsl_func_adapter(double x, void* params) {
        auto* self = static_cast<GSLIntegrationWrapper*>(params);
        if (self->failure) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        try {
            return static_cast<double>((*self->integrand)(static_cast<R>(x)));
        } catch (...) {
            // C++ exceptions must not unwind through GSL; rethrown after GSL returns.
            self->failure = std::current_exception();
            return std::numeric_limits<double>::quiet_NaN();
        }
    }
};

template<typename R = traits::DataType::Real>
class GSLQuadrature final : public IQuadratureRule<R> {
private:
    std::size_t workspace_size_;
    R target_absolute_error_;
    R target_relative_error_;

    // RAII wrapper for gsl_integration_workspace
    using GSLWorkspacePtr = std::unique_ptr<gsl_integration_workspace, decltype(&gsl_integration_workspace_free)>;

    GSLWorkspacePtr create_workspace() const {
        gsl_integration_workspace* ws = gsl_integration_workspace_alloc(workspace_size_);
        if (!ws) {
            throw std::runtime_error("Failed to allocate GSL workspace");
        }
        return GSLWorkspacePtr(ws, gsl_integration_workspace_free);
    }

public:
    /**
     * @brief Constructor for the GSL QAGS adapter.
     * @param absolute_error Target absolute error.
     * @param relative_error Target relative error.
     * @param workspace_limit Max number of subintervals for the workspace.
     */
    explicit GSLQuadrature(
        R absolute_error = 1e-10,
        R relative_error = 1e-10,
        std::size_t workspace_limit = 1000)
        : workspace_size_(workspace_limit),
          target_absolute_error_(absolute_error),
          target_relative_error_(relative_error)
    {
        // The default GSL handler aborts the process; statuses are checked instead.
        gsl_set_error_handler_off();
    }

    ReferenceEstimate<R> integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const override
    {
        detail::require_finite_interval(lower_bound, upper_bound);

        GSLIntegrationWrapper<R> wrapper{&integrand, nullptr};
        gsl_function F;
        F.function = &GSLIntegrationWrapper<R>::gsl_func_adapter;
        F.params = &wrapper;

        double result = 0.0;
        double error_estimate = 0.0;

        // Allocate workspace per call for thread safety
        GSLWorkspacePtr workspace = create_workspace();

        int status = gsl_integration_qags(&F,
                                          static_cast<double>(lower_bound),
                                          static_cast<double>(upper_bound),
                                          static_cast<double>(target_absolute_error_),
                                          static_cast<double>(target_relative_error_),
                                          workspace_size_,
                                          workspace.get(),
                                          &result, &error_estimate);

        if (wrapper.failure) {
            std::rethrow_exception(wrapper.failure);
        }
        if (status != GSL_SUCCESS) {
            throw std::runtime_error(std::string("GSL integration failed: ") + gsl_strerror(status));
        }
        return {static_cast<R>(result), static_cast<R>(error_estimate)};
    }

    std::unique_ptr<IQuadratureRule<R>> clone() const override {
        return std::make_unique<GSLQuadrature<R>>(*this);
    }
};

} // namespace quadrature
#endif // NUMINT_QUADRATURE_RULE_HPP
