/**
 * @file QuadratureEngine.hpp
 * @brief The four sampled quadrature rules and the single point that selects between them.
 *
 * Given an integrand, the engine asks the sampler for the x grid, evaluates the integrand
 * on it in ascending index order, and aggregates the samples with the selected rule:
 * - Trapezoidal: h * (y0/2 + y1 + ... + y(n-2) + y(n-1)/2), h = (b-a)/(n-1)
 * - Simpson:     h/3 * (y0 + 4 y1 + 2 y2 + ... + 4 y(m-1) + ym), h = (b-a)/m, m even
 * - Midpoint:    h * (y0 + ... + y(n-1)), h = (b-a)/n
 * - Monte Carlo: (b-a) * mean(y), with standard error (b-a) * stddev(y) / sqrt(n)
 *
 * Only Monte Carlo reports an error estimate. The first domain fault raised by the integrand
 * aborts the whole integration; an aggregate that overflows is reported the same way.
 *
 * Usage Example:
 * @code
 * quadrature::QuadratureEngine<double> engine;
 * std::mt19937 generator(42);
 * auto outcome = engine.integrate([](double x) { return x * x; }, 0.0, 1.0, 101,
 *                                 traits::IntegrationMethod::Simpson, generator);
 * @endcode
 */
#ifndef NUMINT_QUADRATURE_ENGINE_HPP
#define NUMINT_QUADRATURE_ENGINE_HPP

#include <cmath>
#include <functional>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <boost/math/special_functions/fpclassify.hpp>
#include "../errors/IntegrationErrors.hpp"
#include "../sampling/Sampler.hpp"
#include "../traits/NUMINT_traits.hpp"
#include "../utils/Utils.hpp"

namespace quadrature {

using StoringVector = traits::DataType::StoringVector;

/**
 * @brief Value of one integration together with the samples it was computed from.
 */
template<typename R = traits::DataType::Real>
struct QuadratureOutcome {
    R value;
    StoringVector x_values;
    StoringVector y_values;
    std::optional<R> error_estimate; ///< Set for Monte Carlo only.
};

template<typename R = traits::DataType::Real>
class QuadratureEngine {
public:
    using Integrand = std::function<R(R)>;
    using IntegrationMethod = traits::IntegrationMethod;

    /**
     * @brief Integrates the given function over [lower_bound, upper_bound].
     * @param integrand Callable evaluated on every sample; may throw errors::EvaluationError.
     * @param lower_bound Lower integration limit.
     * @param upper_bound Upper integration limit.
     * @param num_points Requested number of samples (see sampling::effective_point_count).
     * @param method Rule to apply.
     * @param generator Per-request random source for Monte Carlo.
     * @return The integral value, the samples and, for Monte Carlo, the standard error.
     * @throws errors::EvaluationError on the first domain fault or a non-finite aggregate.
     */
    QuadratureOutcome<R> integrate(
        const Integrand& integrand,
        R lower_bound,
        R upper_bound,
        int num_points,
        IntegrationMethod method,
        std::mt19937& generator) const
    {
        QuadratureOutcome<R> outcome;
        outcome.x_values = sampling::sample_grid<R>(lower_bound, upper_bound, num_points, method, generator);
        outcome.y_values = evaluate(integrand, outcome.x_values);

        const auto& x = outcome.x_values;
        const auto& y = outcome.y_values;
        switch (method) {
            case IntegrationMethod::Trapezoidal:
                outcome.value = trapezoidal(x, y, lower_bound, upper_bound);
                break;
            case IntegrationMethod::Simpson:
                outcome.value = simpson(x, y, lower_bound, upper_bound);
                break;
            case IntegrationMethod::Midpoint:
                outcome.value = midpoint(x, y, lower_bound, upper_bound);
                break;
            case IntegrationMethod::MonteCarlo: {
                auto [value, standard_error] = monte_carlo(y, lower_bound, upper_bound);
                outcome.value = value;
                outcome.error_estimate = standard_error;
                break;
            }
        }
        return outcome;
    }

    /**
     * @brief Composite trapezoidal rule on equally spaced samples including both ends.
     */
    static R trapezoidal(const StoringVector& x, const StoringVector& y, R lower_bound, R upper_bound)
    {
        const Eigen::Index n = y.size();
        if (n < 2) {
            throw std::invalid_argument("Trapezoidal rule needs at least two samples.");
        }
        const R h = (upper_bound - lower_bound) / static_cast<R>(n - 1);

        R sum = y(0) / 2;
        for (Eigen::Index i = 1; i < n - 1; ++i) {
            sum += y(i);
            ensure_finite(sum, "trapezoidal sum", x(i));
        }
        sum += y(n - 1) / 2;
        return ensure_finite(h * sum, "trapezoidal sum", x(n - 1));
    }

    /**
     * @brief Composite Simpson 1/3 rule on m + 1 equally spaced samples, m even.
     */
    static R simpson(const StoringVector& x, const StoringVector& y, R lower_bound, R upper_bound)
    {
        const Eigen::Index m = y.size() - 1;
        if (m < 2 || m % 2 != 0) {
            throw std::invalid_argument("Simpson's rule needs an even number of subintervals.");
        }
        const R h = (upper_bound - lower_bound) / static_cast<R>(m);

        R sum = y(0);
        for (Eigen::Index i = 1; i < m; ++i) {
            sum += (i % 2 == 1 ? static_cast<R>(4) : static_cast<R>(2)) * y(i);
            ensure_finite(sum, "Simpson sum", x(i));
        }
        sum += y(m);
        return ensure_finite(h / 3 * sum, "Simpson sum", x(m));
    }

    /**
     * @brief Composite midpoint rule on the centres of n equal subintervals.
     */
    static R midpoint(const StoringVector& x, const StoringVector& y, R lower_bound, R upper_bound)
    {
        const Eigen::Index n = y.size();
        if (n < 1) {
            throw std::invalid_argument("Midpoint rule needs at least one sample.");
        }
        const R h = (upper_bound - lower_bound) / static_cast<R>(n);

        R sum = static_cast<R>(0.0);
        for (Eigen::Index i = 0; i < n; ++i) {
            sum += y(i);
            ensure_finite(sum, "midpoint sum", x(i));
        }
        return ensure_finite(h * sum, "midpoint sum", x(n - 1));
    }

    /**
     * @brief Plain Monte Carlo estimate and its standard error.
     * @return (value, error estimate).
     */
    static std::pair<R, R> monte_carlo(const StoringVector& y, R lower_bound, R upper_bound)
    {
        const R width = upper_bound - lower_bound;
        const R value = width * Utils::mean<R>(y);
        const R standard_error = width * Utils::population_stddev<R>(y) / std::sqrt(static_cast<R>(y.size()));
        // Draws are unordered, so an overflow cannot be tied to a single x.
        ensure_finite(value, "Monte Carlo mean", upper_bound);
        ensure_finite(standard_error, "Monte Carlo standard error", upper_bound);
        return {value, standard_error};
    }

private:
    static StoringVector evaluate(const Integrand& integrand, const StoringVector& x)
    {
        StoringVector y(x.size());
        for (Eigen::Index i = 0; i < x.size(); ++i) {
            y(i) = ensure_finite(integrand(x(i)), "integrand", x(i));
        }
        return y;
    }

    static R ensure_finite(R value, const char* what, R at)
    {
        if (!(boost::math::isfinite)(value)) {
            std::ostringstream message;
            message << what << " is not finite at x = " << at;
            throw errors::EvaluationError(message.str(), static_cast<double>(at));
        }
        return value;
    }
};

} // namespace quadrature

#endif // NUMINT_QUADRATURE_ENGINE_HPP
