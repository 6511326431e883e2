/**
 * @file Sampler.hpp
 * @brief Builds the x grid on which an integrand is evaluated.
 *
 * - Trapezoidal and Simpson: n equally spaced nodes from a to b, both ends included.
 *   Simpson needs an even number of subintervals, so an even n is raised to n + 1.
 * - Midpoint: the centres of n equal subintervals.
 * - Monte Carlo: n uniform draws on [a, b], in draw order, from a generator owned by the caller.
 *
 * The deterministic grids are computed as a + i * h with the last trapezoidal/Simpson node
 * pinned to b, so the same (a, b, n) always yields the same bits.
 */
#ifndef NUMINT_SAMPLER_HPP
#define NUMINT_SAMPLER_HPP

#include <random>
#include <stdexcept>
#include "../traits/NUMINT_traits.hpp"
#include "../utils/Utils.hpp"

namespace sampling {

using StoringVector = traits::DataType::StoringVector;
using IntegrationMethod = traits::IntegrationMethod;

/**
 * @brief Number of samples actually used for a requested count.
 *
 * Simpson with an odd number of subintervals (n even) is adjusted to n + 1 points;
 * every other method uses n unchanged.
 */
constexpr int effective_point_count(int n, IntegrationMethod method) noexcept
{
    if (method == IntegrationMethod::Simpson && n % 2 == 0) {
        return n + 1;
    }
    return n;
}

/**
 * @brief Produces the x coordinates for one integration.
 *
 * @tparam R Floating-point type.
 * @param lower_bound a, finite.
 * @param upper_bound b, finite and greater than a.
 * @param num_points Requested number of points (at least 2).
 * @param method The integration method the grid is built for.
 * @param generator Per-request random source, only drawn from for Monte Carlo.
 * @return effective_point_count(num_points, method) x coordinates.
 * @throws std::invalid_argument if the interval is empty or num_points < 2.
 */
template<typename R = traits::DataType::Real>
StoringVector sample_grid(R lower_bound, R upper_bound, int num_points,
                          IntegrationMethod method, std::mt19937& generator)
{
    if (!(lower_bound < upper_bound)) {
        throw std::invalid_argument("sample_grid requires lower_bound < upper_bound.");
    }
    if (num_points < 2) {
        throw std::invalid_argument("sample_grid requires at least two points.");
    }

    const int n = effective_point_count(num_points, method);
    const R width = upper_bound - lower_bound;
    StoringVector grid(n);

    switch (method) {
        case IntegrationMethod::Trapezoidal:
        case IntegrationMethod::Simpson: {
            const R h = width / static_cast<R>(n - 1);
            for (int i = 0; i < n - 1; ++i) {
                grid(i) = lower_bound + static_cast<R>(i) * h;
            }
            grid(n - 1) = upper_bound;
            break;
        }
        case IntegrationMethod::Midpoint: {
            const R h = width / static_cast<R>(n);
            for (int i = 0; i < n; ++i) {
                grid(i) = lower_bound + (static_cast<R>(i) + static_cast<R>(0.5)) * h;
            }
            break;
        }
        case IntegrationMethod::MonteCarlo: {
            std::uniform_real_distribution<R> uniform(lower_bound, upper_bound);
            grid = Utils::sampler<R>(generator, uniform, n);
            break;
        }
    }
    return grid;
}

} // namespace sampling

#endif // NUMINT_SAMPLER_HPP
