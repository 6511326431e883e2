/*!
 * @file Utils.hpp
 * @brief Utility templates for random sampling and summary statistics on Eigen vectors.
 *
 * This header provides:
 * - A `sampler` function filling an Eigen vector with draws from any standard distribution,
 *   using a generator owned by the caller.
 * - `mean` and `population_stddev` over a sample vector, accumulated in index order.
 *
 * Dependencies:
 * - Eigen for vector storage.
 * - NUMINT_traits.hpp for type definitions.
 */

#ifndef NUMINT_UTILS_HPP
#define NUMINT_UTILS_HPP

#include <cmath>
#include <random>
#include <stdexcept>
#include "../traits/NUMINT_traits.hpp"

namespace Utils
{

/**
 * @section Random Generation Utilities
 */

/**
 * @brief Generates an Eigen vector filled with random samples.
 *
 * Draws happen in index order, so element i is the i-th value produced by the generator.
 *
 * @tparam T Scalar type (e.g., float, double).
 * @tparam DistributionType Type of random number distribution.
 * @param generator Mersenne Twister random number generator.
 * @param distribution Distribution object used to generate samples.
 * @param size Number of samples.
 * @return An Eigen vector of `size` samples.
 */
template<typename T = traits::DataType::Real, typename DistributionType>
traits::DataType::StoringVector sampler(
    std::mt19937& generator,          // Mersenne Twister engine (passed by reference)
    DistributionType& distribution,   // Generic distribution (passed by reference)
    Eigen::Index size)
{
    traits::DataType::StoringVector samples(size);
    for (Eigen::Index i = 0; i < size; ++i) {
        samples(i) = static_cast<T>(distribution(generator));
    }
    return samples;
}

/**
 * @section Statistics Utilities
 */

/**
 * @brief Arithmetic mean of a non-empty sample.
 * @throws std::invalid_argument if the sample is empty.
 */
template<typename T = traits::DataType::Real>
T mean(const traits::DataType::StoringVector& samples)
{
    if (samples.size() == 0) {
        throw std::invalid_argument("Cannot take the mean of an empty sample.");
    }
    T sum = static_cast<T>(0.0);
    for (Eigen::Index i = 0; i < samples.size(); ++i) {
        sum += samples(i);
    }
    return sum / static_cast<T>(samples.size());
}

/**
 * @brief Population standard deviation (divides by n) of a non-empty sample.
 * @throws std::invalid_argument if the sample is empty.
 */
template<typename T = traits::DataType::Real>
T population_stddev(const traits::DataType::StoringVector& samples)
{
    const T mu = mean<T>(samples);
    T squared = static_cast<T>(0.0);
    for (Eigen::Index i = 0; i < samples.size(); ++i) {
        const T deviation = samples(i) - mu;
        squared += deviation * deviation;
    }
    return std::sqrt(squared / static_cast<T>(samples.size()));
}

} // namespace Utils

#endif // NUMINT_UTILS_HPP
