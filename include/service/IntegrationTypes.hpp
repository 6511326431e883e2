/**
 * @file IntegrationTypes.hpp
 * @brief Request and result records exchanged with the request handler.
 */
#ifndef NUMINT_INTEGRATION_TYPES_HPP
#define NUMINT_INTEGRATION_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../traits/NUMINT_traits.hpp"

namespace service {

/**
 * @brief Parameters of one integration, as received from a transport.
 *
 * The method stays a string here: recognising it is part of validation.
 */
struct IntegrationRequest
{
    std::string function;
    double lower_bound = 0.0;
    double upper_bound = 1.0;
    int num_points = traits::Limits::kDefaultPoints;
    std::string method = "trapezoidal";
    std::optional<std::uint64_t> seed; ///< Seeds the Monte Carlo source; random when absent.
};

/**
 * @brief Integral value and the samples it was computed from.
 *
 * x_values and y_values have equal length. They are ascending in x for the deterministic
 * rules and in draw order for Monte Carlo. num_points is the count actually used.
 */
struct IntegrationResult
{
    double value = 0.0;
    std::string method;
    int num_points = 0;
    std::vector<double> x_values;
    std::vector<double> y_values;
    std::optional<double> error_estimate;
};

} // namespace service

#endif // NUMINT_INTEGRATION_TYPES_HPP
