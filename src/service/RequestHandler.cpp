#include "service/RequestHandler.hpp"

#include <boost/math/special_functions/fpclassify.hpp>
#include <cstdint>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

#include "quadrature/QuadratureEngine.hpp"
#include "sampling/Sampler.hpp"

namespace service {

namespace {

std::mt19937 make_generator(const std::optional<std::uint64_t>& seed) {
    if (seed) {
        std::seed_seq sequence{static_cast<std::uint32_t>(*seed & 0xffffffffu),
                               static_cast<std::uint32_t>(*seed >> 32)};
        return std::mt19937(sequence);
    }
    std::random_device device;
    std::seed_seq sequence{device(), device(), device(), device()};
    return std::mt19937(sequence);
}

std::string method_list() {
    std::string names;
    for (auto method : traits::all_integration_methods()) {
        if (!names.empty()) {
            names += ", ";
        }
        names += traits::to_string(method);
    }
    return names;
}

} // namespace

RequestHandler::RequestHandler() : compiler_(&expression::compile) {}

RequestHandler::RequestHandler(Compiler compiler) : compiler_(std::move(compiler)) {
    if (!compiler_) {
        throw std::invalid_argument("RequestHandler requires a compiler.");
    }
}

Outcome RequestHandler::handle(const IntegrationRequest& request) const {
    try {
        const traits::IntegrationMethod method = validate(request);
        return compute(request, method);
    } catch (const errors::ValidationError& e) {
        return errors::IntegrationError::from(e);
    } catch (const errors::ExpressionError& e) {
        return errors::IntegrationError::from(e);
    } catch (const errors::EvaluationError& e) {
        return errors::IntegrationError::from(e);
    } catch (const std::exception& e) {
        return errors::IntegrationError::from(errors::EvaluationError(
            std::string("unexpected failure: ") + e.what(), std::numeric_limits<double>::quiet_NaN()));
    }
}

traits::IntegrationMethod RequestHandler::validate(const IntegrationRequest& request) {
    const auto method = traits::parse_integration_method(request.method);
    if (!method) {
        throw errors::ValidationError(errors::ValidationErrorKind::UnknownMethod,
                                      "unknown method '" + request.method + "', expected one of " + method_list());
    }

    if (!(boost::math::isfinite)(request.lower_bound) || !(boost::math::isfinite)(request.upper_bound)) {
        throw errors::ValidationError(errors::ValidationErrorKind::BadBounds,
                                      "lower_bound and upper_bound must be finite numbers");
    }
    if (!(request.lower_bound < request.upper_bound)) {
        std::ostringstream message;
        message << "lower_bound (" << request.lower_bound << ") must be less than upper_bound ("
                << request.upper_bound << ")";
        throw errors::ValidationError(errors::ValidationErrorKind::BadBounds, message.str());
    }

    if (request.num_points < traits::Limits::kMinPoints || request.num_points > traits::Limits::kMaxPoints) {
        throw errors::ValidationError(errors::ValidationErrorKind::BadPointCount,
                                      "num_points must be between " + std::to_string(traits::Limits::kMinPoints) +
                                      " and " + std::to_string(traits::Limits::kMaxPoints) + ", got " +
                                      std::to_string(request.num_points));
    }
    return *method;
}

IntegrationResult RequestHandler::compute(const IntegrationRequest& request, traits::IntegrationMethod method) const {
    const expression::CompiledExpression compiled = compiler_(request.function);
    std::mt19937 generator = make_generator(request.seed);

    double current_x = std::numeric_limits<double>::quiet_NaN();
    auto integrand = [&compiled, &current_x](double x) {
        current_x = x;
        return compiled.evaluate(x);
    };

    quadrature::QuadratureEngine<double> engine;
    try {
        auto outcome = engine.integrate(integrand, request.lower_bound, request.upper_bound,
                                        request.num_points, method, generator);

        IntegrationResult result;
        result.value = outcome.value;
        result.method = std::string(traits::to_string(method));
        result.num_points = static_cast<int>(outcome.x_values.size());
        result.x_values.assign(outcome.x_values.data(), outcome.x_values.data() + outcome.x_values.size());
        result.y_values.assign(outcome.y_values.data(), outcome.y_values.data() + outcome.y_values.size());
        result.error_estimate = outcome.error_estimate;
        return result;
    } catch (const errors::IntegrationException&) {
        throw;
    } catch (const std::exception& e) {
        // Anything outside the taxonomy is reported against the last x evaluated.
        throw errors::EvaluationError(std::string("unexpected evaluation failure: ") + e.what(), current_x);
    }
}

} // namespace service
