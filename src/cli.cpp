/*
    cli.cpp - One-shot command line integrator.

    Runs a single request through the same RequestHandler the server uses and prints the
    result. With --reference the expression is also integrated by an adaptive rule
    (Boost tanh-sinh or GSL QAGS) and the absolute difference is reported, which is handy to
    judge how many points a sampled rule needs.

    Example:
        numint_cli --function "sin(x)" --lower 0 --upper 3.141592653589793 --method simpson --reference tanh_sinh
*/
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <variant>

#include "../include/config/ServerConfig.hpp"
#include "../include/expression/CompiledExpression.hpp"
#include "../include/protocol/MessageCodec.hpp"
#include "../include/quadrature/QuadratureRuleHolder.hpp"
#include "../include/service/RequestHandler.hpp"

using R = traits::DataType::Real;

int main(int argc, char* argv[]) {
    config::IntegrateOptions options;
    try {
        options = config::parse_integrate_options(argc, argv);
    } catch (const config::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    if (options.help_requested) {
        std::cout << options.usage << std::endl;
        return 0;
    }

    const service::RequestHandler handler;
    const service::Outcome outcome = handler.handle(options.request);

    if (const auto* error = std::get_if<errors::IntegrationError>(&outcome)) {
        if (options.json) {
            std::cout << protocol::encode_error(*error) << std::endl;
        } else {
            std::cerr << error->describe() << std::endl;
        }
        return 1;
    }
    const auto& result = std::get<service::IntegrationResult>(outcome);

    std::optional<quadrature::ReferenceEstimate<R>> reference;
    if (options.reference) {
        try {
            const auto compiled = expression::compile(options.request.function);
            const quadrature::QuadratureRuleHolder<R> holder(*options.reference);
            reference = holder.integrate([&compiled](R x) { return compiled.evaluate(x); },
                                         options.request.lower_bound, options.request.upper_bound);
        } catch (const std::exception& e) {
            std::cerr << "Reference integration failed: " << e.what() << std::endl;
            return 1;
        }
    }

    if (options.json) {
        Json::Value envelope(Json::objectValue);
        envelope["type"] = "result";
        envelope["data"] = protocol::to_json(result);
        if (reference) {
            Json::Value ref(Json::objectValue);
            ref["method"] = std::string(traits::to_string(*options.reference));
            ref["value"] = reference->value;
            ref["absolute_error"] = reference->absolute_error;
            ref["difference"] = std::abs(result.value - reference->value);
            envelope["reference"] = ref;
        }
        std::cout << protocol::write_json(envelope) << std::endl;
        return 0;
    }

    std::cout << std::setprecision(12);
    std::cout << "Integral (" << result.method << ", " << result.num_points << " points): "
              << result.value << std::endl;
    if (result.error_estimate) {
        std::cout << "Standard error: " << *result.error_estimate << std::endl;
    }
    if (reference) {
        std::cout << "Reference (" << traits::to_string(*options.reference) << "): " << reference->value
                  << " +/- " << reference->absolute_error << std::endl;
        std::cout << "Absolute difference: " << std::abs(result.value - reference->value) << std::endl;
    }
    return 0;
}
