/**
 * @file RequestHandler.hpp
 * @brief Single entry point of the integration core.
 *
 * handle() validates a request, compiles its expression, samples and integrates it, and
 * returns either the result or a structured error. Checks run cheapest first and stop at the
 * first failure:
 *   1. method recognised
 *   2. bounds finite and lower_bound < upper_bound
 *   3. num_points within [traits::Limits::kMinPoints, traits::Limits::kMaxPoints]
 *   4. expression compiles
 *   5. evaluation completes without a domain fault
 *
 * The handler keeps no state between calls. Each call compiles its own expression and, for
 * Monte Carlo, owns its own std::mt19937, so one handler can serve any number of threads.
 */
#ifndef NUMINT_REQUEST_HANDLER_HPP
#define NUMINT_REQUEST_HANDLER_HPP

#include <functional>
#include <string>
#include <variant>

#include "../errors/IntegrationErrors.hpp"
#include "../expression/CompiledExpression.hpp"
#include "../traits/NUMINT_traits.hpp"
#include "IntegrationTypes.hpp"

namespace service {

using Outcome = std::variant<IntegrationResult, errors::IntegrationError>;

class RequestHandler {
public:
    using Compiler = std::function<expression::CompiledExpression(const std::string&)>;

    /**
     * @brief Creates a handler using expression::compile.
     */
    RequestHandler();

    /**
     * @brief Creates a handler with a custom compiler.
     * @throws std::invalid_argument if the compiler is empty.
     */
    explicit RequestHandler(Compiler compiler);

    /**
     * @brief Runs one integration request.
     * @return The result, or the first error encountered. Never throws for errors of the
     *         taxonomy; unexpected failures during evaluation are reported as evaluation errors.
     */
    Outcome handle(const IntegrationRequest& request) const;

    /**
     * @brief Checks steps 1 to 3 without compiling anything.
     * @return The recognised method.
     * @throws errors::ValidationError on the first violated constraint.
     */
    static traits::IntegrationMethod validate(const IntegrationRequest& request);

private:
    Compiler compiler_;

    IntegrationResult compute(const IntegrationRequest& request, traits::IntegrationMethod method) const;
};

} // namespace service

#endif // NUMINT_REQUEST_HANDLER_HPP
