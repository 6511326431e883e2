/*
    bindings.cpp - Pybind11 bindings for the NUMINT integration core.

    Exposes the request handler and the expression compiler to Python so notebooks and test
    harnesses can drive the same code the server runs.

    Main Features:
    --------------
    - integrate(function, lower_bound, upper_bound, num_points=100, method="trapezoidal", seed=None)
        * Returns a dict with value, method, num_points, x_values, y_values and, for
          monte_carlo, error_estimate.
        * Raises ValueError with the same message the server would send.

    - handle_message(text)
        * Wire level entry point: returns the JSON reply envelope, or None when the message
          is not an integration request.

    - CompiledExpression / compile(text)
        * Compiles once, evaluates at a scalar or at a numpy vector of points.

    Usage:
    ------
        import numint
        numint.integrate("x**2", 0.0, 1.0, method="simpson")["value"]
        f = numint.compile("sin(x) * exp(-x)")
        f(0.5)
*/
#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "../include/expression/CompiledExpression.hpp"
#include "../include/protocol/MessageCodec.hpp"
#include "../include/service/RequestHandler.hpp"
#include "../include/traits/NUMINT_traits.hpp"

namespace py = pybind11;

using Vector = traits::DataType::StoringVector;

namespace {

const service::RequestHandler& shared_handler() {
    static const service::RequestHandler handler;
    return handler;
}

py::dict to_dict(const service::IntegrationResult& result) {
    py::dict data;
    data["value"] = result.value;
    data["method"] = result.method;
    data["num_points"] = result.num_points;
    data["x_values"] = result.x_values;
    data["y_values"] = result.y_values;
    if (result.error_estimate) {
        data["error_estimate"] = *result.error_estimate;
    }
    return data;
}

} // namespace

PYBIND11_MODULE(numint, m) {
    m.doc() = "Expression driven numerical integration";

    py::class_<expression::CompiledExpression>(m, "CompiledExpression")
        .def("evaluate", py::overload_cast<double>(&expression::CompiledExpression::evaluate, py::const_),
             py::arg("x"))
        .def("evaluate", py::overload_cast<const Vector&>(&expression::CompiledExpression::evaluate, py::const_),
             py::arg("xs"))
        .def("__call__", &expression::CompiledExpression::operator(), py::arg("x"))
        .def_property_readonly("source", &expression::CompiledExpression::source);

    m.def("compile",
          [](const std::string& text) {
              try {
                  return expression::compile(text);
              } catch (const errors::ExpressionError& e) {
                  throw py::value_error(errors::IntegrationError::from(e).describe());
              }
          },
          py::arg("text"),
          "Compiles an expression in x. Raises ValueError on invalid input.");

    m.def("integrate",
          [](const std::string& function, double lower_bound, double upper_bound, int num_points,
             const std::string& method, std::optional<std::uint64_t> seed) {
              service::IntegrationRequest request;
              request.function = function;
              request.lower_bound = lower_bound;
              request.upper_bound = upper_bound;
              request.num_points = num_points;
              request.method = method;
              request.seed = seed;

              service::Outcome outcome;
              {
                  py::gil_scoped_release release;
                  outcome = shared_handler().handle(request);
              }
              if (const auto* error = std::get_if<errors::IntegrationError>(&outcome)) {
                  throw py::value_error(error->describe());
              }
              return to_dict(std::get<service::IntegrationResult>(outcome));
          },
          py::arg("function"), py::arg("lower_bound"), py::arg("upper_bound"),
          py::arg("num_points") = traits::Limits::kDefaultPoints,
          py::arg("method") = std::string("trapezoidal"),
          py::arg("seed") = std::nullopt);

    m.def("handle_message",
          [](const std::string& text) {
              const protocol::MessageAdapter adapter(shared_handler());
              py::gil_scoped_release release;
              return adapter.respond(text);
          },
          py::arg("text"),
          "Answers one wire message; returns None when the message is ignored.");
}
