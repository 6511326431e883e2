#include <service/RequestHandler.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace numint_test {

using errors::ErrorCategory;
using errors::IntegrationError;
using errors::ValidationErrorKind;
using service::IntegrationRequest;
using service::IntegrationResult;
using service::Outcome;
using service::RequestHandler;

/**
 * Test fixture for the request handler.
 * The injected compiler counts how often compilation is reached.
 */
class RequestHandlerTest : public ::testing::Test {
protected:
    std::atomic<int> compileCalls{0};

    RequestHandler handler{[this](const std::string& text) {
        ++compileCalls;
        return expression::compile(text);
    }};

    static IntegrationRequest request(const std::string& function, double a, double b, int n,
                                      const std::string& method) {
        IntegrationRequest r;
        r.function = function;
        r.lower_bound = a;
        r.upper_bound = b;
        r.num_points = n;
        r.method = method;
        return r;
    }

    static IntegrationResult resultOf(const Outcome& outcome) {
        if (const auto* error = std::get_if<IntegrationError>(&outcome)) {
            ADD_FAILURE() << "Unexpected error: " << error->describe();
        }
        return std::get<IntegrationResult>(outcome);
    }

    static IntegrationError errorOf(const Outcome& outcome) {
        EXPECT_TRUE(std::holds_alternative<IntegrationError>(outcome)) << "Expected an error";
        return std::get<IntegrationError>(outcome);
    }
};

TEST_F(RequestHandlerTest, IntegratesWithEveryMethod) {
    for (auto method : traits::all_integration_methods()) {
        const std::string name(traits::to_string(method));
        auto outcome = handler.handle(request("3*x**2", 0.0, 1.0, 200, name));

        const auto& result = resultOf(outcome);
        EXPECT_EQ(result.method, name);
        EXPECT_EQ(result.x_values.size(), result.y_values.size());
        EXPECT_EQ(static_cast<std::size_t>(result.num_points), result.x_values.size());
        const double tolerance = method == traits::IntegrationMethod::MonteCarlo ? 0.35 : 1e-4;
        EXPECT_NEAR(result.value, 1.0, tolerance) << name;
    }
}

TEST_F(RequestHandlerTest, DefaultRequestUsesTrapezoidalWithOneHundredPoints) {
    IntegrationRequest r;
    r.function = "x";

    const auto& result = resultOf(handler.handle(r));

    EXPECT_EQ(result.method, "trapezoidal");
    EXPECT_EQ(result.num_points, 100);
    EXPECT_FALSE(result.error_estimate.has_value());
}

TEST_F(RequestHandlerTest, ReversedBoundsFailBeforeAnyCompilation) {
    auto outcome = handler.handle(request("x", 1.0, 0.0, 100, "trapezoidal"));

    const auto& error = errorOf(outcome);
    EXPECT_EQ(error.category, ErrorCategory::Validation);
    EXPECT_EQ(error.validation_kind(), ValidationErrorKind::BadBounds);
    EXPECT_EQ(error.message, "lower_bound (1) must be less than upper_bound (0)");
    EXPECT_EQ(compileCalls.load(), 0);
}

TEST_F(RequestHandlerTest, EqualAndNonFiniteBoundsAreBadBounds) {
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_EQ(errorOf(handler.handle(request("x", 2.0, 2.0, 100, "midpoint"))).validation_kind(),
              ValidationErrorKind::BadBounds);
    EXPECT_EQ(errorOf(handler.handle(request("x", 0.0, inf, 100, "midpoint"))).validation_kind(),
              ValidationErrorKind::BadBounds);
    EXPECT_EQ(errorOf(handler.handle(request("x", nan, 1.0, 100, "midpoint"))).validation_kind(),
              ValidationErrorKind::BadBounds);
    EXPECT_EQ(compileCalls.load(), 0);
}

TEST_F(RequestHandlerTest, PointCountOutsideRangeIsRejected) {
    for (int n : {5, 9, 1001, -1, 0}) {
        const auto& error = errorOf(handler.handle(request("x", 0.0, 1.0, n, "trapezoidal")));
        EXPECT_EQ(error.validation_kind(), ValidationErrorKind::BadPointCount) << n;
    }
    EXPECT_EQ(errorOf(handler.handle(request("x", 0.0, 1.0, 5, "trapezoidal"))).message,
              "num_points must be between 10 and 1000, got 5");
    EXPECT_EQ(compileCalls.load(), 0);
}

TEST_F(RequestHandlerTest, PointCountLimitsAreInclusive) {
    EXPECT_EQ(resultOf(handler.handle(request("x", 0.0, 1.0, 10, "trapezoidal"))).num_points, 10);
    EXPECT_EQ(resultOf(handler.handle(request("x", 0.0, 1.0, 1000, "trapezoidal"))).num_points, 1000);
}

TEST_F(RequestHandlerTest, UnknownMethodIsCheckedFirst) {
    // Bounds, point count and expression are all invalid too.
    const auto& error = errorOf(handler.handle(request("foo(", 1.0, 0.0, 5, "romberg")));

    EXPECT_EQ(error.validation_kind(), ValidationErrorKind::UnknownMethod);
    EXPECT_EQ(error.message,
              "unknown method 'romberg', expected one of trapezoidal, simpson, midpoint, monte_carlo");
    EXPECT_EQ(compileCalls.load(), 0);
}

TEST_F(RequestHandlerTest, MethodNamesAreCaseSensitive) {
    EXPECT_EQ(errorOf(handler.handle(request("x", 0.0, 1.0, 100, "Simpson"))).validation_kind(),
              ValidationErrorKind::UnknownMethod);
}

TEST_F(RequestHandlerTest, BoundsAreCheckedBeforePointCount) {
    const auto& error = errorOf(handler.handle(request("x", 1.0, 0.0, 5, "simpson")));
    EXPECT_EQ(error.validation_kind(), ValidationErrorKind::BadBounds);
}

TEST_F(RequestHandlerTest, PointCountIsCheckedBeforeCompilation) {
    const auto& error = errorOf(handler.handle(request("foo(x)", 0.0, 1.0, 5, "simpson")));
    EXPECT_EQ(error.validation_kind(), ValidationErrorKind::BadPointCount);
    EXPECT_EQ(compileCalls.load(), 0);
}

TEST_F(RequestHandlerTest, ExpressionErrorsAreReportedWithTheirKind) {
    const auto& unknown = errorOf(handler.handle(request("foo(x)", 0.0, 1.0, 100, "trapezoidal")));
    EXPECT_EQ(unknown.category, ErrorCategory::Expression);
    EXPECT_EQ(unknown.expression_kind(), errors::ExpressionErrorKind::UnknownSymbol);
    EXPECT_EQ(unknown.describe(), "Invalid function expression: unknown symbol 'foo' at position 0");

    const auto& syntax = errorOf(handler.handle(request("x +", 0.0, 1.0, 100, "trapezoidal")));
    EXPECT_EQ(syntax.category, ErrorCategory::Expression);
    EXPECT_EQ(syntax.expression_kind(), errors::ExpressionErrorKind::SyntaxError);
    EXPECT_EQ(compileCalls.load(), 2);
}

TEST_F(RequestHandlerTest, OnlyTheKindOfTheReportedFamilyIsSet) {
    const auto expression = errorOf(handler.handle(request("foo(x)", 0.0, 1.0, 100, "trapezoidal")));
    EXPECT_FALSE(expression.validation_kind().has_value());
    EXPECT_FALSE(expression.evaluation_kind().has_value());

    const auto validation = errorOf(handler.handle(request("x", 1.0, 0.0, 100, "trapezoidal")));
    EXPECT_FALSE(validation.expression_kind().has_value());
    EXPECT_FALSE(validation.evaluation_kind().has_value());

    const auto evaluation = errorOf(handler.handle(request("log(x)", -1.0, 1.0, 11, "trapezoidal")));
    EXPECT_FALSE(evaluation.validation_kind().has_value());
    EXPECT_FALSE(evaluation.expression_kind().has_value());
}

TEST_F(RequestHandlerTest, DomainFaultIsReportedWithItsX) {
    const auto& error = errorOf(handler.handle(request("log(x)", -1.0, 1.0, 11, "trapezoidal")));

    EXPECT_EQ(error.category, ErrorCategory::Evaluation);
    EXPECT_EQ(error.evaluation_kind(), errors::EvaluationErrorKind::DomainError);
    ASSERT_TRUE(error.at.has_value());
    EXPECT_DOUBLE_EQ(*error.at, -1.0);
    EXPECT_EQ(error.describe(), "Evaluation failed: log of non-positive value at x = -1");
}

TEST_F(RequestHandlerTest, DivisionByZeroIsADomainFault) {
    const auto& error = errorOf(handler.handle(request("1/0 * x", 0.0, 1.0, 10, "midpoint")));
    EXPECT_EQ(error.category, ErrorCategory::Evaluation);
}

TEST_F(RequestHandlerTest, UnexpectedFailuresBecomeEvaluationErrors) {
    RequestHandler failing([](const std::string&) -> expression::CompiledExpression {
        throw std::runtime_error("out of memory");
    });

    const auto& error = errorOf(failing.handle(request("x", 0.0, 1.0, 10, "trapezoidal")));

    EXPECT_EQ(error.category, ErrorCategory::Evaluation);
    EXPECT_EQ(error.message, "unexpected failure: out of memory");
    EXPECT_FALSE(error.at.has_value());
}

TEST_F(RequestHandlerTest, EmptyCompilerIsRejected) {
    EXPECT_THROW(RequestHandler{RequestHandler::Compiler{}}, std::invalid_argument);
}

TEST_F(RequestHandlerTest, SimpsonWithOneThousandPointsReportsEffectiveCount) {
    const auto& result = resultOf(handler.handle(request("x**3", 0.0, 1.0, 1000, "simpson")));

    EXPECT_EQ(result.num_points, 1001);
    EXPECT_EQ(result.x_values.size(), 1001u);
    EXPECT_EQ((result.num_points - 1) % 2, 0);
    EXPECT_NEAR(result.value, 0.25, 1e-12);
}

TEST_F(RequestHandlerTest, SimpsonWithOddCountIsUnchanged) {
    EXPECT_EQ(resultOf(handler.handle(request("x", 0.0, 1.0, 101, "simpson"))).num_points, 101);
}

TEST_F(RequestHandlerTest, DeterministicMethodsAreBitIdenticalAcrossCalls) {
    for (const std::string method : {"trapezoidal", "simpson", "midpoint"}) {
        auto first = handler.handle(request("exp(-x) * cos(3*x)", -0.7, 2.9, 333, method));
        auto second = handler.handle(request("exp(-x) * cos(3*x)", -0.7, 2.9, 333, method));

        EXPECT_EQ(resultOf(first).value, resultOf(second).value) << method;
        EXPECT_EQ(resultOf(first).x_values, resultOf(second).x_values);
        EXPECT_EQ(resultOf(first).y_values, resultOf(second).y_values);
    }
}

TEST_F(RequestHandlerTest, MonteCarloWithoutSeedDiffersBetweenCalls) {
    const auto r = request("x**2", 0.0, 3.0, 1000, "monte_carlo");

    auto first = handler.handle(r);
    auto second = handler.handle(r);

    EXPECT_NE(resultOf(first).x_values, resultOf(second).x_values);
    for (const auto* outcome : {&first, &second}) {
        const auto& result = resultOf(*outcome);
        ASSERT_TRUE(result.error_estimate.has_value());
        EXPECT_NEAR(result.value, 9.0, 5.0 * *result.error_estimate);
    }
}

TEST_F(RequestHandlerTest, MonteCarloWithSeedIsReproducible) {
    auto r = request("sin(x)", 0.0, 3.0, 500, "monte_carlo");
    r.seed = 17u;

    const auto& first = resultOf(handler.handle(r));
    const auto& second = resultOf(handler.handle(r));
    EXPECT_EQ(first.x_values, second.x_values);
    EXPECT_EQ(first.value, second.value);

    r.seed = 18u;
    EXPECT_NE(resultOf(handler.handle(r)).x_values, first.x_values);
}

TEST_F(RequestHandlerTest, ConcurrentRequestsDoNotInterfere) {
    const auto reference = resultOf(handler.handle(request("sqrt(x) + sin(x)", 0.0, 4.0, 999, "simpson")));

    std::vector<std::thread> workers;
    std::atomic<int> mismatches{0};
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto outcome = handler.handle(request("sqrt(x) + sin(x)", 0.0, 4.0, 999, "simpson"));
                const auto* result = std::get_if<IntegrationResult>(&outcome);
                if (result == nullptr || result->value != reference.value) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}

TEST(RequestValidationTest, ValidateReturnsTheRecognisedMethod) {
    IntegrationRequest r;
    r.function = "x";
    r.method = "monte_carlo";

    EXPECT_EQ(RequestHandler::validate(r), traits::IntegrationMethod::MonteCarlo);

    r.num_points = 3;
    EXPECT_THROW(RequestHandler::validate(r), errors::ValidationError);
}

} // namespace numint_test
