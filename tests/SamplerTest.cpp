#include <sampling/Sampler.hpp>
#include <utils/Utils.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <stdexcept>

namespace numint_test {

using sampling::effective_point_count;
using sampling::sample_grid;
using traits::IntegrationMethod;

class SamplerTest : public ::testing::Test {
protected:
    static constexpr double kTolerance = 1e-12;
    std::mt19937 generator{12345u};
};

TEST_F(SamplerTest, EffectivePointCountOnlyAdjustsSimpsonWithEvenCount) {
    EXPECT_EQ(effective_point_count(100, IntegrationMethod::Simpson), 101);
    EXPECT_EQ(effective_point_count(1000, IntegrationMethod::Simpson), 1001);
    EXPECT_EQ(effective_point_count(11, IntegrationMethod::Simpson), 11);
    EXPECT_EQ(effective_point_count(100, IntegrationMethod::Trapezoidal), 100);
    EXPECT_EQ(effective_point_count(100, IntegrationMethod::Midpoint), 100);
    EXPECT_EQ(effective_point_count(100, IntegrationMethod::MonteCarlo), 100);
}

TEST_F(SamplerTest, TrapezoidalGridIncludesBothEnds) {
    auto grid = sample_grid<double>(0.0, 1.0, 11, IntegrationMethod::Trapezoidal, generator);

    ASSERT_EQ(grid.size(), 11);
    EXPECT_EQ(grid(0), 0.0);
    EXPECT_EQ(grid(10), 1.0);
    for (Eigen::Index i = 0; i < grid.size(); ++i) {
        EXPECT_NEAR(grid(i), 0.1 * static_cast<double>(i), kTolerance);
    }
}

// The last node is pinned so rounding in a + i*h never misses b.
TEST_F(SamplerTest, LastNodeIsExactlyUpperBound) {
    const double a = -0.3;
    const double b = 2.7182818;
    auto grid = sample_grid<double>(a, b, 97, IntegrationMethod::Trapezoidal, generator);

    EXPECT_EQ(grid(0), a);
    EXPECT_EQ(grid(grid.size() - 1), b);
}

TEST_F(SamplerTest, SimpsonGridHasOddPointCount) {
    auto grid = sample_grid<double>(0.0, 2.0, 10, IntegrationMethod::Simpson, generator);

    ASSERT_EQ(grid.size(), 11);
    EXPECT_NEAR(grid(1), 0.2, kTolerance);
    EXPECT_EQ(grid(10), 2.0);
}

TEST_F(SamplerTest, MidpointGridSitsAtSubintervalCentres) {
    auto grid = sample_grid<double>(0.0, 1.0, 10, IntegrationMethod::Midpoint, generator);

    ASSERT_EQ(grid.size(), 10);
    for (Eigen::Index i = 0; i < grid.size(); ++i) {
        EXPECT_NEAR(grid(i), 0.05 + 0.1 * static_cast<double>(i), kTolerance);
    }
}

TEST_F(SamplerTest, DeterministicGridsIgnoreTheGenerator) {
    std::mt19937 other{999u};
    for (auto method : {IntegrationMethod::Trapezoidal, IntegrationMethod::Simpson, IntegrationMethod::Midpoint}) {
        auto first = sample_grid<double>(1.0, 4.0, 37, method, generator);
        auto second = sample_grid<double>(1.0, 4.0, 37, method, other);
        EXPECT_EQ(first, second);
    }
}

TEST_F(SamplerTest, MonteCarloDrawsStayInsideTheInterval) {
    auto grid = sample_grid<double>(-2.0, 3.0, 1000, IntegrationMethod::MonteCarlo, generator);

    ASSERT_EQ(grid.size(), 1000);
    EXPECT_GE(grid.minCoeff(), -2.0);
    EXPECT_LE(grid.maxCoeff(), 3.0);
}

TEST_F(SamplerTest, MonteCarloFollowsTheGeneratorState) {
    std::mt19937 first{42u};
    std::mt19937 second{42u};

    auto a = sample_grid<double>(0.0, 1.0, 50, IntegrationMethod::MonteCarlo, first);
    auto b = sample_grid<double>(0.0, 1.0, 50, IntegrationMethod::MonteCarlo, second);
    auto c = sample_grid<double>(0.0, 1.0, 50, IntegrationMethod::MonteCarlo, first);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST_F(SamplerTest, RejectsEmptyIntervalAndTooFewPoints) {
    EXPECT_THROW(sample_grid<double>(1.0, 1.0, 10, IntegrationMethod::Trapezoidal, generator),
                 std::invalid_argument);
    EXPECT_THROW(sample_grid<double>(2.0, 1.0, 10, IntegrationMethod::Midpoint, generator),
                 std::invalid_argument);
    EXPECT_THROW(sample_grid<double>(0.0, 1.0, 1, IntegrationMethod::Trapezoidal, generator),
                 std::invalid_argument);
}

TEST(UtilsTest, MeanAndPopulationStddev) {
    traits::DataType::StoringVector samples(4);
    samples << 2.0, 4.0, 4.0, 6.0;

    EXPECT_DOUBLE_EQ(Utils::mean<double>(samples), 4.0);
    EXPECT_DOUBLE_EQ(Utils::population_stddev<double>(samples), std::sqrt(2.0));
}

TEST(UtilsTest, StatisticsOfEmptySampleThrow) {
    traits::DataType::StoringVector empty(0);

    EXPECT_THROW(Utils::mean<double>(empty), std::invalid_argument);
    EXPECT_THROW(Utils::population_stddev<double>(empty), std::invalid_argument);
}

} // namespace numint_test
