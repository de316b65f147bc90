#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "optstrat/options/BlackScholes.hpp"
#include "optstrat/options/Greeks.hpp"
#include "optstrat/options/ImpliedVolatility.hpp"
#include "optstrat/math/NormalDistribution.hpp"
#include "optstrat/math/Statistics.hpp"
#include "optstrat/utils/Logger.hpp"
#include <cmath>
#include <sstream>
#include <vector>

using namespace optstrat;
using namespace optstrat::math;
using ::testing::DoubleNear;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class BlackScholesTest : public ::testing::Test {
protected:
    void SetUp() override {
        option_call_ = OptionSpec(LegKind::CALL, 100.0, 91.25);
        option_put_ = OptionSpec(LegKind::PUT, 100.0, 91.25);
        market_ = MarketData(100.0, 0.20, 0.05);
        tolerance_ = 1e-6;
    }

    OptionSpec option_call_;
    OptionSpec option_put_;
    MarketData market_;
    double tolerance_;
};

TEST_F(BlackScholesTest, CallPutParity) {
    for (double strike : {80.0, 95.0, 100.0, 105.0, 120.0}) {
        for (double days : {7.0, 30.0, 91.25, 365.0}) {
            const OptionSpec call(LegKind::CALL, strike, days);
            const OptionSpec put(LegKind::PUT, strike, days);

            const double call_price = BlackScholesPricer::price(call, market_);
            const double put_price = BlackScholesPricer::price(put, market_);

            const double T = market_.years(days);
            const double present_value_strike = strike * std::exp(-market_.risk_free_rate * T);
            const double parity_diff = call_price - put_price - (market_.spot_price - present_value_strike);

            EXPECT_NEAR(parity_diff, 0.0, tolerance_) << "K=" << strike << " days=" << days;
        }
    }
}

TEST_F(BlackScholesTest, ATMCallPrice) {
    auto result = BlackScholesPricer::price_european_option(option_call_, market_);

    const double expected_price = 4.6150;
    EXPECT_NEAR(result.option_price, expected_price, 0.01);
    EXPECT_TRUE(result.converged);
}

TEST_F(BlackScholesTest, DeltaRange) {
    auto call_result = BlackScholesPricer::price_european_option(option_call_, market_);
    auto put_result = BlackScholesPricer::price_european_option(option_put_, market_);

    EXPECT_GE(call_result.greeks.delta, 0.0);
    EXPECT_LE(call_result.greeks.delta, 1.0);
    EXPECT_GE(put_result.greeks.delta, -1.0);
    EXPECT_LE(put_result.greeks.delta, 0.0);
    EXPECT_NEAR(call_result.greeks.delta - put_result.greeks.delta, 1.0, tolerance_);
}

TEST_F(BlackScholesTest, GammaAndVegaMatchAcrossTypes) {
    auto call_result = BlackScholesPricer::price_european_option(option_call_, market_);
    auto put_result = BlackScholesPricer::price_european_option(option_put_, market_);

    EXPECT_GT(call_result.greeks.gamma, 0.0);
    EXPECT_NEAR(call_result.greeks.gamma, put_result.greeks.gamma, tolerance_);
    EXPECT_GT(call_result.greeks.vega, 0.0);
    EXPECT_NEAR(call_result.greeks.vega, put_result.greeks.vega, tolerance_);
}

TEST_F(BlackScholesTest, ThetaIsPerDay) {
    auto per_day = BlackScholesPricer::price_european_option(option_call_, market_);

    MarketData trading_year = market_;
    trading_year.year_days = 252.0;
    const OptionSpec same_years(LegKind::CALL, 100.0, 91.25 * 252.0 / 365.0);
    auto per_trading_day = BlackScholesPricer::price_european_option(same_years, trading_year);

    EXPECT_LT(per_day.greeks.theta, 0.0);
    EXPECT_NEAR(per_day.option_price, per_trading_day.option_price, tolerance_);
    EXPECT_NEAR(per_day.greeks.theta * 365.0, per_trading_day.greeks.theta * 252.0, tolerance_);
}

TEST_F(BlackScholesTest, ExpiredOptionPricesAtIntrinsic) {
    const OptionSpec itm_call(LegKind::CALL, 95.0, 0.0);
    const OptionSpec atm_call(LegKind::CALL, 100.0, 0.0);
    const OptionSpec itm_put(LegKind::PUT, 105.0, 0.0);
    const OptionSpec otm_put(LegKind::PUT, 90.0, 0.0);

    auto itm_call_result = BlackScholesPricer::price_european_option(itm_call, market_);
    EXPECT_EQ(itm_call_result.option_price, 5.0);
    EXPECT_EQ(itm_call_result.greeks.delta, 1.0);
    EXPECT_EQ(itm_call_result.greeks.gamma, 0.0);
    EXPECT_EQ(itm_call_result.greeks.theta, 0.0);
    EXPECT_EQ(itm_call_result.greeks.vega, 0.0);

    auto atm_call_result = BlackScholesPricer::price_european_option(atm_call, market_);
    EXPECT_EQ(atm_call_result.option_price, 0.0);
    EXPECT_EQ(atm_call_result.greeks.delta, 0.0);

    auto itm_put_result = BlackScholesPricer::price_european_option(itm_put, market_);
    EXPECT_EQ(itm_put_result.option_price, 5.0);
    EXPECT_EQ(itm_put_result.greeks.delta, -1.0);

    auto otm_put_result = BlackScholesPricer::price_european_option(otm_put, market_);
    EXPECT_EQ(otm_put_result.option_price, 0.0);
    EXPECT_EQ(otm_put_result.greeks.delta, 0.0);
}

TEST_F(BlackScholesTest, ZeroVolatilityPricesAtIntrinsic) {
    const OptionSpec itm_call(LegKind::CALL, 90.0, 30.0);
    auto result = BlackScholesPricer::price_european_option(itm_call, market_.with_volatility(0.0));

    EXPECT_EQ(result.option_price, 10.0);
    EXPECT_EQ(result.greeks.delta, 1.0);
    EXPECT_EQ(result.greeks.vega, 0.0);
}

TEST_F(BlackScholesTest, RejectsInvalidInputs) {
    EXPECT_THROW(BlackScholesPricer::price(OptionSpec(LegKind::CALL, 0.0, 30.0), market_), InvalidInput);
    EXPECT_THROW(BlackScholesPricer::price(OptionSpec(LegKind::CALL, 100.0, -1.0), market_), InvalidInput);
    EXPECT_THROW(BlackScholesPricer::price(OptionSpec(LegKind::STOCK, 100.0, 30.0), market_), InvalidInput);
    EXPECT_THROW(BlackScholesPricer::price(option_call_, market_.with_spot(-5.0)), InvalidInput);
    EXPECT_THROW(BlackScholesPricer::price(option_call_, market_.with_volatility(std::nan(""))), InvalidInput);
}

class NormalDistributionTest : public ::testing::Test {
protected:
    void SetUp() override {
        tolerance_ = 1e-10;
    }

    double tolerance_;
};

TEST_F(NormalDistributionTest, StandardNormalCDF) {
    EXPECT_NEAR(NormalDistribution::cdf(0.0), 0.5, tolerance_);
    EXPECT_NEAR(NormalDistribution::cdf(1.96), 0.9750021048517795, 1e-9);
    EXPECT_NEAR(NormalDistribution::cdf(-1.0), 0.15865525393145707, 1e-9);
    EXPECT_NEAR(NormalDistribution::cdf(3.0), 0.9986501019683699, 1e-9);
}

TEST_F(NormalDistributionTest, CDFSymmetry) {
    for (double x : {0.1, 0.5, 1.0, 2.5, 4.0, 6.0}) {
        EXPECT_NEAR(NormalDistribution::cdf(x) + NormalDistribution::cdf(-x), 1.0, tolerance_);
    }
    EXPECT_GT(NormalDistribution::cdf(-8.0), 0.0);
}

TEST_F(NormalDistributionTest, StandardNormalPDF) {
    EXPECT_NEAR(NormalDistribution::pdf(0.0), NormalDistribution::INV_SQRT_2_PI, tolerance_);
    EXPECT_GT(NormalDistribution::pdf(0.0), NormalDistribution::pdf(1.0));
    EXPECT_NEAR(NormalDistribution::pdf(1.0), NormalDistribution::pdf(-1.0), tolerance_);
}

TEST_F(NormalDistributionTest, D1D2Calculation) {
    const double S = 100.0, K = 105.0, T = 0.25, r = 0.05, vol = 0.20;

    const double d1 = NormalDistribution::d1(S, K, T, r, vol);
    const double d2 = NormalDistribution::d2(S, K, T, r, vol);

    EXPECT_NEAR(d2, d1 - vol * std::sqrt(T), tolerance_);
}

TEST_F(NormalDistributionTest, LognormalDensity) {
    EXPECT_EQ(NormalDistribution::lognormal_pdf(0.0, 0.0, 1.0), 0.0);
    EXPECT_EQ(NormalDistribution::lognormal_pdf(-1.0, 0.0, 1.0), 0.0);
    EXPECT_NEAR(NormalDistribution::lognormal_pdf(1.0, 0.0, 1.0), NormalDistribution::INV_SQRT_2_PI, tolerance_);
}

class GreeksTest : public ::testing::Test {
protected:
    void SetUp() override {
        market_ = MarketData(100.0, 0.25, 0.05);
        pricing_func_ = [](const OptionSpec& opt, const MarketData& mkt) -> double {
            return BlackScholesPricer::price_european_option(opt, mkt).option_price;
        };
    }

    MarketData market_;
    GreeksCalculator::PricingFunction pricing_func_;
};

TEST_F(GreeksTest, AnalyticalVsNumericalAcrossMoneyness) {
    for (LegKind type : {LegKind::CALL, LegKind::PUT}) {
        for (double strike : {70.0, 85.0, 100.0, 115.0, 130.0}) {
            const OptionSpec option(type, strike, 60.0);

            auto analytical = GreeksCalculator::calculate_analytical_greeks(option, market_);
            auto numerical = GreeksCalculator::calculate_numerical_greeks(option, market_, pricing_func_);

            EXPECT_NEAR(analytical.delta, numerical.delta, 1e-3) << to_string(type) << " K=" << strike;
            EXPECT_NEAR(analytical.gamma, numerical.gamma, 1e-3) << to_string(type) << " K=" << strike;
            EXPECT_NEAR(analytical.vega, numerical.vega, 1e-3) << to_string(type) << " K=" << strike;
            EXPECT_NEAR(analytical.theta, numerical.theta, 5e-3) << to_string(type) << " K=" << strike;
        }
    }
}

TEST_F(GreeksTest, NoThetaInsideFinalDay) {
    const OptionSpec option(LegKind::CALL, 100.0, 0.5);
    auto numerical = GreeksCalculator::calculate_numerical_greeks(option, market_, pricing_func_);

    EXPECT_EQ(numerical.theta, 0.0);
}

class ImpliedVolatilityTest : public ::testing::Test {
protected:
    void SetUp() override {
        market_ = MarketData(100.0, 0.20, 0.05);
    }

    MarketData market_;
    ImpliedVolatilitySolver solver_;
};

TEST_F(ImpliedVolatilityTest, DefaultConfiguration) {
    const auto& config = solver_.configuration();

    EXPECT_DOUBLE_EQ(config.tolerance, 1e-6);
    EXPECT_EQ(config.max_iterations, 100u);
    EXPECT_DOUBLE_EQ(config.min_volatility, 1e-4);
    EXPECT_DOUBLE_EQ(config.max_volatility, 5.0);
    EXPECT_DOUBLE_EQ(config.initial_guess, 0.0);
}

TEST_F(ImpliedVolatilityTest, RoundTrip) {
    for (LegKind type : {LegKind::CALL, LegKind::PUT}) {
        for (double strike : {85.0, 90.0, 95.0, 100.0, 105.0, 110.0, 115.0}) {
            for (double days : {7.0, 30.0, 90.0, 365.0}) {
                for (double vol : {0.05, 0.1, 0.2, 0.5, 1.0, 1.5, 2.0}) {
                    const OptionSpec option(type, strike, days);
                    const auto model = BlackScholesPricer::price_european_option(option, market_.with_volatility(vol));
                    if (model.greeks.vega < 1e-3) {
                        continue;
                    }

                    auto result = solver_.solve_newton_raphson(option, market_, model.option_price);

                    EXPECT_TRUE(result.converged);
                    EXPECT_NEAR(result.implied_volatility, vol, 1e-4)
                        << to_string(type) << " K=" << strike << " days=" << days << " vol=" << vol;
                    EXPECT_NEAR(result.option_price, model.option_price, 1e-6);
                    EXPECT_LE(result.iterations_used, solver_.configuration().max_iterations);
                }
            }
        }
    }
}

TEST_F(ImpliedVolatilityTest, DeepInTheMoneyStaysInsideBracket) {
    for (LegKind type : {LegKind::CALL, LegKind::PUT}) {
        const double strike = type == LegKind::CALL ? 85.0 : 115.0;
        const OptionSpec option(type, strike, 30.0);
        const double mark = BlackScholesPricer::price(option, market_.with_volatility(0.5));

        SCOPED_TRACE(to_string(type));
        ImpliedVolatilitySolver::SolverConfiguration far_guess;
        far_guess.initial_guess = 0.2;
        ImpliedVolatilitySolver solver(far_guess);

        EXPECT_NEAR(solver.solve_newton_raphson(option, market_, mark).implied_volatility, 0.5, 1e-4);
        EXPECT_NEAR(solver_.solve_newton_raphson(option, market_, mark).implied_volatility, 0.5, 1e-4);
    }
}

TEST_F(ImpliedVolatilityTest, ReturnsGreeksAtSolvedVolatility) {
    const OptionSpec option(LegKind::PUT, 95.0, 45.0);
    const double mark = BlackScholesPricer::price(option, market_.with_volatility(0.35));

    auto solved = solver_.solve_newton_raphson(option, market_, mark);
    auto expected = BlackScholesPricer::price_european_option(option, market_.with_volatility(0.35));

    EXPECT_NEAR(solved.greeks.delta, expected.greeks.delta, 1e-4);
    EXPECT_NEAR(solved.greeks.vega, expected.greeks.vega, 1e-3);
}

TEST_F(ImpliedVolatilityTest, UnreachableMarkFailsAtVolatilityCeiling) {
    const OptionSpec option(LegKind::CALL, 100.0, 30.0);

    try {
        solver_.solve_newton_raphson(option, market_, 150.0);
        FAIL() << "expected ConvergenceError";
    } catch (const ConvergenceError& e) {
        EXPECT_EQ(e.iterations(), 0u);
        EXPECT_NEAR(e.last_volatility(), solver_.configuration().max_volatility, 1e-12);
        EXPECT_THAT(e.what(), HasSubstr("attainable price range"));
    }
}

TEST_F(ImpliedVolatilityTest, StopsAtIterationLimit) {
    ImpliedVolatilitySolver::SolverConfiguration config;
    config.max_iterations = 1;
    ImpliedVolatilitySolver solver(config);
    const OptionSpec option(LegKind::CALL, 100.0, 30.0);
    const double mark = BlackScholesPricer::price(option, market_.with_volatility(1.5));

    try {
        solver.solve_newton_raphson(option, market_, mark);
        FAIL() << "expected ConvergenceError";
    } catch (const ConvergenceError& e) {
        EXPECT_EQ(e.iterations(), 1u);
        EXPECT_THAT(e.what(), HasSubstr("iteration limit"));
    }
}

TEST_F(ImpliedVolatilityTest, ZeroTimeCollapsesVega) {
    const OptionSpec expired(LegKind::CALL, 100.0, 0.0);

    try {
        solver_.solve_newton_raphson(expired, market_, 3.0);
        FAIL() << "expected ConvergenceError";
    } catch (const ConvergenceError& e) {
        EXPECT_THAT(e.what(), HasSubstr("vega collapsed"));
    }
}

TEST_F(ImpliedVolatilityTest, RejectsNegativeMark) {
    const OptionSpec option(LegKind::CALL, 100.0, 30.0);

    EXPECT_THROW(solver_.solve_newton_raphson(option, market_, -1.0), InvalidInput);
}

TEST(GridStatisticsTest, LinspaceIncludesBothEnds) {
    auto points = GridStatistics<double>::linspace(90.0, 110.0, 5);

    EXPECT_THAT(points, ElementsAre(DoubleNear(90.0, 1e-12), DoubleNear(95.0, 1e-12),
                                    DoubleNear(100.0, 1e-12), DoubleNear(105.0, 1e-12),
                                    DoubleNear(110.0, 1e-12)));
    EXPECT_THROW(GridStatistics<double>::linspace(0.0, 1.0, 1), std::logic_error);
}

TEST(GridStatisticsTest, NormalizeAndWeight) {
    std::vector<double> weights{1.0, 3.0, 0.0, 4.0};
    GridStatistics<double>::normalize(weights);

    EXPECT_NEAR(GridStatistics<double>::sum(weights), 1.0, 1e-12);
    EXPECT_NEAR(weights[1], 0.375, 1e-12);

    const std::vector<double> values{-2.0, 1.0, 5.0, 2.0};
    EXPECT_NEAR(GridStatistics<double>::weighted_sum(values, weights), (-2.0 + 3.0 + 8.0) / 8.0, 1e-12);
    EXPECT_NEAR(GridStatistics<double>::positive_mass(values, weights), 7.0 / 8.0, 1e-12);

    std::vector<double> degenerate{0.0, 0.0};
    EXPECT_THROW(GridStatistics<double>::normalize(degenerate), std::logic_error);
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::configure(utils::LogLevel::INFO, sink_);
    }

    void TearDown() override {
        utils::Logger::configure(utils::LogLevel::WARNING);
    }

    std::ostringstream sink_;
};

TEST_F(LoggerTest, WritesEnabledLevels) {
    utils::Logger logger("Pricing");
    OPTSTRAT_LOG_INFO(logger, "priced ", 3, " legs");
    OPTSTRAT_LOG_DEBUG(logger, "hidden");

    EXPECT_THAT(sink_.str(), HasSubstr("[INFO] [Pricing] priced 3 legs"));
    EXPECT_THAT(sink_.str(), ::testing::Not(HasSubstr("hidden")));
}

TEST_F(LoggerTest, OffSilencesEverything) {
    utils::Logger::configure(utils::LogLevel::OFF, sink_);
    utils::Logger logger("Pricing");
    OPTSTRAT_LOG_ERROR(logger, "dropped");

    EXPECT_TRUE(sink_.str().empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
