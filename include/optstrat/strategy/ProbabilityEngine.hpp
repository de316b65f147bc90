#pragma once

#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../types/Errors.hpp"
#include "../math/NormalDistribution.hpp"
#include "../math/Statistics.hpp"
#include "Leg.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace optstrat {

class ProbabilityEngine {
public:
    struct Configuration {
        double stddev_range = 3.0;          // Grid half-width in expected moves
        std::size_t num_simulations = 1000; // Grid points, at least two
        bool monte_carlo = false;
        std::uint64_t random_seed = 0;      // Reserved for the sampled path
        double min_horizon_days = 0.5;

        void validate() const {
            if (!std::isfinite(stddev_range) || stddev_range <= 0.0) {
                throw InvalidInput("stddev range must be positive");
            }
            if (num_simulations < 2) {
                throw InvalidInput("number of simulations must be at least 2");
            }
            if (!std::isfinite(min_horizon_days) || min_horizon_days <= 0.0) {
                throw InvalidInput("minimum horizon must be positive");
            }
        }
    };

    explicit ProbabilityEngine(const MarketData& market) : ProbabilityEngine(market, Configuration()) {}

    ProbabilityEngine(const MarketData& market, const Configuration& config)
        : market_(market), config_(config) {
        config_.validate();
        if (!market_.is_valid()) {
            throw InvalidInput("underlying price must be positive");
        }
    }

    const Configuration& configuration() const noexcept { return config_; }
    const MarketData& market() const noexcept { return market_; }

    // One standard deviation of the underlying over the given number of days.
    static double expected_move(double S, double vol, double days,
                                double year_days = DEFAULT_YEAR_DAYS) noexcept {
        if (days <= 0.0 || vol <= 0.0) {
            return 0.0;
        }
        return S * vol * std::sqrt(days / year_days);
    }

    // Risk-neutral probability of finishing above the strike for a call, below it for a put.
    static double breach_probability(LegKind kind, double S, double K, double days, double vol,
                                     double r = DEFAULT_RISK_FREE_RATE,
                                     double year_days = DEFAULT_YEAR_DAYS) {
        if (!is_option(kind)) {
            throw InvalidInput("breach probability requires a CALL or PUT");
        }
        if (!(S > 0.0) || !(K > 0.0)) {
            throw InvalidInput("underlying and strike prices must be positive");
        }
        const double T = days / year_days;
        if (T <= 0.0 || vol <= 0.0) {
            if (kind == LegKind::CALL) {
                return S > K ? 1.0 : 0.0;
            }
            return S < K ? 1.0 : 0.0;
        }
        const double d2 = math::NormalDistribution::d2(S, K, T, r, vol);
        return kind == LegKind::CALL ? math::NormalDistribution::cdf(d2)
                                     : math::NormalDistribution::cdf(-d2);
    }

    std::vector<double> price_grid(double stddev) const {
        const double S = market_.spot_price;
        const double lower = std::max(S - config_.stddev_range * stddev, S * MIN_GRID_FRACTION);
        const double upper = S + config_.stddev_range * stddev;
        return math::GridStatistics<double>::linspace(lower, upper, config_.num_simulations);
    }

    // Dispatches to the configured evaluation path.
    PnLCurve project(const std::vector<std::unique_ptr<Leg>>& legs,
                     double strategy_dte, double snapshot_dte, double volatility) const {
        if (config_.monte_carlo) {
            return evaluate_monte_carlo(legs, strategy_dte, snapshot_dte, volatility);
        }
        return evaluate(legs, strategy_dte, snapshot_dte, volatility);
    }

    // Legs repriced on a spot grid, weighted by the lognormal density at the horizon.
    PnLCurve evaluate(const std::vector<std::unique_ptr<Leg>>& legs,
                      double strategy_dte, double snapshot_dte, double volatility) const {
        if (!std::isfinite(volatility) || volatility <= 0.0) {
            throw InvalidInput("volatility must be positive");
        }
        if (!std::isfinite(snapshot_dte) || snapshot_dte < 0.0) {
            throw InvalidInput("snapshot days to expiration must be non-negative");
        }

        const double S = market_.spot_price;
        const double horizon = std::max(strategy_dte - snapshot_dte, config_.min_horizon_days);

        PnLCurve curve;
        curve.days_to_expiration = snapshot_dte;
        curve.stddev = expected_move(S, volatility, horizon, market_.year_days);
        curve.prices = price_grid(curve.stddev);

        double entry_cost = 0.0;
        for (const auto& leg : legs) {
            entry_cost += leg->position_cost();
        }

        curve.pnl_values.reserve(curve.prices.size());
        for (double price : curve.prices) {
            double value = 0.0;
            for (const auto& leg : legs) {
                const double remaining = std::max(0.0, leg->days_to_expiration() - horizon);
                value += leg->value_at(price, remaining, market_) * leg->quantity() * leg->multiplier();
            }
            curve.pnl_values.push_back(value - entry_cost);
        }

        const double t = market_.years(horizon);
        const double log_sd = volatility * std::sqrt(t);
        const double log_mean = std::log(S) +
            (market_.risk_free_rate - 0.5 * volatility * volatility) * t;

        curve.weights.reserve(curve.prices.size());
        for (double price : curve.prices) {
            curve.weights.push_back(math::NormalDistribution::lognormal_pdf(price, log_mean, log_sd));
        }
        math::GridStatistics<double>::normalize(curve.weights);

        curve.expected_pnl_values.resize(curve.prices.size());
        for (std::size_t i = 0; i < curve.prices.size(); ++i) {
            curve.expected_pnl_values[i] = curve.pnl_values[i] * curve.weights[i];
        }
        curve.expected_profit = math::GridStatistics<double>::weighted_sum(curve.pnl_values, curve.weights);
        curve.pop = std::clamp(
            math::GridStatistics<double>::positive_mass(curve.pnl_values, curve.weights), 0.0, 1.0);

        return curve;
    }

    PnLCurve evaluate_monte_carlo(const std::vector<std::unique_ptr<Leg>>&,
                                  double, double, double) const {
        throw NotImplemented("Monte Carlo evaluation is not implemented");
    }

private:
    static constexpr double MIN_GRID_FRACTION = 1e-4;

    MarketData market_;
    Configuration config_;
};

}
