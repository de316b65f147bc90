#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace optstrat {

struct Greeks {
    double delta = 0.0;     // Price sensitivity to underlying
    double gamma = 0.0;     // Delta sensitivity to underlying
    double theta = 0.0;     // Price change per calendar day
    double vega = 0.0;      // Price sensitivity per unit of volatility

    Greeks() = default;
    Greeks(double d, double g, double t, double v)
        : delta(d), gamma(g), theta(t), vega(v) {}

    Greeks scaled(double factor) const {
        return Greeks(delta * factor, gamma * factor, theta * factor, vega * factor);
    }

    Greeks& operator+=(const Greeks& other) {
        delta += other.delta;
        gamma += other.gamma;
        theta += other.theta;
        vega += other.vega;
        return *this;
    }
};

struct PricingResult {
    double option_price = 0.0;
    Greeks greeks;
    double implied_volatility = 0.0;
    std::size_t iterations_used = 0;
    bool converged = false;

    PricingResult() = default;

    PricingResult(double price, const Greeks& g)
        : option_price(price), greeks(g), converged(true) {}
};

// Expected profit and probability of profit at one future point in time.
struct PnLSnapshot {
    double days_to_expiration = 0.0;
    double stddev = 0.0;
    double expected_profit = 0.0;
    double pop = 0.0;
};

// The sampled grid behind a snapshot, for charting collaborators.
struct PnLCurve {
    double days_to_expiration = 0.0;
    double stddev = 0.0;
    std::vector<double> prices;
    std::vector<double> pnl_values;
    std::vector<double> weights;
    std::vector<double> expected_pnl_values;
    double expected_profit = 0.0;
    double pop = 0.0;

    PnLSnapshot snapshot() const {
        return PnLSnapshot{days_to_expiration, stddev, expected_profit, pop};
    }

    // Prices where the P&L crosses zero, linearly interpolated between grid points.
    std::vector<double> breakevens() const {
        std::vector<double> result;
        std::size_t last = prices.size();
        for (std::size_t i = 0; i < pnl_values.size(); ++i) {
            if (pnl_values[i] == 0.0) {
                continue;
            }
            if (last != prices.size() && (pnl_values[last] > 0.0) != (pnl_values[i] > 0.0)) {
                const double x0 = prices[last];
                const double x1 = prices[i];
                const double y0 = pnl_values[last];
                const double y1 = pnl_values[i];
                result.push_back(x0 - y0 * (x1 - x0) / (y1 - y0));
            }
            last = i;
        }
        return result;
    }
};

struct MarginRequirement {
    double cash = 0.0;
    double margin = 0.0;
};

struct LegSummary {
    char option_type = 'C';
    double strike_price = 0.0;
    int quantity = 0;
    double days_to_expiration = 0.0;
    double volatility = 0.0;
    double mark = 0.0;
    double delta = 0.0;
    double theta = 0.0;
    double vega = 0.0;
    double gamma = 0.0;
};

struct StrategySummary {
    double underlying_price = 0.0;
    std::string underlying_symbol;
    double days_to_expiration = 0.0;
    double volatility = 0.0;
    double expected_move = 0.0;
    double pop = 0.0;
    double expected_profit = 0.0;
    double cost = 0.0;
    double theta = 0.0;
    double delta = 0.0;
    double vega = 0.0;
    double gamma = 0.0;
    std::string title;
    double stddev_range = 0.0;
    std::size_t num_simulations = 0;
    bool monte_carlo = false;
    double risk_free_rate = 0.0;
    double year_days = 0.0;
};

}
