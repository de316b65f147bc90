#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "BlackScholes.hpp"
#include <algorithm>
#include <functional>

namespace optstrat {

class GreeksCalculator {
public:
    using PricingFunction = std::function<double(const OptionSpec&, const MarketData&)>;

    static Greeks calculate_analytical_greeks(
        const OptionSpec& option,
        const MarketData& market) {
        return BlackScholesPricer::price_european_option(option, market).greeks;
    }

    static Greeks calculate_numerical_greeks(
        const OptionSpec& option,
        const MarketData& market,
        const PricingFunction& pricing_function,
        double bump_size = 1e-4) {

        const double S = market.spot_price;
        const double h = S * bump_size;

        const double base = pricing_function(option, market);
        const double up = pricing_function(option, market.with_spot(S + h));
        const double down = pricing_function(option, market.with_spot(S - h));

        Greeks greeks;
        greeks.delta = (up - down) / (2.0 * h);
        greeks.gamma = (up - 2.0 * base + down) / (h * h);

        const double vol_h = std::max(market.volatility * bump_size, 1e-6);
        const double vol_up = pricing_function(option, market.with_volatility(market.volatility + vol_h));
        const double vol_down = pricing_function(option, market.with_volatility(market.volatility - vol_h));
        greeks.vega = (vol_up - vol_down) / (2.0 * vol_h);

        if (option.days_to_expiry >= 1.0) {
            OptionSpec next_day = option;
            next_day.days_to_expiry -= 1.0;
            greeks.theta = pricing_function(next_day, market) - base;
        }

        return greeks;
    }
};

}
