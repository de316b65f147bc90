#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../types/Errors.hpp"
#include "../utils/Logger.hpp"
#include "BlackScholes.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace optstrat {

class ImpliedVolatilitySolver {
public:
    struct SolverConfiguration {
        double tolerance = 1e-6;
        std::size_t max_iterations = 100;
        double min_volatility = 1e-4;
        double max_volatility = 5.0;
        double initial_guess = 0.0;          // 0 derives the guess from moneyness
        double min_vega = 1e-8;
    };

    ImpliedVolatilitySolver() : ImpliedVolatilitySolver(SolverConfiguration()) {}

    explicit ImpliedVolatilitySolver(const SolverConfiguration& config)
        : config_(config), logger_("ImpliedVolatility") {}

    const SolverConfiguration& configuration() const noexcept { return config_; }

    // Newton-Raphson kept inside a [min_volatility, max_volatility] bracket,
    // bisecting whenever the Newton step leaves it or stalls.
    PricingResult solve_newton_raphson(
        const OptionSpec& option,
        const MarketData& market,
        double market_price) const {

        if (!std::isfinite(market_price) || market_price < 0.0) {
            throw InvalidInput("mark must be a non-negative finite price");
        }

        double vol_low = config_.min_volatility;
        double vol_high = config_.max_volatility;
        const double f_low = BlackScholesPricer::price(option, market.with_volatility(vol_low)) - market_price;
        const double f_high = BlackScholesPricer::price(option, market.with_volatility(vol_high)) - market_price;

        double vol_guess = get_initial_guess(option, market);

        if (f_high - f_low < config_.tolerance && std::abs(f_low) >= config_.tolerance) {
            fail("vega collapsed", option, market_price, 0, vol_guess);
        }
        if (f_high <= -config_.tolerance) {
            fail("mark above the attainable price range", option, market_price, 0, vol_high);
        }
        if (f_low >= config_.tolerance) {
            fail("mark below the attainable price range", option, market_price, 0, vol_low);
        }

        double step = vol_high - vol_low;
        double previous_step = step;
        std::size_t iter = 0;

        for (; iter < config_.max_iterations; ++iter) {
            PricingResult result = BlackScholesPricer::price_european_option(
                option, market.with_volatility(vol_guess));
            const double price_diff = result.option_price - market_price;
            const double vega = result.greeks.vega;

            if (is_converged(price_diff, vega, vol_high - vol_low)) {
                result.implied_volatility = vol_guess;
                result.iterations_used = iter + 1;
                result.converged = true;
                OPTSTRAT_LOG_DEBUG(logger_, to_string(option.type), " K=", option.strike,
                                   " mark=", market_price, " solved vol=", vol_guess,
                                   " in ", iter + 1, " iterations");
                return result;
            }

            if (price_diff < 0.0) {
                vol_low = vol_guess;
            } else {
                vol_high = vol_guess;
            }

            const bool has_slope = vega >= config_.min_vega;
            const double newton_vol = has_slope ? vol_guess - price_diff / vega : vol_guess;
            const bool inside = has_slope && newton_vol > vol_low && newton_vol < vol_high;
            const bool stalling = std::abs(2.0 * price_diff) > std::abs(previous_step * vega);

            previous_step = step;
            if (!inside || stalling) {
                const double midpoint = 0.5 * (vol_low + vol_high);
                step = std::abs(midpoint - vol_guess);
                vol_guess = midpoint;
            } else {
                step = std::abs(newton_vol - vol_guess);
                vol_guess = newton_vol;
            }
        }

        fail("iteration limit reached", option, market_price, iter, vol_guess);
    }

private:
    // The volatility must be pinned too, unless the price is flat in it.
    bool is_converged(double price_diff, double vega, double bracket_width) const noexcept {
        if (std::abs(price_diff) >= config_.tolerance) {
            return false;
        }
        return vega < config_.min_vega ||
               std::abs(price_diff) < config_.tolerance * vega ||
               bracket_width < config_.tolerance;
    }

    double get_initial_guess(const OptionSpec& option, const MarketData& market) const {
        if (config_.initial_guess > 0.0) {
            return std::clamp(config_.initial_guess, config_.min_volatility, config_.max_volatility);
        }

        const double T = market.years(option.days_to_expiry);
        const double forward_moneyness = market.spot_price * std::exp(market.risk_free_rate * T) / option.strike;

        double base_vol = 0.2;
        if (std::abs(std::log(forward_moneyness)) > 0.1) {
            base_vol += 0.1 * std::abs(std::log(forward_moneyness));
        }
        if (T < 0.1) {
            base_vol *= 1.5;
        }

        return std::clamp(base_vol, config_.min_volatility, config_.max_volatility);
    }

    [[noreturn]] void fail(
        const char* reason,
        const OptionSpec& option,
        double market_price,
        std::size_t iterations,
        double last_volatility) const {

        std::ostringstream message;
        message << "implied volatility did not converge (" << reason << ") for "
                << to_string(option.type) << " K=" << option.strike
                << " dte=" << option.days_to_expiry << " mark=" << market_price
                << " after " << iterations << " iterations, last vol=" << last_volatility;
        OPTSTRAT_LOG_DEBUG(logger_, message.str());
        throw ConvergenceError(message.str(), iterations, last_volatility);
    }

    SolverConfiguration config_;
    utils::Logger logger_;
};

}
