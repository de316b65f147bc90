#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../types/Errors.hpp"
#include "../math/NormalDistribution.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace optstrat {

class BlackScholesPricer {
public:
    static double intrinsic_value(LegKind type, double S, double K) noexcept {
        if (type == LegKind::CALL) {
            return std::max(S - K, 0.0);
        }
        if (type == LegKind::PUT) {
            return std::max(K - S, 0.0);
        }
        return S;
    }

    // Expired or zero-vol options price at intrinsic value.
    static PricingResult price_european_option(
        const OptionSpec& option,
        const MarketData& market) {

        validate(option, market);

        const double S = market.spot_price;
        const double K = option.strike;
        const double T = market.years(option.days_to_expiry);
        const double r = market.risk_free_rate;
        const double vol = market.volatility;

        if (T <= 0.0 || vol <= 0.0) {
            return price_at_intrinsic(option.type, S, K);
        }

        const double d1 = math::NormalDistribution::d1(S, K, T, r, vol);
        const double d2 = d1 - vol * std::sqrt(T);

        const double Nd1 = math::NormalDistribution::cdf(d1);
        const double Nd2 = math::NormalDistribution::cdf(d2);
        const double N_minus_d1 = math::NormalDistribution::cdf(-d1);
        const double N_minus_d2 = math::NormalDistribution::cdf(-d2);

        const double discount_factor = std::exp(-r * T);
        const double sqrt_T = std::sqrt(T);
        const double pdf_d1 = math::NormalDistribution::pdf(d1);

        double option_price;
        Greeks greeks;

        if (option.type == LegKind::CALL) {
            option_price = S * Nd1 - K * discount_factor * Nd2;
            greeks.delta = Nd1;
        } else {
            option_price = K * discount_factor * N_minus_d2 - S * N_minus_d1;
            greeks.delta = -N_minus_d1;
        }

        greeks.gamma = pdf_d1 / (S * vol * sqrt_T);
        greeks.vega = S * pdf_d1 * sqrt_T;
        greeks.theta = calculate_theta(S, K, T, r, vol, option.type, pdf_d1, Nd2, N_minus_d2) / market.year_days;

        return PricingResult(option_price, greeks);
    }

    static double price(const OptionSpec& option, const MarketData& market) {
        return price_european_option(option, market).option_price;
    }

private:
    static void validate(const OptionSpec& option, const MarketData& market) {
        if (!is_option(option.type)) {
            throw InvalidInput("option pricing requires a CALL or PUT, got " + to_string(option.type));
        }
        if (!std::isfinite(option.strike) || option.strike <= 0.0) {
            throw InvalidInput("strike price must be positive");
        }
        if (!std::isfinite(market.spot_price) || market.spot_price <= 0.0) {
            throw InvalidInput("underlying price must be positive");
        }
        if (!std::isfinite(option.days_to_expiry) || option.days_to_expiry < 0.0) {
            throw InvalidInput("days to expiration must be non-negative");
        }
        if (!std::isfinite(market.volatility)) {
            throw InvalidInput("volatility must be finite");
        }
        if (!(market.year_days > 0.0)) {
            throw InvalidInput("year length must be positive");
        }
    }

    static PricingResult price_at_intrinsic(LegKind type, double S, double K) noexcept {
        Greeks greeks;
        if (type == LegKind::CALL && S > K) {
            greeks.delta = 1.0;
        } else if (type == LegKind::PUT && S < K) {
            greeks.delta = -1.0;
        }
        return PricingResult(intrinsic_value(type, S, K), greeks);
    }

    // Annualized theta; the caller scales to days.
    static double calculate_theta(
        double S, double K, double T, double r, double vol,
        LegKind type, double pdf_d1, double Nd2, double N_minus_d2) noexcept {

        const double discount_factor = std::exp(-r * T);
        const double theta_common = -S * pdf_d1 * vol / (2.0 * std::sqrt(T));

        if (type == LegKind::CALL) {
            return theta_common - r * K * discount_factor * Nd2;
        }
        return theta_common + r * K * discount_factor * N_minus_d2;
    }
};

}
