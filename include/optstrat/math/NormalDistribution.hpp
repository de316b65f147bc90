#pragma once

#include <cmath>

namespace optstrat::math {

class NormalDistribution {
public:
    static constexpr double INV_SQRT_2_PI = 0.3989422804014326779;
    static constexpr double INV_SQRT_2 = 0.7071067811865475244;

    static double pdf(double x) noexcept {
        return INV_SQRT_2_PI * std::exp(-0.5 * x * x);
    }

    // erfc keeps full relative precision in both tails.
    static double cdf(double x) noexcept {
        return 0.5 * std::erfc(-x * INV_SQRT_2);
    }

    static double d1(double S, double K, double T, double r, double vol) noexcept {
        const double vol_sqrt_T = vol * std::sqrt(T);
        return (std::log(S / K) + (r + 0.5 * vol * vol) * T) / vol_sqrt_T;
    }

    static double d2(double S, double K, double T, double r, double vol) noexcept {
        return d1(S, K, T, r, vol) - vol * std::sqrt(T);
    }

    // Density of X with ln(X) ~ N(log_mean, log_sd^2); zero for x <= 0.
    static double lognormal_pdf(double x, double log_mean, double log_sd) noexcept {
        if (x <= 0.0 || log_sd <= 0.0) {
            return 0.0;
        }
        const double z = (std::log(x) - log_mean) / log_sd;
        return pdf(z) / (x * log_sd);
    }
};

}
