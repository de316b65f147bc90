#pragma once

#include <cmath>

namespace optstrat {

inline constexpr double DEFAULT_RISK_FREE_RATE = 0.05;
// Calendar days; some desks prefer 252 trading days.
inline constexpr double DEFAULT_YEAR_DAYS = 365.0;

struct MarketData {
    double spot_price = 0.0;
    double volatility = 0.0;
    double risk_free_rate = DEFAULT_RISK_FREE_RATE;
    double year_days = DEFAULT_YEAR_DAYS;

    MarketData() = default;

    MarketData(double S, double vol, double r = DEFAULT_RISK_FREE_RATE, double year = DEFAULT_YEAR_DAYS)
        : spot_price(S), volatility(vol), risk_free_rate(r), year_days(year) {}

    MarketData with_spot(double S) const {
        MarketData bumped = *this;
        bumped.spot_price = S;
        return bumped;
    }

    MarketData with_volatility(double vol) const {
        MarketData bumped = *this;
        bumped.volatility = vol;
        return bumped;
    }

    double years(double days) const noexcept {
        return days / year_days;
    }

    bool is_valid() const {
        return std::isfinite(spot_price) && spot_price > 0.0 &&
               std::isfinite(risk_free_rate) && year_days > 0.0;
    }
};

}
