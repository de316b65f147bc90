#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../types/Errors.hpp"
#include "../options/BlackScholes.hpp"
#include "../options/ImpliedVolatility.hpp"
#include "../utils/Logger.hpp"
#include <cmath>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>

namespace optstrat {

// Strategy-level inputs a leg falls back on when the request leaves them unset.
struct LegContext {
    MarketData market;                       // volatility holds the strategy default
    double default_days_to_expiration = 0.0;
    ImpliedVolatilitySolver::SolverConfiguration solver;
};

class Leg {
public:
    virtual ~Leg() = default;

    Leg(const Leg&) = delete;
    Leg& operator=(const Leg&) = delete;

    LegKind kind() const noexcept { return kind_; }
    double strike() const noexcept { return strike_; }
    int quantity() const noexcept { return quantity_; }
    double days_to_expiration() const noexcept { return days_to_expiration_; }
    double volatility() const noexcept { return volatility_; }
    double mark() const noexcept { return mark_; }
    const Greeks& greeks() const noexcept { return greeks_; }

    bool is_option() const noexcept { return optstrat::is_option(kind_); }
    bool is_long() const noexcept { return quantity_ > 0; }

    virtual double multiplier() const noexcept = 0;

    virtual double value_at(double spot, double days_remaining, const MarketData& market) const = 0;

    virtual double payoff_at_expiration(double spot) const noexcept = 0;

    // Greeks of the whole position in share-equivalent units.
    virtual Greeks position_greeks() const {
        return greeks_.scaled(quantity_ * multiplier());
    }

    double position_cost() const noexcept {
        return mark_ * quantity_ * multiplier();
    }

    LegSummary summary() const {
        LegSummary view;
        view.option_type = to_code(kind_);
        view.strike_price = strike_;
        view.quantity = quantity_;
        view.days_to_expiration = days_to_expiration_;
        view.volatility = volatility_;
        view.mark = mark_;
        view.delta = greeks_.delta;
        view.theta = greeks_.theta;
        view.vega = greeks_.vega;
        view.gamma = greeks_.gamma;
        return view;
    }

protected:
    Leg(LegKind kind, double strike, int quantity, double days, double volatility,
        double mark, const Greeks& greeks)
        : kind_(kind), strike_(strike), quantity_(quantity), days_to_expiration_(days),
          volatility_(volatility), mark_(mark), greeks_(greeks) {}

private:
    LegKind kind_;
    double strike_;
    int quantity_;
    double days_to_expiration_;
    double volatility_;
    double mark_;
    Greeks greeks_;
};

class OptionLeg final : public Leg {
public:
    OptionLeg(LegKind kind, double strike, int quantity, double days, double volatility,
              double mark, const Greeks& greeks)
        : Leg(kind, strike, quantity, days, volatility, mark, greeks) {}

    // Mark and volatility are both kept as given; a lone mark is inverted through the solver.
    static std::unique_ptr<OptionLeg> resolve(const OptionLegSpec& spec, const LegContext& context) {
        validate(spec, context);

        const double days = spec.days_to_expiration.value_or(context.default_days_to_expiration);
        const OptionSpec option(spec.type, spec.strike, days);

        double volatility;
        double mark;
        Greeks greeks;

        if (spec.mark && spec.volatility) {
            volatility = *spec.volatility;
            mark = *spec.mark;
            const PricingResult model = BlackScholesPricer::price_european_option(
                option, context.market.with_volatility(volatility));
            greeks = model.greeks;
            OPTSTRAT_LOG_DEBUG(logger(), to_string(spec.type), " K=", spec.strike, " mark ", mark,
                               " kept against model price ", model.option_price, " at vol ", volatility);
        } else if (spec.mark) {
            const ImpliedVolatilitySolver solver(context.solver);
            const PricingResult solved = solver.solve_newton_raphson(option, context.market, *spec.mark);
            volatility = solved.implied_volatility;
            mark = *spec.mark;
            greeks = solved.greeks;
        } else {
            volatility = spec.volatility.value_or(context.market.volatility);
            const PricingResult model = BlackScholesPricer::price_european_option(
                option, context.market.with_volatility(volatility));
            mark = model.option_price;
            greeks = model.greeks;
        }

        if (spec.delta) {
            greeks.delta = *spec.delta;
        }

        return std::make_unique<OptionLeg>(spec.type, spec.strike, spec.quantity, days,
                                           volatility, mark, greeks);
    }

    double multiplier() const noexcept override { return OPTION_MULTIPLIER; }

    double value_at(double spot, double days_remaining, const MarketData& market) const override {
        if (days_remaining <= 0.0) {
            return payoff_at_expiration(spot);
        }
        return BlackScholesPricer::price(
            OptionSpec(kind(), strike(), days_remaining),
            MarketData(spot, volatility(), market.risk_free_rate, market.year_days));
    }

    double payoff_at_expiration(double spot) const noexcept override {
        return BlackScholesPricer::intrinsic_value(kind(), spot, strike());
    }

private:
    static const utils::Logger& logger() {
        static const utils::Logger instance("Leg");
        return instance;
    }

    static void validate(const OptionLegSpec& spec, const LegContext& context) {
        if (!optstrat::is_option(spec.type)) {
            throw InvalidInput("option leg kind must be CALL or PUT, got " + to_string(spec.type));
        }
        if (!std::isfinite(spec.strike) || spec.strike <= 0.0) {
            throw InvalidInput("strike price must be positive");
        }
        if (!context.market.is_valid()) {
            throw InvalidInput("underlying price must be positive");
        }
        if (spec.quantity == 0) {
            throw InvalidInput("quantity must be non-zero");
        }
        if (spec.days_to_expiration &&
            (!std::isfinite(*spec.days_to_expiration) || *spec.days_to_expiration < 0.0)) {
            throw InvalidInput("days to expiration must be non-negative");
        }
        if (spec.volatility && (!std::isfinite(*spec.volatility) || *spec.volatility <= 0.0)) {
            throw InvalidInput("volatility must be positive");
        }
        if (spec.mark && (!std::isfinite(*spec.mark) || *spec.mark < 0.0)) {
            throw InvalidInput("mark must be non-negative");
        }
        if (spec.delta && !std::isfinite(*spec.delta)) {
            throw InvalidInput("delta must be finite");
        }
    }
};

// Shares only carry delta, equal to the share count.
class StockLeg final : public Leg {
public:
    StockLeg(int quantity, double price)
        : Leg(LegKind::STOCK, 0.0, quantity, 0.0, 0.0, price,
              Greeks(static_cast<double>(quantity), 0.0, 0.0, 0.0)) {}

    static std::unique_ptr<StockLeg> resolve(const StockLegSpec& spec, const LegContext& context) {
        if (spec.quantity == 0) {
            throw InvalidInput("quantity must be non-zero");
        }
        if (!context.market.is_valid()) {
            throw InvalidInput("underlying price must be positive");
        }
        return std::make_unique<StockLeg>(spec.quantity, context.market.spot_price);
    }

    double multiplier() const noexcept override { return STOCK_MULTIPLIER; }

    double value_at(double spot, double, const MarketData&) const override { return spot; }

    double payoff_at_expiration(double spot) const noexcept override { return spot; }

    Greeks position_greeks() const override { return greeks(); }
};

inline std::unique_ptr<Leg> resolve_leg(const LegSpec& spec, const LegContext& context) {
    return std::visit([&context](const auto& leg_spec) -> std::unique_ptr<Leg> {
        using SpecType = std::decay_t<decltype(leg_spec)>;
        if constexpr (std::is_same_v<SpecType, OptionLegSpec>) {
            return OptionLeg::resolve(leg_spec, context);
        } else {
            return StockLeg::resolve(leg_spec, context);
        }
    }, spec);
}

}
