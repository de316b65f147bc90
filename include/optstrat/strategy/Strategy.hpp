#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../types/Errors.hpp"
#include "../options/ImpliedVolatility.hpp"
#include "../utils/Logger.hpp"
#include "Leg.hpp"
#include "Margin.hpp"
#include "ProbabilityEngine.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace optstrat {

inline constexpr double DEFAULT_VOLATILITY = 0.22;
inline constexpr double DEFAULT_DAYS_TO_EXPIRATION = 1.0;

struct StrategyConfig {
    double underlying_price = 0.0;
    std::string title = "Option Strategy";
    std::string underlying_symbol = "XYZ";
    std::optional<double> days_to_expiration;  // Averaged over option legs when unset
    std::optional<double> volatility;          // Weighted over option legs when unset
    double stddev_range = 3.0;
    std::size_t num_simulations = 1000;
    bool monte_carlo = false;
    std::uint64_t random_seed = 0;
    double risk_free_rate = DEFAULT_RISK_FREE_RATE;
    double year_days = DEFAULT_YEAR_DAYS;
    ImpliedVolatilitySolver::SolverConfiguration solver;
    MarginEstimator::Configuration margin;

    StrategyConfig() = default;
    explicit StrategyConfig(double S) : underlying_price(S) {}

    ProbabilityEngine::Configuration probability() const {
        ProbabilityEngine::Configuration config;
        config.stddev_range = stddev_range;
        config.num_simulations = num_simulations;
        config.monte_carlo = monte_carlo;
        config.random_seed = random_seed;
        return config;
    }

    void validate() const {
        if (!std::isfinite(underlying_price) || underlying_price <= 0.0) {
            throw InvalidInput("underlying price must be positive");
        }
        if (days_to_expiration && (!std::isfinite(*days_to_expiration) || *days_to_expiration < 0.0)) {
            throw InvalidInput("days to expiration must be non-negative");
        }
        if (volatility && (!std::isfinite(*volatility) || *volatility <= 0.0)) {
            throw InvalidInput("volatility must be positive");
        }
        if (!std::isfinite(risk_free_rate)) {
            throw InvalidInput("risk-free rate must be finite");
        }
        if (!std::isfinite(year_days) || year_days <= 0.0) {
            throw InvalidInput("year length must be positive");
        }
        if (solver.tolerance <= 0.0 || solver.max_iterations == 0 ||
            solver.min_volatility <= 0.0 || solver.max_volatility < solver.min_volatility) {
            throw InvalidInput("solver configuration is inconsistent");
        }
        probability().validate();
        margin.validate();
    }
};

// Exactly one selector must be set.
struct PnlRequest {
    std::optional<int> partitions;    // Evenly spaced snapshots from expiration
    std::optional<int> days_forward;  // Days elapsed from today
    std::optional<double> dte;        // Days remaining to expiration

    static PnlRequest with_partitions(int count) {
        PnlRequest request;
        request.partitions = count;
        return request;
    }

    static PnlRequest with_days_forward(int days) {
        PnlRequest request;
        request.days_forward = days;
        return request;
    }

    static PnlRequest with_dte(double days) {
        PnlRequest request;
        request.dte = days;
        return request;
    }
};

// Legs are priced when added and never change afterwards.
class Strategy {
public:
    explicit Strategy(const StrategyConfig& config)
        : config_(config), logger_("Strategy") {
        config_.validate();
    }

    Strategy(const Strategy&) = delete;
    Strategy& operator=(const Strategy&) = delete;
    Strategy(Strategy&&) = default;
    Strategy& operator=(Strategy&&) = default;

    const StrategyConfig& config() const noexcept { return config_; }
    double underlying_price() const noexcept { return config_.underlying_price; }
    const std::string& underlying_symbol() const noexcept { return config_.underlying_symbol; }
    const std::string& title() const noexcept { return config_.title; }

    const Leg& add_leg(const LegSpec& spec) {
        LegContext context;
        context.market = market();
        context.default_days_to_expiration = days_to_expiration();
        context.solver = config_.solver;

        legs_.push_back(resolve_leg(spec, context));
        const Leg& leg = *legs_.back();
        OPTSTRAT_LOG_INFO(logger_, config_.underlying_symbol, ": added ", to_string(leg.kind()),
                          " x", leg.quantity(), " K=", leg.strike(), " dte=", leg.days_to_expiration(),
                          " mark=", leg.mark(), " vol=", leg.volatility());
        return leg;
    }

    void add_legs(const std::vector<LegSpec>& specs) {
        for (const auto& spec : specs) {
            add_leg(spec);
        }
    }

    const std::vector<std::unique_ptr<Leg>>& legs() const noexcept { return legs_; }

    std::vector<const Leg*> option_legs() const {
        std::vector<const Leg*> result;
        for (const auto& leg : legs_) {
            if (leg->is_option()) {
                result.push_back(leg.get());
            }
        }
        return result;
    }

    std::vector<const Leg*> stock_legs() const {
        std::vector<const Leg*> result;
        for (const auto& leg : legs_) {
            if (!leg->is_option()) {
                result.push_back(leg.get());
            }
        }
        return result;
    }

    std::vector<LegSummary> leg_summaries() const {
        std::vector<LegSummary> result;
        result.reserve(legs_.size());
        for (const auto& leg : legs_) {
            result.push_back(leg->summary());
        }
        return result;
    }

    double days_to_expiration() const {
        if (config_.days_to_expiration) {
            return *config_.days_to_expiration;
        }
        double total = 0.0;
        std::size_t count = 0;
        for (const auto& leg : legs_) {
            if (leg->is_option()) {
                total += leg->days_to_expiration();
                ++count;
            }
        }
        return count > 0 ? total / static_cast<double>(count) : DEFAULT_DAYS_TO_EXPIRATION;
    }

    // Average of option leg volatilities weighted by contract count.
    double volatility() const {
        if (config_.volatility) {
            return *config_.volatility;
        }
        double weighted = 0.0;
        double contracts = 0.0;
        for (const auto& leg : legs_) {
            if (leg->is_option()) {
                const double size = std::abs(static_cast<double>(leg->quantity()));
                weighted += leg->volatility() * size;
                contracts += size;
            }
        }
        return contracts > 0.0 ? weighted / contracts : DEFAULT_VOLATILITY;
    }

    double cost() const {
        double total = 0.0;
        for (const auto& leg : legs_) {
            total += leg->position_cost();
        }
        return total;
    }

    Greeks greeks() const {
        Greeks total;
        for (const auto& leg : legs_) {
            total += leg->position_greeks();
        }
        return total;
    }

    double delta() const { return greeks().delta; }
    double gamma() const { return greeks().gamma; }
    double theta() const { return greeks().theta; }
    double vega() const { return greeks().vega; }

    double expected_move() const {
        return ProbabilityEngine::expected_move(
            config_.underlying_price, volatility(), days_to_expiration(), config_.year_days);
    }

    // Probability of profit at expiration.
    double pop() const { return pnl_curve_at(0.0).pop; }

    double expected_profit() const { return pnl_curve_at(0.0).expected_profit; }

    // Nothing is appended when the request is rejected.
    void add_pnl(const PnlRequest& request) {
        const int selectors = static_cast<int>(request.partitions.has_value()) +
                              static_cast<int>(request.days_forward.has_value()) +
                              static_cast<int>(request.dte.has_value());
        if (selectors != 1) {
            throw InvalidArgument("exactly one of partitions, days_forward or dte must be given");
        }

        const double dte = days_to_expiration();
        std::vector<double> targets;

        if (request.partitions) {
            const int count = *request.partitions;
            if (count <= 1) {
                throw InvalidArgument("partitions must be greater than 1");
            }
            for (int i = 0; i < count; ++i) {
                targets.push_back(dte * static_cast<double>(i) / static_cast<double>(count));
            }
        } else if (request.days_forward) {
            if (*request.days_forward <= 0) {
                throw InvalidArgument("days forward must be positive");
            }
            targets.push_back(std::max(0.0, dte - static_cast<double>(*request.days_forward)));
        } else {
            const double target = *request.dte;
            if (!std::isfinite(target) || target < 0.0 || target > dte) {
                throw InvalidArgument("dte must lie between 0 and the strategy days to expiration");
            }
            targets.push_back(target);
        }

        // Evaluate everything first so a failure leaves no partial snapshots.
        std::vector<PnLCurve> produced;
        produced.reserve(targets.size());
        for (double target : targets) {
            produced.push_back(pnl_curve_at(target));
        }
        snapshots_.reserve(snapshots_.size() + produced.size());
        curves_.reserve(curves_.size() + produced.size());
        for (auto& curve : produced) {
            PnLSnapshot snapshot = curve.snapshot();
            OPTSTRAT_LOG_DEBUG(logger_, config_.underlying_symbol, ": snapshot dte=",
                               snapshot.days_to_expiration, " stddev=", snapshot.stddev,
                               " expected=", snapshot.expected_profit, " pop=", snapshot.pop);
            snapshots_.push_back(std::move(snapshot));
            curves_.push_back(std::move(curve));
        }
    }

    const std::vector<PnLSnapshot>& pnls() const noexcept { return snapshots_; }

    const PnLSnapshot& pnl(std::size_t index) const {
        check_snapshot_index(index);
        return snapshots_[index];
    }

    // The curve behind pnl(index), as it stood when the snapshot was taken.
    const PnLCurve& pnl_curve(std::size_t index) const {
        check_snapshot_index(index);
        return curves_[index];
    }

    PnLCurve pnl_curve_at(double days_to_expiration_left) const {
        const double dte = days_to_expiration();
        if (!std::isfinite(days_to_expiration_left) || days_to_expiration_left < 0.0 ||
            days_to_expiration_left > dte) {
            throw InvalidArgument("dte must lie between 0 and the strategy days to expiration");
        }
        return engine().project(legs_, dte, days_to_expiration_left, volatility());
    }

    MarginRequirement margin() const {
        std::vector<const Leg*> all;
        all.reserve(legs_.size());
        for (const auto& leg : legs_) {
            all.push_back(leg.get());
        }
        return MarginEstimator(config_.underlying_price, config_.underlying_symbol, config_.margin)
            .calculate_margin(all);
    }

    StrategySummary summary() const {
        const PnLCurve at_expiration = pnl_curve_at(0.0);
        const Greeks total = greeks();

        StrategySummary view;
        view.underlying_price = config_.underlying_price;
        view.underlying_symbol = config_.underlying_symbol;
        view.days_to_expiration = days_to_expiration();
        view.volatility = volatility();
        view.expected_move = expected_move();
        view.pop = at_expiration.pop;
        view.expected_profit = at_expiration.expected_profit;
        view.cost = cost();
        view.theta = total.theta;
        view.delta = total.delta;
        view.vega = total.vega;
        view.gamma = total.gamma;
        view.title = config_.title;
        view.stddev_range = config_.stddev_range;
        view.num_simulations = config_.num_simulations;
        view.monte_carlo = config_.monte_carlo;
        view.risk_free_rate = config_.risk_free_rate;
        view.year_days = config_.year_days;
        return view;
    }

private:
    void check_snapshot_index(std::size_t index) const {
        if (index >= snapshots_.size()) {
            throw std::out_of_range("snapshot index " + std::to_string(index) +
                                    " out of range (" + std::to_string(snapshots_.size()) + " stored)");
        }
    }

    MarketData market() const {
        return MarketData(config_.underlying_price, volatility(),
                          config_.risk_free_rate, config_.year_days);
    }

    ProbabilityEngine engine() const {
        return ProbabilityEngine(market(), config_.probability());
    }

    StrategyConfig config_;
    utils::Logger logger_;
    std::vector<std::unique_ptr<Leg>> legs_;
    std::vector<PnLSnapshot> snapshots_;
    std::vector<PnLCurve> curves_;
};

}
