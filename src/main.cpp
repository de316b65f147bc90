#include "optstrat/strategy/Strategy.hpp"
#include "optstrat/utils/Logger.hpp"
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace optstrat;

void print_summary(const Strategy& strategy) {
    const StrategySummary summary = strategy.summary();

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "\n=== " << summary.title << " (" << summary.underlying_symbol << " @ $"
              << summary.underlying_price << ") ===\n";
    std::cout << "Days to Expiration: " << summary.days_to_expiration << "\n";
    std::cout << "Volatility: " << summary.volatility * 100 << "%\n";
    std::cout << "Expected Move: $" << summary.expected_move << "\n";
    std::cout << "Cost: $" << summary.cost << "\n";
    std::cout << "Probability of Profit: " << summary.pop * 100 << "%\n";
    std::cout << "Expected Profit: $" << summary.expected_profit << "\n";
    std::cout << "Greeks:\n";
    std::cout << "  Delta: " << summary.delta << "\n";
    std::cout << "  Gamma: " << summary.gamma << "\n";
    std::cout << "  Theta: " << summary.theta << " (per day)\n";
    std::cout << "  Vega:  " << summary.vega << " (per 1.00 vol)\n";

    std::cout << "Legs:\n";
    for (const LegSummary& leg : strategy.leg_summaries()) {
        std::cout << "  " << leg.option_type << " " << std::setw(5) << leg.quantity;
        if (leg.option_type != 'S') {
            std::cout << " K=" << leg.strike_price << " dte=" << leg.days_to_expiration
                      << " vol=" << leg.volatility;
        }
        std::cout << " mark=" << leg.mark << " delta=" << leg.delta << "\n";
    }
}

void print_snapshots(Strategy& strategy) {
    strategy.add_pnl(PnlRequest::with_partitions(3));

    std::cout << "P&L Snapshots:\n";
    std::cout << "  " << std::setw(8) << "DTE" << std::setw(12) << "Stddev"
              << std::setw(14) << "Expected" << std::setw(10) << "POP" << "\n";
    for (const PnLSnapshot& snapshot : strategy.pnls()) {
        std::cout << "  " << std::setw(8) << snapshot.days_to_expiration
                  << std::setw(12) << snapshot.stddev
                  << std::setw(14) << snapshot.expected_profit
                  << std::setw(10) << snapshot.pop << "\n";
    }

    const PnLCurve at_expiration = strategy.pnl_curve(0);
    std::cout << "Breakevens at expiration:";
    for (double price : at_expiration.breakevens()) {
        std::cout << " $" << price;
    }
    std::cout << "\n";
}

void print_margin(const Strategy& strategy) {
    const MarginRequirement requirement = strategy.margin();
    std::cout << "Cash Requirement: $" << requirement.cash << "\n";
    std::cout << "Margin Requirement: $" << requirement.margin << "\n";
}

Strategy build_vertical_spread() {
    StrategyConfig config(100.0);
    config.title = "Bull Put Spread";
    config.underlying_symbol = "SPY";
    config.days_to_expiration = 30.0;

    Strategy strategy(config);
    strategy.add_legs({
        make_leg_spec('P', 95.0, -1, 0.24),
        make_leg_spec('P', 90.0, 1, 0.27),
    });
    return strategy;
}

Strategy build_calendar_spread() {
    StrategyConfig config(100.0);
    config.title = "Call Calendar";
    config.underlying_symbol = "ACME";

    Strategy strategy(config);
    strategy.add_legs({
        make_leg_spec('C', 100.0, -1, std::nullopt, 2.55, 30.0),
        make_leg_spec('C', 100.0, 1, std::nullopt, 4.10, 60.0),
    });
    return strategy;
}

Strategy build_covered_stock() {
    StrategyConfig config(100.0);
    config.title = "Collared Stock";
    config.days_to_expiration = 30.0;

    Strategy strategy(config);
    strategy.add_legs({
        make_leg_spec('C', 105.0, 1),
        make_leg_spec('P', 95.0, -1),
        make_leg_spec('S', 0.0, 100),
    });
    return strategy;
}

int main(int argc, char** argv) {
    const bool verbose = argc > 1 && std::string(argv[1]) == "--verbose";
    utils::Logger::configure(verbose ? utils::LogLevel::DEBUG : utils::LogLevel::WARNING);
    utils::Logger logger("Demo");

    std::cout << "Option Strategy Analytics Demo\n";
    std::cout << "==============================\n";

    try {
        std::vector<Strategy> strategies;
        strategies.push_back(build_vertical_spread());
        strategies.push_back(build_calendar_spread());
        strategies.push_back(build_covered_stock());

        for (Strategy& strategy : strategies) {
            print_summary(strategy);
            print_snapshots(strategy);
            print_margin(strategy);
        }
    } catch (const std::exception& e) {
        OPTSTRAT_LOG_ERROR(logger, "demo failed: ", e.what());
        return 1;
    }

    return 0;
}
