#include "optstrat/options/BlackScholes.hpp"
#include "optstrat/options/Greeks.hpp"
#include "optstrat/options/ImpliedVolatility.hpp"
#include "optstrat/strategy/ProbabilityEngine.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>

using namespace optstrat;

int main() {
    std::cout << "=== Basic Options Pricing Example ===\n\n";

    // Define option contracts, 91 calendar days out
    OptionSpec call_option(LegKind::CALL, 100.0, 91.0);
    OptionSpec put_option(LegKind::PUT, 100.0, 91.0);

    // Market data: S=$105, vol=20%, r=5%
    MarketData market(105.0, 0.20, 0.05);

    std::cout << "Market Data:\n";
    std::cout << "  Spot Price: $" << market.spot_price << "\n";
    std::cout << "  Volatility: " << market.volatility * 100 << "%\n";
    std::cout << "  Risk-free Rate: " << market.risk_free_rate * 100 << "%\n";
    std::cout << "  Strike Price: $" << call_option.strike << "\n";
    std::cout << "  Days to Expiry: " << call_option.days_to_expiry << "\n\n";

    std::cout << "=== Call Option Pricing ===\n";
    auto call_result = BlackScholesPricer::price_european_option(call_option, market);

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "Call Option Price: $" << call_result.option_price << "\n";
    std::cout << "Greeks:\n";
    std::cout << "  Delta: " << call_result.greeks.delta << "\n";
    std::cout << "  Gamma: " << call_result.greeks.gamma << "\n";
    std::cout << "  Theta: " << call_result.greeks.theta << " (per day)\n";
    std::cout << "  Vega:  " << call_result.greeks.vega << " (per 1.00 vol)\n\n";

    std::cout << "=== Put Option Pricing ===\n";
    auto put_result = BlackScholesPricer::price_european_option(put_option, market);

    std::cout << "Put Option Price: $" << put_result.option_price << "\n";
    std::cout << "Greeks:\n";
    std::cout << "  Delta: " << put_result.greeks.delta << "\n";
    std::cout << "  Gamma: " << put_result.greeks.gamma << "\n";
    std::cout << "  Theta: " << put_result.greeks.theta << " (per day)\n";
    std::cout << "  Vega:  " << put_result.greeks.vega << " (per 1.00 vol)\n\n";

    // Verify put-call parity
    const double T = market.years(call_option.days_to_expiry);
    const double pv_strike = call_option.strike * std::exp(-market.risk_free_rate * T);
    const double put_call_parity = call_result.option_price - put_result.option_price - (market.spot_price - pv_strike);

    std::cout << "=== Put-Call Parity Verification ===\n";
    std::cout << "C - P - (S - PV(K)) = " << put_call_parity << "\n";
    std::cout << (std::abs(put_call_parity) < 1e-10 ? "PASSED" : "FAILED") << "\n\n";

    // Bump-and-reprice cross-check
    auto pricing_func = [](const OptionSpec& opt, const MarketData& mkt) {
        return BlackScholesPricer::price(opt, mkt);
    };
    auto numerical = GreeksCalculator::calculate_numerical_greeks(call_option, market, pricing_func);

    std::cout << "=== Finite-Difference Greeks ===\n";
    std::cout << "  Delta: " << numerical.delta << " (analytic " << call_result.greeks.delta << ")\n";
    std::cout << "  Gamma: " << numerical.gamma << " (analytic " << call_result.greeks.gamma << ")\n";
    std::cout << "  Vega:  " << numerical.vega << " (analytic " << call_result.greeks.vega << ")\n";
    std::cout << "  Theta: " << numerical.theta << " (analytic " << call_result.greeks.theta << ")\n\n";

    // Implied volatility calculation
    std::cout << "=== Implied Volatility Calculation ===\n";
    const double market_price = call_result.option_price * 1.05; // 5% premium

    ImpliedVolatilitySolver iv_solver;
    try {
        auto solved = iv_solver.solve_newton_raphson(call_option, market, market_price);

        std::cout << "Market Price: $" << market_price << "\n";
        std::cout << "Theoretical Price: $" << call_result.option_price << "\n";
        std::cout << "Market Volatility: " << market.volatility * 100 << "%\n";
        std::cout << "Implied Volatility: " << solved.implied_volatility * 100 << "%\n";
        std::cout << "Iterations: " << solved.iterations_used << "\n\n";
    } catch (const ConvergenceError& e) {
        std::cerr << "Implied volatility failed: " << e.what() << "\n";
        return 1;
    }

    // Distribution of the underlying at expiry
    std::cout << "=== Expected Move ===\n";
    const double move = ProbabilityEngine::expected_move(
        market.spot_price, market.volatility, call_option.days_to_expiry, market.year_days);
    std::cout << "One standard deviation: $" << move << "\n";
    std::cout << "P(finish above strike): "
              << ProbabilityEngine::breach_probability(LegKind::CALL, market.spot_price, call_option.strike,
                                                       call_option.days_to_expiry, market.volatility,
                                                       market.risk_free_rate) * 100 << "%\n";

    return 0;
}
