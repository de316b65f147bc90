#pragma once

#include "../types/Option.hpp"
#include "../types/Results.hpp"
#include "../types/Errors.hpp"
#include "Leg.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace optstrat {

// Cash and margin requirements after the CBOE Margin Manual. Unmatched
// option combinations are charged leg by leg.
class MarginEstimator {
public:
    struct Configuration {
        double stock_rate = 0.25;              // Brokers range from 0.2 to 0.5
        double long_full_payment_days = 90.0;  // Long options paid in full below this
        double long_option_rate = 0.75;
        double naked_rate = 0.20;              // Equities and narrow-based indices
        double broad_based_rate = 0.15;        // Broad-based ETFs and indices
        double minimum_rate = 0.10;

        void validate() const {
            const double rates[] = {stock_rate, long_option_rate, naked_rate, broad_based_rate, minimum_rate};
            for (double rate : rates) {
                if (!std::isfinite(rate) || rate < 0.0) {
                    throw InvalidInput("margin rates must be non-negative");
                }
            }
            if (!std::isfinite(long_full_payment_days) || long_full_payment_days < 0.0) {
                throw InvalidInput("long option full payment days must be non-negative");
            }
        }
    };

    MarginEstimator(double underlying_price, std::string underlying_symbol)
        : MarginEstimator(underlying_price, std::move(underlying_symbol), Configuration()) {}

    MarginEstimator(double underlying_price, std::string underlying_symbol, const Configuration& config)
        : underlying_price_(underlying_price),
          underlying_symbol_(std::move(underlying_symbol)),
          config_(config) {
        if (!std::isfinite(underlying_price_) || underlying_price_ <= 0.0) {
            throw InvalidInput("underlying price must be positive");
        }
        config_.validate();
    }

    // Leverage factor for broad-based funds, nothing for everything else.
    static std::optional<double> broad_based_leverage(const std::string& symbol) {
        const auto& table = broad_based_table();
        const auto it = table.find(symbol);
        if (it == table.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    MarginRequirement calculate_margin(const std::vector<const Leg*>& legs) const {
        std::vector<const Leg*> stock;
        std::vector<const Leg*> options;
        for (const Leg* leg : legs) {
            (leg->is_option() ? options : stock).push_back(leg);
        }

        const MarginRequirement stock_req = stock_margin(stock);
        const MarginRequirement option_req = option_margin(options);

        MarginRequirement total;
        total.cash = stock_req.cash + option_req.cash;
        total.margin = stock_req.margin + option_req.margin;
        total.cash = std::max(total.cash, total.margin);
        return total;
    }

    MarginRequirement stock_margin(const std::vector<const Leg*>& legs) const {
        MarginRequirement req;
        for (const Leg* leg : legs) {
            const double value = std::abs(leg->mark() * leg->quantity());
            req.cash += value;
            req.margin += value * config_.stock_rate;
        }
        return req;
    }

    MarginRequirement option_margin(const std::vector<const Leg*>& legs) const {
        if (legs.empty()) {
            return MarginRequirement{};
        }
        if (legs.size() == 1) {
            return legs[0]->is_long() ? long_option(*legs[0]) : short_option(*legs[0]);
        }
        if (legs.size() == 2) {
            if (!legs[0]->is_long() && !legs[1]->is_long()) {
                return short_strangle(*legs[0], *legs[1]);
            }
            if (is_vertical_spread(*legs[0], *legs[1])) {
                return spread(*legs[0], *legs[1]);
            }
        }
        if (legs.size() == 4) {
            std::vector<const Leg*> calls;
            std::vector<const Leg*> puts;
            for (const Leg* leg : legs) {
                (leg->kind() == LegKind::CALL ? calls : puts).push_back(leg);
            }
            if (calls.size() == 2 && puts.size() == 2 &&
                is_vertical_spread(*calls[0], *calls[1]) &&
                is_vertical_spread(*puts[0], *puts[1]) &&
                std::abs(calls[0]->quantity()) == std::abs(puts[0]->quantity())) {
                const MarginRequirement call_side = spread(*calls[0], *calls[1]);
                const MarginRequirement put_side = spread(*puts[0], *puts[1]);
                return MarginRequirement{std::max(call_side.cash, put_side.cash),
                                         std::max(call_side.margin, put_side.margin)};
            }
        }

        MarginRequirement sum;
        for (const Leg* leg : legs) {
            const MarginRequirement req = option_margin({leg});
            sum.cash += req.cash;
            sum.margin += req.margin;
        }
        return sum;
    }

    // Long options are paid in full; longer-dated listed ones at a discount.
    MarginRequirement long_option(const Leg& leg) const {
        const double cost = leg.mark() * OPTION_MULTIPLIER * leg.quantity();
        const double margin = leg.days_to_expiration() < config_.long_full_payment_days
            ? cost
            : cost * config_.long_option_rate;
        return MarginRequirement{cost, margin};
    }

    MarginRequirement short_option(const Leg& leg) const {
        const double S = underlying_price_;
        const double K = leg.strike();
        const double mark = leg.mark();
        const bool is_put = leg.kind() == LegKind::PUT;
        const double otm_distance = is_put ? std::max(0.0, S - K) : std::max(0.0, K - S);

        double margin;
        double cash;
        if (const auto leverage = broad_based_leverage(underlying_symbol_)) {
            const double minimum = mark + (is_put ? K : S) * config_.minimum_rate * *leverage;
            const double base = mark + S * config_.broad_based_rate * *leverage - otm_distance;
            margin = std::max(minimum, base);
            cash = K - mark;
        } else {
            const double minimum = mark + (is_put ? K : S) * config_.minimum_rate;
            const double base = mark + S * config_.naked_rate - otm_distance;
            margin = std::max(minimum, base);
            // Puts are secured by the exercise price, calls by the shares.
            cash = is_put ? K - mark : S - mark;
        }

        const double contracts = OPTION_MULTIPLIER * std::abs(leg.quantity());
        return MarginRequirement{cash * contracts, margin * contracts};
    }

    // The greater short requirement plus the proceeds of the other side.
    MarginRequirement short_strangle(const Leg& first, const Leg& second) const {
        const MarginRequirement a = short_option(first);
        const MarginRequirement b = short_option(second);

        MarginRequirement req;
        req.cash = a.cash + b.cash;
        if (a.margin > b.margin) {
            req.margin = a.margin + proceeds(second);
        } else {
            req.margin = b.margin + proceeds(first);
        }
        return req;
    }

    // Worst loss at either strike plus the net debit (less a net credit).
    MarginRequirement spread(const Leg& first, const Leg& second) const {
        const double net_debit = first.position_cost() + second.position_cost();

        double worst = 0.0;
        for (double strike : {first.strike(), second.strike()}) {
            worst = std::min(worst, expiration_value(first, strike) + expiration_value(second, strike));
        }
        const double requirement = std::abs(worst) + net_debit;
        return MarginRequirement{requirement, requirement};
    }

private:
    static bool is_vertical_spread(const Leg& a, const Leg& b) noexcept {
        if (a.kind() != b.kind() || a.quantity() != -b.quantity()) {
            return false;
        }
        const Leg& long_leg = a.is_long() ? a : b;
        const Leg& short_leg = a.is_long() ? b : a;
        return long_leg.days_to_expiration() >= short_leg.days_to_expiration();
    }

    static double proceeds(const Leg& leg) noexcept {
        return leg.mark() * OPTION_MULTIPLIER * std::abs(leg.quantity());
    }

    static double expiration_value(const Leg& leg, double price) noexcept {
        return leg.payoff_at_expiration(price) * leg.quantity() * OPTION_MULTIPLIER;
    }

    static const std::unordered_map<std::string, double>& broad_based_table() {
        static const std::unordered_map<std::string, double> table = {
            {"SPY", 1}, {"VOO", 1}, {"IVV", 1}, {"VTI", 1}, {"QQQ", 1}, {"VEA", 1}, {"IEFA", 1},
            {"IJH", 1}, {"IJR", 1}, {"VIG", 1}, {"VGT", 1}, {"VWO", 1}, {"IEMG", 1}, {"VXUS", 1},
            {"IWM", 1}, {"VO", 1}, {"XLK", 1}, {"RSP", 1}, {"SCHD", 1}, {"VB", 1}, {"ITOT", 1},
            {"VYM", 1}, {"EFA", 1}, {"SPLG", 1}, {"SCHX", 1}, {"QUAL", 1}, {"XLF", 1}, {"VT", 1},
            {"IWR", 1}, {"SCHF", 1}, {"VV", 1}, {"VEU", 1}, {"IWB", 1}, {"XLV", 1}, {"XLE", 1},
            {"IXUS", 1}, {"DIA", 1}, {"JEPI", 1}, {"VNQ", 1}, {"QQQM", 1}, {"DFAC", 1}, {"SCHB", 1},
            {"DGRO", 1}, {"COWZ", 1}, {"TQQQ", 3}, {"MDY", 1}, {"USMV", 1}, {"XLY", 1}, {"VXF", 1},
            {"XLI", 1}, {"SDY", 1}, {"DVY", 1}, {"SPDW", 1}, {"XLC", 1}, {"IYW", 1}, {"ACWI", 1},
            {"SCHA", 1}, {"JEPQ", 1}, {"EEM", 1}, {"FNDX", 1}, {"VGK", 1}, {"XLU", 1}, {"VHT", 1},
            {"XLP", 1}, {"EMXC", 1}, {"MOAT", 1}, {"IWV", 1}, {"DGRW", 1}, {"OEF", 1}, {"IDEV", 1},
            {"ESGU", 1}, {"EWJ", 1}, {"MTUM", 1}, {"GSLC", 1}, {"FNDF", 1}, {"DYNF", 1},
            {"RDVY", 1}, {"SPSM", 1}, {"FTEC", 1}, {"VTWO", 1}, {"NOBL", 1}, {"DFUS", 1},
            {"SPMD", 1}, {"SPHQ", 1}, {"SCHM", 1}, {"VFH", 1}, {"BBJP", 1}, {"HDV", 1}, {"INDA", 1},
            {"SPEM", 1}, {"ESGV", 1}, {"FVD", 1}, {"SPTM", 1}, {"FNDA", 1}, {"DFAS", 1},
            {"SCHE", 1}, {"FTCS", 1}, {"CALF", 1}, {"VSS", 1}, {"SCZ", 1}, {"VDE", 1}, {"QYLD", 1},
            {"ESGD", 1}, {"VYMI", 1}, {"FXI", 1}, {"AVUS", 1}, {"IQLT", 1}, {"XLRE", 1}, {"PRF", 1},
            {"QLD", 2}, {"BBCA", 1}, {"SPLV", 1}, {"XLG", 1}, {"SDVY", 1}, {"ONEQ", 1}, {"DUHP", 1},
            {"VDC", 1}, {"VIGI", 1}, {"DFAX", 1}, {"DFAI", 1}, {"VPL", 1}, {"SPYD", 1}, {"DFIC", 1},
            {"AVEM", 1}, {"DFAU", 1}, {"JGLO", 1}, {"EZU", 1}, {"VPU", 1}, {"DBEF", 1}, {"MGC", 1},
            {"BBEU", 1}, {"FNDE", 1}, {"JIRE", 1}, {"IOO", 1}, {"VCR", 1}, {"XMHQ", 1}, {"XLB", 1},
            {"PBUS", 1}, {"VIS", 1}, {"EFAV", 1}, {"BUFR", 1}, {"MCHI", 1}, {"SSO", 2}, {"EWT", 1},
            {"SPXL", 1}, {"HEFA", 1}, {"VONE", 1}, {"OMFL", 1}, {"JQUA", 1}, {"IXN", 1},
            {"AVDE", 1}, {"DSI", 1}, {"BBIN", 1}, {"DFAE", 1}, {"BBAX", 1}, {"IYR", 1}, {"FDL", 1},
            {"ACWX", 1}, {"DLN", 1}, {"ESGE", 1}, {"VOX", 1}, {"ACWV", 1}, {"UPRO", 3}, {"DFEM", 1},
            {"SPGP", 1}, {"BBUS", 1}, {"JHMM", 1}, {"IEUR", 1}, {"EEMV", 1}, {"FDVV", 1},
            {"EWY", 1}, {"IDV", 1}, {"RWL", 1}, {"URTH", 1}, {"FELC", 1}, {"CGUS", 1}, {"SCHK", 1},
            {"SCHC", 1}, {"SPMO", 1}, {"DON", 1}, {"QTEC", 1}, {"VSGX", 1}, {"IXJ", 1}, {"FV", 1},
            {"SUSA", 1}, {"DIVO", 1}, {"IYF", 1}, {"DXJ", 1}, {"EWZ", 1}, {"EPI", 1}, {"GSIE", 1},
            {"KNG", 1}, {"SPHD", 1}, {"RSPT", 1}, {"TECL", 1}, {"XT", 1}, {"FEZ", 1}, {"PTLC", 1},
            {"VNQI", 1}, {"IYH", 1}, {"BITU", 2}, {"USD", 2}, {"UYG", 2}, {"ROM", 2}, {"AGQ", 2},
            {"DDM", 2}, {"UWM", 2}, {"UCO", 2}, {"SDS", 2}, {"TBT", 2}, {"BOIL", 2}, {"UGL", 2},
            {"KOLD", 2}, {"QID", 2}, {"SCO", 2}, {"ETHT", 2}, {"MVV", 2}, {"UBT", 2}, {"DIG", 2},
            {"RXL", 2}, {"URE", 2}, {"BIB", 2}, {"DXD", 2}, {"YCL", 2}, {"SBIT", 2}, {"TWM", 2},
            {"EUO", 2}, {"UYM", 2}, {"SAA", 2}, {"SRS", 2}, {"UXI", 2}, {"YCS", 2}, {"EPV", 2},
            {"ZSL", 2}, {"UCC", 2}, {"UST", 2}, {"XPP", 2}, {"UPW", 2}, {"PST", 2}, {"GLL", 2},
            {"EET", 2}, {"UJB", 2}, {"DUG", 2}, {"SKF", 2}, {"FXP", 2}, {"LTL", 2}, {"UGE", 2},
            {"BZQ", 2}, {"EFO", 2}, {"SSG", 2}, {"ETHD", 2}, {"ULE", 2}, {"EZJ", 2}, {"EEV", 2},
            {"EWV", 2}, {"UCYB", 2}, {"REW", 2}, {"UPV", 2}, {"BIS", 2}, {"SKYU", 2}, {"EFU", 2},
            {"SDD", 2}, {"UBR", 2}, {"RXD", 2}, {"SDP", 2}, {"MZZ", 2}, {"SCC", 2}, {"SIJ", 2},
            {"SMN", 2}, {"SZK", 2}, {"SQQQ", 3}, {"UDOW", 3}, {"URTY", 3}, {"SPXU", 3}, {"SDOW", 3},
            {"SRTY", 3}, {"UMDD", 3}, {"TTT", 3}, {"SMDD", 3},
        };
        return table;
    }

    double underlying_price_;
    std::string underlying_symbol_;
    Configuration config_;
};

}
