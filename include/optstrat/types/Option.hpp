#pragma once

#include "Errors.hpp"
#include <optional>
#include <string>
#include <variant>

namespace optstrat {

enum class LegKind {
    CALL,
    PUT,
    STOCK
};

// Contract size scaling for cost and Greek aggregation.
inline constexpr double OPTION_MULTIPLIER = 100.0;
inline constexpr double STOCK_MULTIPLIER = 1.0;

inline char to_code(LegKind kind) noexcept {
    switch (kind) {
        case LegKind::CALL:  return 'C';
        case LegKind::PUT:   return 'P';
        case LegKind::STOCK: return 'S';
    }
    return '?';
}

inline std::string to_string(LegKind kind) {
    switch (kind) {
        case LegKind::CALL:  return "CALL";
        case LegKind::PUT:   return "PUT";
        case LegKind::STOCK: return "STOCK";
    }
    return "UNKNOWN";
}

inline LegKind leg_kind_from_code(char code) {
    switch (code) {
        case 'C': case 'c': return LegKind::CALL;
        case 'P': case 'p': return LegKind::PUT;
        case 'S': case 's': return LegKind::STOCK;
        default:
            throw InvalidInput(std::string("leg kind must be 'C', 'P' or 'S', got '") + code + "'");
    }
}

inline bool is_option(LegKind kind) noexcept {
    return kind == LegKind::CALL || kind == LegKind::PUT;
}

// Pricing input for a single option contract.
struct OptionSpec {
    LegKind type = LegKind::CALL;
    double strike = 0.0;
    double days_to_expiry = 0.0;

    OptionSpec() = default;

    OptionSpec(LegKind t, double K, double days)
        : type(t), strike(K), days_to_expiry(days) {}
};

struct OptionLegSpec {
    LegKind type = LegKind::CALL;
    double strike = 0.0;
    int quantity = 0;
    std::optional<double> volatility;
    std::optional<double> mark;
    std::optional<double> days_to_expiration;
    std::optional<double> delta;   // per-contract override

    OptionLegSpec() = default;

    OptionLegSpec(LegKind t, double K, int qty)
        : type(t), strike(K), quantity(qty) {}
};

// Shares are bought or sold at the underlying price.
struct StockLegSpec {
    int quantity = 0;

    StockLegSpec() = default;
    explicit StockLegSpec(int qty) : quantity(qty) {}
};

using LegSpec = std::variant<OptionLegSpec, StockLegSpec>;

inline LegSpec make_leg_spec(
    char code,
    double strike,
    int quantity,
    std::optional<double> volatility = std::nullopt,
    std::optional<double> mark = std::nullopt,
    std::optional<double> days_to_expiration = std::nullopt,
    std::optional<double> delta = std::nullopt) {

    const LegKind kind = leg_kind_from_code(code);
    if (kind == LegKind::STOCK) {
        return StockLegSpec(quantity);
    }

    OptionLegSpec spec(kind, strike, quantity);
    spec.volatility = volatility;
    spec.mark = mark;
    spec.days_to_expiration = days_to_expiration;
    spec.delta = delta;
    return spec;
}

}
