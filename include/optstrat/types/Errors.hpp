#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace optstrat {

// Rejected leg or configuration input, raised before any pricing attempt.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& message)
        : std::invalid_argument(message) {}
};

// Misuse of an API call, e.g. conflicting P&L request selectors.
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& message)
        : std::invalid_argument(message) {}
};

class ConvergenceError : public std::runtime_error {
public:
    ConvergenceError(const std::string& message, std::size_t iterations, double last_volatility)
        : std::runtime_error(message), iterations_(iterations), last_volatility_(last_volatility) {}

    std::size_t iterations() const noexcept { return iterations_; }
    double last_volatility() const noexcept { return last_volatility_; }

private:
    std::size_t iterations_;
    double last_volatility_;
};

class NotImplemented : public std::logic_error {
public:
    explicit NotImplemented(const std::string& message)
        : std::logic_error(message) {}
};

}
