#pragma once

#include <stdexcept>
#include <string>

// Malformed transaction or request input, rejected before any write.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// A SELL exceeds the position held at that point in the ledger.
class InsufficientHoldingsError : public std::runtime_error {
public:
    InsufficientHoldingsError(const std::string& symbol, const std::string& held,
                              const std::string& requested)
        : std::runtime_error("Insufficient holdings for " + symbol + ": held " + held +
                             ", sell " + requested)
        , symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

class PriceUnavailableError : public std::runtime_error {
public:
    explicit PriceUnavailableError(const std::string& symbol)
        : std::runtime_error("No price available for " + symbol)
        , symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

// The ledger changed while a recomputation was running.
class RecomputationConflictError : public std::runtime_error {
public:
    explicit RecomputationConflictError(const std::string& msg) : std::runtime_error(msg) {}
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};
