// File: src/core/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace profitlift {

/// Invalid weights or thresholds. Fatal at startup, never clamped.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument("Configuration error: " + message) {}
};

/// Not enough data to mine a context or estimate a rule's uplift.
///
/// Recoverable: the pipeline skips the context (or marks the rule
/// insufficient_data) and logs the rejected identity.
class DataInsufficientError : public std::runtime_error {
public:
    DataInsufficientError(const std::string& identity, const std::string& reason)
        : std::runtime_error("Insufficient data for " + identity + ": " + reason),
          identity_(identity) {}

    /// Context label or rule signature that was rejected
    const std::string& identity() const { return identity_; }

private:
    std::string identity_;
};

/// Rule or uplift storage failed. Surfaces to the pipeline caller as a run
/// failure distinct from data-quality skips.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message)
        : std::runtime_error("Persistence error: " + message) {}
};

} // namespace profitlift
