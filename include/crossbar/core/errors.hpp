#pragma once
#include <stdexcept>
#include <string>

namespace crossbar::core {

// Missing or invalid configuration. Raised before any simulation starts.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("configuration error: " + message) {}
};

// Malformed, missing or insufficient market data for one unit of work.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& message)
        : std::runtime_error("data error: " + message) {}
};

} // namespace crossbar::core
