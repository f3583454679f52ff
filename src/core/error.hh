#pragma once

#include <stdexcept>
#include <string>

namespace mesh {

// ============================================================================
// Error Types
// ============================================================================

// Invalid configuration; raised by the *Config::validate() helpers at startup
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Time outside the range the epoch clock is defined for (before genesis)
class ClockError : public std::runtime_error {
public:
    explicit ClockError(const std::string& what) : std::runtime_error(what) {}
};

// The replicated store could not be reached. Callers retry on the next tick.
class StoreUnavailable : public std::runtime_error {
public:
    explicit StoreUnavailable(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace mesh
