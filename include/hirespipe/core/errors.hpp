#pragma once

#include <stdexcept>
#include <string>

namespace hirespipe {

class HiresPipeError : public std::runtime_error {
public:
    explicit HiresPipeError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public HiresPipeError {
public:
    explicit ConfigError(const std::string& message)
        : HiresPipeError("Config error: " + message) {}
};

class ValidationError : public HiresPipeError {
public:
    explicit ValidationError(const std::string& message)
        : HiresPipeError("Validation error: " + message) {}
};

class IOError : public HiresPipeError {
public:
    explicit IOError(const std::string& message)
        : HiresPipeError("I/O error: " + message) {}
};

// Per-file, permanent: an adapter may throw this instead of returning
// ErrorKind::InvalidInput.
class InvalidInput : public HiresPipeError {
public:
    explicit InvalidInput(const std::string& message)
        : HiresPipeError("Invalid input: " + message) {}
};

// Per-file, permanent: write or publish at the destination failed.
class DeliveryFailure : public IOError {
public:
    explicit DeliveryFailure(const std::string& message)
        : IOError("Delivery failure: " + message) {}
};

// Process-wide, fatal: the durability guarantee is broken.
class LedgerWriteFailure : public IOError {
public:
    explicit LedgerWriteFailure(const std::string& message)
        : IOError("Ledger write failure: " + message) {}
};

// Process-wide: source, destination or ledger unusable at startup.
class StartupError : public HiresPipeError {
public:
    explicit StartupError(const std::string& message)
        : HiresPipeError("Startup failed: " + message) {}
};

class StopRequested : public HiresPipeError {
public:
    StopRequested() : HiresPipeError("Stop requested") {}
};

} // namespace hirespipe
