#ifndef ROUNDWATCH_COMMON_ERRORS_H_
#define ROUNDWATCH_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace Roundwatch {

class RoundwatchError : public std::runtime_error {
public:
    explicit RoundwatchError(const std::string& what) : std::runtime_error(what) {}
};

/// Invalid or inconsistent configuration. Fatal at startup.
class ConfigError : public RoundwatchError {
public:
    explicit ConfigError(const std::string& what) : RoundwatchError(what) {}
};

/// Phase model artifact missing or malformed. Fatal at startup.
class ModelLoadError : public RoundwatchError {
public:
    explicit ModelLoadError(const std::string& what) : RoundwatchError(what) {}
};

/// Screen sampling or text parsing failed. Transient; the poll is retried.
class ReadError : public RoundwatchError {
public:
    explicit ReadError(const std::string& what) : RoundwatchError(what) {}
};

/// Input device failed or an action was interrupted.
class ActuatorError : public RoundwatchError {
public:
    explicit ActuatorError(const std::string& what) : RoundwatchError(what) {}
};

/// Durable store rejected a write or a transaction.
class PersistenceError : public RoundwatchError {
public:
    explicit PersistenceError(const std::string& what) : RoundwatchError(what) {}
};

} // namespace Roundwatch

#endif // ROUNDWATCH_COMMON_ERRORS_H_
