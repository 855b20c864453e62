#pragma once

#include <stdexcept>
#include <string>

// Malformed rule, workflow or submission. Raised before anything executes.
class DefinitionError : public std::runtime_error {
public:
    explicit DefinitionError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConnectorError : public std::runtime_error {
public:
    ConnectorError(const std::string& message, bool transient)
        : std::runtime_error(message), transient_(transient) {}

    bool transient() const { return transient_; }

private:
    bool transient_;
};

// Timeouts, unreachable devices, overloaded endpoints
class TransientConnectorError : public ConnectorError {
public:
    explicit TransientConnectorError(const std::string& message)
        : ConnectorError(message, true) {}
};

// Authentication failures, malformed paths, protocol violations
class PermanentConnectorError : public ConnectorError {
public:
    explicit PermanentConnectorError(const std::string& message)
        : ConnectorError(message, false) {}
};

// Raised by step handlers; only retryable failures consume retry_count
class StepFailure : public std::runtime_error {
public:
    StepFailure(const std::string& message, bool retryable)
        : std::runtime_error(message), retryable_(retryable) {}

    bool retryable() const { return retryable_; }

private:
    bool retryable_;
};
