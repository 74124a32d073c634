#ifndef RETIRECALC_ERRORS_HPP
#define RETIRECALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace retirecalc {

// Base class for all errors raised by the calculation core
class CalcError : public std::runtime_error {
public:
    explicit CalcError(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed or out-of-range input, detected before any simulation starts
class ValidationError : public CalcError {
public:
    ValidationError(const std::string& field, const std::string& message)
        : CalcError("Validation failed: " + message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// Unexpected failure while a run is in progress
class ComputationError : public CalcError {
public:
    explicit ComputationError(const std::string& message)
        : CalcError("Computation failed: " + message) {}
};

// Raised only for requests with a deadline that elapsed before completion
class TimeoutError : public CalcError {
public:
    explicit TimeoutError(const std::string& message)
        : CalcError("Timeout: " + message) {}
};

// Work was discarded because the caller lost interest in it
class CancelledError : public CalcError {
public:
    explicit CancelledError(const std::string& message)
        : CalcError("Cancelled: " + message) {}
};

} // namespace retirecalc

#endif // RETIRECALC_ERRORS_HPP
