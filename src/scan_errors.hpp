// ============================================================================
// scan_errors.hpp - Error kinds raised by the spectrum acquisition core
// ============================================================================
#ifndef SCAN_ERRORS_HPP
#define SCAN_ERRORS_HPP

#include <stdexcept>
#include <string>

enum class ErrorKind {
    OutOfRange,      // frequency / rate / size outside hardware capability
    InvalidGain,     // manual gain is not one of the supported steps
    Timeout,         // block read missed its deadline (cycle skipped)
    ConfigMismatch,  // block length does not match the FFT size (block dropped)
    DeviceFailure    // hardware gone or unresponsive (fatal to the loop)
};

std::string error_kind_to_string(ErrorKind kind);

// ============================================================================
// Base class - every error thrown by the core carries its kind
// ============================================================================
class ScanError : public std::runtime_error {
public:
    ScanError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    // Timeouts and mismatches never halt the acquisition loop
    bool recoverable() const {
        return kind_ == ErrorKind::Timeout || kind_ == ErrorKind::ConfigMismatch;
    }

private:
    ErrorKind kind_;
};

class OutOfRangeError : public ScanError {
public:
    explicit OutOfRangeError(const std::string& what)
        : ScanError(ErrorKind::OutOfRange, what) {}
};

class InvalidGainError : public ScanError {
public:
    explicit InvalidGainError(const std::string& what)
        : ScanError(ErrorKind::InvalidGain, what) {}
};

class TimeoutError : public ScanError {
public:
    explicit TimeoutError(const std::string& what)
        : ScanError(ErrorKind::Timeout, what) {}
};

class ConfigMismatchError : public ScanError {
public:
    explicit ConfigMismatchError(const std::string& what)
        : ScanError(ErrorKind::ConfigMismatch, what) {}
};

class DeviceFailureError : public ScanError {
public:
    explicit DeviceFailureError(const std::string& what)
        : ScanError(ErrorKind::DeviceFailure, what) {}
};

#endif // SCAN_ERRORS_HPP
