#pragma once

#include <stdexcept>
#include <string>

namespace void_cmb {

class VoidCmbError : public std::runtime_error {
public:
    explicit VoidCmbError(const std::string& message)
        : std::runtime_error(message) {}

    // Stable name used for failure entries in the output artifact.
    virtual const char* kind() const noexcept { return "VoidCmbError"; }
};

class ConfigError : public VoidCmbError {
public:
    explicit ConfigError(const std::string& message)
        : VoidCmbError("Config error: " + message) {}
    const char* kind() const noexcept override { return "ConfigError"; }
};

class ValidationError : public VoidCmbError {
public:
    explicit ValidationError(const std::string& message)
        : VoidCmbError("Validation error: " + message) {}
    const char* kind() const noexcept override { return "ValidationError"; }
};

class IOError : public VoidCmbError {
public:
    explicit IOError(const std::string& message)
        : VoidCmbError("I/O error: " + message) {}
    const char* kind() const noexcept override { return "IOError"; }
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
    const char* kind() const noexcept override { return "FitsError"; }
};

// Coordinate outside its valid range, or non-finite.
class InvalidDirection : public VoidCmbError {
public:
    explicit InvalidDirection(const std::string& message)
        : VoidCmbError("Invalid direction: " + message) {}
    const char* kind() const noexcept override { return "InvalidDirection"; }
};

// Map has no pixel data at its resolution.
class MapUninitialized : public VoidCmbError {
public:
    explicit MapUninitialized(const std::string& message)
        : VoidCmbError("Map uninitialized: " + message) {}
    const char* kind() const noexcept override { return "MapUninitialized"; }
};

// Core or rim region holds fewer usable pixels than required.
class InsufficientPixels : public VoidCmbError {
public:
    explicit InsufficientPixels(const std::string& message)
        : VoidCmbError("Insufficient pixels: " + message) {}
    const char* kind() const noexcept override { return "InsufficientPixels"; }
};

class MaskedRegionExhausted : public VoidCmbError {
public:
    explicit MaskedRegionExhausted(const std::string& message)
        : VoidCmbError("Masked region exhausted: " + message) {}
    const char* kind() const noexcept override { return "MaskedRegionExhausted"; }
};

// Closed-form model evaluated outside its domain.
class DomainError : public VoidCmbError {
public:
    explicit DomainError(const std::string& message)
        : VoidCmbError("Domain error: " + message) {}
    const char* kind() const noexcept override { return "DomainError"; }
};

} // namespace void_cmb
