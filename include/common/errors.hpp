#pragma once
#include <stdexcept>
#include <string>

// Bad construction-time input: decimals mismatch, malformed address, factor out of range.
// The instance (or configuration) must be rebuilt with corrected inputs.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// An unsigned upstream value does not fit in int256.
class InvalidMagnitudeError : public std::runtime_error {
public:
  explicit InvalidMagnitudeError(const std::string& what) : std::runtime_error(what) {}
};
