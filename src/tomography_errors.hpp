#pragma once

#include <stdexcept>
#include <string>

// Angle sequences, states, basis settings or matrices whose sizes do not
// agree with the qubit count they are used with.
class DimensionMismatch : public std::invalid_argument {
  public:
    explicit DimensionMismatch(const std::string& what)
        : std::invalid_argument(what) {}
};

// Raised when every optimization attempt of a multi-start estimate failed.
class ConvergenceFailure : public std::runtime_error {
  public:
    explicit ConvergenceFailure(const std::string& what)
        : std::runtime_error(what) {}
};

// Log category for probabilities that needed clamping. Never raised.
inline constexpr const char* kNumericalInstabilityCategory = "NumericalInstability";
