#pragma once
#include "../core/exceptions.hpp"
#include <source_location>
#include <string_view>

namespace flue::combustion {

enum class CombustionErrorKind { UnknownSpecies, InvalidFlow, UnreachableTarget, DegenerateComposition, ConvergenceFailure };

[[nodiscard]] constexpr auto to_string(CombustionErrorKind kind) noexcept -> std::string_view {
  switch (kind) {
  case CombustionErrorKind::UnknownSpecies:
    return "UnknownSpecies";
  case CombustionErrorKind::InvalidFlow:
    return "InvalidFlow";
  case CombustionErrorKind::UnreachableTarget:
    return "UnreachableTarget";
  case CombustionErrorKind::DegenerateComposition:
    return "DegenerateComposition";
  case CombustionErrorKind::ConvergenceFailure:
    return "ConvergenceFailure";
  }
  return "Unknown";
}

// Errors are returned by value inside std::expected, so the subclass is sliced
// away; kind() is what callers dispatch on.
class CombustionError : public core::FlueException {
private:
  CombustionErrorKind kind_;

public:
  CombustionError(CombustionErrorKind kind, std::string_view message,
                  std::source_location location = std::source_location::current())
      : FlueException(std::format("Combustion Error: {}", message), location), kind_(kind) {}

  [[nodiscard]] auto kind() const noexcept -> CombustionErrorKind { return kind_; }
};

class UnknownSpeciesError : public CombustionError {
public:
  explicit UnknownSpeciesError(std::string_view species_name,
                               std::source_location location = std::source_location::current())
      : CombustionError(CombustionErrorKind::UnknownSpecies,
                        std::format("Unknown species '{}' in composition", species_name), location) {}
};

class InvalidFlowError : public CombustionError {
public:
  explicit InvalidFlowError(std::string_view message, std::source_location location = std::source_location::current())
      : CombustionError(CombustionErrorKind::InvalidFlow, std::format("Invalid input: {}", message), location) {}
};

class UnreachableTargetError : public CombustionError {
public:
  explicit UnreachableTargetError(std::string_view message,
                                  std::source_location location = std::source_location::current())
      : CombustionError(CombustionErrorKind::UnreachableTarget, std::format("Unreachable target: {}", message),
                        location) {}
};

class DegenerateCompositionError : public CombustionError {
public:
  explicit DegenerateCompositionError(std::string_view message,
                                      std::source_location location = std::source_location::current())
      : CombustionError(CombustionErrorKind::DegenerateComposition,
                        std::format("Degenerate composition: {}", message), location) {}
};

class ConvergenceError : public CombustionError {
public:
  explicit ConvergenceError(std::string_view message, std::source_location location = std::source_location::current())
      : CombustionError(CombustionErrorKind::ConvergenceFailure, std::format("Convergence Error: {}", message),
                        location) {}
};

} // namespace flue::combustion
