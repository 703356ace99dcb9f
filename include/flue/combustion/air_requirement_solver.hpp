#pragma once
#include "combustion_errors.hpp"
#include "combustion_types.hpp"
#include "fuel_composition.hpp"
#include <expected>

namespace flue::combustion {

// Finds the O2 supply whose residual O2 mole fraction in the exhaust equals
// the target, by bisection between the theoretical demand and a multiple of it.
class AirRequirementSolver {
private:
  const AirSolverConfig config_;

  struct Bracket {
    double low;
    double high;
    int expansions = 0;
    bool clamped = false;
  };

  [[nodiscard]] auto residual_fraction(double fuel_molar_flow, const FuelComposition& composition,
                                       double o2_supply) const noexcept -> double;

  [[nodiscard]] auto establish_bracket(double fuel_molar_flow, const FuelComposition& composition,
                                       double theoretical_o2,
                                       double target) const -> std::expected<Bracket, CombustionError>;

  [[nodiscard]] auto bisect(double fuel_molar_flow, const FuelComposition& composition, Bracket bracket,
                            double target, int& iterations) const -> std::expected<double, CombustionError>;

public:
  explicit AirRequirementSolver(const AirSolverConfig& config = {}) : config_(config) {}

  [[nodiscard]] auto solve(double fuel_molar_flow, const FuelComposition& composition,
                           double target_o2_fraction) const -> std::expected<AirRequirement, CombustionError>;

  [[nodiscard]] auto config() const noexcept -> const AirSolverConfig& { return config_; }
};

} // namespace flue::combustion
