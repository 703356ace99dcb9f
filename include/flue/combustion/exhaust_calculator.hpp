#pragma once
#include "air_requirement_solver.hpp"
#include "combustion_errors.hpp"
#include "combustion_types.hpp"
#include "fuel_composition.hpp"
#include <expected>
#include <map>
#include <string>

namespace flue::combustion {

// Molar flow conversion -> air requirement -> exhaust composition
class ExhaustCalculator {
private:
  AirRequirementSolver solver_;

public:
  explicit ExhaustCalculator(const AirSolverConfig& config = {}) : solver_(config) {}

  [[nodiscard]] auto compute(double fuel_mass_flow, const FuelComposition& composition,
                             double target_o2_fraction) const -> std::expected<ExhaustResult, CombustionError>;

  [[nodiscard]] auto solver() const noexcept -> const AirRequirementSolver& { return solver_; }
};

/**
 * @brief Exhaust composition and flows for a fuel burned to a residual O2 target
 *
 * @param fuel_mass_flow Fuel mass flow [kg/s], must be positive
 * @param composition Fuel mole fractions, expected to sum to one
 * @param target_o2_fraction Residual O2 mole fraction in the exhaust, in (0, 1)
 * @return Result or the first error: InvalidFlow, UnknownSpecies,
 *         DegenerateComposition, UnreachableTarget or ConvergenceFailure
 */
[[nodiscard]] auto compute_exhaust(double fuel_mass_flow, const FuelComposition& composition,
                                   double target_o2_fraction, const AirSolverConfig& config = {})
    -> std::expected<ExhaustResult, CombustionError>;

[[nodiscard]] auto compute_exhaust(double fuel_mass_flow, const std::map<std::string, double>& composition,
                                   double target_o2_fraction, const AirSolverConfig& config = {})
    -> std::expected<ExhaustResult, CombustionError>;

} // namespace flue::combustion
