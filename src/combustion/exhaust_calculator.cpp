#include "flue/combustion/exhaust_calculator.hpp"
#include "flue/combustion/exhaust_composer.hpp"
#include "flue/combustion/molar_flow.hpp"
#include "flue/core/expected_utils.hpp"
#include <cmath>
#include <format>

namespace flue::combustion {

namespace {

auto validate_inputs(double fuel_mass_flow, double target_o2_fraction) -> std::expected<void, CombustionError> {
  if (!std::isfinite(fuel_mass_flow) || fuel_mass_flow <= 0.0) {
    return std::unexpected(
        InvalidFlowError(std::format("fuel mass flow must be positive, got {} kg/s", fuel_mass_flow)));
  }
  if (!std::isfinite(target_o2_fraction) || target_o2_fraction <= 0.0 || target_o2_fraction >= 1.0) {
    return std::unexpected(InvalidFlowError(
        std::format("target O2 fraction must lie in (0, 1), got {} (pass a fraction, not a percentage)",
                    target_o2_fraction)));
  }
  return {};
}

} // namespace

auto ExhaustCalculator::compute(double fuel_mass_flow, const FuelComposition& composition,
                                double target_o2_fraction) const -> std::expected<ExhaustResult, CombustionError> {
  FLUE_TRY_VOID(validate_inputs(fuel_mass_flow, target_o2_fraction));

  double molar_flow = 0.0;
  FLUE_TRY_ASSIGN(molar_flow, fuel_molar_flow(fuel_mass_flow, composition));

  AirRequirement requirement;
  FLUE_TRY_ASSIGN(requirement, solver_.solve(molar_flow, composition, target_o2_fraction));

  auto result = compose_exhaust(molar_flow, composition, requirement.air_molar_flow);
  result.solver_iterations = requirement.iterations;
  result.target_clamped = requirement.clamped;

  return result;
}

auto compute_exhaust(double fuel_mass_flow, const FuelComposition& composition, double target_o2_fraction,
                     const AirSolverConfig& config) -> std::expected<ExhaustResult, CombustionError> {
  return ExhaustCalculator(config).compute(fuel_mass_flow, composition, target_o2_fraction);
}

auto compute_exhaust(double fuel_mass_flow, const std::map<std::string, double>& composition,
                     double target_o2_fraction, const AirSolverConfig& config)
    -> std::expected<ExhaustResult, CombustionError> {
  FLUE_TRY_VOID(validate_inputs(fuel_mass_flow, target_o2_fraction));

  FuelComposition fuel;
  FLUE_TRY_ASSIGN(fuel, FuelComposition::from_named(composition));

  return compute_exhaust(fuel_mass_flow, fuel, target_o2_fraction, config);
}

} // namespace flue::combustion
