#include "flue/combustion/air_requirement_solver.hpp"
#include "flue/combustion/mass_balance.hpp"
#include "flue/core/constants.hpp"
#include "flue/core/expected_utils.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace flue::combustion {

auto AirRequirementSolver::residual_fraction(double fuel_molar_flow, const FuelComposition& composition,
                                             double o2_supply) const noexcept -> double {
  return evaluate_mass_balance(fuel_molar_flow, composition, o2_supply).residual_o2_fraction();
}

auto AirRequirementSolver::establish_bracket(double fuel_molar_flow, const FuelComposition& composition,
                                             double theoretical_o2, double target) const
    -> std::expected<Bracket, CombustionError> {

  Bracket bracket{.low = theoretical_o2, .high = theoretical_o2 * config_.bracket_factor};
  const auto policy = config_.unreachable_target_policy;

  // Only fuel-borne O2 can put the fraction above target at stoichiometric supply
  const double fraction_low = residual_fraction(fuel_molar_flow, composition, bracket.low);
  if (fraction_low > target) {
    if (policy != UnreachableTargetPolicy::Clamp) {
      return std::unexpected(UnreachableTargetError(
          std::format("target O2 fraction {} is below the {:.6f} already present at stoichiometric supply", target,
                      fraction_low)));
    }
    bracket.clamped = true;
    return bracket;
  }

  double fraction_high = residual_fraction(fuel_molar_flow, composition, bracket.high);
  if (fraction_high >= target) {
    return bracket;
  }

  switch (policy) {
  case UnreachableTargetPolicy::Clamp:
    bracket.clamped = true;
    return bracket;

  case UnreachableTargetPolicy::Expand:
    while (fraction_high < target && bracket.expansions < config_.max_bracket_expansions) {
      bracket.low = bracket.high;
      bracket.high *= 2.0;
      ++bracket.expansions;
      fraction_high = residual_fraction(fuel_molar_flow, composition, bracket.high);
    }
    if (fraction_high >= target) {
      return bracket;
    }
    return std::unexpected(UnreachableTargetError(
        std::format("target O2 fraction {} not reached after {} bracket expansions (fraction {:.6f} at {:.6g} kmol/s)",
                    target, bracket.expansions, fraction_high, bracket.high)));

  case UnreachableTargetPolicy::Fail:
    break;
  }

  return std::unexpected(UnreachableTargetError(
      std::format("target O2 fraction {} exceeds the {:.6f} reached with {}x the theoretical O2", target,
                  fraction_high, config_.bracket_factor)));
}

auto AirRequirementSolver::bisect(double fuel_molar_flow, const FuelComposition& composition, Bracket bracket,
                                  double target, int& iterations) const -> std::expected<double, CombustionError> {
  double low = bracket.low;
  double high = bracket.high;
  iterations = 0;

  // Small fuel flows give brackets only a few absolute tolerances wide
  const double width = std::min(config_.tolerance, config_.relative_tolerance * bracket.low);

  while ((high - low) > width) {
    if (iterations >= config_.max_iterations) {
      return std::unexpected(ConvergenceError(std::format(
          "bisection did not reach width {} within {} iterations (bracket [{}, {}])", width,
          config_.max_iterations, low, high)));
    }
    ++iterations;

    const double mid = 0.5 * (low + high);
    // Bracket already at machine resolution
    if (mid <= low || mid >= high) {
      break;
    }

    if (residual_fraction(fuel_molar_flow, composition, mid) < target) {
      low = mid;
    } else {
      high = mid;
    }
  }

  return high;
}

auto AirRequirementSolver::solve(double fuel_molar_flow, const FuelComposition& composition,
                                 double target_o2_fraction) const -> std::expected<AirRequirement, CombustionError> {

  if (!std::isfinite(fuel_molar_flow) || fuel_molar_flow <= 0.0) {
    return std::unexpected(
        InvalidFlowError(std::format("fuel molar flow must be positive, got {} kmol/s", fuel_molar_flow)));
  }
  if (!std::isfinite(target_o2_fraction) || target_o2_fraction <= 0.0 || target_o2_fraction >= 1.0) {
    return std::unexpected(InvalidFlowError(
        std::format("target O2 fraction must lie in (0, 1), got {}", target_o2_fraction)));
  }

  AirRequirement requirement;
  requirement.theoretical_o2 = theoretical_o2_demand(fuel_molar_flow, composition);

  if (!(requirement.theoretical_o2 > 0.0)) {
    return std::unexpected(
        DegenerateCompositionError("fuel contains no combustible species, theoretical O2 demand is zero"));
  }

  Bracket bracket{};
  FLUE_TRY_ASSIGN(bracket,
                  establish_bracket(fuel_molar_flow, composition, requirement.theoretical_o2, target_o2_fraction));

  FLUE_TRY_ASSIGN(requirement.o2_supply,
                  bisect(fuel_molar_flow, composition, bracket, target_o2_fraction, requirement.iterations));

  requirement.air_molar_flow = requirement.o2_supply / constants::air::o2_mole_fraction;
  requirement.bracket_expansions = bracket.expansions;
  requirement.clamped = bracket.clamped;

  return requirement;
}

} // namespace flue::combustion
