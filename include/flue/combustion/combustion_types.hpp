#pragma once
#include "../core/constants.hpp"
#include "species.hpp"
#include <map>
#include <string_view>

namespace flue::combustion {

// What the air solver does when the target O2 fraction lies outside the
// search bracket
enum class UnreachableTargetPolicy { Fail, Clamp, Expand };

[[nodiscard]] constexpr auto to_string(UnreachableTargetPolicy policy) noexcept -> std::string_view {
  switch (policy) {
  case UnreachableTargetPolicy::Fail:
    return "fail";
  case UnreachableTargetPolicy::Clamp:
    return "clamp";
  case UnreachableTargetPolicy::Expand:
    return "expand";
  }
  return "unknown";
}

struct AirSolverConfig {
  double tolerance = constants::tolerance::bisection; // absolute cap on the final width [kmol/s]
  double relative_tolerance = constants::tolerance::bisection_relative;
  double bracket_factor = constants::solver::bracket_factor;
  int max_iterations = constants::solver::max_iterations;
  UnreachableTargetPolicy unreachable_target_policy = UnreachableTargetPolicy::Fail;
  int max_bracket_expansions = constants::solver::max_bracket_expansions;
};

// Exhaust balance at one trial O2 supply [kmol/s]
struct CombustionState {
  double o2_supply = 0.0;
  double total_exhaust = 0.0;
  double residual_o2 = 0.0;

  [[nodiscard]] auto residual_o2_fraction() const noexcept -> double { return residual_o2 / total_exhaust; }
};

struct AirRequirement {
  double theoretical_o2 = 0.0; // [kmol/s]
  double o2_supply = 0.0;      // [kmol/s]
  double air_molar_flow = 0.0; // [kmol/s]
  int iterations = 0;
  int bracket_expansions = 0;
  bool clamped = false; // converged onto a bracket bound without reaching the target
};

struct ExhaustResult {
  std::map<Species, double> composition; // mole percent
  std::map<Species, double> mass_flows;  // [kg/s]
  std::map<Species, double> molar_flows; // [kmol/s]
  double total_mass_flow = 0.0;          // [kg/s]
  double air_mass_flow = 0.0;            // [kg/s]

  double total_molar_flow = 0.0; // [kmol/s]
  double fuel_molar_flow = 0.0;  // [kmol/s]
  double air_molar_flow = 0.0;   // [kmol/s]
  double o2_supply = 0.0;        // [kmol/s]
  double theoretical_o2 = 0.0;   // [kmol/s]
  int solver_iterations = 0;
  bool target_clamped = false;
};

} // namespace flue::combustion
