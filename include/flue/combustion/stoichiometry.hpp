#pragma once
#include "species.hpp"

namespace flue::combustion {

// Moles consumed or produced per mole of fuel species burned to completion
struct ReactionCoefficient {
  double o2_consumed = 0.0;
  double co2_produced = 0.0;
  double h2o_produced = 0.0;
  double so2_produced = 0.0;
};

// Complete-combustion stoichiometry. Non-combustible species burn to nothing.
[[nodiscard]] constexpr auto reaction_coefficients(Species species) noexcept -> ReactionCoefficient {
  switch (species) {
  case Species::CH4: // CH4 + 2 O2 -> CO2 + 2 H2O
    return {2.0, 1.0, 2.0, 0.0};
  case Species::C2H6: // C2H6 + 3.5 O2 -> 2 CO2 + 3 H2O
    return {3.5, 2.0, 3.0, 0.0};
  case Species::C3H8: // C3H8 + 5 O2 -> 3 CO2 + 4 H2O
    return {5.0, 3.0, 4.0, 0.0};
  case Species::C6H6: // C6H6 + 7.5 O2 -> 6 CO2 + 3 H2O
    return {7.5, 6.0, 3.0, 0.0};
  case Species::H2S: // H2S + 1.5 O2 -> SO2 + H2O
    return {1.5, 0.0, 1.0, 1.0};
  case Species::He:
  case Species::N2:
  case Species::H2O:
  case Species::O2:
  case Species::CO2:
  case Species::SO2:
    return {};
  }
  return {};
}

[[nodiscard]] constexpr auto is_combustible(Species species) noexcept -> bool {
  return reaction_coefficients(species).o2_consumed > 0.0;
}

} // namespace flue::combustion
