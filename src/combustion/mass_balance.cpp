#include "flue/combustion/mass_balance.hpp"
#include "flue/combustion/stoichiometry.hpp"
#include "flue/core/constants.hpp"

namespace flue::combustion {

auto theoretical_o2_demand(double fuel_molar_flow, const FuelComposition& composition) noexcept -> double {
  double demand = 0.0;
  for (auto species : all_species) {
    demand += fuel_molar_flow * composition.fraction(species) * reaction_coefficients(species).o2_consumed;
  }
  return demand;
}

auto exhaust_molar_flows(double fuel_molar_flow, const FuelComposition& composition,
                         double o2_supply) noexcept -> SpeciesVector {
  SpeciesVector flows = SpeciesVector::Zero();

  for (auto species : all_species) {
    const double n_fuel = fuel_molar_flow * composition.fraction(species);
    if (n_fuel == 0.0) {
      continue;
    }

    if (!is_combustible(species)) {
      flows[index_of(species)] += n_fuel;
      continue;
    }

    const auto coeff = reaction_coefficients(species);
    flows[index_of(Species::CO2)] += n_fuel * coeff.co2_produced;
    flows[index_of(Species::H2O)] += n_fuel * coeff.h2o_produced;
    flows[index_of(Species::SO2)] += n_fuel * coeff.so2_produced;
  }

  flows[index_of(Species::N2)] +=
      o2_supply / constants::air::o2_mole_fraction * constants::air::n2_mole_fraction;
  flows[index_of(Species::O2)] += o2_supply - theoretical_o2_demand(fuel_molar_flow, composition);

  return flows;
}

auto evaluate_mass_balance(double fuel_molar_flow, const FuelComposition& composition,
                           double o2_supply) noexcept -> CombustionState {
  const auto flows = exhaust_molar_flows(fuel_molar_flow, composition, o2_supply);
  return CombustionState{
      .o2_supply = o2_supply,
      .total_exhaust = flows.sum(),
      .residual_o2 = flows[index_of(Species::O2)],
  };
}

} // namespace flue::combustion
