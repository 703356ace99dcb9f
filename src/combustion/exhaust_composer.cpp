#include "flue/combustion/exhaust_composer.hpp"
#include "flue/combustion/mass_balance.hpp"
#include "flue/core/constants.hpp"

namespace flue::combustion {

auto compose_exhaust(double fuel_molar_flow, const FuelComposition& composition,
                     double air_molar_flow) -> ExhaustResult {
  ExhaustResult result;
  result.fuel_molar_flow = fuel_molar_flow;
  result.air_molar_flow = air_molar_flow;
  result.o2_supply = air_molar_flow * constants::air::o2_mole_fraction;
  result.theoretical_o2 = theoretical_o2_demand(fuel_molar_flow, composition);

  const SpeciesVector molar = exhaust_molar_flows(fuel_molar_flow, composition, result.o2_supply);
  const SpeciesVector mass = molar.cwiseProduct(molecular_weights());

  result.total_molar_flow = molar.sum();

  for (auto species : exhaust_species) {
    const auto i = index_of(species);
    result.molar_flows[species] = molar[i];
    result.mass_flows[species] = mass[i];
    result.composition[species] = molar[i] / result.total_molar_flow * constants::conversion::to_percentage;
  }

  result.total_mass_flow = mass.sum();
  result.air_mass_flow = air_molar_flow * air_molecular_weight();

  return result;
}

} // namespace flue::combustion
