#pragma once
#include "combustion_types.hpp"
#include "fuel_composition.hpp"

namespace flue::combustion {

/**
 * @brief O2 needed to burn every combustible species completely [kmol/s]
 */
[[nodiscard]] auto theoretical_o2_demand(double fuel_molar_flow, const FuelComposition& composition) noexcept
    -> double;

/**
 * @brief Per-species exhaust molar flows for a given O2 supply [kmol/s]
 *
 * Combustible species are converted with the stoichiometry table; every other
 * fuel species passes through unchanged. Air nitrogen follows the O2 supply at
 * the dry-air N2/O2 ratio. The O2 entry is the residual and is negative when
 * the supply is below the theoretical demand.
 *
 * @param fuel_molar_flow Fuel molar flow [kmol/s]
 * @param composition Fuel mole fractions
 * @param o2_supply O2 supplied with the combustion air [kmol/s]
 */
[[nodiscard]] auto exhaust_molar_flows(double fuel_molar_flow, const FuelComposition& composition,
                                       double o2_supply) noexcept -> SpeciesVector;

/**
 * @brief Total exhaust and residual O2 molar flows for a trial O2 supply
 */
[[nodiscard]] auto evaluate_mass_balance(double fuel_molar_flow, const FuelComposition& composition,
                                         double o2_supply) noexcept -> CombustionState;

} // namespace flue::combustion
