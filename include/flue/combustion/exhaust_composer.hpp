#pragma once
#include "combustion_types.hpp"
#include "fuel_composition.hpp"

namespace flue::combustion {

/**
 * @brief Final exhaust flows and composition at a converged air rate
 *
 * Evaluates the mass balance once at O2 supply = air_molar_flow * 0.21 and
 * converts each exhaust species to mole percent and mass flow. Only the
 * solver fields of the result (iterations, clamping) are left for the caller.
 *
 * @param fuel_molar_flow Fuel molar flow [kmol/s]
 * @param composition Fuel mole fractions
 * @param air_molar_flow Combustion air molar flow [kmol/s]
 */
[[nodiscard]] auto compose_exhaust(double fuel_molar_flow, const FuelComposition& composition,
                                   double air_molar_flow) -> ExhaustResult;

} // namespace flue::combustion
