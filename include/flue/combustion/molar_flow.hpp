#pragma once
#include "combustion_errors.hpp"
#include "fuel_composition.hpp"
#include <expected>
#include <map>
#include <string>

namespace flue::combustion {

// Mole-fraction weighted molecular weight [kg/kmol]
[[nodiscard]] auto average_molecular_weight(const FuelComposition& composition) noexcept -> double;

// Fuel molar flow [kmol/s] from mass flow [kg/s]
[[nodiscard]] auto fuel_molar_flow(double mass_flow, const FuelComposition& composition)
    -> std::expected<double, CombustionError>;

[[nodiscard]] auto fuel_molar_flow(double mass_flow, const std::map<std::string, double>& composition)
    -> std::expected<double, CombustionError>;

} // namespace flue::combustion
