#include "flue/combustion/molar_flow.hpp"
#include "flue/core/expected_utils.hpp"
#include <cmath>
#include <format>

namespace flue::combustion {

auto average_molecular_weight(const FuelComposition& composition) noexcept -> double {
  return composition.fractions().dot(molecular_weights());
}

auto fuel_molar_flow(double mass_flow, const FuelComposition& composition) -> std::expected<double, CombustionError> {
  if (!std::isfinite(mass_flow) || mass_flow <= 0.0) {
    return std::unexpected(InvalidFlowError(std::format("fuel mass flow must be positive, got {} kg/s", mass_flow)));
  }

  const double mw = average_molecular_weight(composition);
  if (!std::isfinite(mw) || mw <= 0.0) {
    return std::unexpected(
        InvalidFlowError(std::format("average molecular weight of the fuel is {} kg/kmol (empty composition?)", mw)));
  }

  return mass_flow / mw;
}

auto fuel_molar_flow(double mass_flow, const std::map<std::string, double>& composition)
    -> std::expected<double, CombustionError> {
  FuelComposition fuel;
  FLUE_TRY_ASSIGN(fuel, FuelComposition::from_named(composition));
  return fuel_molar_flow(mass_flow, fuel);
}

} // namespace flue::combustion
