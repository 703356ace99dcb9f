#include "flue/io/fuel_presets.hpp"
#include "flue/combustion/species.hpp"
#include "flue/core/constants.hpp"
#include <cmath>
#include <format>
#include <iostream>

namespace flue::io {

auto find_preset(std::string_view name) -> std::expected<std::map<std::string, double>, core::ConfigurationError> {
  auto it = fuel_presets.find(std::string(name));
  if (it == fuel_presets.end()) {
    std::string valid_options;
    for (const auto& [option, _] : fuel_presets) {
      valid_options += option + ", ";
    }
    valid_options = valid_options.substr(0, valid_options.length() - 2);
    return std::unexpected(
        core::ConfigurationError(std::format("Unknown fuel preset '{}'. Valid options: {}", name, valid_options)));
  }
  return it->second;
}

auto build_composition(const std::map<std::string, double>& raw, FuelConfig::Units units, bool normalize)
    -> std::expected<combustion::FuelComposition, core::ConfigurationError> {

  if (raw.empty()) {
    return std::unexpected(core::ValidationError("fuel.composition", "composition is empty"));
  }

  const double scale = (units == FuelConfig::Units::Percent) ? 1.0 / constants::conversion::to_percentage : 1.0;

  std::map<std::string, double> fractions;
  for (const auto& [name, value] : raw) {
    if (!std::isfinite(value) || value < 0.0) {
      return std::unexpected(
          core::ValidationError("fuel.composition", std::format("fraction of {} must be non-negative, got {}", name, value)));
    }
    fractions[name] = value * scale;
  }

  auto composition_result = combustion::FuelComposition::from_named(fractions);
  if (!composition_result) {
    std::string valid_species;
    for (auto species : combustion::all_species) {
      valid_species += std::string(combustion::species_name(species)) + ", ";
    }
    valid_species = valid_species.substr(0, valid_species.length() - 2);
    return std::unexpected(core::ConfigurationError(
        std::format("{}. Valid species: {}", composition_result.error().message(), valid_species)));
  }
  auto composition = composition_result.value();

  const double total = composition.sum();
  if (total <= 0.0) {
    return std::unexpected(core::ValidationError("fuel.composition", "all fractions are zero"));
  }

  if (std::abs(total - 1.0) > constants::tolerance::composition_sum) {
    if (!normalize) {
      return std::unexpected(core::ValidationError(
          "fuel.composition",
          std::format("fractions must total 100% (currently {:.4f}%)", total * constants::conversion::to_percentage)));
    }
    std::cout << std::format("INFO: Normalizing fuel composition (sum was {:.4f}%)",
                             total * constants::conversion::to_percentage)
              << std::endl;
    for (auto species : combustion::all_species) {
      composition.set_fraction(species, composition.fraction(species) / total);
    }
  }

  return composition;
}

} // namespace flue::io
