#pragma once
#include "../combustion/fuel_composition.hpp"
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

namespace flue::io {

// Built-in fuel compositions in mole percent. "default" is a nitrogen-rich
// natural gas with traces of heavier hydrocarbons and H2S.
inline const std::unordered_map<std::string, std::map<std::string, double>> fuel_presets = {
    {"default",
     {{"CH4", 58.57},
      {"C2H6", 0.08},
      {"C3H8", 0.01},
      {"C6H6", 0.0023},
      {"He", 0.15},
      {"N2", 36.90},
      {"H2O", 0.45},
      {"H2S", 0.0004},
      {"CO2", 3.8}}},
    {"methane", {{"CH4", 100.0}}}};

[[nodiscard]] auto find_preset(std::string_view name)
    -> std::expected<std::map<std::string, double>, core::ConfigurationError>;

/**
 * @brief Turn a named composition into validated mole fractions
 *
 * Percent input is divided by 100. With normalization enabled a sum away from
 * one is rescaled; otherwise it is rejected.
 */
[[nodiscard]] auto build_composition(const std::map<std::string, double>& raw, FuelConfig::Units units,
                                     bool normalize)
    -> std::expected<combustion::FuelComposition, core::ConfigurationError>;

} // namespace flue::io
