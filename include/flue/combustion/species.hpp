#pragma once
#include "../core/containers.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace flue::combustion {

// Closed set of species handled by the calculator. The enumerator value is the
// species' index in every SpeciesVector.
enum class Species : std::size_t { CH4, C2H6, C3H8, C6H6, He, N2, H2O, H2S, O2, CO2, SO2 };

inline constexpr std::size_t n_species = 11;

inline constexpr std::array<Species, n_species> all_species = {
    Species::CH4, Species::C2H6, Species::C3H8, Species::C6H6, Species::He,  Species::N2,
    Species::H2O, Species::H2S,  Species::O2,   Species::CO2,  Species::SO2};

// Species that can appear in the exhaust, in report order
inline constexpr std::array<Species, 6> exhaust_species = {Species::CO2, Species::H2O, Species::SO2,
                                                           Species::He,  Species::O2,  Species::N2};

// Per-species quantity indexed by Species
using SpeciesVector = core::FixedMathVector<double, static_cast<int>(n_species)>;

[[nodiscard]] constexpr auto index_of(Species species) noexcept -> std::size_t {
  return static_cast<std::size_t>(species);
}

// Molecular weight [kg/kmol]
[[nodiscard]] constexpr auto molecular_weight(Species species) noexcept -> double {
  switch (species) {
  case Species::CH4:
    return 16.04;
  case Species::C2H6:
    return 30.07;
  case Species::C3H8:
    return 44.10;
  case Species::C6H6:
    return 78.11;
  case Species::He:
    return 4.003;
  case Species::N2:
    return 28.01;
  case Species::H2O:
    return 18.02;
  case Species::H2S:
    return 34.08;
  case Species::O2:
    return 32.0;
  case Species::CO2:
    return 44.01;
  case Species::SO2:
    return 64.06;
  }
  return 0.0;
}

[[nodiscard]] constexpr auto species_name(Species species) noexcept -> std::string_view {
  switch (species) {
  case Species::CH4:
    return "CH4";
  case Species::C2H6:
    return "C2H6";
  case Species::C3H8:
    return "C3H8";
  case Species::C6H6:
    return "C6H6";
  case Species::He:
    return "He";
  case Species::N2:
    return "N2";
  case Species::H2O:
    return "H2O";
  case Species::H2S:
    return "H2S";
  case Species::O2:
    return "O2";
  case Species::CO2:
    return "CO2";
  case Species::SO2:
    return "SO2";
  }
  return "?";
}

// Exact, case-sensitive lookup ("He" and "HE" are not the same formula)
[[nodiscard]] constexpr auto find_species(std::string_view name) noexcept -> std::optional<Species> {
  for (auto species : all_species) {
    if (species_name(species) == name) {
      return species;
    }
  }
  return std::nullopt;
}

// Registry as a vector, for dot products against composition vectors
[[nodiscard]] inline auto molecular_weights() noexcept -> const SpeciesVector& {
  static const SpeciesVector weights = [] {
    SpeciesVector w;
    for (auto species : all_species) {
      w[index_of(species)] = molecular_weight(species);
    }
    return w;
  }();
  return weights;
}

// Mean molecular weight of dry combustion air [kg/kmol]
[[nodiscard]] auto air_molecular_weight() noexcept -> double;

} // namespace flue::combustion
