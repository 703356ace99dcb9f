#include "flue/combustion/fuel_composition.hpp"
#include "flue/combustion/stoichiometry.hpp"

namespace flue::combustion {

FuelComposition::FuelComposition(std::initializer_list<std::pair<Species, double>> entries) {
  for (const auto& [species, value] : entries) {
    fractions_[index_of(species)] += value;
  }
}

auto FuelComposition::from_named(const std::map<std::string, double>& named)
    -> std::expected<FuelComposition, CombustionError> {
  FuelComposition composition;
  for (const auto& [name, value] : named) {
    auto species = find_species(name);
    if (!species) {
      return std::unexpected(UnknownSpeciesError(name));
    }
    composition.fractions_[index_of(*species)] += value;
  }
  return composition;
}

auto FuelComposition::present_species() const -> std::vector<std::pair<Species, double>> {
  std::vector<std::pair<Species, double>> entries;
  for (auto species : all_species) {
    const double x = fraction(species);
    if (x != 0.0) {
      entries.emplace_back(species, x);
    }
  }
  return entries;
}

auto FuelComposition::has_combustible() const noexcept -> bool {
  for (auto species : all_species) {
    if (is_combustible(species) && fraction(species) > 0.0) {
      return true;
    }
  }
  return false;
}

} // namespace flue::combustion
