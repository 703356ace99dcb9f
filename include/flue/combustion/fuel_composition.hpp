#pragma once
#include "combustion_errors.hpp"
#include "species.hpp"
#include <expected>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace flue::combustion {

// Mole fractions of the fuel gas stream. Summing to one is the caller's
// responsibility; nothing here renormalizes.
class FuelComposition {
private:
  SpeciesVector fractions_ = SpeciesVector::Zero();

public:
  FuelComposition() = default;
  FuelComposition(std::initializer_list<std::pair<Species, double>> entries);

  // Converts species names to the closed Species set
  [[nodiscard]] static auto from_named(const std::map<std::string, double>& named)
      -> std::expected<FuelComposition, CombustionError>;

  [[nodiscard]] auto fraction(Species species) const noexcept -> double { return fractions_[index_of(species)]; }

  auto set_fraction(Species species, double value) noexcept -> void { fractions_[index_of(species)] = value; }

  [[nodiscard]] auto fractions() const noexcept -> const SpeciesVector& { return fractions_; }

  [[nodiscard]] auto sum() const noexcept -> double { return fractions_.sum(); }

  // Species with a non-zero fraction, in registry order
  [[nodiscard]] auto present_species() const -> std::vector<std::pair<Species, double>>;

  [[nodiscard]] auto has_combustible() const noexcept -> bool;
};

} // namespace flue::combustion
