#include <map>
#include <string>

#include <gtest/gtest.h>

#include "flue/combustion/fuel_composition.hpp"
#include "flue/io/fuel_presets.hpp"

using namespace flue::combustion;
using flue::io::FuelConfig;

static const double OK_DOUBLE = 1.0e-12;

TEST (FuelComposition, InitializerList)
{
  const FuelComposition fuel{{Species::CH4, 0.7}, {Species::N2, 0.2}, {Species::CH4, 0.1}};
  EXPECT_NEAR(fuel.fraction(Species::CH4), 0.8, OK_DOUBLE);
  EXPECT_NEAR(fuel.fraction(Species::N2), 0.2, OK_DOUBLE);
  EXPECT_DOUBLE_EQ(fuel.fraction(Species::O2), 0.0);
  EXPECT_NEAR(fuel.sum(), 1.0, OK_DOUBLE);
}

TEST (FuelComposition, FromNamed)
{
  auto fuel = FuelComposition::from_named({{"CH4", 0.5}, {"C3H8", 0.25}, {"He", 0.25}});
  ASSERT_TRUE(fuel.has_value());
  EXPECT_DOUBLE_EQ(fuel->fraction(Species::CH4), 0.5);
  EXPECT_DOUBLE_EQ(fuel->fraction(Species::C3H8), 0.25);
  EXPECT_DOUBLE_EQ(fuel->fraction(Species::He), 0.25);

  auto unknown = FuelComposition::from_named({{"CH4", 0.5}, {"HE", 0.5}});
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().kind(), CombustionErrorKind::UnknownSpecies);
}

TEST (FuelComposition, PresentSpeciesInRegistryOrder)
{
  const FuelComposition fuel{{Species::CO2, 0.1}, {Species::CH4, 0.9}};
  const auto present = fuel.present_species();
  ASSERT_EQ(present.size(), 2u);
  EXPECT_EQ(present[0].first, Species::CH4);
  EXPECT_EQ(present[1].first, Species::CO2);
  EXPECT_DOUBLE_EQ(present[1].second, 0.1);
}

TEST (FuelComposition, HasCombustible)
{
  EXPECT_TRUE((FuelComposition{{Species::H2S, 0.01}, {Species::N2, 0.99}}.has_combustible()));
  EXPECT_FALSE((FuelComposition{{Species::N2, 0.5}, {Species::He, 0.5}}.has_combustible()));
  EXPECT_FALSE(FuelComposition{}.has_combustible());
}

TEST (FuelPresets, FindPreset)
{
  auto methane = flue::io::find_preset("methane");
  ASSERT_TRUE(methane.has_value());
  EXPECT_DOUBLE_EQ(methane->at("CH4"), 100.0);

  auto natural_gas = flue::io::find_preset("default");
  ASSERT_TRUE(natural_gas.has_value());
  EXPECT_EQ(natural_gas->size(), 9u);
  EXPECT_DOUBLE_EQ(natural_gas->at("N2"), 36.90);

  auto missing = flue::io::find_preset("propane");
  ASSERT_FALSE(missing.has_value());
  EXPECT_NE(missing.error().message().find("propane"), std::string::npos);
}

TEST (FuelPresets, PresetSpeciesAreKnown)
{
  for (const auto& [name, composition] : flue::io::fuel_presets) {
    for (const auto& [species, percent] : composition) {
      EXPECT_TRUE(find_species(species).has_value()) << name << ": " << species;
      EXPECT_GT(percent, 0.0) << name << ": " << species;
    }
  }
}

TEST (BuildComposition, PercentAndFraction)
{
  auto from_percent = flue::io::build_composition({{"CH4", 90.0}, {"N2", 10.0}}, FuelConfig::Units::Percent, false);
  ASSERT_TRUE(from_percent.has_value());
  EXPECT_NEAR(from_percent->fraction(Species::CH4), 0.9, OK_DOUBLE);
  EXPECT_NEAR(from_percent->fraction(Species::N2), 0.1, OK_DOUBLE);

  auto from_fraction = flue::io::build_composition({{"CH4", 0.9}, {"N2", 0.1}}, FuelConfig::Units::Fraction, false);
  ASSERT_TRUE(from_fraction.has_value());
  EXPECT_NEAR(from_fraction->fraction(Species::CH4), 0.9, OK_DOUBLE);
}

TEST (BuildComposition, Normalization)
{
  const std::map<std::string, double> short_sum = {{"CH4", 0.6}, {"N2", 0.2}};

  auto normalized = flue::io::build_composition(short_sum, FuelConfig::Units::Fraction, true);
  ASSERT_TRUE(normalized.has_value());
  EXPECT_NEAR(normalized->sum(), 1.0, OK_DOUBLE);
  EXPECT_NEAR(normalized->fraction(Species::CH4), 0.75, OK_DOUBLE);

  auto strict = flue::io::build_composition(short_sum, FuelConfig::Units::Fraction, false);
  ASSERT_FALSE(strict.has_value());
  EXPECT_NE(strict.error().message().find("fuel.composition"), std::string::npos);
}

TEST (BuildComposition, DefaultPresetNormalizes)
{
  auto preset = flue::io::find_preset("default");
  ASSERT_TRUE(preset.has_value());
  auto composition = flue::io::build_composition(preset.value(), FuelConfig::Units::Percent, true);
  ASSERT_TRUE(composition.has_value());
  EXPECT_NEAR(composition->sum(), 1.0, OK_DOUBLE);
  EXPECT_TRUE(composition->has_combustible());
}

TEST (BuildComposition, Rejections)
{
  EXPECT_FALSE(flue::io::build_composition({}, FuelConfig::Units::Percent, true).has_value());
  EXPECT_FALSE(
      flue::io::build_composition({{"CH4", 110.0}, {"N2", -10.0}}, FuelConfig::Units::Percent, true).has_value());
  EXPECT_FALSE(flue::io::build_composition({{"CH4", 0.0}, {"N2", 0.0}}, FuelConfig::Units::Percent, true).has_value());

  auto unknown = flue::io::build_composition({{"CH4", 90.0}, {"Ar", 10.0}}, FuelConfig::Units::Percent, true);
  ASSERT_FALSE(unknown.has_value());
  EXPECT_NE(unknown.error().message().find("Valid species"), std::string::npos);
}
