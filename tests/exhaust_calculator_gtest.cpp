#include <cmath>
#include <map>
#include <string>

#include <gtest/gtest.h>

#include "flue/combustion/exhaust_calculator.hpp"
#include "flue/combustion/molar_flow.hpp"
#include "flue/io/fuel_presets.hpp"

using namespace flue::combustion;

static const double PERCENT_SUM_TOL = 1.0e-9;
// molecular weights are rounded to two decimals, so element balances close only approximately
static const double MASS_REL_TOL = 1.0e-3;

class ExhaustCalculatorTestFixture: public ::testing::Test
{
 protected:
  void SetUp() override
  {
    auto preset = flue::io::find_preset("default");
    ASSERT_TRUE(preset.has_value());
    auto composition = flue::io::build_composition(preset.value(), flue::io::FuelConfig::Units::Percent, true);
    ASSERT_TRUE(composition.has_value());
    natural_gas_ = composition.value();
  }

  static auto PercentSum(const ExhaustResult& result) -> double
  {
    double sum = 0.0;
    for (const auto& [species, percent] : result.composition) {
      sum += percent;
    }
    return sum;
  }

  FuelComposition natural_gas_;
  const FuelComposition methane_{{Species::CH4, 1.0}};
};

TEST_F (ExhaustCalculatorTestFixture, MethaneAirRequirement)
{
  auto result = compute_exhaust(1.0, methane_, 0.03);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  // stoichiometric air for methane is ~17.1 kg per kg of fuel
  EXPECT_GT(result->air_mass_flow, 17.13);
  EXPECT_LT(result->air_mass_flow, 25.0);
  EXPECT_NEAR(result->air_mass_flow, 20.283, 1.0e-2);

  EXPECT_NEAR(result->fuel_molar_flow, 1.0 / 16.04, 1.0e-12);
  EXPECT_NEAR(result->molar_flows.at(Species::CO2), result->fuel_molar_flow, 1.0e-12);
  EXPECT_NEAR(result->molar_flows.at(Species::H2O), 2.0 * result->fuel_molar_flow, 1.0e-12);
  EXPECT_DOUBLE_EQ(result->molar_flows.at(Species::SO2), 0.0);
  EXPECT_DOUBLE_EQ(result->molar_flows.at(Species::He), 0.0);

  EXPECT_GT(result->composition.at(Species::CO2), 0.0);
  EXPECT_GT(result->composition.at(Species::H2O), 0.0);
  EXPECT_NEAR(result->composition.at(Species::O2), 3.0, 1.0e-2);
  for (auto species : exhaust_species) {
    if (species != Species::N2) {
      EXPECT_GT(result->composition.at(Species::N2), result->composition.at(species)) << species_name(species);
    }
  }
}

TEST_F (ExhaustCalculatorTestFixture, SmallFuelFlowsMeetTarget)
{
  for (double mass_flow : {1.0, 0.1, 0.01, 0.001, 1.0e-4}) {
    auto result = compute_exhaust(mass_flow, methane_, 0.03);
    ASSERT_TRUE(result.has_value()) << mass_flow;
    const double o2_fraction = result->molar_flows.at(Species::O2) / result->total_molar_flow;
    EXPECT_NEAR(o2_fraction, 0.03, 1.0e-4) << mass_flow;
  }
}

TEST_F (ExhaustCalculatorTestFixture, ResidualOxygenMatchesTarget)
{
  for (double target : {0.02, 0.03, 0.05, 0.08}) {
    auto result = compute_exhaust(2.5, natural_gas_, target);
    ASSERT_TRUE(result.has_value()) << target;
    EXPECT_NEAR(result->composition.at(Species::O2), 100.0 * target, 1.0e-3) << target;
    EXPECT_FALSE(result->target_clamped);
  }
}

TEST_F (ExhaustCalculatorTestFixture, CompositionSumsToHundred)
{
  auto result = compute_exhaust(1.0, natural_gas_, 0.03);
  ASSERT_TRUE(result.has_value());
  EXPECT_NEAR(PercentSum(*result), 100.0, PERCENT_SUM_TOL);
  EXPECT_EQ(result->composition.size(), exhaust_species.size());

  for (auto species : exhaust_species) {
    EXPECT_GE(result->composition.at(species), 0.0) << species_name(species);
    EXPECT_GE(result->mass_flows.at(species), 0.0) << species_name(species);
  }
}

TEST_F (ExhaustCalculatorTestFixture, MassIsConserved)
{
  for (double mass_flow : {0.1, 1.0, 12.0}) {
    auto result = compute_exhaust(mass_flow, natural_gas_, 0.03);
    ASSERT_TRUE(result.has_value());
    const double inflow = mass_flow + result->air_mass_flow;
    EXPECT_NEAR(result->total_mass_flow, inflow, MASS_REL_TOL * inflow) << mass_flow;

    double species_total = 0.0;
    for (const auto& [species, flow] : result->mass_flows) {
      species_total += flow;
    }
    EXPECT_NEAR(species_total, result->total_mass_flow, 1.0e-9 * result->total_mass_flow);
  }
}

TEST_F (ExhaustCalculatorTestFixture, InertsPassThrough)
{
  auto result = compute_exhaust(1.0, natural_gas_, 0.03);
  ASSERT_TRUE(result.has_value());

  const double fuel_flow = result->fuel_molar_flow;
  EXPECT_NEAR(result->molar_flows.at(Species::He), fuel_flow * natural_gas_.fraction(Species::He), 1.0e-12);
  EXPECT_GT(result->molar_flows.at(Species::N2),
            result->air_molar_flow * 0.79 + 0.99 * fuel_flow * natural_gas_.fraction(Species::N2));
  EXPECT_GT(result->molar_flows.at(Species::SO2), 0.0);
}

TEST_F (ExhaustCalculatorTestFixture, AirIncreasesWithTarget)
{
  double previous_air = 0.0;
  for (double target = 0.01; target < 0.12; target += 0.01) {
    auto result = compute_exhaust(1.0, natural_gas_, target);
    ASSERT_TRUE(result.has_value()) << target;
    EXPECT_GT(result->air_mass_flow, previous_air) << target;
    previous_air = result->air_mass_flow;
  }
}

TEST_F (ExhaustCalculatorTestFixture, FlowsScaleWithFuelMassFlow)
{
  auto single = compute_exhaust(1.0, natural_gas_, 0.04);
  auto triple = compute_exhaust(3.0, natural_gas_, 0.04);
  ASSERT_TRUE(single.has_value());
  ASSERT_TRUE(triple.has_value());

  EXPECT_NEAR(triple->air_mass_flow, 3.0 * single->air_mass_flow, 1.0e-3);
  for (auto species : exhaust_species) {
    EXPECT_NEAR(triple->composition.at(species), single->composition.at(species), 1.0e-3) << species_name(species);
  }
}

TEST_F (ExhaustCalculatorTestFixture, RepeatedCallsAgree)
{
  ExhaustCalculator calculator;
  auto first = calculator.compute(1.0, natural_gas_, 0.03);
  auto second = calculator.compute(1.0, natural_gas_, 0.03);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());

  EXPECT_EQ(first->air_mass_flow, second->air_mass_flow);
  EXPECT_EQ(first->total_mass_flow, second->total_mass_flow);
  EXPECT_EQ(first->solver_iterations, second->solver_iterations);
  for (auto species : exhaust_species) {
    EXPECT_EQ(first->mass_flows.at(species), second->mass_flows.at(species));
    EXPECT_EQ(first->composition.at(species), second->composition.at(species));
  }
}

TEST_F (ExhaustCalculatorTestFixture, NamedComposition)
{
  const std::map<std::string, double> named = {{"CH4", 0.9}, {"N2", 0.1}};
  auto result = compute_exhaust(1.0, named, 0.03);
  ASSERT_TRUE(result.has_value());

  auto direct = compute_exhaust(1.0, FuelComposition{{Species::CH4, 0.9}, {Species::N2, 0.1}}, 0.03);
  ASSERT_TRUE(direct.has_value());
  EXPECT_DOUBLE_EQ(result->air_mass_flow, direct->air_mass_flow);
}

TEST_F (ExhaustCalculatorTestFixture, UnknownSpecies)
{
  const std::map<std::string, double> named = {{"CH4", 0.9}, {"Ar", 0.1}};
  auto result = compute_exhaust(1.0, named, 0.03);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), CombustionErrorKind::UnknownSpecies);
}

TEST_F (ExhaustCalculatorTestFixture, InvalidInputs)
{
  for (double mass_flow : {0.0, -1.0, std::nan("")}) {
    auto result = compute_exhaust(mass_flow, methane_, 0.03);
    ASSERT_FALSE(result.has_value()) << mass_flow;
    EXPECT_EQ(result.error().kind(), CombustionErrorKind::InvalidFlow);
  }

  // a percentage passed where a fraction is expected
  auto percent = compute_exhaust(1.0, methane_, 3.0);
  ASSERT_FALSE(percent.has_value());
  EXPECT_EQ(percent.error().kind(), CombustionErrorKind::InvalidFlow);
}

TEST_F (ExhaustCalculatorTestFixture, InertFuelIsDegenerate)
{
  auto result = compute_exhaust(1.0, FuelComposition{{Species::N2, 0.8}, {Species::CO2, 0.2}}, 0.03);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), CombustionErrorKind::DegenerateComposition);

  auto helium = compute_exhaust(1.0, FuelComposition{{Species::He, 1.0}}, 0.03);
  ASSERT_FALSE(helium.has_value());
  EXPECT_EQ(helium.error().kind(), CombustionErrorKind::DegenerateComposition);
}

TEST_F (ExhaustCalculatorTestFixture, ClampedResultIsFlagged)
{
  AirSolverConfig config;
  config.unreachable_target_policy = UnreachableTargetPolicy::Clamp;
  auto result = compute_exhaust(1.0, methane_, 0.18, config);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->target_clamped);
  EXPECT_LT(result->composition.at(Species::O2), 18.0);
}
