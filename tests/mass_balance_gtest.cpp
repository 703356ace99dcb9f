#include <cmath>

#include <gtest/gtest.h>

#include "flue/combustion/mass_balance.hpp"
#include "flue/combustion/species.hpp"

using namespace flue::combustion;

static const double OK_DOUBLE = 1.0e-12;

class MassBalanceTestFixture: public ::testing::Test
{
 protected:
  // 1 kmol/s of a natural gas with every kind of species in it
  const FuelComposition fuel_{{Species::CH4, 0.80}, {Species::C2H6, 0.05}, {Species::H2S, 0.01},
                              {Species::N2, 0.09},  {Species::CO2, 0.03},  {Species::He, 0.01},
                              {Species::H2O, 0.01}};
  const double fuel_flow_ = 1.0;
};

TEST_F (MassBalanceTestFixture, TheoreticalDemand)
{
  const double expected = 0.80 * 2.0 + 0.05 * 3.5 + 0.01 * 1.5;
  EXPECT_NEAR(theoretical_o2_demand(fuel_flow_, fuel_), expected, OK_DOUBLE);
  EXPECT_NEAR(theoretical_o2_demand(3.0 * fuel_flow_, fuel_), 3.0 * expected, OK_DOUBLE);
}

TEST_F (MassBalanceTestFixture, ProductsAndPassThrough)
{
  const double demand = theoretical_o2_demand(fuel_flow_, fuel_);
  const double supply = 1.2 * demand;
  const auto flows = exhaust_molar_flows(fuel_flow_, fuel_, supply);

  EXPECT_NEAR(flows[index_of(Species::CO2)], 0.80 + 0.05 * 2.0 + 0.03, OK_DOUBLE);
  EXPECT_NEAR(flows[index_of(Species::H2O)], 0.80 * 2.0 + 0.05 * 3.0 + 0.01 + 0.01, OK_DOUBLE);
  EXPECT_NEAR(flows[index_of(Species::SO2)], 0.01, OK_DOUBLE);
  EXPECT_NEAR(flows[index_of(Species::He)], 0.01, OK_DOUBLE);
  EXPECT_NEAR(flows[index_of(Species::N2)], 0.09 + supply / 0.21 * 0.79, OK_DOUBLE);
  EXPECT_NEAR(flows[index_of(Species::O2)], supply - demand, OK_DOUBLE);

  // combustibles are consumed entirely
  EXPECT_DOUBLE_EQ(flows[index_of(Species::CH4)], 0.0);
  EXPECT_DOUBLE_EQ(flows[index_of(Species::C2H6)], 0.0);
  EXPECT_DOUBLE_EQ(flows[index_of(Species::H2S)], 0.0);
}

TEST_F (MassBalanceTestFixture, FuelOxygenPassesThrough)
{
  const FuelComposition oxygenated{{Species::CH4, 0.9}, {Species::O2, 0.1}};
  const double demand = theoretical_o2_demand(1.0, oxygenated);
  const auto flows = exhaust_molar_flows(1.0, oxygenated, demand);
  EXPECT_NEAR(flows[index_of(Species::O2)], 0.1, OK_DOUBLE);
}

TEST_F (MassBalanceTestFixture, ResidualIsNegativeBelowStoichiometric)
{
  const double demand = theoretical_o2_demand(fuel_flow_, fuel_);
  const auto state = evaluate_mass_balance(fuel_flow_, fuel_, 0.5 * demand);
  EXPECT_LT(state.residual_o2, 0.0);
  EXPECT_LT(state.residual_o2_fraction(), 0.0);
}

TEST_F (MassBalanceTestFixture, ResidualFractionIncreasesWithSupply)
{
  const double demand = theoretical_o2_demand(fuel_flow_, fuel_);
  double previous = -1.0;
  for (double factor = 1.0; factor <= 5.0; factor += 0.25) {
    const auto state = evaluate_mass_balance(fuel_flow_, fuel_, factor * demand);
    EXPECT_GT(state.residual_o2_fraction(), previous) << factor;
    previous = state.residual_o2_fraction();
  }
  EXPECT_LT(previous, 0.21);
}

TEST_F (MassBalanceTestFixture, StateMatchesFlows)
{
  const double supply = 1.5 * theoretical_o2_demand(fuel_flow_, fuel_);
  const auto flows = exhaust_molar_flows(fuel_flow_, fuel_, supply);
  const auto state = evaluate_mass_balance(fuel_flow_, fuel_, supply);

  EXPECT_DOUBLE_EQ(state.o2_supply, supply);
  EXPECT_NEAR(state.total_exhaust, flows.sum(), OK_DOUBLE);
  EXPECT_NEAR(state.residual_o2, flows[index_of(Species::O2)], OK_DOUBLE);
}

TEST_F (MassBalanceTestFixture, MassIsConserved)
{
  const double supply = 1.3 * theoretical_o2_demand(fuel_flow_, fuel_);
  const auto flows = exhaust_molar_flows(fuel_flow_, fuel_, supply);

  const double fuel_mass = fuel_flow_ * fuel_.fractions().dot(molecular_weights());
  const double air_mass = supply / 0.21 * air_molecular_weight();
  const double exhaust_mass = flows.cwiseProduct(molecular_weights()).sum();

  // rounded molecular weights leave a small imbalance
  EXPECT_NEAR(exhaust_mass / (fuel_mass + air_mass), 1.0, 1.0e-3);
}
