#pragma once

#include "../combustion/exhaust_calculator.hpp"
#include "../combustion/species.hpp"
#include "../core/containers.hpp"
#include "config_types.hpp"
#include <string>
#include <vector>

namespace flue::io {

// Repeats the exhaust calculation over a range of residual O2 targets for the
// configured fuel. Points that fail are kept as NaN rows.
class SweepGenerator {
public:
  struct Result {
    std::vector<double> target_o2_percent;
    std::vector<double> air_mass_flows;   // [kg/s]
    std::vector<double> exhaust_mass_flows; // [kg/s]
    std::vector<double> o2_supply;        // [kmol/s]
    core::Matrix<double> exhaust_composition; // [n_points x n_exhaust_species], mole percent
    std::vector<int> converged;
    std::vector<std::string> failure_messages;
    int n_failed = 0;
    bool success = false;
  };

  SweepGenerator(const combustion::ExhaustCalculator& calculator, const Configuration& config);

  [[nodiscard]] auto generate() const -> Result;

  // Evenly spaced targets from min to max inclusive [%]
  [[nodiscard]] static auto target_grid(const SweepConfig& sweep) -> std::vector<double>;

private:
  const combustion::ExhaustCalculator& calculator_;
  const Configuration& config_;
};

} // namespace flue::io
