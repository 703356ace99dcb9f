#include "flue/io/sweep_generator.hpp"
#include "flue/core/constants.hpp"
#include <format>
#include <iostream>
#include <limits>

namespace flue::io {

SweepGenerator::SweepGenerator(const combustion::ExhaustCalculator& calculator, const Configuration& config)
    : calculator_(calculator), config_(config) {}

auto SweepGenerator::target_grid(const SweepConfig& sweep) -> std::vector<double> {
  std::vector<double> targets;
  if (sweep.points < 2) {
    return targets;
  }

  targets.resize(sweep.points);
  const double step = (sweep.target_o2_percent_max - sweep.target_o2_percent_min) / (sweep.points - 1);
  for (int i = 0; i < sweep.points; ++i) {
    targets[i] = sweep.target_o2_percent_min + i * step;
  }
  // Land exactly on the upper bound
  targets.back() = sweep.target_o2_percent_max;
  return targets;
}

auto SweepGenerator::generate() const -> Result {
  Result result;

  if (!config_.sweep.enabled) {
    return result;
  }

  result.target_o2_percent = target_grid(config_.sweep);
  const auto n_points = result.target_o2_percent.size();
  constexpr double nan = std::numeric_limits<double>::quiet_NaN();

  result.air_mass_flows.assign(n_points, nan);
  result.exhaust_mass_flows.assign(n_points, nan);
  result.o2_supply.assign(n_points, nan);
  result.converged.assign(n_points, 0);
  result.failure_messages.assign(n_points, "");
  result.exhaust_composition = core::Matrix<double>(n_points, combustion::exhaust_species.size());
  result.exhaust_composition.fill(nan);

  std::cout << "\n=== TARGET O2 SWEEP ===" << std::endl;
  std::cout << std::format("Range: {:.2f}% to {:.2f}% O2 in {} points", config_.sweep.target_o2_percent_min,
                           config_.sweep.target_o2_percent_max, n_points)
            << std::endl;

  for (std::size_t i = 0; i < n_points; ++i) {
    const double target_percent = result.target_o2_percent[i];

    if (i % constants::sweep::progress_report_step == 0) {
      std::cout << std::format("  O2 target = {:.2f}% ({}/{})", target_percent, i + 1, n_points) << std::endl;
    }

    auto exhaust = calculator_.compute(config_.fuel.mass_flow, config_.fuel.composition,
                                       target_percent / constants::conversion::to_percentage);
    if (!exhaust) {
      std::cerr << std::format("{}Sweep point {:.2f}% failed: {}{}", constants::string_processing::colors::yellow,
                               target_percent, exhaust.error().message(), constants::string_processing::colors::reset)
                << std::endl;
      result.failure_messages[i] = exhaust.error().message();
      ++result.n_failed;
      continue;
    }

    const auto& point = exhaust.value();
    result.air_mass_flows[i] = point.air_mass_flow;
    result.exhaust_mass_flows[i] = point.total_mass_flow;
    result.o2_supply[i] = point.o2_supply;
    result.converged[i] = point.target_clamped ? 0 : 1;

    for (std::size_t j = 0; j < combustion::exhaust_species.size(); ++j) {
      result.exhaust_composition(i, j) = point.composition.at(combustion::exhaust_species[j]);
    }
  }

  std::cout << std::format("=== SWEEP COMPLETE ({} of {} points solved) ===", n_points - result.n_failed, n_points)
            << std::endl;

  result.success = static_cast<std::size_t>(result.n_failed) < n_points;
  return result;
}

} // namespace flue::io
