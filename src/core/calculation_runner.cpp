#include "flue/core/calculation_runner.hpp"
#include "flue/combustion/exhaust_calculator.hpp"
#include "flue/core/constants.hpp"
#include <chrono>
#include <cmath>
#include <format>
#include <iomanip>
#include <iostream>

namespace flue::core {

auto CalculationRunner::run_calculation(const io::Configuration& config, PerformanceMetrics& metrics)
  -> std::expected<CalculationResult, ApplicationError> {

  combustion::ExhaustCalculator calculator(config.numerical.solver);
  CalculationResult result;

  auto solve_start = std::chrono::high_resolution_clock::now();

  if (config.sweep.enabled) {
    auto sweep = run_sweep(calculator, config);
    if (!sweep) {
      return std::unexpected(sweep.error());
    }
    result.sweep = std::move(sweep.value());
  } else {
    auto exhaust = run_single_point(calculator, config);
    if (!exhaust) {
      return std::unexpected(exhaust.error());
    }
    result.exhaust = std::move(exhaust.value());
  }

  auto solve_end = std::chrono::high_resolution_clock::now();
  metrics.solve_time = std::chrono::duration_cast<std::chrono::milliseconds>(solve_end - solve_start);

  return result;
}

auto CalculationRunner::run_single_point(const combustion::ExhaustCalculator& calculator,
                                         const io::Configuration& config)
  -> std::expected<combustion::ExhaustResult, ApplicationError> {

  std::cout << "\n=== SOLVING AIR REQUIREMENT ===" << std::endl;

  auto exhaust = calculator.compute(config.fuel.mass_flow, config.fuel.composition,
                                    config.combustion.target_o2_fraction);
  if (!exhaust) {
    return std::unexpected(ApplicationError{
      std::format("Calculation failed ({}): {}", combustion::to_string(exhaust.error().kind()),
                  exhaust.error().message()),
      constants::indexing::second
    });
  }

  std::cout << constants::string_processing::colors::green << "✓ Air requirement converged"
            << constants::string_processing::colors::reset << " in " << exhaust->solver_iterations
            << " iterations" << std::endl;

  return std::move(exhaust.value());
}

auto CalculationRunner::run_sweep(const combustion::ExhaustCalculator& calculator, const io::Configuration& config)
  -> std::expected<io::SweepGenerator::Result, ApplicationError> {

  io::SweepGenerator generator(calculator, config);
  auto sweep = generator.generate();

  if (!sweep.success) {
    return std::unexpected(ApplicationError{"Target sweep failed at every point", constants::indexing::second});
  }
  if (sweep.n_failed > 0) {
    std::cerr << constants::string_processing::colors::yellow
              << std::format("Warning: {} sweep point(s) failed and are stored as NaN", sweep.n_failed)
              << constants::string_processing::colors::reset << std::endl;
  }

  return sweep;
}

auto CalculationRunner::display_calculation_results(const CalculationResult& result,
                                                    const io::Configuration& config) const -> void {
  if (result.exhaust) {
    display_exhaust_report(*result.exhaust, config.output);
  }
  if (result.sweep) {
    display_sweep_table(*result.sweep);
  }
}

auto CalculationRunner::display_exhaust_report(const combustion::ExhaustResult& exhaust,
                                               const io::OutputConfig& output) const -> void {
  using namespace constants::string_processing;

  if (exhaust.target_clamped) {
    std::cerr << colors::yellow
              << "Warning: O2 target lies outside the search bracket; result clamped to the nearest bound"
              << colors::reset << std::endl;
  }

  std::cout << "\n=== EXHAUST COMPOSITION ===" << std::endl;
  std::cout << std::setw(medium_field_width) << std::left << "Species" << std::setw(wide_field_width) << std::right
            << "mol %" << std::endl;
  std::cout << std::string(separator_width, '-') << std::endl;
  for (auto species : combustion::exhaust_species) {
    const double percent = exhaust.composition.at(species);
    if (percent < output.mole_fraction_display_threshold) {
      continue;
    }
    std::cout << std::setw(medium_field_width) << std::left << combustion::species_name(species)
              << std::setw(wide_field_width) << std::right << std::fixed << std::setprecision(float_precision_2)
              << percent << std::endl;
  }

  std::cout << "\n=== EXHAUST MASS FLOWS ===" << std::endl;
  std::cout << std::setw(medium_field_width) << std::left << "Species" << std::setw(wide_field_width) << std::right
            << "kg/s" << std::endl;
  std::cout << std::string(separator_width, '-') << std::endl;
  for (auto species : combustion::exhaust_species) {
    const double mass_flow = exhaust.mass_flows.at(species);
    if (mass_flow < output.mass_flow_display_threshold) {
      continue;
    }
    std::cout << std::setw(medium_field_width) << std::left << combustion::species_name(species)
              << std::setw(wide_field_width) << std::right << std::fixed << std::setprecision(float_precision_3)
              << mass_flow << std::endl;
  }

  std::cout << "\n=== SUMMARY ===" << std::endl;
  std::cout << std::format("Air mass flow     : {:>10.3f} kg/s", exhaust.air_mass_flow) << std::endl;
  std::cout << std::format("Exhaust mass flow : {:>10.3f} kg/s", exhaust.total_mass_flow) << std::endl;
  std::cout << std::format("Excess O2 supply  : {:>10.2f} %",
                           (exhaust.o2_supply / exhaust.theoretical_o2 - 1.0) * constants::conversion::to_percentage)
            << std::endl;
}

auto CalculationRunner::display_sweep_table(const io::SweepGenerator::Result& sweep) const -> void {
  using namespace constants::string_processing;

  std::cout << "\n=== SWEEP RESULTS ===" << std::endl;
  std::cout << std::setw(wide_field_width) << "O2 [%]" << std::setw(wide_field_width) << "air [kg/s]"
            << std::setw(wide_field_width) << "exh [kg/s]" << std::endl;
  std::cout << std::string(separator_width, '-') << std::endl;

  for (std::size_t i = 0; i < sweep.target_o2_percent.size(); ++i) {
    std::cout << std::setw(wide_field_width) << std::fixed << std::setprecision(float_precision_2)
              << sweep.target_o2_percent[i];
    if (std::isnan(sweep.air_mass_flows[i])) {
      std::cout << std::setw(wide_field_width) << "failed" << std::setw(wide_field_width) << "-" << std::endl;
      continue;
    }
    std::cout << std::setw(wide_field_width) << std::setprecision(float_precision_3) << sweep.air_mass_flows[i]
              << std::setw(wide_field_width) << sweep.exhaust_mass_flows[i] << std::endl;
  }
}

} // namespace flue::core
