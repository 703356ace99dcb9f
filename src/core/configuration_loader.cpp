#include "flue/core/configuration_loader.hpp"
#include "flue/combustion/molar_flow.hpp"
#include "flue/core/constants.hpp"
#include "flue/io/config_manager.hpp"
#include <format>
#include <iomanip>
#include <iostream>

namespace flue::core {

auto ConfigurationLoader::load_configuration(const std::string& config_file)
  -> std::expected<io::Configuration, ApplicationError> {

  std::cout << "Loading configuration from: " << config_file << std::endl;

  io::ConfigurationManager config_manager;
  auto config_result = config_manager.load(config_file);

  if (!config_result) {
    return std::unexpected(ApplicationError{
      "Failed to load config: " + config_result.error().message(),
      constants::indexing::second
    });
  }
  auto config = std::move(config_result.value());

  std::cout << constants::string_processing::colors::green << "✓ Configuration loaded successfully"
            << constants::string_processing::colors::reset << std::endl;

  display_configuration_info(config);

  return config;
}

auto ConfigurationLoader::display_configuration_info(const io::Configuration& config) const -> void {
  display_fuel_composition(config.fuel);
  display_calculation_setup(config);
}

auto ConfigurationLoader::display_fuel_composition(const io::FuelConfig& fuel) const -> void {
  using namespace constants::string_processing;

  std::cout << "\n" << colors::cyan
            << "┌─ FUEL COMPOSITION ────────────────────────┐"
            << colors::reset << std::endl;
  if (fuel.preset) {
    std::cout << "│ Preset          : " << std::setw(22) << std::left << *fuel.preset << " │" << std::endl;
  }
  for (const auto& [species, fraction] : fuel.composition.present_species()) {
    std::cout << std::format("│ {:<16}: {:>18.4f} % │", combustion::species_name(species),
                             fraction * constants::conversion::to_percentage)
              << std::endl;
  }
  std::cout << std::format("│ {:<16}: {:>15.3f} kg/kmol │", "Mean MW",
                           combustion::average_molecular_weight(fuel.composition))
            << std::endl;
  std::cout << colors::cyan
            << "└───────────────────────────────────────────┘"
            << colors::reset << std::endl;
}

auto ConfigurationLoader::display_calculation_setup(const io::Configuration& config) const -> void {
  using namespace constants::string_processing;

  const auto& solver = config.numerical.solver;

  std::cout << "\n" << colors::blue
            << "┌─ CALCULATION SETUP ───────────────────────┐"
            << colors::reset << std::endl;
  std::cout << std::format("│ {:<16}: {:>17.4f} kg/s │", "Fuel mass flow", config.fuel.mass_flow) << std::endl;
  if (config.sweep.enabled) {
    std::cout << std::format("│ {:<16}: {:>8.2f} - {:>6.2f} %  │", "O2 target sweep", config.sweep.target_o2_percent_min,
                             config.sweep.target_o2_percent_max)
              << std::endl;
    std::cout << std::format("│ {:<16}: {:>22} │", "Sweep points", config.sweep.points) << std::endl;
  } else {
    std::cout << std::format("│ {:<16}: {:>20.2f} % │", "O2 target",
                             config.combustion.target_o2_fraction * constants::conversion::to_percentage)
              << std::endl;
  }
  std::cout << std::format("│ {:<16}: {:>22.1e} │", "Bisection tol", solver.tolerance) << std::endl;
  std::cout << std::format("│ {:<16}: {:>22.1f} │", "Bracket factor", solver.bracket_factor) << std::endl;
  std::cout << std::format("│ {:<16}: {:>22} │", "Unreachable O2", combustion::to_string(solver.unreachable_target_policy))
            << std::endl;
  std::cout << colors::blue
            << "└───────────────────────────────────────────┘"
            << colors::reset << std::endl;
}

} // namespace flue::core
