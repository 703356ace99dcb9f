#pragma once
#include "../io/config_types.hpp"
#include "application_types.hpp"
#include <expected>
#include <string>

namespace flue::core {

class ConfigurationLoader {
public:
  [[nodiscard]] auto load_configuration(const std::string& config_file)
    -> std::expected<io::Configuration, ApplicationError>;

  auto display_configuration_info(const io::Configuration& config) const -> void;

private:
  auto display_fuel_composition(const io::FuelConfig& fuel) const -> void;

  auto display_calculation_setup(const io::Configuration& config) const -> void;
};

} // namespace flue::core
