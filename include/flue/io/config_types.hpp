#pragma once
#include "../combustion/combustion_types.hpp"
#include "../combustion/fuel_composition.hpp"
#include "../core/constants.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace flue::io {

struct FuelConfig {
  enum class Units { Percent, Fraction };

  std::optional<std::string> preset;
  std::map<std::string, double> raw_composition; // as written, after applying the preset
  Units units = Units::Percent;
  bool normalize = true;
  double mass_flow = 1.0; // [kg/s]

  combustion::FuelComposition composition; // validated mole fractions
};

struct CombustionConfig {
  double target_o2_fraction = 0.03;
};

struct NumericalConfig {
  combustion::AirSolverConfig solver{};
};

struct OutputConfig {
  enum class Format { HDF5, CSV };

  std::string output_directory = "flue_outputs";
  std::vector<Format> formats = {Format::HDF5};
  bool include_timestamp = true;
  double mole_fraction_display_threshold = constants::display::mole_percent_threshold; // [%]
  double mass_flow_display_threshold = constants::display::mass_flow_threshold;         // [kg/s]
};

struct SweepConfig {
  bool enabled = false;
  double target_o2_percent_min = constants::sweep::target_o2_percent_min;
  double target_o2_percent_max = constants::sweep::target_o2_percent_max;
  int points = constants::sweep::default_points;
};

struct Configuration {
  FuelConfig fuel;
  CombustionConfig combustion;
  NumericalConfig numerical;
  OutputConfig output;
  SweepConfig sweep;
};

} // namespace flue::io
