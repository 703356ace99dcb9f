#pragma once
#include "../../core/constants.hpp"
#include "../../core/containers.hpp"
#include "../../core/exceptions.hpp"
#include "../config_types.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace flue::io::output {

enum class OutputFormat { HDF5, CSV };

struct OutputConfig {
  std::filesystem::path base_directory = "flue_outputs";
  std::vector<OutputFormat> formats = {OutputFormat::HDF5};
  bool include_timestamp = true;
  int compression_level = constants::io::default_hdf5_compression; // 0-9 for HDF5
};

struct CalculationMetadata {
  std::string flue_version = constants::io::default_flue_version;
  std::chrono::system_clock::time_point creation_time;
  std::string case_name;

  std::vector<std::string> species_names; // full species table
  std::vector<double> species_molecular_weights;

  double target_o2_fraction = 0.0;
  double bisection_tolerance = 0.0;
  double bracket_factor = 0.0;
  std::string unreachable_target_policy;
};

struct FuelData {
  std::vector<std::string> species_names;
  std::vector<double> mole_fractions;
  double mass_flow = 0.0;  // [kg/s]
  double molar_flow = 0.0; // [kmol/s]
  double average_molecular_weight = 0.0;
};

struct ExhaustData {
  std::vector<std::string> species_names; // report order
  std::vector<double> mole_percent;
  std::vector<double> molar_flows; // [kmol/s]
  std::vector<double> mass_flows;  // [kg/s]

  double total_mass_flow = 0.0;  // [kg/s]
  double total_molar_flow = 0.0; // [kmol/s]
  double air_mass_flow = 0.0;    // [kg/s]
  double air_molar_flow = 0.0;   // [kmol/s]
  double o2_supply = 0.0;        // [kmol/s]
  double theoretical_o2 = 0.0;   // [kmol/s]
  int solver_iterations = 0;
  bool target_clamped = false;
};

struct SweepData {
  std::vector<std::string> species_names;
  std::vector<double> target_o2_percent;
  std::vector<double> air_mass_flows;
  std::vector<double> exhaust_mass_flows;
  std::vector<double> o2_supply;
  core::Matrix<double> exhaust_composition; // [n_points x n_species], mole percent
  std::vector<int> converged;
};

struct OutputDataset {
  CalculationMetadata metadata;
  FuelData fuel;
  std::optional<ExhaustData> exhaust; // absent when only a sweep was run
  std::optional<SweepData> sweep;
};

class OutputError : public core::FlueException {
public:
  explicit OutputError(std::string_view message, std::source_location location = std::source_location::current())
      : FlueException(std::format("Output Error: {}", message), location) {}
};

class FileWriteError : public OutputError {
private:
  std::filesystem::path file_path_;

public:
  explicit FileWriteError(const std::filesystem::path& path, std::string_view message,
                          std::source_location location = std::source_location::current())
      : OutputError(std::format("File '{}': {}", path.string(), message), location), file_path_(path) {}

  [[nodiscard]] auto file_path() const noexcept -> const std::filesystem::path& { return file_path_; }
};

class UnsupportedFormatError : public OutputError {
public:
  explicit UnsupportedFormatError(OutputFormat format, std::source_location location = std::source_location::current())
      : OutputError(std::format("Unsupported output format: {}", static_cast<int>(format)), location) {}
};

} // namespace flue::io::output
