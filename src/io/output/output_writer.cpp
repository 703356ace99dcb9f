#include "flue/io/output/output_writer.hpp"
#include "flue/combustion/molar_flow.hpp"
#include "flue/io/output/csv_writer.hpp"
#include "flue/io/output/hdf5_writer.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace flue::io::output {

auto WriterFactory::create_writer(OutputFormat format, const OutputConfig& config)
    -> std::expected<std::unique_ptr<FormatWriter>, UnsupportedFormatError> {

  switch (format) {
  case OutputFormat::HDF5:
    return std::make_unique<HDF5Writer>(HDF5Config{.compression_level = config.compression_level});
  case OutputFormat::CSV:
    return std::make_unique<CSVWriter>();
  }
  return std::unexpected(UnsupportedFormatError(format));
}

auto WriterFactory::get_available_formats() noexcept -> std::vector<OutputFormat> {
  return {OutputFormat::HDF5, OutputFormat::CSV};
}

OutputWriter::OutputWriter(OutputConfig config) : config_(std::move(config)) { initialize_writers(); }

auto OutputWriter::initialize_writers() -> void {
  writers_.clear();

  for (auto format : config_.formats) {
    if (auto writer = WriterFactory::create_writer(format, config_)) {
      writers_.push_back(std::move(writer.value()));
    }
  }
}

auto OutputWriter::build_dataset(const Configuration& config, const std::optional<combustion::ExhaustResult>& exhaust,
                                 const std::optional<SweepGenerator::Result>& sweep, const std::string& case_name)
    -> OutputDataset {

  using combustion::Species;

  OutputDataset dataset;

  auto& meta = dataset.metadata;
  meta.creation_time = std::chrono::system_clock::now();
  meta.case_name = case_name;
  meta.target_o2_fraction = config.combustion.target_o2_fraction;
  meta.bisection_tolerance = config.numerical.solver.tolerance;
  meta.bracket_factor = config.numerical.solver.bracket_factor;
  meta.unreachable_target_policy = std::string(combustion::to_string(config.numerical.solver.unreachable_target_policy));
  for (auto species : combustion::all_species) {
    meta.species_names.emplace_back(combustion::species_name(species));
    meta.species_molecular_weights.push_back(combustion::molecular_weight(species));
  }

  auto& fuel = dataset.fuel;
  fuel.mass_flow = config.fuel.mass_flow;
  fuel.average_molecular_weight = combustion::average_molecular_weight(config.fuel.composition);
  fuel.molar_flow = fuel.average_molecular_weight > 0.0 ? fuel.mass_flow / fuel.average_molecular_weight : 0.0;
  for (const auto& [species, fraction] : config.fuel.composition.present_species()) {
    fuel.species_names.emplace_back(combustion::species_name(species));
    fuel.mole_fractions.push_back(fraction);
  }

  if (exhaust) {
    ExhaustData data;
    for (auto species : combustion::exhaust_species) {
      data.species_names.emplace_back(combustion::species_name(species));
      data.mole_percent.push_back(exhaust->composition.at(species));
      data.molar_flows.push_back(exhaust->molar_flows.at(species));
      data.mass_flows.push_back(exhaust->mass_flows.at(species));
    }
    data.total_mass_flow = exhaust->total_mass_flow;
    data.total_molar_flow = exhaust->total_molar_flow;
    data.air_mass_flow = exhaust->air_mass_flow;
    data.air_molar_flow = exhaust->air_molar_flow;
    data.o2_supply = exhaust->o2_supply;
    data.theoretical_o2 = exhaust->theoretical_o2;
    data.solver_iterations = exhaust->solver_iterations;
    data.target_clamped = exhaust->target_clamped;
    fuel.molar_flow = exhaust->fuel_molar_flow;
    dataset.exhaust = std::move(data);
  }

  if (sweep && sweep->success) {
    SweepData data;
    for (auto species : combustion::exhaust_species) {
      data.species_names.emplace_back(combustion::species_name(species));
    }
    data.target_o2_percent = sweep->target_o2_percent;
    data.air_mass_flows = sweep->air_mass_flows;
    data.exhaust_mass_flows = sweep->exhaust_mass_flows;
    data.o2_supply = sweep->o2_supply;
    data.exhaust_composition = sweep->exhaust_composition;
    data.converged = sweep->converged;
    dataset.sweep = std::move(data);
  }

  return dataset;
}

auto OutputWriter::write(const OutputDataset& dataset) -> std::expected<std::vector<std::filesystem::path>, OutputError> {

  auto file_paths = generate_file_paths(dataset.metadata.case_name, dataset.metadata.creation_time);

  if (!file_paths.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(file_paths[0].parent_path(), ec);
    if (ec) {
      return std::unexpected(OutputError(std::format("Cannot create output directory '{}': {}",
                                                     file_paths[0].parent_path().string(), ec.message())));
    }
  }

  std::vector<std::filesystem::path> written_files;
  written_files.reserve(writers_.size());

  for (std::size_t i = 0; i < writers_.size() && i < file_paths.size(); ++i) {
    const auto& file_path = file_paths[i];

    if (auto write_result = writers_[i]->write(file_path, dataset, config_); !write_result) {
      return std::unexpected(FileWriteError(file_path, write_result.error().message()));
    }

    written_files.push_back(file_path);
  }

  return written_files;
}

auto OutputWriter::generate_file_paths(const std::string& case_name,
                                       const std::chrono::system_clock::time_point& timestamp) const
    -> std::vector<std::filesystem::path> {

  std::vector<std::filesystem::path> paths;
  paths.reserve(writers_.size());

  std::string timestamp_str;
  if (config_.include_timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto tm = *std::localtime(&time_t);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    timestamp_str = "_" + oss.str();
  }

  // CSV writers derive their per-table file names from this stem
  for (const auto& writer : writers_) {
    auto filename = case_name + timestamp_str + std::string(writer->get_extension());
    paths.push_back(config_.base_directory / filename);
  }

  return paths;
}

auto OutputWriter::validate_config() const -> std::expected<void, OutputError> {
  if (config_.formats.empty()) {
    return std::unexpected(OutputError("No output format selected"));
  }

  if (!std::filesystem::exists(config_.base_directory)) {
    std::error_code ec;
    std::filesystem::create_directories(config_.base_directory, ec);
    if (ec) {
      return std::unexpected(OutputError(
          std::format("Cannot create output directory '{}': {}", config_.base_directory.string(), ec.message())));
    }
  }

  if (config_.compression_level < 0 || config_.compression_level > 9) {
    return std::unexpected(OutputError("Compression level must be between 0 and 9"));
  }

  return {};
}

} // namespace flue::io::output
