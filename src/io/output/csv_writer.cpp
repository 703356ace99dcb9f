#include "flue/io/output/csv_writer.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace flue::io::output {

auto CSVWriter::table_path(const std::filesystem::path& file_path, std::string_view table) -> std::filesystem::path {
  return file_path.parent_path() / std::format("{}_{}.csv", file_path.stem().string(), table);
}

auto CSVWriter::write(const std::filesystem::path& file_path, const OutputDataset& dataset,
                      const OutputConfig& /*config*/) const -> std::expected<void, OutputError> {

  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  if (ec) {
    return std::unexpected(OutputError(
        std::format("Cannot create output directory '{}': {}", file_path.parent_path().string(), ec.message())));
  }

  if (dataset.exhaust) {
    if (auto result = write_exhaust_table(table_path(file_path, "exhaust"), *dataset.exhaust); !result) {
      return std::unexpected(result.error());
    }
  }

  if (dataset.sweep) {
    if (auto result = write_sweep_table(table_path(file_path, "sweep"), *dataset.sweep); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto CSVWriter::write_exhaust_table(const std::filesystem::path& file_path,
                                    const ExhaustData& exhaust) const -> std::expected<void, OutputError> {

  std::ofstream file(file_path);
  if (!file) {
    return std::unexpected(FileWriteError(file_path, "cannot open for writing"));
  }

  const char d = csv_config_.delimiter;

  if (csv_config_.include_headers) {
    file << "species" << d << "mole_percent" << d << "molar_flow_kmol_s" << d << "mass_flow_kg_s" << '\n';
  }

  for (std::size_t i = 0; i < exhaust.species_names.size(); ++i) {
    file << exhaust.species_names[i] << d << format_value(exhaust.mole_percent[i]) << d
         << format_value(exhaust.molar_flows[i]) << d << format_value(exhaust.mass_flows[i]) << '\n';
  }

  file << "total" << d << format_value(100.0) << d << format_value(exhaust.total_molar_flow) << d
       << format_value(exhaust.total_mass_flow) << '\n';
  file << "air" << d << "" << d << format_value(exhaust.air_molar_flow) << d << format_value(exhaust.air_mass_flow)
       << '\n';

  if (!file) {
    return std::unexpected(FileWriteError(file_path, "write failed"));
  }
  return {};
}

auto CSVWriter::write_sweep_table(const std::filesystem::path& file_path,
                                  const SweepData& sweep) const -> std::expected<void, OutputError> {

  std::ofstream file(file_path);
  if (!file) {
    return std::unexpected(FileWriteError(file_path, "cannot open for writing"));
  }

  const char d = csv_config_.delimiter;

  if (csv_config_.include_headers) {
    file << "target_o2_percent" << d << "air_mass_flow_kg_s" << d << "exhaust_mass_flow_kg_s" << d
         << "o2_supply_kmol_s" << d << "converged";
    for (const auto& name : sweep.species_names) {
      file << d << name << "_percent";
    }
    file << '\n';
  }

  for (std::size_t i = 0; i < sweep.target_o2_percent.size(); ++i) {
    file << format_value(sweep.target_o2_percent[i]) << d << format_value(sweep.air_mass_flows[i]) << d
         << format_value(sweep.exhaust_mass_flows[i]) << d << format_value(sweep.o2_supply[i]) << d
         << sweep.converged[i];
    for (std::size_t j = 0; j < sweep.exhaust_composition.cols(); ++j) {
      file << d << format_value(sweep.exhaust_composition(i, j));
    }
    file << '\n';
  }

  if (!file) {
    return std::unexpected(FileWriteError(file_path, "write failed"));
  }
  return {};
}

auto CSVWriter::format_value(double value) const -> std::string {
  if (std::isnan(value)) {
    return "nan";
  }

  std::ostringstream oss;
  if (csv_config_.scientific_notation) {
    oss << std::scientific;
  } else {
    oss << std::fixed;
  }
  oss << std::setprecision(csv_config_.precision) << value;
  return oss.str();
}

} // namespace flue::io::output
