#include "flue/core/output_manager.hpp"
#include "flue/core/constants.hpp"
#include "flue/io/output/csv_writer.hpp"
#include "flue/io/output/hdf5_writer.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>

namespace flue::core {

auto OutputManager::initialize_output_system(const io::Configuration& config)
  -> std::expected<void, ApplicationError> {

  std::cout << "\nInitializing output system..." << std::endl;

  if (auto version = io::output::hdf5::check_version()) {
    std::cout << constants::string_processing::colors::green << "✓ HDF5 library version: "
              << constants::string_processing::colors::reset << version.value() << std::endl;
  } else {
    std::cerr << "Warning: " << version.error().message() << std::endl;
  }

  output_writer_ = std::make_unique<io::output::OutputWriter>(create_output_config(config));

  if (auto validation = output_writer_->validate_config(); !validation) {
    return std::unexpected(ApplicationError{
      "Output configuration error: " + validation.error().message(),
      constants::indexing::second
    });
  }

  std::cout << constants::string_processing::colors::green << "✓ Output system configured"
            << constants::string_processing::colors::reset << std::endl;

  return {};
}

auto OutputManager::write_results(const CalculationRunner::CalculationResult& result,
                                  const io::Configuration& config,
                                  const std::string& case_name,
                                  PerformanceMetrics& metrics)
  -> std::expected<std::vector<std::filesystem::path>, ApplicationError> {

  if (!output_writer_) {
    return std::unexpected(ApplicationError{"Output system not initialized", constants::indexing::second});
  }

  std::cout << "\n=== WRITING OUTPUT FILES ===" << std::endl;

  auto output_start = std::chrono::high_resolution_clock::now();
  auto dataset = io::output::OutputWriter::build_dataset(config, result.exhaust, result.sweep, case_name);
  auto output_result = output_writer_->write(dataset);
  auto output_end = std::chrono::high_resolution_clock::now();

  metrics.output_time = std::chrono::duration_cast<std::chrono::milliseconds>(output_end - output_start);

  if (!output_result) {
    return std::unexpected(ApplicationError{
      "Failed to write output: " + output_result.error().message(),
      constants::indexing::second
    });
  }

  // CSV output fans out into one file per table
  std::vector<std::filesystem::path> output_files;
  for (const auto& path : output_result.value()) {
    if (path.extension() == ".csv") {
      for (std::string_view table : {"exhaust", "sweep"}) {
        auto table_path = io::output::CSVWriter::table_path(path, table);
        if (std::filesystem::exists(table_path)) {
          output_files.push_back(table_path);
        }
      }
    } else {
      output_files.push_back(path);
    }
  }
  metrics.output_files = output_files;

  std::cout << constants::string_processing::colors::green << "✓ Output written successfully!"
            << constants::string_processing::colors::reset << std::endl;
  std::cout << "  Output time: " << metrics.output_time.count() << " ms" << std::endl;
  std::cout << "\nGenerated files:" << std::endl;

  for (const auto& file_path : output_files) {
    std::error_code ec;
    auto file_size = std::filesystem::file_size(file_path, ec);
    std::cout << "  " << file_path.filename().string();
    if (!ec) {
      std::cout << " (" << std::setprecision(constants::string_processing::float_precision_2) << std::fixed
                << (file_size / constants::io::bytes_to_kb) << " KB)";
    }
    std::cout << std::endl;
  }

  return output_files;
}

auto OutputManager::create_output_config(const io::Configuration& config) -> io::output::OutputConfig {
  io::output::OutputConfig output_config;
  output_config.base_directory = config.output.output_directory;
  output_config.include_timestamp = config.output.include_timestamp;

  output_config.formats.clear();
  for (auto format : config.output.formats) {
    switch (format) {
    case io::OutputConfig::Format::HDF5:
      output_config.formats.push_back(io::output::OutputFormat::HDF5);
      break;
    case io::OutputConfig::Format::CSV:
      output_config.formats.push_back(io::output::OutputFormat::CSV);
      break;
    }
  }

  return output_config;
}

} // namespace flue::core
