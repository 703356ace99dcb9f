#pragma once
#include "../io/config_types.hpp"
#include "../io/output/output_writer.hpp"
#include "application_types.hpp"
#include "calculation_runner.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace flue::core {

class OutputManager {
public:
  [[nodiscard]] auto initialize_output_system(const io::Configuration& config)
    -> std::expected<void, ApplicationError>;

  [[nodiscard]] auto write_results(const CalculationRunner::CalculationResult& result,
                                   const io::Configuration& config,
                                   const std::string& case_name,
                                   PerformanceMetrics& metrics)
    -> std::expected<std::vector<std::filesystem::path>, ApplicationError>;

  [[nodiscard]] static auto create_output_config(const io::Configuration& config) -> io::output::OutputConfig;

private:
  std::unique_ptr<io::output::OutputWriter> output_writer_;
};

} // namespace flue::core
