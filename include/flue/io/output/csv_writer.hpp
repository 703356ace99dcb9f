#pragma once
#include "output_writer.hpp"
#include <fstream>

namespace flue::io::output {

struct CSVConfig {
  char delimiter = ',';
  int precision = 8;
  bool include_headers = true;
  bool scientific_notation = false;
};

// Writes <stem>_exhaust.csv and, in sweep mode, <stem>_sweep.csv next to the
// path handed in by OutputWriter
class CSVWriter : public FormatWriter {
private:
  CSVConfig csv_config_;

  [[nodiscard]] auto write_exhaust_table(const std::filesystem::path& file_path,
                                         const ExhaustData& exhaust) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_sweep_table(const std::filesystem::path& file_path,
                                       const SweepData& sweep) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto format_value(double value) const -> std::string;

public:
  explicit CSVWriter(CSVConfig config = {}) : csv_config_(config) {}

  [[nodiscard]] auto write(const std::filesystem::path& file_path, const OutputDataset& dataset,
                           const OutputConfig& config) const -> std::expected<void, OutputError> override;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view override { return ".csv"; }

  [[nodiscard]] static auto table_path(const std::filesystem::path& file_path,
                                       std::string_view table) -> std::filesystem::path;
};

} // namespace flue::io::output
