#pragma once
#include "../../combustion/combustion_types.hpp"
#include "../sweep_generator.hpp"
#include "output_types.hpp"
#include <expected>
#include <memory>
#include <optional>

namespace flue::io::output {

// Abstract base class for format-specific writers
class FormatWriter {
public:
  virtual ~FormatWriter() = default;

  [[nodiscard]] virtual auto write(const std::filesystem::path& file_path, const OutputDataset& dataset,
                                   const OutputConfig& config) const -> std::expected<void, OutputError> = 0;

  [[nodiscard]] virtual auto get_extension() const noexcept -> std::string_view = 0;
};

class WriterFactory {
public:
  [[nodiscard]] static auto create_writer(OutputFormat format, const OutputConfig& config = {})
      -> std::expected<std::unique_ptr<FormatWriter>, UnsupportedFormatError>;

  [[nodiscard]] static auto get_available_formats() noexcept -> std::vector<OutputFormat>;
};

class OutputWriter {
private:
  OutputConfig config_;
  std::vector<std::unique_ptr<FormatWriter>> writers_;

  auto initialize_writers() -> void;

  [[nodiscard]] auto generate_file_paths(const std::string& case_name,
                                         const std::chrono::system_clock::time_point& timestamp) const
      -> std::vector<std::filesystem::path>;

public:
  explicit OutputWriter(OutputConfig config = {});

  // Assemble the dataset written by every format
  [[nodiscard]] static auto build_dataset(const Configuration& config,
                                          const std::optional<combustion::ExhaustResult>& exhaust,
                                          const std::optional<SweepGenerator::Result>& sweep,
                                          const std::string& case_name) -> OutputDataset;

  [[nodiscard]] auto write(const OutputDataset& dataset)
      -> std::expected<std::vector<std::filesystem::path>, OutputError>;

  [[nodiscard]] auto validate_config() const -> std::expected<void, OutputError>;

  [[nodiscard]] auto get_config() const noexcept -> const OutputConfig& { return config_; }
};

} // namespace flue::io::output
