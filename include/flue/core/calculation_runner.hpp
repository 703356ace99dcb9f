#pragma once
#include "../combustion/combustion_types.hpp"
#include "../io/config_types.hpp"
#include "../io/sweep_generator.hpp"
#include "application_types.hpp"
#include <expected>
#include <optional>

namespace flue::core {

class CalculationRunner {
public:
  struct CalculationResult {
    std::optional<combustion::ExhaustResult> exhaust;
    std::optional<io::SweepGenerator::Result> sweep;
  };

  // Single operating point, or the target sweep when enabled
  [[nodiscard]] auto run_calculation(const io::Configuration& config, PerformanceMetrics& metrics)
    -> std::expected<CalculationResult, ApplicationError>;

  auto display_calculation_results(const CalculationResult& result, const io::Configuration& config) const -> void;

private:
  [[nodiscard]] auto run_single_point(const combustion::ExhaustCalculator& calculator,
                                      const io::Configuration& config)
    -> std::expected<combustion::ExhaustResult, ApplicationError>;

  [[nodiscard]] auto run_sweep(const combustion::ExhaustCalculator& calculator, const io::Configuration& config)
    -> std::expected<io::SweepGenerator::Result, ApplicationError>;

  auto display_exhaust_report(const combustion::ExhaustResult& exhaust, const io::OutputConfig& output) const -> void;

  auto display_sweep_table(const io::SweepGenerator::Result& sweep) const -> void;
};

} // namespace flue::core
