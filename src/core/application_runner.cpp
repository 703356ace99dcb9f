#include "flue/core/application_runner.hpp"
#include "flue/core/constants.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <string_view>

namespace flue::core {

ApplicationRunner::ApplicationRunner()
  : config_loader_(std::make_unique<ConfigurationLoader>())
  , output_manager_(std::make_unique<OutputManager>())
  , calculation_runner_(std::make_unique<CalculationRunner>()) {
}

ApplicationRunner::~ApplicationRunner() = default;

auto ApplicationRunner::run(int argc, char* argv[]) -> ApplicationResult {
  auto start_time = std::chrono::high_resolution_clock::now();
  PerformanceMetrics metrics;

  try {
    auto args_result = parse_command_line(argc, argv);
    if (!args_result) {
      display_usage(argc > 0 ? argv[constants::indexing::first] : "flue");
      return handle_error(args_result.error());
    }
    auto args = args_result.value();

    if (args.help_requested) {
      display_usage(argv[constants::indexing::first]);
      return {true, constants::indexing::first, "Help displayed"};
    }

    display_header();

    auto config_result = config_loader_->load_configuration(args.config_file);
    if (!config_result) {
      return handle_error(config_result.error());
    }
    auto config = std::move(config_result.value());

    if (auto output_init = output_manager_->initialize_output_system(config); !output_init) {
      return handle_error(output_init.error());
    }

    auto calculation_result = calculation_runner_->run_calculation(config, metrics);
    if (!calculation_result) {
      return handle_error(calculation_result.error());
    }
    auto result = std::move(calculation_result.value());

    calculation_runner_->display_calculation_results(result, config);

    auto output_result = output_manager_->write_results(result, config, args.case_name, metrics);
    if (!output_result) {
      return handle_error(output_result.error());
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    metrics.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    display_performance_summary(metrics);
    display_completion_message();

    return {true, constants::indexing::first, "Success"};

  } catch (const std::exception& e) {
    return handle_error(ApplicationError{"Unexpected error: " + std::string(e.what()), constants::indexing::second});
  }
}

auto ApplicationRunner::parse_command_line(int argc, char* argv[])
  -> std::expected<CommandLineArgs, ApplicationError> {

  constexpr int min_required_args = 2;
  constexpr int max_accepted_args = 3;

  CommandLineArgs args;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.help_requested = true;
      return args;
    }
  }

  if (argc < min_required_args) {
    return std::unexpected(ApplicationError{"Insufficient arguments provided", constants::indexing::second});
  }
  if (argc > max_accepted_args) {
    return std::unexpected(ApplicationError{"Too many arguments provided", constants::indexing::second});
  }

  args.config_file = argv[constants::indexing::second];
  if (argc == max_accepted_args) {
    args.case_name = argv[max_accepted_args - constants::indexing::second];
  }

  return args;
}

auto ApplicationRunner::display_usage(const std::string& program_name) const -> void {
  std::cerr << "Usage: " << program_name << " <config_file.yaml> [case_name]\n"
            << "\n"
            << "Computes the combustion air requirement and exhaust composition of a fuel gas\n"
            << "burned to a residual O2 target.\n"
            << "\n"
            << "Options:\n"
            << "  -h, --help    Show this message and exit\n";
}

auto ApplicationRunner::display_header() const -> void {
  std::cout << "=== FLUE Combustion Exhaust Calculator ===" << std::endl;
}

auto ApplicationRunner::display_performance_summary(const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== PERFORMANCE SUMMARY ===" << std::endl;
  std::cout << "Total runtime: " << metrics.total_time.count() << " ms" << std::endl;
  std::cout << "  Calculation: " << metrics.solve_time.count() << " ms" << std::endl;
  std::cout << "  Output: " << metrics.output_time.count() << " ms" << std::endl;
}

auto ApplicationRunner::display_completion_message() const -> void {
  std::cout << "\n=== CALCULATION COMPLETED SUCCESSFULLY ===" << std::endl;
  std::cout << "\nPost-processing recommendations:" << std::endl;
  std::cout << "  • Open .h5 files with HDFView or Python (h5py, pandas)" << std::endl;
}

auto ApplicationRunner::handle_error(const ApplicationError& error) -> ApplicationResult {
  std::cerr << constants::string_processing::colors::red << "Error: " << error.message
            << constants::string_processing::colors::reset << std::endl;
  return {false, error.exit_code, error.message};
}

} // namespace flue::core
