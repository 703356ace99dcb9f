#pragma once
#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace flue::core {

struct ApplicationError {
  std::string message;
  int exit_code;
};

struct CommandLineArgs {
  std::string config_file;
  std::string case_name = "combustion";
  bool help_requested = false;
};

struct ApplicationResult {
  bool success;
  int exit_code;
  std::string message;
};

struct PerformanceMetrics {
  std::chrono::milliseconds total_time{0};
  std::chrono::milliseconds solve_time{0};
  std::chrono::milliseconds output_time{0};
  std::vector<std::filesystem::path> output_files;
};

} // namespace flue::core
