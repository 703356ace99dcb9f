#include "flue/io/yaml_parser.hpp"
#include "flue/core/constants.hpp"
#include "flue/core/exceptions.hpp"
#include "flue/io/fuel_presets.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace flue::io {

auto YamlParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile& e) {
    return std::unexpected(core::FileError{"Failed to open YAML file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  } catch (const std::exception& e) {
    return std::unexpected(core::FileError{std::format("Unexpected error during YAML load: {}", e.what()), file_path_});
  }
}

auto YamlParser::parse() const -> std::expected<Configuration, core::ConfigurationError> {
  try {
    if (!root_ || root_.IsNull()) {
      return std::unexpected(core::ConfigurationError("No YAML content loaded. Call load() first."));
    }

    if (!root_["fuel"]) {
      return std::unexpected(core::ConfigurationError("Missing required 'fuel' section."));
    }

    Configuration config;

    auto fuel_result = parse_fuel_config(root_["fuel"]);
    if (!fuel_result) {
      return std::unexpected(fuel_result.error());
    }
    config.fuel = std::move(fuel_result.value());

    // numerical, output and sweep fall back to defaults when absent
    auto num_result = parse_numerical_config(root_["numerical"]);
    if (!num_result) {
      return std::unexpected(num_result.error());
    }
    config.numerical = num_result.value();

    auto out_result = parse_output_config(root_["output"]);
    if (!out_result) {
      return std::unexpected(out_result.error());
    }
    config.output = std::move(out_result.value());

    auto sweep_result = parse_sweep_config(root_["sweep"]);
    if (!sweep_result) {
      return std::unexpected(sweep_result.error());
    }
    config.sweep = sweep_result.value();

    // A sweep supplies its own targets, so the single-point target is optional there
    if (root_["combustion"]) {
      auto combustion_result = parse_combustion_config(root_["combustion"]);
      if (!combustion_result) {
        return std::unexpected(combustion_result.error());
      }
      config.combustion = combustion_result.value();
    } else if (!config.sweep.enabled) {
      return std::unexpected(core::ConfigurationError("Missing required 'combustion' section."));
    }

    return config;

  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("YAML error: {}", e.what())));
  }
}

auto YamlParser::parse_fuel_config(const YAML::Node& node) const
    -> std::expected<FuelConfig, core::ConfigurationError> {

  FuelConfig config;

  auto preset_result = extract_value_or<std::string>(node, "preset", "");
  if (!preset_result)
    return std::unexpected(preset_result.error());
  if (!preset_result.value().empty()) {
    config.preset = preset_result.value();
    auto preset = find_preset(*config.preset);
    if (!preset)
      return std::unexpected(preset.error());
    config.raw_composition = std::move(preset.value());
    config.units = FuelConfig::Units::Percent;
  }

  if (node["units"]) {
    auto units_result = extract_enum(node, "units", enum_mappings::composition_units);
    if (!units_result)
      return std::unexpected(units_result.error());
    if (config.preset && units_result.value() != FuelConfig::Units::Percent) {
      return std::unexpected(core::ValidationError("fuel.units", "preset compositions are in percent"));
    }
    config.units = units_result.value();
  }

  // Explicit entries override preset entries species by species
  if (node["composition"]) {
    auto comp_result = extract_value<std::map<std::string, double>>(node, "composition");
    if (!comp_result)
      return std::unexpected(comp_result.error());

    for (const auto& [name, value] : comp_result.value()) {
      config.raw_composition[name] = value;
    }
  }

  if (config.raw_composition.empty()) {
    return std::unexpected(
        core::ConfigurationError("In 'fuel' section: either 'preset' or 'composition' must be given"));
  }

  auto normalize_result = extract_value_or<bool>(node, "normalize", true);
  if (!normalize_result)
    return std::unexpected(normalize_result.error());
  config.normalize = normalize_result.value();

  auto mass_flow_result = extract_value<double>(node, "mass_flow");
  if (!mass_flow_result)
    return std::unexpected(mass_flow_result.error());
  config.mass_flow = mass_flow_result.value();
  if (!std::isfinite(config.mass_flow) || config.mass_flow <= 0.0) {
    return std::unexpected(
        core::ValidationError("fuel.mass_flow", std::format("must be positive, got {} kg/s", config.mass_flow)));
  }

  auto composition_result = build_composition(config.raw_composition, config.units, config.normalize);
  if (!composition_result)
    return std::unexpected(composition_result.error());
  config.composition = composition_result.value();

  return config;
}

auto YamlParser::parse_combustion_config(const YAML::Node& node) const
    -> std::expected<CombustionConfig, core::ConfigurationError> {

  CombustionConfig config;

  if (node["target_o2_percent"] && node["target_o2_fraction"]) {
    return std::unexpected(core::ConfigurationError(
        "In 'combustion' section: give either 'target_o2_percent' or 'target_o2_fraction', not both"));
  }

  if (node["target_o2_percent"]) {
    auto percent_result = extract_value<double>(node, "target_o2_percent");
    if (!percent_result)
      return std::unexpected(percent_result.error());
    config.target_o2_fraction = percent_result.value() / constants::conversion::to_percentage;
  } else {
    auto fraction_result = extract_value<double>(node, "target_o2_fraction");
    if (!fraction_result)
      return std::unexpected(core::ConfigurationError(
          std::format("In 'combustion' section: {}", fraction_result.error().message())));
    config.target_o2_fraction = fraction_result.value();
  }

  if (!std::isfinite(config.target_o2_fraction) || config.target_o2_fraction <= 0.0 ||
      config.target_o2_fraction >= 1.0) {
    return std::unexpected(core::ValidationError(
        "combustion.target_o2", std::format("must lie strictly between 0 and 100%, got {}%",
                                            config.target_o2_fraction * constants::conversion::to_percentage)));
  }

  return config;
}

auto YamlParser::parse_numerical_config(const YAML::Node& node) const
    -> std::expected<NumericalConfig, core::ConfigurationError> {

  NumericalConfig config;
  auto& solver = config.solver;

  if (!node) {
    return config;
  }

  auto tol_result = extract_value_or<double>(node, "bisection_tolerance", solver.tolerance);
  if (!tol_result)
    return std::unexpected(tol_result.error());
  solver.tolerance = tol_result.value();

  auto rel_tol_result =
      extract_value_or<double>(node, "bisection_relative_tolerance", solver.relative_tolerance);
  if (!rel_tol_result)
    return std::unexpected(rel_tol_result.error());
  solver.relative_tolerance = rel_tol_result.value();

  auto factor_result = extract_value_or<double>(node, "bracket_factor", solver.bracket_factor);
  if (!factor_result)
    return std::unexpected(factor_result.error());
  solver.bracket_factor = factor_result.value();

  auto max_iter_result = extract_value_or<int>(node, "max_iterations", solver.max_iterations);
  if (!max_iter_result)
    return std::unexpected(max_iter_result.error());
  solver.max_iterations = max_iter_result.value();

  auto expansions_result = extract_value_or<int>(node, "max_bracket_expansions", solver.max_bracket_expansions);
  if (!expansions_result)
    return std::unexpected(expansions_result.error());
  solver.max_bracket_expansions = expansions_result.value();

  if (node["unreachable_target_policy"]) {
    auto policy_result = extract_enum(node, "unreachable_target_policy", enum_mappings::unreachable_target_policies);
    if (!policy_result)
      return std::unexpected(policy_result.error());
    solver.unreachable_target_policy = policy_result.value();
  }

  if (!(solver.tolerance > 0.0)) {
    return std::unexpected(core::ValidationError("numerical.bisection_tolerance", "must be positive"));
  }
  if (!(solver.relative_tolerance >= 0.0) || !std::isfinite(solver.relative_tolerance)) {
    return std::unexpected(core::ValidationError("numerical.bisection_relative_tolerance", "must be non-negative"));
  }
  if (!(solver.bracket_factor > 1.0)) {
    return std::unexpected(core::ValidationError("numerical.bracket_factor", "must be greater than 1"));
  }
  if (solver.max_iterations <= 0) {
    return std::unexpected(core::ValidationError("numerical.max_iterations", "must be positive"));
  }
  if (solver.max_bracket_expansions < 0) {
    return std::unexpected(core::ValidationError("numerical.max_bracket_expansions", "must be non-negative"));
  }

  return config;
}

auto YamlParser::parse_output_config(const YAML::Node& node) const
    -> std::expected<OutputConfig, core::ConfigurationError> {

  OutputConfig config;

  if (!node) {
    return config;
  }

  try {
    auto output_dir_result = extract_value_or<std::string>(node, "output_directory", config.output_directory);
    if (!output_dir_result)
      return std::unexpected(output_dir_result.error());
    config.output_directory = output_dir_result.value();

    auto timestamp_result = extract_value_or<bool>(node, "include_timestamp", config.include_timestamp);
    if (!timestamp_result)
      return std::unexpected(timestamp_result.error());
    config.include_timestamp = timestamp_result.value();

    auto mole_threshold_result =
        extract_value_or<double>(node, "mole_fraction_display_threshold", config.mole_fraction_display_threshold);
    if (!mole_threshold_result)
      return std::unexpected(mole_threshold_result.error());
    config.mole_fraction_display_threshold = mole_threshold_result.value();

    auto mass_threshold_result =
        extract_value_or<double>(node, "mass_flow_display_threshold", config.mass_flow_display_threshold);
    if (!mass_threshold_result)
      return std::unexpected(mass_threshold_result.error());
    config.mass_flow_display_threshold = mass_threshold_result.value();

    if (node["formats"]) {
      auto formats_result = extract_value<std::vector<std::string>>(node, "formats");
      if (!formats_result)
        return std::unexpected(formats_result.error());

      config.formats.clear();
      for (auto name : formats_result.value()) {
        std::ranges::transform(name, name.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = enum_mappings::output_formats.find(name);
        if (it == enum_mappings::output_formats.end()) {
          return std::unexpected(core::ValidationError("output.formats", std::format("unknown format '{}'", name)));
        }
        if (std::ranges::find(config.formats, it->second) == config.formats.end()) {
          config.formats.push_back(it->second);
        }
      }
      if (config.formats.empty()) {
        return std::unexpected(core::ValidationError("output.formats", "at least one format is required"));
      }
    }

    return config;

  } catch (const core::ConfigurationError& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'output' section: {}", e.message())));
  }
}

auto YamlParser::parse_sweep_config(const YAML::Node& node) const
    -> std::expected<SweepConfig, core::ConfigurationError> {

  SweepConfig config;

  if (!node) {
    return config;
  }

  auto enabled_result = extract_value_or<bool>(node, "enabled", false);
  if (!enabled_result)
    return std::unexpected(enabled_result.error());
  config.enabled = enabled_result.value();

  if (!config.enabled) {
    return config;
  }

  auto min_result = extract_value<double>(node, "target_o2_percent_min");
  if (!min_result)
    return std::unexpected(min_result.error());
  config.target_o2_percent_min = min_result.value();

  auto max_result = extract_value<double>(node, "target_o2_percent_max");
  if (!max_result)
    return std::unexpected(max_result.error());
  config.target_o2_percent_max = max_result.value();

  auto points_result = extract_value_or<int>(node, "points", config.points);
  if (!points_result)
    return std::unexpected(points_result.error());
  config.points = points_result.value();

  if (config.target_o2_percent_min <= 0.0 || config.target_o2_percent_max >= constants::conversion::to_percentage ||
      config.target_o2_percent_min >= config.target_o2_percent_max) {
    return std::unexpected(core::ValidationError(
        "sweep", std::format("target range must satisfy 0 < min < max < 100, got [{}, {}]",
                             config.target_o2_percent_min, config.target_o2_percent_max)));
  }
  if (config.points < 2) {
    return std::unexpected(core::ValidationError("sweep.points", "at least 2 points are required"));
  }

  return config;
}

} // namespace flue::io
