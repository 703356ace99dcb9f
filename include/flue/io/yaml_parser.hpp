#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <algorithm>
#include <cctype>
#include <concepts>
#include <expected>
#include <format>
#include <string>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace flue::io {

class YamlParser {
private:
  YAML::Node root_;
  std::string file_path_;

  template <typename T>
  [[nodiscard]] auto extract_value(const YAML::Node& node,
                                   std::string_view key) const -> std::expected<T, core::ConfigurationError>;

  template <typename T>
  [[nodiscard]] auto extract_value_or(const YAML::Node& node, std::string_view key,
                                      T fallback) const -> std::expected<T, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto extract_enum(const YAML::Node& node, std::string_view key,
                                  const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<EnumType, core::ConfigurationError>;

  [[nodiscard]] auto parse_fuel_config(const YAML::Node& node) const
      -> std::expected<FuelConfig, core::ConfigurationError>;

  [[nodiscard]] auto parse_combustion_config(const YAML::Node& node) const
      -> std::expected<CombustionConfig, core::ConfigurationError>;

  [[nodiscard]] auto parse_numerical_config(const YAML::Node& node) const
      -> std::expected<NumericalConfig, core::ConfigurationError>;

  [[nodiscard]] auto parse_output_config(const YAML::Node& node) const
      -> std::expected<OutputConfig, core::ConfigurationError>;

  [[nodiscard]] auto parse_sweep_config(const YAML::Node& node) const
      -> std::expected<SweepConfig, core::ConfigurationError>;

public:
  explicit YamlParser(std::string file_path) : file_path_(std::move(file_path)) {}

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  [[nodiscard]] auto parse() const -> std::expected<Configuration, core::ConfigurationError>;
};

// Implementation of template methods
template <typename T>
auto YamlParser::extract_value(const YAML::Node& node,
                               std::string_view key) const -> std::expected<T, core::ConfigurationError> {
  try {
    if (!node[std::string(key)]) {
      return std::unexpected(core::ConfigurationError(std::format("Required field '{}' is missing", key)));
    }

    if constexpr (std::same_as<T, std::map<std::string, double>>) {
      auto mapping = node[std::string(key)];
      if (!mapping.IsMap()) {
        return std::unexpected(core::ConfigurationError(std::format("Field '{}' must be a mapping", key)));
      }
      std::map<std::string, double> result;
      for (const auto& item : mapping) {
        result[item.first.as<std::string>()] = item.second.as<double>();
      }
      return result;
    } else {
      return node[std::string(key)].as<T>();
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Failed to parse field '{}': {}", key, e.what())));
  }
}

template <typename T>
auto YamlParser::extract_value_or(const YAML::Node& node, std::string_view key,
                                  T fallback) const -> std::expected<T, core::ConfigurationError> {
  if (!node || !node[std::string(key)]) {
    return fallback;
  }
  return extract_value<T>(node, key);
}

template <typename EnumType>
auto YamlParser::extract_enum(const YAML::Node& node, std::string_view key,
                              const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  auto str_result = extract_value<std::string>(node, key);
  if (!str_result) {
    return std::unexpected(str_result.error());
  }

  auto str_value = str_result.value();
  std::ranges::transform(str_value, str_value.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  auto it = mapping.find(str_value);
  if (it == mapping.end()) {
    std::string valid_options;
    for (const auto& [option, _] : mapping) {
      valid_options += option + ", ";
    }
    valid_options = valid_options.substr(0, valid_options.length() - 2);

    return std::unexpected(core::ConfigurationError(
        std::format("Invalid value '{}' for field '{}'. Valid options: {}", str_value, key, valid_options)));
  }

  return it->second;
}

// Enum mappings
namespace enum_mappings {

inline const std::unordered_map<std::string, FuelConfig::Units> composition_units = {
    {"percent", FuelConfig::Units::Percent},
    {"%", FuelConfig::Units::Percent},
    {"fraction", FuelConfig::Units::Fraction},
    {"mole_fraction", FuelConfig::Units::Fraction}};

inline const std::unordered_map<std::string, combustion::UnreachableTargetPolicy> unreachable_target_policies = {
    {"fail", combustion::UnreachableTargetPolicy::Fail},
    {"clamp", combustion::UnreachableTargetPolicy::Clamp},
    {"expand", combustion::UnreachableTargetPolicy::Expand},
    {"expand_bracket", combustion::UnreachableTargetPolicy::Expand}};

inline const std::unordered_map<std::string, OutputConfig::Format> output_formats = {
    {"hdf5", OutputConfig::Format::HDF5},
    {"h5", OutputConfig::Format::HDF5},
    {"csv", OutputConfig::Format::CSV}};

} // namespace enum_mappings

} // namespace flue::io
