#include "flue/io/output/hdf5_writer.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <tuple>
#include <vector>

namespace flue::io::output {

auto HDF5Writer::write(const std::filesystem::path& file_path, const OutputDataset& dataset,
                       const OutputConfig& config) const -> std::expected<void, OutputError> {

  try {
    auto file_result = create_file(file_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    if (auto result = write_metadata(file, dataset.metadata); !result) {
      return std::unexpected(result.error());
    }

    if (auto result = write_fuel(file, dataset.fuel); !result) {
      return std::unexpected(result.error());
    }

    if (dataset.exhaust) {
      if (auto result = write_exhaust(file, *dataset.exhaust); !result) {
        return std::unexpected(result.error());
      }
    }

    if (dataset.sweep) {
      if (auto result = write_sweep(file, *dataset.sweep); !result) {
        return std::unexpected(result.error());
      }
    }

    return {};

  } catch (const OutputError& e) {
    return std::unexpected(OutputError(std::format("HDF5 write failed: {}", e.message())));
  }
}

auto HDF5Writer::create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError> {

  auto fapl = H5Pcreate(H5P_FILE_ACCESS);
  if (fapl < 0) {
    return std::unexpected(OutputError("Failed to create file access property list"));
  }
  PropertyHandle access_props(fapl);

  H5Pset_fclose_degree(access_props, H5F_CLOSE_STRONG);

  auto file_id = H5Fcreate(file_path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, access_props);
  if (file_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create HDF5 file: {}", file_path.string())));
  }

  return FileHandle(file_id);
}

auto HDF5Writer::write_metadata(FileHandle& file,
                                const CalculationMetadata& metadata) const -> std::expected<void, OutputError> {

  auto group_result = create_group(file, "metadata");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  if (auto result = write_string(group, "flue_version", metadata.flue_version); !result) {
    return std::unexpected(result.error());
  }

  auto time_t = std::chrono::system_clock::to_time_t(metadata.creation_time);
  auto tm = *std::gmtime(&time_t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  if (auto result = write_string(group, "creation_time", oss.str()); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string(group, "case_name", metadata.case_name); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string(group, "unreachable_target_policy", metadata.unreachable_target_policy); !result) {
    return std::unexpected(result.error());
  }

  if (auto result = write_string_array(group, "species_names", metadata.species_names); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(group, "species_molecular_weights", metadata.species_molecular_weights, "kg/kmol");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(group, "target_o2_fraction", metadata.target_o2_fraction, "-",
                                 "Residual O2 mole fraction requested in the exhaust");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(group, "bisection_tolerance", metadata.bisection_tolerance, "kmol/s"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(group, "bracket_factor", metadata.bracket_factor); !result) {
    return std::unexpected(result.error());
  }

  return {};
}

auto HDF5Writer::write_fuel(FileHandle& file, const FuelData& fuel) const -> std::expected<void, OutputError> {

  auto group_result = create_group(file, "fuel");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  if (auto result = write_string_array(group, "species_names", fuel.species_names); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(group, "mole_fractions", fuel.mole_fractions, "-"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(group, "mass_flow", fuel.mass_flow, "kg/s"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(group, "molar_flow", fuel.molar_flow, "kmol/s"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(group, "average_molecular_weight", fuel.average_molecular_weight, "kg/kmol");
      !result) {
    return std::unexpected(result.error());
  }

  return {};
}

auto HDF5Writer::write_exhaust(FileHandle& file,
                               const ExhaustData& exhaust) const -> std::expected<void, OutputError> {

  auto group_result = create_group(file, "exhaust");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  if (auto result = write_string_array(group, "species_names", exhaust.species_names); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(group, "mole_percent", exhaust.mole_percent, "%"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(group, "molar_flows", exhaust.molar_flows, "kmol/s"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(group, "mass_flows", exhaust.mass_flows, "kg/s"); !result) {
    return std::unexpected(result.error());
  }

  const std::vector<std::tuple<std::string, double, std::string>> scalars = {
      {"total_mass_flow", exhaust.total_mass_flow, "kg/s"},
      {"total_molar_flow", exhaust.total_molar_flow, "kmol/s"},
      {"air_mass_flow", exhaust.air_mass_flow, "kg/s"},
      {"air_molar_flow", exhaust.air_molar_flow, "kmol/s"},
      {"o2_supply", exhaust.o2_supply, "kmol/s"},
      {"theoretical_o2", exhaust.theoretical_o2, "kmol/s"},
      {"solver_iterations", static_cast<double>(exhaust.solver_iterations), "-"},
      {"target_clamped", exhaust.target_clamped ? 1.0 : 0.0, "-"}};

  for (const auto& [name, value, units] : scalars) {
    if (auto result = write_scalar(group, name, value, units); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_sweep(FileHandle& file, const SweepData& sweep) const -> std::expected<void, OutputError> {

  auto group_result = create_group(file, "sweep");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  if (auto result = write_vector(group, "target_o2_percent", sweep.target_o2_percent, "%"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(group, "air_mass_flows", sweep.air_mass_flows, "kg/s", "NaN where the point failed");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(group, "exhaust_mass_flows", sweep.exhaust_mass_flows, "kg/s"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(group, "o2_supply", sweep.o2_supply, "kmol/s"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string_array(group, "species_names", sweep.species_names); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_matrix(group, "exhaust_composition", sweep.exhaust_composition, "%",
                                 "Exhaust mole percent [n_points x n_species]");
      !result) {
    return std::unexpected(result.error());
  }

  std::vector<double> converged(sweep.converged.begin(), sweep.converged.end());
  if (auto result = write_vector(group, "converged", converged, "-", "1 where the target was met exactly"); !result) {
    return std::unexpected(result.error());
  }

  return {};
}

auto HDF5Writer::create_group(hid_t parent, const std::string& name) const -> std::expected<GroupHandle, OutputError> {

  auto group_id = H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create group '{}'", name)));
  }

  return GroupHandle(group_id);
}

auto HDF5Writer::write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                              const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {

  if (data.empty()) {
    return {};
  }

  std::vector<hsize_t> dims = {data.size()};
  auto space_id = H5Screate_simple(1, dims.data(), nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_chunked_properties(dims);
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  if (H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  return write_annotations(dataset, units, description);
}

auto HDF5Writer::write_matrix(hid_t parent, const std::string& name, const core::Matrix<double>& data,
                              const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {

  if (data.rows() == 0 || data.cols() == 0) {
    return {};
  }

  std::vector<hsize_t> dims = {static_cast<hsize_t>(data.rows()), static_cast<hsize_t>(data.cols())};
  auto space_id = H5Screate_simple(2, dims.data(), nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for matrix '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_chunked_properties(dims);
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  // core::Matrix is row-major, matching the HDF5 layout
  if (H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write matrix data for '{}'", name)));
  }

  return write_annotations(dataset, units, description);
}

auto HDF5Writer::write_scalar(hid_t parent, const std::string& name, double value, const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  if (H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write scalar value for '{}'", name)));
  }

  return write_annotations(dataset, units, description);
}

auto HDF5Writer::write_annotations(hid_t dataset, const std::string& units,
                                   const std::string& description) const -> std::expected<void, OutputError> {
  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }
  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }
  return {};
}

auto HDF5Writer::write_string(hid_t parent, const std::string& name,
                              const std::string& value) const -> std::expected<void, OutputError> {

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  // Zero-length string types are rejected by HDF5
  H5Tset_size(string_type, std::max<std::size_t>(value.length(), 1));
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto attr_id = H5Acreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string attribute '{}'", name)));
  }
  AttributeHandle attribute(attr_id);

  if (H5Awrite(attribute, string_type, value.c_str()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string attribute '{}'", name)));
  }

  return {};
}

auto HDF5Writer::write_string_array(hid_t parent, const std::string& name,
                                    const std::vector<std::string>& values) const -> std::expected<void, OutputError> {

  if (values.empty()) {
    return {};
  }

  std::size_t max_len = 0;
  for (const auto& str : values) {
    max_len = std::max(max_len, str.length());
  }
  ++max_len; // null terminator

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  H5Tset_size(string_type, max_len);
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  hsize_t dims = values.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string array '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string array dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  std::vector<char> buffer(values.size() * max_len, '\0');
  for (std::size_t i = 0; i < values.size(); ++i) {
    std::strncpy(&buffer[i * max_len], values[i].c_str(), max_len - 1);
  }

  if (H5Dwrite(dataset, string_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string array data for '{}'", name)));
  }

  return {};
}

auto HDF5Writer::create_chunked_properties(const std::vector<hsize_t>& dims) const
    -> std::expected<PropertyHandle, OutputError> {

  auto plist_id = H5Pcreate(H5P_DATASET_CREATE);
  if (plist_id < 0) {
    return std::unexpected(OutputError("Failed to create dataset property list"));
  }
  PropertyHandle props(plist_id);

  if (hdf5_config_.compression_level <= 0) {
    return props;
  }

  // Chunk extents must not exceed the data extents
  std::vector<hsize_t> chunk_dims(dims.size());
  for (std::size_t i = 0; i < dims.size(); ++i) {
    chunk_dims[i] = std::max<hsize_t>(1, std::min<hsize_t>(dims[i], hdf5_config_.chunk_size));
  }

  if (H5Pset_chunk(props, static_cast<int>(chunk_dims.size()), chunk_dims.data()) < 0) {
    return std::unexpected(OutputError("Failed to set chunking"));
  }

  if (hdf5_config_.use_shuffle_filter) {
    H5Pset_shuffle(props);
  }
  H5Pset_deflate(props, hdf5_config_.compression_level);

  return props;
}

namespace hdf5 {

auto check_version() -> std::expected<std::string, OutputError> {
  unsigned majnum, minnum, relnum;
  if (H5get_libversion(&majnum, &minnum, &relnum) < 0) {
    return std::unexpected(OutputError("Failed to get HDF5 version"));
  }

  return std::format("{}.{}.{}", majnum, minnum, relnum);
}

} // namespace hdf5

} // namespace flue::io::output
