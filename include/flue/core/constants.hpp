#pragma once

#include <cstddef>

namespace flue::constants {

// ================================================================================================
// COMBUSTION AIR
// ================================================================================================

namespace air {
/// Mole fraction of O2 in dry combustion air
inline constexpr double o2_mole_fraction = 0.21;

/// Mole fraction of N2 in dry combustion air
inline constexpr double n2_mole_fraction = 0.79;
}  // namespace air

// ================================================================================================
// NUMERICAL TOLERANCES
// ================================================================================================

namespace tolerance {
/// Absolute bracket width at which the O2 supply bisection stops [kmol/s]
inline constexpr double bisection = 1e-6;

/// Bracket width relative to the lower bound at which the bisection stops, when
/// tighter than the absolute width
inline constexpr double bisection_relative = 1e-8;

/// Allowed deviation of a mole fraction sum from unity
inline constexpr double composition_sum = 1e-6;
}  // namespace tolerance

// ================================================================================================
// AIR REQUIREMENT SOLVER
// ================================================================================================

namespace solver {
/// Upper bracket bound as a multiple of the theoretical O2 demand
inline constexpr double bracket_factor = 5.0;

/// Hard cap on bisection iterations
inline constexpr int max_iterations = 200;

/// Number of times the upper bound may be doubled under the expand policy
inline constexpr int max_bracket_expansions = 10;
}  // namespace solver

// ================================================================================================
// CONSOLE REPORT
// ================================================================================================

namespace display {
/// Smallest exhaust mole percentage printed in the report [%]
inline constexpr double mole_percent_threshold = 0.01;

/// Smallest exhaust mass flow printed in the report [kg/s]
inline constexpr double mass_flow_threshold = 0.001;
}  // namespace display

// ================================================================================================
// SWEEP DEFAULTS
// ================================================================================================

namespace sweep {
inline constexpr double target_o2_percent_min = 1.0;
inline constexpr double target_o2_percent_max = 10.0;
inline constexpr int default_points = 10;
inline constexpr int progress_report_step = 5;
}  // namespace sweep

// ================================================================================================
// FILE I/O AND FORMATTING CONSTANTS
// ================================================================================================

namespace io {
/// HDF5 default compression level (0-9, higher = better compression)
inline constexpr int default_hdf5_compression = 6;

/// Bytes to KB conversion factor
inline constexpr double bytes_to_kb = 1024.0;

/// Invalid HDF5 handle value
inline constexpr int invalid_hdf5_handle = -1;

/// Default FLUE version string
inline constexpr const char* default_flue_version = "1.0.0";
}  // namespace io

// ================================================================================================
// ARRAY AND INDEXING CONSTANTS
// ================================================================================================

namespace indexing {
/// First array index
inline constexpr std::size_t first = 0;

/// Second array index
inline constexpr std::size_t second = 1;
}  // namespace indexing

// ================================================================================================
// STRING PROCESSING CONSTANTS
// ================================================================================================

namespace string_processing {
/// Format precision for floating point display
inline constexpr int float_precision_2 = 2;
inline constexpr int float_precision_3 = 3;

/// Field widths for tabular output
inline constexpr int medium_field_width = 8;
inline constexpr int wide_field_width = 12;
inline constexpr int separator_width = 36;

namespace colors {
inline constexpr const char* reset = "\033[0m";
inline constexpr const char* red = "\033[31m";
inline constexpr const char* green = "\033[32m";
inline constexpr const char* yellow = "\033[33m";
inline constexpr const char* blue = "\033[34m";
inline constexpr const char* cyan = "\033[36m";
}  // namespace colors
}  // namespace string_processing

// ================================================================================================
// UNIT CONVERSION FACTORS
// ================================================================================================

namespace conversion {
/// Fraction to percentage conversion factor
inline constexpr double to_percentage = 100.0;
}  // namespace conversion

}  // namespace flue::constants
