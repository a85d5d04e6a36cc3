#pragma once

#include "NumCpp.hpp"

#include <string>
#include <vector>

namespace chromat {
namespace config {

// Constants
constexpr int DEFAULT_KERNEL_WINDOW = 3;
constexpr double DEFAULT_LANCZOS_A = 3.0;
constexpr double DEFAULT_SINC_A = 3.0;
constexpr double DEFAULT_CARDINAL_SPLINE_A = 0.5;
constexpr double DEFAULT_CARDINAL_SPLINE_B = 0.0;
constexpr int SPRAGUE_MINIMUM_POINTS = 6;

// Tolerances used by the null interpolator and the uniformity check.
constexpr double TOLERANCE_ABSOLUTE = 1e-6;
constexpr double TOLERANCE_RELATIVE = 1e-6;
constexpr double TOLERANCE_INTERVAL = 1e-9;

constexpr int DEFAULT_TABLE_STEPS = 33;

/**
 * @brief Domain-range scale of the colour model functions.
 *
 * Every leaf colour function takes the scale explicitly instead of reading
 * a process wide setting.
 *   - Reference: each function's own reference scale.
 *   - One: domain and range normalised to [0, 1].
 *   - Hundred: domain and range normalised to [0, 100].
 */
enum class ScaleMode { Reference, One, Hundred };

ScaleMode parse_scale_mode(const std::string& name);
std::string to_string(ScaleMode mode);

// Domain conversion, applied to function inputs.
nc::NdArray<double> to_domain_1(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor = 100.0);
nc::NdArray<double> to_domain_10(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor = 10.0);
nc::NdArray<double> to_domain_100(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor = 100.0);
nc::NdArray<double> to_domain_degrees(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor = 360.0);
nc::NdArray<double> to_domain_int(const nc::NdArray<double>& a, ScaleMode mode, int bit_depth = 8);

// Range conversion, applied to function outputs.
nc::NdArray<double> from_range_1(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor = 100.0);
nc::NdArray<double> from_range_10(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor = 10.0);
nc::NdArray<double> from_range_100(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor = 100.0);
nc::NdArray<double> from_range_degrees(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor = 360.0);
nc::NdArray<double> from_range_int(const nc::NdArray<double>& a, ScaleMode mode, int bit_depth = 8);

// Reference scale of one column of a multi-column quantity, e.g. xyY is
// {Fixed, Fixed, Unit} and LCHab is {Percent, Percent, Degrees}.
enum class ScaleKind { Fixed, Unit, Percent, Degrees };
using ScaleKinds = std::vector<ScaleKind>;

// Column-wise domain / range conversion of an N x kinds.size() array.
nc::NdArray<double> to_domain(const nc::NdArray<double>& a, ScaleMode mode, const ScaleKinds& kinds);
nc::NdArray<double> from_range(const nc::NdArray<double>& a, ScaleMode mode, const ScaleKinds& kinds);

} // namespace config
} // namespace chromat
