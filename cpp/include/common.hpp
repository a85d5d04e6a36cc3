#pragma once

#include "NumCpp.hpp"

#include <array>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace chromat {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

namespace utils {

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------

/**
 * @brief Writes a non-fatal "[tag] WARNING: message" line to std::cerr.
 */
void runtime_warning(const std::string& tag, const std::string& message);

void set_warnings_enabled(bool enabled);
bool warnings_enabled();

// ---------------------------------------------------------------------------
// Strings
// ---------------------------------------------------------------------------

std::string to_lower(const std::string& value);

// Joins values with a separator, e.g. join({"a", "b"}, ", ") == "a, b".
std::string join(const std::vector<std::string>& values, const std::string& separator);

// ---------------------------------------------------------------------------
// Array helpers
// ---------------------------------------------------------------------------

std::vector<double> to_vector(const nc::NdArray<double>& a);
nc::NdArray<double> to_row(const std::vector<double>& values);

// Sorted unique intervals between consecutive values, merged within tolerance.
std::vector<double> interval(const std::vector<double>& distribution);
bool is_uniform(const std::vector<double>& distribution);

// Index of the value closest to x.
std::size_t closest_index(const std::vector<double>& values, double x);

bool is_close(double a, double b, double rtol = 1e-9, double atol = 0.0);
// Equality treating NaN as equal to NaN.
bool same_value(double a, double b);
bool same_values(const std::vector<double>& a, const std::vector<double>& b);

// Repeats values cyclically to the given size (numpy.resize semantics).
std::vector<double> resize_cyclic(const std::vector<double>& values, std::size_t size);

// Indices selected by a slice over a sequence of the given size, with
// negative start / stop counted from the end.
std::vector<std::size_t> slice_indices(const nc::Slice& slice, std::size_t size);

// Sign preserving power.
double spow(double a, double p);

// Throws std::invalid_argument unless a is an N x columns array.
void require_columns(const nc::NdArray<double>& a, std::size_t columns, const std::string& what);

} // namespace utils

namespace algebra {

using Matrix3 = std::array<std::array<double, 3>, 3>;
using Vector3 = std::array<double, 3>;

Matrix3 identity3();
Matrix3 matmul(const Matrix3& a, const Matrix3& b);
Vector3 matmul(const Matrix3& m, const Vector3& v);
Matrix3 inverse(const Matrix3& m);
Matrix3 diagonal(const Vector3& v);

// Applies m to every row of an N x 3 array.
nc::NdArray<double> vector_dot(const Matrix3& m, const nc::NdArray<double>& rows);

} // namespace algebra
} // namespace chromat
