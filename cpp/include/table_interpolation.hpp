#pragma once

#include "NumCpp.hpp"

#include <functional>
#include <string>
#include <utility>

namespace chromat {
namespace algebra {

enum class TableInterpolationMethod { Trilinear, Tetrahedral };

TableInterpolationMethod parse_table_interpolation_method(const std::string& name);
std::string to_string(TableInterpolationMethod method);

// Function sampled on the table grid: N x 3 inputs to N x C outputs.
using TableFunction = std::function<nc::NdArray<double>(const nc::NdArray<double>&)>;

/**
 * @brief Number of steps L of a flattened (L*L*L x C) table.
 *
 * Throws std::invalid_argument when the row count is not a cube of at least 2.
 */
int table_size(const nc::NdArray<double>& table);

/**
 * @brief Trilinear interpolation of a flattened 3D table.
 *
 * @param V_xyz N x 3 coordinates in [0, 1] (clipped)
 * @param table (L*L*L) x C values, row (r * L + g) * L + b
 * @return N x C
 */
nc::NdArray<double> table_interpolation_trilinear(const nc::NdArray<double>& V_xyz, const nc::NdArray<double>& table);

/**
 * @brief Tetrahedral interpolation of a flattened 3D table.
 *
 * The unit cube around each query is split into 6 tetrahedra sharing the
 * V000 - V111 diagonal; the ordering of the fractional offsets selects one.
 */
nc::NdArray<double> table_interpolation_tetrahedral(const nc::NdArray<double>& V_xyz, const nc::NdArray<double>& table);

nc::NdArray<double> table_interpolation(const nc::NdArray<double>& V_xyz,
                                        const nc::NdArray<double>& table,
                                        TableInterpolationMethod method = TableInterpolationMethod::Trilinear);

/**
 * @brief Samples a function on a regular steps^3 grid over [xmin, xmax]^3.
 * @return The flattened (steps^3, C) table.
 */
nc::NdArray<double> create_table_3d(const TableFunction& function, int steps, double xmin = 0.0, double xmax = 1.0);

/**
 * @brief Builds the table for a function then applies it to data (N x 3).
 * @return Pair of (interpolated data, table)
 */
std::pair<nc::NdArray<double>, nc::NdArray<double>> compute_with_table(
    const nc::NdArray<double>& data,
    const TableFunction& function,
    int steps,
    double xmin = 0.0,
    double xmax = 1.0,
    TableInterpolationMethod method = TableInterpolationMethod::Tetrahedral);

} // namespace algebra
} // namespace chromat
