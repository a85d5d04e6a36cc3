#include "table_interpolation.hpp"
#include "common.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace chromat {
namespace algebra {

namespace {

struct Cell {
    int r0, g0, b0;
    int r1, g1, b1;
    double x, y, z;  // fractional offsets along r, g, b
};

Cell locate(const nc::NdArray<double>& V_xyz, nc::uint32 row, int L) {
    const int i_m = L - 1;
    Cell c{};
    double v[3];
    for (nc::uint32 k = 0; k < 3; ++k) {
        v[k] = std::clamp(V_xyz(row, k), 0.0, 1.0) * i_m;
    }
    const int f0 = static_cast<int>(std::floor(v[0]));
    const int f1 = static_cast<int>(std::floor(v[1]));
    const int f2 = static_cast<int>(std::floor(v[2]));
    c.r0 = std::min(f0, i_m);
    c.g0 = std::min(f1, i_m);
    c.b0 = std::min(f2, i_m);
    c.r1 = std::min(c.r0 + 1, i_m);
    c.g1 = std::min(c.g0 + 1, i_m);
    c.b1 = std::min(c.b0 + 1, i_m);
    c.x = v[0] - c.r0;
    c.y = v[1] - c.g0;
    c.z = v[2] - c.b0;
    return c;
}

inline nc::uint32 node(int r, int g, int b, int L) {
    return static_cast<nc::uint32>((r * L + g) * L + b);
}

void validate_query(const nc::NdArray<double>& V_xyz, const std::string& what) {
    utils::require_columns(V_xyz, 3, what);
    for (const double v : V_xyz) {
        if (std::isnan(v)) {
            utils::runtime_warning("Table", what + ": NaN coordinates propagate to the output");
            return;
        }
    }
}

} // namespace

TableInterpolationMethod parse_table_interpolation_method(const std::string& name) {
    const std::string key = utils::to_lower(name);
    if (key == "trilinear") return TableInterpolationMethod::Trilinear;
    if (key == "tetrahedral") return TableInterpolationMethod::Tetrahedral;
    throw std::invalid_argument("Invalid table interpolation method \"" + name +
                                "\", accepted values are: Trilinear, Tetrahedral");
}

std::string to_string(TableInterpolationMethod method) {
    return method == TableInterpolationMethod::Trilinear ? "Trilinear" : "Tetrahedral";
}

int table_size(const nc::NdArray<double>& table) {
    const auto rows = static_cast<long long>(table.shape().rows);
    long long L = static_cast<long long>(std::llround(std::cbrt(static_cast<double>(rows))));
    if (L < 2 || L * L * L != rows || table.shape().cols == 0) {
        throw std::invalid_argument("Table must be a flattened (L*L*L x C) array with L >= 2, got " +
                                    std::to_string(table.shape().rows) + " x " +
                                    std::to_string(table.shape().cols));
    }
    return static_cast<int>(L);
}

nc::NdArray<double> table_interpolation_trilinear(const nc::NdArray<double>& V_xyz, const nc::NdArray<double>& table) {
    const int L = table_size(table);
    validate_query(V_xyz, "table_interpolation_trilinear");
    const nc::uint32 N = V_xyz.shape().rows;
    const nc::uint32 C = table.shape().cols;

    nc::NdArray<double> out(N, C);
    for (nc::uint32 i = 0; i < N; ++i) {
        if (std::isnan(V_xyz(i, 0)) || std::isnan(V_xyz(i, 1)) || std::isnan(V_xyz(i, 2))) {
            for (nc::uint32 c = 0; c < C; ++c) out(i, c) = std::numeric_limits<double>::quiet_NaN();
            continue;
        }
        const Cell cell = locate(V_xyz, i, L);
        const int rs[2] = {cell.r0, cell.r1};
        const int gs[2] = {cell.g0, cell.g1};
        const int bs[2] = {cell.b0, cell.b1};
        const double wr[2] = {1.0 - cell.x, cell.x};
        const double wg[2] = {1.0 - cell.y, cell.y};
        const double wb[2] = {1.0 - cell.z, cell.z};

        for (nc::uint32 c = 0; c < C; ++c) {
            double sum = 0.0;
            for (int a = 0; a < 2; ++a) {
                for (int b = 0; b < 2; ++b) {
                    for (int d = 0; d < 2; ++d) {
                        const double w = wr[a] * wg[b] * wb[d];
                        if (w == 0.0) continue;
                        sum += w * table(node(rs[a], gs[b], bs[d], L), c);
                    }
                }
            }
            out(i, c) = sum;
        }
    }
    return out;
}

nc::NdArray<double> table_interpolation_tetrahedral(const nc::NdArray<double>& V_xyz, const nc::NdArray<double>& table) {
    const int L = table_size(table);
    validate_query(V_xyz, "table_interpolation_tetrahedral");
    const nc::uint32 N = V_xyz.shape().rows;
    const nc::uint32 C = table.shape().cols;

    nc::NdArray<double> out(N, C);
    for (nc::uint32 i = 0; i < N; ++i) {
        if (std::isnan(V_xyz(i, 0)) || std::isnan(V_xyz(i, 1)) || std::isnan(V_xyz(i, 2))) {
            for (nc::uint32 c = 0; c < C; ++c) out(i, c) = std::numeric_limits<double>::quiet_NaN();
            continue;
        }
        const Cell k = locate(V_xyz, i, L);
        const double x = k.x;
        const double y = k.y;
        const double z = k.z;

        const nc::uint32 V000 = node(k.r0, k.g0, k.b0, L);
        const nc::uint32 V001 = node(k.r0, k.g0, k.b1, L);
        const nc::uint32 V010 = node(k.r0, k.g1, k.b0, L);
        const nc::uint32 V011 = node(k.r0, k.g1, k.b1, L);
        const nc::uint32 V100 = node(k.r1, k.g0, k.b0, L);
        const nc::uint32 V101 = node(k.r1, k.g0, k.b1, L);
        const nc::uint32 V110 = node(k.r1, k.g1, k.b0, L);
        const nc::uint32 V111 = node(k.r1, k.g1, k.b1, L);

        for (nc::uint32 c = 0; c < C; ++c) {
            double v;
            if (x > y && y > z) {
                v = (1 - x) * table(V000, c) + (x - y) * table(V100, c) + (y - z) * table(V110, c) + z * table(V111, c);
            } else if (x > y && x > z) {
                v = (1 - x) * table(V000, c) + (x - z) * table(V100, c) + (z - y) * table(V101, c) + y * table(V111, c);
            } else if (x > y) {
                v = (1 - z) * table(V000, c) + (z - x) * table(V001, c) + (x - y) * table(V101, c) + y * table(V111, c);
            } else if (z > y) {
                v = (1 - z) * table(V000, c) + (z - y) * table(V001, c) + (y - x) * table(V011, c) + x * table(V111, c);
            } else if (z > x) {
                v = (1 - y) * table(V000, c) + (y - z) * table(V010, c) + (z - x) * table(V011, c) + x * table(V111, c);
            } else {
                v = (1 - y) * table(V000, c) + (y - x) * table(V010, c) + (x - z) * table(V110, c) + z * table(V111, c);
            }
            out(i, c) = v;
        }
    }
    return out;
}

nc::NdArray<double> table_interpolation(const nc::NdArray<double>& V_xyz,
                                        const nc::NdArray<double>& table,
                                        TableInterpolationMethod method) {
    switch (method) {
        case TableInterpolationMethod::Trilinear: return table_interpolation_trilinear(V_xyz, table);
        case TableInterpolationMethod::Tetrahedral: return table_interpolation_tetrahedral(V_xyz, table);
    }
    throw std::invalid_argument("table_interpolation: unsupported method");
}

nc::NdArray<double> create_table_3d(const TableFunction& function, int steps, double xmin, double xmax) {
    if (steps < 2) {
        throw std::invalid_argument("create_table_3d: steps must be at least 2, got " + std::to_string(steps));
    }
    const int L = steps;
    const int N = L * L * L;
    nc::NdArray<double> inputs(static_cast<nc::uint32>(N), 3);
    for (int r = 0; r < L; ++r) {
        for (int g = 0; g < L; ++g) {
            for (int b = 0; b < L; ++b) {
                const nc::uint32 idx = node(r, g, b, L);
                inputs(idx, 0) = xmin + (xmax - xmin) * static_cast<double>(r) / (L - 1);
                inputs(idx, 1) = xmin + (xmax - xmin) * static_cast<double>(g) / (L - 1);
                inputs(idx, 2) = xmin + (xmax - xmin) * static_cast<double>(b) / (L - 1);
            }
        }
    }
    auto outputs = function(inputs);
    if (outputs.shape().rows != static_cast<nc::uint32>(N)) {
        throw std::runtime_error("create_table_3d: function returned " + std::to_string(outputs.shape().rows) +
                                 " rows, expected " + std::to_string(N));
    }
    return outputs;
}

std::pair<nc::NdArray<double>, nc::NdArray<double>> compute_with_table(
    const nc::NdArray<double>& data,
    const TableFunction& function,
    int steps,
    double xmin,
    double xmax,
    TableInterpolationMethod method) {
    utils::require_columns(data, 3, "compute_with_table");
    if (!(xmax > xmin)) {
        throw std::invalid_argument("compute_with_table: xmax must be greater than xmin");
    }
    auto table = create_table_3d(function, steps, xmin, xmax);

    nc::NdArray<double> normalised(data.shape());
    for (std::size_t k = 0; k < data.size(); ++k) {
        normalised[k] = (data[k] - xmin) / (xmax - xmin);
    }
    auto out = table_interpolation(normalised, table, method);
    return {out, table};
}

} // namespace algebra
} // namespace chromat
