#include "common.hpp"
#include "config.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace chromat {
namespace utils {

namespace {
std::atomic<bool> g_warnings_enabled{true};
}

void runtime_warning(const std::string& tag, const std::string& message) {
    if (!g_warnings_enabled.load()) return;
    std::cerr << "[" << tag << "] WARNING: " << message << std::endl;
}

void set_warnings_enabled(bool enabled) {
    g_warnings_enabled.store(enabled);
}

bool warnings_enabled() {
    return g_warnings_enabled.load();
}

std::string to_lower(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string join(const std::vector<std::string>& values, const std::string& separator) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << separator;
        oss << values[i];
    }
    return oss.str();
}

std::vector<double> to_vector(const nc::NdArray<double>& a) {
    return std::vector<double>(a.begin(), a.end());
}

nc::NdArray<double> to_row(const std::vector<double>& values) {
    if (values.empty()) return nc::NdArray<double>();
    nc::NdArray<double> out(1, static_cast<nc::uint32>(values.size()));
    std::copy(values.begin(), values.end(), out.begin());
    return out;
}

std::vector<double> interval(const std::vector<double>& distribution) {
    std::vector<double> steps;
    for (std::size_t i = 1; i < distribution.size(); ++i) {
        steps.push_back(distribution[i] - distribution[i - 1]);
    }
    std::sort(steps.begin(), steps.end());

    std::vector<double> unique;
    for (double step : steps) {
        if (unique.empty() || !is_close(unique.back(), step, config::TOLERANCE_INTERVAL, 0.0)) {
            unique.push_back(step);
        }
    }
    return unique;
}

bool is_uniform(const std::vector<double>& distribution) {
    return interval(distribution).size() == 1;
}

std::size_t closest_index(const std::vector<double>& values, double x) {
    std::size_t best = 0;
    double best_distance = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < values.size(); ++i) {
        const double d = std::abs(values[i] - x);
        if (d < best_distance) {
            best_distance = d;
            best = i;
        }
    }
    return best;
}

bool is_close(double a, double b, double rtol, double atol) {
    if (a == b) return true;
    if (std::isnan(a) || std::isnan(b) || std::isinf(a) || std::isinf(b)) return false;
    return std::abs(a - b) <= atol + rtol * std::max(std::abs(a), std::abs(b));
}

bool same_value(double a, double b) {
    if (std::isnan(a) && std::isnan(b)) return true;
    return a == b;
}

bool same_values(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!same_value(a[i], b[i])) return false;
    }
    return true;
}

std::vector<double> resize_cyclic(const std::vector<double>& values, std::size_t size) {
    std::vector<double> out(size, 0.0);
    if (values.empty()) return out;
    for (std::size_t i = 0; i < size; ++i) out[i] = values[i % values.size()];
    return out;
}

std::vector<std::size_t> slice_indices(const nc::Slice& slice, std::size_t size) {
    const long long n = static_cast<long long>(size);
    const long long step = slice.step;
    if (step == 0) throw std::invalid_argument("slice step cannot be zero");

    auto normalise = [n](long long index, long long lower, long long upper) {
        if (index < 0) index += n;
        return std::min(std::max(index, lower), upper);
    };

    std::vector<std::size_t> out;
    if (step > 0) {
        const long long start = normalise(slice.start, 0, n);
        const long long stop = normalise(slice.stop, 0, n);
        for (long long i = start; i < stop; i += step) out.push_back(static_cast<std::size_t>(i));
    } else {
        const long long start = normalise(slice.start, -1, n - 1);
        const long long stop = normalise(slice.stop, -1, n - 1);
        for (long long i = start; i > stop; i += step) out.push_back(static_cast<std::size_t>(i));
    }
    return out;
}

double spow(double a, double p) {
    const double sign = (a > 0.0) - (a < 0.0);
    return sign * std::pow(std::abs(a), p);
}

void require_columns(const nc::NdArray<double>& a, std::size_t columns, const std::string& what) {
    if (a.shape().cols != columns) {
        throw std::invalid_argument(what + ": expected an N x " + std::to_string(columns) +
                                    " array, got " + std::to_string(a.shape().rows) + " x " +
                                    std::to_string(a.shape().cols));
    }
}

} // namespace utils

namespace algebra {

Matrix3 identity3() {
    return {{{{1.0, 0.0, 0.0}}, {{0.0, 1.0, 0.0}}, {{0.0, 0.0, 1.0}}}};
}

Matrix3 matmul(const Matrix3& a, const Matrix3& b) {
    Matrix3 out{};
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            out[i][j] = a[i][0] * b[0][j] + a[i][1] * b[1][j] + a[i][2] * b[2][j];
        }
    }
    return out;
}

Vector3 matmul(const Matrix3& m, const Vector3& v) {
    Vector3 out{};
    for (int i = 0; i < 3; ++i) {
        out[i] = m[i][0] * v[0] + m[i][1] * v[1] + m[i][2] * v[2];
    }
    return out;
}

Matrix3 inverse(const Matrix3& m) {
    const double det = m[0][0] * (m[1][1] * m[2][2] - m[1][2] * m[2][1]) -
                       m[0][1] * (m[1][0] * m[2][2] - m[1][2] * m[2][0]) +
                       m[0][2] * (m[1][0] * m[2][1] - m[1][1] * m[2][0]);
    if (det == 0.0) {
        throw std::invalid_argument("inverse: singular 3x3 matrix");
    }
    Matrix3 out{};
    out[0][0] = (m[1][1] * m[2][2] - m[1][2] * m[2][1]) / det;
    out[0][1] = (m[0][2] * m[2][1] - m[0][1] * m[2][2]) / det;
    out[0][2] = (m[0][1] * m[1][2] - m[0][2] * m[1][1]) / det;
    out[1][0] = (m[1][2] * m[2][0] - m[1][0] * m[2][2]) / det;
    out[1][1] = (m[0][0] * m[2][2] - m[0][2] * m[2][0]) / det;
    out[1][2] = (m[0][2] * m[1][0] - m[0][0] * m[1][2]) / det;
    out[2][0] = (m[1][0] * m[2][1] - m[1][1] * m[2][0]) / det;
    out[2][1] = (m[0][1] * m[2][0] - m[0][0] * m[2][1]) / det;
    out[2][2] = (m[0][0] * m[1][1] - m[0][1] * m[1][0]) / det;
    return out;
}

Matrix3 diagonal(const Vector3& v) {
    Matrix3 out{};
    out[0][0] = v[0];
    out[1][1] = v[1];
    out[2][2] = v[2];
    return out;
}

nc::NdArray<double> vector_dot(const Matrix3& m, const nc::NdArray<double>& rows) {
    utils::require_columns(rows, 3, "vector_dot");
    nc::NdArray<double> out(rows.shape());
    for (nc::uint32 i = 0; i < rows.shape().rows; ++i) {
        const double a = rows(i, 0);
        const double b = rows(i, 1);
        const double c = rows(i, 2);
        out(i, 0) = m[0][0] * a + m[0][1] * b + m[0][2] * c;
        out(i, 1) = m[1][0] * a + m[1][1] * b + m[1][2] * c;
        out(i, 2) = m[2][0] * a + m[2][1] * b + m[2][2] * c;
    }
    return out;
}

} // namespace algebra
} // namespace chromat
