// One dimensional interpolators over a strictly increasing domain, the
// interpolation kernels and the Lagrange coefficients. The piecewise cubic
// machinery follows SciPy's interpolate module (CubicSpline, PchipInterpolator).
// -----------------------------------------------------------------------------
#pragma once

#include "NumCpp.hpp"
#include "config.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chromat {
namespace algebra {

enum class InterpolatorMethod { Linear, CubicSpline, Pchip, Sprague, Kernel, NearestNeighbour, Null };
enum class KernelType { NearestNeighbour, Linear, Sinc, Lanczos, CardinalSpline };
// Padding applied to the range before kernel evaluation (numpy.pad modes).
enum class PaddingMode { Reflect, Symmetric, Edge, Constant };

InterpolatorMethod parse_interpolator_method(const std::string& name);
KernelType parse_kernel_type(const std::string& name);
PaddingMode parse_padding_mode(const std::string& name);
std::string to_string(InterpolatorMethod method);
std::string to_string(KernelType kernel);
std::string to_string(PaddingMode mode);

// -----------------------------------------------------------------------------
// Kernels
// -----------------------------------------------------------------------------
double kernel_nearest_neighbour(double x);
double kernel_linear(double x);
double kernel_sinc(double x, double a = config::DEFAULT_SINC_A);
double kernel_lanczos(double x, double a = config::DEFAULT_LANCZOS_A);
double kernel_cardinal_spline(double x,
                              double a = config::DEFAULT_CARDINAL_SPLINE_A,
                              double b = config::DEFAULT_CARDINAL_SPLINE_B);

/**
 * @brief Interpolator selection and parameters.
 *
 * Kernel parameters left unset take the kernel's own defaults. The JSON form
 * uses the keyword names of the settings, e.g.
 * {"method": "Kernel", "kernel": "Lanczos", "window": 1, "kernel_kwargs": {"a": 1}}.
 */
struct InterpolatorSettings {
    InterpolatorMethod method = InterpolatorMethod::Kernel;
    KernelType kernel = KernelType::Lanczos;
    std::optional<double> kernel_a;
    std::optional<double> kernel_b;
    int window = config::DEFAULT_KERNEL_WINDOW;
    PaddingMode padding = PaddingMode::Reflect;
    double padding_constant = 0.0;
    double absolute_tolerance = config::TOLERANCE_ABSOLUTE;
    double relative_tolerance = config::TOLERANCE_RELATIVE;
    double default_value = std::numeric_limits<double>::quiet_NaN();

    static InterpolatorSettings from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

bool operator==(const InterpolatorSettings& a, const InterpolatorSettings& b);
bool operator!=(const InterpolatorSettings& a, const InterpolatorSettings& b);

// -----------------------------------------------------------------------------
// Base class
// -----------------------------------------------------------------------------
class Interpolator {
public:
    Interpolator(const nc::NdArray<double>& x, const nc::NdArray<double>& y, std::size_t minimum_points = 2);
    virtual ~Interpolator() = default;

    virtual InterpolatorMethod method() const = 0;

    // Query points outside [x.front(), x.back()] evaluate to NaN.
    double operator()(double xq) const;
    nc::NdArray<double> operator()(const nc::NdArray<double>& xq) const;

    nc::NdArray<double> x() const;
    nc::NdArray<double> y() const;
    double x_min() const { return m_x.front(); }
    double x_max() const { return m_x.back(); }
    std::size_t size() const { return m_x.size(); }

protected:
    virtual double evaluate(double xq) const = 0;

    // Index i such that m_x[i] <= xq < m_x[i + 1], clamped to the last segment.
    std::size_t find_segment(double xq) const;

    std::vector<double> m_x;
    std::vector<double> m_y;
};

class LinearInterpolator : public Interpolator {
public:
    LinearInterpolator(const nc::NdArray<double>& x, const nc::NdArray<double>& y);
    InterpolatorMethod method() const override { return InterpolatorMethod::Linear; }

protected:
    double evaluate(double xq) const override;
};

// Piecewise cubic Hermite polynomial, c(0..3, i) in descending powers of (x - x_i).
class PiecewiseCubic : public Interpolator {
public:
    using Interpolator::Interpolator;

protected:
    void set_slopes(const std::vector<double>& s);
    double evaluate(double xq) const override;

    std::vector<std::array<double, 4>> m_c;
};

// C2 cubic spline with not-a-knot boundary conditions.
class CubicSplineInterpolator : public PiecewiseCubic {
public:
    CubicSplineInterpolator(const nc::NdArray<double>& x, const nc::NdArray<double>& y);
    InterpolatorMethod method() const override { return InterpolatorMethod::CubicSpline; }
};

// Monotonicity preserving cubic (Fritsch-Carlson slopes).
class PchipInterpolator : public PiecewiseCubic {
public:
    PchipInterpolator(const nc::NdArray<double>& x, const nc::NdArray<double>& y);
    InterpolatorMethod method() const override { return InterpolatorMethod::Pchip; }
};

/**
 * @brief Sprague (1880) fifth order interpolation.
 *
 * The range is extended by two points on each side with the Sprague boundary
 * coefficients; at least six points are required.
 */
class SpragueInterpolator : public Interpolator {
public:
    SpragueInterpolator(const nc::NdArray<double>& x, const nc::NdArray<double>& y);
    InterpolatorMethod method() const override { return InterpolatorMethod::Sprague; }

    static const std::array<std::array<double, 6>, 4> COEFFICIENTS;

protected:
    double evaluate(double xq) const override;

private:
    std::vector<double> m_xp;
    std::vector<double> m_yp;
};

/**
 * @brief Kernel based interpolation over a window of neighbouring samples.
 *
 * The domain should be uniform; a non uniform domain is accepted with a
 * runtime warning and the smallest interval is used.
 */
class KernelInterpolator : public Interpolator {
public:
    KernelInterpolator(const nc::NdArray<double>& x,
                       const nc::NdArray<double>& y,
                       KernelType kernel = KernelType::Lanczos,
                       std::optional<double> kernel_a = std::nullopt,
                       std::optional<double> kernel_b = std::nullopt,
                       int window = config::DEFAULT_KERNEL_WINDOW,
                       PaddingMode padding = PaddingMode::Reflect,
                       double padding_constant = 0.0);

    InterpolatorMethod method() const override { return InterpolatorMethod::Kernel; }
    KernelType kernel() const { return m_kernel; }
    int window() const { return m_window; }
    double kernel_value(double x) const;

protected:
    double evaluate(double xq) const override;

private:
    KernelType m_kernel;
    double m_a;
    double m_b;
    int m_window;
    double m_interval{1.0};
    double m_xp_min{0.0};
    double m_xp_max{0.0};
    std::vector<double> m_yp;
};

class NearestNeighbourInterpolator : public KernelInterpolator {
public:
    NearestNeighbourInterpolator(const nc::NdArray<double>& x,
                                 const nc::NdArray<double>& y,
                                 int window = config::DEFAULT_KERNEL_WINDOW,
                                 PaddingMode padding = PaddingMode::Reflect,
                                 double padding_constant = 0.0);
    InterpolatorMethod method() const override { return InterpolatorMethod::NearestNeighbour; }
};

// Returns stored values at (tolerance) exact domain matches, default_value elsewhere.
class NullInterpolator : public Interpolator {
public:
    NullInterpolator(const nc::NdArray<double>& x,
                     const nc::NdArray<double>& y,
                     double absolute_tolerance = config::TOLERANCE_ABSOLUTE,
                     double relative_tolerance = config::TOLERANCE_RELATIVE,
                     double default_value = std::numeric_limits<double>::quiet_NaN());
    InterpolatorMethod method() const override { return InterpolatorMethod::Null; }

protected:
    double evaluate(double xq) const override;

private:
    double m_absolute_tolerance;
    double m_relative_tolerance;
    double m_default;
};

std::shared_ptr<Interpolator> make_interpolator(const nc::NdArray<double>& x,
                                                const nc::NdArray<double>& y,
                                                const InterpolatorSettings& settings = {});

// -----------------------------------------------------------------------------
// Lagrange
// -----------------------------------------------------------------------------
/**
 * @brief Lagrange basis coefficients at point r over n unit spaced nodes 0..n-1.
 * @return 1 x n array.
 */
nc::NdArray<double> lagrange_coefficients(double r, int n = 4);

} // namespace algebra
} // namespace chromat
