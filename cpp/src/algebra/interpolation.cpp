#include "interpolation.hpp"
#include "common.hpp"
#include "json_values.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace chromat {
namespace algebra {

namespace {

constexpr double PI = 3.14159265358979323846;

double sinc(double x) {
    if (x == 0.0) return 1.0;
    const double px = PI * x;
    return std::sin(px) / px;
}

// Thomas algorithm for tridiagonal systems: a lower, b diagonal, c upper.
std::vector<double> thomas(std::vector<double> a,
                           std::vector<double> b,
                           std::vector<double> c,
                           std::vector<double> d) {
    const std::size_t n = d.size();
    for (std::size_t i = 1; i < n; ++i) {
        const double m = a[i] / b[i - 1];
        b[i] -= m * c[i - 1];
        d[i] -= m * d[i - 1];
    }
    std::vector<double> x(n);
    x[n - 1] = d[n - 1] / b[n - 1];
    for (std::size_t i = n - 1; i-- > 0;) {
        x[i] = (d[i] - c[i] * x[i + 1]) / b[i];
    }
    return x;
}

int sign(double v) {
    return (v > 0.0) - (v < 0.0);
}

// numpy.pad index mapping for the reflect and symmetric modes.
std::size_t reflect_index(long long j, long long n) {
    if (n == 1) return 0;
    const long long period = 2 * (n - 1);
    long long m = j % period;
    if (m < 0) m += period;
    if (m >= n) m = period - m;
    return static_cast<std::size_t>(m);
}

std::size_t symmetric_index(long long j, long long n) {
    const long long period = 2 * n;
    long long m = j % period;
    if (m < 0) m += period;
    if (m >= n) m = period - 1 - m;
    return static_cast<std::size_t>(m);
}

template <typename Enum, std::size_t N>
Enum parse_enum(const std::string& name,
                const std::array<std::pair<const char*, Enum>, N>& table,
                const std::string& what) {
    const std::string key = utils::to_lower(name);
    std::vector<std::string> accepted;
    for (const auto& entry : table) {
        if (utils::to_lower(entry.first) == key) return entry.second;
        accepted.push_back(entry.first);
    }
    throw std::invalid_argument("Invalid " + what + " \"" + name + "\", accepted values are: " +
                                utils::join(accepted, ", "));
}

const std::array<std::pair<const char*, InterpolatorMethod>, 7> INTERPOLATOR_METHODS = {{
    {"Linear", InterpolatorMethod::Linear},
    {"CubicSpline", InterpolatorMethod::CubicSpline},
    {"Pchip", InterpolatorMethod::Pchip},
    {"Sprague", InterpolatorMethod::Sprague},
    {"Kernel", InterpolatorMethod::Kernel},
    {"NearestNeighbour", InterpolatorMethod::NearestNeighbour},
    {"Null", InterpolatorMethod::Null},
}};

const std::array<std::pair<const char*, KernelType>, 5> KERNEL_TYPES = {{
    {"NearestNeighbour", KernelType::NearestNeighbour},
    {"Linear", KernelType::Linear},
    {"Sinc", KernelType::Sinc},
    {"Lanczos", KernelType::Lanczos},
    {"CardinalSpline", KernelType::CardinalSpline},
}};

const std::array<std::pair<const char*, PaddingMode>, 4> PADDING_MODES = {{
    {"Reflect", PaddingMode::Reflect},
    {"Symmetric", PaddingMode::Symmetric},
    {"Edge", PaddingMode::Edge},
    {"Constant", PaddingMode::Constant},
}};

template <typename Enum, std::size_t N>
std::string enum_name(Enum value, const std::array<std::pair<const char*, Enum>, N>& table) {
    for (const auto& entry : table) {
        if (entry.second == value) return entry.first;
    }
    return "Unknown";
}

bool same_optional(const std::optional<double>& a, const std::optional<double>& b) {
    if (a.has_value() != b.has_value()) return false;
    return !a.has_value() || utils::same_value(*a, *b);
}

} // namespace

InterpolatorMethod parse_interpolator_method(const std::string& name) {
    return parse_enum(name, INTERPOLATOR_METHODS, "interpolator method");
}

KernelType parse_kernel_type(const std::string& name) {
    return parse_enum(name, KERNEL_TYPES, "kernel");
}

PaddingMode parse_padding_mode(const std::string& name) {
    return parse_enum(name, PADDING_MODES, "padding mode");
}

std::string to_string(InterpolatorMethod method) { return enum_name(method, INTERPOLATOR_METHODS); }
std::string to_string(KernelType kernel) { return enum_name(kernel, KERNEL_TYPES); }
std::string to_string(PaddingMode mode) { return enum_name(mode, PADDING_MODES); }

// -----------------------------------------------------------------------------
// Kernels
// -----------------------------------------------------------------------------
double kernel_nearest_neighbour(double x) {
    return std::abs(x) < 0.5 ? 1.0 : 0.0;
}

double kernel_linear(double x) {
    const double ax = std::abs(x);
    return ax < 1.0 ? 1.0 - ax : 0.0;
}

double kernel_sinc(double x, double a) {
    return std::abs(x) < a ? sinc(x) : 0.0;
}

double kernel_lanczos(double x, double a) {
    return std::abs(x) < a ? sinc(x) * sinc(x / a) : 0.0;
}

double kernel_cardinal_spline(double x, double a, double b) {
    const double ax = std::abs(x);
    const double ax2 = ax * ax;
    const double ax3 = ax2 * ax;
    if (ax < 1.0) {
        return ((-6.0 * a - 9.0 * b + 12.0) * ax3 + (6.0 * a + 12.0 * b - 18.0) * ax2 - 2.0 * b + 6.0) / 6.0;
    }
    if (ax < 2.0) {
        return ((-6.0 * a - b) * ax3 + (30.0 * a + 6.0 * b) * ax2 + (-48.0 * a - 12.0 * b) * ax + 24.0 * a + 8.0 * b) / 6.0;
    }
    return 0.0;
}

// -----------------------------------------------------------------------------
// Settings
// -----------------------------------------------------------------------------
InterpolatorSettings InterpolatorSettings::from_json(const nlohmann::json& j) {
    utils::require_known_keys(j,
                              {"method", "kernel", "kernel_kwargs", "window", "padding", "padding_constant",
                               "absolute_tolerance", "relative_tolerance", "default"},
                              "InterpolatorSettings");
    InterpolatorSettings s;
    if (j.contains("method")) s.method = parse_interpolator_method(j.at("method").get<std::string>());
    if (j.contains("kernel")) s.kernel = parse_kernel_type(j.at("kernel").get<std::string>());
    if (j.contains("kernel_kwargs")) {
        const auto& kwargs = j.at("kernel_kwargs");
        utils::require_known_keys(kwargs, {"a", "b"}, "InterpolatorSettings.kernel_kwargs");
        if (kwargs.contains("a")) s.kernel_a = utils::json_to_double(kwargs.at("a"));
        if (kwargs.contains("b")) s.kernel_b = utils::json_to_double(kwargs.at("b"));
    }
    if (j.contains("window")) s.window = j.at("window").get<int>();
    if (j.contains("padding")) s.padding = parse_padding_mode(j.at("padding").get<std::string>());
    if (j.contains("padding_constant")) s.padding_constant = utils::json_to_double(j.at("padding_constant"));
    if (j.contains("absolute_tolerance")) s.absolute_tolerance = utils::json_to_double(j.at("absolute_tolerance"));
    if (j.contains("relative_tolerance")) s.relative_tolerance = utils::json_to_double(j.at("relative_tolerance"));
    if (j.contains("default")) s.default_value = utils::json_to_double(j.at("default"));
    return s;
}

nlohmann::json InterpolatorSettings::to_json() const {
    nlohmann::json j;
    j["method"] = to_string(method);
    j["kernel"] = to_string(kernel);
    nlohmann::json kwargs = nlohmann::json::object();
    if (kernel_a) kwargs["a"] = utils::double_to_json(*kernel_a);
    if (kernel_b) kwargs["b"] = utils::double_to_json(*kernel_b);
    j["kernel_kwargs"] = kwargs;
    j["window"] = window;
    j["padding"] = to_string(padding);
    j["padding_constant"] = utils::double_to_json(padding_constant);
    j["absolute_tolerance"] = utils::double_to_json(absolute_tolerance);
    j["relative_tolerance"] = utils::double_to_json(relative_tolerance);
    j["default"] = utils::double_to_json(default_value);
    return j;
}

bool operator==(const InterpolatorSettings& a, const InterpolatorSettings& b) {
    return a.method == b.method && a.kernel == b.kernel && same_optional(a.kernel_a, b.kernel_a) &&
           same_optional(a.kernel_b, b.kernel_b) && a.window == b.window && a.padding == b.padding &&
           utils::same_value(a.padding_constant, b.padding_constant) &&
           utils::same_value(a.absolute_tolerance, b.absolute_tolerance) &&
           utils::same_value(a.relative_tolerance, b.relative_tolerance) &&
           utils::same_value(a.default_value, b.default_value);
}

bool operator!=(const InterpolatorSettings& a, const InterpolatorSettings& b) {
    return !(a == b);
}

// -----------------------------------------------------------------------------
// Interpolator
// -----------------------------------------------------------------------------
Interpolator::Interpolator(const nc::NdArray<double>& x, const nc::NdArray<double>& y, std::size_t minimum_points)
    : m_x(x.begin(), x.end()), m_y(y.begin(), y.end()) {
    if (m_x.size() != m_y.size()) {
        throw std::invalid_argument("Interpolator: x and y must have the same size, got " +
                                    std::to_string(m_x.size()) + " and " + std::to_string(m_y.size()));
    }
    if (m_x.size() < minimum_points) {
        throw std::invalid_argument("Interpolator: at least " + std::to_string(minimum_points) +
                                    " points are required, got " + std::to_string(m_x.size()));
    }
    for (std::size_t i = 1; i < m_x.size(); ++i) {
        if (!(m_x[i] > m_x[i - 1])) {
            throw std::invalid_argument("Interpolator: x must be strictly increasing");
        }
    }
}

double Interpolator::operator()(double xq) const {
    if (std::isnan(xq) || xq < m_x.front() || xq > m_x.back()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return evaluate(xq);
}

nc::NdArray<double> Interpolator::operator()(const nc::NdArray<double>& xq) const {
    nc::NdArray<double> out(xq.shape());
    for (std::size_t k = 0; k < xq.size(); ++k) out[k] = (*this)(xq[k]);
    return out;
}

nc::NdArray<double> Interpolator::x() const { return utils::to_row(m_x); }
nc::NdArray<double> Interpolator::y() const { return utils::to_row(m_y); }

std::size_t Interpolator::find_segment(double xq) const {
    auto it = std::upper_bound(m_x.begin(), m_x.end(), xq);
    std::size_t i = (it == m_x.begin()) ? 0 : static_cast<std::size_t>(it - m_x.begin() - 1);
    if (i >= m_x.size() - 1) i = m_x.size() - 2;
    return i;
}

// -----------------------------------------------------------------------------
// Linear
// -----------------------------------------------------------------------------
LinearInterpolator::LinearInterpolator(const nc::NdArray<double>& x, const nc::NdArray<double>& y)
    : Interpolator(x, y) {}

double LinearInterpolator::evaluate(double xq) const {
    const std::size_t i = find_segment(xq);
    if (xq == m_x[i + 1]) return m_y[i + 1];
    const double t = (xq - m_x[i]) / (m_x[i + 1] - m_x[i]);
    return m_y[i] + t * (m_y[i + 1] - m_y[i]);
}

// -----------------------------------------------------------------------------
// Piecewise cubic
// -----------------------------------------------------------------------------
void PiecewiseCubic::set_slopes(const std::vector<double>& s) {
    const std::size_t n = m_x.size();
    m_c.assign(n - 1, {0.0, 0.0, 0.0, 0.0});
    for (std::size_t i = 0; i < n - 1; ++i) {
        const double dx = m_x[i + 1] - m_x[i];
        const double dy = (m_y[i + 1] - m_y[i]) / dx;
        const double s0 = s[i];
        const double s1 = s[i + 1];
        m_c[i][0] = (s0 + s1 - 2.0 * dy) / (dx * dx);
        m_c[i][1] = (3.0 * dy - 2.0 * s0 - s1) / dx;
        m_c[i][2] = s0;
        m_c[i][3] = m_y[i];
    }
}

double PiecewiseCubic::evaluate(double xq) const {
    const std::size_t i = find_segment(xq);
    if (xq == m_x[i + 1]) return m_y[i + 1];
    const double t = xq - m_x[i];
    const auto& c = m_c[i];
    return ((c[0] * t + c[1]) * t + c[2]) * t + c[3];
}

CubicSplineInterpolator::CubicSplineInterpolator(const nc::NdArray<double>& x, const nc::NdArray<double>& y)
    : PiecewiseCubic(x, y) {
    const std::size_t n = m_x.size();
    std::vector<double> h(n - 1);
    std::vector<double> m(n - 1);
    for (std::size_t i = 0; i < n - 1; ++i) {
        h[i] = m_x[i + 1] - m_x[i];
        m[i] = (m_y[i + 1] - m_y[i]) / h[i];
    }

    std::vector<double> s(n);
    if (n == 2) {
        s[0] = s[1] = m[0];
    } else if (n == 3) {
        // not-a-knot on three points is the interpolating parabola
        const double A = (m[1] - m[0]) / (m_x[2] - m_x[0]);
        s[0] = m[0] - A * h[0];
        s[1] = m[0] + A * h[0];
        s[2] = m[0] + A * (h[0] + 2.0 * h[1]);
    } else {
        std::vector<double> a(n, 0.0), b(n, 0.0), c(n, 0.0), d(n, 0.0);
        for (std::size_t i = 1; i < n - 1; ++i) {
            a[i] = h[i];
            b[i] = 2.0 * (h[i - 1] + h[i]);
            c[i] = h[i - 1];
            d[i] = 3.0 * (h[i] * m[i - 1] + h[i - 1] * m[i]);
        }

        const double d0 = m_x[2] - m_x[0];
        b[0] = h[1];
        c[0] = d0;
        d[0] = ((h[0] + 2.0 * d0) * h[1] * m[0] + h[0] * h[0] * m[1]) / d0;

        const double dn = m_x[n - 1] - m_x[n - 3];
        a[n - 1] = dn;
        b[n - 1] = h[n - 3];
        d[n - 1] = (h[n - 2] * h[n - 2] * m[n - 3] + (2.0 * dn + h[n - 2]) * h[n - 3] * m[n - 2]) / dn;

        s = thomas(a, b, c, d);
    }
    set_slopes(s);
}

PchipInterpolator::PchipInterpolator(const nc::NdArray<double>& x, const nc::NdArray<double>& y)
    : PiecewiseCubic(x, y) {
    const std::size_t n = m_x.size();
    std::vector<double> h(n - 1);
    std::vector<double> m(n - 1);
    for (std::size_t i = 0; i < n - 1; ++i) {
        h[i] = m_x[i + 1] - m_x[i];
        m[i] = (m_y[i + 1] - m_y[i]) / h[i];
    }

    std::vector<double> s(n, 0.0);
    if (n == 2) {
        s[0] = s[1] = m[0];
        set_slopes(s);
        return;
    }

    for (std::size_t k = 1; k < n - 1; ++k) {
        const double m0 = m[k - 1];
        const double m1 = m[k];
        if (sign(m0) != sign(m1) || m0 == 0.0 || m1 == 0.0) {
            s[k] = 0.0;
            continue;
        }
        const double w1 = 2.0 * h[k] + h[k - 1];
        const double w2 = h[k] + 2.0 * h[k - 1];
        s[k] = (w1 + w2) / (w1 / m0 + w2 / m1);
    }

    auto edge = [](double h0, double h1, double m0, double m1) {
        double d = ((2.0 * h0 + h1) * m0 - h0 * m1) / (h0 + h1);
        if (sign(d) != sign(m0)) {
            d = 0.0;
        } else if (sign(m0) != sign(m1) && std::abs(d) > 3.0 * std::abs(m0)) {
            d = 3.0 * m0;
        }
        return d;
    };
    s[0] = edge(h[0], h[1], m[0], m[1]);
    s[n - 1] = edge(h[n - 2], h[n - 3], m[n - 2], m[n - 3]);
    set_slopes(s);
}

// -----------------------------------------------------------------------------
// Sprague
// -----------------------------------------------------------------------------
const std::array<std::array<double, 6>, 4> SpragueInterpolator::COEFFICIENTS = {{
    {{884.0, -1960.0, 3033.0, -2648.0, 1080.0, -180.0}},
    {{508.0, -540.0, 488.0, -367.0, 144.0, -24.0}},
    {{-24.0, 144.0, -367.0, 488.0, -540.0, 508.0}},
    {{-180.0, 1080.0, -2648.0, 3033.0, -1960.0, 884.0}},
}};

SpragueInterpolator::SpragueInterpolator(const nc::NdArray<double>& x, const nc::NdArray<double>& y)
    : Interpolator(x, y, config::SPRAGUE_MINIMUM_POINTS) {
    const std::size_t n = m_x.size();
    const double step = utils::interval(m_x).front();

    m_xp.reserve(n + 4);
    m_xp.push_back(m_x.front() - step * 2.0);
    m_xp.push_back(m_x.front() - step);
    m_xp.insert(m_xp.end(), m_x.begin(), m_x.end());
    m_xp.push_back(m_x.back() + step);
    m_xp.push_back(m_x.back() + step * 2.0);

    auto boundary = [&](std::size_t row, std::size_t offset) {
        double sum = 0.0;
        for (std::size_t k = 0; k < 6; ++k) sum += COEFFICIENTS[row][k] * m_y[offset + k];
        return sum / 209.0;
    };
    m_yp.reserve(n + 4);
    m_yp.push_back(boundary(0, 0));
    m_yp.push_back(boundary(1, 0));
    m_yp.insert(m_yp.end(), m_y.begin(), m_y.end());
    m_yp.push_back(boundary(2, n - 6));
    m_yp.push_back(boundary(3, n - 6));
}

double SpragueInterpolator::evaluate(double xq) const {
    const std::size_t n = m_x.size();
    auto it = std::lower_bound(m_xp.begin(), m_xp.end(), xq);
    std::size_t i = static_cast<std::size_t>(it - m_xp.begin());
    i = (i == 0) ? 0 : i - 1;
    i = std::clamp<std::size_t>(i, 2, n);

    const double X = (xq - m_xp[i]) / (m_xp[i + 1] - m_xp[i]);
    const auto& r = m_yp;

    const double a0 = r[i];
    const double a1 = (2.0 * r[i - 2] - 16.0 * r[i - 1] + 16.0 * r[i + 1] - 2.0 * r[i + 2]) / 24.0;
    const double a2 = (-r[i - 2] + 16.0 * r[i - 1] - 30.0 * r[i] + 16.0 * r[i + 1] - r[i + 2]) / 24.0;
    const double a3 = (-9.0 * r[i - 2] + 39.0 * r[i - 1] - 70.0 * r[i] + 66.0 * r[i + 1] - 33.0 * r[i + 2] +
                       7.0 * r[i + 3]) / 24.0;
    const double a4 = (13.0 * r[i - 2] - 64.0 * r[i - 1] + 126.0 * r[i] - 124.0 * r[i + 1] + 61.0 * r[i + 2] -
                       12.0 * r[i + 3]) / 24.0;
    const double a5 = (-5.0 * r[i - 2] + 25.0 * r[i - 1] - 50.0 * r[i] + 50.0 * r[i + 1] - 25.0 * r[i + 2] +
                       5.0 * r[i + 3]) / 24.0;

    return a0 + X * (a1 + X * (a2 + X * (a3 + X * (a4 + X * a5))));
}

// -----------------------------------------------------------------------------
// Kernel
// -----------------------------------------------------------------------------
KernelInterpolator::KernelInterpolator(const nc::NdArray<double>& x,
                                       const nc::NdArray<double>& y,
                                       KernelType kernel,
                                       std::optional<double> kernel_a,
                                       std::optional<double> kernel_b,
                                       int window,
                                       PaddingMode padding,
                                       double padding_constant)
    : Interpolator(x, y), m_kernel(kernel), m_window(window) {
    if (window < 1) {
        throw std::invalid_argument("KernelInterpolator: window must be at least 1, got " + std::to_string(window));
    }
    switch (kernel) {
        case KernelType::Sinc:
            m_a = kernel_a.value_or(config::DEFAULT_SINC_A);
            m_b = 0.0;
            break;
        case KernelType::Lanczos:
            m_a = kernel_a.value_or(config::DEFAULT_LANCZOS_A);
            m_b = 0.0;
            break;
        case KernelType::CardinalSpline:
            m_a = kernel_a.value_or(config::DEFAULT_CARDINAL_SPLINE_A);
            m_b = kernel_b.value_or(config::DEFAULT_CARDINAL_SPLINE_B);
            break;
        default:
            m_a = 0.0;
            m_b = 0.0;
            break;
    }

    const auto intervals = utils::interval(m_x);
    if (intervals.size() != 1) {
        utils::runtime_warning("Kernel", "\"x\" independent variable is not uniform, unpredictable results may occur!");
    }
    m_interval = intervals.front();
    m_xp_min = m_x.front() - window * m_interval;
    m_xp_max = m_x.back() + window * m_interval;

    const long long n = static_cast<long long>(m_y.size());
    const long long w = window;
    m_yp.resize(static_cast<std::size_t>(n + 2 * w));
    for (long long k = -w; k < n + w; ++k) {
        double value;
        if (k >= 0 && k < n) {
            value = m_y[static_cast<std::size_t>(k)];
        } else {
            switch (padding) {
                case PaddingMode::Reflect: value = m_y[reflect_index(k, n)]; break;
                case PaddingMode::Symmetric: value = m_y[symmetric_index(k, n)]; break;
                case PaddingMode::Edge: value = k < 0 ? m_y.front() : m_y.back(); break;
                case PaddingMode::Constant:
                default: value = padding_constant; break;
            }
        }
        m_yp[static_cast<std::size_t>(k + w)] = value;
    }
}

double KernelInterpolator::kernel_value(double x) const {
    switch (m_kernel) {
        case KernelType::NearestNeighbour: return kernel_nearest_neighbour(x);
        case KernelType::Linear: return kernel_linear(x);
        case KernelType::Sinc: return kernel_sinc(x, m_a);
        case KernelType::Lanczos: return kernel_lanczos(x, m_a);
        case KernelType::CardinalSpline: return kernel_cardinal_spline(x, m_a, m_b);
    }
    return 0.0;
}

double KernelInterpolator::evaluate(double xq) const {
    const double clip_l = m_xp_min / m_interval;
    const double clip_h = m_xp_max / m_interval;
    if (!std::isfinite(clip_l) || !std::isfinite(clip_h)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const double x_i = xq / m_interval;
    const double x_f = std::floor(x_i);

    double sum = 0.0;
    for (int k = -m_window + 1; k <= m_window; ++k) {
        const double window = std::clamp(x_f + k, clip_l, clip_h) - clip_l;
        const double j = std::round(window);
        const std::size_t index = std::min(static_cast<std::size_t>(j), m_yp.size() - 1);
        sum += m_yp[index] * kernel_value(x_i - j - clip_l);
    }
    return sum;
}

NearestNeighbourInterpolator::NearestNeighbourInterpolator(const nc::NdArray<double>& x,
                                                           const nc::NdArray<double>& y,
                                                           int window,
                                                           PaddingMode padding,
                                                           double padding_constant)
    : KernelInterpolator(x, y, KernelType::NearestNeighbour, std::nullopt, std::nullopt, window, padding,
                         padding_constant) {}

// -----------------------------------------------------------------------------
// Null
// -----------------------------------------------------------------------------
NullInterpolator::NullInterpolator(const nc::NdArray<double>& x,
                                   const nc::NdArray<double>& y,
                                   double absolute_tolerance,
                                   double relative_tolerance,
                                   double default_value)
    : Interpolator(x, y),
      m_absolute_tolerance(absolute_tolerance),
      m_relative_tolerance(relative_tolerance),
      m_default(default_value) {}

double NullInterpolator::evaluate(double xq) const {
    const std::size_t i = utils::closest_index(m_x, xq);
    if (std::abs(m_x[i] - xq) <= m_absolute_tolerance + m_relative_tolerance * std::abs(xq)) {
        return m_y[i];
    }
    return m_default;
}

// -----------------------------------------------------------------------------
// Factory
// -----------------------------------------------------------------------------
std::shared_ptr<Interpolator> make_interpolator(const nc::NdArray<double>& x,
                                                const nc::NdArray<double>& y,
                                                const InterpolatorSettings& settings) {
    switch (settings.method) {
        case InterpolatorMethod::Linear:
            return std::make_shared<LinearInterpolator>(x, y);
        case InterpolatorMethod::CubicSpline:
            return std::make_shared<CubicSplineInterpolator>(x, y);
        case InterpolatorMethod::Pchip:
            return std::make_shared<PchipInterpolator>(x, y);
        case InterpolatorMethod::Sprague:
            return std::make_shared<SpragueInterpolator>(x, y);
        case InterpolatorMethod::Kernel:
            return std::make_shared<KernelInterpolator>(x, y, settings.kernel, settings.kernel_a, settings.kernel_b,
                                                        settings.window, settings.padding, settings.padding_constant);
        case InterpolatorMethod::NearestNeighbour:
            return std::make_shared<NearestNeighbourInterpolator>(x, y, settings.window, settings.padding,
                                                                  settings.padding_constant);
        case InterpolatorMethod::Null:
            return std::make_shared<NullInterpolator>(x, y, settings.absolute_tolerance, settings.relative_tolerance,
                                                      settings.default_value);
    }
    throw std::invalid_argument("make_interpolator: unsupported interpolator method");
}

// -----------------------------------------------------------------------------
// Lagrange
// -----------------------------------------------------------------------------
nc::NdArray<double> lagrange_coefficients(double r, int n) {
    if (n < 1) {
        throw std::invalid_argument("lagrange_coefficients: n must be at least 1, got " + std::to_string(n));
    }
    nc::NdArray<double> L(1, static_cast<nc::uint32>(n));
    for (int j = 0; j < n; ++j) {
        double basis = 1.0;
        for (int i = 0; i < n; ++i) {
            if (i == j) continue;
            basis *= (r - i) / static_cast<double>(j - i);
        }
        L[j] = basis;
    }
    return L;
}

} // namespace algebra
} // namespace chromat
