#include "signal.hpp"
#include "common.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace chromat {
namespace continuous {

ArithmeticOperator parse_arithmetic_operator(const std::string& symbol) {
    const std::string key = utils::to_lower(symbol);
    if (key == "+" || key == "add") return ArithmeticOperator::Add;
    if (key == "-" || key == "subtract") return ArithmeticOperator::Subtract;
    if (key == "*" || key == "multiply") return ArithmeticOperator::Multiply;
    if (key == "/" || key == "divide") return ArithmeticOperator::Divide;
    if (key == "**" || key == "power") return ArithmeticOperator::Power;
    throw std::invalid_argument("Invalid arithmetic operator \"" + symbol +
                                "\", accepted values are: +, -, *, /, **");
}

std::string to_string(ArithmeticOperator op) {
    switch (op) {
        case ArithmeticOperator::Add: return "+";
        case ArithmeticOperator::Subtract: return "-";
        case ArithmeticOperator::Multiply: return "*";
        case ArithmeticOperator::Divide: return "/";
        case ArithmeticOperator::Power: return "**";
    }
    return "?";
}

double apply_operator(double a, double b, ArithmeticOperator op) {
    switch (op) {
        case ArithmeticOperator::Add: return a + b;
        case ArithmeticOperator::Subtract: return a - b;
        case ArithmeticOperator::Multiply: return a * b;
        case ArithmeticOperator::Divide: return a / b;
        case ArithmeticOperator::Power: return std::pow(a, b);
    }
    throw std::invalid_argument("apply_operator: unsupported operator");
}

FillNanMethod parse_fill_nan_method(const std::string& name) {
    const std::string key = utils::to_lower(name);
    if (key == "interpolation") return FillNanMethod::Interpolation;
    if (key == "constant") return FillNanMethod::Constant;
    throw std::invalid_argument("Invalid fill NaN method \"" + name +
                                "\", accepted values are: Interpolation, Constant");
}

// -----------------------------------------------------------------------------
// Signal
// -----------------------------------------------------------------------------

Signal::Signal()
    : m_extrapolator_settings(default_extrapolator_settings()) {}

Signal::Signal(const nc::NdArray<double>& range,
               const nc::NdArray<double>& domain,
               const std::string& name,
               const algebra::InterpolatorSettings& interpolator,
               const algebra::ExtrapolatorSettings& extrapolator)
    : m_name(name),
      m_interpolator_settings(interpolator),
      m_extrapolator_settings(extrapolator) {
    std::vector<double> r = utils::to_vector(range);
    std::vector<double> d;
    if (domain.size() == 0) {
        d.resize(r.size());
        for (std::size_t i = 0; i < d.size(); ++i) d[i] = static_cast<double>(i);
    } else {
        d = utils::to_vector(domain);
    }
    if (d.size() != r.size()) {
        throw std::invalid_argument("Signal: domain and range must have the same size, got " +
                                    std::to_string(d.size()) + " and " + std::to_string(r.size()));
    }
    set_data(d, r);
}

Signal::Signal(const std::map<double, double>& data,
               const std::string& name,
               const algebra::InterpolatorSettings& interpolator,
               const algebra::ExtrapolatorSettings& extrapolator)
    : m_name(name),
      m_interpolator_settings(interpolator),
      m_extrapolator_settings(extrapolator) {
    std::vector<double> d;
    std::vector<double> r;
    for (const auto& kv : data) {
        d.push_back(kv.first);
        r.push_back(kv.second);
    }
    set_data(d, r);
}

algebra::ExtrapolatorSettings Signal::default_extrapolator_settings() {
    algebra::ExtrapolatorSettings settings;
    settings.method = algebra::ExtrapolationMethod::Constant;
    settings.left = NaN;
    settings.right = NaN;
    return settings;
}

nc::NdArray<double> Signal::domain() const {
    return utils::to_row(m_domain);
}

nc::NdArray<double> Signal::range() const {
    return utils::to_row(m_range);
}

void Signal::validate_domain(const std::vector<double>& domain) const {
    bool warned = false;
    for (std::size_t i = 0; i < domain.size(); ++i) {
        if (std::isnan(domain[i])) {
            throw std::invalid_argument("Signal \"" + m_name + "\": domain cannot contain NaN");
        }
        if (!warned && std::isinf(domain[i])) {
            utils::runtime_warning("Signal", "\"" + m_name + "\" domain is not finite");
            warned = true;
        }
        if (i > 0 && !(domain[i] > domain[i - 1])) {
            throw std::invalid_argument("Signal \"" + m_name + "\": domain must be strictly increasing");
        }
    }
}

void Signal::set_domain(const nc::NdArray<double>& domain) {
    std::vector<double> d = utils::to_vector(domain);
    validate_domain(d);
    std::vector<double> r = m_range;
    if (d.size() != r.size()) {
        utils::runtime_warning("Signal", "\"" + m_name + "\" new domain size " + std::to_string(d.size()) +
                                             " differs from range size " + std::to_string(r.size()) +
                                             ", the range is resized");
        r = utils::resize_cyclic(r, d.size());
    }
    commit(std::move(d), std::move(r));
}

void Signal::set_range(const nc::NdArray<double>& range) {
    std::vector<double> r = utils::to_vector(range);
    std::vector<double> d = m_domain;
    if (d.empty()) {
        d.resize(r.size());
        for (std::size_t i = 0; i < r.size(); ++i) d[i] = static_cast<double>(i);
    } else if (r.size() != d.size()) {
        throw std::invalid_argument("Signal \"" + m_name + "\": range size " + std::to_string(r.size()) +
                                    " does not match domain size " + std::to_string(d.size()));
    }
    commit(std::move(d), std::move(r));
}

void Signal::set_data(const std::vector<double>& domain, const std::vector<double>& range) {
    if (domain.size() != range.size()) {
        throw std::invalid_argument("Signal \"" + m_name + "\": domain and range must have the same size");
    }
    validate_domain(domain);
    commit(domain, range);
}

void Signal::set_interpolator_settings(const algebra::InterpolatorSettings& settings) {
    m_function = build_function(m_domain, m_range, settings, m_extrapolator_settings);
    m_interpolator_settings = settings;
}

void Signal::set_extrapolator_settings(const algebra::ExtrapolatorSettings& settings) {
    m_function = build_function(m_domain, m_range, m_interpolator_settings, settings);
    m_extrapolator_settings = settings;
}

std::shared_ptr<const algebra::Extrapolator> Signal::build_function(
    const std::vector<double>& domain,
    const std::vector<double>& range,
    const algebra::InterpolatorSettings& interpolator_settings,
    const algebra::ExtrapolatorSettings& extrapolator_settings) {
    if (domain.size() < 2) return nullptr;
    auto interpolator = algebra::make_interpolator(utils::to_row(domain), utils::to_row(range), interpolator_settings);
    return std::make_shared<const algebra::Extrapolator>(interpolator, extrapolator_settings);
}

// The interpolator is built from the new samples before any member changes,
// a construction error leaves the signal untouched.
void Signal::commit(std::vector<double> domain, std::vector<double> range) {
    auto function = build_function(domain, range, m_interpolator_settings, m_extrapolator_settings);
    m_domain = std::move(domain);
    m_range = std::move(range);
    m_function = std::move(function);
}

void Signal::rebuild() {
    m_function = build_function(m_domain, m_range, m_interpolator_settings, m_extrapolator_settings);
}

double Signal::evaluate_single(double x) const {
    if (m_domain.empty()) return NaN;
    if (m_domain.size() == 1) {
        if (x == m_domain.front()) return m_range.front();
        const auto& e = m_extrapolator_settings;
        if (e.method == algebra::ExtrapolationMethod::Nan) return NaN;
        if (x < m_domain.front()) return e.left ? *e.left : m_range.front();
        return e.right ? *e.right : m_range.front();
    }
    return (*m_function)(x);
}

double Signal::evaluate(double x) const {
    return evaluate_single(x);
}

nc::NdArray<double> Signal::evaluate(const nc::NdArray<double>& x) const {
    nc::NdArray<double> out(x.shape());
    for (std::size_t i = 0; i < x.size(); ++i) out[i] = evaluate_single(x[i]);
    return out;
}

nc::NdArray<double> Signal::operator[](const nc::Slice& indexes) const {
    std::vector<double> values;
    for (std::size_t i : utils::slice_indices(indexes, m_range.size())) values.push_back(m_range[i]);
    return utils::to_row(values);
}

void Signal::require_assignable(const nc::NdArray<double>& x) const {
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (std::isnan(x[i])) {
            throw std::invalid_argument("Signal \"" + m_name + "\": cannot assign at a NaN domain value");
        }
    }
}

void Signal::insert_sample(std::vector<double>& domain, std::vector<double>& range, double x, double y) {
    auto it = std::lower_bound(domain.begin(), domain.end(), x);
    const auto index = static_cast<std::size_t>(it - domain.begin());
    if (it != domain.end() && *it == x) {
        range[index] = y;
    } else {
        domain.insert(it, x);
        range.insert(range.begin() + static_cast<std::ptrdiff_t>(index), y);
    }
}

void Signal::set_item(double x, double y) {
    set_item(nc::NdArray<double>{x}, y);
}

void Signal::set_item(const nc::NdArray<double>& x, const nc::NdArray<double>& y) {
    if (y.size() != x.size() && y.size() != 1) {
        throw std::invalid_argument("Signal \"" + m_name + "\": cannot assign " + std::to_string(y.size()) +
                                    " values to " + std::to_string(x.size()) + " domain values");
    }
    require_assignable(x);
    std::vector<double> d = m_domain;
    std::vector<double> r = m_range;
    for (std::size_t i = 0; i < x.size(); ++i) {
        insert_sample(d, r, x[i], y.size() == 1 ? y[0] : y[i]);
    }
    commit(std::move(d), std::move(r));
}

void Signal::set_item(const nc::NdArray<double>& x, double y) {
    set_item(x, nc::NdArray<double>{y});
}

void Signal::set_item(const nc::Slice& indexes, double y) {
    set_item(indexes, nc::NdArray<double>{y});
}

void Signal::set_item(const nc::Slice& indexes, const nc::NdArray<double>& y) {
    const auto selected = utils::slice_indices(indexes, m_range.size());
    if (y.size() != selected.size() && y.size() != 1) {
        throw std::invalid_argument("Signal \"" + m_name + "\": cannot assign " + std::to_string(y.size()) +
                                    " values to " + std::to_string(selected.size()) + " indexes");
    }
    std::vector<double> r = m_range;
    for (std::size_t k = 0; k < selected.size(); ++k) {
        r[selected[k]] = y.size() == 1 ? y[0] : y[k];
    }
    commit(m_domain, std::move(r));
}

Signal& Signal::fill_nan(FillNanMethod method, double default_value) {
    if (method == FillNanMethod::Constant) {
        for (double& v : m_range) {
            if (std::isnan(v)) v = default_value;
        }
        rebuild();
        return *this;
    }

    std::vector<double> xs;
    std::vector<double> ys;
    for (std::size_t i = 0; i < m_range.size(); ++i) {
        if (!std::isnan(m_range[i])) {
            xs.push_back(m_domain[i]);
            ys.push_back(m_range[i]);
        }
    }
    for (std::size_t i = 0; i < m_range.size(); ++i) {
        if (!std::isnan(m_range[i])) continue;
        const double x = m_domain[i];
        if (xs.empty()) {
            m_range[i] = default_value;
        } else if (x <= xs.front()) {
            m_range[i] = ys.front();
        } else if (x >= xs.back()) {
            m_range[i] = ys.back();
        } else {
            const auto upper = static_cast<std::size_t>(std::upper_bound(xs.begin(), xs.end(), x) - xs.begin());
            const std::size_t lower = upper - 1;
            const double t = (x - xs[lower]) / (xs[upper] - xs[lower]);
            m_range[i] = ys[lower] + t * (ys[upper] - ys[lower]);
        }
    }
    rebuild();
    return *this;
}

double Signal::domain_distance(double x) const {
    if (m_domain.empty() || std::isnan(x)) return NaN;
    if (x <= m_domain.front()) return m_domain.front() - x;
    if (x > m_domain.back()) return x - m_domain.back();
    if (x == m_domain.back()) return 1.0;
    const auto upper = static_cast<std::size_t>(
        std::upper_bound(m_domain.begin(), m_domain.end(), x) - m_domain.begin());
    const std::size_t lower = upper - 1;
    return (x - m_domain[lower]) / (m_domain[upper] - m_domain[lower]);
}

nc::NdArray<double> Signal::domain_distance(const nc::NdArray<double>& x) const {
    nc::NdArray<double> out(x.shape());
    for (std::size_t i = 0; i < x.size(); ++i) out[i] = domain_distance(x[i]);
    return out;
}

bool Signal::is_uniform() const {
    return utils::is_uniform(m_domain);
}

bool Signal::contains(double x) const {
    if (m_domain.empty() || std::isnan(x)) return false;
    return x >= m_domain.front() && x <= m_domain.back();
}

bool Signal::contains(const nc::NdArray<double>& x) const {
    for (const double v : x) {
        if (!contains(v)) return false;
    }
    return true;
}

void Signal::arithmetic_in_place(const std::vector<double>& operand, ArithmeticOperator op) {
    if (operand.size() != m_range.size() && operand.size() != 1) {
        throw std::invalid_argument("Signal \"" + m_name + "\": operand size " + std::to_string(operand.size()) +
                                    " does not match range size " + std::to_string(m_range.size()));
    }
    for (std::size_t i = 0; i < m_range.size(); ++i) {
        m_range[i] = apply_operator(m_range[i], operand.size() == 1 ? operand[0] : operand[i], op);
    }
    rebuild();
}

Signal Signal::apply_arithmetic(double operand, ArithmeticOperator op, bool in_place) {
    Signal result = *this;
    result.arithmetic_in_place({operand}, op);
    if (in_place) *this = result;
    return result;
}

Signal Signal::apply_arithmetic(const nc::NdArray<double>& operand, ArithmeticOperator op, bool in_place) {
    Signal result = *this;
    result.arithmetic_in_place(utils::to_vector(operand), op);
    if (in_place) *this = result;
    return result;
}

Signal Signal::apply_arithmetic(const Signal& operand, ArithmeticOperator op, bool in_place) {
    Signal result = *this;
    std::vector<double> values(m_domain.size());
    for (std::size_t i = 0; i < m_domain.size(); ++i) values[i] = operand.evaluate(m_domain[i]);
    if (!values.empty()) result.arithmetic_in_place(values, op);

    std::vector<double> exclusive;
    std::set_symmetric_difference(m_domain.begin(), m_domain.end(),
                                  operand.m_domain.begin(), operand.m_domain.end(),
                                  std::back_inserter(exclusive));
    std::vector<double> d = result.m_domain;
    std::vector<double> r = result.m_range;
    for (const double x : exclusive) insert_sample(d, r, x, NaN);
    result.commit(std::move(d), std::move(r));

    if (in_place) *this = result;
    return result;
}

bool operator==(const Signal& a, const Signal& b) {
    return a.m_domain == b.m_domain &&
           utils::same_values(a.m_range, b.m_range) &&
           a.m_interpolator_settings == b.m_interpolator_settings &&
           a.m_extrapolator_settings == b.m_extrapolator_settings;
}

std::ostream& operator<<(std::ostream& os, const Signal& signal) {
    std::ostringstream oss;
    oss << std::setprecision(8);
    oss << "Signal(\"" << signal.m_name << "\", " << signal.size() << " samples)";
    for (std::size_t i = 0; i < signal.size(); ++i) {
        oss << "\n  [" << signal.m_domain[i] << ", " << signal.m_range[i] << "]";
    }
    return os << oss.str();
}

} // namespace continuous
} // namespace chromat
