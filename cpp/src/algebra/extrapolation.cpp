#include "extrapolation.hpp"
#include "common.hpp"
#include "json_values.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace chromat {
namespace algebra {

ExtrapolationMethod parse_extrapolation_method(const std::string& name) {
    const std::string key = utils::to_lower(name);
    if (key == "linear") return ExtrapolationMethod::Linear;
    if (key == "constant") return ExtrapolationMethod::Constant;
    if (key == "nan") return ExtrapolationMethod::Nan;
    throw std::invalid_argument("Invalid extrapolation method \"" + name +
                                "\", accepted values are: Linear, Constant, NaN");
}

std::string to_string(ExtrapolationMethod method) {
    switch (method) {
        case ExtrapolationMethod::Linear: return "Linear";
        case ExtrapolationMethod::Constant: return "Constant";
        case ExtrapolationMethod::Nan: return "NaN";
    }
    return "Linear";
}

ExtrapolatorSettings ExtrapolatorSettings::from_json(const nlohmann::json& j) {
    utils::require_known_keys(j, {"method", "left", "right"}, "ExtrapolatorSettings");
    ExtrapolatorSettings s;
    if (j.contains("method")) s.method = parse_extrapolation_method(j.at("method").get<std::string>());
    if (j.contains("left")) s.left = utils::json_to_double(j.at("left"));
    if (j.contains("right")) s.right = utils::json_to_double(j.at("right"));
    return s;
}

nlohmann::json ExtrapolatorSettings::to_json() const {
    nlohmann::json j;
    j["method"] = to_string(method);
    if (left) j["left"] = utils::double_to_json(*left);
    if (right) j["right"] = utils::double_to_json(*right);
    return j;
}

bool operator==(const ExtrapolatorSettings& a, const ExtrapolatorSettings& b) {
    if (a.method != b.method) return false;
    if (a.left.has_value() != b.left.has_value() || a.right.has_value() != b.right.has_value()) return false;
    if (a.left && !utils::same_value(*a.left, *b.left)) return false;
    if (a.right && !utils::same_value(*a.right, *b.right)) return false;
    return true;
}

bool operator!=(const ExtrapolatorSettings& a, const ExtrapolatorSettings& b) {
    return !(a == b);
}

Extrapolator::Extrapolator(std::shared_ptr<const Interpolator> interpolator, ExtrapolatorSettings settings)
    : m_interpolator(std::move(interpolator)), m_settings(settings) {
    if (!m_interpolator) {
        throw std::invalid_argument("Extrapolator: interpolator must not be null");
    }
    const auto x = m_interpolator->x();
    const auto y = m_interpolator->y();
    const std::size_t n = x.size();
    m_x0 = x[0];
    m_x1 = x[1];
    m_y0 = y[0];
    m_y1 = y[1];
    m_xm = x[static_cast<nc::uint32>(n - 2)];
    m_xn = x[static_cast<nc::uint32>(n - 1)];
    m_ym = y[static_cast<nc::uint32>(n - 2)];
    m_yn = y[static_cast<nc::uint32>(n - 1)];
}

double Extrapolator::operator()(double x) const {
    if (std::isnan(x)) return std::numeric_limits<double>::quiet_NaN();
    if (x >= m_x0 && x <= m_xn) return (*m_interpolator)(x);

    const bool below = x < m_x0;
    switch (m_settings.method) {
        case ExtrapolationMethod::Nan:
            return std::numeric_limits<double>::quiet_NaN();
        case ExtrapolationMethod::Linear:
            if (below) {
                if (m_settings.left) return *m_settings.left;
                return m_y0 + (x - m_x0) * (m_y1 - m_y0) / (m_x1 - m_x0);
            }
            if (m_settings.right) return *m_settings.right;
            return m_yn + (x - m_xn) * (m_yn - m_ym) / (m_xn - m_xm);
        case ExtrapolationMethod::Constant:
            if (below) return m_settings.left ? *m_settings.left : m_y0;
            return m_settings.right ? *m_settings.right : m_yn;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

nc::NdArray<double> Extrapolator::operator()(const nc::NdArray<double>& x) const {
    nc::NdArray<double> out(x.shape());
    for (std::size_t k = 0; k < x.size(); ++k) out[k] = (*this)(x[k]);
    return out;
}

} // namespace algebra
} // namespace chromat
