#pragma once

#include "NumCpp.hpp"
#include "interpolation.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace chromat {
namespace algebra {

enum class ExtrapolationMethod { Linear, Constant, Nan };

ExtrapolationMethod parse_extrapolation_method(const std::string& name);
std::string to_string(ExtrapolationMethod method);

/**
 * @brief Extrapolation method and the optional left / right constants.
 *
 * When set, left and right override the Linear and Constant methods below and
 * above the interpolator range.
 */
struct ExtrapolatorSettings {
    ExtrapolationMethod method = ExtrapolationMethod::Linear;
    std::optional<double> left;
    std::optional<double> right;

    static ExtrapolatorSettings from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

bool operator==(const ExtrapolatorSettings& a, const ExtrapolatorSettings& b);
bool operator!=(const ExtrapolatorSettings& a, const ExtrapolatorSettings& b);

class Extrapolator {
public:
    explicit Extrapolator(std::shared_ptr<const Interpolator> interpolator, ExtrapolatorSettings settings = {});

    double operator()(double x) const;
    nc::NdArray<double> operator()(const nc::NdArray<double>& x) const;

    const Interpolator& interpolator() const { return *m_interpolator; }
    const ExtrapolatorSettings& settings() const { return m_settings; }

private:
    std::shared_ptr<const Interpolator> m_interpolator;
    ExtrapolatorSettings m_settings;
    double m_x0, m_x1, m_y0, m_y1;  // first segment
    double m_xm, m_xn, m_ym, m_yn;  // last segment
};

} // namespace algebra
} // namespace chromat
