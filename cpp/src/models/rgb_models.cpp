#include "rgb_models.hpp"
#include "common.hpp"

#include <algorithm>
#include <cmath>

namespace chromat {
namespace models {

using config::ScaleMode;

namespace {

// Hue of a row in [0, 1], 0 for achromatic rows.
double hue(double R, double G, double B, double maximum, double delta) {
    if (delta == 0.0) return 0.0;
    const double delta_R = ((maximum - R) / 6.0 + delta / 2.0) / delta;
    const double delta_G = ((maximum - G) / 6.0 + delta / 2.0) / delta;
    const double delta_B = ((maximum - B) / 6.0 + delta / 2.0) / delta;

    double H;
    if (R == maximum) H = delta_B - delta_G;
    else if (G == maximum) H = 1.0 / 3.0 + delta_R - delta_B;
    else H = 2.0 / 3.0 + delta_G - delta_R;

    if (H < 0.0) H += 1.0;
    if (H > 1.0) H -= 1.0;
    return H;
}

double hue_to_component(double v_1, double v_2, double v_H) {
    if (v_H < 0.0) v_H += 1.0;
    if (v_H > 1.0) v_H -= 1.0;
    if (6.0 * v_H < 1.0) return v_1 + (v_2 - v_1) * 6.0 * v_H;
    if (2.0 * v_H < 1.0) return v_2;
    if (3.0 * v_H < 2.0) return v_1 + (v_2 - v_1) * (2.0 / 3.0 - v_H) * 6.0;
    return v_1;
}

} // namespace

nc::NdArray<double> RGB_to_HSV(const nc::NdArray<double>& RGB, ScaleMode scale) {
    utils::require_columns(RGB, 3, "RGB_to_HSV");
    const auto values = config::to_domain_1(RGB, scale);
    nc::NdArray<double> HSV(values.shape().rows, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double R = values(i, 0);
        const double G = values(i, 1);
        const double B = values(i, 2);
        const double maximum = std::max({R, G, B});
        const double delta = maximum - std::min({R, G, B});
        HSV(i, 0) = hue(R, G, B, maximum, delta);
        HSV(i, 1) = delta == 0.0 ? 0.0 : delta / maximum;
        HSV(i, 2) = maximum;
    }
    return config::from_range_1(HSV, scale);
}

nc::NdArray<double> HSV_to_RGB(const nc::NdArray<double>& HSV, ScaleMode scale) {
    utils::require_columns(HSV, 3, "HSV_to_RGB");
    const auto values = config::to_domain_1(HSV, scale);
    nc::NdArray<double> RGB(values.shape().rows, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double S = values(i, 1);
        const double V = values(i, 2);
        double h = values(i, 0) * 6.0;
        if (h >= 6.0) h = 0.0;
        const double sector = std::floor(h);
        const double f = h - sector;
        const double j = V * (1.0 - S);
        const double k = V * (1.0 - S * f);
        const double l = V * (1.0 - S * (1.0 - f));

        double R = V, G = l, B = j;
        switch (static_cast<int>(sector)) {
            case 1: R = k; G = V; B = j; break;
            case 2: R = j; G = V; B = l; break;
            case 3: R = j; G = k; B = V; break;
            case 4: R = l; G = j; B = V; break;
            case 5: R = V; G = j; B = k; break;
            default: break;
        }
        RGB(i, 0) = R;
        RGB(i, 1) = G;
        RGB(i, 2) = B;
    }
    return config::from_range_1(RGB, scale);
}

nc::NdArray<double> RGB_to_HSL(const nc::NdArray<double>& RGB, ScaleMode scale) {
    utils::require_columns(RGB, 3, "RGB_to_HSL");
    const auto values = config::to_domain_1(RGB, scale);
    nc::NdArray<double> HSL(values.shape().rows, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double R = values(i, 0);
        const double G = values(i, 1);
        const double B = values(i, 2);
        const double maximum = std::max({R, G, B});
        const double minimum = std::min({R, G, B});
        const double delta = maximum - minimum;
        const double L = (maximum + minimum) / 2.0;

        double S = 0.0;
        if (delta != 0.0) {
            S = L < 0.5 ? delta / (maximum + minimum) : delta / (2.0 - maximum - minimum);
        }
        HSL(i, 0) = hue(R, G, B, maximum, delta);
        HSL(i, 1) = S;
        HSL(i, 2) = L;
    }
    return config::from_range_1(HSL, scale);
}

nc::NdArray<double> HSL_to_RGB(const nc::NdArray<double>& HSL, ScaleMode scale) {
    utils::require_columns(HSL, 3, "HSL_to_RGB");
    const auto values = config::to_domain_1(HSL, scale);
    nc::NdArray<double> RGB(values.shape().rows, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double H = values(i, 0);
        const double S = values(i, 1);
        const double L = values(i, 2);
        if (S == 0.0) {
            RGB(i, 0) = L;
            RGB(i, 1) = L;
            RGB(i, 2) = L;
            continue;
        }
        const double Q = L < 0.5 ? L * (1.0 + S) : (L + S) - (S * L);
        const double P = 2.0 * L - Q;
        RGB(i, 0) = hue_to_component(P, Q, H + 1.0 / 3.0);
        RGB(i, 1) = hue_to_component(P, Q, H);
        RGB(i, 2) = hue_to_component(P, Q, H - 1.0 / 3.0);
    }
    return config::from_range_1(RGB, scale);
}

nc::NdArray<double> RGB_to_CMY(const nc::NdArray<double>& RGB, ScaleMode scale) {
    utils::require_columns(RGB, 3, "RGB_to_CMY");
    auto CMY = config::to_domain_1(RGB, scale);
    for (auto& value : CMY) value = 1.0 - value;
    return config::from_range_1(CMY, scale);
}

nc::NdArray<double> CMY_to_RGB(const nc::NdArray<double>& CMY, ScaleMode scale) {
    utils::require_columns(CMY, 3, "CMY_to_RGB");
    auto RGB = config::to_domain_1(CMY, scale);
    for (auto& value : RGB) value = 1.0 - value;
    return config::from_range_1(RGB, scale);
}

nc::NdArray<double> CMY_to_CMYK(const nc::NdArray<double>& CMY, ScaleMode scale) {
    utils::require_columns(CMY, 3, "CMY_to_CMYK");
    const auto values = config::to_domain_1(CMY, scale);
    nc::NdArray<double> CMYK(values.shape().rows, 4);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double K = std::min({1.0, values(i, 0), values(i, 1), values(i, 2)});
        for (nc::uint32 c = 0; c < 3; ++c) {
            CMYK(i, c) = K == 1.0 ? 0.0 : (values(i, c) - K) / (1.0 - K);
        }
        CMYK(i, 3) = K;
    }
    return config::from_range_1(CMYK, scale);
}

nc::NdArray<double> CMYK_to_CMY(const nc::NdArray<double>& CMYK, ScaleMode scale) {
    utils::require_columns(CMYK, 4, "CMYK_to_CMY");
    const auto values = config::to_domain_1(CMYK, scale);
    nc::NdArray<double> CMY(values.shape().rows, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double K = values(i, 3);
        for (nc::uint32 c = 0; c < 3; ++c) CMY(i, c) = values(i, c) * (1.0 - K) + K;
    }
    return config::from_range_1(CMY, scale);
}

} // namespace models
} // namespace chromat
