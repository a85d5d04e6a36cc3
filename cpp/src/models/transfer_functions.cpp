#include "transfer_functions.hpp"
#include "common.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace chromat {
namespace models {

using config::ScaleMode;

namespace {

template <typename Function>
nc::NdArray<double> map(const nc::NdArray<double>& a, Function f) {
    nc::NdArray<double> out(a.shape());
    for (std::size_t i = 0; i < a.size(); ++i) out[i] = f(a[i]);
    return out;
}

// ST 2084 constants
constexpr double ST2084_M_1 = 2610.0 / 4096.0 * (1.0 / 4.0);
constexpr double ST2084_M_2 = 2523.0 / 4096.0 * 128.0;
constexpr double ST2084_C_1 = 3424.0 / 4096.0;
constexpr double ST2084_C_2 = 2413.0 / 4096.0 * 32.0;
constexpr double ST2084_C_3 = 2392.0 / 4096.0 * 32.0;

constexpr double DCDM_NORMALISATION = 52.37;
constexpr double DCDM_GAMMA = 2.6;
constexpr double DCDM_CODE_MAX = 4095.0;

// ACEScc / ACEScct
constexpr double ACES_LOG_OFFSET = 9.72;
constexpr double ACES_LOG_SCALE = 17.52;
constexpr double ACESCCT_X_BRK = 0.0078125;
constexpr double ACESCCT_Y_BRK = 0.155251141552511;
constexpr double ACESCCT_A = 10.5402377416545;
constexpr double ACESCCT_B = 0.0729055341958355;

struct ACESproxyConstants {
    double CV_min;
    double CV_max;
    double steps_per_stop;
    double mid_CV_offset;
    double mid_log_offset;
};

ACESproxyConstants aces_proxy_constants(int bit_depth) {
    if (bit_depth == 10) return {64.0, 940.0, 50.0, 425.0, 2.5};
    if (bit_depth == 12) return {256.0, 3760.0, 200.0, 1700.0, 2.5};
    throw std::invalid_argument("Invalid ACESproxy bit depth " + std::to_string(bit_depth) +
                                ", accepted values are: 10, 12");
}

struct BT2020Constants {
    double alpha;
    double beta;
};

BT2020Constants bt2020_constants(bool is_12_bits_system) {
    return is_12_bits_system ? BT2020Constants{1.0993, 0.0181}
                             : BT2020Constants{1.09929682680944, 0.018053968510807};
}

} // namespace

// -----------------------------------------------------------------------------
// Display and camera encodings
// -----------------------------------------------------------------------------

nc::NdArray<double> eotf_inverse_sRGB(const nc::NdArray<double>& L, ScaleMode scale) {
    const auto V = map(config::to_domain_1(L, scale), [](double l) {
        return l <= 0.0031308 ? 12.92 * l : 1.055 * std::pow(l, 1.0 / 2.4) - 0.055;
    });
    return config::from_range_1(V, scale);
}

nc::NdArray<double> eotf_sRGB(const nc::NdArray<double>& V, ScaleMode scale) {
    const auto L = map(config::to_domain_1(V, scale), [](double v) {
        return v <= 0.04045 ? v / 12.92 : std::pow((v + 0.055) / 1.055, 2.4);
    });
    return config::from_range_1(L, scale);
}

nc::NdArray<double> oetf_BT709(const nc::NdArray<double>& L, ScaleMode scale) {
    const auto V = map(config::to_domain_1(L, scale), [](double l) {
        return l < 0.018 ? 4.5 * l : 1.099 * std::pow(l, 0.45) - 0.099;
    });
    return config::from_range_1(V, scale);
}

nc::NdArray<double> oetf_inverse_BT709(const nc::NdArray<double>& V, ScaleMode scale) {
    const auto L = map(config::to_domain_1(V, scale), [](double v) {
        return v < 4.5 * 0.018 ? v / 4.5 : std::pow((v + 0.099) / 1.099, 1.0 / 0.45);
    });
    return config::from_range_1(L, scale);
}

nc::NdArray<double> oetf_BT2020(const nc::NdArray<double>& E, bool is_12_bits_system, ScaleMode scale) {
    const auto k = bt2020_constants(is_12_bits_system);
    const auto E_p = map(config::to_domain_1(E, scale), [k](double e) {
        return e < k.beta ? 4.5 * e : k.alpha * std::pow(e, 0.45) - (k.alpha - 1.0);
    });
    return config::from_range_1(E_p, scale);
}

nc::NdArray<double> oetf_inverse_BT2020(const nc::NdArray<double>& E_p, bool is_12_bits_system, ScaleMode scale) {
    const auto k = bt2020_constants(is_12_bits_system);
    const auto E = map(config::to_domain_1(E_p, scale), [k](double e) {
        return e < 4.5 * k.beta ? e / 4.5 : std::pow((e + (k.alpha - 1.0)) / k.alpha, 1.0 / 0.45);
    });
    return config::from_range_1(E, scale);
}

nc::NdArray<double> cctf_encoding_ProPhotoRGB(const nc::NdArray<double>& X, ScaleMode scale) {
    const auto X_p = map(config::to_domain_1(X, scale), [](double x) {
        return x < 1.0 / 512.0 ? 16.0 * x : std::pow(x, 1.0 / 1.8);
    });
    return config::from_range_1(X_p, scale);
}

nc::NdArray<double> cctf_decoding_ProPhotoRGB(const nc::NdArray<double>& X_p, ScaleMode scale) {
    const auto X = map(config::to_domain_1(X_p, scale), [](double x) {
        return x < 16.0 / 512.0 ? x / 16.0 : std::pow(x, 1.8);
    });
    return config::from_range_1(X, scale);
}

// -----------------------------------------------------------------------------
// SMPTE ST 2084 (PQ) and DCDM
// -----------------------------------------------------------------------------

nc::NdArray<double> eotf_inverse_ST2084(const nc::NdArray<double>& C, double L_p, ScaleMode scale) {
    const auto N = map(config::to_domain_1(C, scale), [L_p](double c) {
        const double Y_p = std::pow(c / L_p, ST2084_M_1);
        return std::pow((ST2084_C_1 + ST2084_C_2 * Y_p) / (ST2084_C_3 * Y_p + 1.0), ST2084_M_2);
    });
    return config::from_range_1(N, scale);
}

nc::NdArray<double> eotf_ST2084(const nc::NdArray<double>& N, double L_p, ScaleMode scale) {
    const auto C = map(config::to_domain_1(N, scale), [L_p](double n) {
        const double V_p = std::pow(n, 1.0 / ST2084_M_2);
        const double numerator = std::max(V_p - ST2084_C_1, 0.0);
        const double L = std::pow(numerator / (ST2084_C_2 - ST2084_C_3 * V_p), 1.0 / ST2084_M_1);
        return L_p * L;
    });
    return config::from_range_1(C, scale);
}

nc::NdArray<double> eotf_inverse_DCDM(const nc::NdArray<double>& XYZ, bool out_int, ScaleMode scale) {
    const auto XYZ_p = map(config::to_domain_1(XYZ, scale), [](double v) {
        return std::pow(v / DCDM_NORMALISATION, 1.0 / DCDM_GAMMA);
    });
    if (out_int) {
        return map(XYZ_p, [](double v) { return std::nearbyint(DCDM_CODE_MAX * v); });
    }
    return config::from_range_1(XYZ_p, scale);
}

nc::NdArray<double> eotf_DCDM(const nc::NdArray<double>& XYZ_p, bool in_int, ScaleMode scale) {
    const auto normalised = in_int ? map(XYZ_p, [](double v) { return v / DCDM_CODE_MAX; })
                                   : config::to_domain_1(XYZ_p, scale);
    const auto XYZ = map(normalised, [](double v) {
        return DCDM_NORMALISATION * std::pow(v, DCDM_GAMMA);
    });
    return config::from_range_1(XYZ, scale);
}

// -----------------------------------------------------------------------------
// ACES log encodings
// -----------------------------------------------------------------------------

nc::NdArray<double> log_encoding_ACEScc(const nc::NdArray<double>& lin_AP1, ScaleMode scale) {
    const auto ACEScc = map(config::to_domain_1(lin_AP1, scale), [](double lin) {
        if (lin <= 0.0) return (std::log2(std::pow(2.0, -16.0)) + ACES_LOG_OFFSET) / ACES_LOG_SCALE;
        if (lin < std::pow(2.0, -15.0)) {
            return (std::log2(std::pow(2.0, -16.0) + lin * 0.5) + ACES_LOG_OFFSET) / ACES_LOG_SCALE;
        }
        return (std::log2(lin) + ACES_LOG_OFFSET) / ACES_LOG_SCALE;
    });
    return config::from_range_1(ACEScc, scale);
}

nc::NdArray<double> log_decoding_ACEScc(const nc::NdArray<double>& ACEScc, ScaleMode scale) {
    const auto lin = map(config::to_domain_1(ACEScc, scale), [](double cc) {
        if (cc < (ACES_LOG_OFFSET - 15.0) / ACES_LOG_SCALE) {
            return (std::pow(2.0, cc * ACES_LOG_SCALE - ACES_LOG_OFFSET) - std::pow(2.0, -16.0)) * 2.0;
        }
        if (cc < (std::log2(65504.0) + ACES_LOG_OFFSET) / ACES_LOG_SCALE) {
            return std::pow(2.0, cc * ACES_LOG_SCALE - ACES_LOG_OFFSET);
        }
        return 65504.0;
    });
    return config::from_range_1(lin, scale);
}

nc::NdArray<double> log_encoding_ACEScct(const nc::NdArray<double>& lin_AP1, ScaleMode scale) {
    const auto ACEScct = map(config::to_domain_1(lin_AP1, scale), [](double lin) {
        return lin <= ACESCCT_X_BRK ? ACESCCT_A * lin + ACESCCT_B
                                    : (std::log2(lin) + ACES_LOG_OFFSET) / ACES_LOG_SCALE;
    });
    return config::from_range_1(ACEScct, scale);
}

nc::NdArray<double> log_decoding_ACEScct(const nc::NdArray<double>& ACEScct, ScaleMode scale) {
    const auto lin = map(config::to_domain_1(ACEScct, scale), [](double cct) {
        return cct > ACESCCT_Y_BRK ? std::pow(2.0, cct * ACES_LOG_SCALE - ACES_LOG_OFFSET)
                                   : (cct - ACESCCT_B) / ACESCCT_A;
    });
    return config::from_range_1(lin, scale);
}

nc::NdArray<double> log_encoding_ACESproxy(const nc::NdArray<double>& lin_AP1,
                                           int bit_depth,
                                           bool out_int,
                                           ScaleMode scale) {
    const auto k = aces_proxy_constants(bit_depth);
    const double code_max = std::pow(2.0, bit_depth) - 1.0;

    const auto code_values = map(config::to_domain_1(lin_AP1, scale), [k](double lin) {
        if (!(lin > std::pow(2.0, -9.72))) return k.CV_min;
        const double cv = (std::log2(lin) + k.mid_log_offset) * k.steps_per_stop + k.mid_CV_offset;
        return std::clamp(std::nearbyint(cv), k.CV_min, k.CV_max);
    });
    if (out_int) return code_values;
    return config::from_range_1(map(code_values, [code_max](double cv) { return cv / code_max; }), scale);
}

nc::NdArray<double> log_decoding_ACESproxy(const nc::NdArray<double>& ACESproxy,
                                           int bit_depth,
                                           bool in_int,
                                           ScaleMode scale) {
    const auto k = aces_proxy_constants(bit_depth);
    const double code_max = std::pow(2.0, bit_depth) - 1.0;

    const auto code_values = in_int ? ACESproxy
                                    : map(config::to_domain_1(ACESproxy, scale),
                                          [code_max](double v) { return v * code_max; });
    const auto lin = map(code_values, [k](double cv) {
        return std::pow(2.0, (cv - k.mid_CV_offset) / k.steps_per_stop - k.mid_log_offset);
    });
    return config::from_range_1(lin, scale);
}

} // namespace models
} // namespace chromat
