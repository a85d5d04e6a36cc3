#include "colour_models.hpp"

#include <cmath>
#include <stdexcept>

namespace chromat {
namespace models {

using config::ScaleKind;
using config::ScaleKinds;
using config::ScaleMode;

namespace {

constexpr double CIE_E = 216.0 / 24389.0;
constexpr double CIE_K = 24389.0 / 27.0;
constexpr double PI = 3.14159265358979323846;

const ScaleKinds XYY_KINDS = {ScaleKind::Fixed, ScaleKind::Fixed, ScaleKind::Unit};
const ScaleKinds LCH_KINDS = {ScaleKind::Percent, ScaleKind::Percent, ScaleKind::Degrees};

double f_Lab(double t) {
    return t > CIE_E ? std::cbrt(t) : (CIE_K * t + 16.0) / 116.0;
}

double f_Lab_inverse(double f) {
    const double f3 = f * f * f;
    return f3 > CIE_E ? f3 : (116.0 * f - 16.0) / CIE_K;
}

// CIE 1976 u'v' of a tristimulus triplet, the fallback for black.
std::array<double, 2> XYZ_to_uv_prime(double X, double Y, double Z, const std::array<double, 2>& fallback) {
    const double d = X + 15.0 * Y + 3.0 * Z;
    if (d == 0.0) return fallback;
    return {{4.0 * X / d, 9.0 * Y / d}};
}

std::array<double, 2> white_uv_prime(const Chromaticity& illuminant) {
    const auto W = whitepoint_XYZ(illuminant);
    return XYZ_to_uv_prime(W[0], W[1], W[2], {{0.0, 0.0}});
}

// CIE 1960 UCS uv from xy.
std::array<double, 2> xy_to_uv_1960(double x, double y) {
    const double d = -2.0 * x + 12.0 * y + 3.0;
    return {{4.0 * x / d, 6.0 * y / d}};
}

nc::NdArray<double> rows_like(const nc::NdArray<double>& a, nc::uint32 cols) {
    return nc::NdArray<double>(a.shape().rows, cols);
}

nc::NdArray<double> Lab_like_to_LCH(const nc::NdArray<double>& Lab) {
    auto out = rows_like(Lab, 3);
    for (nc::uint32 i = 0; i < Lab.shape().rows; ++i) {
        const double a = Lab(i, 1);
        const double b = Lab(i, 2);
        double h = std::atan2(b, a) * 180.0 / PI;
        if (h < 0.0) h += 360.0;
        out(i, 0) = Lab(i, 0);
        out(i, 1) = std::hypot(a, b);
        out(i, 2) = h;
    }
    return out;
}

nc::NdArray<double> LCH_to_Lab_like(const nc::NdArray<double>& LCH) {
    auto out = rows_like(LCH, 3);
    for (nc::uint32 i = 0; i < LCH.shape().rows; ++i) {
        const double h = LCH(i, 2) * PI / 180.0;
        out(i, 0) = LCH(i, 0);
        out(i, 1) = LCH(i, 1) * std::cos(h);
        out(i, 2) = LCH(i, 1) * std::sin(h);
    }
    return out;
}

// Hunt-Pointer-Estevez normalised to D65, as used by IPT.
const algebra::Matrix3 MATRIX_IPT_XYZ_TO_LMS = {{
    {{0.4002, 0.7075, -0.0807}},
    {{-0.2280, 1.1500, 0.0612}},
    {{0.0000, 0.0000, 0.9184}},
}};

const algebra::Matrix3 MATRIX_IPT_LMS_P_TO_IPT = {{
    {{0.4000, 0.4000, 0.2000}},
    {{4.4550, -4.8510, 0.3960}},
    {{0.8056, 0.3572, -1.1628}},
}};

const algebra::Matrix3 MATRIX_OKLAB_XYZ_TO_LMS = {{
    {{0.8189330101, 0.3618667424, -0.1288597137}},
    {{0.0329845436, 0.9293118715, 0.0361456387}},
    {{0.0482003018, 0.2643662691, 0.6338517070}},
}};

const algebra::Matrix3 MATRIX_OKLAB_LMS_P_TO_LAB = {{
    {{0.2104542553, 0.7936177850, -0.0040720468}},
    {{1.9779984951, -2.4285922050, 0.4505937099}},
    {{0.0259040371, 0.7827717662, -0.8086757660}},
}};

nc::NdArray<double> spow_all(const nc::NdArray<double>& a, double p) {
    nc::NdArray<double> out(a.shape());
    for (std::size_t i = 0; i < a.size(); ++i) out[i] = utils::spow(a[i], p);
    return out;
}

nc::NdArray<double> matrix_power_matrix(const nc::NdArray<double>& XYZ,
                                        const algebra::Matrix3& m1,
                                        double p,
                                        const algebra::Matrix3& m2) {
    return algebra::vector_dot(m2, spow_all(algebra::vector_dot(m1, XYZ), p));
}

nc::NdArray<double> matrix_power_matrix_inverse(const nc::NdArray<double>& values,
                                                const algebra::Matrix3& m1,
                                                double p,
                                                const algebra::Matrix3& m2) {
    return algebra::vector_dot(algebra::inverse(m1),
                               spow_all(algebra::vector_dot(algebra::inverse(m2), values), 1.0 / p));
}

} // namespace

Chromaticity illuminant_xy(const std::string& name) {
    const std::string key = utils::to_lower(name);
    if (key == "a") return {{0.44757, 0.40745}};
    if (key == "d50") return CCS_ILLUMINANT_D50;
    if (key == "d55") return {{0.33242, 0.34743}};
    if (key == "d60") return {{0.321616709705268, 0.337619916550817}};
    if (key == "d65") return CCS_ILLUMINANT_D65;
    if (key == "d75") return {{0.29902, 0.31485}};
    if (key == "e") return {{1.0 / 3.0, 1.0 / 3.0}};
    if (key == "aces") return CCS_ILLUMINANT_ACES;
    throw std::invalid_argument("Invalid illuminant \"" + name + "\", accepted values are: " +
                                utils::join(illuminant_names(), ", "));
}

std::vector<std::string> illuminant_names() {
    return {"A", "D50", "D55", "D60", "D65", "D75", "E", "ACES"};
}

algebra::Vector3 whitepoint_XYZ(const Chromaticity& xy) {
    const double x = xy[0];
    const double y = xy[1];
    if (y == 0.0) return {{0.0, 0.0, 0.0}};
    return {{x / y, 1.0, (1.0 - x - y) / y}};
}

// -----------------------------------------------------------------------------
// CIE xyY / xy
// -----------------------------------------------------------------------------

nc::NdArray<double> XYZ_to_xyY(const nc::NdArray<double>& XYZ, const Chromaticity& illuminant, ScaleMode scale) {
    utils::require_columns(XYZ, 3, "XYZ_to_xyY");
    const auto values = config::to_domain_1(XYZ, scale);
    auto xyY = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double X = values(i, 0);
        const double Y = values(i, 1);
        const double Z = values(i, 2);
        const double s = X + Y + Z;
        if (s == 0.0) {
            xyY(i, 0) = illuminant[0];
            xyY(i, 1) = illuminant[1];
        } else {
            xyY(i, 0) = X / s;
            xyY(i, 1) = Y / s;
        }
        xyY(i, 2) = Y;
    }
    return config::from_range(xyY, scale, XYY_KINDS);
}

nc::NdArray<double> xyY_to_XYZ(const nc::NdArray<double>& xyY, ScaleMode scale) {
    utils::require_columns(xyY, 3, "xyY_to_XYZ");
    const auto values = config::to_domain(xyY, scale, XYY_KINDS);
    auto XYZ = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double x = values(i, 0);
        const double y = values(i, 1);
        const double Y = values(i, 2);
        if (y == 0.0) {
            XYZ(i, 0) = 0.0;
            XYZ(i, 1) = 0.0;
            XYZ(i, 2) = 0.0;
            continue;
        }
        XYZ(i, 0) = x * Y / y;
        XYZ(i, 1) = Y;
        XYZ(i, 2) = (1.0 - x - y) * Y / y;
    }
    return config::from_range_1(XYZ, scale);
}

nc::NdArray<double> xyY_to_xy(const nc::NdArray<double>& xyY) {
    utils::require_columns(xyY, 3, "xyY_to_xy");
    auto xy = rows_like(xyY, 2);
    for (nc::uint32 i = 0; i < xyY.shape().rows; ++i) {
        xy(i, 0) = xyY(i, 0);
        xy(i, 1) = xyY(i, 1);
    }
    return xy;
}

nc::NdArray<double> xy_to_xyY(const nc::NdArray<double>& xy, ScaleMode scale) {
    utils::require_columns(xy, 2, "xy_to_xyY");
    auto xyY = rows_like(xy, 3);
    for (nc::uint32 i = 0; i < xy.shape().rows; ++i) {
        xyY(i, 0) = xy(i, 0);
        xyY(i, 1) = xy(i, 1);
        xyY(i, 2) = 1.0;
    }
    return config::from_range(xyY, scale, XYY_KINDS);
}

nc::NdArray<double> XYZ_to_xy(const nc::NdArray<double>& XYZ, const Chromaticity& illuminant) {
    return xyY_to_xy(XYZ_to_xyY(XYZ, illuminant));
}

nc::NdArray<double> xy_to_XYZ(const nc::NdArray<double>& xy, ScaleMode scale) {
    return config::from_range_1(xyY_to_XYZ(xy_to_xyY(xy)), scale);
}

// -----------------------------------------------------------------------------
// CIE L*a*b* / L*u*v*
// -----------------------------------------------------------------------------

nc::NdArray<double> XYZ_to_Lab(const nc::NdArray<double>& XYZ, const Chromaticity& illuminant, ScaleMode scale) {
    utils::require_columns(XYZ, 3, "XYZ_to_Lab");
    const auto values = config::to_domain_1(XYZ, scale);
    const auto W = whitepoint_XYZ(illuminant);
    auto Lab = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double fx = f_Lab(values(i, 0) / W[0]);
        const double fy = f_Lab(values(i, 1) / W[1]);
        const double fz = f_Lab(values(i, 2) / W[2]);
        Lab(i, 0) = 116.0 * fy - 16.0;
        Lab(i, 1) = 500.0 * (fx - fy);
        Lab(i, 2) = 200.0 * (fy - fz);
    }
    return config::from_range_100(Lab, scale);
}

nc::NdArray<double> Lab_to_XYZ(const nc::NdArray<double>& Lab, const Chromaticity& illuminant, ScaleMode scale) {
    utils::require_columns(Lab, 3, "Lab_to_XYZ");
    const auto values = config::to_domain_100(Lab, scale);
    const auto W = whitepoint_XYZ(illuminant);
    auto XYZ = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double fy = (values(i, 0) + 16.0) / 116.0;
        const double fx = values(i, 1) / 500.0 + fy;
        const double fz = fy - values(i, 2) / 200.0;
        XYZ(i, 0) = f_Lab_inverse(fx) * W[0];
        XYZ(i, 1) = f_Lab_inverse(fy) * W[1];
        XYZ(i, 2) = f_Lab_inverse(fz) * W[2];
    }
    return config::from_range_1(XYZ, scale);
}

nc::NdArray<double> Lab_to_LCHab(const nc::NdArray<double>& Lab, ScaleMode scale) {
    utils::require_columns(Lab, 3, "Lab_to_LCHab");
    return config::from_range(Lab_like_to_LCH(config::to_domain_100(Lab, scale)), scale, LCH_KINDS);
}

nc::NdArray<double> LCHab_to_Lab(const nc::NdArray<double>& LCHab, ScaleMode scale) {
    utils::require_columns(LCHab, 3, "LCHab_to_Lab");
    return config::from_range_100(LCH_to_Lab_like(config::to_domain(LCHab, scale, LCH_KINDS)), scale);
}

nc::NdArray<double> XYZ_to_Luv(const nc::NdArray<double>& XYZ, const Chromaticity& illuminant, ScaleMode scale) {
    utils::require_columns(XYZ, 3, "XYZ_to_Luv");
    const auto values = config::to_domain_1(XYZ, scale);
    const auto W = whitepoint_XYZ(illuminant);
    const auto uv_n = white_uv_prime(illuminant);
    auto Luv = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double X = values(i, 0);
        const double Y = values(i, 1);
        const double Z = values(i, 2);
        const double y_r = Y / W[1];
        const double L = y_r > CIE_E ? 116.0 * std::cbrt(y_r) - 16.0 : CIE_K * y_r;
        const auto uv = XYZ_to_uv_prime(X, Y, Z, uv_n);
        Luv(i, 0) = L;
        Luv(i, 1) = 13.0 * L * (uv[0] - uv_n[0]);
        Luv(i, 2) = 13.0 * L * (uv[1] - uv_n[1]);
    }
    return config::from_range_100(Luv, scale);
}

nc::NdArray<double> Luv_to_XYZ(const nc::NdArray<double>& Luv, const Chromaticity& illuminant, ScaleMode scale) {
    utils::require_columns(Luv, 3, "Luv_to_XYZ");
    const auto values = config::to_domain_100(Luv, scale);
    const auto W = whitepoint_XYZ(illuminant);
    const auto uv_n = white_uv_prime(illuminant);
    auto XYZ = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double L = values(i, 0);
        if (L == 0.0) {
            XYZ(i, 0) = 0.0;
            XYZ(i, 1) = 0.0;
            XYZ(i, 2) = 0.0;
            continue;
        }
        const double Y = (L > CIE_K * CIE_E ? std::pow((L + 16.0) / 116.0, 3.0) : L / CIE_K) * W[1];
        const double u = values(i, 1) / (13.0 * L) + uv_n[0];
        const double v = values(i, 2) / (13.0 * L) + uv_n[1];
        XYZ(i, 0) = Y * 9.0 * u / (4.0 * v);
        XYZ(i, 1) = Y;
        XYZ(i, 2) = Y * (12.0 - 3.0 * u - 20.0 * v) / (4.0 * v);
    }
    return config::from_range_1(XYZ, scale);
}

nc::NdArray<double> Luv_to_LCHuv(const nc::NdArray<double>& Luv, ScaleMode scale) {
    utils::require_columns(Luv, 3, "Luv_to_LCHuv");
    return config::from_range(Lab_like_to_LCH(config::to_domain_100(Luv, scale)), scale, LCH_KINDS);
}

nc::NdArray<double> LCHuv_to_Luv(const nc::NdArray<double>& LCHuv, ScaleMode scale) {
    utils::require_columns(LCHuv, 3, "LCHuv_to_Luv");
    return config::from_range_100(LCH_to_Lab_like(config::to_domain(LCHuv, scale, LCH_KINDS)), scale);
}

nc::NdArray<double> Luv_to_uv(const nc::NdArray<double>& Luv, const Chromaticity& illuminant, ScaleMode scale) {
    const auto reference = Luv_to_XYZ(config::to_domain_100(Luv, scale), illuminant);
    const auto uv_n = white_uv_prime(illuminant);
    auto uv = rows_like(reference, 2);
    for (nc::uint32 i = 0; i < reference.shape().rows; ++i) {
        const auto value = XYZ_to_uv_prime(reference(i, 0), reference(i, 1), reference(i, 2), uv_n);
        uv(i, 0) = value[0];
        uv(i, 1) = value[1];
    }
    return uv;
}

nc::NdArray<double> uv_to_Luv(const nc::NdArray<double>& uv, const Chromaticity& illuminant, ScaleMode scale) {
    utils::require_columns(uv, 2, "uv_to_Luv");
    auto XYZ = rows_like(uv, 3);
    for (nc::uint32 i = 0; i < uv.shape().rows; ++i) {
        const double u = uv(i, 0);
        const double v = uv(i, 1);
        const double d = 6.0 * u - 16.0 * v + 12.0;
        const double x = 9.0 * u / d;
        const double y = 4.0 * v / d;
        XYZ(i, 0) = x / y;
        XYZ(i, 1) = 1.0;
        XYZ(i, 2) = (1.0 - x - y) / y;
    }
    return config::from_range_100(XYZ_to_Luv(XYZ, illuminant), scale);
}

// -----------------------------------------------------------------------------
// CIE 1960 UCS and CIE 1964 U*V*W*
// -----------------------------------------------------------------------------

nc::NdArray<double> XYZ_to_UCS(const nc::NdArray<double>& XYZ, ScaleMode scale) {
    utils::require_columns(XYZ, 3, "XYZ_to_UCS");
    const auto values = config::to_domain_1(XYZ, scale);
    auto UVW = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double X = values(i, 0);
        const double Y = values(i, 1);
        const double Z = values(i, 2);
        UVW(i, 0) = 2.0 / 3.0 * X;
        UVW(i, 1) = Y;
        UVW(i, 2) = 0.5 * (-X + 3.0 * Y + Z);
    }
    return config::from_range_1(UVW, scale);
}

nc::NdArray<double> UCS_to_XYZ(const nc::NdArray<double>& UVW, ScaleMode scale) {
    utils::require_columns(UVW, 3, "UCS_to_XYZ");
    const auto values = config::to_domain_1(UVW, scale);
    auto XYZ = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double U = values(i, 0);
        const double V = values(i, 1);
        const double W = values(i, 2);
        XYZ(i, 0) = 1.5 * U;
        XYZ(i, 1) = V;
        XYZ(i, 2) = 1.5 * U - 3.0 * V + 2.0 * W;
    }
    return config::from_range_1(XYZ, scale);
}

nc::NdArray<double> UCS_to_uv(const nc::NdArray<double>& UVW) {
    utils::require_columns(UVW, 3, "UCS_to_uv");
    auto uv = rows_like(UVW, 2);
    for (nc::uint32 i = 0; i < UVW.shape().rows; ++i) {
        const double s = UVW(i, 0) + UVW(i, 1) + UVW(i, 2);
        uv(i, 0) = UVW(i, 0) / s;
        uv(i, 1) = UVW(i, 1) / s;
    }
    return uv;
}

nc::NdArray<double> uv_to_UCS(const nc::NdArray<double>& uv, ScaleMode scale) {
    utils::require_columns(uv, 2, "uv_to_UCS");
    auto UVW = rows_like(uv, 3);
    for (nc::uint32 i = 0; i < uv.shape().rows; ++i) {
        const double u = uv(i, 0);
        const double v = uv(i, 1);
        UVW(i, 0) = u / v;
        UVW(i, 1) = 1.0;
        UVW(i, 2) = (1.0 - u - v) / v;
    }
    return config::from_range_1(UVW, scale);
}

nc::NdArray<double> XYZ_to_UVW(const nc::NdArray<double>& XYZ, const Chromaticity& illuminant, ScaleMode scale) {
    utils::require_columns(XYZ, 3, "XYZ_to_UVW");
    const auto values = config::to_domain_100(XYZ, scale);
    const auto xy = XYZ_to_xy(values, illuminant);
    const auto uv_0 = xy_to_uv_1960(illuminant[0], illuminant[1]);
    auto UVW = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const auto uv = xy_to_uv_1960(xy(i, 0), xy(i, 1));
        const double W = 25.0 * std::cbrt(values(i, 1)) - 17.0;
        UVW(i, 0) = 13.0 * W * (uv[0] - uv_0[0]);
        UVW(i, 1) = 13.0 * W * (uv[1] - uv_0[1]);
        UVW(i, 2) = W;
    }
    return config::from_range_100(UVW, scale);
}

nc::NdArray<double> UVW_to_XYZ(const nc::NdArray<double>& UVW, const Chromaticity& illuminant, ScaleMode scale) {
    utils::require_columns(UVW, 3, "UVW_to_XYZ");
    const auto values = config::to_domain_100(UVW, scale);
    const auto uv_0 = xy_to_uv_1960(illuminant[0], illuminant[1]);
    auto XYZ = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double W = values(i, 2);
        const double Y = std::pow((W + 17.0) / 25.0, 3.0);
        const double u = values(i, 0) / (13.0 * W) + uv_0[0];
        const double v = values(i, 1) / (13.0 * W) + uv_0[1];
        const double d = 2.0 * u - 8.0 * v + 4.0;
        const double x = 3.0 * u / d;
        const double y = 2.0 * v / d;
        XYZ(i, 0) = x * Y / y;
        XYZ(i, 1) = Y;
        XYZ(i, 2) = (1.0 - x - y) * Y / y;
    }
    return config::from_range_100(XYZ, scale);
}

// -----------------------------------------------------------------------------
// Hunter Lab, IPT, Oklab
// -----------------------------------------------------------------------------

nc::NdArray<double> XYZ_to_Hunter_Lab(const nc::NdArray<double>& XYZ,
                                      const algebra::Vector3& XYZ_n,
                                      const std::array<double, 2>& K_ab,
                                      ScaleMode scale) {
    utils::require_columns(XYZ, 3, "XYZ_to_Hunter_Lab");
    const auto values = config::to_domain_100(XYZ, scale);
    auto Lab = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double Y_Y_n = values(i, 1) / XYZ_n[1];
        const double sqrt_Y_Y_n = std::sqrt(Y_Y_n);
        Lab(i, 0) = 100.0 * sqrt_Y_Y_n;
        Lab(i, 1) = K_ab[0] * ((values(i, 0) / XYZ_n[0] - Y_Y_n) / sqrt_Y_Y_n);
        Lab(i, 2) = K_ab[1] * ((Y_Y_n - values(i, 2) / XYZ_n[2]) / sqrt_Y_Y_n);
    }
    return config::from_range_100(Lab, scale);
}

nc::NdArray<double> Hunter_Lab_to_XYZ(const nc::NdArray<double>& Lab,
                                      const algebra::Vector3& XYZ_n,
                                      const std::array<double, 2>& K_ab,
                                      ScaleMode scale) {
    utils::require_columns(Lab, 3, "Hunter_Lab_to_XYZ");
    const auto values = config::to_domain_100(Lab, scale);
    auto XYZ = rows_like(values, 3);
    for (nc::uint32 i = 0; i < values.shape().rows; ++i) {
        const double L_100 = values(i, 0) / 100.0;
        const double L_100_2 = L_100 * L_100;
        XYZ(i, 0) = ((values(i, 1) / K_ab[0]) * L_100 + L_100_2) * XYZ_n[0];
        XYZ(i, 1) = L_100_2 * XYZ_n[1];
        XYZ(i, 2) = -((values(i, 2) / K_ab[1]) * L_100 - L_100_2) * XYZ_n[2];
    }
    return config::from_range_100(XYZ, scale);
}

nc::NdArray<double> XYZ_to_IPT(const nc::NdArray<double>& XYZ, ScaleMode scale) {
    utils::require_columns(XYZ, 3, "XYZ_to_IPT");
    const auto IPT = matrix_power_matrix(config::to_domain_1(XYZ, scale), MATRIX_IPT_XYZ_TO_LMS, 0.43,
                                         MATRIX_IPT_LMS_P_TO_IPT);
    return config::from_range_1(IPT, scale);
}

nc::NdArray<double> IPT_to_XYZ(const nc::NdArray<double>& IPT, ScaleMode scale) {
    utils::require_columns(IPT, 3, "IPT_to_XYZ");
    const auto XYZ = matrix_power_matrix_inverse(config::to_domain_1(IPT, scale), MATRIX_IPT_XYZ_TO_LMS, 0.43,
                                                 MATRIX_IPT_LMS_P_TO_IPT);
    return config::from_range_1(XYZ, scale);
}

nc::NdArray<double> XYZ_to_Oklab(const nc::NdArray<double>& XYZ, ScaleMode scale) {
    utils::require_columns(XYZ, 3, "XYZ_to_Oklab");
    const auto Lab = matrix_power_matrix(config::to_domain_1(XYZ, scale), MATRIX_OKLAB_XYZ_TO_LMS, 1.0 / 3.0,
                                         MATRIX_OKLAB_LMS_P_TO_LAB);
    return config::from_range_1(Lab, scale);
}

nc::NdArray<double> Oklab_to_XYZ(const nc::NdArray<double>& Lab, ScaleMode scale) {
    utils::require_columns(Lab, 3, "Oklab_to_XYZ");
    const auto XYZ = matrix_power_matrix_inverse(config::to_domain_1(Lab, scale), MATRIX_OKLAB_XYZ_TO_LMS, 1.0 / 3.0,
                                                 MATRIX_OKLAB_LMS_P_TO_LAB);
    return config::from_range_1(XYZ, scale);
}

// -----------------------------------------------------------------------------
// Luminance and lightness
// -----------------------------------------------------------------------------

nc::NdArray<double> XYZ_to_luminance(const nc::NdArray<double>& XYZ) {
    utils::require_columns(XYZ, 3, "XYZ_to_luminance");
    auto Y = rows_like(XYZ, 1);
    for (nc::uint32 i = 0; i < XYZ.shape().rows; ++i) Y(i, 0) = XYZ(i, 1);
    return Y;
}

nc::NdArray<double> lightness_CIE1976(const nc::NdArray<double>& Y, double Y_n, ScaleMode scale) {
    const auto values = config::to_domain_100(Y, scale);
    nc::NdArray<double> L(values.shape());
    for (std::size_t i = 0; i < values.size(); ++i) {
        const double y_r = values[i] / Y_n;
        L[i] = y_r > CIE_E ? 116.0 * std::cbrt(y_r) - 16.0 : CIE_K * y_r;
    }
    return config::from_range_100(L, scale);
}

nc::NdArray<double> luminance_CIE1976(const nc::NdArray<double>& L_star, double Y_n, ScaleMode scale) {
    const auto values = config::to_domain_100(L_star, scale);
    nc::NdArray<double> Y(values.shape());
    for (std::size_t i = 0; i < values.size(); ++i) {
        const double L = values[i];
        Y[i] = (L > CIE_K * CIE_E ? std::pow((L + 16.0) / 116.0, 3.0) : L / CIE_K) * Y_n;
    }
    return config::from_range_100(Y, scale);
}

} // namespace models
} // namespace chromat
