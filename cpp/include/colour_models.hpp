#pragma once

#include "NumCpp.hpp"
#include "common.hpp"
#include "config.hpp"

#include <array>
#include <string>
#include <vector>

namespace chromat {
namespace models {

using Chromaticity = std::array<double, 2>;

// CIE 1931 2 degree standard observer chromaticity coordinates.
constexpr Chromaticity CCS_ILLUMINANT_D50 = {{0.3457, 0.3585}};
constexpr Chromaticity CCS_ILLUMINANT_D65 = {{0.3127, 0.3290}};
constexpr Chromaticity CCS_ILLUMINANT_ACES = {{0.32168, 0.33767}};

/**
 * @brief Chromaticity coordinates of a named illuminant.
 *
 * Accepts A, D50, D55, D60, D65, D75, E and ACES (case-insensitive), throws
 * std::invalid_argument otherwise.
 */
Chromaticity illuminant_xy(const std::string& name);
std::vector<std::string> illuminant_names();

// Tristimulus values of a chromaticity with Y = 1.
algebra::Vector3 whitepoint_XYZ(const Chromaticity& xy);

// Hunter Lab reference white and chromaticity coefficients (D65, 2 degree).
constexpr algebra::Vector3 TVS_HUNTERLAB_D65 = {{95.02, 100.0, 108.82}};
constexpr std::array<double, 2> K_AB_HUNTERLAB_D65 = {{172.30, 67.20}};

// Functions take N x 3 arrays (N x 2 for chromaticities) and return one row
// per input row. The scale argument selects the domain-range scale.

// -----------------------------------------------------------------------------
// CIE xyY / xy
// -----------------------------------------------------------------------------

// Black (zero) rows take the illuminant chromaticity.
nc::NdArray<double> XYZ_to_xyY(const nc::NdArray<double>& XYZ,
                               const Chromaticity& illuminant = CCS_ILLUMINANT_D65,
                               config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> xyY_to_XYZ(const nc::NdArray<double>& xyY,
                               config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> xyY_to_xy(const nc::NdArray<double>& xyY);
// Y = 1
nc::NdArray<double> xy_to_xyY(const nc::NdArray<double>& xy, config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> XYZ_to_xy(const nc::NdArray<double>& XYZ, const Chromaticity& illuminant = CCS_ILLUMINANT_D65);
nc::NdArray<double> xy_to_XYZ(const nc::NdArray<double>& xy, config::ScaleMode scale = config::ScaleMode::Reference);

// -----------------------------------------------------------------------------
// CIE L*a*b* / L*u*v* and their cylindrical forms
// -----------------------------------------------------------------------------

nc::NdArray<double> XYZ_to_Lab(const nc::NdArray<double>& XYZ,
                               const Chromaticity& illuminant = CCS_ILLUMINANT_D65,
                               config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> Lab_to_XYZ(const nc::NdArray<double>& Lab,
                               const Chromaticity& illuminant = CCS_ILLUMINANT_D65,
                               config::ScaleMode scale = config::ScaleMode::Reference);

// Hue in degrees [0, 360).
nc::NdArray<double> Lab_to_LCHab(const nc::NdArray<double>& Lab, config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> LCHab_to_Lab(const nc::NdArray<double>& LCHab, config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> XYZ_to_Luv(const nc::NdArray<double>& XYZ,
                               const Chromaticity& illuminant = CCS_ILLUMINANT_D65,
                               config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> Luv_to_XYZ(const nc::NdArray<double>& Luv,
                               const Chromaticity& illuminant = CCS_ILLUMINANT_D65,
                               config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> Luv_to_LCHuv(const nc::NdArray<double>& Luv, config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> LCHuv_to_Luv(const nc::NdArray<double>& LCHuv, config::ScaleMode scale = config::ScaleMode::Reference);

// CIE 1976 u'v' chromaticity coordinates.
nc::NdArray<double> Luv_to_uv(const nc::NdArray<double>& Luv,
                              const Chromaticity& illuminant = CCS_ILLUMINANT_D65,
                              config::ScaleMode scale = config::ScaleMode::Reference);
// Y = 1
nc::NdArray<double> uv_to_Luv(const nc::NdArray<double>& uv,
                              const Chromaticity& illuminant = CCS_ILLUMINANT_D65,
                              config::ScaleMode scale = config::ScaleMode::Reference);

// -----------------------------------------------------------------------------
// CIE 1960 UCS and CIE 1964 U*V*W*
// -----------------------------------------------------------------------------

nc::NdArray<double> XYZ_to_UCS(const nc::NdArray<double>& XYZ, config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> UCS_to_XYZ(const nc::NdArray<double>& UVW, config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> UCS_to_uv(const nc::NdArray<double>& UVW);
// V = 1
nc::NdArray<double> uv_to_UCS(const nc::NdArray<double>& uv, config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> XYZ_to_UVW(const nc::NdArray<double>& XYZ,
                               const Chromaticity& illuminant = CCS_ILLUMINANT_D65,
                               config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> UVW_to_XYZ(const nc::NdArray<double>& UVW,
                               const Chromaticity& illuminant = CCS_ILLUMINANT_D65,
                               config::ScaleMode scale = config::ScaleMode::Reference);

// -----------------------------------------------------------------------------
// Hunter Lab, IPT, Oklab
// -----------------------------------------------------------------------------

nc::NdArray<double> XYZ_to_Hunter_Lab(const nc::NdArray<double>& XYZ,
                                      const algebra::Vector3& XYZ_n = TVS_HUNTERLAB_D65,
                                      const std::array<double, 2>& K_ab = K_AB_HUNTERLAB_D65,
                                      config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> Hunter_Lab_to_XYZ(const nc::NdArray<double>& Lab,
                                      const algebra::Vector3& XYZ_n = TVS_HUNTERLAB_D65,
                                      const std::array<double, 2>& K_ab = K_AB_HUNTERLAB_D65,
                                      config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> XYZ_to_IPT(const nc::NdArray<double>& XYZ, config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> IPT_to_XYZ(const nc::NdArray<double>& IPT, config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> XYZ_to_Oklab(const nc::NdArray<double>& XYZ, config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> Oklab_to_XYZ(const nc::NdArray<double>& Lab, config::ScaleMode scale = config::ScaleMode::Reference);

// -----------------------------------------------------------------------------
// Luminance and lightness
// -----------------------------------------------------------------------------

// N x 1 column holding Y.
nc::NdArray<double> XYZ_to_luminance(const nc::NdArray<double>& XYZ);

// CIE 1976 L* from luminance Y in [0, 100] (reference scale), element-wise.
nc::NdArray<double> lightness_CIE1976(const nc::NdArray<double>& Y,
                                      double Y_n = 100.0,
                                      config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> luminance_CIE1976(const nc::NdArray<double>& L_star,
                                      double Y_n = 100.0,
                                      config::ScaleMode scale = config::ScaleMode::Reference);

} // namespace models
} // namespace chromat
