#pragma once

#include "NumCpp.hpp"
#include "colour_models.hpp"
#include "common.hpp"
#include "config.hpp"

#include <array>
#include <functional>
#include <string>
#include <vector>

namespace chromat {
namespace models {

// -----------------------------------------------------------------------------
// Chromatic adaptation
// -----------------------------------------------------------------------------

enum class ChromaticAdaptationTransform { Bradford, CAT02, VonKries, XYZScaling };

ChromaticAdaptationTransform parse_chromatic_adaptation_transform(const std::string& name);
std::string to_string(ChromaticAdaptationTransform transform);

// Cone response matrix of a transform.
algebra::Matrix3 chromatic_adaptation_cone_matrix(ChromaticAdaptationTransform transform);

/**
 * @brief Von Kries style adaptation matrix from test whitepoint XYZ_w to
 * reference whitepoint XYZ_wr: M^-1 * diag(LMS_wr / LMS_w) * M.
 */
algebra::Matrix3 chromatic_adaptation_matrix(const algebra::Vector3& XYZ_w,
                                             const algebra::Vector3& XYZ_wr,
                                             ChromaticAdaptationTransform transform = ChromaticAdaptationTransform::CAT02);
algebra::Matrix3 chromatic_adaptation_matrix(const Chromaticity& source_xy,
                                             const Chromaticity& target_xy,
                                             ChromaticAdaptationTransform transform = ChromaticAdaptationTransform::CAT02);

// Adapts N x 3 tristimulus values.
nc::NdArray<double> chromatic_adaptation(const nc::NdArray<double>& XYZ,
                                         const Chromaticity& source_xy,
                                         const Chromaticity& target_xy,
                                         ChromaticAdaptationTransform transform = ChromaticAdaptationTransform::CAT02);

// -----------------------------------------------------------------------------
// RGB colourspaces
// -----------------------------------------------------------------------------

using Primaries = std::array<Chromaticity, 3>;
using TransferFunction = std::function<nc::NdArray<double>(const nc::NdArray<double>&)>;

// RGB to XYZ matrix of a set of primaries and a whitepoint.
algebra::Matrix3 normalised_primary_matrix(const Primaries& primaries, const Chromaticity& whitepoint);

/**
 * @brief An RGB colourspace defined by its primaries and whitepoint.
 *
 * The RGB <-> XYZ matrices are derived from the primaries. The transfer
 * functions take and return values at the reference scale.
 */
struct RGBColourspace {
    std::string name;
    Primaries primaries;
    Chromaticity whitepoint;
    std::string whitepoint_name;
    algebra::Matrix3 matrix_RGB_to_XYZ;
    algebra::Matrix3 matrix_XYZ_to_RGB;
    TransferFunction cctf_encoding;
    TransferFunction cctf_decoding;

    RGBColourspace(const std::string& n,
                   const Primaries& p,
                   const Chromaticity& wp,
                   const std::string& wp_name,
                   TransferFunction encoding,
                   TransferFunction decoding);
};

/**
 * @brief Predefined colourspace by name (case-insensitive).
 *
 * sRGB, ITU-R BT.709, ITU-R BT.2020, ProPhoto RGB, ACES2065-1, ACEScg,
 * ACEScc, ACEScct and Display P3. Throws std::invalid_argument otherwise.
 */
const RGBColourspace& rgb_colourspace(const std::string& name);
std::vector<std::string> rgb_colourspace_names();

/**
 * @brief Converts RGB values of a colourspace to CIE XYZ.
 * @param illuminant_xy Optional 1 x 2 chromaticity the XYZ values are adapted
 *        to; empty keeps the colourspace whitepoint.
 * @param apply_cctf_decoding Decode the values with the colourspace CCTF first.
 */
nc::NdArray<double> RGB_to_XYZ(const nc::NdArray<double>& RGB,
                               const RGBColourspace& colourspace,
                               const nc::NdArray<double>& illuminant_xy = nc::NdArray<double>(),
                               ChromaticAdaptationTransform transform = ChromaticAdaptationTransform::CAT02,
                               bool apply_cctf_decoding = false,
                               config::ScaleMode scale = config::ScaleMode::Reference);

/**
 * @brief Converts CIE XYZ values to RGB values of a colourspace.
 * @param illuminant_xy Optional 1 x 2 chromaticity of the XYZ values; they are
 *        adapted to the colourspace whitepoint first.
 */
nc::NdArray<double> XYZ_to_RGB(const nc::NdArray<double>& XYZ,
                               const RGBColourspace& colourspace,
                               const nc::NdArray<double>& illuminant_xy = nc::NdArray<double>(),
                               ChromaticAdaptationTransform transform = ChromaticAdaptationTransform::CAT02,
                               bool apply_cctf_encoding = false,
                               config::ScaleMode scale = config::ScaleMode::Reference);

// Linear RGB to RGB matrix, adapting between the whitepoints.
algebra::Matrix3 matrix_RGB_to_RGB(const RGBColourspace& input,
                                   const RGBColourspace& output,
                                   ChromaticAdaptationTransform transform = ChromaticAdaptationTransform::CAT02);

nc::NdArray<double> RGB_to_RGB(const nc::NdArray<double>& RGB,
                               const RGBColourspace& input,
                               const RGBColourspace& output,
                               ChromaticAdaptationTransform transform = ChromaticAdaptationTransform::CAT02,
                               bool apply_cctf_decoding = false,
                               bool apply_cctf_encoding = false,
                               config::ScaleMode scale = config::ScaleMode::Reference);

} // namespace models
} // namespace chromat
