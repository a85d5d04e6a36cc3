#include "rgb_colourspaces.hpp"
#include "transfer_functions.hpp"

#include <stdexcept>
#include <utility>

namespace chromat {
namespace models {

using config::ScaleMode;

namespace {

const algebra::Matrix3 CAT_BRADFORD = {{
    {{0.8951, 0.2664, -0.1614}},
    {{-0.7502, 1.7135, 0.0367}},
    {{0.0389, -0.0685, 1.0296}},
}};

const algebra::Matrix3 CAT_CAT02 = {{
    {{0.7328, 0.4296, -0.1624}},
    {{-0.7036, 1.6975, 0.0061}},
    {{0.0030, 0.0136, 0.9834}},
}};

const algebra::Matrix3 CAT_VON_KRIES = {{
    {{0.40024, 0.70760, -0.08081}},
    {{-0.22630, 1.16532, 0.04570}},
    {{0.00000, 0.00000, 0.91822}},
}};

const Primaries PRIMARIES_BT709 = {{{{0.6400, 0.3300}}, {{0.3000, 0.6000}}, {{0.1500, 0.0600}}}};
const Primaries PRIMARIES_BT2020 = {{{{0.7080, 0.2920}}, {{0.1700, 0.7970}}, {{0.1310, 0.0460}}}};
const Primaries PRIMARIES_ROMM = {{{{0.7347, 0.2653}}, {{0.1596, 0.8404}}, {{0.0366, 0.0001}}}};
const Primaries PRIMARIES_AP0 = {{{{0.7347, 0.2653}}, {{0.0000, 1.0000}}, {{0.0001, -0.0770}}}};
const Primaries PRIMARIES_AP1 = {{{{0.7130, 0.2930}}, {{0.1650, 0.8300}}, {{0.1280, 0.0440}}}};
const Primaries PRIMARIES_P3 = {{{{0.6800, 0.3200}}, {{0.2650, 0.6900}}, {{0.1500, 0.0600}}}};

nc::NdArray<double> linear(const nc::NdArray<double>& a) {
    return a.copy();
}

std::vector<RGBColourspace> build_colourspaces() {
    std::vector<RGBColourspace> colourspaces;
    colourspaces.emplace_back(
        "sRGB", PRIMARIES_BT709, CCS_ILLUMINANT_D65, "D65",
        [](const nc::NdArray<double>& L) { return eotf_inverse_sRGB(L); },
        [](const nc::NdArray<double>& V) { return eotf_sRGB(V); });
    colourspaces.emplace_back(
        "ITU-R BT.709", PRIMARIES_BT709, CCS_ILLUMINANT_D65, "D65",
        [](const nc::NdArray<double>& L) { return oetf_BT709(L); },
        [](const nc::NdArray<double>& V) { return oetf_inverse_BT709(V); });
    colourspaces.emplace_back(
        "ITU-R BT.2020", PRIMARIES_BT2020, CCS_ILLUMINANT_D65, "D65",
        [](const nc::NdArray<double>& E) { return oetf_BT2020(E); },
        [](const nc::NdArray<double>& E_p) { return oetf_inverse_BT2020(E_p); });
    colourspaces.emplace_back(
        "ProPhoto RGB", PRIMARIES_ROMM, CCS_ILLUMINANT_D50, "D50",
        [](const nc::NdArray<double>& X) { return cctf_encoding_ProPhotoRGB(X); },
        [](const nc::NdArray<double>& X_p) { return cctf_decoding_ProPhotoRGB(X_p); });
    colourspaces.emplace_back("ACES2065-1", PRIMARIES_AP0, CCS_ILLUMINANT_ACES, "ACES", linear, linear);
    colourspaces.emplace_back("ACEScg", PRIMARIES_AP1, CCS_ILLUMINANT_ACES, "ACES", linear, linear);
    colourspaces.emplace_back(
        "ACEScc", PRIMARIES_AP1, CCS_ILLUMINANT_ACES, "ACES",
        [](const nc::NdArray<double>& lin) { return log_encoding_ACEScc(lin); },
        [](const nc::NdArray<double>& cc) { return log_decoding_ACEScc(cc); });
    colourspaces.emplace_back(
        "ACEScct", PRIMARIES_AP1, CCS_ILLUMINANT_ACES, "ACES",
        [](const nc::NdArray<double>& lin) { return log_encoding_ACEScct(lin); },
        [](const nc::NdArray<double>& cct) { return log_decoding_ACEScct(cct); });
    colourspaces.emplace_back(
        "Display P3", PRIMARIES_P3, CCS_ILLUMINANT_D65, "D65",
        [](const nc::NdArray<double>& L) { return eotf_inverse_sRGB(L); },
        [](const nc::NdArray<double>& V) { return eotf_sRGB(V); });
    return colourspaces;
}

const std::vector<RGBColourspace>& colourspaces() {
    static const std::vector<RGBColourspace> instance = build_colourspaces();
    return instance;
}

bool has_illuminant(const nc::NdArray<double>& illuminant_xy) {
    if (illuminant_xy.size() == 0) return false;
    if (illuminant_xy.size() != 2) {
        throw std::invalid_argument("Illuminant chromaticity must have 2 values, got " +
                                    std::to_string(illuminant_xy.size()));
    }
    return true;
}

Chromaticity to_chromaticity(const nc::NdArray<double>& illuminant_xy) {
    return {{illuminant_xy[0], illuminant_xy[1]}};
}

} // namespace

ChromaticAdaptationTransform parse_chromatic_adaptation_transform(const std::string& name) {
    const std::string key = utils::to_lower(name);
    if (key == "bradford") return ChromaticAdaptationTransform::Bradford;
    if (key == "cat02") return ChromaticAdaptationTransform::CAT02;
    if (key == "von kries") return ChromaticAdaptationTransform::VonKries;
    if (key == "xyz scaling") return ChromaticAdaptationTransform::XYZScaling;
    throw std::invalid_argument("Invalid chromatic adaptation transform \"" + name +
                                "\", accepted values are: Bradford, CAT02, Von Kries, XYZ Scaling");
}

std::string to_string(ChromaticAdaptationTransform transform) {
    switch (transform) {
        case ChromaticAdaptationTransform::Bradford: return "Bradford";
        case ChromaticAdaptationTransform::CAT02: return "CAT02";
        case ChromaticAdaptationTransform::VonKries: return "Von Kries";
        case ChromaticAdaptationTransform::XYZScaling: return "XYZ Scaling";
    }
    return "CAT02";
}

algebra::Matrix3 chromatic_adaptation_cone_matrix(ChromaticAdaptationTransform transform) {
    switch (transform) {
        case ChromaticAdaptationTransform::Bradford: return CAT_BRADFORD;
        case ChromaticAdaptationTransform::CAT02: return CAT_CAT02;
        case ChromaticAdaptationTransform::VonKries: return CAT_VON_KRIES;
        case ChromaticAdaptationTransform::XYZScaling: return algebra::identity3();
    }
    return CAT_CAT02;
}

algebra::Matrix3 chromatic_adaptation_matrix(const algebra::Vector3& XYZ_w,
                                             const algebra::Vector3& XYZ_wr,
                                             ChromaticAdaptationTransform transform) {
    const auto M = chromatic_adaptation_cone_matrix(transform);
    const auto LMS_w = algebra::matmul(M, XYZ_w);
    const auto LMS_wr = algebra::matmul(M, XYZ_wr);

    algebra::Vector3 D{};
    for (int i = 0; i < 3; ++i) D[i] = LMS_w[i] != 0.0 ? LMS_wr[i] / LMS_w[i] : 1.0;

    return algebra::matmul(algebra::inverse(M), algebra::matmul(algebra::diagonal(D), M));
}

algebra::Matrix3 chromatic_adaptation_matrix(const Chromaticity& source_xy,
                                             const Chromaticity& target_xy,
                                             ChromaticAdaptationTransform transform) {
    return chromatic_adaptation_matrix(whitepoint_XYZ(source_xy), whitepoint_XYZ(target_xy), transform);
}

nc::NdArray<double> chromatic_adaptation(const nc::NdArray<double>& XYZ,
                                         const Chromaticity& source_xy,
                                         const Chromaticity& target_xy,
                                         ChromaticAdaptationTransform transform) {
    return algebra::vector_dot(chromatic_adaptation_matrix(source_xy, target_xy, transform), XYZ);
}

algebra::Matrix3 normalised_primary_matrix(const Primaries& primaries, const Chromaticity& whitepoint) {
    algebra::Matrix3 P{};
    for (int c = 0; c < 3; ++c) {
        const double x = primaries[c][0];
        const double y = primaries[c][1];
        P[0][c] = x;
        P[1][c] = y;
        P[2][c] = 1.0 - x - y;
    }
    const auto S = algebra::matmul(algebra::inverse(P), whitepoint_XYZ(whitepoint));
    return algebra::matmul(P, algebra::diagonal(S));
}

RGBColourspace::RGBColourspace(const std::string& n,
                               const Primaries& p,
                               const Chromaticity& wp,
                               const std::string& wp_name,
                               TransferFunction encoding,
                               TransferFunction decoding)
    : name(n),
      primaries(p),
      whitepoint(wp),
      whitepoint_name(wp_name),
      matrix_RGB_to_XYZ(normalised_primary_matrix(p, wp)),
      matrix_XYZ_to_RGB(algebra::inverse(matrix_RGB_to_XYZ)),
      cctf_encoding(std::move(encoding)),
      cctf_decoding(std::move(decoding)) {}

const RGBColourspace& rgb_colourspace(const std::string& name) {
    const std::string key = utils::to_lower(name);
    for (const auto& colourspace : colourspaces()) {
        if (utils::to_lower(colourspace.name) == key) return colourspace;
    }
    throw std::invalid_argument("Unsupported RGB colourspace \"" + name + "\", accepted values are: " +
                                utils::join(rgb_colourspace_names(), ", "));
}

std::vector<std::string> rgb_colourspace_names() {
    std::vector<std::string> names;
    for (const auto& colourspace : colourspaces()) names.push_back(colourspace.name);
    return names;
}

nc::NdArray<double> RGB_to_XYZ(const nc::NdArray<double>& RGB,
                               const RGBColourspace& colourspace,
                               const nc::NdArray<double>& illuminant_xy,
                               ChromaticAdaptationTransform transform,
                               bool apply_cctf_decoding,
                               ScaleMode scale) {
    utils::require_columns(RGB, 3, "RGB_to_XYZ");
    auto rgb_linear = config::to_domain_1(RGB, scale);
    if (apply_cctf_decoding) rgb_linear = colourspace.cctf_decoding(rgb_linear);

    auto XYZ = algebra::vector_dot(colourspace.matrix_RGB_to_XYZ, rgb_linear);
    if (has_illuminant(illuminant_xy)) {
        XYZ = chromatic_adaptation(XYZ, colourspace.whitepoint, to_chromaticity(illuminant_xy), transform);
    }
    return config::from_range_1(XYZ, scale);
}

nc::NdArray<double> XYZ_to_RGB(const nc::NdArray<double>& XYZ,
                               const RGBColourspace& colourspace,
                               const nc::NdArray<double>& illuminant_xy,
                               ChromaticAdaptationTransform transform,
                               bool apply_cctf_encoding,
                               ScaleMode scale) {
    utils::require_columns(XYZ, 3, "XYZ_to_RGB");
    auto XYZ_adapted = config::to_domain_1(XYZ, scale);
    if (has_illuminant(illuminant_xy)) {
        XYZ_adapted = chromatic_adaptation(XYZ_adapted, to_chromaticity(illuminant_xy), colourspace.whitepoint, transform);
    }

    auto RGB = algebra::vector_dot(colourspace.matrix_XYZ_to_RGB, XYZ_adapted);
    if (apply_cctf_encoding) RGB = colourspace.cctf_encoding(RGB);
    return config::from_range_1(RGB, scale);
}

algebra::Matrix3 matrix_RGB_to_RGB(const RGBColourspace& input,
                                   const RGBColourspace& output,
                                   ChromaticAdaptationTransform transform) {
    auto M = input.matrix_RGB_to_XYZ;
    if (input.whitepoint != output.whitepoint) {
        M = algebra::matmul(chromatic_adaptation_matrix(input.whitepoint, output.whitepoint, transform), M);
    }
    return algebra::matmul(output.matrix_XYZ_to_RGB, M);
}

nc::NdArray<double> RGB_to_RGB(const nc::NdArray<double>& RGB,
                               const RGBColourspace& input,
                               const RGBColourspace& output,
                               ChromaticAdaptationTransform transform,
                               bool apply_cctf_decoding,
                               bool apply_cctf_encoding,
                               ScaleMode scale) {
    utils::require_columns(RGB, 3, "RGB_to_RGB");
    auto values = config::to_domain_1(RGB, scale);
    if (apply_cctf_decoding) values = input.cctf_decoding(values);

    values = algebra::vector_dot(matrix_RGB_to_RGB(input, output, transform), values);

    if (apply_cctf_encoding) values = output.cctf_encoding(values);
    return config::from_range_1(values, scale);
}

} // namespace models
} // namespace chromat
