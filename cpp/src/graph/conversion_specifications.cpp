#include "colour_models.hpp"
#include "conversion_graph.hpp"
#include "rgb_colourspaces.hpp"
#include "rgb_models.hpp"

#include <stdexcept>

namespace chromat {
namespace graph {

namespace {

using Array = nc::NdArray<double>;
using models::CCS_ILLUMINANT_D65;

models::Chromaticity illuminant(const ConversionContext& context) {
    return context.chromaticity("illuminant", CCS_ILLUMINANT_D65);
}

// Optional adaptation illuminant of the RGB stages, empty when absent.
Array adaptation_illuminant(const ConversionContext& context) {
    if (!context.has("illuminant")) return Array();
    const auto xy = context.chromaticity("illuminant", CCS_ILLUMINANT_D65);
    return utils::to_row({xy[0], xy[1]});
}

const models::RGBColourspace& colourspace(const ConversionContext& context) {
    return models::rgb_colourspace(context.string_value("colourspace", "sRGB"));
}

models::ChromaticAdaptationTransform adaptation_transform(const ConversionContext& context) {
    return models::parse_chromatic_adaptation_transform(
        context.string_value("chromatic_adaptation_transform", "CAT02"));
}

algebra::Vector3 hunter_whitepoint(const ConversionContext& context) {
    const auto values = context.array("XYZ_n");
    if (values.size() == 0) return models::TVS_HUNTERLAB_D65;
    if (values.size() != 3) throw std::invalid_argument("Keyword argument \"XYZ_n\" must have 3 values");
    return {{values[0], values[1], values[2]}};
}

std::array<double, 2> hunter_coefficients(const ConversionContext& context) {
    const auto values = context.array("K_ab");
    if (values.size() == 0) return models::K_AB_HUNTERLAB_D65;
    if (values.size() != 2) throw std::invalid_argument("Keyword argument \"K_ab\" must have 2 values");
    return {{values[0], values[1]}};
}

std::vector<ConversionSpecification> build_specifications() {
    std::vector<ConversionSpecification> s;

    // CIE xyY / xy
    s.push_back({"CIE XYZ", "CIE xyY", "XYZ_to_xyY",
                 [](const Array& XYZ, const ConversionContext& c) {
                     return models::XYZ_to_xyY(XYZ, illuminant(c), c.scale);
                 },
                 {"illuminant"}});
    s.push_back({"CIE xyY", "CIE XYZ", "xyY_to_XYZ",
                 [](const Array& xyY, const ConversionContext& c) { return models::xyY_to_XYZ(xyY, c.scale); },
                 {}});
    s.push_back({"CIE xyY", "CIE xy", "xyY_to_xy",
                 [](const Array& xyY, const ConversionContext&) { return models::xyY_to_xy(xyY); }, {}});
    s.push_back({"CIE xy", "CIE xyY", "xy_to_xyY",
                 [](const Array& xy, const ConversionContext& c) { return models::xy_to_xyY(xy, c.scale); }, {}});

    // CIE L*a*b*
    s.push_back({"CIE XYZ", "CIE Lab", "XYZ_to_Lab",
                 [](const Array& XYZ, const ConversionContext& c) {
                     return models::XYZ_to_Lab(XYZ, illuminant(c), c.scale);
                 },
                 {"illuminant"}});
    s.push_back({"CIE Lab", "CIE XYZ", "Lab_to_XYZ",
                 [](const Array& Lab, const ConversionContext& c) {
                     return models::Lab_to_XYZ(Lab, illuminant(c), c.scale);
                 },
                 {"illuminant"}});
    s.push_back({"CIE Lab", "CIE LCHab", "Lab_to_LCHab",
                 [](const Array& Lab, const ConversionContext& c) { return models::Lab_to_LCHab(Lab, c.scale); },
                 {}});
    s.push_back({"CIE LCHab", "CIE Lab", "LCHab_to_Lab",
                 [](const Array& LCHab, const ConversionContext& c) { return models::LCHab_to_Lab(LCHab, c.scale); },
                 {}});

    // CIE L*u*v*
    s.push_back({"CIE XYZ", "CIE Luv", "XYZ_to_Luv",
                 [](const Array& XYZ, const ConversionContext& c) {
                     return models::XYZ_to_Luv(XYZ, illuminant(c), c.scale);
                 },
                 {"illuminant"}});
    s.push_back({"CIE Luv", "CIE XYZ", "Luv_to_XYZ",
                 [](const Array& Luv, const ConversionContext& c) {
                     return models::Luv_to_XYZ(Luv, illuminant(c), c.scale);
                 },
                 {"illuminant"}});
    s.push_back({"CIE Luv", "CIE LCHuv", "Luv_to_LCHuv",
                 [](const Array& Luv, const ConversionContext& c) { return models::Luv_to_LCHuv(Luv, c.scale); },
                 {}});
    s.push_back({"CIE LCHuv", "CIE Luv", "LCHuv_to_Luv",
                 [](const Array& LCHuv, const ConversionContext& c) { return models::LCHuv_to_Luv(LCHuv, c.scale); },
                 {}});
    s.push_back({"CIE Luv", "CIE Luv uv", "Luv_to_uv",
                 [](const Array& Luv, const ConversionContext& c) {
                     return models::Luv_to_uv(Luv, illuminant(c), c.scale);
                 },
                 {"illuminant"}});
    s.push_back({"CIE Luv uv", "CIE Luv", "uv_to_Luv",
                 [](const Array& uv, const ConversionContext& c) {
                     return models::uv_to_Luv(uv, illuminant(c), c.scale);
                 },
                 {"illuminant"}});

    // CIE 1960 UCS, CIE 1964 U*V*W*
    s.push_back({"CIE XYZ", "CIE UCS", "XYZ_to_UCS",
                 [](const Array& XYZ, const ConversionContext& c) { return models::XYZ_to_UCS(XYZ, c.scale); }, {}});
    s.push_back({"CIE UCS", "CIE XYZ", "UCS_to_XYZ",
                 [](const Array& UVW, const ConversionContext& c) { return models::UCS_to_XYZ(UVW, c.scale); }, {}});
    s.push_back({"CIE UCS", "CIE UCS uv", "UCS_to_uv",
                 [](const Array& UVW, const ConversionContext&) { return models::UCS_to_uv(UVW); }, {}});
    s.push_back({"CIE UCS uv", "CIE UCS", "uv_to_UCS",
                 [](const Array& uv, const ConversionContext& c) { return models::uv_to_UCS(uv, c.scale); }, {}});
    s.push_back({"CIE XYZ", "CIE UVW", "XYZ_to_UVW",
                 [](const Array& XYZ, const ConversionContext& c) {
                     return models::XYZ_to_UVW(XYZ, illuminant(c), c.scale);
                 },
                 {"illuminant"}});
    s.push_back({"CIE UVW", "CIE XYZ", "UVW_to_XYZ",
                 [](const Array& UVW, const ConversionContext& c) {
                     return models::UVW_to_XYZ(UVW, illuminant(c), c.scale);
                 },
                 {"illuminant"}});

    // Hunter Lab, IPT, Oklab
    s.push_back({"CIE XYZ", "Hunter Lab", "XYZ_to_Hunter_Lab",
                 [](const Array& XYZ, const ConversionContext& c) {
                     return models::XYZ_to_Hunter_Lab(XYZ, hunter_whitepoint(c), hunter_coefficients(c), c.scale);
                 },
                 {"XYZ_n", "K_ab"}});
    s.push_back({"Hunter Lab", "CIE XYZ", "Hunter_Lab_to_XYZ",
                 [](const Array& Lab, const ConversionContext& c) {
                     return models::Hunter_Lab_to_XYZ(Lab, hunter_whitepoint(c), hunter_coefficients(c), c.scale);
                 },
                 {"XYZ_n", "K_ab"}});
    s.push_back({"CIE XYZ", "IPT", "XYZ_to_IPT",
                 [](const Array& XYZ, const ConversionContext& c) { return models::XYZ_to_IPT(XYZ, c.scale); }, {}});
    s.push_back({"IPT", "CIE XYZ", "IPT_to_XYZ",
                 [](const Array& IPT, const ConversionContext& c) { return models::IPT_to_XYZ(IPT, c.scale); }, {}});
    s.push_back({"CIE XYZ", "Oklab", "XYZ_to_Oklab",
                 [](const Array& XYZ, const ConversionContext& c) { return models::XYZ_to_Oklab(XYZ, c.scale); }, {}});
    s.push_back({"Oklab", "CIE XYZ", "Oklab_to_XYZ",
                 [](const Array& Lab, const ConversionContext& c) { return models::Oklab_to_XYZ(Lab, c.scale); }, {}});

    // RGB colourspaces
    s.push_back({"CIE XYZ", "RGB", "XYZ_to_RGB",
                 [](const Array& XYZ, const ConversionContext& c) {
                     return models::XYZ_to_RGB(XYZ, colourspace(c), adaptation_illuminant(c), adaptation_transform(c),
                                               false, c.scale);
                 },
                 {"colourspace", "illuminant", "chromatic_adaptation_transform"}});
    s.push_back({"RGB", "CIE XYZ", "RGB_to_XYZ",
                 [](const Array& RGB, const ConversionContext& c) {
                     return models::RGB_to_XYZ(RGB, colourspace(c), adaptation_illuminant(c), adaptation_transform(c),
                                               false, c.scale);
                 },
                 {"colourspace", "illuminant", "chromatic_adaptation_transform"}});
    s.push_back({"RGB", "Output-Referred RGB", "cctf_encoding",
                 [](const Array& RGB, const ConversionContext& c) {
                     const auto encoded = colourspace(c).cctf_encoding(config::to_domain_1(RGB, c.scale));
                     return config::from_range_1(encoded, c.scale);
                 },
                 {"colourspace"}});
    s.push_back({"Output-Referred RGB", "RGB", "cctf_decoding",
                 [](const Array& RGB, const ConversionContext& c) {
                     const auto decoded = colourspace(c).cctf_decoding(config::to_domain_1(RGB, c.scale));
                     return config::from_range_1(decoded, c.scale);
                 },
                 {"colourspace"}});
    s.push_back({"CIE XYZ", "sRGB", "XYZ_to_sRGB",
                 [](const Array& XYZ, const ConversionContext& c) {
                     return models::XYZ_to_RGB(XYZ, models::rgb_colourspace("sRGB"), adaptation_illuminant(c),
                                               adaptation_transform(c), c.boolean("apply_cctf_encoding", true), c.scale);
                 },
                 {"illuminant", "chromatic_adaptation_transform", "apply_cctf_encoding"}});
    s.push_back({"sRGB", "CIE XYZ", "sRGB_to_XYZ",
                 [](const Array& RGB, const ConversionContext& c) {
                     return models::RGB_to_XYZ(RGB, models::rgb_colourspace("sRGB"), adaptation_illuminant(c),
                                               adaptation_transform(c), c.boolean("apply_cctf_decoding", true), c.scale);
                 },
                 {"illuminant", "chromatic_adaptation_transform", "apply_cctf_decoding"}});

    // Output-referred RGB representations
    s.push_back({"Output-Referred RGB", "HSV", "RGB_to_HSV",
                 [](const Array& RGB, const ConversionContext& c) { return models::RGB_to_HSV(RGB, c.scale); }, {}});
    s.push_back({"HSV", "Output-Referred RGB", "HSV_to_RGB",
                 [](const Array& HSV, const ConversionContext& c) { return models::HSV_to_RGB(HSV, c.scale); }, {}});
    s.push_back({"Output-Referred RGB", "HSL", "RGB_to_HSL",
                 [](const Array& RGB, const ConversionContext& c) { return models::RGB_to_HSL(RGB, c.scale); }, {}});
    s.push_back({"HSL", "Output-Referred RGB", "HSL_to_RGB",
                 [](const Array& HSL, const ConversionContext& c) { return models::HSL_to_RGB(HSL, c.scale); }, {}});
    s.push_back({"Output-Referred RGB", "CMY", "RGB_to_CMY",
                 [](const Array& RGB, const ConversionContext& c) { return models::RGB_to_CMY(RGB, c.scale); }, {}});
    s.push_back({"CMY", "Output-Referred RGB", "CMY_to_RGB",
                 [](const Array& CMY, const ConversionContext& c) { return models::CMY_to_RGB(CMY, c.scale); }, {}});
    s.push_back({"CMY", "CMYK", "CMY_to_CMYK",
                 [](const Array& CMY, const ConversionContext& c) { return models::CMY_to_CMYK(CMY, c.scale); }, {}});
    s.push_back({"CMYK", "CMY", "CMYK_to_CMY",
                 [](const Array& CMYK, const ConversionContext& c) { return models::CMYK_to_CMY(CMYK, c.scale); }, {}});

    // Luminance and lightness
    s.push_back({"CIE XYZ", "Luminance", "XYZ_to_luminance",
                 [](const Array& XYZ, const ConversionContext&) { return models::XYZ_to_luminance(XYZ); }, {}});
    s.push_back({"Luminance", "Lightness", "lightness_CIE1976",
                 [](const Array& Y, const ConversionContext& c) {
                     return models::lightness_CIE1976(Y, c.number("Y_n", 100.0), c.scale);
                 },
                 {"Y_n"}});
    s.push_back({"Lightness", "Luminance", "luminance_CIE1976",
                 [](const Array& L, const ConversionContext& c) {
                     return models::luminance_CIE1976(L, c.number("Y_n", 100.0), c.scale);
                 },
                 {"Y_n"}});

    return s;
}

} // namespace

const std::vector<ConversionSpecification>& conversion_specifications() {
    static const std::vector<ConversionSpecification> specifications = build_specifications();
    return specifications;
}

} // namespace graph
} // namespace chromat
