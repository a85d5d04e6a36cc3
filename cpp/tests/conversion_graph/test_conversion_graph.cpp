#include <cassert>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "colour_models.hpp"
#include "common.hpp"
#include "conversion_graph.hpp"
#include "rgb_colourspaces.hpp"

using namespace chromat;
using namespace chromat::graph;
using chromat::config::ScaleMode;

static bool close(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

static nc::NdArray<double> row3(double a, double b, double c) {
    nc::NdArray<double> out(1, 3);
    out(0, 0) = a;
    out(0, 1) = b;
    out(0, 2) = c;
    return out;
}

static bool arrays_close(const nc::NdArray<double>& a, const nc::NdArray<double>& b, double tol = 1e-9) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!close(a[i], b[i], tol)) return false;
    }
    return true;
}

// Redirects std::cerr for the lifetime of the object.
class CerrCapture {
public:
    CerrCapture() : m_previous(std::cerr.rdbuf(m_buffer.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(m_previous); }
    std::string str() const { return m_buffer.str(); }

private:
    std::ostringstream m_buffer;
    std::streambuf* m_previous;
};

static const nc::NdArray<double> XYZ = row3(0.20654008, 0.12197225, 0.05136952);

// A -> B doubles, B -> C adds "offset" (default 1), C is a sink.
static ConversionGraph toy_graph() {
    std::vector<ConversionSpecification> specifications;
    specifications.push_back({"Node A", "Node B", "double",
                              [](const nc::NdArray<double>& a, const ConversionContext&) { return a * 2.0; },
                              {}});
    specifications.push_back({"Node B", "Node C", "add_offset",
                              [](const nc::NdArray<double>& a, const ConversionContext& c) {
                                  return a + c.number("offset", 1.0);
                              },
                              {"offset"}});
    specifications.push_back({"Node A", "Node C", "slow_path",
                              [](const nc::NdArray<double>& a, const ConversionContext&) { return a * 100.0; },
                              {}});
    return ConversionGraph(specifications);
}

static void test_node_names() {
    std::cout << "Testing node name normalisation..." << std::endl;
    assert(normalise_node_name("CIE XYZ") == "cie-xyz");
    assert(normalise_node_name("  Output-Referred   RGB ") == "output-referred-rgb");
    assert(normalise_node_name("cie_xyz") == "cie-xyz");
    assert(normalise_node_name("Hunter Lab") == "hunter-lab");

    const auto& graph = ConversionGraph::default_graph();
    assert(graph.has_node("CIE XYZ"));
    assert(graph.has_node("cie-xyz"));
    assert(graph.has_node("cie xyz"));
    assert(!graph.has_node("CIE CAM02"));
    assert(graph.nodes().front() == "CIE XYZ");
}

static void test_paths() {
    std::cout << "Testing conversion paths..." << std::endl;
    const auto& graph = ConversionGraph::default_graph();
    assert(graph.conversion_path("CIE XYZ", "cie xyz").empty());

    const auto lch = graph.conversion_path("CIE XYZ", "CIE LCHab");
    assert(lch.size() == 2);
    assert(lch[0]->name == "XYZ_to_Lab");
    assert(lch[1]->name == "Lab_to_LCHab");

    const auto hsv = graph.conversion_path("CIE Lab", "HSV");
    assert(hsv.size() == 4);
    assert(hsv.back()->name == "RGB_to_HSV");

    // The direct edge wins over the two stage path.
    const auto toy = toy_graph();
    const auto direct = toy.conversion_path("Node A", "Node C");
    assert(direct.size() == 1 && direct.front()->name == "slow_path");

    // Between equal length paths the earliest registered edge wins.
    const ConversionFunction identity = [](const nc::NdArray<double>& a, const ConversionContext&) { return a; };
    std::vector<ConversionSpecification> diamond;
    diamond.push_back({"P", "Q", "P_to_Q", identity, {}});
    diamond.push_back({"P", "R", "P_to_R", identity, {}});
    diamond.push_back({"R", "S", "R_to_S", identity, {}});
    diamond.push_back({"Q", "S", "Q_to_S", identity, {}});
    const ConversionGraph diamond_graph(diamond);
    const auto tied = diamond_graph.conversion_path("P", "S");
    assert(tied.size() == 2);
    assert(tied[0]->name == "P_to_Q");
    assert(tied[1]->name == "Q_to_S");

    std::vector<ConversionSpecification> swapped{diamond[1], diamond[0], diamond[2], diamond[3]};
    const ConversionGraph swapped_graph(swapped);
    const auto reordered = swapped_graph.conversion_path("P", "S");
    assert(reordered[0]->name == "P_to_R");
    assert(reordered[1]->name == "R_to_S");

    bool threw = false;
    try {
        graph.conversion_path("CIE XYZ", "Munsell Colour");
    } catch (const GraphError& e) {
        threw = std::string(e.what()).find("\"Munsell Colour\"") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        toy.conversion_path("Node C", "Node A");
    } catch (const GraphError& e) {
        threw = std::string(e.what()).find("No conversion path") != std::string::npos;
    }
    assert(threw);

    // GraphError is a std::runtime_error.
    threw = false;
    try {
        toy.conversion_path("Node Z", "Node A");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

static void test_convert() {
    std::cout << "Testing conversions..." << std::endl;
    const auto identity = convert(XYZ, "CIE XYZ", "CIE XYZ");
    assert(arrays_close(identity, XYZ, 0.0));

    const auto lch = convert(XYZ, "CIE XYZ", "CIE LCHab");
    const auto expected = models::Lab_to_LCHab(models::XYZ_to_Lab(XYZ, models::CCS_ILLUMINANT_D65, ScaleMode::One),
                                               ScaleMode::One);
    assert(arrays_close(lch, expected));
    assert(close(lch[0], 0.4152787529, 1e-8));

    // Reference scale gives the familiar L*a*b* ranges.
    const auto lab = convert(XYZ, "CIE XYZ", "CIE Lab", json::object(), ScaleMode::Reference);
    assert(close(lab[0], 41.52787529, 1e-7));

    const auto xy = convert(XYZ, "CIE XYZ", "CIE xy");
    assert(xy.shape().cols == 2);
    assert(close(xy[0], 0.54369557, 1e-7));

    const auto srgb = convert(XYZ, "CIE XYZ", "sRGB");
    const auto back = convert(srgb, "sRGB", "CIE XYZ");
    assert(arrays_close(back, XYZ));

    const auto hsv = convert(XYZ, "CIE XYZ", "HSV");
    assert(hsv.shape().cols == 3);
    const auto via_rgb = convert(convert(XYZ, "CIE XYZ", "Output-Referred RGB"), "Output-Referred RGB", "HSV");
    assert(arrays_close(hsv, via_rgb));

    const auto lightness = convert(XYZ, "CIE XYZ", "Lightness");
    assert(close(lightness[0], 0.4152787529, 1e-8));
}

static void test_kwargs() {
    std::cout << "Testing keyword arguments..." << std::endl;
    const auto D50 = convert(XYZ, "CIE XYZ", "CIE Lab", json{{"illuminant", "D50"}});
    const auto expected = models::XYZ_to_Lab(XYZ, models::CCS_ILLUMINANT_D50, ScaleMode::One);
    assert(arrays_close(D50, expected));

    const auto explicit_xy = convert(XYZ, "CIE XYZ", "CIE Lab", json{{"illuminant", {0.3457, 0.3585}}});
    assert(arrays_close(explicit_xy, expected));

    const auto acescg = convert(XYZ, "CIE XYZ", "RGB", json{{"colourspace", "ACEScg"}});
    const auto direct = models::XYZ_to_RGB(XYZ, models::rgb_colourspace("ACEScg"));
    assert(arrays_close(acescg, direct));

    const auto toy = toy_graph();
    const auto one = nc::NdArray<double>{1.0};
    assert(toy.convert(one, "Node B", "Node C")[0] == 2.0);
    assert(toy.convert(one, "Node B", "Node C", json{{"offset", 5.0}})[0] == 6.0);
    assert(toy.convert(one, "Node B", "Node C", json{{"add_offset", {{"offset", 10.0}}}})[0] == 11.0);
    assert(toy.convert(one, "Node B", "Node C", nullptr)[0] == 2.0);

    bool threw = false;
    try {
        toy.convert(one, "Node B", "Node C", json::array({1, 2}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    {
        CerrCapture capture;
        const auto result = toy.convert(one, "Node B", "Node C", json{{"offset", 1.0}, {"gain", 3.0}});
        assert(result[0] == 2.0);
        const std::string warning = capture.str();
        assert(warning.find("Unused keyword arguments") != std::string::npos);
        assert(warning.find("gain") != std::string::npos);
        assert(warning.find("offset") == std::string::npos);
    }

    {
        CerrCapture capture;
        utils::set_warnings_enabled(false);
        assert(!utils::warnings_enabled());
        toy.convert(one, "Node B", "Node C", json{{"gain", 3.0}});
        utils::set_warnings_enabled(true);
        assert(capture.str().empty());
    }
}

static void test_describe() {
    std::cout << "Testing conversion path descriptions..." << std::endl;
    assert(describe_conversion_path("CIE XYZ", "CIE xy") == "CIE XYZ --> CIE xyY --> CIE xy");
    assert(describe_conversion_path("cie-xyz", "CIE XYZ") == "CIE XYZ");

    const std::string long_form =
        describe_conversion_path("CIE XYZ", "CIE xy", DescribeMode::Long, json{{"illuminant", "D50"}});
    assert(long_form.find("[1] XYZ_to_xyY: CIE XYZ --> CIE xyY") != std::string::npos);
    assert(long_form.find("arguments: {\"illuminant\":\"D50\"}") != std::string::npos);
    assert(long_form.find("[2] xyY_to_xy: CIE xyY --> CIE xy") != std::string::npos);
    assert(long_form.find("parameters:") == std::string::npos);

    const std::string extended = describe_conversion_path("CIE XYZ", "CIE xy", DescribeMode::Extended);
    assert(extended.find("parameters: illuminant") != std::string::npos);
    assert(extended.find("parameters: (none)") != std::string::npos);

    const std::string dot = describe_conversion_path("CIE XYZ", "CIE xy", DescribeMode::Dot);
    assert(dot.find("digraph conversion_path {") == 0);
    assert(dot.find("\"CIE XYZ\" -> \"CIE xyY\" [label=\"XYZ_to_xyY\"];") != std::string::npos);

    assert(parse_describe_mode("Extended") == DescribeMode::Extended);
    bool threw = false;
    try {
        parse_describe_mode("verbose");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_invalid_graph() {
    std::cout << "Testing invalid specifications..." << std::endl;
    bool threw = false;
    try {
        std::vector<ConversionSpecification> specifications;
        specifications.push_back({"A", "B", "missing", ConversionFunction(), {}});
        const ConversionGraph graph(specifications);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        std::vector<ConversionSpecification> specifications;
        specifications.push_back(
            {"A", " - ", "empty", [](const nc::NdArray<double>& a, const ConversionContext&) { return a; }, {}});
        const ConversionGraph graph(specifications);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    try {
        test_node_names();
        test_paths();
        test_convert();
        test_kwargs();
        test_describe();
        test_invalid_graph();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All conversion graph tests passed." << std::endl;
    return 0;
}
