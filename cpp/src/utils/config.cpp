#include "config.hpp"
#include "common.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace chromat {
namespace config {

namespace {

nc::NdArray<double> scaled(const nc::NdArray<double>& a, double numerator, double denominator = 1.0) {
    nc::NdArray<double> out = a.copy();
    if (numerator == denominator) return out;
    for (auto& value : out) value = value * numerator / denominator;
    return out;
}

double int_scale(int bit_depth) {
    return std::pow(2.0, bit_depth) - 1.0;
}

// Factor taking a value of the given kind from the mode's scale to the
// reference scale.
double domain_factor(ScaleKind kind, ScaleMode mode) {
    if (mode == ScaleMode::Reference) return 1.0;
    switch (kind) {
        case ScaleKind::Fixed: return 1.0;
        case ScaleKind::Unit: return mode == ScaleMode::Hundred ? 0.01 : 1.0;
        case ScaleKind::Percent: return mode == ScaleMode::One ? 100.0 : 1.0;
        case ScaleKind::Degrees: return mode == ScaleMode::One ? 360.0 : 3.6;
    }
    return 1.0;
}

nc::NdArray<double> scaled_columns(const nc::NdArray<double>& a, ScaleMode mode, const ScaleKinds& kinds, bool inverse) {
    if (a.shape().cols != kinds.size()) {
        throw std::invalid_argument("Expected " + std::to_string(kinds.size()) + " columns, got " +
                                    std::to_string(a.shape().cols));
    }
    nc::NdArray<double> out = a.copy();
    if (mode == ScaleMode::Reference) return out;
    for (nc::uint32 c = 0; c < a.shape().cols; ++c) {
        const double factor = domain_factor(kinds[c], mode);
        if (factor == 1.0) continue;
        for (nc::uint32 r = 0; r < a.shape().rows; ++r) {
            out(r, c) = inverse ? a(r, c) / factor : a(r, c) * factor;
        }
    }
    return out;
}

} // namespace

ScaleMode parse_scale_mode(const std::string& name) {
    const std::string key = utils::to_lower(name);
    if (key == "reference") return ScaleMode::Reference;
    if (key == "1") return ScaleMode::One;
    if (key == "100") return ScaleMode::Hundred;
    throw std::invalid_argument("Invalid scale mode \"" + name + "\", accepted values are: Reference, 1, 100");
}

std::string to_string(ScaleMode mode) {
    switch (mode) {
        case ScaleMode::Reference: return "Reference";
        case ScaleMode::One: return "1";
        case ScaleMode::Hundred: return "100";
    }
    return "Reference";
}

nc::NdArray<double> to_domain_1(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor) {
    return mode == ScaleMode::Hundred ? scaled(a, 1.0, scale_factor) : a.copy();
}

nc::NdArray<double> to_domain_10(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor) {
    if (mode == ScaleMode::One) return scaled(a, scale_factor);
    if (mode == ScaleMode::Hundred) return scaled(a, 1.0, scale_factor);
    return a.copy();
}

nc::NdArray<double> to_domain_100(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor) {
    return mode == ScaleMode::One ? scaled(a, scale_factor) : a.copy();
}

nc::NdArray<double> to_domain_degrees(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor) {
    if (mode == ScaleMode::One) return scaled(a, scale_factor);
    if (mode == ScaleMode::Hundred) return scaled(a, scale_factor, 100.0);
    return a.copy();
}

nc::NdArray<double> to_domain_int(const nc::NdArray<double>& a, ScaleMode mode, int bit_depth) {
    const double maximum = int_scale(bit_depth);
    if (mode == ScaleMode::One) return scaled(a, maximum);
    if (mode == ScaleMode::Hundred) return scaled(a, maximum, 100.0);
    return a.copy();
}

nc::NdArray<double> from_range_1(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor) {
    return mode == ScaleMode::Hundred ? scaled(a, scale_factor) : a.copy();
}

nc::NdArray<double> from_range_10(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor) {
    if (mode == ScaleMode::One) return scaled(a, 1.0, scale_factor);
    if (mode == ScaleMode::Hundred) return scaled(a, scale_factor);
    return a.copy();
}

nc::NdArray<double> from_range_100(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor) {
    return mode == ScaleMode::One ? scaled(a, 1.0, scale_factor) : a.copy();
}

nc::NdArray<double> from_range_degrees(const nc::NdArray<double>& a, ScaleMode mode, double scale_factor) {
    if (mode == ScaleMode::One) return scaled(a, 1.0, scale_factor);
    if (mode == ScaleMode::Hundred) return scaled(a, 100.0, scale_factor);
    return a.copy();
}

nc::NdArray<double> from_range_int(const nc::NdArray<double>& a, ScaleMode mode, int bit_depth) {
    const double maximum = int_scale(bit_depth);
    if (mode == ScaleMode::One) return scaled(a, 1.0, maximum);
    if (mode == ScaleMode::Hundred) return scaled(a, 100.0, maximum);
    return a.copy();
}

nc::NdArray<double> to_domain(const nc::NdArray<double>& a, ScaleMode mode, const ScaleKinds& kinds) {
    return scaled_columns(a, mode, kinds, false);
}

nc::NdArray<double> from_range(const nc::NdArray<double>& a, ScaleMode mode, const ScaleKinds& kinds) {
    return scaled_columns(a, mode, kinds, true);
}

} // namespace config
} // namespace chromat
