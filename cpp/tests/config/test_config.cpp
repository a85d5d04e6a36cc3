#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "config.hpp"

using namespace chromat::config;

static bool close(double a, double b, double tol = 1e-12) {
    return std::abs(a - b) <= tol;
}

static void test_parse_scale_mode() {
    std::cout << "Testing parse_scale_mode..." << std::endl;
    assert(parse_scale_mode("Reference") == ScaleMode::Reference);
    assert(parse_scale_mode("reference") == ScaleMode::Reference);
    assert(parse_scale_mode("1") == ScaleMode::One);
    assert(parse_scale_mode("100") == ScaleMode::Hundred);
    assert(to_string(ScaleMode::One) == "1");

    bool threw = false;
    try {
        parse_scale_mode("10");
    } catch (const std::invalid_argument& e) {
        threw = std::string(e.what()).find("Reference, 1, 100") != std::string::npos;
    }
    assert(threw);
}

static void test_scalar_factors() {
    std::cout << "Testing to_domain / from_range..." << std::endl;
    nc::NdArray<double> a = {0.5, 50.0};

    // Reference leaves values untouched.
    assert(close(to_domain_1(a, ScaleMode::Reference)[1], 50.0));
    assert(close(from_range_100(a, ScaleMode::Reference)[0], 0.5));

    assert(close(to_domain_1(a, ScaleMode::Hundred)[1], 0.5));
    assert(close(to_domain_1(a, ScaleMode::One)[1], 50.0));
    assert(close(from_range_1(a, ScaleMode::Hundred)[0], 50.0));

    assert(close(to_domain_100(a, ScaleMode::One)[0], 50.0));
    assert(close(to_domain_100(a, ScaleMode::Hundred)[0], 0.5));
    assert(close(from_range_100(a, ScaleMode::One)[1], 0.5));

    assert(close(to_domain_10(a, ScaleMode::One)[0], 5.0));
    assert(close(to_domain_10(a, ScaleMode::Hundred)[1], 5.0));
    assert(close(from_range_10(a, ScaleMode::One)[1], 5.0));

    assert(close(to_domain_degrees(a, ScaleMode::One)[0], 180.0));
    assert(close(to_domain_degrees(a, ScaleMode::Hundred)[1], 180.0));
    assert(close(from_range_degrees(nc::NdArray<double>{180.0}, ScaleMode::One)[0], 0.5));

    assert(close(to_domain_int(nc::NdArray<double>{1.0}, ScaleMode::One, 10)[0], 1023.0));
    assert(close(from_range_int(nc::NdArray<double>{1023.0}, ScaleMode::One, 10)[0], 1.0));
}

static void test_column_kinds() {
    std::cout << "Testing column-wise scaling..." << std::endl;
    nc::NdArray<double> LCH = {{0.5, 0.25, 0.75}};
    const ScaleKinds kinds = {ScaleKind::Percent, ScaleKind::Percent, ScaleKind::Degrees};

    const auto reference = to_domain(LCH, ScaleMode::One, kinds);
    assert(close(reference(0, 0), 50.0));
    assert(close(reference(0, 1), 25.0));
    assert(close(reference(0, 2), 270.0));
    const auto back = from_range(reference, ScaleMode::One, kinds);
    assert(close(back(0, 2), 0.75));

    nc::NdArray<double> xyY = {{0.3, 0.4, 50.0}};
    const ScaleKinds xyY_kinds = {ScaleKind::Fixed, ScaleKind::Fixed, ScaleKind::Unit};
    const auto unit = to_domain(xyY, ScaleMode::Hundred, xyY_kinds);
    assert(close(unit(0, 0), 0.3));
    assert(close(unit(0, 2), 0.5));

    bool threw = false;
    try {
        to_domain(nc::NdArray<double>{{1.0, 2.0}}, ScaleMode::One, kinds);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    try {
        test_parse_scale_mode();
        test_scalar_factors();
        test_column_kinds();
        std::cout << "Config tests passed" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
