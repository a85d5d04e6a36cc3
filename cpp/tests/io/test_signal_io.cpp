#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "signal_io.hpp"

using namespace chromat;
using namespace chromat::continuous;
using chromat::utils::json;

static Signal make_signal() {
    algebra::InterpolatorSettings interpolator;
    interpolator.method = algebra::InterpolatorMethod::CubicSpline;
    algebra::ExtrapolatorSettings extrapolator;
    extrapolator.method = algebra::ExtrapolationMethod::Constant;
    extrapolator.left = 0.0;
    return Signal(nc::NdArray<double>{1.0, 4.0, std::nan(""), 16.0, 25.0},
                  nc::NdArray<double>{400.0, 410.0, 420.0, 430.0, 440.0}, "Spectrum", interpolator, extrapolator);
}

static void test_signal_round_trip() {
    std::cout << "Testing Signal save / load..." << std::endl;
    const std::string path = "chromat_test_signal.json";
    const Signal signal = make_signal();
    utils::SignalIO::save_signal(signal, path);

    std::ifstream in(path);
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(text.find("NaN") != std::string::npos);
    assert(text.find("\"NaN\"") == std::string::npos);

    const Signal loaded = utils::SignalIO::load_signal(path);
    assert(loaded == signal);
    assert(loaded.name() == "Spectrum");
    assert(std::isnan(loaded.range_values()[2]));
    assert(loaded.extrapolator_settings().left && *loaded.extrapolator_settings().left == 0.0);
    std::remove(path.c_str());
}

static void test_signal_from_json() {
    std::cout << "Testing Signal documents..." << std::endl;
    const Signal minimal = utils::signal_from_json(json{{"range", {1.0, 2.0, 3.0}}});
    assert(minimal.domain_values() == (std::vector<double>{0.0, 1.0, 2.0}));
    assert(minimal.interpolator_settings() == algebra::InterpolatorSettings());
    assert(std::isnan(minimal[5.0]));

    bool threw = false;
    try {
        utils::signal_from_json(json{{"range", {1.0}}, {"colour", "red"}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        utils::signal_from_json(json{{"domain", {1.0}}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_multi_signals_round_trip() {
    std::cout << "Testing MultiSignals save / load..." << std::endl;
    const std::string path = "chromat_test_multi_signals.json";
    nc::NdArray<double> range(4, 3);
    for (nc::uint32 i = 0; i < 4; ++i) {
        for (nc::uint32 j = 0; j < 3; ++j) range(i, j) = i + 0.5 * j;
    }
    range(1, 1) = std::numeric_limits<double>::infinity();
    const MultiSignals signals(range, nc::NdArray<double>{0.0, 1.0, 2.0, 3.0}, {"x", "y", "z"}, "Triplets");
    utils::SignalIO::save_multi_signals(signals, path);

    const MultiSignals loaded = utils::SignalIO::load_multi_signals(path);
    assert(loaded == signals);
    assert(loaded.labels() == (std::vector<std::string>{"x", "y", "z"}));
    assert(std::isinf(loaded.range()(1, 1)));
    std::remove(path.c_str());

    // A single sample keeps its channel count.
    const MultiSignals single(std::map<double, std::vector<double>>{{5.0, {1.0, 2.0}}});
    const MultiSignals reloaded = utils::multi_signals_from_json(utils::multi_signals_to_json(single));
    assert(reloaded.channels() == 2);
    assert(reloaded.size() == 1);
    assert(reloaded.domain()[0] == 5.0);
}

static void test_bare_specials() {
    std::cout << "Testing bare NaN / Infinity tokens..." << std::endl;
    const std::string path = "chromat_test_specials.json";
    {
        std::ofstream out(path);
        out << "{\"name\": \"NaN inside a string\", \"range\": [NaN, Infinity, -Infinity, 1.5]}";
    }
    const json j = utils::parse_json_with_specials(path);
    assert(j.at("name") == "NaN inside a string");
    const Signal signal = utils::signal_from_json(j);
    assert(std::isnan(signal.range_values()[0]));
    assert(signal.range_values()[1] > 0.0 && std::isinf(signal.range_values()[1]));
    assert(signal.range_values()[2] < 0.0 && std::isinf(signal.range_values()[2]));
    assert(signal.range_values()[3] == 1.5);
    std::remove(path.c_str());

    bool threw = false;
    try {
        utils::SignalIO::load_signal("does_not_exist/chromat.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    try {
        test_signal_round_trip();
        test_signal_from_json();
        test_multi_signals_round_trip();
        test_bare_specials();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All Signal I/O tests passed." << std::endl;
    return 0;
}
