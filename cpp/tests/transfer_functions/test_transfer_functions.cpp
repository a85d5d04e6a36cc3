#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

#include "transfer_functions.hpp"

using namespace chromat;
using namespace chromat::models;
using chromat::config::ScaleMode;

static bool close(double a, double b, double tol = 1e-7) {
    return std::abs(a - b) <= tol;
}

static nc::NdArray<double> value(double v) {
    return nc::NdArray<double>{v};
}

static double at(const nc::NdArray<double>& a) {
    return a[0];
}

using Curve = std::function<nc::NdArray<double>(const nc::NdArray<double>&)>;

static void check_round_trip(const Curve& encode, const Curve& decode, const nc::NdArray<double>& samples,
                             double tol = 1e-9) {
    const auto decoded = decode(encode(samples));
    for (std::size_t i = 0; i < samples.size(); ++i) {
        assert(close(decoded[i], samples[i], tol));
    }
}

static void test_display_encodings() {
    std::cout << "Testing sRGB, BT.709, BT.2020 and ProPhoto RGB..." << std::endl;
    assert(close(at(eotf_inverse_sRGB(value(0.18))), 0.461356129500442));
    assert(close(at(eotf_inverse_sRGB(value(1.0))), 1.0));
    assert(close(at(eotf_sRGB(value(0.461356129500442))), 0.18));
    assert(close(at(oetf_BT709(value(0.18))), 0.409007728864150));
    assert(close(at(oetf_BT2020(value(0.18))), 0.4088, 1e-4));
    assert(close(at(oetf_BT2020(value(0.18), true)), 0.408846402493504));
    assert(close(at(cctf_encoding_ProPhotoRGB(value(0.18))), 0.385711424751138));

    // Linear segment below the break points.
    assert(close(at(eotf_inverse_sRGB(value(0.001))), 0.01292));
    assert(close(at(oetf_BT709(value(0.01))), 0.045));
    assert(close(at(cctf_encoding_ProPhotoRGB(value(0.001))), 0.016));

    const nc::NdArray<double> samples{0.0, 0.001, 0.01, 0.18, 0.5, 1.0};
    check_round_trip([](const nc::NdArray<double>& a) { return eotf_inverse_sRGB(a); },
                     [](const nc::NdArray<double>& a) { return eotf_sRGB(a); }, samples);
    check_round_trip([](const nc::NdArray<double>& a) { return oetf_BT709(a); },
                     [](const nc::NdArray<double>& a) { return oetf_inverse_BT709(a); }, samples);
    check_round_trip([](const nc::NdArray<double>& a) { return oetf_BT2020(a); },
                     [](const nc::NdArray<double>& a) { return oetf_inverse_BT2020(a); }, samples);
    check_round_trip([](const nc::NdArray<double>& a) { return cctf_encoding_ProPhotoRGB(a); },
                     [](const nc::NdArray<double>& a) { return cctf_decoding_ProPhotoRGB(a); }, samples);
}

static void test_scale_modes() {
    std::cout << "Testing domain-range scales..." << std::endl;
    assert(close(at(eotf_inverse_sRGB(value(18.0), ScaleMode::Hundred)), 46.1356129500442));
    assert(close(at(eotf_inverse_sRGB(value(0.18), ScaleMode::One)), 0.461356129500442));

    // Shape is preserved.
    nc::NdArray<double> triplets(2, 3);
    triplets.fill(0.18);
    const auto encoded = eotf_inverse_sRGB(triplets);
    assert(encoded.shape().rows == 2 && encoded.shape().cols == 3);
    assert(close(encoded(1, 2), 0.461356129500442));
}

static void test_st2084() {
    std::cout << "Testing SMPTE ST 2084..." << std::endl;
    assert(close(at(eotf_inverse_ST2084(value(0.0))), 7.30955903e-7, 1e-12));
    assert(close(at(eotf_inverse_ST2084(value(100.0))), 0.508078421517399));
    assert(close(at(eotf_inverse_ST2084(value(400.0))), 0.652578597563067));
    assert(close(at(eotf_inverse_ST2084(value(5000.0), 5000.0)), 1.0));
    assert(close(at(eotf_ST2084(value(1.0), 5000.0)), 5000.0, 1e-6));
    assert(close(at(eotf_ST2084(value(0.508078421517399))), 100.0, 1e-6));

    check_round_trip([](const nc::NdArray<double>& a) { return eotf_inverse_ST2084(a); },
                     [](const nc::NdArray<double>& a) { return eotf_ST2084(a); },
                     nc::NdArray<double>{0.01, 1.0, 100.0, 1000.0, 10000.0}, 1e-6);
}

static void test_dcdm() {
    std::cout << "Testing DCDM..." << std::endl;
    assert(close(at(eotf_inverse_DCDM(value(0.18))), 0.112818609517667));
    assert(at(eotf_inverse_DCDM(value(0.18), true)) == 462.0);
    assert(close(at(eotf_inverse_DCDM(value(1.0))), 0.218179727327296));
    assert(close(at(eotf_DCDM(value(0.112818609517667))), 0.18));
    assert(close(at(eotf_DCDM(value(462.0), true)), 0.18, 1e-3));
}

static void test_aces() {
    std::cout << "Testing ACEScc, ACEScct and ACESproxy..." << std::endl;
    assert(close(at(log_encoding_ACEScc(value(0.18))), 0.413588402492442));
    assert(close(at(log_encoding_ACEScc(value(1.0))), 0.554794520547945));
    assert(close(at(log_encoding_ACEScc(value(0.0))), -0.358447488584475));
    assert(close(at(log_decoding_ACEScc(value(0.413588402492442))), 0.18));

    assert(close(at(log_encoding_ACEScct(value(0.18))), 0.413588402492442));
    assert(close(at(log_encoding_ACEScct(value(0.0))), 0.0729055341958355));
    check_round_trip([](const nc::NdArray<double>& a) { return log_encoding_ACEScct(a); },
                     [](const nc::NdArray<double>& a) { return log_decoding_ACEScct(a); },
                     nc::NdArray<double>{0.0, 0.005, 0.18, 1.0, 10.0});
    check_round_trip([](const nc::NdArray<double>& a) { return log_encoding_ACEScc(a); },
                     [](const nc::NdArray<double>& a) { return log_decoding_ACEScc(a); },
                     nc::NdArray<double>{0.001, 0.18, 1.0, 10.0});

    assert(close(at(log_encoding_ACESproxy(value(0.18))), 426.0 / 1023.0));
    assert(at(log_encoding_ACESproxy(value(0.18), 10, true)) == 426.0);
    assert(close(at(log_encoding_ACESproxy(value(1.0))), 0.537634408602151));
    assert(at(log_encoding_ACESproxy(value(0.0), 10, true)) == 64.0);
    assert(at(log_encoding_ACESproxy(value(1.0e6), 12, true)) == 3760.0);
    assert(close(at(log_decoding_ACESproxy(value(426.0), 10, true)), std::pow(2.0, 1.0 / 50.0 - 2.5)));
    assert(close(at(log_decoding_ACESproxy(value(550.0 / 1023.0))), 1.0));

    bool threw = false;
    try {
        log_encoding_ACESproxy(value(0.18), 8);
    } catch (const std::invalid_argument& e) {
        threw = std::string(e.what()).find("accepted values are: 10, 12") != std::string::npos;
    }
    assert(threw);
}

int main() {
    try {
        test_display_encodings();
        test_scale_modes();
        test_st2084();
        test_dcdm();
        test_aces();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All transfer function tests passed." << std::endl;
    return 0;
}
