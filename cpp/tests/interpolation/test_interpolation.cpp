#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "interpolation.hpp"

using namespace chromat::algebra;

static bool close(double a, double b, double tol = 1e-10) {
    return std::abs(a - b) <= tol;
}

static nc::NdArray<double> arange(int n) {
    nc::NdArray<double> a(1, n);
    for (int i = 0; i < n; ++i) a[i] = i;
    return a;
}

static void test_kernels() {
    std::cout << "Testing kernels..." << std::endl;
    assert(kernel_nearest_neighbour(0.4) == 1.0);
    assert(kernel_nearest_neighbour(0.6) == 0.0);
    assert(close(kernel_linear(0.25), 0.75));
    assert(kernel_linear(1.5) == 0.0);
    assert(close(kernel_sinc(0.0), 1.0));
    assert(close(kernel_sinc(2.0), 0.0));
    assert(kernel_sinc(3.5) == 0.0);
    assert(close(kernel_lanczos(0.0), 1.0));
    assert(close(kernel_lanczos(1.0), 0.0));
    assert(kernel_lanczos(3.0) == 0.0);
    assert(close(kernel_cardinal_spline(0.0), 1.0));
    assert(close(kernel_cardinal_spline(1.0), 0.0));
    assert(kernel_cardinal_spline(2.5) == 0.0);
}

static void test_linear() {
    std::cout << "Testing LinearInterpolator..." << std::endl;
    const auto x = arange(5);
    const auto y = x * 2.0;
    LinearInterpolator interpolator(x, y);
    assert(interpolator.method() == InterpolatorMethod::Linear);
    assert(close(interpolator(1.5), 3.0));
    assert(close(interpolator(4.0), 8.0));
    assert(std::isnan(interpolator(-0.1)));
    assert(std::isnan(interpolator(4.1)));

    const auto values = interpolator(nc::NdArray<double>{0.5, 2.25});
    assert(values.shape().cols == 2);
    assert(close(values[0], 1.0));
    assert(close(values[1], 4.5));

    bool threw = false;
    try {
        LinearInterpolator bad(nc::NdArray<double>{0.0, 1.0, 1.0}, nc::NdArray<double>{0.0, 1.0, 2.0});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_cubic() {
    std::cout << "Testing CubicSplineInterpolator and PchipInterpolator..." << std::endl;
    const auto x = arange(6);
    nc::NdArray<double> y(1, 6);
    for (int i = 0; i < 6; ++i) y[i] = std::pow(static_cast<double>(i), 3.0);

    // Not-a-knot splines reproduce cubics.
    CubicSplineInterpolator spline(x, y);
    assert(close(spline(2.5), 15.625, 1e-9));
    assert(close(spline(4.2), std::pow(4.2, 3.0), 1e-9));

    PchipInterpolator pchip(x, y);
    for (int i = 0; i < 6; ++i) assert(close(pchip(static_cast<double>(i)), y[i]));
    double previous = pchip(0.0);
    for (double q = 0.1; q <= 5.0; q += 0.1) {
        const double value = pchip(q);
        assert(value >= previous);
        previous = value;
    }
}

static void test_sprague() {
    std::cout << "Testing SpragueInterpolator..." << std::endl;
    const auto x = arange(8);
    const auto y = x * 3.0 + 1.0;
    SpragueInterpolator sprague(x, y);
    for (int i = 0; i < 8; ++i) assert(close(sprague(static_cast<double>(i)), y[i]));
    assert(close(sprague(3.5), 11.5, 1e-9));
    assert(close(sprague(0.25), 1.75, 1e-9));

    // Curved data reaches the padded boundary coefficients on the outer intervals.
    nc::NdArray<double> curved{5.0, 9.0, 2.0, 7.0, 11.0, 4.0, 8.0, 6.0};
    SpragueInterpolator boundary(x, curved);
    assert(close(boundary(0.0), 5.0, 1e-9));
    assert(close(boundary(0.5), 8.40823116028708, 1e-9));
    assert(close(boundary(3.5), 10.16015625, 1e-9));
    assert(close(boundary(6.5), 7.930360346889953, 1e-9));
    assert(close(boundary(7.0), 6.0, 1e-9));

    bool threw = false;
    try {
        SpragueInterpolator too_short(arange(5), arange(5));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_kernel_interpolator() {
    std::cout << "Testing KernelInterpolator..." << std::endl;
    const auto x = arange(10);
    nc::NdArray<double> y(1, 10);
    for (int i = 0; i < 10; ++i) y[i] = 10.0 * (i + 1);

    KernelInterpolator lanczos(x, y);
    for (int i = 0; i < 10; ++i) assert(close(lanczos(static_cast<double>(i)), y[i]));
    assert(close(lanczos(1.25), 22.83489024, 1e-7));
    assert(close(lanczos(2.5), 34.80044921, 1e-7));
    assert(close(lanczos(3.75), 47.55353925, 1e-7));

    KernelInterpolator linear(x, y, KernelType::Linear);
    assert(close(linear(2.5), 35.0));

    NearestNeighbourInterpolator nearest(x, y);
    assert(nearest.method() == InterpolatorMethod::NearestNeighbour);
    assert(close(nearest(1.4), 20.0));
    assert(close(nearest(1.6), 30.0));
}

static void test_null() {
    std::cout << "Testing NullInterpolator..." << std::endl;
    const auto x = arange(5);
    const auto y = x * 10.0;
    NullInterpolator null(x, y);
    assert(close(null(2.0), 20.0));
    assert(close(null(2.0000001), 20.0));
    assert(std::isnan(null(2.5)));

    NullInterpolator with_default(x, y, 1e-6, 1e-6, -1.0);
    assert(with_default(2.5) == -1.0);
}

static void test_factory_and_settings() {
    std::cout << "Testing make_interpolator and settings..." << std::endl;
    const auto x = arange(6);
    const auto y = x * 2.0;

    InterpolatorSettings settings;
    assert(settings.method == InterpolatorMethod::Kernel);
    assert(settings.kernel == KernelType::Lanczos);
    assert(settings.window == 3);

    settings.method = InterpolatorMethod::Linear;
    auto interpolator = make_interpolator(x, y, settings);
    assert(interpolator->method() == InterpolatorMethod::Linear);
    assert(close((*interpolator)(1.25), 2.5));

    assert(parse_interpolator_method("cubicspline") == InterpolatorMethod::CubicSpline);
    assert(parse_kernel_type("CardinalSpline") == KernelType::CardinalSpline);
    assert(parse_padding_mode("edge") == PaddingMode::Edge);

    bool threw = false;
    try {
        parse_interpolator_method("Quadratic");
    } catch (const std::invalid_argument& e) {
        threw = std::string(e.what()).find("Linear") != std::string::npos;
    }
    assert(threw);

    const auto round_trip = InterpolatorSettings::from_json(settings.to_json());
    assert(round_trip == settings);

    InterpolatorSettings sprague;
    sprague.method = InterpolatorMethod::Sprague;
    threw = false;
    try {
        make_interpolator(arange(4), arange(4), sprague);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_lagrange_coefficients() {
    std::cout << "Testing lagrange_coefficients..." << std::endl;
    const auto L = lagrange_coefficients(0.1);
    assert(L.size() == 4);
    assert(close(L[0], 0.8265));
    assert(close(L[1], 0.2755));
    assert(close(L[2], -0.1305));
    assert(close(L[3], 0.0285));

    const auto L6 = lagrange_coefficients(2.0, 6);
    for (int i = 0; i < 6; ++i) assert(close(L6[i], i == 2 ? 1.0 : 0.0));

    double sum = 0.0;
    for (const double value : lagrange_coefficients(0.37, 5)) sum += value;
    assert(close(sum, 1.0));
}

int main() {
    try {
        test_kernels();
        test_linear();
        test_cubic();
        test_sprague();
        test_kernel_interpolator();
        test_null();
        test_factory_and_settings();
        test_lagrange_coefficients();
        std::cout << "Interpolation tests passed" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
