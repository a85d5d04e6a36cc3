#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "signal.hpp"

using namespace chromat;
using namespace chromat::continuous;

static bool close(double a, double b, double tol = 1e-7) {
    return std::abs(a - b) <= tol;
}

static nc::NdArray<double> row(std::initializer_list<double> values) {
    return nc::NdArray<double>(values);
}

// domain 0..9, range 10, 20, ..., 100
static Signal fixture(bool linear = false) {
    nc::NdArray<double> domain(1, 10);
    nc::NdArray<double> range(1, 10);
    for (int i = 0; i < 10; ++i) {
        domain[i] = i;
        range[i] = 10.0 * (i + 1);
    }
    algebra::InterpolatorSettings settings;
    if (linear) settings.method = algebra::InterpolatorMethod::Linear;
    return Signal(range, domain, "Signal", settings);
}

static void test_construction() {
    std::cout << "Testing construction..." << std::endl;
    Signal empty;
    assert(empty.empty());
    assert(std::isnan(empty.evaluate(0.0)));

    Signal implicit(row({1.0, 2.0, 3.0}));
    assert(implicit.size() == 3);
    assert(implicit.domain_values() == (std::vector<double>{0.0, 1.0, 2.0}));

    Signal mapped(std::map<double, double>{{2.0, 20.0}, {1.0, 10.0}, {3.0, 30.0}}, "Mapped");
    assert(mapped.name() == "Mapped");
    assert(mapped.domain_values() == (std::vector<double>{1.0, 2.0, 3.0}));
    assert(mapped.range_values() == (std::vector<double>{10.0, 20.0, 30.0}));

    bool threw = false;
    try {
        Signal bad(row({1.0, 2.0}), row({0.0, 1.0, 2.0}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Signal bad(row({1.0, 2.0, 3.0}), row({0.0, 2.0, 1.0}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Signal bad(row({1.0, 2.0}), row({0.0, std::nan("")}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_evaluation() {
    std::cout << "Testing evaluation..." << std::endl;
    const Signal signal = fixture();
    for (int i = 0; i < 10; ++i) {
        assert(close(signal[static_cast<double>(i)], 10.0 * (i + 1)));
    }
    assert(std::isnan(signal[-1.0]));
    assert(std::isnan(signal[10.5]));

    // Lanczos kernel interpolation by default.
    assert(close(signal[1.25], 22.83489024));
    assert(close(signal[2.5], 34.80044921));
    assert(close(signal[3.75], 47.55353925));

    const Signal linear = fixture(true);
    const auto values = linear[row({0.5, 4.25, 8.5})];
    assert(close(values[0], 15.0));
    assert(close(values[1], 52.5));
    assert(close(values[2], 95.0));

    const auto head = linear[nc::Slice(0, 3)];
    assert(head.size() == 3);
    assert(head[0] == 10.0 && head[2] == 30.0);
}

static void test_extrapolation() {
    std::cout << "Testing extrapolation settings..." << std::endl;
    Signal signal = fixture(true);
    algebra::ExtrapolatorSettings settings;
    signal.set_extrapolator_settings(settings);
    assert(close(signal[-1000.0], -9990.0));
    assert(close(signal[1000.0], 10100.0));

    settings.method = algebra::ExtrapolationMethod::Constant;
    signal.set_extrapolator_settings(settings);
    assert(signal[-1000.0] == 10.0);
    assert(signal[1000.0] == 100.0);
}

static void test_assignment() {
    std::cout << "Testing item assignment..." << std::endl;
    Signal signal = fixture(true);
    assert(signal.is_uniform());

    signal.set_item(0.5, 12.5);
    assert(signal.size() == 11);
    assert(signal.domain_values()[1] == 0.5);
    assert(signal.range_values()[1] == 12.5);
    assert(!signal.is_uniform());
    assert(close(signal[0.5], 12.5));

    signal.set_item(3.0, -1.0);
    assert(signal.size() == 11);
    assert(signal[3.0] == -1.0);

    signal.set_item(row({-1.0, 20.0}), 0.0);
    assert(signal.size() == 13);
    assert(signal.domain_values().front() == -1.0);
    assert(signal.domain_values().back() == 20.0);

    Signal sliced = fixture(true);
    sliced.set_item(nc::Slice(0, 2), 0.0);
    assert(sliced.range_values()[0] == 0.0);
    assert(sliced.range_values()[1] == 0.0);
    assert(sliced.range_values()[2] == 30.0);

    bool threw = false;
    try {
        sliced.set_item(nc::Slice(0, 3), row({1.0, 2.0}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // A rejected assignment leaves the samples untouched.
    Signal unchanged = fixture(true);
    threw = false;
    try {
        unchanged.set_item(row({5.5, std::nan("")}), 1.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(unchanged.size() == 10);
    assert(close(unchanged[5.5], 65.0));
    assert(unchanged == fixture(true));
}

static void test_domain_and_range() {
    std::cout << "Testing domain and range setters..." << std::endl;
    Signal signal = fixture(true);
    nc::NdArray<double> domain(1, 10);
    for (int i = 0; i < 10; ++i) domain[i] = 2.0 * i;
    signal.set_domain(domain);
    assert(close(signal[3.0], 25.0));

    bool threw = false;
    try {
        signal.set_range(row({1.0, 2.0}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // A shorter domain resizes the range cyclically.
    Signal shrunk = fixture(true);
    shrunk.set_domain(row({0.0, 1.0, 2.0}));
    assert(shrunk.range_values() == (std::vector<double>{10.0, 20.0, 30.0}));

    assert(signal.contains(5.0));
    assert(!signal.contains(19.0));
    assert(!signal.contains(row({1.0, 40.0})));

    assert(close(signal.domain_distance(3.0), 0.5));
    assert(signal.domain_distance(18.0) == 1.0);
    assert(signal.domain_distance(-1.0) == 1.0);
    assert(signal.domain_distance(20.5) == 2.5);
    assert(std::isnan(Signal().domain_distance(1.0)));

    nc::NdArray<double> midpoints(1, 10);
    for (int i = 0; i < 10; ++i) midpoints[i] = i + 0.5;
    const auto distances = fixture().domain_distance(midpoints);
    assert(distances.size() == 10);
    for (const double d : distances) assert(close(d, 0.5));

    // Sprague needs six samples, the failed resize keeps the original domain.
    algebra::InterpolatorSettings sprague;
    sprague.method = algebra::InterpolatorMethod::Sprague;
    Signal curved = fixture(true);
    curved.set_interpolator_settings(sprague);
    const Signal before = curved;
    threw = false;
    try {
        curved.set_domain(row({0.0, 1.0, 2.0}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(curved.size() == 10);
    assert(curved == before);
}

static void test_arithmetic() {
    std::cout << "Testing arithmetic..." << std::endl;
    Signal signal = fixture(true);
    Signal sum = signal.apply_arithmetic(10.0, ArithmeticOperator::Add);
    assert(sum.range_values()[0] == 20.0);
    assert(signal.range_values()[0] == 10.0);

    const Signal back = sum.apply_arithmetic(signal, ArithmeticOperator::Subtract);
    for (const double v : back.range_values()) assert(close(v, 10.0));

    const Signal squared = signal.apply_arithmetic(2.0, ArithmeticOperator::Power);
    assert(squared.range_values()[1] == 400.0);

    signal.apply_arithmetic(2.0, ArithmeticOperator::Multiply, true);
    assert(signal.range_values()[9] == 200.0);

    // Samples outside the shared domain become NaN.
    algebra::InterpolatorSettings linear;
    linear.method = algebra::InterpolatorMethod::Linear;
    const Signal other(row({1.0, 1.0}), row({0.0, 12.0}), "Other", linear);
    const Signal combined = fixture(true).apply_arithmetic(other, ArithmeticOperator::Add);
    assert(combined.size() == 11);
    assert(close(combined.range_values()[0], 11.0));
    assert(std::isnan(combined.range_values()[1]));
    assert(std::isnan(combined.range_values().back()));

    Signal reference = fixture(true);
    assert(reference.apply_arithmetic(5.0, ArithmeticOperator::Add)
               .apply_arithmetic(5.0, ArithmeticOperator::Subtract) == reference);
    assert(reference.apply_arithmetic(1.0, ArithmeticOperator::Multiply) == reference);
    assert(reference.apply_arithmetic(1.0, ArithmeticOperator::Power) == reference);

    assert(parse_arithmetic_operator("power") == ArithmeticOperator::Power);
    assert(to_string(ArithmeticOperator::Divide) == "/");
    bool threw = false;
    try {
        parse_arithmetic_operator("%");
    } catch (const std::invalid_argument& e) {
        threw = std::string(e.what()).find("accepted values are") != std::string::npos;
    }
    assert(threw);
}

static void test_fill_nan() {
    std::cout << "Testing NaN filling..." << std::endl;
    Signal signal = fixture(true);
    signal.set_item(nc::Slice(3, 5), std::nan(""));
    assert(std::isnan(signal.range_values()[3]));

    Signal interpolated = signal;
    interpolated.fill_nan();
    assert(close(interpolated.range_values()[3], 40.0));
    assert(close(interpolated.range_values()[4], 50.0));

    Signal constant = signal;
    constant.fill_nan(FillNanMethod::Constant, -1.0);
    assert(constant.range_values()[3] == -1.0);
    assert(parse_fill_nan_method("Constant") == FillNanMethod::Constant);
}

static void test_equality() {
    std::cout << "Testing equality..." << std::endl;
    Signal a = fixture();
    Signal b = fixture();
    assert(a == b);
    b.set_item(0.0, 0.0);
    assert(a != b);

    Signal c = fixture();
    algebra::InterpolatorSettings settings;
    settings.method = algebra::InterpolatorMethod::CubicSpline;
    c.set_interpolator_settings(settings);
    assert(a != c);

    Signal with_nan = fixture();
    with_nan.set_item(2.0, std::nan(""));
    Signal copy = with_nan;
    assert(with_nan == copy);

    std::ostringstream oss;
    oss << a;
    assert(oss.str().find("Signal(\"Signal\", 10 samples)") == 0);
}

int main() {
    try {
        test_construction();
        test_evaluation();
        test_extrapolation();
        test_assignment();
        test_domain_and_range();
        test_arithmetic();
        test_fill_nan();
        test_equality();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All Signal tests passed." << std::endl;
    return 0;
}
