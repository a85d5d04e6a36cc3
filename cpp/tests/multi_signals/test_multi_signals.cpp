#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "multi_signals.hpp"

using namespace chromat;
using namespace chromat::continuous;

static bool close(double a, double b, double tol = 1e-7) {
    return std::abs(a - b) <= tol;
}

static nc::NdArray<double> row(std::initializer_list<double> values) {
    return nc::NdArray<double>(values);
}

static nc::NdArray<double> fixture_domain() {
    nc::NdArray<double> domain(1, 10);
    for (int i = 0; i < 10; ++i) domain[i] = i;
    return domain;
}

// 10 x 3, column j is 10, 20, ..., 100 shifted by 10 * j
static nc::NdArray<double> fixture_range() {
    nc::NdArray<double> range(10, 3);
    for (nc::uint32 i = 0; i < 10; ++i) {
        for (nc::uint32 j = 0; j < 3; ++j) range(i, j) = 10.0 * (i + 1) + 10.0 * j;
    }
    return range;
}

static algebra::InterpolatorSettings linear_settings() {
    algebra::InterpolatorSettings settings;
    settings.method = algebra::InterpolatorMethod::Linear;
    return settings;
}

static MultiSignals fixture() {
    return MultiSignals(fixture_range(), fixture_domain(), {}, "Fixture", linear_settings());
}

static void test_unpack_data() {
    std::cout << "Testing multi_signals_unpack_data..." << std::endl;
    const auto single = multi_signals_unpack_data(row({1.0, 2.0, 3.0}));
    assert(single.size() == 1);
    assert(single.front().first == "0");
    assert(single.front().second.size() == 3);

    const auto columns = multi_signals_unpack_data(fixture_range(), fixture_domain());
    assert(columns.size() == 3);
    assert(columns[2].first == "2");
    assert(columns[2].second.range_values().front() == 30.0);

    const auto duplicated = multi_signals_unpack_data(fixture_range(), fixture_domain(), {"a", "a", "b"});
    assert(duplicated[0].first == "a - 0");
    assert(duplicated[1].first == "a - 1");
    assert(duplicated[2].first == "b - 2");

    bool threw = false;
    try {
        multi_signals_unpack_data(fixture_range(), row({0.0, 1.0}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        multi_signals_unpack_data(fixture_range(), fixture_domain(), {"x", "y"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    const std::map<double, std::vector<double>> mapping{{0.0, {1.0, 2.0}}, {1.0, {3.0, 4.0}}};
    const auto mapped = multi_signals_unpack_data(mapping, {"x", "y"});
    assert(mapped.size() == 2);
    assert(mapped[1].first == "y");
    assert(mapped[1].second.range_values() == (std::vector<double>{2.0, 4.0}));

    threw = false;
    try {
        multi_signals_unpack_data(std::map<double, std::vector<double>>{{0.0, {1.0}}, {1.0, {1.0, 2.0}}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_signals_on_different_domains() {
    std::cout << "Testing signals reconciled on the union domain..." << std::endl;
    const Signal a(row({0.0, 10.0}), row({0.0, 1.0}), "a", linear_settings());
    const Signal b(row({0.0, 20.0}), row({0.0, 2.0}), "b", linear_settings());
    const MultiSignals signals(std::vector<Signal>{a, b});
    assert(signals.channels() == 2);
    assert(signals.size() == 3);
    assert(signals.labels() == (std::vector<std::string>{"a", "b"}));

    const auto range = signals.range();
    assert(close(range(1, 0), 10.0));
    assert(std::isnan(range(2, 0)));
    assert(close(range(1, 1), 10.0));
    assert(close(range(2, 1), 20.0));
}

static void test_evaluation() {
    std::cout << "Testing evaluation..." << std::endl;
    const MultiSignals signals = fixture();
    assert(signals.channels() == 3);
    assert(signals.size() == 10);
    assert(signals.is_uniform());
    assert(signals.labels() == (std::vector<std::string>{"0", "1", "2"}));

    const auto at_node = signals[4.0];
    assert(at_node.shape().rows == 1 && at_node.shape().cols == 3);
    assert(close(at_node[0], 50.0) && close(at_node[1], 60.0) && close(at_node[2], 70.0));

    const auto between = signals[row({0.5, 8.5})];
    assert(between.shape().rows == 2 && between.shape().cols == 3);
    assert(close(between(0, 0), 15.0));
    assert(close(between(1, 2), 115.0));

    const auto outside = signals[-1.0];
    for (const double v : outside) assert(std::isnan(v));

    const auto sliced = signals.get(nc::Slice(0, 2), nc::Slice(1, 3));
    assert(sliced.shape().rows == 2 && sliced.shape().cols == 2);
    assert(sliced(0, 0) == 20.0);
    assert(sliced(1, 1) == 40.0);

    assert(signals.signal("1").range_values().back() == 110.0);

    // Lanczos kernel interpolation by default.
    const MultiSignals kernel(fixture_range(), fixture_domain());
    const auto interpolated = kernel[1.25];
    assert(close(interpolated[0], 22.83489024));
    assert(close(interpolated[1], 32.80460562));
    assert(close(interpolated[2], 42.77432100));

    nc::NdArray<double> midpoints(1, 10);
    for (int i = 0; i < 10; ++i) midpoints[i] = i + 0.5;
    const auto distances = signals.domain_distance(midpoints);
    assert(distances.size() == 10);
    for (const double d : distances) assert(close(d, 0.5));
    assert(signals.domain_distance(-2.0) == 2.0);
}

static void test_from_signal() {
    std::cout << "Testing construction from a Signal..." << std::endl;
    nc::NdArray<double> values(1, 10);
    for (int i = 0; i < 10; ++i) values[i] = 20.0 + 10.0 * i;
    const Signal signal(values, fixture_domain(), "Single", linear_settings());
    const MultiSignals signals(signal);
    assert(signals.channels() == 1);
    assert(signals.name() == "Single");

    const auto domain = signals.domain();
    const auto range = signals.range();
    assert(domain.size() == 10 && range.size() == 10);
    for (nc::uint32 i = 0; i < 10; ++i) {
        assert(domain[i] == signal.domain_values()[i]);
        assert(range[i] == signal.range_values()[i]);
    }
    assert(signals.signals().front().second == signal);
}

static void test_extrapolation() {
    std::cout << "Testing extrapolation..." << std::endl;
    MultiSignals signals = fixture();
    signals.set_extrapolator_settings(algebra::ExtrapolatorSettings());
    const auto values = signals[-1000.0];
    assert(close(values[0], -9990.0));
    assert(close(values[1], -9980.0));
    assert(close(values[2], -9970.0));
    for (const auto& entry : signals.signals()) {
        assert(entry.second.extrapolator_settings().method == algebra::ExtrapolationMethod::Linear);
    }
}

static void test_assignment() {
    std::cout << "Testing item assignment..." << std::endl;
    MultiSignals signals = fixture();
    signals.set_item(0.5, row({1.0, 2.0, 3.0}));
    assert(signals.size() == 11);
    assert(!signals.is_uniform());
    const auto inserted = signals[0.5];
    assert(inserted[0] == 1.0 && inserted[1] == 2.0 && inserted[2] == 3.0);

    signals.set_item(nc::Slice(0, 1), nc::Slice(0, 3), -1.0);
    assert(signals.range()(0, 2) == -1.0);

    signals.set_item(20.0, 0.0);
    assert(signals.size() == 12);
    for (const auto& entry : signals.signals()) {
        assert(entry.second.domain_values() == signals.signals().front().second.domain_values());
    }

    bool threw = false;
    try {
        signals.set_item(row({30.0, 31.0}), row({1.0, 2.0, 3.0, 4.0, 5.0}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Rejected updates leave every channel untouched.
    MultiSignals unchanged = fixture();
    threw = false;
    try {
        unchanged.set_item(row({5.5, std::nan("")}), 1.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(unchanged == fixture());

    algebra::InterpolatorSettings sprague;
    sprague.method = algebra::InterpolatorMethod::Sprague;
    unchanged.set_interpolator_settings(sprague);
    const MultiSignals before = unchanged;
    threw = false;
    try {
        unchanged.set_domain(row({0.0, 1.0, 2.0}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(unchanged.size() == 10);
    assert(unchanged == before);
}

static void test_arithmetic() {
    std::cout << "Testing arithmetic..." << std::endl;
    MultiSignals signals = fixture();
    const auto shifted = signals.apply_arithmetic(row({1.0, 2.0, 3.0}), ArithmeticOperator::Add);
    assert(shifted.range()(0, 0) == 11.0);
    assert(shifted.range()(0, 2) == 33.0);
    assert(signals.range()(0, 0) == 10.0);

    const auto doubled = signals.apply_arithmetic(signals, ArithmeticOperator::Add);
    assert(doubled.range()(9, 1) == 220.0);

    signals.apply_arithmetic(10.0, ArithmeticOperator::Divide, true);
    assert(close(signals.range()(9, 2), 12.0));

    bool threw = false;
    try {
        signals.apply_arithmetic(row({1.0, 2.0}), ArithmeticOperator::Add);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_labels_and_equality() {
    std::cout << "Testing labels and equality..." << std::endl;
    MultiSignals a = fixture();
    MultiSignals b = fixture();
    assert(a == b);

    a.set_labels({"x", "y", "z"});
    assert(a.signal("z").name() == "z");
    assert(a != b);

    bool threw = false;
    try {
        a.set_labels({"x"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        a.signal("w");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Replacing the signals adopts the collection's settings.
    MultiSignals c = fixture();
    LabelledSignals replacement;
    replacement.emplace_back("p", Signal(row({1.0, 2.0, 3.0}), row({0.0, 1.0, 2.0}), "p"));
    replacement.emplace_back("q", Signal(row({4.0, 5.0, 6.0}), row({0.0, 1.0, 2.0}), "q"));
    c.set_signals(replacement);
    assert(c.labels() == (std::vector<std::string>{"p", "q"}));
    assert(c.signal("q").interpolator_settings() == linear_settings());
    const auto values = c.evaluate(1.5);
    assert(close(values[0], 2.5) && close(values[1], 5.5));

    replacement.back().second = Signal(row({4.0, 5.0, 6.0}), row({0.0, 1.0, 5.0}), "q");
    threw = false;
    try {
        c.set_signals(replacement);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    c.set_signals(fixture_range(), fixture_domain(), {"r", "g", "b"});
    assert(c.channels() == 3);
    assert(c.labels().back() == "b");
}

static void test_empty() {
    std::cout << "Testing empty MultiSignals..." << std::endl;
    MultiSignals empty;
    assert(empty.channels() == 0);
    assert(empty.empty());
    assert(empty.range().size() == 0);

    bool threw = false;
    try {
        empty.evaluate(0.0);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    empty.set_range(fixture_range());
    assert(empty.channels() == 3);
    assert(empty.size() == 10);
}

int main() {
    try {
        test_unpack_data();
        test_signals_on_different_domains();
        test_evaluation();
        test_from_signal();
        test_extrapolation();
        test_assignment();
        test_arithmetic();
        test_labels_and_equality();
        test_empty();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All MultiSignals tests passed." << std::endl;
    return 0;
}
