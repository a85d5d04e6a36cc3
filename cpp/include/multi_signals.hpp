#pragma once

#include "NumCpp.hpp"
#include "signal.hpp"

#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace chromat {
namespace continuous {

class MultiSignals;

// Ordered label -> Signal collection, insertion order is column order.
using LabelledSignals = std::vector<std::pair<std::string, Signal>>;

// -----------------------------------------------------------------------------
// Ingestion
// -----------------------------------------------------------------------------

/**
 * @brief Unpacks an n x c array into c signals sharing the given domain.
 *
 * A 1 x n row is a single channel. An empty domain defaults to 0..n-1 and
 * empty labels to "0".."c-1". Duplicate labels are suffixed with " - <index>".
 */
LabelledSignals multi_signals_unpack_data(
    const nc::NdArray<double>& data,
    const nc::NdArray<double>& domain = nc::NdArray<double>(),
    const std::vector<std::string>& labels = {},
    const algebra::InterpolatorSettings& interpolator = algebra::InterpolatorSettings(),
    const algebra::ExtrapolatorSettings& extrapolator = Signal::default_extrapolator_settings());

// Domain value -> one value per channel; every vector must have the same size.
LabelledSignals multi_signals_unpack_data(
    const std::map<double, std::vector<double>>& data,
    const std::vector<std::string>& labels = {},
    const algebra::InterpolatorSettings& interpolator = algebra::InterpolatorSettings(),
    const algebra::ExtrapolatorSettings& extrapolator = Signal::default_extrapolator_settings());

LabelledSignals multi_signals_unpack_data(const MultiSignals& data, const std::vector<std::string>& labels = {});

LabelledSignals multi_signals_unpack_data(const Signal& data, const std::vector<std::string>& labels = {});

// Signals on differing domains are evaluated on the union of the domains.
LabelledSignals multi_signals_unpack_data(const std::vector<Signal>& data,
                                          const std::vector<std::string>& labels = {});

/**
 * @brief Vector valued signal: one shared domain and c labelled channels.
 *
 * Every channel is a Signal carrying the same domain and the same
 * interpolator and extrapolator settings. Mutations go through the channels
 * in lockstep so their domains never diverge.
 */
class MultiSignals {
public:
    MultiSignals();
    explicit MultiSignals(const nc::NdArray<double>& range,
                          const nc::NdArray<double>& domain = nc::NdArray<double>(),
                          const std::vector<std::string>& labels = {},
                          const std::string& name = "",
                          const algebra::InterpolatorSettings& interpolator = algebra::InterpolatorSettings(),
                          const algebra::ExtrapolatorSettings& extrapolator = Signal::default_extrapolator_settings());
    explicit MultiSignals(const std::map<double, std::vector<double>>& data,
                          const std::vector<std::string>& labels = {},
                          const std::string& name = "",
                          const algebra::InterpolatorSettings& interpolator = algebra::InterpolatorSettings(),
                          const algebra::ExtrapolatorSettings& extrapolator = Signal::default_extrapolator_settings());
    // Settings are taken from the (first) signal.
    explicit MultiSignals(const Signal& signal, const std::vector<std::string>& labels = {});
    explicit MultiSignals(const std::vector<Signal>& signals, const std::vector<std::string>& labels = {},
                          const std::string& name = "");

    const std::string& name() const { return m_name; }
    void set_name(const std::string& name) { m_name = name; }

    nc::NdArray<double> domain() const;
    // n x c
    nc::NdArray<double> range() const;
    std::size_t size() const;
    std::size_t channels() const { return m_signals.size(); }
    bool empty() const { return m_signals.empty() || m_signals.front().empty(); }

    void set_domain(const nc::NdArray<double>& domain);
    // n x c, or n values broadcast to every channel.
    void set_range(const nc::NdArray<double>& range);

    const LabelledSignals& signals() const { return m_signals; }
    const Signal& signal(const std::string& label) const;
    void set_signals(const LabelledSignals& signals);
    void set_signals(const nc::NdArray<double>& range,
                     const nc::NdArray<double>& domain = nc::NdArray<double>(),
                     const std::vector<std::string>& labels = {});

    std::vector<std::string> labels() const;
    void set_labels(const std::vector<std::string>& labels);

    const algebra::InterpolatorSettings& interpolator_settings() const { return m_interpolator_settings; }
    void set_interpolator_settings(const algebra::InterpolatorSettings& settings);
    const algebra::ExtrapolatorSettings& extrapolator_settings() const { return m_extrapolator_settings; }
    void set_extrapolator_settings(const algebra::ExtrapolatorSettings& settings);

    // 1 x c
    nc::NdArray<double> evaluate(double x) const;
    // x.size() x c
    nc::NdArray<double> evaluate(const nc::NdArray<double>& x) const;

    nc::NdArray<double> operator[](double x) const { return evaluate(x); }
    nc::NdArray<double> operator[](const nc::NdArray<double>& x) const { return evaluate(x); }
    // Range rows by index.
    nc::NdArray<double> operator[](const nc::Slice& rows) const;

    // Range rows and label columns by index.
    nc::NdArray<double> get(const nc::Slice& rows, const nc::Slice& columns) const;
    nc::NdArray<double> get(const nc::NdArray<double>& x, const nc::Slice& columns) const;

    void set_item(double x, double y);
    // One value per channel, or a single value.
    void set_item(double x, const nc::NdArray<double>& y);
    void set_item(const nc::NdArray<double>& x, double y);
    // k x c values, one 1 x c row broadcast to every x, or k x 1 values broadcast to every channel.
    void set_item(const nc::NdArray<double>& x, const nc::NdArray<double>& y);
    void set_item(const nc::Slice& rows, double y);
    void set_item(const nc::Slice& rows, const nc::NdArray<double>& y);
    void set_item(const nc::Slice& rows, const nc::Slice& columns, double y);

    MultiSignals& fill_nan(FillNanMethod method = FillNanMethod::Interpolation, double default_value = 0.0);

    double domain_distance(double x) const;
    nc::NdArray<double> domain_distance(const nc::NdArray<double>& x) const;

    bool is_uniform() const;
    bool contains(double x) const;
    bool contains(const nc::NdArray<double>& x) const;

    /**
     * @brief Applies an arithmetic operator channel by channel.
     *
     * Array operands are n x c, 1 x c (one value per channel), n x 1 (one
     * value per sample) or a single value. A MultiSignals operand must have
     * the same number of channels or a single one; a Signal operand applies
     * to every channel.
     */
    MultiSignals apply_arithmetic(double operand, ArithmeticOperator op, bool in_place = false);
    MultiSignals apply_arithmetic(const nc::NdArray<double>& operand, ArithmeticOperator op, bool in_place = false);
    MultiSignals apply_arithmetic(const MultiSignals& operand, ArithmeticOperator op, bool in_place = false);
    MultiSignals apply_arithmetic(const Signal& operand, ArithmeticOperator op, bool in_place = false);

    friend bool operator==(const MultiSignals& a, const MultiSignals& b);
    friend bool operator!=(const MultiSignals& a, const MultiSignals& b) { return !(a == b); }
    friend std::ostream& operator<<(std::ostream& os, const MultiSignals& signals);

private:
    void adopt(LabelledSignals signals);
    void require_signals(const std::string& what) const;
    std::vector<std::size_t> column_indices(const nc::Slice& columns) const;

    std::string m_name;
    LabelledSignals m_signals;
    algebra::InterpolatorSettings m_interpolator_settings;
    algebra::ExtrapolatorSettings m_extrapolator_settings;
};

} // namespace continuous
} // namespace chromat
