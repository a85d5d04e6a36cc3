#include "multi_signals.hpp"
#include "common.hpp"

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>

namespace chromat {
namespace continuous {

namespace {

std::vector<std::string> resolve_labels(const std::vector<std::string>& labels,
                                        const std::vector<std::string>& defaults) {
    std::vector<std::string> out = labels.empty() ? defaults : labels;
    if (out.size() != defaults.size()) {
        throw std::invalid_argument("multi_signals_unpack_data: " + std::to_string(out.size()) +
                                    " labels given for " + std::to_string(defaults.size()) + " signals");
    }
    const std::set<std::string> unique(out.begin(), out.end());
    if (unique.size() != out.size()) {
        for (std::size_t i = 0; i < out.size(); ++i) out[i] = out[i] + " - " + std::to_string(i);
    }
    return out;
}

std::vector<std::string> index_labels(std::size_t count) {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < count; ++i) out.push_back(std::to_string(i));
    return out;
}

nc::NdArray<double> column(const nc::NdArray<double>& a, nc::uint32 c) {
    nc::NdArray<double> out(1, a.shape().rows);
    for (nc::uint32 r = 0; r < a.shape().rows; ++r) out(0, r) = a(r, c);
    return out;
}

nc::NdArray<double> flat(const nc::NdArray<double>& a) {
    return utils::to_row(utils::to_vector(a));
}

} // namespace

// -----------------------------------------------------------------------------
// Ingestion
// -----------------------------------------------------------------------------

LabelledSignals multi_signals_unpack_data(const nc::NdArray<double>& data,
                                          const nc::NdArray<double>& domain,
                                          const std::vector<std::string>& labels,
                                          const algebra::InterpolatorSettings& interpolator,
                                          const algebra::ExtrapolatorSettings& extrapolator) {
    if (data.size() == 0) return {};

    std::vector<nc::NdArray<double>> columns;
    if (data.shape().rows == 1) {
        columns.push_back(data);
    } else {
        for (nc::uint32 c = 0; c < data.shape().cols; ++c) columns.push_back(column(data, c));
    }

    const std::size_t n = columns.front().size();
    if (domain.size() != 0 && domain.size() != n) {
        throw std::invalid_argument("multi_signals_unpack_data: domain size " + std::to_string(domain.size()) +
                                    " does not match the " + std::to_string(n) + " samples of the data");
    }

    const auto names = resolve_labels(labels, index_labels(columns.size()));
    LabelledSignals out;
    for (std::size_t c = 0; c < columns.size(); ++c) {
        out.emplace_back(names[c], Signal(columns[c], flat(domain), names[c], interpolator, extrapolator));
    }
    return out;
}

LabelledSignals multi_signals_unpack_data(const std::map<double, std::vector<double>>& data,
                                          const std::vector<std::string>& labels,
                                          const algebra::InterpolatorSettings& interpolator,
                                          const algebra::ExtrapolatorSettings& extrapolator) {
    if (data.empty()) return {};

    const std::size_t c = data.begin()->second.size();
    nc::NdArray<double> domain(1, static_cast<nc::uint32>(data.size()));
    nc::NdArray<double> range(static_cast<nc::uint32>(data.size()), static_cast<nc::uint32>(c));
    nc::uint32 row = 0;
    for (const auto& kv : data) {
        if (kv.second.size() != c) {
            throw std::invalid_argument("multi_signals_unpack_data: every sample must have " + std::to_string(c) +
                                        " values");
        }
        domain(0, row) = kv.first;
        for (std::size_t j = 0; j < c; ++j) range(row, static_cast<nc::uint32>(j)) = kv.second[j];
        ++row;
    }

    const auto names = resolve_labels(labels, index_labels(c));
    LabelledSignals out;
    for (std::size_t j = 0; j < c; ++j) {
        out.emplace_back(names[j], Signal(column(range, static_cast<nc::uint32>(j)), domain, names[j],
                                          interpolator, extrapolator));
    }
    return out;
}

LabelledSignals multi_signals_unpack_data(const MultiSignals& data, const std::vector<std::string>& labels) {
    LabelledSignals out = data.signals();
    std::vector<std::string> current;
    for (const auto& entry : out) current.push_back(entry.first);
    const auto names = resolve_labels(labels, current);
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i].first = names[i];
        out[i].second.set_name(names[i]);
    }
    return out;
}

LabelledSignals multi_signals_unpack_data(const Signal& data, const std::vector<std::string>& labels) {
    return multi_signals_unpack_data(std::vector<Signal>{data}, labels);
}

LabelledSignals multi_signals_unpack_data(const std::vector<Signal>& data, const std::vector<std::string>& labels) {
    if (data.empty()) return {};

    std::vector<double> domain = data.front().domain_values();
    bool aligned = true;
    for (const auto& signal : data) {
        if (signal.domain_values() == domain) continue;
        aligned = false;
        std::vector<double> merged;
        std::set_union(domain.begin(), domain.end(), signal.domain_values().begin(), signal.domain_values().end(),
                       std::back_inserter(merged));
        domain.swap(merged);
    }

    std::vector<std::string> defaults;
    for (std::size_t i = 0; i < data.size(); ++i) {
        defaults.push_back(data[i].name().empty() ? std::to_string(i) : data[i].name());
    }
    const auto names = resolve_labels(labels, defaults);

    LabelledSignals out;
    const auto union_domain = utils::to_row(domain);
    for (std::size_t i = 0; i < data.size(); ++i) {
        Signal signal = data[i];
        if (!aligned) {
            signal = Signal(data[i].evaluate(union_domain), union_domain, names[i],
                            data[i].interpolator_settings(), data[i].extrapolator_settings());
        }
        signal.set_name(names[i]);
        out.emplace_back(names[i], signal);
    }
    return out;
}

// -----------------------------------------------------------------------------
// MultiSignals
// -----------------------------------------------------------------------------

MultiSignals::MultiSignals()
    : m_extrapolator_settings(Signal::default_extrapolator_settings()) {}

MultiSignals::MultiSignals(const nc::NdArray<double>& range,
                           const nc::NdArray<double>& domain,
                           const std::vector<std::string>& labels,
                           const std::string& name,
                           const algebra::InterpolatorSettings& interpolator,
                           const algebra::ExtrapolatorSettings& extrapolator)
    : m_name(name),
      m_interpolator_settings(interpolator),
      m_extrapolator_settings(extrapolator) {
    adopt(multi_signals_unpack_data(range, domain, labels, interpolator, extrapolator));
}

MultiSignals::MultiSignals(const std::map<double, std::vector<double>>& data,
                           const std::vector<std::string>& labels,
                           const std::string& name,
                           const algebra::InterpolatorSettings& interpolator,
                           const algebra::ExtrapolatorSettings& extrapolator)
    : m_name(name),
      m_interpolator_settings(interpolator),
      m_extrapolator_settings(extrapolator) {
    adopt(multi_signals_unpack_data(data, labels, interpolator, extrapolator));
}

MultiSignals::MultiSignals(const Signal& signal, const std::vector<std::string>& labels)
    : m_name(signal.name()),
      m_interpolator_settings(signal.interpolator_settings()),
      m_extrapolator_settings(signal.extrapolator_settings()) {
    adopt(multi_signals_unpack_data(signal, labels));
}

MultiSignals::MultiSignals(const std::vector<Signal>& signals,
                           const std::vector<std::string>& labels,
                           const std::string& name)
    : m_name(name),
      m_extrapolator_settings(Signal::default_extrapolator_settings()) {
    if (!signals.empty()) {
        m_interpolator_settings = signals.front().interpolator_settings();
        m_extrapolator_settings = signals.front().extrapolator_settings();
    }
    adopt(multi_signals_unpack_data(signals, labels));
}

void MultiSignals::adopt(LabelledSignals signals) {
    for (auto& entry : signals) {
        if (!signals.empty() && entry.second.domain_values() != signals.front().second.domain_values()) {
            throw std::invalid_argument("MultiSignals \"" + m_name + "\": signals must share the same domain");
        }
        if (entry.second.interpolator_settings() != m_interpolator_settings) {
            entry.second.set_interpolator_settings(m_interpolator_settings);
        }
        if (entry.second.extrapolator_settings() != m_extrapolator_settings) {
            entry.second.set_extrapolator_settings(m_extrapolator_settings);
        }
    }
    m_signals = std::move(signals);
}

void MultiSignals::require_signals(const std::string& what) const {
    if (m_signals.empty()) {
        throw std::runtime_error("MultiSignals \"" + m_name + "\": " + what + " requires at least one signal");
    }
}

std::vector<std::size_t> MultiSignals::column_indices(const nc::Slice& columns) const {
    return utils::slice_indices(columns, m_signals.size());
}

nc::NdArray<double> MultiSignals::domain() const {
    if (m_signals.empty()) return nc::NdArray<double>();
    return m_signals.front().second.domain();
}

nc::NdArray<double> MultiSignals::range() const {
    const std::size_t n = size();
    if (n == 0 || m_signals.empty()) return nc::NdArray<double>();
    nc::NdArray<double> out(static_cast<nc::uint32>(n), static_cast<nc::uint32>(m_signals.size()));
    for (std::size_t c = 0; c < m_signals.size(); ++c) {
        const auto& values = m_signals[c].second.range_values();
        for (std::size_t r = 0; r < n; ++r) out(static_cast<nc::uint32>(r), static_cast<nc::uint32>(c)) = values[r];
    }
    return out;
}

std::size_t MultiSignals::size() const {
    return m_signals.empty() ? 0 : m_signals.front().second.size();
}

void MultiSignals::set_domain(const nc::NdArray<double>& domain) {
    require_signals("set_domain");
    LabelledSignals updated = m_signals;
    for (auto& entry : updated) entry.second.set_domain(domain);
    m_signals = std::move(updated);
}

void MultiSignals::set_range(const nc::NdArray<double>& range) {
    if (m_signals.empty()) {
        set_signals(range);
        return;
    }
    const std::size_t n = size();
    const std::size_t c = m_signals.size();
    LabelledSignals updated = m_signals;
    if (range.shape().rows == n && range.shape().cols == c) {
        for (std::size_t j = 0; j < c; ++j) updated[j].second.set_range(column(range, static_cast<nc::uint32>(j)));
    } else if (range.size() == n) {
        for (auto& entry : updated) entry.second.set_range(flat(range));
    } else {
        throw std::invalid_argument("MultiSignals \"" + m_name + "\": range of shape " +
                                    std::to_string(range.shape().rows) + " x " + std::to_string(range.shape().cols) +
                                    " does not match " + std::to_string(n) + " x " + std::to_string(c));
    }
    m_signals = std::move(updated);
}

const Signal& MultiSignals::signal(const std::string& label) const {
    for (const auto& entry : m_signals) {
        if (entry.first == label) return entry.second;
    }
    throw std::invalid_argument("MultiSignals \"" + m_name + "\": no signal labelled \"" + label + "\"");
}

void MultiSignals::set_signals(const LabelledSignals& signals) {
    adopt(signals);
}

void MultiSignals::set_signals(const nc::NdArray<double>& range,
                               const nc::NdArray<double>& domain,
                               const std::vector<std::string>& labels) {
    adopt(multi_signals_unpack_data(range, domain, labels, m_interpolator_settings, m_extrapolator_settings));
}

std::vector<std::string> MultiSignals::labels() const {
    std::vector<std::string> out;
    for (const auto& entry : m_signals) out.push_back(entry.first);
    return out;
}

void MultiSignals::set_labels(const std::vector<std::string>& labels) {
    if (labels.size() != m_signals.size()) {
        throw std::invalid_argument("MultiSignals \"" + m_name + "\": " + std::to_string(labels.size()) +
                                    " labels given for " + std::to_string(m_signals.size()) + " signals");
    }
    m_signals = multi_signals_unpack_data(*this, labels);
}

void MultiSignals::set_interpolator_settings(const algebra::InterpolatorSettings& settings) {
    LabelledSignals updated = m_signals;
    for (auto& entry : updated) entry.second.set_interpolator_settings(settings);
    m_interpolator_settings = settings;
    m_signals = std::move(updated);
}

void MultiSignals::set_extrapolator_settings(const algebra::ExtrapolatorSettings& settings) {
    LabelledSignals updated = m_signals;
    for (auto& entry : updated) entry.second.set_extrapolator_settings(settings);
    m_extrapolator_settings = settings;
    m_signals = std::move(updated);
}

nc::NdArray<double> MultiSignals::evaluate(double x) const {
    require_signals("evaluate");
    nc::NdArray<double> out(1, static_cast<nc::uint32>(m_signals.size()));
    for (std::size_t c = 0; c < m_signals.size(); ++c) out(0, static_cast<nc::uint32>(c)) = m_signals[c].second.evaluate(x);
    return out;
}

nc::NdArray<double> MultiSignals::evaluate(const nc::NdArray<double>& x) const {
    require_signals("evaluate");
    const auto n = static_cast<nc::uint32>(x.size());
    nc::NdArray<double> out(n, static_cast<nc::uint32>(m_signals.size()));
    for (std::size_t c = 0; c < m_signals.size(); ++c) {
        const auto values = m_signals[c].second.evaluate(flat(x));
        for (nc::uint32 r = 0; r < n; ++r) out(r, static_cast<nc::uint32>(c)) = values[r];
    }
    return out;
}

nc::NdArray<double> MultiSignals::operator[](const nc::Slice& rows) const {
    return get(rows, nc::Slice(0, static_cast<int>(m_signals.size())));
}

nc::NdArray<double> MultiSignals::get(const nc::Slice& rows, const nc::Slice& columns) const {
    const auto r = utils::slice_indices(rows, size());
    const auto c = column_indices(columns);
    nc::NdArray<double> out(static_cast<nc::uint32>(r.size()), static_cast<nc::uint32>(c.size()));
    for (std::size_t j = 0; j < c.size(); ++j) {
        const auto& values = m_signals[c[j]].second.range_values();
        for (std::size_t i = 0; i < r.size(); ++i) {
            out(static_cast<nc::uint32>(i), static_cast<nc::uint32>(j)) = values[r[i]];
        }
    }
    return out;
}

nc::NdArray<double> MultiSignals::get(const nc::NdArray<double>& x, const nc::Slice& columns) const {
    const auto c = column_indices(columns);
    const auto n = static_cast<nc::uint32>(x.size());
    nc::NdArray<double> out(n, static_cast<nc::uint32>(c.size()));
    for (std::size_t j = 0; j < c.size(); ++j) {
        const auto values = m_signals[c[j]].second.evaluate(flat(x));
        for (nc::uint32 i = 0; i < n; ++i) out(i, static_cast<nc::uint32>(j)) = values[i];
    }
    return out;
}

void MultiSignals::set_item(double x, double y) {
    require_signals("set_item");
    LabelledSignals updated = m_signals;
    for (auto& entry : updated) entry.second.set_item(x, y);
    m_signals = std::move(updated);
}

void MultiSignals::set_item(double x, const nc::NdArray<double>& y) {
    nc::NdArray<double> xs(1, 1);
    xs(0, 0) = x;
    set_item(xs, y);
}

void MultiSignals::set_item(const nc::NdArray<double>& x, double y) {
    require_signals("set_item");
    LabelledSignals updated = m_signals;
    for (auto& entry : updated) entry.second.set_item(flat(x), y);
    m_signals = std::move(updated);
}

void MultiSignals::set_item(const nc::NdArray<double>& x, const nc::NdArray<double>& y) {
    require_signals("set_item");
    const std::size_t k = x.size();
    const std::size_t c = m_signals.size();
    const auto rows = y.shape().rows;
    const auto cols = y.shape().cols;

    if (y.size() == 1) {
        set_item(x, y[0]);
        return;
    }
    LabelledSignals updated = m_signals;
    if (rows == 1 && cols == c) {
        for (std::size_t j = 0; j < c; ++j) updated[j].second.set_item(flat(x), y[static_cast<nc::uint32>(j)]);
    } else if (rows == k && cols == c) {
        for (std::size_t j = 0; j < c; ++j) updated[j].second.set_item(flat(x), column(y, static_cast<nc::uint32>(j)));
    } else if (y.size() == k && (cols == 1 || c == 1)) {
        for (auto& entry : updated) entry.second.set_item(flat(x), flat(y));
    } else {
        throw std::invalid_argument("MultiSignals \"" + m_name + "\": cannot assign " + std::to_string(rows) + " x " +
                                    std::to_string(cols) + " values to " + std::to_string(k) + " domain values and " +
                                    std::to_string(c) + " signals");
    }
    m_signals = std::move(updated);
}

void MultiSignals::set_item(const nc::Slice& rows, double y) {
    require_signals("set_item");
    LabelledSignals updated = m_signals;
    for (auto& entry : updated) entry.second.set_item(rows, y);
    m_signals = std::move(updated);
}

void MultiSignals::set_item(const nc::Slice& rows, const nc::NdArray<double>& y) {
    require_signals("set_item");
    const std::size_t k = utils::slice_indices(rows, size()).size();
    const std::size_t c = m_signals.size();

    if (y.size() == 1) {
        set_item(rows, y[0]);
        return;
    }
    LabelledSignals updated = m_signals;
    if (y.shape().rows == 1 && y.shape().cols == c) {
        for (std::size_t j = 0; j < c; ++j) updated[j].second.set_item(rows, y[static_cast<nc::uint32>(j)]);
    } else if (y.shape().rows == k && y.shape().cols == c) {
        for (std::size_t j = 0; j < c; ++j) updated[j].second.set_item(rows, column(y, static_cast<nc::uint32>(j)));
    } else if (y.size() == k) {
        for (auto& entry : updated) entry.second.set_item(rows, flat(y));
    } else {
        throw std::invalid_argument("MultiSignals \"" + m_name + "\": cannot assign " + std::to_string(y.size()) +
                                    " values to " + std::to_string(k) + " rows and " + std::to_string(c) + " signals");
    }
    m_signals = std::move(updated);
}

void MultiSignals::set_item(const nc::Slice& rows, const nc::Slice& columns, double y) {
    LabelledSignals updated = m_signals;
    for (std::size_t j : column_indices(columns)) updated[j].second.set_item(rows, y);
    m_signals = std::move(updated);
}

MultiSignals& MultiSignals::fill_nan(FillNanMethod method, double default_value) {
    for (auto& entry : m_signals) entry.second.fill_nan(method, default_value);
    return *this;
}

double MultiSignals::domain_distance(double x) const {
    require_signals("domain_distance");
    return m_signals.front().second.domain_distance(x);
}

nc::NdArray<double> MultiSignals::domain_distance(const nc::NdArray<double>& x) const {
    require_signals("domain_distance");
    return m_signals.front().second.domain_distance(x);
}

bool MultiSignals::is_uniform() const {
    return !m_signals.empty() && m_signals.front().second.is_uniform();
}

bool MultiSignals::contains(double x) const {
    return !m_signals.empty() && m_signals.front().second.contains(x);
}

bool MultiSignals::contains(const nc::NdArray<double>& x) const {
    return !m_signals.empty() && m_signals.front().second.contains(x);
}

MultiSignals MultiSignals::apply_arithmetic(double operand, ArithmeticOperator op, bool in_place) {
    MultiSignals result = *this;
    for (auto& entry : result.m_signals) entry.second.apply_arithmetic(operand, op, true);
    if (in_place) *this = result;
    return result;
}

MultiSignals MultiSignals::apply_arithmetic(const nc::NdArray<double>& operand, ArithmeticOperator op, bool in_place) {
    const std::size_t n = size();
    const std::size_t c = m_signals.size();
    const auto rows = operand.shape().rows;
    const auto cols = operand.shape().cols;

    MultiSignals result = *this;
    if (operand.size() == 1) {
        return apply_arithmetic(operand[0], op, in_place);
    } else if (rows == n && cols == c) {
        for (std::size_t j = 0; j < c; ++j) {
            result.m_signals[j].second.apply_arithmetic(column(operand, static_cast<nc::uint32>(j)), op, true);
        }
    } else if (rows == 1 && cols == c) {
        for (std::size_t j = 0; j < c; ++j) {
            result.m_signals[j].second.apply_arithmetic(operand[static_cast<nc::uint32>(j)], op, true);
        }
    } else if (operand.size() == n) {
        for (auto& entry : result.m_signals) entry.second.apply_arithmetic(flat(operand), op, true);
    } else {
        throw std::invalid_argument("MultiSignals \"" + m_name + "\": operand of shape " + std::to_string(rows) +
                                    " x " + std::to_string(cols) + " does not broadcast to " + std::to_string(n) +
                                    " x " + std::to_string(c));
    }
    if (in_place) *this = result;
    return result;
}

MultiSignals MultiSignals::apply_arithmetic(const MultiSignals& operand, ArithmeticOperator op, bool in_place) {
    const std::size_t c = m_signals.size();
    if (operand.m_signals.size() != c && operand.m_signals.size() != 1) {
        throw std::invalid_argument("MultiSignals \"" + m_name + "\": operand has " +
                                    std::to_string(operand.m_signals.size()) + " signals, expected " +
                                    std::to_string(c) + " or 1");
    }
    MultiSignals result = *this;
    for (std::size_t j = 0; j < c; ++j) {
        const Signal& other = operand.m_signals[operand.m_signals.size() == 1 ? 0 : j].second;
        result.m_signals[j].second.apply_arithmetic(other, op, true);
    }
    if (in_place) *this = result;
    return result;
}

MultiSignals MultiSignals::apply_arithmetic(const Signal& operand, ArithmeticOperator op, bool in_place) {
    MultiSignals result = *this;
    for (auto& entry : result.m_signals) entry.second.apply_arithmetic(operand, op, true);
    if (in_place) *this = result;
    return result;
}

bool operator==(const MultiSignals& a, const MultiSignals& b) {
    if (a.labels() != b.labels()) return false;
    if (a.m_interpolator_settings != b.m_interpolator_settings) return false;
    if (a.m_extrapolator_settings != b.m_extrapolator_settings) return false;
    for (std::size_t i = 0; i < a.m_signals.size(); ++i) {
        if (a.m_signals[i].second != b.m_signals[i].second) return false;
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const MultiSignals& signals) {
    std::ostringstream oss;
    oss << std::setprecision(8);
    oss << "MultiSignals(\"" << signals.m_name << "\", " << signals.size() << " samples, labels: ["
        << utils::join(signals.labels(), ", ") << "])";
    const auto domain = signals.domain();
    const auto range = signals.range();
    for (nc::uint32 r = 0; r < range.shape().rows; ++r) {
        oss << "\n  [" << domain[r];
        for (nc::uint32 c = 0; c < range.shape().cols; ++c) oss << ", " << range(r, c);
        oss << "]";
    }
    return os << oss.str();
}

} // namespace continuous
} // namespace chromat
