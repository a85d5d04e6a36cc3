#include "signal_io.hpp"
#include "common.hpp"

#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>

namespace chromat {
namespace utils {

namespace {

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open: " + path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

bool matches(const std::string& raw, std::size_t pos, const std::string& token) {
    return raw.compare(pos, token.size(), token) == 0;
}

// Quotes bare NaN / Infinity tokens outside strings so the parser accepts them.
std::string sanitize_json_specials(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    bool in_string = false;
    bool escape = false;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const char c = raw[i];
        if (in_string) {
            out.push_back(c);
            if (escape) escape = false;
            else if (c == '\\') escape = true;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') {
            in_string = true;
            out.push_back(c);
            continue;
        }
        if (matches(raw, i, "NaN")) { out += "\"NaN\""; i += 2; continue; }
        if (matches(raw, i, "-Infinity")) { out += "\"-Infinity\""; i += 8; continue; }
        if (matches(raw, i, "Infinity")) { out += "\"Infinity\""; i += 7; continue; }
        out.push_back(c);
    }
    return out;
}

// Unquotes string values that are exactly one of the special tokens.
std::string unquote_json_specials(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '"') {
            out.push_back(text[i]);
            continue;
        }
        std::size_t j = i + 1;
        bool escape = false;
        for (; j < text.size(); ++j) {
            if (escape) { escape = false; continue; }
            if (text[j] == '\\') { escape = true; continue; }
            if (text[j] == '"') break;
        }
        if (j >= text.size()) {
            out.append(text, i, std::string::npos);
            break;
        }
        const std::string content = text.substr(i + 1, j - i - 1);
        if (content == "NaN" || content == "Infinity" || content == "-Infinity") {
            out += content;
        } else {
            out.append(text, i, j - i + 1);
        }
        i = j;
    }
    return out;
}

algebra::InterpolatorSettings interpolator_from(const json& j) {
    return j.contains("interpolator") ? algebra::InterpolatorSettings::from_json(j.at("interpolator"))
                                      : algebra::InterpolatorSettings();
}

algebra::ExtrapolatorSettings extrapolator_from(const json& j) {
    return j.contains("extrapolator") ? algebra::ExtrapolatorSettings::from_json(j.at("extrapolator"))
                                      : continuous::Signal::default_extrapolator_settings();
}

} // namespace

json signal_to_json(const continuous::Signal& signal) {
    json j;
    j["name"] = signal.name();
    j["domain"] = vector_to_json(signal.domain_values());
    j["range"] = vector_to_json(signal.range_values());
    j["interpolator"] = signal.interpolator_settings().to_json();
    j["extrapolator"] = signal.extrapolator_settings().to_json();
    return j;
}

continuous::Signal signal_from_json(const json& j) {
    require_known_keys(j, {"name", "domain", "range", "interpolator", "extrapolator"}, "Signal");
    if (!j.contains("range")) throw std::invalid_argument("Signal: missing \"range\"");

    const auto range = json_to_vector(j.at("range"));
    const auto domain = j.contains("domain") ? json_to_vector(j.at("domain")) : std::vector<double>();
    const std::string name = j.value("name", std::string());
    return continuous::Signal(to_row(range), to_row(domain), name, interpolator_from(j), extrapolator_from(j));
}

json multi_signals_to_json(const continuous::MultiSignals& signals) {
    json j;
    j["name"] = signals.name();
    j["labels"] = signals.labels();
    j["domain"] = ndarray_to_json(signals.domain());
    // Nested rows even for a single sample so the channel count survives.
    json rows = json::array();
    const auto range = signals.range();
    for (nc::uint32 r = 0; r < range.shape().rows; ++r) {
        json row = json::array();
        for (nc::uint32 c = 0; c < range.shape().cols; ++c) row.push_back(double_to_json(range(r, c)));
        rows.push_back(row);
    }
    j["range"] = rows;
    j["interpolator"] = signals.interpolator_settings().to_json();
    j["extrapolator"] = signals.extrapolator_settings().to_json();
    return j;
}

continuous::MultiSignals multi_signals_from_json(const json& j) {
    require_known_keys(j, {"name", "labels", "domain", "range", "interpolator", "extrapolator"}, "MultiSignals");
    if (!j.contains("range")) throw std::invalid_argument("MultiSignals: missing \"range\"");

    const auto& range_json = j.at("range");
    nc::NdArray<double> range;
    if (range_json.is_array() && !range_json.empty() && range_json[0].is_array()) {
        // n x c, including n == 1
        const auto rows = static_cast<nc::uint32>(range_json.size());
        const auto cols = static_cast<nc::uint32>(range_json[0].size());
        range = nc::NdArray<double>(rows, cols);
        for (nc::uint32 r = 0; r < rows; ++r) {
            const auto values = json_to_vector(range_json[r]);
            if (values.size() != cols) throw std::invalid_argument("MultiSignals: jagged \"range\"");
            for (nc::uint32 c = 0; c < cols; ++c) range(r, c) = values[c];
        }
    } else {
        range = to_row(json_to_vector(range_json));
    }

    const auto domain = j.contains("domain") ? to_row(json_to_vector(j.at("domain"))) : nc::NdArray<double>();
    std::vector<std::string> labels;
    if (j.contains("labels")) labels = j.at("labels").get<std::vector<std::string>>();
    const std::string name = j.value("name", std::string());

    if (range.shape().rows == 1 && range.shape().cols > 1 && range_json[0].is_array()) {
        // A single sample with several channels.
        std::map<double, std::vector<double>> data;
        data[domain.size() == 1 ? domain[0] : 0.0] = to_vector(range);
        return continuous::MultiSignals(data, labels, name, interpolator_from(j), extrapolator_from(j));
    }
    return continuous::MultiSignals(range, domain, labels, name, interpolator_from(j), extrapolator_from(j));
}

continuous::Signal SignalIO::load_signal(const std::string& json_path) {
    return signal_from_json(parse_json_with_specials(json_path));
}

void SignalIO::save_signal(const continuous::Signal& signal, const std::string& json_path) {
    write_json_with_specials(signal_to_json(signal), json_path);
}

continuous::MultiSignals SignalIO::load_multi_signals(const std::string& json_path) {
    return multi_signals_from_json(parse_json_with_specials(json_path));
}

void SignalIO::save_multi_signals(const continuous::MultiSignals& signals, const std::string& json_path) {
    write_json_with_specials(multi_signals_to_json(signals), json_path);
}

json parse_json_with_specials(const std::string& json_path) {
    return json::parse(sanitize_json_specials(slurp(json_path)));
}

void write_json_with_specials(const json& j, const std::string& json_path) {
    std::ofstream f(json_path);
    if (!f) throw std::runtime_error("Cannot open file for write: " + json_path);
    f << unquote_json_specials(j.dump(4));
}

} // namespace utils
} // namespace chromat
