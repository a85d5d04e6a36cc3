#pragma once

#include "json_values.hpp"
#include "multi_signals.hpp"
#include "signal.hpp"

#include <string>

namespace chromat {
namespace utils {

/**
 * Signal documents:
 *   {"name": "...", "domain": [...], "range": [...],
 *    "interpolator": {...}, "extrapolator": {...}}
 * MultiSignals documents add "labels" and store "range" as nested rows.
 * Missing settings take the Signal defaults; unknown keys are rejected.
 */
json signal_to_json(const continuous::Signal& signal);
continuous::Signal signal_from_json(const json& j);

json multi_signals_to_json(const continuous::MultiSignals& signals);
continuous::MultiSignals multi_signals_from_json(const json& j);

class SignalIO {
public:
    static continuous::Signal load_signal(const std::string& json_path);
    static void save_signal(const continuous::Signal& signal, const std::string& json_path);

    static continuous::MultiSignals load_multi_signals(const std::string& json_path);
    static void save_multi_signals(const continuous::MultiSignals& signals, const std::string& json_path);
};

// Parses a JSON file accepting bare NaN / Infinity / -Infinity tokens.
json parse_json_with_specials(const std::string& json_path);

// Writes j with NaN / Infinity / -Infinity as bare tokens.
void write_json_with_specials(const json& j, const std::string& json_path);

} // namespace utils
} // namespace chromat
