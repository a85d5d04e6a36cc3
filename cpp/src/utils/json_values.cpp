#include "json_values.hpp"
#include "common.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace chromat {
namespace utils {

double json_to_double(const json& j) {
    if (j.is_null()) return std::numeric_limits<double>::quiet_NaN();
    if (j.is_string()) {
        const std::string s = j.get<std::string>();
        if (s == "NaN" || s == "nan") return std::numeric_limits<double>::quiet_NaN();
        if (s == "Infinity" || s == "inf") return std::numeric_limits<double>::infinity();
        if (s == "-Infinity" || s == "-inf") return -std::numeric_limits<double>::infinity();
        throw std::invalid_argument("Unknown string value: " + s);
    }
    if (!j.is_number()) {
        throw std::invalid_argument("Expected a number, got: " + j.dump());
    }
    return j.get<double>();
}

json double_to_json(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return std::signbit(value) ? "-Infinity" : "Infinity";
    return value;
}

json ndarray_to_json(const nc::NdArray<double>& a) {
    json j = json::array();
    if (a.size() == 0) return j;
    if (a.shape().rows == 1) {
        for (nc::uint32 k = 0; k < a.shape().cols; ++k) j.push_back(double_to_json(a(0, k)));
        return j;
    }
    for (nc::uint32 i = 0; i < a.shape().rows; ++i) {
        json row = json::array();
        for (nc::uint32 k = 0; k < a.shape().cols; ++k) row.push_back(double_to_json(a(i, k)));
        j.push_back(row);
    }
    return j;
}

std::vector<double> json_to_vector(const json& j) {
    if (!j.is_array()) throw std::invalid_argument("Expected array, got: " + j.dump());
    std::vector<double> out;
    out.reserve(j.size());
    for (const auto& value : j) out.push_back(json_to_double(value));
    return out;
}

json vector_to_json(const std::vector<double>& values) {
    json j = json::array();
    for (double value : values) j.push_back(double_to_json(value));
    return j;
}

void require_known_keys(const json& j, const std::vector<std::string>& accepted, const std::string& what) {
    if (!j.is_object()) throw std::invalid_argument(what + ": expected a JSON object, got: " + j.dump());
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (std::find(accepted.begin(), accepted.end(), it.key()) == accepted.end()) {
            throw std::invalid_argument(what + ": unknown key \"" + it.key() +
                                        "\", accepted keys are: " + join(accepted, ", "));
        }
    }
}

} // namespace utils
} // namespace chromat
