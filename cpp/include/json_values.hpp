#pragma once

#include "NumCpp.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace chromat {
namespace utils {

using json = nlohmann::json;

// Numbers, null (NaN) and the "NaN", "Infinity", "-Infinity" strings.
double json_to_double(const json& j);
json double_to_json(double value);

// Rows with a single row are written flat.
json ndarray_to_json(const nc::NdArray<double>& a);

std::vector<double> json_to_vector(const json& j);
json vector_to_json(const std::vector<double>& values);

// Throws std::invalid_argument when j holds a key outside accepted.
void require_known_keys(const json& j, const std::vector<std::string>& accepted, const std::string& what);

} // namespace utils
} // namespace chromat
