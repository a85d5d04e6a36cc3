#pragma once

#include "NumCpp.hpp"
#include "colour_models.hpp"
#include "config.hpp"
#include "json_values.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace chromat {
namespace graph {

using utils::json;

// Raised when a node is unknown or a target cannot be reached.
class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Lower case, runs of non alphanumeric characters collapsed to "-",
// e.g. "CIE XYZ" -> "cie-xyz".
std::string normalise_node_name(const std::string& name);

/**
 * @brief Arguments handed to one conversion stage.
 *
 * kwargs only holds the keys the stage declares, plus the object stored
 * under the stage's function name.
 */
struct ConversionContext {
    json kwargs = json::object();
    config::ScaleMode scale = config::ScaleMode::One;

    bool has(const std::string& key) const;
    std::string string_value(const std::string& key, const std::string& default_value) const;
    double number(const std::string& key, double default_value) const;
    bool boolean(const std::string& key, bool default_value) const;
    // Illuminant name ("D65") or [x, y].
    models::Chromaticity chromaticity(const std::string& key, const models::Chromaticity& default_value) const;
    // Flat array, empty when the key is absent.
    nc::NdArray<double> array(const std::string& key) const;
};

using ConversionFunction = std::function<nc::NdArray<double>(const nc::NdArray<double>&, const ConversionContext&)>;

struct ConversionSpecification {
    std::string source;
    std::string target;
    std::string name;
    ConversionFunction function;
    std::vector<std::string> parameter_names;
};

enum class DescribeMode { Short, Long, Extended, Dot };

DescribeMode parse_describe_mode(const std::string& name);

/**
 * @brief Directed graph of conversions between colour representations.
 *
 * Built once from a list of specifications and immutable afterwards.
 * Paths are resolved breadth-first: fewest stages, ties broken by
 * registration order.
 */
class ConversionGraph {
public:
    explicit ConversionGraph(const std::vector<ConversionSpecification>& specifications);

    // Graph of conversion_specifications(), built on first use.
    static const ConversionGraph& default_graph();

    bool has_node(const std::string& name) const;
    // Display names in registration order.
    std::vector<std::string> nodes() const;
    const std::vector<ConversionSpecification>& edges() const { return m_edges; }

    // Empty when source and target are the same node.
    std::vector<const ConversionSpecification*> conversion_path(const std::string& source,
                                                                const std::string& target) const;

    nc::NdArray<double> convert(const nc::NdArray<double>& value,
                                const std::string& source,
                                const std::string& target,
                                const json& kwargs = json::object(),
                                config::ScaleMode scale = config::ScaleMode::One) const;

    std::string describe_conversion_path(const std::string& source,
                                         const std::string& target,
                                         DescribeMode mode = DescribeMode::Short,
                                         const json& kwargs = json::object()) const;

private:
    std::string resolve_node(const std::string& name) const;
    std::string display_name(const std::string& node) const;
    static json stage_kwargs(const ConversionSpecification& edge, const json& kwargs);

    std::vector<std::string> m_nodes;
    std::map<std::string, std::string> m_display_names;
    std::vector<ConversionSpecification> m_edges;
    std::map<std::string, std::vector<std::size_t>> m_adjacency;
};

// The catalogue of the default graph.
const std::vector<ConversionSpecification>& conversion_specifications();

nc::NdArray<double> convert(const nc::NdArray<double>& value,
                            const std::string& source,
                            const std::string& target,
                            const json& kwargs = json::object(),
                            config::ScaleMode scale = config::ScaleMode::One);

std::string describe_conversion_path(const std::string& source,
                                     const std::string& target,
                                     DescribeMode mode = DescribeMode::Short,
                                     const json& kwargs = json::object());

} // namespace graph
} // namespace chromat
