#include "conversion_graph.hpp"
#include "common.hpp"

#include <algorithm>
#include <cctype>
#include <deque>
#include <set>
#include <sstream>

namespace chromat {
namespace graph {

namespace {

std::string quoted(const std::string& value) {
    return "\"" + value + "\"";
}

} // namespace

std::string normalise_node_name(const std::string& name) {
    std::string out;
    bool pending_separator = false;
    for (const char c : name) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u)) {
            if (pending_separator && !out.empty()) out.push_back('-');
            pending_separator = false;
            out.push_back(static_cast<char>(std::tolower(u)));
        } else {
            pending_separator = true;
        }
    }
    return out;
}

// -----------------------------------------------------------------------------
// ConversionContext
// -----------------------------------------------------------------------------

bool ConversionContext::has(const std::string& key) const {
    return kwargs.is_object() && kwargs.contains(key) && !kwargs.at(key).is_null();
}

std::string ConversionContext::string_value(const std::string& key, const std::string& default_value) const {
    if (!has(key)) return default_value;
    const auto& value = kwargs.at(key);
    if (!value.is_string()) throw std::invalid_argument("Keyword argument \"" + key + "\" must be a string");
    return value.get<std::string>();
}

double ConversionContext::number(const std::string& key, double default_value) const {
    return has(key) ? utils::json_to_double(kwargs.at(key)) : default_value;
}

bool ConversionContext::boolean(const std::string& key, bool default_value) const {
    if (!has(key)) return default_value;
    const auto& value = kwargs.at(key);
    if (!value.is_boolean()) throw std::invalid_argument("Keyword argument \"" + key + "\" must be a boolean");
    return value.get<bool>();
}

models::Chromaticity ConversionContext::chromaticity(const std::string& key,
                                                     const models::Chromaticity& default_value) const {
    if (!has(key)) return default_value;
    const auto& value = kwargs.at(key);
    if (value.is_string()) return models::illuminant_xy(value.get<std::string>());
    const auto xy = utils::json_to_vector(value);
    if (xy.size() != 2) {
        throw std::invalid_argument("Keyword argument \"" + key + "\" must be an illuminant name or [x, y]");
    }
    return {{xy[0], xy[1]}};
}

nc::NdArray<double> ConversionContext::array(const std::string& key) const {
    if (!has(key)) return nc::NdArray<double>();
    return utils::to_row(utils::json_to_vector(kwargs.at(key)));
}

DescribeMode parse_describe_mode(const std::string& name) {
    const std::string key = utils::to_lower(name);
    if (key == "short") return DescribeMode::Short;
    if (key == "long") return DescribeMode::Long;
    if (key == "extended") return DescribeMode::Extended;
    if (key == "dot") return DescribeMode::Dot;
    throw std::invalid_argument("Invalid describe mode \"" + name + "\", accepted values are: Short, Long, Extended, Dot");
}

// -----------------------------------------------------------------------------
// ConversionGraph
// -----------------------------------------------------------------------------

ConversionGraph::ConversionGraph(const std::vector<ConversionSpecification>& specifications) {
    for (const auto& specification : specifications) {
        if (!specification.function) {
            throw std::invalid_argument("Conversion " + quoted(specification.name) + " has no function");
        }
        const std::string source = normalise_node_name(specification.source);
        const std::string target = normalise_node_name(specification.target);
        if (source.empty() || target.empty()) {
            throw std::invalid_argument("Conversion " + quoted(specification.name) + " has an empty node name");
        }
        for (const auto& node : {std::make_pair(source, specification.source),
                                 std::make_pair(target, specification.target)}) {
            if (m_display_names.emplace(node.first, node.second).second) m_nodes.push_back(node.first);
        }
        m_adjacency[source].push_back(m_edges.size());
        m_edges.push_back(specification);
    }
}

const ConversionGraph& ConversionGraph::default_graph() {
    static const ConversionGraph instance(conversion_specifications());
    return instance;
}

bool ConversionGraph::has_node(const std::string& name) const {
    return m_display_names.count(normalise_node_name(name)) != 0;
}

std::vector<std::string> ConversionGraph::nodes() const {
    std::vector<std::string> names;
    names.reserve(m_nodes.size());
    for (const auto& node : m_nodes) names.push_back(m_display_names.at(node));
    return names;
}

std::string ConversionGraph::resolve_node(const std::string& name) const {
    const std::string node = normalise_node_name(name);
    if (m_display_names.count(node) == 0) {
        throw GraphError(quoted(name) + " is not a node of the conversion graph");
    }
    return node;
}

std::string ConversionGraph::display_name(const std::string& node) const {
    return m_display_names.at(node);
}

std::vector<const ConversionSpecification*> ConversionGraph::conversion_path(const std::string& source,
                                                                             const std::string& target) const {
    const std::string from = resolve_node(source);
    const std::string to = resolve_node(target);
    if (from == to) return {};

    std::map<std::string, std::size_t> parent_edge;
    std::set<std::string> visited{from};
    std::deque<std::string> queue{from};

    while (!queue.empty()) {
        const std::string node = queue.front();
        queue.pop_front();

        const auto it = m_adjacency.find(node);
        if (it == m_adjacency.end()) continue;

        for (const std::size_t index : it->second) {
            const std::string next = normalise_node_name(m_edges[index].target);
            if (!visited.insert(next).second) continue;
            parent_edge[next] = index;

            if (next == to) {
                std::vector<const ConversionSpecification*> path;
                for (std::string cursor = to; cursor != from;) {
                    const auto& edge = m_edges[parent_edge.at(cursor)];
                    path.push_back(&edge);
                    cursor = normalise_node_name(edge.source);
                }
                return std::vector<const ConversionSpecification*>(path.rbegin(), path.rend());
            }
            queue.push_back(next);
        }
    }
    throw GraphError("No conversion path from " + quoted(display_name(from)) + " to " + quoted(display_name(to)));
}

json ConversionGraph::stage_kwargs(const ConversionSpecification& edge, const json& kwargs) {
    json filtered = json::object();
    for (const auto& parameter : edge.parameter_names) {
        if (kwargs.contains(parameter)) filtered[parameter] = kwargs.at(parameter);
    }
    if (kwargs.contains(edge.name) && kwargs.at(edge.name).is_object()) {
        for (const auto& item : kwargs.at(edge.name).items()) filtered[item.key()] = item.value();
    }
    return filtered;
}

nc::NdArray<double> ConversionGraph::convert(const nc::NdArray<double>& value,
                                             const std::string& source,
                                             const std::string& target,
                                             const json& kwargs,
                                             config::ScaleMode scale) const {
    if (!kwargs.is_null() && !kwargs.is_object()) {
        throw std::invalid_argument("Conversion keyword arguments must be a JSON object");
    }
    const json arguments = kwargs.is_null() ? json::object() : kwargs;
    const auto path = conversion_path(source, target);

    std::set<std::string> used;
    nc::NdArray<double> result = value.copy();
    for (const auto* edge : path) {
        ConversionContext context;
        context.kwargs = stage_kwargs(*edge, arguments);
        context.scale = scale;
        for (const auto& item : arguments.items()) {
            const auto& names = edge->parameter_names;
            if (item.key() == edge->name || std::find(names.begin(), names.end(), item.key()) != names.end()) {
                used.insert(item.key());
            }
        }
        result = edge->function(result, context);
    }

    std::vector<std::string> unused;
    for (const auto& item : arguments.items()) {
        if (used.count(item.key()) == 0) unused.push_back(item.key());
    }
    if (!unused.empty()) {
        utils::runtime_warning("Graph", "Unused keyword arguments converting " + quoted(source) + " to " +
                                            quoted(target) + ": " + utils::join(unused, ", "));
    }
    return result;
}

std::string ConversionGraph::describe_conversion_path(const std::string& source,
                                                      const std::string& target,
                                                      DescribeMode mode,
                                                      const json& kwargs) const {
    const json arguments = kwargs.is_object() ? kwargs : json::object();
    const auto path = conversion_path(source, target);
    const std::string from = display_name(resolve_node(source));
    const std::string to = display_name(resolve_node(target));

    std::ostringstream out;
    if (mode == DescribeMode::Dot) {
        out << "digraph conversion_path {\n";
        if (path.empty()) out << "    " << quoted(from) << ";\n";
        for (const auto* edge : path) {
            out << "    " << quoted(edge->source) << " -> " << quoted(edge->target)
                << " [label=" << quoted(edge->name) << "];\n";
        }
        out << "}";
        return out.str();
    }

    out << from;
    for (const auto* edge : path) out << " --> " << edge->target;
    if (mode == DescribeMode::Short) return out.str();

    std::size_t stage = 1;
    for (const auto* edge : path) {
        out << "\n[" << stage++ << "] " << edge->name << ": " << edge->source << " --> " << edge->target;
        out << "\n    arguments: " << stage_kwargs(*edge, arguments).dump();
        if (mode == DescribeMode::Extended) {
            out << "\n    parameters: "
                << (edge->parameter_names.empty() ? std::string("(none)") : utils::join(edge->parameter_names, ", "));
        }
    }
    if (path.empty()) out << "\n(identity, " << to << ")";
    return out.str();
}

nc::NdArray<double> convert(const nc::NdArray<double>& value,
                            const std::string& source,
                            const std::string& target,
                            const json& kwargs,
                            config::ScaleMode scale) {
    return ConversionGraph::default_graph().convert(value, source, target, kwargs, scale);
}

std::string describe_conversion_path(const std::string& source,
                                     const std::string& target,
                                     DescribeMode mode,
                                     const json& kwargs) {
    return ConversionGraph::default_graph().describe_conversion_path(source, target, mode, kwargs);
}

} // namespace graph
} // namespace chromat
