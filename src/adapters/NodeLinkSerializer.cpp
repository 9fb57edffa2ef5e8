#include "adapters/NodeLinkSerializer.hpp"
#include "model/Errors.hpp"
#include <stdexcept>

namespace adapters {

using model::MalformedSourceError;

// =============================================================================
// Serialization
// =============================================================================

json NodeLinkSerializer::toJson(const NodeLinkGraph& graph) {
    json result;
    result["directed"] = graph.directed;
    result["multigraph"] = graph.multigraph;
    result["graph"] = graph.graph.is_null() ? json::object() : graph.graph;

    json nodesArray = json::array();
    for (const auto& node : graph.nodes) {
        json n = node.attributes.is_object() ? node.attributes : json::object();
        n["id"] = model::idToJson(node.id);
        nodesArray.push_back(std::move(n));
    }
    result["nodes"] = std::move(nodesArray);

    json linksArray = json::array();
    for (const auto& link : graph.links) {
        json l = link.attributes.is_object() ? link.attributes : json::object();
        l["source"] = model::idToJson(link.source);
        l["target"] = model::idToJson(link.target);
        linksArray.push_back(std::move(l));
    }
    result["links"] = std::move(linksArray);

    return result;
}

std::string NodeLinkSerializer::toString(const NodeLinkGraph& graph, int indent) {
    return toJson(graph).dump(indent);
}

// =============================================================================
// Deserialization
// =============================================================================

NodeLinkGraph NodeLinkSerializer::fromJson(const json& j) {
    if (!j.is_object()) {
        throw MalformedSourceError("Node-link document must be a JSON object");
    }
    if (!j.contains("nodes") || !j["nodes"].is_array()) {
        throw MalformedSourceError("Node-link document has no 'nodes' array");
    }

    for (const char* flag : {"directed", "multigraph"}) {
        if (j.contains(flag) && !j[flag].is_boolean()) {
            throw MalformedSourceError(std::string("Node-link '") + flag + "' must be a boolean");
        }
    }

    NodeLinkGraph graph;
    graph.directed = j.value("directed", false);
    graph.multigraph = j.value("multigraph", false);
    if (j.contains("graph") && j["graph"].is_object()) {
        graph.graph = j["graph"];
    }

    const auto& nodes = j["nodes"];
    graph.nodes.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        graph.nodes.push_back(jsonToNode(nodes[i], i));
    }

    const char* linksKey = j.contains("links") ? "links" : (j.contains("edges") ? "edges" : nullptr);
    if (linksKey) {
        const auto& links = j[linksKey];
        if (!links.is_array()) {
            throw MalformedSourceError(std::string("Node-link '") + linksKey + "' must be an array");
        }
        graph.links.reserve(links.size());
        for (size_t i = 0; i < links.size(); ++i) {
            graph.links.push_back(jsonToLink(links[i], i));
        }
    }

    return graph;
}

NodeLinkGraph NodeLinkSerializer::fromString(const std::string& str) {
    json j;
    try {
        j = json::parse(str);
    } catch (const json::parse_error& e) {
        throw MalformedSourceError("Invalid node-link JSON: " + std::string(e.what()));
    }
    return fromJson(j);
}

// =============================================================================
// Helpers
// =============================================================================

NodeLinkNode NodeLinkSerializer::jsonToNode(const json& j, size_t position) {
    if (!j.is_object() || !j.contains("id")) {
        throw MalformedSourceError("Invalid node at position " + std::to_string(position) + ": missing 'id'");
    }

    NodeLinkNode node;
    try {
        node.id = model::idFromJson(j["id"]);
    } catch (const std::invalid_argument& e) {
        throw MalformedSourceError("Invalid node at position " + std::to_string(position) + ": " + e.what());
    }
    node.attributes = j;
    node.attributes.erase("id");
    return node;
}

NodeLinkLink NodeLinkSerializer::jsonToLink(const json& j, size_t position) {
    if (!j.is_object() || !j.contains("source") || !j.contains("target")) {
        throw MalformedSourceError("Invalid link at position " + std::to_string(position) +
                                   ": missing 'source' or 'target'");
    }

    NodeLinkLink link;
    try {
        link.source = model::idFromJson(j["source"]);
        link.target = model::idFromJson(j["target"]);
    } catch (const std::invalid_argument& e) {
        throw MalformedSourceError("Invalid link at position " + std::to_string(position) + ": " + e.what());
    }
    link.attributes = j;
    link.attributes.erase("source");
    link.attributes.erase("target");
    return link;
}

} // namespace adapters
