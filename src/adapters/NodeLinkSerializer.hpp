#pragma once

#include "model/ExternalId.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace adapters {

using json = nlohmann::json;

struct NodeLinkNode {
    model::ExternalId id;
    json attributes = json::object();   // Every key except "id"
};

struct NodeLinkLink {
    model::ExternalId source;
    model::ExternalId target;
    json attributes = json::object();   // Every key except "source" and "target"
};

/**
 * In-memory form of a node-link graph document
 */
struct NodeLinkGraph {
    bool directed = false;
    bool multigraph = false;
    json graph = json::object();
    std::vector<NodeLinkNode> nodes;
    std::vector<NodeLinkLink> links;
};

/**
 * Serialization/Deserialization for node-link graph documents
 *
 * JSON format (networkx node_link_data):
 * {
 *   "directed": false,
 *   "multigraph": false,
 *   "graph": {},
 *   "nodes": [
 *     {"id": 0, "labels": ["Chemical"], "test": false, "val": false}
 *   ],
 *   "links": [
 *     {"source": 0, "target": 1, "id": 0, "labels": ["CHEMICALBINDSGENE"]}
 *   ]
 * }
 *
 * "source" and "target" hold node ids. Documents using "edges" instead of
 * "links" are accepted when reading.
 */
class NodeLinkSerializer {
public:
    // === Serialization ===

    static json toJson(const NodeLinkGraph& graph);
    static std::string toString(const NodeLinkGraph& graph, int indent = -1);

    // === Deserialization ===

    /**
     * Parse a node-link document
     * Throws MalformedSourceError if the structure is invalid
     */
    static NodeLinkGraph fromJson(const json& j);
    static NodeLinkGraph fromString(const std::string& str);

private:
    static NodeLinkNode jsonToNode(const json& j, size_t position);
    static NodeLinkLink jsonToLink(const json& j, size_t position);
};

} // namespace adapters
