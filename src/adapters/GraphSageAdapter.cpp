#include "adapters/GraphSageAdapter.hpp"
#include "adapters/AdapterSupport.hpp"
#include "model/Errors.hpp"
#include "util/Logger.hpp"

namespace adapters {

using model::MalformedSourceError;

GraphSageAdapter::GraphSageAdapter(GraphSageDataset dataset, WalkOrderPolicy policy)
    : m_dataset(std::move(dataset)), m_policy(policy) {}

std::unique_ptr<GraphSageAdapter> GraphSageAdapter::open(const std::string& prefix, const std::string& directory,
                                                         WalkOrderPolicy policy) {
    return std::make_unique<GraphSageAdapter>(GraphSageDataset::read(prefix, directory, policy), policy);
}

void GraphSageAdapter::save(const std::string& prefix, const std::string& directory) const {
    m_dataset.write(prefix, directory);
}

// =============================================================================
// Load
// =============================================================================

model::GraphModel GraphSageAdapter::load() {
    const auto& nodes = m_dataset.graph.nodes;
    const size_t n = nodes.size();

    if (m_dataset.idMap.size() != n) {
        throw MalformedSourceError("GraphSAGE id map has " + std::to_string(m_dataset.idMap.size()) +
                                   " entries but the graph has " + std::to_string(n) + " nodes");
    }

    // Order graph nodes by their dense index; the id map must be a bijection onto [0, n)
    std::vector<const NodeLinkNode*> ordered(n, nullptr);
    for (const auto& node : nodes) {
        const std::string key = model::toString(node.id);
        auto it = m_dataset.idMap.find(key);
        if (it == m_dataset.idMap.end()) {
            throw MalformedSourceError("Node " + key + " has no entry in the GraphSAGE id map");
        }
        if (it->second >= n) {
            throw MalformedSourceError("Id map assigns index " + std::to_string(it->second) + " to node " + key +
                                       ", outside [0, " + std::to_string(n) + ")");
        }
        if (ordered[it->second]) {
            throw MalformedSourceError("Id map assigns index " + std::to_string(it->second) + " twice");
        }
        ordered[it->second] = &node;
    }

    if (m_dataset.classMap) {
        for (const auto& [key, membership] : *m_dataset.classMap) {
            if (m_dataset.idMap.find(key) == m_dataset.idMap.end()) {
                throw MalformedSourceError("Class map entry '" + key + "' does not name a graph node");
            }
        }
    }

    std::vector<model::NodeSpec> nodeSpecs;
    nodeSpecs.reserve(n);
    for (const NodeLinkNode* node : ordered) {
        const std::string key = model::toString(node->id);
        model::NodeSpec spec;
        spec.id = node->id;
        spec.properties = node->attributes;
        spec.labels = labelsFromJson(takeAttribute(spec.properties, kLabelsAttribute), "node " + key);
        if (m_dataset.classMap) {
            auto it = m_dataset.classMap->find(key);
            if (it != m_dataset.classMap->end()) {
                spec.membership = it->second;
            }
        }
        nodeSpecs.push_back(std::move(spec));
    }

    model::GraphModel graph;
    graph.setAttributes(model::GraphAttributes{m_dataset.graph.directed, m_dataset.graph.multigraph,
                                               m_dataset.graph.graph});
    graph.addNodes(nodeSpecs);

    std::vector<model::EdgeSpec> edgeSpecs;
    edgeSpecs.reserve(m_dataset.graph.links.size());
    const auto& nodeIds = graph.idMap().nodes();
    for (size_t i = 0; i < m_dataset.graph.links.size(); ++i) {
        const auto& link = m_dataset.graph.links[i];
        if (!nodeIds.contains(link.source) || !nodeIds.contains(link.target)) {
            throw MalformedSourceError("Link " + std::to_string(i) + " references a node missing from the graph");
        }

        model::EdgeSpec spec;
        spec.source = link.source;
        spec.target = link.target;
        spec.properties = link.attributes;
        json id = takeAttribute(spec.properties, kIdAttribute);
        try {
            spec.id = id.is_null() ? model::ExternalId(static_cast<int64_t>(i)) : model::idFromJson(id);
        } catch (const std::invalid_argument& e) {
            throw MalformedSourceError("Link " + std::to_string(i) + ": " + e.what());
        }
        spec.labels = labelsFromJson(takeAttribute(spec.properties, kLabelsAttribute),
                                     "link " + std::to_string(i));
        edgeSpecs.push_back(std::move(spec));
    }
    graph.addEdges(edgeSpecs);

    if (m_dataset.features) {
        if (m_dataset.features->rows() != n) {
            throw MalformedSourceError("Feature array has " + std::to_string(m_dataset.features->rows()) +
                                       " rows but the graph has " + std::to_string(n) + " nodes");
        }
        graph.setNodeFeatures(splitNodeFeatures(graph, *m_dataset.features));
    }

    if (m_dataset.walks) {
        if (m_policy == WalkOrderPolicy::Strict) {
            for (const auto& [first, second] : *m_dataset.walks) {
                if (first >= n || second >= n) {
                    throw MalformedSourceError("Walk pair (" + std::to_string(first) + ", " +
                                               std::to_string(second) + ") is outside [0, " +
                                               std::to_string(n) + ")");
                }
            }
        }
        graph.setWalks(m_dataset.walks);
    }

    LOG_INFO("GraphSAGE: loaded " + util::Logger::formatCount(graph.nodeCount(), "node") + ", " +
             util::Logger::formatCount(graph.edgeCount(), "edge"));
    return graph;
}

// =============================================================================
// Serialize
// =============================================================================

void GraphSageAdapter::serialize(const model::GraphModel& graph, const SerializeOptions& options) {
    checkFeatureLayout(graph, format(), options);

    GraphSageDataset dataset;
    const auto& attributes = graph.attributes();
    dataset.graph.directed = attributes.directed;
    dataset.graph.multigraph = attributes.multigraph;
    dataset.graph.graph = attributes.attributes;

    bool anyMembership = false;
    std::map<std::string, std::vector<int>> classMap;

    dataset.graph.nodes.reserve(graph.nodeCount());
    for (const auto& node : graph.getNodes()) {
        NodeLinkNode out;
        out.id = node.externalId;
        out.attributes = node.properties;
        if (!node.labels.empty()) {
            out.attributes[kLabelsAttribute] = labelsToJson(node.labels);
        }
        dataset.graph.nodes.push_back(std::move(out));

        const std::string key = model::toString(node.externalId);
        if (!dataset.idMap.emplace(key, node.index).second) {
            throw model::DuplicateIdentifierError("Node ids collide in text form: " + key);
        }
        if (!node.membership.empty()) {
            anyMembership = true;
            classMap.emplace(key, node.membership);
        }
    }
    if (anyMembership) {
        dataset.classMap = std::move(classMap);
    }

    dataset.graph.links.reserve(graph.edgeCount());
    for (const auto& edge : graph.getEdges()) {
        NodeLinkLink out;
        out.source = graph.node(edge.source).externalId;
        out.target = graph.node(edge.target).externalId;
        out.attributes = edge.properties;
        out.attributes[kIdAttribute] = model::idToJson(edge.externalId);
        if (!edge.labels.empty()) {
            out.attributes[kLabelsAttribute] = labelsToJson(edge.labels);
        }
        dataset.graph.links.push_back(std::move(out));
    }

    dataset.features = singleNodeMatrix(graph, options);
    dataset.walks = graph.walks();

    m_dataset = std::move(dataset);
    LOG_DEBUG("GraphSAGE: serialized " + util::Logger::formatCount(graph.nodeCount(), "node") +
              (m_dataset.features ? " with features" : " without features"));
}

} // namespace adapters
