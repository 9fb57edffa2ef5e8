#include "adapters/DatabaseAdapter.hpp"
#include "adapters/AdapterSupport.hpp"
#include "model/Errors.hpp"
#include "util/Logger.hpp"
#include <stdexcept>

namespace adapters {

using model::MalformedSourceError;

std::string graphQueryToString(GraphQuery query) {
    switch (query) {
        case GraphQuery::FetchMetadata: return "fetch_metadata";
        case GraphQuery::FetchNodes:    return "fetch_nodes";
        case GraphQuery::FetchEdges:    return "fetch_edges";
        case GraphQuery::Clear:         return "clear";
        case GraphQuery::StoreMetadata: return "store_metadata";
        case GraphQuery::InsertNode:    return "insert_node";
        case GraphQuery::InsertEdge:    return "insert_edge";
    }
    return "unknown";
}

namespace {

model::ExternalId requireId(const Record& record, const char* field, const std::string& context) {
    if (!record.contains(field)) {
        throw MalformedSourceError(context + " record has no '" + field + "'");
    }
    try {
        return model::idFromJson(record[field]);
    } catch (const std::invalid_argument& e) {
        throw MalformedSourceError(context + " record: " + e.what());
    }
}

json recordProperties(const Record& record, const std::string& context) {
    if (!record.contains("properties") || record["properties"].is_null()) {
        return json::object();
    }
    if (!record["properties"].is_object()) {
        throw MalformedSourceError(context + " record: 'properties' must be an object");
    }
    return record["properties"];
}

} // anonymous namespace

DatabaseAdapter::DatabaseAdapter(std::shared_ptr<GraphDatabase> database) : m_database(std::move(database)) {
    if (!m_database) {
        throw std::invalid_argument("DatabaseAdapter needs a database collaborator");
    }
}

// =============================================================================
// Record conversion
// =============================================================================

Record DatabaseAdapter::nodeToRecord(const model::GraphModel& graph, const model::Node& node) {
    Record record;
    record["id"] = model::idToJson(node.externalId);
    record["labels"] = labelsToJson(node.labels);
    record["properties"] = node.properties;
    if (auto row = graph.nodeFeatureRow(node.index)) {
        record["properties"][kFeaturesProperty] = *row;
    }
    if (!node.membership.empty()) {
        record["properties"][kMembershipProperty] = node.membership;
    }
    return record;
}

Record DatabaseAdapter::edgeToRecord(const model::GraphModel& graph, const model::Edge& edge) {
    Record record;
    record["id"] = model::idToJson(edge.externalId);
    record["source"] = model::idToJson(graph.node(edge.source).externalId);
    record["target"] = model::idToJson(graph.node(edge.target).externalId);
    record["labels"] = labelsToJson(edge.labels);
    record["properties"] = edge.properties;
    if (auto row = graph.edgeFeatureRow(edge.index)) {
        record["properties"][kFeaturesProperty] = *row;
    }
    return record;
}

model::NodeSpec DatabaseAdapter::recordToNode(const Record& record) {
    if (!record.is_object()) {
        throw MalformedSourceError("Node record must be a JSON object");
    }
    model::NodeSpec spec;
    spec.id = requireId(record, "id", "Node");
    const std::string context = "node " + model::toString(spec.id);
    spec.labels = labelsFromJson(record.value("labels", json()), context);
    spec.properties = recordProperties(record, context);

    json features = takeAttribute(spec.properties, kFeaturesProperty);
    if (!features.is_null()) {
        spec.features = numbersFromJson(features, context);
    }
    json membership = takeAttribute(spec.properties, kMembershipProperty);
    if (!membership.is_null()) {
        spec.membership = membershipFromJson(membership, context);
    }
    return spec;
}

model::EdgeSpec DatabaseAdapter::recordToEdge(const Record& record) {
    if (!record.is_object()) {
        throw MalformedSourceError("Edge record must be a JSON object");
    }
    model::EdgeSpec spec;
    spec.id = requireId(record, "id", "Edge");
    const std::string context = "edge " + model::toString(spec.id);
    spec.source = requireId(record, "source", context);
    spec.target = requireId(record, "target", context);
    spec.labels = labelsFromJson(record.value("labels", json()), context);
    spec.properties = recordProperties(record, context);

    json features = takeAttribute(spec.properties, kFeaturesProperty);
    if (!features.is_null()) {
        spec.features = numbersFromJson(features, context);
    }
    return spec;
}

// =============================================================================
// Load / Serialize
// =============================================================================

model::GraphModel DatabaseAdapter::load() {
    model::GraphModel graph;

    auto metadata = m_database->execute(GraphQuery::FetchMetadata);
    if (!metadata.empty()) {
        const Record& meta = metadata.front();
        model::GraphAttributes attributes;
        attributes.directed = meta.value("directed", false);
        attributes.multigraph = meta.value("multigraph", false);
        if (meta.contains("attributes") && meta["attributes"].is_object()) {
            attributes.attributes = meta["attributes"];
        }
        graph.setAttributes(std::move(attributes));
    }

    auto nodeRecords = m_database->execute(GraphQuery::FetchNodes);
    std::vector<model::NodeSpec> nodeSpecs;
    nodeSpecs.reserve(nodeRecords.size());
    for (const auto& record : nodeRecords) {
        nodeSpecs.push_back(recordToNode(record));
    }
    graph.addNodes(nodeSpecs);

    auto edgeRecords = m_database->execute(GraphQuery::FetchEdges);
    std::vector<model::EdgeSpec> edgeSpecs;
    edgeSpecs.reserve(edgeRecords.size());
    for (const auto& record : edgeRecords) {
        edgeSpecs.push_back(recordToEdge(record));
    }
    graph.addEdges(edgeSpecs);

    LOG_INFO("Database: loaded " + util::Logger::formatCount(graph.nodeCount(), "node") + ", " +
             util::Logger::formatCount(graph.edgeCount(), "edge"));
    return graph;
}

void DatabaseAdapter::serialize(const model::GraphModel& graph, const SerializeOptions& options) {
    checkFeatureLayout(graph, format(), options);

    json metadata;
    metadata["directed"] = graph.attributes().directed;
    metadata["multigraph"] = graph.attributes().multigraph;
    metadata["attributes"] = graph.attributes().attributes;

    std::vector<Record> nodeRecords;
    nodeRecords.reserve(graph.nodeCount());
    for (const auto& node : graph.getNodes()) {
        nodeRecords.push_back(nodeToRecord(graph, node));
    }
    std::vector<Record> edgeRecords;
    edgeRecords.reserve(graph.edgeCount());
    for (const auto& edge : graph.getEdges()) {
        edgeRecords.push_back(edgeToRecord(graph, edge));
    }

    m_database->executeTransaction([&](GraphDatabase& db) {
        db.execute(GraphQuery::Clear);
        db.execute(GraphQuery::StoreMetadata, metadata);
        for (const auto& record : nodeRecords) {
            db.execute(GraphQuery::InsertNode, record);
        }
        for (const auto& record : edgeRecords) {
            db.execute(GraphQuery::InsertEdge, record);
        }
    });

    LOG_INFO("Database: stored " + util::Logger::formatCount(nodeRecords.size(), "node") + ", " +
             util::Logger::formatCount(edgeRecords.size(), "edge"));
}

} // namespace adapters
