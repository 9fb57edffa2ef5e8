#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace adapters {

/**
 * Operations the conversion core asks of a graph database
 *
 * The collaborator owns the query language: each operation maps to whatever
 * statement its backend needs.
 */
enum class GraphQuery {
    FetchMetadata,    // -> 0 or 1 record {directed, multigraph, attributes}
    FetchNodes,       // -> records {id, labels, properties} in insertion order
    FetchEdges,       // -> records {id, source, target, labels, properties} in insertion order
    Clear,            // Remove every node, edge and the metadata
    StoreMetadata,    // parameters: {directed, multigraph, attributes}
    InsertNode,       // parameters: {id, labels, properties}
    InsertEdge        // parameters: {id, source, target, labels, properties}
};

std::string graphQueryToString(GraphQuery query);

/**
 * A database row as a JSON object; ids are JSON numbers or strings
 */
using Record = nlohmann::json;

/**
 * Query and transaction execution capability of a graph database
 */
class GraphDatabase {
public:
    virtual ~GraphDatabase() = default;

    /**
     * Run one operation
     * Throws std::runtime_error with the driver message on failure
     */
    virtual std::vector<Record> execute(GraphQuery query,
                                        const nlohmann::json& parameters = nlohmann::json::object()) = 0;

    /**
     * Run work inside one transaction: committed if work returns,
     * rolled back (and the exception rethrown) if it throws
     */
    virtual void executeTransaction(const std::function<void(GraphDatabase&)>& work) = 0;
};

} // namespace adapters
