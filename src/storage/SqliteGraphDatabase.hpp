#pragma once

#include "adapters/GraphDatabase.hpp"
#include <memory>
#include <string>

namespace storage {

/**
 * SQLite-backed graph database
 *
 * Nodes, edges and graph metadata live in the tables graph_nodes, graph_edges
 * and graph_meta. External ids are stored as their JSON text so integer and
 * string ids keep their type across a round trip.
 *
 * Usage:
 *   auto db = std::make_shared<SqliteGraphDatabase>("./graph.db");
 *   auto graph = bridge::Graph::fromDatabase(db);
 */
class SqliteGraphDatabase : public adapters::GraphDatabase {
public:
    /**
     * Open or create a SQLite database at the given path (":memory:" allowed)
     * Throws std::runtime_error if the file cannot be opened
     */
    explicit SqliteGraphDatabase(const std::string& dbPath);
    ~SqliteGraphDatabase() override;

    // Non-copyable
    SqliteGraphDatabase(const SqliteGraphDatabase&) = delete;
    SqliteGraphDatabase& operator=(const SqliteGraphDatabase&) = delete;

    std::vector<adapters::Record> execute(adapters::GraphQuery query,
                                          const nlohmann::json& parameters = nlohmann::json::object()) override;

    void executeTransaction(const std::function<void(adapters::GraphDatabase&)>& work) override;

    const std::string& getPath() const;

    bool inTransaction() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace storage
