#pragma once

#include "adapters/GraphDatabase.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <pqxx/pqxx>

namespace postgres {

/**
 * PostgreSQL-backed graph database
 *
 * Same schema as the SQLite store (graph_nodes, graph_edges, graph_meta),
 * created on first connection. The connection is opened lazily and reused;
 * outside executeTransaction() every operation runs in its own transaction.
 */
class PostgresGraphDatabase : public adapters::GraphDatabase {
public:
    PostgresGraphDatabase() = default;

    /**
     * @param connectionString Format: "host=localhost port=5432 dbname=mydb user=user password=pass"
     */
    explicit PostgresGraphDatabase(const std::string& connectionString);

    PostgresGraphDatabase(const PostgresGraphDatabase&) = delete;
    PostgresGraphDatabase& operator=(const PostgresGraphDatabase&) = delete;

    /**
     * Set the connection string; an open connection to another server is closed
     */
    void configure(const std::string& connectionString);

    bool isConfigured() const;
    bool isConnected() const;
    std::string getConnectionString() const;

    /**
     * Throws std::runtime_error if not configured, if the connection fails or
     * if the statement fails
     */
    std::vector<adapters::Record> execute(adapters::GraphQuery query,
                                          const nlohmann::json& parameters = nlohmann::json::object()) override;

    void executeTransaction(const std::function<void(adapters::GraphDatabase&)>& work) override;

    /**
     * Close the current connection
     */
    void disconnect();

private:
    void ensureConnection();
    void createTables(pqxx::work& txn);
    std::vector<adapters::Record> run(pqxx::work& txn, adapters::GraphQuery query,
                                      const nlohmann::json& parameters);

    std::string m_connectionString;
    std::unique_ptr<pqxx::connection> m_connection;
    std::unique_ptr<pqxx::work> m_txn;
    mutable std::recursive_mutex m_mutex;
    bool m_configured = false;
};

} // namespace postgres
