#include "postgres/PostgresGraphDatabase.hpp"
#include "util/Logger.hpp"
#include <stdexcept>

namespace postgres {

using json = nlohmann::json;
using adapters::GraphQuery;
using adapters::Record;

namespace {

json parseColumn(const pqxx::field& field, const char* column) {
    if (field.is_null()) {
        return json();
    }
    try {
        return json::parse(field.c_str());
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Corrupt '") + column + "' column: " + e.what());
    }
}

std::string idText(const json& parameters, const char* field) {
    if (!parameters.contains(field)) {
        throw std::runtime_error(std::string("Missing record field '") + field + "'");
    }
    return parameters[field].dump();
}

} // anonymous namespace

PostgresGraphDatabase::PostgresGraphDatabase(const std::string& connectionString) {
    configure(connectionString);
}

void PostgresGraphDatabase::configure(const std::string& connectionString) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (m_txn) {
        throw std::logic_error("Cannot reconfigure PostgreSQL connection inside a transaction");
    }
    if (m_connectionString != connectionString) {
        m_connection.reset();
    }

    m_connectionString = connectionString;
    m_configured = true;

    LOG_INFO("PostgreSQL graph database configured");
}

bool PostgresGraphDatabase::isConfigured() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_configured;
}

bool PostgresGraphDatabase::isConnected() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_connection && m_connection->is_open();
}

std::string PostgresGraphDatabase::getConnectionString() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_connectionString;
}

void PostgresGraphDatabase::ensureConnection() {
    if (!m_configured) {
        throw std::runtime_error("PostgresGraphDatabase not configured. Call configure() first.");
    }

    if (!m_connection || !m_connection->is_open()) {
        LOG_DEBUG("PostgreSQL: creating new connection...");
        m_connection = std::make_unique<pqxx::connection>(m_connectionString);

        if (!m_connection->is_open()) {
            throw std::runtime_error("Failed to open PostgreSQL connection");
        }

        pqxx::work txn(*m_connection);
        createTables(txn);
        txn.commit();

        LOG_INFO("PostgreSQL: connection established");
    }
}

void PostgresGraphDatabase::createTables(pqxx::work& txn) {
    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS graph_nodes (
            seq BIGSERIAL PRIMARY KEY,
            id TEXT UNIQUE NOT NULL,
            labels TEXT NOT NULL,
            properties TEXT NOT NULL
        )
    )");
    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS graph_edges (
            seq BIGSERIAL PRIMARY KEY,
            id TEXT UNIQUE NOT NULL,
            source TEXT NOT NULL,
            target TEXT NOT NULL,
            labels TEXT NOT NULL,
            properties TEXT NOT NULL
        )
    )");
    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS graph_meta (
            key INTEGER PRIMARY KEY CHECK (key = 0),
            directed BOOLEAN NOT NULL,
            multigraph BOOLEAN NOT NULL,
            attributes TEXT NOT NULL
        )
    )");
}

std::vector<Record> PostgresGraphDatabase::run(pqxx::work& txn, GraphQuery query, const json& parameters) {
    std::vector<Record> records;

    switch (query) {
        case GraphQuery::FetchMetadata: {
            pqxx::result result = txn.exec("SELECT directed, multigraph, attributes FROM graph_meta WHERE key = 0");
            for (const auto& row : result) {
                Record record;
                record["directed"] = row[0].as<bool>();
                record["multigraph"] = row[1].as<bool>();
                record["attributes"] = parseColumn(row[2], "attributes");
                records.push_back(std::move(record));
            }
            break;
        }
        case GraphQuery::FetchNodes: {
            pqxx::result result = txn.exec("SELECT id, labels, properties FROM graph_nodes ORDER BY seq");
            records.reserve(static_cast<size_t>(result.size()));
            for (const auto& row : result) {
                Record record;
                record["id"] = parseColumn(row[0], "id");
                record["labels"] = parseColumn(row[1], "labels");
                record["properties"] = parseColumn(row[2], "properties");
                records.push_back(std::move(record));
            }
            break;
        }
        case GraphQuery::FetchEdges: {
            pqxx::result result = txn.exec(
                "SELECT id, source, target, labels, properties FROM graph_edges ORDER BY seq");
            records.reserve(static_cast<size_t>(result.size()));
            for (const auto& row : result) {
                Record record;
                record["id"] = parseColumn(row[0], "id");
                record["source"] = parseColumn(row[1], "source");
                record["target"] = parseColumn(row[2], "target");
                record["labels"] = parseColumn(row[3], "labels");
                record["properties"] = parseColumn(row[4], "properties");
                records.push_back(std::move(record));
            }
            break;
        }
        case GraphQuery::Clear:
            txn.exec("DELETE FROM graph_edges");
            txn.exec("DELETE FROM graph_nodes");
            txn.exec("DELETE FROM graph_meta");
            break;
        case GraphQuery::StoreMetadata:
            txn.exec_params(
                "INSERT INTO graph_meta (key, directed, multigraph, attributes) VALUES (0, $1, $2, $3) "
                "ON CONFLICT (key) DO UPDATE SET directed = EXCLUDED.directed, "
                "multigraph = EXCLUDED.multigraph, attributes = EXCLUDED.attributes",
                parameters.value("directed", false),
                parameters.value("multigraph", false),
                parameters.value("attributes", json::object()).dump());
            break;
        case GraphQuery::InsertNode:
            txn.exec_params(
                "INSERT INTO graph_nodes (id, labels, properties) VALUES ($1, $2, $3)",
                idText(parameters, "id"),
                parameters.value("labels", json::array()).dump(),
                parameters.value("properties", json::object()).dump());
            break;
        case GraphQuery::InsertEdge:
            txn.exec_params(
                "INSERT INTO graph_edges (id, source, target, labels, properties) VALUES ($1, $2, $3, $4, $5)",
                idText(parameters, "id"),
                idText(parameters, "source"),
                idText(parameters, "target"),
                parameters.value("labels", json::array()).dump(),
                parameters.value("properties", json::object()).dump());
            break;
    }
    return records;
}

std::vector<Record> PostgresGraphDatabase::execute(GraphQuery query, const json& parameters) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    ensureConnection();

    LOG_DEBUG("PostgreSQL: executing " + adapters::graphQueryToString(query));

    try {
        if (m_txn) {
            return run(*m_txn, query, parameters);
        }
        pqxx::work txn(*m_connection);
        auto records = run(txn, query, parameters);
        txn.commit();
        return records;
    }
    catch (const pqxx::sql_error& e) {
        LOG_ERROR("PostgreSQL: SQL error: " + std::string(e.what()));
        throw std::runtime_error("SQL error: " + std::string(e.what()));
    }
    catch (const std::exception& e) {
        LOG_ERROR("PostgreSQL: error executing " + adapters::graphQueryToString(query) + ": " + e.what());
        throw;
    }
}

void PostgresGraphDatabase::executeTransaction(const std::function<void(adapters::GraphDatabase&)>& work) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (m_txn) {
        work(*this);
        return;
    }

    ensureConnection();
    m_txn = std::make_unique<pqxx::work>(*m_connection);
    try {
        work(*this);
        m_txn->commit();
        m_txn.reset();
    }
    catch (const std::exception& e) {
        // Destroying an uncommitted pqxx::work aborts it
        m_txn.reset();
        LOG_ERROR("PostgreSQL: transaction rolled back: " + std::string(e.what()));
        throw;
    }
}

void PostgresGraphDatabase::disconnect() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (m_txn) {
        throw std::logic_error("Cannot disconnect inside a transaction");
    }
    if (m_connection) {
        LOG_INFO("PostgreSQL: disconnecting...");
        m_connection.reset();
    }
}

} // namespace postgres
