#include "storage/SqliteGraphDatabase.hpp"
#include "util/Logger.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace storage {

using json = nlohmann::json;
using adapters::GraphQuery;
using adapters::Record;

namespace {

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement: " +
                                     std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindInt64(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw std::runtime_error("Step failed: " +
                                 std::string(sqlite3_errmsg(sqlite3_db_handle(m_stmt))));
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? text : "";
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(m_stmt, col);
    }

private:
    sqlite3_stmt* m_stmt;
};

/**
 * Parse a stored JSON column, failing with the column name in the message
 */
json parseColumn(const std::string& text, const char* column) {
    if (text.empty()) {
        return json();
    }
    try {
        return json::parse(text);
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

// =============================================================================
// SqliteGraphDatabase::Impl
// =============================================================================

class SqliteGraphDatabase::Impl {
public:
    explicit Impl(const std::string& dbPath) : m_dbPath(dbPath), m_db(nullptr) {
        if (sqlite3_open(dbPath.c_str(), &m_db) != SQLITE_OK) {
            std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            if (m_db) {
                sqlite3_close(m_db);
            }
            throw std::runtime_error("Failed to open database: " + error);
        }
        try {
            createTables();
        } catch (const std::exception&) {
            sqlite3_close(m_db);
            throw;
        }
    }

    ~Impl() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    void exec(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("SQL error: " + error);
        }
    }

    void createTables() {
        exec(R"(
            CREATE TABLE IF NOT EXISTS graph_nodes (
                seq INTEGER PRIMARY KEY AUTOINCREMENT,
                id TEXT UNIQUE NOT NULL,
                labels TEXT NOT NULL,
                properties TEXT NOT NULL
            )
        )");

        exec(R"(
            CREATE TABLE IF NOT EXISTS graph_edges (
                seq INTEGER PRIMARY KEY AUTOINCREMENT,
                id TEXT UNIQUE NOT NULL,
                source TEXT NOT NULL,
                target TEXT NOT NULL,
                labels TEXT NOT NULL,
                properties TEXT NOT NULL
            )
        )");

        exec(R"(
            CREATE TABLE IF NOT EXISTS graph_meta (
                key INTEGER PRIMARY KEY CHECK (key = 0),
                directed INTEGER NOT NULL,
                multigraph INTEGER NOT NULL,
                attributes TEXT NOT NULL
            )
        )");
    }

    // === Reads ===

    std::vector<Record> fetchMetadata() {
        Statement stmt(m_db, "SELECT directed, multigraph, attributes FROM graph_meta WHERE key = 0");
        std::vector<Record> result;
        if (stmt.step()) {
            Record record;
            record["directed"] = stmt.getInt64(0) != 0;
            record["multigraph"] = stmt.getInt64(1) != 0;
            record["attributes"] = parseColumn(stmt.getText(2), "attributes");
            result.push_back(std::move(record));
        }
        return result;
    }

    std::vector<Record> fetchNodes() {
        Statement stmt(m_db, "SELECT id, labels, properties FROM graph_nodes ORDER BY seq");
        std::vector<Record> result;
        while (stmt.step()) {
            Record record;
            record["id"] = parseColumn(stmt.getText(0), "id");
            record["labels"] = parseColumn(stmt.getText(1), "labels");
            record["properties"] = parseColumn(stmt.getText(2), "properties");
            result.push_back(std::move(record));
        }
        return result;
    }

    std::vector<Record> fetchEdges() {
        Statement stmt(m_db,
            "SELECT id, source, target, labels, properties FROM graph_edges ORDER BY seq");
        std::vector<Record> result;
        while (stmt.step()) {
            Record record;
            record["id"] = parseColumn(stmt.getText(0), "id");
            record["source"] = parseColumn(stmt.getText(1), "source");
            record["target"] = parseColumn(stmt.getText(2), "target");
            record["labels"] = parseColumn(stmt.getText(3), "labels");
            record["properties"] = parseColumn(stmt.getText(4), "properties");
            result.push_back(std::move(record));
        }
        return result;
    }

    // === Writes ===

    void clear() {
        exec("DELETE FROM graph_edges");
        exec("DELETE FROM graph_nodes");
        exec("DELETE FROM graph_meta");
    }

    void storeMetadata(const json& parameters) {
        Statement stmt(m_db,
            "INSERT OR REPLACE INTO graph_meta (key, directed, multigraph, attributes) VALUES (0, ?, ?, ?)");
        stmt.bindInt64(1, parameters.value("directed", false) ? 1 : 0);
        stmt.bindInt64(2, parameters.value("multigraph", false) ? 1 : 0);
        stmt.bindText(3, parameters.value("attributes", json::object()).dump());
        stmt.step();
    }

    void insertNode(const json& parameters) {
        Statement stmt(m_db, "INSERT INTO graph_nodes (id, labels, properties) VALUES (?, ?, ?)");
        stmt.bindText(1, idText(parameters, "id"));
        stmt.bindText(2, parameters.value("labels", json::array()).dump());
        stmt.bindText(3, parameters.value("properties", json::object()).dump());
        stmt.step();
    }

    void insertEdge(const json& parameters) {
        Statement stmt(m_db,
            "INSERT INTO graph_edges (id, source, target, labels, properties) VALUES (?, ?, ?, ?, ?)");
        stmt.bindText(1, idText(parameters, "id"));
        stmt.bindText(2, idText(parameters, "source"));
        stmt.bindText(3, idText(parameters, "target"));
        stmt.bindText(4, parameters.value("labels", json::array()).dump());
        stmt.bindText(5, parameters.value("properties", json::object()).dump());
        stmt.step();
    }

    std::string m_dbPath;
    sqlite3* m_db;
    bool m_inTransaction = false;
};

// =============================================================================
// SqliteGraphDatabase
// =============================================================================

SqliteGraphDatabase::SqliteGraphDatabase(const std::string& dbPath)
    : m_impl(std::make_unique<Impl>(dbPath)) {
    LOG_DEBUG("SQLite graph database opened: " + dbPath);
}

SqliteGraphDatabase::~SqliteGraphDatabase() = default;

std::vector<Record> SqliteGraphDatabase::execute(GraphQuery query, const json& parameters) {
    try {
        switch (query) {
            case GraphQuery::FetchMetadata: return m_impl->fetchMetadata();
            case GraphQuery::FetchNodes:    return m_impl->fetchNodes();
            case GraphQuery::FetchEdges:    return m_impl->fetchEdges();
            case GraphQuery::Clear:         m_impl->clear(); break;
            case GraphQuery::StoreMetadata: m_impl->storeMetadata(parameters); break;
            case GraphQuery::InsertNode:    m_impl->insertNode(parameters); break;
            case GraphQuery::InsertEdge:    m_impl->insertEdge(parameters); break;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("SQLite " + adapters::graphQueryToString(query) + " failed: " + e.what());
        throw;
    }
    return {};
}

void SqliteGraphDatabase::executeTransaction(const std::function<void(adapters::GraphDatabase&)>& work) {
    // Nested calls join the enclosing transaction
    if (m_impl->m_inTransaction) {
        work(*this);
        return;
    }

    m_impl->exec("BEGIN");
    m_impl->m_inTransaction = true;
    try {
        work(*this);
        m_impl->exec("COMMIT");
        m_impl->m_inTransaction = false;
    } catch (const std::exception& e) {
        m_impl->m_inTransaction = false;
        LOG_ERROR("SQLite transaction rolled back: " + std::string(e.what()));
        char* errMsg = nullptr;
        if (sqlite3_exec(m_impl->m_db, "ROLLBACK", nullptr, nullptr, &errMsg) != SQLITE_OK) {
            LOG_ERROR("SQLite rollback failed: " + std::string(errMsg ? errMsg : "Unknown error"));
        }
        sqlite3_free(errMsg);
        throw;
    }
}

const std::string& SqliteGraphDatabase::getPath() const {
    return m_impl->m_dbPath;
}

bool SqliteGraphDatabase::inTransaction() const {
    return m_impl->m_inTransaction;
}

} // namespace storage
