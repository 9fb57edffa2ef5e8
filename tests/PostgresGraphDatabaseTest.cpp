#include <catch2/catch.hpp>
#include "postgres/PostgresGraphDatabase.hpp"
#include <stdexcept>

using namespace postgres;
using adapters::GraphQuery;

// Note: these tests never open a connection, no server is needed

TEST_CASE("PostgreSQL database configuration", "[postgres]") {
    PostgresGraphDatabase db;

    CHECK_FALSE(db.isConfigured());
    CHECK_FALSE(db.isConnected());

    db.configure("host=localhost port=5432 dbname=test");

    CHECK(db.isConfigured());
    CHECK(db.getConnectionString() == "host=localhost port=5432 dbname=test");
    CHECK_FALSE(db.isConnected());
}

TEST_CASE("PostgreSQL database reconfiguration", "[postgres]") {
    PostgresGraphDatabase db("host=localhost dbname=first");
    db.configure("host=localhost dbname=second");

    CHECK(db.getConnectionString() == "host=localhost dbname=second");
    CHECK_FALSE(db.isConnected());
}

TEST_CASE("PostgreSQL database requires configuration", "[postgres]") {
    PostgresGraphDatabase db;

    CHECK_THROWS_AS(db.execute(GraphQuery::FetchNodes), std::runtime_error);
    CHECK_THROWS_AS(db.executeTransaction([](adapters::GraphDatabase&) {}), std::runtime_error);
}

TEST_CASE("PostgreSQL disconnect without connection", "[postgres]") {
    PostgresGraphDatabase db("host=localhost dbname=test");
    CHECK_NOTHROW(db.disconnect());
    CHECK_FALSE(db.isConnected());
}
