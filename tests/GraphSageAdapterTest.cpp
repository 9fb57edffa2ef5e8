#include <catch2/catch.hpp>
#include "adapters/GraphSageAdapter.hpp"
#include "adapters/NpyIO.hpp"
#include "model/Errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace adapters;
using namespace model;
using Catch::Detail::Approx;

// Helper to create a temporary dataset directory
class TempDirectory {
public:
    TempDirectory() : m_path("/tmp/test_graphsage_" + std::to_string(std::rand())) {
        std::filesystem::create_directories(m_path);
    }

    ~TempDirectory() {
        std::filesystem::remove_all(m_path);
    }

    const std::string& path() const { return m_path; }

    std::string file(const std::string& name) const { return m_path + "/" + name; }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream out(file(name));
        out << content;
    }

private:
    std::string m_path;
};

static const char* kToyGraph = R"({
    "directed": false,
    "multigraph": false,
    "graph": {},
    "nodes": [
        {"id": 10, "labels": ["Chemical"]},
        {"id": 11, "labels": ["Gene"]},
        {"id": 12, "labels": ["Chemical"]}
    ],
    "links": [
        {"source": 10, "target": 11, "id": 100, "labels": ["CHEMICALBINDSGENE"]},
        {"source": 12, "target": 11, "id": 101, "labels": ["CHEMICALBINDSGENE"]}
    ]
})";

static void writeToyDataset(const TempDirectory& dir, bool withOptional) {
    dir.write("toy-G.json", kToyGraph);
    dir.write("toy-id_map.json", R"({"10": 0, "11": 1, "12": 2})");
    if (withOptional) {
        dir.write("toy-class_map.json", R"({"10": [1, 0], "11": [0, 1], "12": [1, 0]})");
        NpyIO::save(FeatureMatrix::fromRows({{1.0, 1.0}, {2.0, 2.0}, {3.0, 3.0}}), dir.file("toy-feats.npy"));
        dir.write("toy-walks.txt", "0\t1\n1\t2\n2\t0\n");
    }
}

// =============================================================================
// Loading
// =============================================================================

TEST_CASE("Load a complete GraphSAGE dataset", "[GraphSage]") {
    TempDirectory dir;
    writeToyDataset(dir, true);

    auto adapter = GraphSageAdapter::open("toy", dir.path());
    auto graph = adapter->load();

    REQUIRE(graph.nodeCount() == 3);
    REQUIRE(graph.edgeCount() == 2);
    CHECK(std::get<int64_t>(graph.node(1).externalId) == 11);
    CHECK(graph.node(1).nodeClass == "Gene");
    CHECK(graph.node(1).membership == std::vector<int>{0, 1});
    CHECK_FALSE(graph.node(0).properties.contains("labels"));
    CHECK(std::get<int64_t>(graph.edge(1).externalId) == 101);
    CHECK(graph.edge(1).edgeClass == "CHEMICALBINDSGENE");

    SECTION("Features are split per class in dense order") {
        CHECK(graph.isHeterogeneous());
        auto chemical = graph["Chemical"];
        REQUIRE(chemical.features != nullptr);
        CHECK(chemical.features->rows() == 2);
        CHECK(chemical.features->at(1, 0) == Approx(3.0));
        CHECK(graph["Gene"].features->at(0, 0) == Approx(2.0));
    }

    SECTION("Walks are dense index pairs") {
        REQUIRE(graph.walks().has_value());
        CHECK(graph.walks()->size() == 3);
        CHECK((*graph.walks())[1] == WalkPair{1, 2});
    }
}

TEST_CASE("Optional GraphSAGE artifacts may be absent", "[GraphSage]") {
    TempDirectory dir;
    writeToyDataset(dir, false);

    auto graph = GraphSageAdapter::open("toy", dir.path())->load();

    CHECK(graph.nodeCount() == 3);
    CHECK(std::holds_alternative<std::monostate>(graph.nodeFeatures()));
    CHECK_FALSE(graph.walks().has_value());
    CHECK(graph.node(0).membership.empty());
}

TEST_CASE("Mandatory GraphSAGE artifacts", "[GraphSage]") {
    TempDirectory dir;

    SECTION("Missing id map") {
        dir.write("toy-G.json", kToyGraph);
        CHECK_THROWS_AS(GraphSageAdapter::open("toy", dir.path()), MalformedSourceError);
    }

    SECTION("Missing graph") {
        dir.write("toy-id_map.json", R"({"10": 0})");
        CHECK_THROWS_AS(GraphSageAdapter::open("toy", dir.path()), MalformedSourceError);
    }

    SECTION("Unparsable graph") {
        dir.write("toy-G.json", "{nodes");
        dir.write("toy-id_map.json", R"({"10": 0})");
        CHECK_THROWS_AS(GraphSageAdapter::open("toy", dir.path()), MalformedSourceError);
    }
}

TEST_CASE("Inconsistent GraphSAGE artifacts", "[GraphSage]") {
    TempDirectory dir;
    writeToyDataset(dir, false);

    SECTION("Id map misses a node") {
        dir.write("toy-id_map.json", R"({"10": 0, "11": 1})");
        CHECK_THROWS_AS(GraphSageAdapter::open("toy", dir.path())->load(), MalformedSourceError);
    }

    SECTION("Id map repeats an index") {
        dir.write("toy-id_map.json", R"({"10": 0, "11": 0, "12": 2})");
        CHECK_THROWS_AS(GraphSageAdapter::open("toy", dir.path())->load(), MalformedSourceError);
    }

    SECTION("Feature rows differ from node count") {
        NpyIO::save(FeatureMatrix::fromRows({{1.0}, {2.0}}), dir.file("toy-feats.npy"));
        CHECK_THROWS_AS(GraphSageAdapter::open("toy", dir.path())->load(), MalformedSourceError);
    }

    SECTION("Feature array declares more data than the file holds") {
        std::string header = "{'descr': '<f8', 'fortran_order': False, 'shape': (4611686018427387904, 4), }";
        header.append(64 - (10 + header.size() + 1) % 64, ' ');
        header.push_back('\n');
        std::string bytes = "\x93NUMPY";
        bytes.push_back(1);
        bytes.push_back(0);
        bytes.push_back(static_cast<char>(header.size() & 0xFF));
        bytes.push_back(static_cast<char>((header.size() >> 8) & 0xFF));
        dir.write("toy-feats.npy", bytes + header + std::string(8, '\0'));
        CHECK_THROWS_AS(GraphSageAdapter::open("toy", dir.path()), MalformedSourceError);
    }

    SECTION("Class map vectors differ in length") {
        dir.write("toy-class_map.json", R"({"10": [1, 0], "11": [1]})");
        CHECK_THROWS_AS(GraphSageAdapter::open("toy", dir.path()), MalformedSourceError);
    }

    SECTION("Unparsable walks") {
        dir.write("toy-walks.txt", "0 1\nzero one\n");
        CHECK_THROWS_AS(GraphSageAdapter::open("toy", dir.path()), MalformedSourceError);
    }
}

TEST_CASE("Walk order policy", "[GraphSage][walks]") {
    SECTION("Permissive keeps pairs as read") {
        std::istringstream in("2 0\n0 1\n");
        auto walks = GraphSageDataset::parseWalks(in, WalkOrderPolicy::Permissive);
        REQUIRE(walks.size() == 2);
        CHECK(walks[0] == WalkPair{2, 0});
    }

    SECTION("Strict rejects descending first elements") {
        std::istringstream in("0 1\n2 0\n1 2\n");
        CHECK_THROWS_AS(GraphSageDataset::parseWalks(in, WalkOrderPolicy::Strict), MalformedSourceError);
    }

    SECTION("Strict rejects pairs outside the node range") {
        TempDirectory dir;
        writeToyDataset(dir, false);
        dir.write("toy-walks.txt", "0 1\n1 7\n");

        auto permissive = GraphSageAdapter::open("toy", dir.path(), WalkOrderPolicy::Permissive);
        CHECK_NOTHROW(permissive->load());

        auto strict = GraphSageAdapter::open("toy", dir.path(), WalkOrderPolicy::Strict);
        CHECK_THROWS_AS(strict->load(), MalformedSourceError);
    }

    SECTION("Policy names") {
        CHECK(stringToWalkOrderPolicy("strict") == WalkOrderPolicy::Strict);
        CHECK(walkOrderPolicyToString(WalkOrderPolicy::Permissive) == "permissive");
        CHECK_THROWS_AS(stringToWalkOrderPolicy("lenient"), std::invalid_argument);
    }
}

// =============================================================================
// Serialization
// =============================================================================

static GraphModel homogeneousGraph() {
    GraphModel graph;
    std::vector<NodeSpec> nodes;
    for (int64_t i = 0; i < 3; ++i) {
        NodeSpec spec;
        spec.id = std::string("n") + std::to_string(i);
        spec.features = std::vector<double>{static_cast<double>(i), 1.0};
        spec.membership = {i == 0 ? 1 : 0};
        nodes.push_back(std::move(spec));
    }
    graph.addNodes(nodes);

    EdgeSpec edge;
    edge.id = int64_t{0};
    edge.source = std::string("n0");
    edge.target = std::string("n2");
    edge.properties = {{"weight", 2.5}};
    graph.addEdge(edge);

    graph.setWalks(std::vector<WalkPair>{{0, 2}, {2, 0}});
    return graph;
}

TEST_CASE("GraphSAGE write then read reproduces the graph", "[GraphSage]") {
    TempDirectory dir;
    GraphModel original = homogeneousGraph();

    GraphSageAdapter writer;
    writer.serialize(original);
    writer.save("out", dir.path());

    CHECK(std::filesystem::exists(dir.file("out-G.json")));
    CHECK(std::filesystem::exists(dir.file("out-id_map.json")));
    CHECK(std::filesystem::exists(dir.file("out-class_map.json")));
    CHECK(std::filesystem::exists(dir.file("out-feats.npy")));
    CHECK(std::filesystem::exists(dir.file("out-walks.txt")));

    auto loaded = GraphSageAdapter::open("out", dir.path())->load();

    REQUIRE(loaded.nodeCount() == 3);
    REQUIRE(loaded.edgeCount() == 1);
    CHECK(std::get<std::string>(loaded.node(2).externalId) == "n2");
    CHECK(loaded.node(0).membership == std::vector<int>{1});
    CHECK(loaded.edge(0).properties["weight"] == 2.5);
    CHECK(std::get<int64_t>(loaded.edge(0).externalId) == 0);
    CHECK(loaded.nodeFeatureRow(2) == std::vector<double>{2.0, 1.0});
    REQUIRE(loaded.walks().has_value());
    CHECK(*loaded.walks() == *original.walks());
}

TEST_CASE("GraphSAGE write removes stale optional files", "[GraphSage]") {
    TempDirectory dir;
    writeToyDataset(dir, true);

    GraphModel graph;
    NodeSpec spec;
    spec.id = int64_t{1};
    graph.addNode(spec);

    GraphSageAdapter writer;
    writer.serialize(graph);
    writer.save("toy", dir.path());

    CHECK_FALSE(std::filesystem::exists(dir.file("toy-feats.npy")));
    CHECK_FALSE(std::filesystem::exists(dir.file("toy-walks.txt")));
    CHECK_FALSE(std::filesystem::exists(dir.file("toy-class_map.json")));
}

TEST_CASE("GraphSAGE stores a single node feature matrix", "[GraphSage][features]") {
    GraphModel graph;
    NodeSpec chemical;
    chemical.id = int64_t{0};
    chemical.labels = {"Chemical"};
    chemical.features = std::vector<double>{1.0, 2.0};
    NodeSpec gene;
    gene.id = int64_t{1};
    gene.labels = {"Gene"};
    gene.features = std::vector<double>{3.0, 4.0};
    graph.addNodes({chemical, gene});

    GraphSageAdapter adapter;

    SECTION("Per-class matrices are rejected") {
        CHECK_THROWS_AS(adapter.serialize(graph), IncompatibleFeatureLayoutError);
        CHECK(adapter.dataset().graph.nodes.empty());
    }

    SECTION("Flattening stitches classes in dense order") {
        SerializeOptions options;
        options.flattenClasses = true;
        adapter.serialize(graph, options);

        REQUIRE(adapter.dataset().features.has_value());
        CHECK(adapter.dataset().features->row(1) == std::vector<double>{3.0, 4.0});

        // Reading back splits the matrix into the classes again
        auto reloaded = adapter.load();
        CHECK(reloaded["Gene"].features->row(0) == std::vector<double>{3.0, 4.0});
    }

    SECTION("Flattening needs equal widths") {
        GraphModel uneven;
        chemical.features = std::vector<double>{1.0};
        uneven.addNodes({chemical, gene});

        SerializeOptions options;
        options.flattenClasses = true;
        CHECK_THROWS_AS(adapter.serialize(uneven, options), IncompatibleFeatureLayoutError);
    }

    SECTION("Edge features are rejected") {
        GraphModel withEdgeFeatures;
        NodeSpec a;
        a.id = int64_t{0};
        withEdgeFeatures.addNode(a);
        EdgeSpec loop;
        loop.id = int64_t{0};
        loop.source = int64_t{0};
        loop.target = int64_t{0};
        loop.features = std::vector<double>{1.0};
        withEdgeFeatures.addEdge(loop);

        CHECK_THROWS_AS(adapter.serialize(withEdgeFeatures), IncompatibleFeatureLayoutError);
    }
}
