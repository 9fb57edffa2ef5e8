#include <catch2/catch.hpp>
#include "model/GraphModel.hpp"
#include "model/Errors.hpp"

using namespace model;
using Catch::Detail::Approx;

static NodeSpec node(ExternalId id, std::vector<std::string> labels = {},
                     std::optional<std::vector<double>> features = std::nullopt) {
    NodeSpec spec;
    spec.id = std::move(id);
    spec.labels = std::move(labels);
    spec.features = std::move(features);
    return spec;
}

static EdgeSpec edge(ExternalId id, ExternalId source, ExternalId target,
                     std::vector<std::string> labels = {}) {
    EdgeSpec spec;
    spec.id = std::move(id);
    spec.source = std::move(source);
    spec.target = std::move(target);
    spec.labels = std::move(labels);
    return spec;
}

static ExternalId sid(const char* text) {
    return std::string(text);
}

// =============================================================================
// Insertion
// =============================================================================

TEST_CASE("GraphModel adds nodes and edges", "[GraphModel]") {
    GraphModel graph;
    auto entries = graph.addNodes({node(sid("a"), {"Chemical"}), node(sid("b"), {"Gene"})});

    REQUIRE(entries.size() == 2);
    CHECK(entries[1].index == 1);
    CHECK(entries[1].entityClass == "Gene");

    NodeSpec withProperties = node(sid("c"));
    withProperties.properties = {{"name", "water"}};
    graph.addNode(withProperties);

    auto e = graph.addEdge(edge(int64_t{7}, sid("a"), sid("b"), {"CHEMICALBINDSGENE"}));
    CHECK(e.index == 0);

    REQUIRE(graph.nodeCount() == 3);
    REQUIRE(graph.edgeCount() == 1);
    CHECK(graph.node(2).properties["name"] == "water");
    CHECK(graph.node(2).nodeClass.empty());
    CHECK(graph.edge(0).source == 0);
    CHECK(graph.edge(0).target == 1);
    CHECK(graph.edge(0).edgeClass == "CHEMICALBINDSGENE");
    CHECK(graph.nodeIndex(sid("b")) == 1);
}

TEST_CASE("GraphModel rejects duplicate ids without partial insertion", "[GraphModel]") {
    GraphModel graph;
    graph.addNode(node(int64_t{1}));

    SECTION("Id already in the graph") {
        CHECK_THROWS_AS(graph.addNodes({node(int64_t{2}), node(int64_t{1})}), DuplicateIdentifierError);
        CHECK(graph.nodeCount() == 1);
        CHECK_FALSE(graph.idMap().nodes().contains(int64_t{2}));
    }

    SECTION("Id repeated inside one batch") {
        CHECK_THROWS_AS(graph.addNodes({node(int64_t{3}), node(int64_t{3})}), DuplicateIdentifierError);
        CHECK(graph.nodeCount() == 1);
    }

    SECTION("Id already used by another class") {
        CHECK_THROWS_AS(graph.addNode(node(int64_t{1}, {"Gene"})), DuplicateIdentifierError);
        CHECK(graph.nodeCount() == 1);
        CHECK_FALSE(graph.descriptor().hasClass(EntityKind::Node, "Gene"));
    }

    SECTION("Duplicate edge ids") {
        graph.addNode(node(int64_t{2}));
        graph.addEdge(edge(int64_t{0}, int64_t{1}, int64_t{2}));
        CHECK_THROWS_AS(graph.addEdge(edge(int64_t{0}, int64_t{2}, int64_t{1})), DuplicateIdentifierError);
        CHECK(graph.edgeCount() == 1);
    }
}

TEST_CASE("GraphModel rejects dangling edges", "[GraphModel]") {
    GraphModel graph;
    graph.addNodes({node(sid("a")), node(sid("b"))});

    CHECK_THROWS_AS(graph.addEdges({edge(int64_t{0}, sid("a"), sid("b")), edge(int64_t{1}, sid("a"), sid("z"))}),
                    DanglingReferenceError);
    CHECK(graph.edgeCount() == 0);
    CHECK(graph.idMap().edges().empty());

    CHECK_THROWS_AS(graph.addEdge(edge(int64_t{2}, sid("z"), sid("a"))), DanglingReferenceError);
}

TEST_CASE("GraphModel accepts self loops and parallel edges", "[GraphModel]") {
    GraphModel graph;
    graph.addNodes({node(int64_t{0}), node(int64_t{1})});
    graph.addEdges({
        edge(int64_t{0}, int64_t{0}, int64_t{0}),
        edge(int64_t{1}, int64_t{0}, int64_t{1}),
        edge(int64_t{2}, int64_t{0}, int64_t{1})
    });

    CHECK(graph.edgeCount() == 3);
}

// =============================================================================
// Features
// =============================================================================

TEST_CASE("Feature rows on insertion keep matrices in step with classes", "[GraphModel][features]") {
    GraphModel graph;
    graph.addNodes({
        node(sid("c1"), {"Chemical"}, std::vector<double>{1.0, 0.0}),
        node(sid("g1"), {"Gene"}, std::vector<double>{5.0}),
        node(sid("c2"), {"Chemical"}, std::vector<double>{0.0, 1.0})
    });

    CHECK(graph.isHeterogeneous());
    auto chemical = graph["Chemical"];
    REQUIRE(chemical.features != nullptr);
    CHECK(chemical.features->rows() == chemical.size());
    CHECK(chemical.features->at(1, 1) == Approx(1.0));
    CHECK(graph["Gene"].features->rows() == 1);

    SECTION("A row of the wrong width is rejected") {
        CHECK_THROWS_AS(graph.addNode(node(sid("c3"), {"Chemical"}, std::vector<double>{1.0})),
                        IncompatibleFeatureLayoutError);
        CHECK(graph.nodeCount() == 3);
        CHECK(graph["Chemical"].features->rows() == 2);
    }

    SECTION("A missing row in a class with features is rejected") {
        CHECK_THROWS_AS(graph.addNode(node(sid("c3"), {"Chemical"})), IncompatibleFeatureLayoutError);
        CHECK(graph.nodeCount() == 3);
    }

    SECTION("Rows are looked up by dense index") {
        CHECK(graph.nodeFeatureRow(2) == std::vector<double>{0.0, 1.0});
        CHECK(graph.nodeFeatureRow(1) == std::vector<double>{5.0});
    }
}

TEST_CASE("Feature rows cannot be started on a class that has members", "[GraphModel][features]") {
    GraphModel graph;
    graph.addNode(node(sid("a")));
    CHECK_THROWS_AS(graph.addNode(node(sid("b"), {}, std::vector<double>{1.0})), IncompatibleFeatureLayoutError);
    CHECK(graph.nodeCount() == 1);
}

TEST_CASE("Setting node features", "[GraphModel][features]") {
    SECTION("Single matrix on a homogeneous graph") {
        GraphModel graph;
        graph.addNodes({node(int64_t{0}), node(int64_t{1})});
        graph.setNodeFeatures(FeatureMatrix::fromRows({{1.0, 2.0}, {3.0, 4.0}}));

        auto features = graph.nodeFeatures();
        REQUIRE(std::holds_alternative<FeatureMatrix>(features));
        CHECK(std::get<FeatureMatrix>(features).at(1, 0) == Approx(3.0));

        CHECK_THROWS_AS(graph.setNodeFeatures(FeatureMatrix::fromRows({{1.0}})), IncompatibleFeatureLayoutError);
        // The previous binding survives a rejected one
        CHECK(std::holds_alternative<FeatureMatrix>(graph.nodeFeatures()));

        graph.setNodeFeatures(std::monostate{});
        CHECK(std::holds_alternative<std::monostate>(graph.nodeFeatures()));
    }

    SECTION("Heterogeneous graphs need per-class matrices") {
        GraphModel graph;
        graph.addNodes({node(sid("c"), {"Chemical"}), node(sid("g"), {"Gene"})});

        CHECK_THROWS_AS(graph.setNodeFeatures(FeatureMatrix::fromRows({{1.0}, {2.0}})),
                        IncompatibleFeatureLayoutError);

        graph.setNodeFeatures(ClassFeatures{
            {"Chemical", FeatureMatrix::fromRows({{1.0, 1.0}})},
            {"Gene", FeatureMatrix::fromRows({{2.0}})}
        });
        auto features = graph.nodeFeatures();
        REQUIRE(std::holds_alternative<ClassFeatures>(features));
        CHECK(std::get<ClassFeatures>(features).size() == 2);

        CHECK_THROWS_AS(graph.setNodeFeatures(ClassFeatures{{"Disease", FeatureMatrix::fromRows({{1.0}})}}),
                        UnknownClassError);
        CHECK_THROWS_AS(graph.setClassFeatures("Gene", FeatureMatrix::fromRows({{1.0}, {2.0}})),
                        IncompatibleFeatureLayoutError);
    }

    SECTION("Edge features per class") {
        GraphModel graph;
        graph.addNodes({node(int64_t{0}), node(int64_t{1})});
        graph.addEdges({edge(int64_t{0}, int64_t{0}, int64_t{1}, {"A"}), edge(int64_t{1}, int64_t{1}, int64_t{0}, {"B"})});

        graph.setEdgeClassFeatures("B", FeatureMatrix::fromRows({{9.0}}));
        CHECK_FALSE(graph.edgeFeatureRow(0).has_value());
        CHECK(graph.edgeFeatureRow(1) == std::vector<double>{9.0});
        CHECK(graph.edgeClass("B").features != nullptr);
        CHECK_THROWS_AS(graph.edgeClass("C"), UnknownClassError);
    }
}

// =============================================================================
// Classes
// =============================================================================

TEST_CASE("Class views", "[GraphModel]") {
    GraphModel graph;
    graph.addNodes({node(sid("c1"), {"Chemical"}), node(sid("g1"), {"Gene"}), node(sid("c2"), {"Chemical"})});

    auto view = graph["Chemical"];
    CHECK(view.name == "Chemical");
    CHECK(view.size() == 2);
    CHECK(*view.members == std::vector<size_t>{0, 2});
    CHECK(view.features == nullptr);

    CHECK_THROWS_AS(graph["Disease"], UnknownClassError);
}

// =============================================================================
// Adjacency
// =============================================================================

TEST_CASE("Adjacency of an undirected graph is symmetric", "[GraphModel][adjacency]") {
    GraphModel graph;
    graph.addNodes({node(sid("a")), node(sid("b")), node(sid("c"))});
    graph.addEdges({edge(int64_t{0}, sid("a"), sid("b")), edge(int64_t{1}, sid("b"), sid("c"))});

    auto adjacency = graph.getAdjacency();
    REQUIRE(adjacency.rows() == 3);
    REQUIRE(adjacency.cols() == 3);
    CHECK(adjacency.nonZeros() == 4);
    CHECK(adjacency.at(0, 1) == 1.0);
    CHECK(adjacency.at(1, 0) == 1.0);
    CHECK(adjacency.at(1, 2) == 1.0);
    CHECK(adjacency.at(2, 1) == 1.0);
    CHECK(adjacency.at(0, 2) == 0.0);
}

TEST_CASE("Adjacency of a directed multigraph", "[GraphModel][adjacency]") {
    GraphModel graph;
    graph.setAttributes(GraphAttributes{true, true, json::object()});
    graph.addNodes({node(int64_t{0}), node(int64_t{1})});
    graph.addEdges({
        edge(int64_t{0}, int64_t{0}, int64_t{1}),
        edge(int64_t{1}, int64_t{0}, int64_t{1}),
        edge(int64_t{2}, int64_t{1}, int64_t{1})
    });

    auto adjacency = graph.getAdjacency();
    CHECK(adjacency.at(0, 1) == 2.0);
    CHECK(adjacency.at(1, 0) == 0.0);
    CHECK(adjacency.at(1, 1) == 1.0);
}

TEST_CASE("Self loops are stored once in undirected adjacency", "[GraphModel][adjacency]") {
    GraphModel graph;
    graph.addNode(node(int64_t{0}));
    graph.addEdge(edge(int64_t{0}, int64_t{0}, int64_t{0}));

    auto adjacency = graph.getAdjacency();
    CHECK(adjacency.nonZeros() == 1);
    CHECK(adjacency.at(0, 0) == 1.0);
}

TEST_CASE("Empty graph adjacency", "[GraphModel][adjacency]") {
    GraphModel graph;
    auto adjacency = graph.getAdjacency();
    CHECK(adjacency.rows() == 0);
    CHECK(adjacency.nonZeros() == 0);
}

// =============================================================================
// Summary
// =============================================================================

TEST_CASE("GraphModel summary", "[GraphModel]") {
    GraphModel graph;
    graph.addNodes({node(sid("c"), {"Chemical"}), node(sid("g"), {"Gene"})});
    graph.setWalks(std::vector<WalkPair>{{0, 1}});

    auto text = graph.summary();
    CHECK(text.find("Node count:    2") != std::string::npos);
    CHECK(text.find("Chemical, Gene") != std::string::npos);
    CHECK(text.find("Node features: none") != std::string::npos);
    REQUIRE(graph.walks().has_value());
    CHECK(graph.walks()->size() == 1);
}
