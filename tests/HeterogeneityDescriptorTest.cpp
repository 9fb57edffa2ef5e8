#include <catch2/catch.hpp>
#include "model/GraphModel.hpp"
#include "model/Errors.hpp"

using namespace model;

static NodeSpec node(const std::string& id, std::vector<std::string> labels,
                     std::optional<std::vector<double>> features = std::nullopt) {
    NodeSpec spec;
    spec.id = id;
    spec.labels = std::move(labels);
    spec.features = std::move(features);
    return spec;
}

TEST_CASE("Class of an entity is its first label", "[HeterogeneityDescriptor]") {
    CHECK(HeterogeneityDescriptor::classOf({"Chemical", "Drug"}) == "Chemical");
    CHECK(HeterogeneityDescriptor::classOf({}) == HeterogeneityDescriptor::kImplicitClass);
    CHECK(HeterogeneityDescriptor::kImplicitClass.empty());
}

TEST_CASE("Empty descriptor", "[HeterogeneityDescriptor]") {
    HeterogeneityDescriptor descriptor;
    CHECK(descriptor.nodeClasses().empty());
    CHECK(descriptor.edgeClasses().empty());
    CHECK_FALSE(descriptor.isHeterogeneous());
    CHECK_THROWS_AS(descriptor.requireClass(EntityKind::Node, ""), UnknownClassError);
    CHECK_THROWS_AS(descriptor.featureShape(EntityKind::Edge, "X"), UnknownClassError);
}

TEST_CASE("Descriptor registers classes in first-seen order", "[HeterogeneityDescriptor]") {
    GraphModel graph;
    graph.addNodes({node("a", {"Gene"}), node("b", {"Chemical"}), node("c", {"Gene"})});

    const auto& descriptor = graph.descriptor();
    CHECK(descriptor.nodeClasses() == std::vector<std::string>{"Gene", "Chemical"});
    CHECK(descriptor.hasClass(EntityKind::Node, "Chemical"));
    CHECK_FALSE(descriptor.hasClass(EntityKind::Edge, "Chemical"));
    CHECK(descriptor.isHeterogeneous(EntityKind::Node));
    CHECK_FALSE(descriptor.isHeterogeneous(EntityKind::Edge));
    CHECK(descriptor.isHeterogeneous());
}

TEST_CASE("Homogeneous graphs use the implicit class", "[HeterogeneityDescriptor]") {
    GraphModel graph;
    graph.addNodes({node("a", {}), node("b", {})});

    CHECK(graph.descriptor().nodeClasses() == std::vector<std::string>{""});
    CHECK_FALSE(graph.isHeterogeneous());
}

TEST_CASE("Descriptor records bound feature shapes", "[HeterogeneityDescriptor]") {
    GraphModel graph;
    graph.addNodes({
        node("c1", {"Chemical"}, std::vector<double>{1.0, 2.0, 3.0}),
        node("c2", {"Chemical"}, std::vector<double>{4.0, 5.0, 6.0}),
        node("g1", {"Gene"})
    });

    const auto& descriptor = graph.descriptor();
    auto chemical = descriptor.featureShape(EntityKind::Node, "Chemical");
    REQUIRE(chemical.has_value());
    CHECK(*chemical == FeatureShape{2, 3});
    CHECK_FALSE(descriptor.featureShape(EntityKind::Node, "Gene").has_value());

    graph.setClassFeatures("Gene", FeatureMatrix::fromRows({{7.0}}));
    auto gene = graph.descriptor().featureShape(EntityKind::Node, "Gene");
    REQUIRE(gene.has_value());
    CHECK(*gene == FeatureShape{1, 1});
}
