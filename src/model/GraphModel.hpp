#pragma once

#include "model/ExternalId.hpp"
#include "model/FeatureMatrix.hpp"
#include "model/HeterogeneityDescriptor.hpp"
#include "model/IdentityMap.hpp"
#include "model/SparseMatrix.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace model {

using json = nlohmann::json;

/**
 * A node of the canonical graph
 */
struct Node {
    size_t index = 0;                    // Dense index (row/column in adjacency)
    ExternalId externalId;               // Id in the originating store
    std::string nodeClass;               // First label, "" when unlabeled
    std::vector<std::string> labels;     // Semantic labels
    json properties = json::object();    // Free attributes carried through formats
    std::vector<int> membership;         // Supervised class membership (empty = none)
};

/**
 * An edge of the canonical graph
 */
struct Edge {
    size_t index = 0;
    ExternalId externalId;
    size_t source = 0;                   // Dense node index
    size_t target = 0;                   // Dense node index
    std::string edgeClass;
    std::vector<std::string> labels;
    json properties = json::object();
};

/**
 * Input of addNode()
 */
struct NodeSpec {
    ExternalId id;
    std::vector<std::string> labels;
    json properties = json::object();
    std::optional<std::vector<double>> features;
    std::vector<int> membership;
};

/**
 * Input of addEdge(); endpoints are node external ids
 */
struct EdgeSpec {
    ExternalId id;
    ExternalId source;
    ExternalId target;
    std::vector<std::string> labels;
    json properties = json::object();
    std::optional<std::vector<double>> features;
};

/**
 * Graph-level attributes carried by every format
 */
struct GraphAttributes {
    bool directed = false;
    bool multigraph = false;
    json attributes = json::object();
};

/**
 * Read view of one class: members in class order and the bound matrix
 */
struct ClassView {
    std::string name;
    const std::vector<size_t>* members = nullptr;  // Global dense indices
    const FeatureMatrix* features = nullptr;       // nullptr when the class has no features

    size_t size() const { return members ? members->size() : 0; }
};

using WalkPair = std::pair<size_t, size_t>;

/**
 * Format-agnostic graph that every adapter reads from and writes to
 *
 * Owns the node and edge collections, the identity map, the heterogeneity
 * descriptor and the feature bindings. All mutation goes through addNode(s),
 * addEdge(s) and the explicit feature setters; each of them validates its
 * whole input before touching any state, so a failed call leaves the model
 * unchanged.
 */
class GraphModel {
public:
    GraphModel() = default;

    // === Collections ===

    const std::vector<Node>& getNodes() const { return m_nodes; }
    const std::vector<Edge>& getEdges() const { return m_edges; }
    size_t nodeCount() const { return m_nodes.size(); }
    size_t edgeCount() const { return m_edges.size(); }

    const Node& node(size_t index) const { return m_nodes.at(index); }
    const Edge& edge(size_t index) const { return m_edges.at(index); }

    /**
     * Dense index of a node external id
     * Throws std::out_of_range if unknown
     */
    size_t nodeIndex(const ExternalId& id) const;

    // === Insertion ===

    /**
     * Register nodes, assigning the next dense indices
     * Throws DuplicateIdentifierError for a known id or an id repeated in the batch,
     * IncompatibleFeatureLayoutError for feature rows that do not fit the class matrix
     */
    std::vector<IdentityEntry> addNodes(const std::vector<NodeSpec>& specs);
    IdentityEntry addNode(const NodeSpec& spec);

    /**
     * Register edges between known nodes
     * Throws DanglingReferenceError if an endpoint id is unknown, plus the addNodes() errors
     */
    std::vector<IdentityEntry> addEdges(const std::vector<EdgeSpec>& specs);
    IdentityEntry addEdge(const EdgeSpec& spec);

    // === Identity and classes ===

    const IdentityMap& idMap() const { return m_idMap; }
    const HeterogeneityDescriptor& descriptor() const { return m_descriptor; }

    /**
     * True iff more than one node class or more than one edge class exists
     */
    bool isHeterogeneous() const { return m_descriptor.isHeterogeneous(); }

    /**
     * View of a node class
     * Throws UnknownClassError if the class is not in the descriptor
     */
    ClassView operator[](const std::string& nodeClass) const;

    /**
     * View of an edge class
     * Throws UnknownClassError if the class is not in the descriptor
     */
    ClassView edgeClass(const std::string& edgeClass) const;

    // === Features ===

    /**
     * Current node feature binding: none, a single matrix (at most one class)
     * or one matrix per class
     */
    Features nodeFeatures() const { return featureView(EntityKind::Node); }
    Features edgeFeatures() const { return featureView(EntityKind::Edge); }

    /**
     * Replace the whole node feature binding
     * Throws IncompatibleFeatureLayoutError for a single matrix on a heterogeneous
     * graph or a row count that differs from the class size, UnknownClassError for
     * a class key absent from the descriptor
     */
    void setNodeFeatures(Features features);
    void setEdgeFeatures(Features features);

    /**
     * Replace the matrix of one class
     */
    void setClassFeatures(const std::string& nodeClass, FeatureMatrix matrix);
    void setEdgeClassFeatures(const std::string& edgeClass, FeatureMatrix matrix);

    /**
     * Feature row of an entity by dense index, nullopt if its class has none
     */
    std::optional<std::vector<double>> nodeFeatureRow(size_t index) const;
    std::optional<std::vector<double>> edgeFeatureRow(size_t index) const;

    // === Graph attributes ===

    const GraphAttributes& attributes() const { return m_attributes; }
    void setAttributes(GraphAttributes attributes) { m_attributes = std::move(attributes); }
    bool isDirected() const { return m_attributes.directed; }

    /**
     * Precomputed random walks as pairs of dense node indices.
     * Ascending order by first element is the producer's responsibility.
     */
    const std::optional<std::vector<WalkPair>>& walks() const { return m_walks; }
    void setWalks(std::optional<std::vector<WalkPair>> walks) { m_walks = std::move(walks); }

    // === Queries ===

    /**
     * n x n adjacency over dense node indices; values count parallel edges.
     * Undirected graphs are symmetrised (a self loop is stored once).
     */
    SparseMatrix getAdjacency() const;

    /**
     * Node/edge counts and classes, one item per line
     */
    std::string summary() const;

private:
    ClassFeatures& featureStore(EntityKind kind);
    const ClassFeatures& featureStore(EntityKind kind) const;
    const EntityIdentityMap& identities(EntityKind kind) const;

    Features featureView(EntityKind kind) const;
    void bindFeatures(EntityKind kind, Features features);
    void bindClassFeatures(EntityKind kind, const std::string& entityClass, FeatureMatrix matrix);
    std::optional<std::vector<double>> featureRow(EntityKind kind, size_t index) const;
    ClassView classView(EntityKind kind, const std::string& entityClass) const;
    void refreshFeatureShapes(EntityKind kind);

    struct PendingRow {
        const ExternalId* id;
        std::string entityClass;
        const std::optional<std::vector<double>>* features;
    };

    /**
     * Throws IncompatibleFeatureLayoutError on the first pending row that does
     * not fit its class matrix
     */
    void checkFeatureRows(EntityKind kind, const std::vector<PendingRow>& rows) const;
    void appendFeatureRow(EntityKind kind, const std::string& entityClass,
                          const std::optional<std::vector<double>>& row);

    std::vector<Node> m_nodes;
    std::vector<Edge> m_edges;
    IdentityMap m_idMap;
    HeterogeneityDescriptor m_descriptor;
    ClassFeatures m_nodeFeatures;
    ClassFeatures m_edgeFeatures;
    GraphAttributes m_attributes;
    std::optional<std::vector<WalkPair>> m_walks;
};

} // namespace model
