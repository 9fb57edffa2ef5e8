#pragma once

#include "adapters/AdapterFactory.hpp"
#include "adapters/BoostGraphAdapter.hpp"
#include "adapters/GraphAdapter.hpp"
#include "adapters/GraphSageAdapter.hpp"
#include "model/GraphModel.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bridge {

enum class GraphState {
    Unloaded,    // No model, no adapter
    Loaded,      // Model read from the adapter it was created with
    Converted    // Adapter replaced or produced by a conversion
};

std::string graphStateToString(GraphState state);

/**
 * A graph bound to one backing format
 *
 * Holds the canonical model and the adapter of the format it currently lives
 * in. The model is the source of truth: conversions project it into a fresh
 * adapter, and commit() pushes in-process changes back into the current one.
 *
 * Usage:
 *   auto graph = bridge::Graph::fromGraphSage("ppi", "./data");
 *   auto boost = graph.convert(adapters::Format::BoostGraph);
 *   graph.convertInplace(adapters::Format::Database, {}, {.database = db});
 */
class Graph {
public:
    /**
     * Unloaded graph; every operation but state() throws std::logic_error
     */
    Graph() = default;

    Graph(Graph&&) noexcept = default;
    Graph& operator=(Graph&&) noexcept = default;
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    // === Construction ===

    /**
     * Load a GraphSAGE file set
     * Throws MalformedSourceError if a mandatory file is missing or unparsable
     */
    static Graph fromGraphSage(const std::string& prefix, const std::string& directory,
                               adapters::WalkOrderPolicy policy = adapters::WalkOrderPolicy::Permissive);

    static Graph fromDatabase(std::shared_ptr<adapters::GraphDatabase> database);

    static Graph fromBoostGraph(adapters::BoostGraph graph);

    /**
     * Load through an already populated adapter
     * Throws std::invalid_argument for a null adapter
     */
    static Graph fromAdapter(adapters::GraphAdapterPtr adapter);

    // === Conversion ===

    /**
     * New graph holding the same model, projected into the target format.
     * This graph is left untouched.
     * Throws IncompatibleFeatureLayoutError if the features cannot be stored in the target
     */
    Graph convert(adapters::Format to, const adapters::SerializeOptions& options = {},
                  const adapters::AdapterOptions& adapterOptions = {}) const;

    /**
     * Move this graph to the target format. On any failure the graph keeps
     * its previous format and adapter.
     */
    void convertInplace(adapters::Format to, const adapters::SerializeOptions& options = {},
                        const adapters::AdapterOptions& adapterOptions = {});

    /**
     * Re-serialize the model into the current adapter
     */
    void commit(const adapters::SerializeOptions& options = {});

    // === State ===

    GraphState state() const { return m_state; }
    adapters::Format format() const;

    adapters::GraphAdapter& adapter();
    const adapters::GraphAdapter& adapter() const;

    /**
     * Format, node count and edge count, one per line
     */
    std::string describe() const;

    // === Model access ===

    model::GraphModel& model();
    const model::GraphModel& model() const;

    const std::vector<model::Node>& getNodes() const { return model().getNodes(); }
    const std::vector<model::Edge>& getEdges() const { return model().getEdges(); }

    model::IdentityEntry addNode(const model::NodeSpec& spec) { return model().addNode(spec); }
    std::vector<model::IdentityEntry> addNodes(const std::vector<model::NodeSpec>& specs) {
        return model().addNodes(specs);
    }
    model::IdentityEntry addEdge(const model::EdgeSpec& spec) { return model().addEdge(spec); }
    std::vector<model::IdentityEntry> addEdges(const std::vector<model::EdgeSpec>& specs) {
        return model().addEdges(specs);
    }

    const model::IdentityMap& idMap() const { return model().idMap(); }
    model::ClassView operator[](const std::string& nodeClass) const { return model()[nodeClass]; }
    bool isHeterogeneous() const { return model().isHeterogeneous(); }
    model::SparseMatrix getAdjacency() const { return model().getAdjacency(); }

private:
    Graph(model::GraphModel graph, adapters::GraphAdapterPtr adapter, GraphState state);

    void requireLoaded(const char* operation) const;

    std::optional<model::GraphModel> m_model;
    adapters::GraphAdapterPtr m_adapter;
    GraphState m_state = GraphState::Unloaded;
};

} // namespace bridge
