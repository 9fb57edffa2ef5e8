#pragma once

#include "adapters/GraphAdapter.hpp"
#include "model/ExternalId.hpp"
#include <boost/graph/adjacency_list.hpp>
#include <boost/range/iterator_range.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace adapters {

struct VertexData {
    model::ExternalId id;
    std::vector<std::string> labels;
    nlohmann::json properties = nlohmann::json::object();
    std::optional<std::vector<double>> features;
    std::vector<int> membership;
};

struct EdgeData {
    model::ExternalId id;
    std::vector<std::string> labels;
    nlohmann::json properties = nlohmann::json::object();
    std::optional<std::vector<double>> features;
    size_t order = 0;   // Position in the canonical edge list; edges are read back sorted by it
};

struct GraphData {
    bool directed = false;
    bool multigraph = false;
    nlohmann::json attributes = nlohmann::json::object();
};

/**
 * In-memory graph library representation
 *
 * Vertex descriptors are the dense node indices. A bidirectional list keeps
 * in-edge enumeration available to algorithms; the directed flag records
 * how the canonical graph interprets the edges.
 */
using BoostGraph = boost::adjacency_list<boost::vecS, boost::vecS, boost::bidirectionalS,
                                         VertexData, EdgeData, GraphData>;

/**
 * Adapter for Boost.Graph adjacency lists with bundled properties
 */
class BoostGraphAdapter : public GraphAdapter {
public:
    BoostGraphAdapter() = default;
    explicit BoostGraphAdapter(BoostGraph graph);

    Format format() const override { return Format::BoostGraph; }

    model::GraphModel load() override;
    void serialize(const model::GraphModel& graph, const SerializeOptions& options = {}) override;

    const BoostGraph& graph() const { return m_graph; }
    BoostGraph& graph() { return m_graph; }

private:
    BoostGraph m_graph;
};

} // namespace adapters
