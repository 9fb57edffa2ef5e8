#include "adapters/BoostGraphAdapter.hpp"
#include "adapters/AdapterSupport.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace adapters {

BoostGraphAdapter::BoostGraphAdapter(BoostGraph graph) : m_graph(std::move(graph)) {}

model::GraphModel BoostGraphAdapter::load() {
    model::GraphModel result;
    const GraphData& graphData = m_graph[boost::graph_bundle];
    result.setAttributes(model::GraphAttributes{graphData.directed, graphData.multigraph, graphData.attributes});

    std::vector<model::NodeSpec> nodeSpecs;
    nodeSpecs.reserve(boost::num_vertices(m_graph));
    for (auto v : boost::make_iterator_range(boost::vertices(m_graph))) {
        const VertexData& data = m_graph[v];
        model::NodeSpec spec;
        spec.id = data.id;
        spec.labels = data.labels;
        spec.properties = data.properties;
        spec.features = data.features;
        spec.membership = data.membership;
        nodeSpecs.push_back(std::move(spec));
    }
    result.addNodes(nodeSpecs);

    std::vector<BoostGraph::edge_descriptor> edges;
    edges.reserve(boost::num_edges(m_graph));
    for (auto e : boost::make_iterator_range(boost::edges(m_graph))) {
        edges.push_back(e);
    }
    std::stable_sort(edges.begin(), edges.end(), [this](const auto& a, const auto& b) {
        return m_graph[a].order < m_graph[b].order;
    });

    std::vector<model::EdgeSpec> edgeSpecs;
    edgeSpecs.reserve(edges.size());
    for (const auto& e : edges) {
        const EdgeData& data = m_graph[e];
        model::EdgeSpec spec;
        spec.id = data.id;
        spec.source = m_graph[boost::source(e, m_graph)].id;
        spec.target = m_graph[boost::target(e, m_graph)].id;
        spec.labels = data.labels;
        spec.properties = data.properties;
        spec.features = data.features;
        edgeSpecs.push_back(std::move(spec));
    }
    result.addEdges(edgeSpecs);

    LOG_DEBUG("BoostGraph: loaded " + util::Logger::formatCount(result.nodeCount(), "node") + ", " +
              util::Logger::formatCount(result.edgeCount(), "edge"));
    return result;
}

void BoostGraphAdapter::serialize(const model::GraphModel& graph, const SerializeOptions& options) {
    checkFeatureLayout(graph, format(), options);

    BoostGraph out(graph.nodeCount());
    const auto& attributes = graph.attributes();
    out[boost::graph_bundle] = GraphData{attributes.directed, attributes.multigraph, attributes.attributes};

    for (const auto& node : graph.getNodes()) {
        VertexData& data = out[boost::vertex(node.index, out)];
        data.id = node.externalId;
        data.labels = node.labels;
        data.properties = node.properties;
        data.features = graph.nodeFeatureRow(node.index);
        data.membership = node.membership;
    }

    for (const auto& edge : graph.getEdges()) {
        EdgeData data;
        data.id = edge.externalId;
        data.labels = edge.labels;
        data.properties = edge.properties;
        data.features = graph.edgeFeatureRow(edge.index);
        data.order = edge.index;
        boost::add_edge(boost::vertex(edge.source, out), boost::vertex(edge.target, out), std::move(data), out);
    }

    m_graph = std::move(out);
}

} // namespace adapters
