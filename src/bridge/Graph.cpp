#include "bridge/Graph.hpp"
#include "adapters/DatabaseAdapter.hpp"
#include "util/Logger.hpp"
#include <sstream>
#include <stdexcept>

namespace bridge {

std::string graphStateToString(GraphState state) {
    switch (state) {
        case GraphState::Unloaded:  return "unloaded";
        case GraphState::Loaded:    return "loaded";
        case GraphState::Converted: return "converted";
    }
    return "unknown";
}

Graph::Graph(model::GraphModel graph, adapters::GraphAdapterPtr adapter, GraphState state)
    : m_model(std::move(graph)), m_adapter(std::move(adapter)), m_state(state) {}

void Graph::requireLoaded(const char* operation) const {
    if (m_state == GraphState::Unloaded || !m_model || !m_adapter) {
        throw std::logic_error(std::string("Graph::") + operation + " called on an unloaded graph");
    }
}

// =============================================================================
// Construction
// =============================================================================

Graph Graph::fromGraphSage(const std::string& prefix, const std::string& directory,
                           adapters::WalkOrderPolicy policy) {
    LOG_INFO("Loading GraphSAGE dataset '" + prefix + "' from " + directory);
    return fromAdapter(adapters::GraphSageAdapter::open(prefix, directory, policy));
}

Graph Graph::fromDatabase(std::shared_ptr<adapters::GraphDatabase> database) {
    return fromAdapter(std::make_unique<adapters::DatabaseAdapter>(std::move(database)));
}

Graph Graph::fromBoostGraph(adapters::BoostGraph graph) {
    return fromAdapter(std::make_unique<adapters::BoostGraphAdapter>(std::move(graph)));
}

Graph Graph::fromAdapter(adapters::GraphAdapterPtr adapter) {
    if (!adapter) {
        throw std::invalid_argument("Graph::fromAdapter needs an adapter");
    }
    model::GraphModel graph = adapter->load();
    return Graph(std::move(graph), std::move(adapter), GraphState::Loaded);
}

// =============================================================================
// Conversion
// =============================================================================

Graph Graph::convert(adapters::Format to, const adapters::SerializeOptions& options,
                     const adapters::AdapterOptions& adapterOptions) const {
    requireLoaded("convert");

    auto target = adapters::AdapterFactory::create(to, adapterOptions);
    target->serialize(*m_model, options);

    LOG_INFO("Converted graph from " + adapters::formatToString(format()) + " to " +
             adapters::formatToString(to));
    return Graph(*m_model, std::move(target), GraphState::Converted);
}

void Graph::convertInplace(adapters::Format to, const adapters::SerializeOptions& options,
                           const adapters::AdapterOptions& adapterOptions) {
    requireLoaded("convertInplace");

    // Everything that can fail happens on the new adapter
    auto target = adapters::AdapterFactory::create(to, adapterOptions);
    target->serialize(*m_model, options);

    const adapters::Format from = format();
    m_adapter = std::move(target);
    m_state = GraphState::Converted;

    LOG_INFO("Converted graph in place from " + adapters::formatToString(from) + " to " +
             adapters::formatToString(to));
}

void Graph::commit(const adapters::SerializeOptions& options) {
    requireLoaded("commit");
    m_adapter->serialize(*m_model, options);
    LOG_DEBUG("Committed graph to " + adapters::formatToString(format()));
}

// =============================================================================
// State and model access
// =============================================================================

adapters::Format Graph::format() const {
    requireLoaded("format");
    return m_adapter->format();
}

adapters::GraphAdapter& Graph::adapter() {
    requireLoaded("adapter");
    return *m_adapter;
}

const adapters::GraphAdapter& Graph::adapter() const {
    requireLoaded("adapter");
    return *m_adapter;
}

model::GraphModel& Graph::model() {
    requireLoaded("model");
    return *m_model;
}

const model::GraphModel& Graph::model() const {
    requireLoaded("model");
    return *m_model;
}

std::string Graph::describe() const {
    requireLoaded("describe");

    std::ostringstream oss;
    oss << "Format:     " << adapters::formatToString(format()) << "\n"
        << "Node count: " << m_model->nodeCount() << "\n"
        << "Edge count: " << m_model->edgeCount() << "\n";
    return oss.str();
}

} // namespace bridge
