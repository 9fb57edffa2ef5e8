#pragma once

#include "adapters/GraphAdapter.hpp"
#include "adapters/GraphDatabase.hpp"
#include <memory>

namespace adapters {

/**
 * Adapter for graph databases reached through a GraphDatabase collaborator
 *
 * Records map one-to-one onto canonical nodes and edges. Feature rows and
 * class membership live in the reserved properties "_features" and
 * "_membership", so every class keeps its own feature space.
 */
class DatabaseAdapter : public GraphAdapter {
public:
    explicit DatabaseAdapter(std::shared_ptr<GraphDatabase> database);

    Format format() const override { return Format::Database; }

    model::GraphModel load() override;

    /**
     * Replace the database content with the model, in one transaction
     */
    void serialize(const model::GraphModel& graph, const SerializeOptions& options = {}) override;

    const std::shared_ptr<GraphDatabase>& database() const { return m_database; }

    // Record conversion (public for tests)
    static Record nodeToRecord(const model::GraphModel& graph, const model::Node& node);
    static Record edgeToRecord(const model::GraphModel& graph, const model::Edge& edge);
    static model::NodeSpec recordToNode(const Record& record);
    static model::EdgeSpec recordToEdge(const Record& record);

private:
    std::shared_ptr<GraphDatabase> m_database;
};

} // namespace adapters
