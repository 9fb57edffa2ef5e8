#pragma once

#include "adapters/GraphAdapter.hpp"
#include "adapters/GraphSageDataset.hpp"
#include <memory>
#include <string>

namespace adapters {

/**
 * Adapter for the GraphSAGE embedding-learning file set
 *
 * The backing representation is an in-memory GraphSageDataset; open() and
 * save() move it from/to disk. The format stores one homogeneous node
 * feature matrix and no edge features. Semantic labels travel as the
 * "labels" attribute of node-link nodes and links.
 */
class GraphSageAdapter : public GraphAdapter {
public:
    GraphSageAdapter() = default;
    explicit GraphSageAdapter(GraphSageDataset dataset,
                              WalkOrderPolicy policy = WalkOrderPolicy::Permissive);

    /**
     * Read a dataset from disk
     * Throws MalformedSourceError (see GraphSageDataset::read)
     */
    static std::unique_ptr<GraphSageAdapter> open(const std::string& prefix, const std::string& directory,
                                                  WalkOrderPolicy policy = WalkOrderPolicy::Permissive);

    Format format() const override { return Format::GraphSage; }

    model::GraphModel load() override;
    void serialize(const model::GraphModel& graph, const SerializeOptions& options = {}) override;

    const GraphSageDataset& dataset() const { return m_dataset; }
    WalkOrderPolicy walkPolicy() const { return m_policy; }

    /**
     * Write the current dataset to disk
     */
    void save(const std::string& prefix, const std::string& directory) const;

private:
    GraphSageDataset m_dataset;
    WalkOrderPolicy m_policy = WalkOrderPolicy::Permissive;
};

} // namespace adapters
