#pragma once

#include "adapters/GraphAdapter.hpp"
#include "adapters/GraphDatabase.hpp"
#include "adapters/GraphSageDataset.hpp"
#include <memory>

namespace adapters {

/**
 * Collaborators and settings an adapter may need at construction
 */
struct AdapterOptions {
    std::shared_ptr<GraphDatabase> database;                     // Required for Format::Database
    WalkOrderPolicy walkPolicy = WalkOrderPolicy::Permissive;    // Used by Format::GraphSage
};

/**
 * Creates an empty adapter for a format tag
 */
class AdapterFactory {
public:
    /**
     * Throws std::invalid_argument when the format needs a collaborator the
     * options do not provide
     */
    static GraphAdapterPtr create(Format format, const AdapterOptions& options = {});
};

} // namespace adapters
