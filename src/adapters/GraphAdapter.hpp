#pragma once

#include "adapters/Format.hpp"
#include "model/GraphModel.hpp"
#include <memory>

namespace adapters {

struct SerializeOptions {
    /**
     * Stitch per-class node matrices into one matrix (dense index order)
     * when the target stores a single homogeneous matrix. Every class must
     * have a matrix and all matrices must share their width.
     */
    bool flattenClasses = false;
};

/**
 * Translates between the canonical GraphModel and one backing representation
 *
 * An adapter owns (or references) its backing representation: load() reads it
 * into a new model, serialize() replaces it with the projection of a model.
 * serialize() validates everything before replacing the backing data, so a
 * failed call leaves the adapter as it was.
 */
class GraphAdapter {
public:
    virtual ~GraphAdapter() = default;

    virtual Format format() const = 0;

    FormatCapabilities capabilities() const { return capabilitiesOf(format()); }

    /**
     * Read the backing representation
     * Throws MalformedSourceError if a mandatory part is missing or unparsable
     */
    virtual model::GraphModel load() = 0;

    /**
     * Write a model into the backing representation
     * Throws IncompatibleFeatureLayoutError if the model's feature layout does not fit the format
     */
    virtual void serialize(const model::GraphModel& graph, const SerializeOptions& options = {}) = 0;
};

using GraphAdapterPtr = std::unique_ptr<GraphAdapter>;

} // namespace adapters
