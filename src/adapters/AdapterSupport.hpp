#pragma once

#include "adapters/GraphAdapter.hpp"
#include "model/GraphModel.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace adapters {

using json = nlohmann::json;

// Reserved attribute names shared by the formats that store entities as
// attribute maps (node-link JSON, database records)
extern const char* const kLabelsAttribute;      // "labels"
extern const char* const kIdAttribute;          // "id"
extern const char* const kFeaturesProperty;     // "_features"
extern const char* const kMembershipProperty;   // "_membership"

/**
 * Check the model's feature bindings against a format's capabilities
 * Throws IncompatibleFeatureLayoutError when they cannot be stored
 */
void checkFeatureLayout(const model::GraphModel& graph, Format format, const SerializeOptions& options);

/**
 * Node features as one matrix in dense index order, for single-matrix formats
 * Returns nullopt when the graph has no node features.
 * Throws IncompatibleFeatureLayoutError for per-class features unless
 * options.flattenClasses is set and the classes can be stitched together.
 */
std::optional<model::FeatureMatrix> singleNodeMatrix(const model::GraphModel& graph,
                                                     const SerializeOptions& options);

/**
 * Stitch per-class node matrices into one, row i = node with dense index i
 * Throws IncompatibleFeatureLayoutError if a class has no matrix or widths differ
 */
model::FeatureMatrix flattenClassFeatures(const model::GraphModel& graph);

/**
 * Inverse of flattenClassFeatures(): split a matrix in dense index order
 * into the layout matching the graph's node classes
 */
model::Features splitNodeFeatures(const model::GraphModel& graph, const model::FeatureMatrix& matrix);

// === Attribute helpers ===

/**
 * Read a "labels" value (array of strings, a single string or null)
 * Throws MalformedSourceError for anything else
 */
std::vector<std::string> labelsFromJson(const json& value, const std::string& context);

json labelsToJson(const std::vector<std::string>& labels);

/**
 * Read a numeric JSON array
 * Throws MalformedSourceError if an element is not a number
 */
std::vector<double> numbersFromJson(const json& value, const std::string& context);

/**
 * Read a 0/1 membership vector
 * Throws MalformedSourceError if an element is not an integer or boolean
 */
std::vector<int> membershipFromJson(const json& value, const std::string& context);

/**
 * Remove a key from a JSON object and return its value (null if absent)
 */
json takeAttribute(json& object, const std::string& key);

} // namespace adapters
