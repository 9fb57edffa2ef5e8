#pragma once

#include "adapters/NodeLinkSerializer.hpp"
#include "model/FeatureMatrix.hpp"
#include "model/GraphModel.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace adapters {

/**
 * How the optional walk list is checked on load
 */
enum class WalkOrderPolicy {
    Permissive,   // Keep pairs as read; ordering is the producer's responsibility
    Strict        // Reject pairs out of ascending order by first element, or out of range
};

std::string walkOrderPolicyToString(WalkOrderPolicy policy);

/**
 * Convert "permissive"/"strict" to WalkOrderPolicy
 * Throws std::invalid_argument for other values
 */
WalkOrderPolicy stringToWalkOrderPolicy(const std::string& str);

/**
 * The artifacts of a GraphSAGE dataset, held in memory
 *
 * Files, for a prefix P in a directory D:
 *   D/P-G.json          node-link graph              (mandatory)
 *   D/P-id_map.json     {"<node id>": dense index}   (mandatory)
 *   D/P-class_map.json  {"<node id>": [0, 1, ...]}   (optional)
 *   D/P-feats.npy       features, row = dense index  (optional)
 *   D/P-walks.txt       "i j" dense index pairs      (optional)
 */
struct GraphSageDataset {
    NodeLinkGraph graph;
    std::map<std::string, size_t> idMap;
    std::optional<std::map<std::string, std::vector<int>>> classMap;
    std::optional<model::FeatureMatrix> features;
    std::optional<std::vector<model::WalkPair>> walks;

    static std::string artifactPath(const std::string& prefix, const std::string& directory,
                                    const std::string& suffix);

    /**
     * Read the artifacts from disk
     * Throws MalformedSourceError if a mandatory file is missing, or any present
     * file cannot be parsed. Missing optional files leave their member empty.
     */
    static GraphSageDataset read(const std::string& prefix, const std::string& directory,
                                 WalkOrderPolicy policy = WalkOrderPolicy::Permissive);

    /**
     * Write the artifacts to disk. An optional artifact that is absent from
     * the dataset is removed from the directory so a later read() sees the same data.
     * Throws std::runtime_error if a file cannot be written
     */
    void write(const std::string& prefix, const std::string& directory) const;

    // Parsers for the individual artifacts (public for tests)
    static std::map<std::string, size_t> parseIdMap(const nlohmann::json& j);
    static std::map<std::string, std::vector<int>> parseClassMap(const nlohmann::json& j);
    static std::vector<model::WalkPair> parseWalks(std::istream& in, WalkOrderPolicy policy);
};

} // namespace adapters
