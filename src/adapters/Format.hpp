#pragma once

#include <string>

namespace adapters {

/**
 * Backing representations a graph can live in
 */
enum class Format {
    Database,     // Node/edge records behind a GraphDatabase collaborator
    BoostGraph,   // boost::adjacency_list with bundled properties
    GraphSage     // GraphSAGE file set (-G.json, -id_map.json, ...)
};

/**
 * Convert Format to its tag ("database", "boost_graph", "graphsage")
 */
std::string formatToString(Format format);

/**
 * Convert a tag to Format
 * Throws std::invalid_argument for unknown tags
 */
Format stringToFormat(const std::string& str);

/**
 * Feature layouts a format can store
 */
struct FormatCapabilities {
    bool perClassNodeFeatures = false;   // One node matrix per class
    bool edgeFeatures = false;           // Any edge features at all
    bool perClassEdgeFeatures = false;   // One edge matrix per class
};

FormatCapabilities capabilitiesOf(Format format);

} // namespace adapters
