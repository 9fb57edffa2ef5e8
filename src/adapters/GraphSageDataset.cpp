#include "adapters/GraphSageDataset.hpp"
#include "adapters/AdapterSupport.hpp"
#include "adapters/NpyIO.hpp"
#include "model/Errors.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace adapters {

using model::MalformedSourceError;
namespace fs = std::filesystem;

namespace {

json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw MalformedSourceError("Cannot open " + path);
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw MalformedSourceError("Invalid JSON in " + path + ": " + e.what());
    }
}

void writeTextFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    file << content;
    if (!file) {
        throw std::runtime_error("Failed to write " + path);
    }
}

} // anonymous namespace

std::string walkOrderPolicyToString(WalkOrderPolicy policy) {
    switch (policy) {
        case WalkOrderPolicy::Permissive: return "permissive";
        case WalkOrderPolicy::Strict:     return "strict";
    }
    return "unknown";
}

WalkOrderPolicy stringToWalkOrderPolicy(const std::string& str) {
    if (str == "permissive") return WalkOrderPolicy::Permissive;
    if (str == "strict") return WalkOrderPolicy::Strict;
    throw std::invalid_argument("Unknown walk order policy: " + str);
}

std::string GraphSageDataset::artifactPath(const std::string& prefix, const std::string& directory,
                                           const std::string& suffix) {
    return (fs::path(directory.empty() ? "." : directory) / (prefix + suffix)).string();
}

// =============================================================================
// Reading
// =============================================================================

GraphSageDataset GraphSageDataset::read(const std::string& prefix, const std::string& directory,
                                        WalkOrderPolicy policy) {
    const std::string graphFile = artifactPath(prefix, directory, "-G.json");
    const std::string idMapFile = artifactPath(prefix, directory, "-id_map.json");
    const std::string classMapFile = artifactPath(prefix, directory, "-class_map.json");
    const std::string featsFile = artifactPath(prefix, directory, "-feats.npy");
    const std::string walksFile = artifactPath(prefix, directory, "-walks.txt");

    for (const auto& mandatory : {graphFile, idMapFile}) {
        if (!fs::exists(mandatory)) {
            throw MalformedSourceError("Missing mandatory GraphSAGE artifact: " + mandatory);
        }
    }

    GraphSageDataset dataset;
    dataset.graph = NodeLinkSerializer::fromJson(readJsonFile(graphFile));
    dataset.idMap = parseIdMap(readJsonFile(idMapFile));
    LOG_DEBUG("GraphSAGE: read " + util::Logger::formatCount(dataset.graph.nodes.size(), "node") +
              " and " + util::Logger::formatCount(dataset.graph.links.size(), "link") + " from " + graphFile);

    if (fs::exists(classMapFile)) {
        dataset.classMap = parseClassMap(readJsonFile(classMapFile));
    } else {
        LOG_DEBUG("GraphSAGE: no class map at " + classMapFile);
    }

    if (fs::exists(featsFile)) {
        dataset.features = NpyIO::load(featsFile);
    } else {
        LOG_DEBUG("GraphSAGE: no feature array at " + featsFile);
    }

    if (fs::exists(walksFile)) {
        std::ifstream file(walksFile);
        if (!file.is_open()) {
            throw MalformedSourceError("Cannot open " + walksFile);
        }
        try {
            dataset.walks = parseWalks(file, policy);
        } catch (const MalformedSourceError& e) {
            throw MalformedSourceError(walksFile + ": " + e.what());
        }
    } else {
        LOG_DEBUG("GraphSAGE: no walk list at " + walksFile);
    }

    return dataset;
}

std::map<std::string, size_t> GraphSageDataset::parseIdMap(const json& j) {
    if (!j.is_object()) {
        throw MalformedSourceError("GraphSAGE id map must be a JSON object");
    }
    std::map<std::string, size_t> idMap;
    for (const auto& [key, value] : j.items()) {
        if (!value.is_number_integer() || value.get<int64_t>() < 0) {
            throw MalformedSourceError("GraphSAGE id map entry '" + key + "' is not a non-negative integer");
        }
        idMap.emplace(key, value.get<size_t>());
    }
    return idMap;
}

std::map<std::string, std::vector<int>> GraphSageDataset::parseClassMap(const json& j) {
    if (!j.is_object()) {
        throw MalformedSourceError("GraphSAGE class map must be a JSON object");
    }
    std::map<std::string, std::vector<int>> classMap;
    std::optional<size_t> width;
    for (const auto& [key, value] : j.items()) {
        auto membership = membershipFromJson(value, "class map entry '" + key + "'");
        if (width && *width != membership.size()) {
            throw MalformedSourceError("GraphSAGE class map entry '" + key + "' has length " +
                                       std::to_string(membership.size()) + ", expected " +
                                       std::to_string(*width));
        }
        width = membership.size();
        classMap.emplace(key, std::move(membership));
    }
    return classMap;
}

std::vector<model::WalkPair> GraphSageDataset::parseWalks(std::istream& in, WalkOrderPolicy policy) {
    std::vector<model::WalkPair> walks;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        std::istringstream fields(line);
        long long first = 0;
        long long second = 0;
        if (!(fields >> first)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            throw MalformedSourceError("Walk line " + std::to_string(lineNumber) + " is not an index pair");
        }
        std::string rest;
        if (!(fields >> second) || (fields >> rest) || first < 0 || second < 0) {
            throw MalformedSourceError("Walk line " + std::to_string(lineNumber) + " is not an index pair");
        }
        if (policy == WalkOrderPolicy::Strict && !walks.empty() &&
            static_cast<size_t>(first) < walks.back().first) {
            throw MalformedSourceError("Walk line " + std::to_string(lineNumber) +
                                       " breaks ascending order of first elements");
        }
        walks.emplace_back(static_cast<size_t>(first), static_cast<size_t>(second));
    }
    return walks;
}

// =============================================================================
// Writing
// =============================================================================

void GraphSageDataset::write(const std::string& prefix, const std::string& directory) const {
    if (!directory.empty()) {
        fs::create_directories(directory);
    }

    writeTextFile(artifactPath(prefix, directory, "-G.json"), NodeLinkSerializer::toString(graph));

    json idMapJson = json::object();
    for (const auto& [key, index] : idMap) {
        idMapJson[key] = index;
    }
    writeTextFile(artifactPath(prefix, directory, "-id_map.json"), idMapJson.dump());

    if (classMap) {
        json classMapJson = json::object();
        for (const auto& [key, membership] : *classMap) {
            classMapJson[key] = membership;
        }
        writeTextFile(artifactPath(prefix, directory, "-class_map.json"), classMapJson.dump());
    } else {
        fs::remove(artifactPath(prefix, directory, "-class_map.json"));
    }

    if (features) {
        NpyIO::save(*features, artifactPath(prefix, directory, "-feats.npy"));
    } else {
        fs::remove(artifactPath(prefix, directory, "-feats.npy"));
    }

    if (walks) {
        std::ostringstream oss;
        for (const auto& [first, second] : *walks) {
            oss << first << "\t" << second << "\n";
        }
        writeTextFile(artifactPath(prefix, directory, "-walks.txt"), oss.str());
    } else {
        fs::remove(artifactPath(prefix, directory, "-walks.txt"));
    }

    LOG_INFO("GraphSAGE: wrote dataset '" + prefix + "' to " + (directory.empty() ? "." : directory));
}

} // namespace adapters
