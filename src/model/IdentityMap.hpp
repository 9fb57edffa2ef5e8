#pragma once

#include "model/ExternalId.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace model {

class GraphModel;

/**
 * One registration in an identity map
 */
struct IdentityEntry {
    ExternalId externalId;
    std::string entityClass;   // "" for the implicit homogeneous class
    size_t index = 0;          // dense index over all entities of the kind
    size_t classIndex = 0;     // dense index inside entityClass
};

/**
 * Bidirectional external id <-> dense index map for one entity kind
 *
 * Every entity gets a global dense index in [0, size()) and a class-local
 * dense index in [0, classSize(cls)). Ids are unique across the whole kind.
 * Only GraphModel can register ids, so the bijection cannot be broken from outside.
 */
class EntityIdentityMap {
public:
    EntityIdentityMap() = default;

    size_t size() const { return m_externalIds.size(); }
    bool empty() const { return m_externalIds.empty(); }

    bool contains(const ExternalId& id) const;

    /**
     * Dense index of an id, or nullopt if unknown
     */
    std::optional<size_t> find(const ExternalId& id) const;

    /**
     * Dense index of an id
     * Throws std::out_of_range if unknown
     */
    size_t indexOf(const ExternalId& id) const;

    const ExternalId& externalId(size_t index) const;
    const std::string& classOf(size_t index) const;
    size_t classIndexOf(size_t index) const;
    IdentityEntry entry(size_t index) const;

    bool hasClass(const std::string& entityClass) const;
    size_t classSize(const std::string& entityClass) const;

    /**
     * Global indices of a class's members in class-local order
     * Throws UnknownClassError if no entity of that class was registered
     */
    const std::vector<size_t>& members(const std::string& entityClass) const;

    const std::vector<ExternalId>& externalIds() const { return m_externalIds; }

private:
    friend class GraphModel;

    IdentityEntry insert(const ExternalId& id, const std::string& entityClass);

    std::unordered_map<ExternalId, size_t> m_toIndex;
    std::vector<ExternalId> m_externalIds;
    std::vector<std::string> m_classes;
    std::vector<size_t> m_classIndices;
    std::map<std::string, std::vector<size_t>> m_members;
};

/**
 * Identity maps of a graph, one per entity kind
 */
class IdentityMap {
public:
    const EntityIdentityMap& nodes() const { return m_nodes; }
    const EntityIdentityMap& edges() const { return m_edges; }

private:
    friend class GraphModel;

    EntityIdentityMap m_nodes;
    EntityIdentityMap m_edges;
};

} // namespace model
