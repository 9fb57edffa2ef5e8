#include "model/IdentityMap.hpp"
#include "model/Errors.hpp"
#include <stdexcept>

namespace model {

bool EntityIdentityMap::contains(const ExternalId& id) const {
    return m_toIndex.find(id) != m_toIndex.end();
}

std::optional<size_t> EntityIdentityMap::find(const ExternalId& id) const {
    auto it = m_toIndex.find(id);
    if (it == m_toIndex.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t EntityIdentityMap::indexOf(const ExternalId& id) const {
    auto it = m_toIndex.find(id);
    if (it == m_toIndex.end()) {
        throw std::out_of_range("Unknown external id: " + toString(id));
    }
    return it->second;
}

const ExternalId& EntityIdentityMap::externalId(size_t index) const {
    return m_externalIds.at(index);
}

const std::string& EntityIdentityMap::classOf(size_t index) const {
    return m_classes.at(index);
}

size_t EntityIdentityMap::classIndexOf(size_t index) const {
    return m_classIndices.at(index);
}

IdentityEntry EntityIdentityMap::entry(size_t index) const {
    return IdentityEntry{m_externalIds.at(index), m_classes.at(index), index, m_classIndices.at(index)};
}

bool EntityIdentityMap::hasClass(const std::string& entityClass) const {
    return m_members.find(entityClass) != m_members.end();
}

size_t EntityIdentityMap::classSize(const std::string& entityClass) const {
    auto it = m_members.find(entityClass);
    return it == m_members.end() ? 0 : it->second.size();
}

const std::vector<size_t>& EntityIdentityMap::members(const std::string& entityClass) const {
    auto it = m_members.find(entityClass);
    if (it == m_members.end()) {
        throw UnknownClassError("No entity registered for class '" + entityClass + "'");
    }
    return it->second;
}

IdentityEntry EntityIdentityMap::insert(const ExternalId& id, const std::string& entityClass) {
    if (contains(id)) {
        throw DuplicateIdentifierError("External id already registered: " + toString(id));
    }

    size_t index = m_externalIds.size();
    auto& classMembers = m_members[entityClass];
    size_t classIndex = classMembers.size();

    m_toIndex.emplace(id, index);
    m_externalIds.push_back(id);
    m_classes.push_back(entityClass);
    m_classIndices.push_back(classIndex);
    classMembers.push_back(index);

    return IdentityEntry{id, entityClass, index, classIndex};
}

} // namespace model
