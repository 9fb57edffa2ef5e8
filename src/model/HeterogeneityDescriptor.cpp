#include "model/HeterogeneityDescriptor.hpp"
#include "model/Errors.hpp"

namespace model {

const std::string HeterogeneityDescriptor::kImplicitClass = "";

std::string entityKindToString(EntityKind kind) {
    switch (kind) {
        case EntityKind::Node: return "node";
        case EntityKind::Edge: return "edge";
    }
    return "unknown";
}

std::string HeterogeneityDescriptor::classOf(const std::vector<std::string>& labels) {
    return labels.empty() ? kImplicitClass : labels.front();
}

HeterogeneityDescriptor::ClassTable& HeterogeneityDescriptor::table(EntityKind kind) {
    return kind == EntityKind::Node ? m_nodes : m_edges;
}

const HeterogeneityDescriptor::ClassTable& HeterogeneityDescriptor::table(EntityKind kind) const {
    return kind == EntityKind::Node ? m_nodes : m_edges;
}

const std::vector<std::string>& HeterogeneityDescriptor::classes(EntityKind kind) const {
    return table(kind).order;
}

bool HeterogeneityDescriptor::hasClass(EntityKind kind, const std::string& entityClass) const {
    const auto& t = table(kind);
    return t.shapes.find(entityClass) != t.shapes.end();
}

void HeterogeneityDescriptor::requireClass(EntityKind kind, const std::string& entityClass) const {
    if (!hasClass(kind, entityClass)) {
        throw UnknownClassError("Unknown " + entityKindToString(kind) + " class '" + entityClass + "'");
    }
}

std::optional<FeatureShape> HeterogeneityDescriptor::featureShape(EntityKind kind,
                                                                  const std::string& entityClass) const {
    requireClass(kind, entityClass);
    return table(kind).shapes.at(entityClass);
}

bool HeterogeneityDescriptor::isHeterogeneous(EntityKind kind) const {
    return table(kind).order.size() > 1;
}

bool HeterogeneityDescriptor::isHeterogeneous() const {
    return isHeterogeneous(EntityKind::Node) || isHeterogeneous(EntityKind::Edge);
}

void HeterogeneityDescriptor::registerClass(EntityKind kind, const std::string& entityClass) {
    auto& t = table(kind);
    if (t.shapes.emplace(entityClass, std::nullopt).second) {
        t.order.push_back(entityClass);
    }
}

void HeterogeneityDescriptor::setFeatureShape(EntityKind kind, const std::string& entityClass,
                                              std::optional<FeatureShape> shape) {
    requireClass(kind, entityClass);
    table(kind).shapes[entityClass] = shape;
}

} // namespace model
