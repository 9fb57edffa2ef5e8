#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace model {

class GraphModel;

enum class EntityKind {
    Node,
    Edge
};

std::string entityKindToString(EntityKind kind);

/**
 * Shape of the feature matrix bound to a class
 */
struct FeatureShape {
    size_t rows = 0;
    size_t cols = 0;

    bool operator==(const FeatureShape& other) const {
        return rows == other.rows && cols == other.cols;
    }
};

/**
 * Semantic classes of a graph and the feature shape bound to each
 *
 * The class of an entity is its first label; an entity without labels
 * belongs to the implicit class "". Classes are kept in registration order.
 */
class HeterogeneityDescriptor {
public:
    static const std::string kImplicitClass;

    /**
     * Class of an entity from its labels
     */
    static std::string classOf(const std::vector<std::string>& labels);

    const std::vector<std::string>& classes(EntityKind kind) const;
    const std::vector<std::string>& nodeClasses() const { return classes(EntityKind::Node); }
    const std::vector<std::string>& edgeClasses() const { return classes(EntityKind::Edge); }

    bool hasClass(EntityKind kind, const std::string& entityClass) const;

    /**
     * Throws UnknownClassError if the class is not registered
     */
    void requireClass(EntityKind kind, const std::string& entityClass) const;

    /**
     * Bound feature shape, or nullopt for "no features"
     * Throws UnknownClassError if the class is not registered
     */
    std::optional<FeatureShape> featureShape(EntityKind kind, const std::string& entityClass) const;

    /**
     * True if more than one class exists for the kind
     */
    bool isHeterogeneous(EntityKind kind) const;

    /**
     * True if nodes or edges have more than one class
     */
    bool isHeterogeneous() const;

private:
    friend class GraphModel;

    struct ClassTable {
        std::vector<std::string> order;
        std::map<std::string, std::optional<FeatureShape>> shapes;
    };

    ClassTable& table(EntityKind kind);
    const ClassTable& table(EntityKind kind) const;

    void registerClass(EntityKind kind, const std::string& entityClass);
    void setFeatureShape(EntityKind kind, const std::string& entityClass,
                         std::optional<FeatureShape> shape);

    ClassTable m_nodes;
    ClassTable m_edges;
};

} // namespace model
