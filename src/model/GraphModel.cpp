#include "model/GraphModel.hpp"
#include "model/Errors.hpp"
#include <map>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <unordered_set>

namespace model {

namespace {

json normalizeProperties(const json& properties, const ExternalId& id) {
    if (properties.is_null()) {
        return json::object();
    }
    if (!properties.is_object()) {
        throw std::invalid_argument("Properties of entity " + toString(id) + " must be a JSON object");
    }
    return properties;
}

std::string joinClasses(const std::vector<std::string>& classes) {
    if (classes.size() <= 1) {
        return classes.empty() || classes.front().empty() ? "(homogeneous)" : classes.front();
    }
    std::string result;
    for (const auto& c : classes) {
        if (!result.empty()) result += ", ";
        result += c.empty() ? "(unlabeled)" : c;
    }
    return result;
}

} // anonymous namespace

// =============================================================================
// Collections
// =============================================================================

size_t GraphModel::nodeIndex(const ExternalId& id) const {
    return m_idMap.nodes().indexOf(id);
}

// =============================================================================
// Insertion
// =============================================================================

std::vector<IdentityEntry> GraphModel::addNodes(const std::vector<NodeSpec>& specs) {
    std::unordered_set<ExternalId> seen;
    std::vector<PendingRow> pending;
    std::vector<json> properties;
    pending.reserve(specs.size());
    properties.reserve(specs.size());

    for (const auto& spec : specs) {
        if (m_idMap.m_nodes.contains(spec.id) || !seen.insert(spec.id).second) {
            throw DuplicateIdentifierError("Node id already registered: " + toString(spec.id));
        }
        properties.push_back(normalizeProperties(spec.properties, spec.id));
        pending.push_back(PendingRow{&spec.id, HeterogeneityDescriptor::classOf(spec.labels), &spec.features});
    }
    checkFeatureRows(EntityKind::Node, pending);

    std::vector<IdentityEntry> entries;
    entries.reserve(specs.size());
    for (size_t i = 0; i < specs.size(); ++i) {
        const auto& spec = specs[i];
        const std::string& nodeClass = pending[i].entityClass;

        IdentityEntry entry = m_idMap.m_nodes.insert(spec.id, nodeClass);
        m_descriptor.registerClass(EntityKind::Node, nodeClass);

        Node node;
        node.index = entry.index;
        node.externalId = spec.id;
        node.nodeClass = nodeClass;
        node.labels = spec.labels;
        node.properties = std::move(properties[i]);
        node.membership = spec.membership;
        m_nodes.push_back(std::move(node));

        appendFeatureRow(EntityKind::Node, nodeClass, spec.features);
        entries.push_back(std::move(entry));
    }
    refreshFeatureShapes(EntityKind::Node);
    return entries;
}

IdentityEntry GraphModel::addNode(const NodeSpec& spec) {
    return addNodes({spec}).front();
}

std::vector<IdentityEntry> GraphModel::addEdges(const std::vector<EdgeSpec>& specs) {
    std::unordered_set<ExternalId> seen;
    std::vector<PendingRow> pending;
    std::vector<std::pair<size_t, size_t>> endpoints;
    std::vector<json> properties;
    pending.reserve(specs.size());
    endpoints.reserve(specs.size());
    properties.reserve(specs.size());

    for (const auto& spec : specs) {
        if (m_idMap.m_edges.contains(spec.id) || !seen.insert(spec.id).second) {
            throw DuplicateIdentifierError("Edge id already registered: " + toString(spec.id));
        }
        auto source = m_idMap.m_nodes.find(spec.source);
        if (!source) {
            throw DanglingReferenceError("Edge " + toString(spec.id) +
                                         " references unknown source node " + toString(spec.source));
        }
        auto target = m_idMap.m_nodes.find(spec.target);
        if (!target) {
            throw DanglingReferenceError("Edge " + toString(spec.id) +
                                         " references unknown target node " + toString(spec.target));
        }
        endpoints.emplace_back(*source, *target);
        properties.push_back(normalizeProperties(spec.properties, spec.id));
        pending.push_back(PendingRow{&spec.id, HeterogeneityDescriptor::classOf(spec.labels), &spec.features});
    }
    checkFeatureRows(EntityKind::Edge, pending);

    std::vector<IdentityEntry> entries;
    entries.reserve(specs.size());
    for (size_t i = 0; i < specs.size(); ++i) {
        const auto& spec = specs[i];
        const std::string& edgeClass = pending[i].entityClass;

        IdentityEntry entry = m_idMap.m_edges.insert(spec.id, edgeClass);
        m_descriptor.registerClass(EntityKind::Edge, edgeClass);

        Edge edge;
        edge.index = entry.index;
        edge.externalId = spec.id;
        edge.source = endpoints[i].first;
        edge.target = endpoints[i].second;
        edge.edgeClass = edgeClass;
        edge.labels = spec.labels;
        edge.properties = std::move(properties[i]);
        m_edges.push_back(std::move(edge));

        appendFeatureRow(EntityKind::Edge, edgeClass, spec.features);
        entries.push_back(std::move(entry));
    }
    refreshFeatureShapes(EntityKind::Edge);
    return entries;
}

IdentityEntry GraphModel::addEdge(const EdgeSpec& spec) {
    return addEdges({spec}).front();
}

void GraphModel::checkFeatureRows(EntityKind kind, const std::vector<PendingRow>& rows) const {
    struct ClassState {
        std::optional<size_t> width;
        size_t members = 0;
    };
    std::map<std::string, ClassState> states;
    const auto& store = featureStore(kind);
    const auto& ids = identities(kind);

    for (const auto& pending : rows) {
        auto it = states.find(pending.entityClass);
        if (it == states.end()) {
            ClassState state;
            auto bound = store.find(pending.entityClass);
            if (bound != store.end()) {
                state.width = bound->second.cols();
            }
            state.members = ids.classSize(pending.entityClass);
            it = states.emplace(pending.entityClass, state).first;
        }

        ClassState& state = it->second;
        const auto& row = *pending.features;
        const std::string what = entityKindToString(kind) + " " + toString(*pending.id);

        if (state.width) {
            if (!row) {
                throw IncompatibleFeatureLayoutError("Class '" + pending.entityClass +
                                                     "' has bound features; " + what + " needs a feature row");
            }
            if (row->size() != *state.width) {
                throw IncompatibleFeatureLayoutError("Feature row of " + what + " has width " +
                                                     std::to_string(row->size()) + ", class '" +
                                                     pending.entityClass + "' expects " +
                                                     std::to_string(*state.width));
            }
        } else if (row) {
            if (state.members > 0) {
                throw IncompatibleFeatureLayoutError("Class '" + pending.entityClass +
                                                     "' already has members without features; cannot bind a row for " +
                                                     what);
            }
            state.width = row->size();
        }
        ++state.members;
    }
}

void GraphModel::appendFeatureRow(EntityKind kind, const std::string& entityClass,
                                  const std::optional<std::vector<double>>& row) {
    if (!row) {
        return;
    }
    auto& store = featureStore(kind);
    auto it = store.find(entityClass);
    if (it == store.end()) {
        it = store.emplace(entityClass, FeatureMatrix(0, row->size())).first;
    }
    it->second.appendRow(*row);
}

// =============================================================================
// Classes
// =============================================================================

ClassView GraphModel::operator[](const std::string& nodeClass) const {
    return classView(EntityKind::Node, nodeClass);
}

ClassView GraphModel::edgeClass(const std::string& edgeClass) const {
    return classView(EntityKind::Edge, edgeClass);
}

ClassView GraphModel::classView(EntityKind kind, const std::string& entityClass) const {
    m_descriptor.requireClass(kind, entityClass);

    ClassView view;
    view.name = entityClass;
    view.members = &identities(kind).members(entityClass);
    const auto& store = featureStore(kind);
    auto it = store.find(entityClass);
    if (it != store.end()) {
        view.features = &it->second;
    }
    return view;
}

// =============================================================================
// Features
// =============================================================================

ClassFeatures& GraphModel::featureStore(EntityKind kind) {
    return kind == EntityKind::Node ? m_nodeFeatures : m_edgeFeatures;
}

const ClassFeatures& GraphModel::featureStore(EntityKind kind) const {
    return kind == EntityKind::Node ? m_nodeFeatures : m_edgeFeatures;
}

const EntityIdentityMap& GraphModel::identities(EntityKind kind) const {
    return kind == EntityKind::Node ? m_idMap.nodes() : m_idMap.edges();
}

Features GraphModel::featureView(EntityKind kind) const {
    const auto& store = featureStore(kind);
    if (store.empty()) {
        return std::monostate{};
    }
    if (!m_descriptor.isHeterogeneous(kind)) {
        return store.begin()->second;
    }
    return store;
}

void GraphModel::setNodeFeatures(Features features) {
    bindFeatures(EntityKind::Node, std::move(features));
}

void GraphModel::setEdgeFeatures(Features features) {
    bindFeatures(EntityKind::Edge, std::move(features));
}

void GraphModel::bindFeatures(EntityKind kind, Features features) {
    const std::string kindName = entityKindToString(kind);
    const auto& ids = identities(kind);
    ClassFeatures next;

    std::visit([&](auto&& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            // Unbind everything
        } else if constexpr (std::is_same_v<T, FeatureMatrix>) {
            const auto& classes = m_descriptor.classes(kind);
            if (classes.size() > 1) {
                throw IncompatibleFeatureLayoutError("Graph has " + std::to_string(classes.size()) + " " +
                                                     kindName + " classes; features must be given per class");
            }
            if (classes.empty()) {
                if (value.rows() != 0) {
                    throw IncompatibleFeatureLayoutError("Feature matrix has " + std::to_string(value.rows()) +
                                                         " rows but the graph has no " + kindName + "s");
                }
                return;
            }
            if (value.rows() != ids.size()) {
                throw IncompatibleFeatureLayoutError("Feature matrix has " + std::to_string(value.rows()) +
                                                     " rows, expected " + std::to_string(ids.size()));
            }
            next.emplace(classes.front(), std::move(value));
        } else {
            for (auto& [entityClass, matrix] : value) {
                m_descriptor.requireClass(kind, entityClass);
                size_t expected = ids.classSize(entityClass);
                if (matrix.rows() != expected) {
                    throw IncompatibleFeatureLayoutError("Feature matrix of class '" + entityClass + "' has " +
                                                         std::to_string(matrix.rows()) + " rows, expected " +
                                                         std::to_string(expected));
                }
                next.emplace(entityClass, std::move(matrix));
            }
        }
    }, std::move(features));

    featureStore(kind) = std::move(next);
    refreshFeatureShapes(kind);
}

void GraphModel::setClassFeatures(const std::string& nodeClass, FeatureMatrix matrix) {
    bindClassFeatures(EntityKind::Node, nodeClass, std::move(matrix));
}

void GraphModel::setEdgeClassFeatures(const std::string& edgeClass, FeatureMatrix matrix) {
    bindClassFeatures(EntityKind::Edge, edgeClass, std::move(matrix));
}

void GraphModel::bindClassFeatures(EntityKind kind, const std::string& entityClass, FeatureMatrix matrix) {
    m_descriptor.requireClass(kind, entityClass);
    size_t expected = identities(kind).classSize(entityClass);
    if (matrix.rows() != expected) {
        throw IncompatibleFeatureLayoutError("Feature matrix of class '" + entityClass + "' has " +
                                             std::to_string(matrix.rows()) + " rows, expected " +
                                             std::to_string(expected));
    }
    featureStore(kind)[entityClass] = std::move(matrix);
    refreshFeatureShapes(kind);
}

std::optional<std::vector<double>> GraphModel::nodeFeatureRow(size_t index) const {
    return featureRow(EntityKind::Node, index);
}

std::optional<std::vector<double>> GraphModel::edgeFeatureRow(size_t index) const {
    return featureRow(EntityKind::Edge, index);
}

std::optional<std::vector<double>> GraphModel::featureRow(EntityKind kind, size_t index) const {
    const auto& ids = identities(kind);
    const auto& store = featureStore(kind);
    auto it = store.find(ids.classOf(index));
    if (it == store.end()) {
        return std::nullopt;
    }
    return it->second.row(ids.classIndexOf(index));
}

void GraphModel::refreshFeatureShapes(EntityKind kind) {
    const auto& store = featureStore(kind);
    for (const auto& entityClass : m_descriptor.classes(kind)) {
        auto it = store.find(entityClass);
        if (it == store.end()) {
            m_descriptor.setFeatureShape(kind, entityClass, std::nullopt);
        } else {
            m_descriptor.setFeatureShape(kind, entityClass, FeatureShape{it->second.rows(), it->second.cols()});
        }
    }
}

// =============================================================================
// Queries
// =============================================================================

SparseMatrix GraphModel::getAdjacency() const {
    std::vector<SparseMatrix::Triplet> triplets;
    triplets.reserve(m_attributes.directed ? m_edges.size() : m_edges.size() * 2);

    for (const auto& edge : m_edges) {
        triplets.push_back({edge.source, edge.target, 1.0});
        if (!m_attributes.directed && edge.source != edge.target) {
            triplets.push_back({edge.target, edge.source, 1.0});
        }
    }
    return SparseMatrix::fromTriplets(m_nodes.size(), m_nodes.size(), std::move(triplets));
}

std::string GraphModel::summary() const {
    std::ostringstream oss;
    oss << "Node count:    " << m_nodes.size() << "\n"
        << "Edge count:    " << m_edges.size() << "\n"
        << "Directed:      " << (m_attributes.directed ? "yes" : "no") << "\n"
        << "Node classes:  " << joinClasses(m_descriptor.nodeClasses()) << "\n"
        << "Edge classes:  " << joinClasses(m_descriptor.edgeClasses()) << "\n"
        << "Node features: " << featureLayoutName(nodeFeatures()) << "\n"
        << "Edge features: " << featureLayoutName(edgeFeatures()) << "\n";
    return oss.str();
}

} // namespace model
