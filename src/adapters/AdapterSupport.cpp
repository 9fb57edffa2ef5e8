#include "adapters/AdapterSupport.hpp"
#include "model/Errors.hpp"
#include <type_traits>

namespace adapters {

using model::FeatureMatrix;
using model::IncompatibleFeatureLayoutError;
using model::MalformedSourceError;

const char* const kLabelsAttribute = "labels";
const char* const kIdAttribute = "id";
const char* const kFeaturesProperty = "_features";
const char* const kMembershipProperty = "_membership";

void checkFeatureLayout(const model::GraphModel& graph, Format format, const SerializeOptions& options) {
    const FormatCapabilities caps = capabilitiesOf(format);
    const std::string name = formatToString(format);

    std::visit([&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, model::ClassFeatures>) {
            if (caps.perClassNodeFeatures) {
                return;
            }
            if (!options.flattenClasses) {
                throw IncompatibleFeatureLayoutError(
                    "Graph binds " + std::to_string(value.size()) + " per-class node feature matrices; format '" +
                    name + "' stores a single homogeneous matrix (flatten the classes first)");
            }
            // Throws when the classes cannot be stitched
            flattenClassFeatures(graph);
        }
    }, graph.nodeFeatures());

    std::visit([&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, model::FeatureMatrix>) {
            if (!caps.edgeFeatures) {
                throw IncompatibleFeatureLayoutError("Format '" + name + "' cannot store edge features");
            }
        } else if constexpr (std::is_same_v<T, model::ClassFeatures>) {
            if (!caps.edgeFeatures || !caps.perClassEdgeFeatures) {
                throw IncompatibleFeatureLayoutError("Format '" + name + "' cannot store per-class edge features");
            }
        }
    }, graph.edgeFeatures());
}

std::optional<FeatureMatrix> singleNodeMatrix(const model::GraphModel& graph, const SerializeOptions& options) {
    return std::visit([&](const auto& value) -> std::optional<FeatureMatrix> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, FeatureMatrix>) {
            return value;
        } else {
            if (!options.flattenClasses) {
                throw IncompatibleFeatureLayoutError(
                    "Per-class node features need flattening before they can be stored as one matrix");
            }
            return flattenClassFeatures(graph);
        }
    }, graph.nodeFeatures());
}

FeatureMatrix flattenClassFeatures(const model::GraphModel& graph) {
    const auto& classes = graph.descriptor().nodeClasses();
    std::optional<size_t> width;
    for (const auto& nodeClass : classes) {
        auto shape = graph.descriptor().featureShape(model::EntityKind::Node, nodeClass);
        if (!shape) {
            throw IncompatibleFeatureLayoutError("Cannot flatten node features: class '" + nodeClass +
                                                 "' has no feature matrix");
        }
        if (width && *width != shape->cols) {
            throw IncompatibleFeatureLayoutError("Cannot flatten node features: class '" + nodeClass +
                                                 "' has width " + std::to_string(shape->cols) +
                                                 ", other classes have " + std::to_string(*width));
        }
        width = shape->cols;
    }

    FeatureMatrix flat(0, width.value_or(0));
    for (size_t i = 0; i < graph.nodeCount(); ++i) {
        flat.appendRow(*graph.nodeFeatureRow(i));
    }
    return flat;
}

model::Features splitNodeFeatures(const model::GraphModel& graph, const FeatureMatrix& matrix) {
    if (!graph.descriptor().isHeterogeneous(model::EntityKind::Node)) {
        return matrix;
    }
    model::ClassFeatures perClass;
    for (const auto& nodeClass : graph.descriptor().nodeClasses()) {
        perClass.emplace(nodeClass, matrix.selectRows(*graph[nodeClass].members));
    }
    return perClass;
}

std::vector<std::string> labelsFromJson(const json& value, const std::string& context) {
    if (value.is_null()) {
        return {};
    }
    if (value.is_string()) {
        return {value.get<std::string>()};
    }
    if (!value.is_array()) {
        throw MalformedSourceError(context + ": 'labels' must be an array of strings");
    }
    std::vector<std::string> labels;
    labels.reserve(value.size());
    for (const auto& label : value) {
        if (!label.is_string()) {
            throw MalformedSourceError(context + ": 'labels' must be an array of strings");
        }
        labels.push_back(label.get<std::string>());
    }
    return labels;
}

json labelsToJson(const std::vector<std::string>& labels) {
    return json(labels);
}

std::vector<double> numbersFromJson(const json& value, const std::string& context) {
    if (!value.is_array()) {
        throw MalformedSourceError(context + ": expected an array of numbers");
    }
    std::vector<double> numbers;
    numbers.reserve(value.size());
    for (const auto& v : value) {
        if (!v.is_number()) {
            throw MalformedSourceError(context + ": expected an array of numbers, found " + v.dump());
        }
        numbers.push_back(v.get<double>());
    }
    return numbers;
}

std::vector<int> membershipFromJson(const json& value, const std::string& context) {
    if (!value.is_array()) {
        throw MalformedSourceError(context + ": class membership must be an array");
    }
    std::vector<int> membership;
    membership.reserve(value.size());
    for (const auto& v : value) {
        if (v.is_boolean()) {
            membership.push_back(v.get<bool>() ? 1 : 0);
        } else if (v.is_number_integer()) {
            membership.push_back(v.get<int>());
        } else {
            throw MalformedSourceError(context + ": class membership entries must be integers, found " + v.dump());
        }
    }
    return membership;
}

json takeAttribute(json& object, const std::string& key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    if (it == object.end()) {
        return nullptr;
    }
    json value = std::move(*it);
    object.erase(it);
    return value;
}

} // namespace adapters
