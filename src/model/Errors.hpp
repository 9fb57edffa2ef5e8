#pragma once

#include <stdexcept>
#include <string>

namespace model {

/**
 * Base class for every error raised by the conversion core
 */
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * An external id was inserted twice for the same entity kind
 */
class DuplicateIdentifierError : public GraphError {
public:
    explicit DuplicateIdentifierError(const std::string& message) : GraphError(message) {}
};

/**
 * An edge references an endpoint that is not in the identity map
 */
class DanglingReferenceError : public GraphError {
public:
    explicit DanglingReferenceError(const std::string& message) : GraphError(message) {}
};

/**
 * A semantic class is not registered in the heterogeneity descriptor
 */
class UnknownClassError : public GraphError {
public:
    explicit UnknownClassError(const std::string& message) : GraphError(message) {}
};

/**
 * A mandatory artifact is missing, or an artifact that is present cannot be parsed
 */
class MalformedSourceError : public GraphError {
public:
    explicit MalformedSourceError(const std::string& message) : GraphError(message) {}
};

/**
 * Feature bindings do not fit the target layout
 * (per-class features into a single-matrix format, mismatched widths or row counts)
 */
class IncompatibleFeatureLayoutError : public GraphError {
public:
    explicit IncompatibleFeatureLayoutError(const std::string& message) : GraphError(message) {}
};

} // namespace model
