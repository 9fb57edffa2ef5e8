#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace model {

/**
 * Dense 2-D feature array (row-major doubles)
 *
 * Row i holds the features of the i-th member of a class (or of the graph,
 * for a single homogeneous matrix).
 */
class FeatureMatrix {
public:
    FeatureMatrix() = default;

    /**
     * Zero-filled matrix of the given shape
     */
    FeatureMatrix(size_t rows, size_t cols);

    /**
     * Matrix from row-major data
     * Throws std::invalid_argument if data.size() != rows * cols
     */
    FeatureMatrix(size_t rows, size_t cols, std::vector<double> data);

    /**
     * Matrix from a list of equally sized rows
     * Throws std::invalid_argument if the rows differ in width
     */
    static FeatureMatrix fromRows(const std::vector<std::vector<double>>& rows);

    size_t rows() const { return m_rows; }
    size_t cols() const { return m_cols; }
    bool empty() const { return m_rows == 0; }

    double at(size_t row, size_t col) const;
    double& at(size_t row, size_t col);

    std::vector<double> row(size_t index) const;
    void appendRow(const std::vector<double>& values);

    /**
     * New matrix made of the given rows, in the given order
     */
    FeatureMatrix selectRows(const std::vector<size_t>& indices) const;

    const std::vector<double>& data() const { return m_data; }

    bool operator==(const FeatureMatrix& other) const;
    bool operator!=(const FeatureMatrix& other) const { return !(*this == other); }

private:
    size_t m_rows = 0;
    size_t m_cols = 0;
    std::vector<double> m_data;
};

/**
 * Feature matrices keyed by class name
 */
using ClassFeatures = std::map<std::string, FeatureMatrix>;

/**
 * Feature binding of one entity kind
 *
 * - std::monostate: no features
 * - FeatureMatrix:  one matrix for a homogeneous graph
 * - ClassFeatures:  one matrix per class of a heterogeneous graph
 */
using Features = std::variant<std::monostate, FeatureMatrix, ClassFeatures>;

/**
 * "none", "single" or "per_class"
 */
std::string featureLayoutName(const Features& features);

bool hasFeatures(const Features& features);

} // namespace model
