#pragma once

#include <cstddef>
#include <vector>

namespace model {

/**
 * Compressed sparse row matrix
 *
 * Row r's entries live in [indptr[r], indptr[r + 1]) of indices/values,
 * column indices sorted ascending inside a row.
 */
class SparseMatrix {
public:
    struct Triplet {
        size_t row;
        size_t col;
        double value;
    };

    SparseMatrix() = default;

    /**
     * Build from unordered triplets; duplicates are summed
     * Throws std::out_of_range for coordinates outside the shape
     */
    static SparseMatrix fromTriplets(size_t rows, size_t cols, std::vector<Triplet> triplets);

    size_t rows() const { return m_rows; }
    size_t cols() const { return m_cols; }
    size_t nonZeros() const { return m_indices.size(); }

    /**
     * Value at (row, col), 0 when not stored
     */
    double at(size_t row, size_t col) const;

    /**
     * Column indices stored in a row
     */
    std::vector<size_t> rowIndices(size_t row) const;

    std::vector<std::vector<double>> toDense() const;

    const std::vector<size_t>& indptr() const { return m_indptr; }
    const std::vector<size_t>& indices() const { return m_indices; }
    const std::vector<double>& values() const { return m_values; }

private:
    size_t m_rows = 0;
    size_t m_cols = 0;
    std::vector<size_t> m_indptr{0};
    std::vector<size_t> m_indices;
    std::vector<double> m_values;
};

} // namespace model
