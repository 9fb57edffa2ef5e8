#include "model/SparseMatrix.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace model {

SparseMatrix SparseMatrix::fromTriplets(size_t rows, size_t cols, std::vector<Triplet> triplets) {
    for (const auto& t : triplets) {
        if (t.row >= rows || t.col >= cols) {
            throw std::out_of_range("Sparse entry (" + std::to_string(t.row) + ", " +
                                    std::to_string(t.col) + ") outside shape (" +
                                    std::to_string(rows) + ", " + std::to_string(cols) + ")");
        }
    }

    std::sort(triplets.begin(), triplets.end(), [](const Triplet& a, const Triplet& b) {
        return a.row != b.row ? a.row < b.row : a.col < b.col;
    });

    SparseMatrix m;
    m.m_rows = rows;
    m.m_cols = cols;
    m.m_indptr.assign(rows + 1, 0);
    m.m_indices.reserve(triplets.size());
    m.m_values.reserve(triplets.size());

    for (size_t i = 0; i < triplets.size(); ++i) {
        const auto& t = triplets[i];
        bool sameAsPrevious = i > 0 && triplets[i - 1].row == t.row && triplets[i - 1].col == t.col;
        if (sameAsPrevious) {
            m.m_values.back() += t.value;
            continue;
        }
        m.m_indices.push_back(t.col);
        m.m_values.push_back(t.value);
        ++m.m_indptr[t.row + 1];
    }

    for (size_t r = 0; r < rows; ++r) {
        m.m_indptr[r + 1] += m.m_indptr[r];
    }
    return m;
}

double SparseMatrix::at(size_t row, size_t col) const {
    if (row >= m_rows || col >= m_cols) {
        throw std::out_of_range("Sparse index out of range");
    }
    auto begin = m_indices.begin() + static_cast<std::ptrdiff_t>(m_indptr[row]);
    auto end = m_indices.begin() + static_cast<std::ptrdiff_t>(m_indptr[row + 1]);
    auto it = std::lower_bound(begin, end, col);
    if (it == end || *it != col) {
        return 0.0;
    }
    return m_values[static_cast<size_t>(it - m_indices.begin())];
}

std::vector<size_t> SparseMatrix::rowIndices(size_t row) const {
    if (row >= m_rows) {
        throw std::out_of_range("Sparse row out of range");
    }
    return std::vector<size_t>(m_indices.begin() + static_cast<std::ptrdiff_t>(m_indptr[row]),
                               m_indices.begin() + static_cast<std::ptrdiff_t>(m_indptr[row + 1]));
}

std::vector<std::vector<double>> SparseMatrix::toDense() const {
    std::vector<std::vector<double>> dense(m_rows, std::vector<double>(m_cols, 0.0));
    for (size_t r = 0; r < m_rows; ++r) {
        for (size_t k = m_indptr[r]; k < m_indptr[r + 1]; ++k) {
            dense[r][m_indices[k]] = m_values[k];
        }
    }
    return dense;
}

} // namespace model
