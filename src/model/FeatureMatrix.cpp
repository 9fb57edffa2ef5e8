#include "model/FeatureMatrix.hpp"
#include <stdexcept>

namespace model {

FeatureMatrix::FeatureMatrix(size_t rows, size_t cols)
    : m_rows(rows), m_cols(cols), m_data(rows * cols, 0.0) {}

FeatureMatrix::FeatureMatrix(size_t rows, size_t cols, std::vector<double> data)
    : m_rows(rows), m_cols(cols), m_data(std::move(data)) {
    if (m_data.size() != rows * cols) {
        throw std::invalid_argument("Feature data size " + std::to_string(m_data.size()) +
                                    " does not match shape (" + std::to_string(rows) + ", " +
                                    std::to_string(cols) + ")");
    }
}

FeatureMatrix FeatureMatrix::fromRows(const std::vector<std::vector<double>>& rows) {
    if (rows.empty()) {
        return FeatureMatrix();
    }
    FeatureMatrix matrix(0, rows.front().size());
    matrix.m_data.reserve(rows.size() * matrix.m_cols);
    for (const auto& values : rows) {
        matrix.appendRow(values);
    }
    return matrix;
}

double FeatureMatrix::at(size_t row, size_t col) const {
    if (row >= m_rows || col >= m_cols) {
        throw std::out_of_range("Feature index (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") out of range");
    }
    return m_data[row * m_cols + col];
}

double& FeatureMatrix::at(size_t row, size_t col) {
    if (row >= m_rows || col >= m_cols) {
        throw std::out_of_range("Feature index (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") out of range");
    }
    return m_data[row * m_cols + col];
}

std::vector<double> FeatureMatrix::row(size_t index) const {
    if (index >= m_rows) {
        throw std::out_of_range("Feature row " + std::to_string(index) + " out of range");
    }
    auto begin = m_data.begin() + static_cast<std::ptrdiff_t>(index * m_cols);
    return std::vector<double>(begin, begin + static_cast<std::ptrdiff_t>(m_cols));
}

void FeatureMatrix::appendRow(const std::vector<double>& values) {
    if (m_rows == 0 && m_cols == 0) {
        m_cols = values.size();
    }
    if (values.size() != m_cols) {
        throw std::invalid_argument("Feature row has width " + std::to_string(values.size()) +
                                    ", expected " + std::to_string(m_cols));
    }
    m_data.insert(m_data.end(), values.begin(), values.end());
    ++m_rows;
}

FeatureMatrix FeatureMatrix::selectRows(const std::vector<size_t>& indices) const {
    FeatureMatrix result(0, m_cols);
    result.m_data.reserve(indices.size() * m_cols);
    for (size_t index : indices) {
        if (index >= m_rows) {
            throw std::out_of_range("Feature row " + std::to_string(index) + " out of range");
        }
        auto begin = m_data.begin() + static_cast<std::ptrdiff_t>(index * m_cols);
        result.m_data.insert(result.m_data.end(), begin, begin + static_cast<std::ptrdiff_t>(m_cols));
        ++result.m_rows;
    }
    return result;
}

bool FeatureMatrix::operator==(const FeatureMatrix& other) const {
    return m_rows == other.m_rows && m_cols == other.m_cols && m_data == other.m_data;
}

std::string featureLayoutName(const Features& features) {
    switch (features.index()) {
        case 0: return "none";
        case 1: return "single";
        default: return "per_class";
    }
}

bool hasFeatures(const Features& features) {
    return !std::holds_alternative<std::monostate>(features);
}

} // namespace model
