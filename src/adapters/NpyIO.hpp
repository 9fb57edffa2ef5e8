#pragma once

#include "model/FeatureMatrix.hpp"
#include <iosfwd>
#include <string>

namespace adapters {

/**
 * Reader/writer for NumPy .npy arrays holding feature matrices
 *
 * Reads format versions 1.0 to 3.0 with boolean, integer and floating point
 * dtypes in either byte order and either memory order. A 1-D array of length n
 * is read as an (n, 1) matrix. Writes version 1.0, '<f8', C order.
 */
class NpyIO {
public:
    /**
     * Throws MalformedSourceError if the file cannot be opened or parsed
     */
    static model::FeatureMatrix load(const std::string& path);
    static model::FeatureMatrix read(std::istream& in);

    /**
     * Throws std::runtime_error if the file cannot be written
     */
    static void save(const model::FeatureMatrix& matrix, const std::string& path);
    static void write(const model::FeatureMatrix& matrix, std::ostream& out);
};

} // namespace adapters
