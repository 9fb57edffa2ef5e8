#include "adapters/NpyIO.hpp"
#include "model/Errors.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <istream>
#include <limits>
#include <ostream>
#include <regex>
#include <sstream>
#include <vector>

namespace adapters {

using model::FeatureMatrix;
using model::MalformedSourceError;

namespace {

constexpr char kMagic[] = "\x93NUMPY";
constexpr size_t kMagicSize = 6;

bool isSystemLittleEndian() {
    uint16_t value = 1;
    return *reinterpret_cast<uint8_t*>(&value) == 1;
}

void swapBytes(char* data, size_t count, size_t itemsize) {
    for (size_t i = 0; i < count; ++i) {
        std::reverse(data + i * itemsize, data + (i + 1) * itemsize);
    }
}

enum class Kind { Bool, Int, UInt, Float };

struct DType {
    Kind kind;
    size_t itemsize;
    bool needsSwap;
};

DType parseDType(const std::string& descr) {
    if (descr.empty()) {
        throw MalformedSourceError("Empty dtype descriptor in .npy header");
    }

    char endian = descr[0];
    std::string typeStr = descr;
    bool little = isSystemLittleEndian();
    if (endian == '<' || endian == '>' || endian == '|' || endian == '=') {
        typeStr = descr.substr(1);
        if (endian == '<') little = true;
        if (endian == '>') little = false;
    }
    if (typeStr.empty()) {
        throw MalformedSourceError("Invalid dtype descriptor: " + descr);
    }

    char typeChar = typeStr[0];
    size_t size = 0;
    if (typeStr.size() > 1) {
        try {
            size = static_cast<size_t>(std::stoul(typeStr.substr(1)));
        } catch (const std::exception&) {
            throw MalformedSourceError("Invalid dtype descriptor: " + descr);
        }
    }

    DType dtype{Kind::Float, 8, false};
    switch (typeChar) {
        case '?':
            dtype = DType{Kind::Bool, 1, false};
            break;
        case 'b':
            // '|b1' is NumPy's boolean, a bare 'b' is a signed byte
            dtype = size == 1 ? DType{Kind::Bool, 1, false} : DType{Kind::Int, 1, false};
            break;
        case 'B':
            dtype = DType{Kind::UInt, 1, false};
            break;
        case 'i':
        case 'u':
            if (size != 1 && size != 2 && size != 4 && size != 8) {
                throw MalformedSourceError("Unsupported integer size in dtype: " + descr);
            }
            dtype = DType{typeChar == 'i' ? Kind::Int : Kind::UInt, size, false};
            break;
        case 'f':
            if (size != 4 && size != 8) {
                throw MalformedSourceError("Unsupported float size in dtype: " + descr);
            }
            dtype = DType{Kind::Float, size, false};
            break;
        case 'd':
            dtype = DType{Kind::Float, 8, false};
            break;
        default:
            throw MalformedSourceError("Unsupported dtype: " + descr);
    }

    dtype.needsSwap = dtype.itemsize > 1 && little != isSystemLittleEndian();
    return dtype;
}

struct Header {
    std::string descr;
    bool fortranOrder = false;
    std::vector<size_t> shape;
};

std::vector<size_t> parseShape(const std::string& text) {
    std::string clean = text;
    clean.erase(std::remove(clean.begin(), clean.end(), ' '), clean.end());

    std::vector<size_t> shape;
    std::stringstream ss(clean);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        try {
            shape.push_back(static_cast<size_t>(std::stoull(item)));
        } catch (const std::exception&) {
            throw MalformedSourceError("Invalid shape in .npy header: (" + text + ")");
        }
    }
    return shape;
}

Header parseHeader(const std::string& header) {
    Header result;

    std::regex descrRegex(R"('descr'\s*:\s*'([^']+)')");
    std::smatch descrMatch;
    if (!std::regex_search(header, descrMatch, descrRegex)) {
        throw MalformedSourceError("Missing 'descr' in .npy header");
    }
    result.descr = descrMatch[1].str();

    std::regex fortranRegex(R"('fortran_order'\s*:\s*(True|False))");
    std::smatch fortranMatch;
    if (std::regex_search(header, fortranMatch, fortranRegex)) {
        result.fortranOrder = fortranMatch[1].str() == "True";
    }

    std::regex shapeRegex(R"('shape'\s*:\s*\(([^)]*)\))");
    std::smatch shapeMatch;
    if (!std::regex_search(header, shapeMatch, shapeRegex)) {
        throw MalformedSourceError("Missing 'shape' in .npy header");
    }
    result.shape = parseShape(shapeMatch[1].str());

    return result;
}

template <typename T>
double readValue(const char* p) {
    T value;
    std::memcpy(&value, p, sizeof(T));
    return static_cast<double>(value);
}

double toDouble(const char* p, const DType& dtype) {
    switch (dtype.kind) {
        case Kind::Bool:
            return *p != 0 ? 1.0 : 0.0;
        case Kind::Int:
            switch (dtype.itemsize) {
                case 1: return readValue<int8_t>(p);
                case 2: return readValue<int16_t>(p);
                case 4: return readValue<int32_t>(p);
                default: return readValue<int64_t>(p);
            }
        case Kind::UInt:
            switch (dtype.itemsize) {
                case 1: return readValue<uint8_t>(p);
                case 2: return readValue<uint16_t>(p);
                case 4: return readValue<uint32_t>(p);
                default: return readValue<uint64_t>(p);
            }
        case Kind::Float:
            return dtype.itemsize == 4 ? readValue<float>(p) : readValue<double>(p);
    }
    return 0.0;
}

/**
 * Size of the data block declared by the header
 * Throws MalformedSourceError if rows * cols * itemsize does not fit in size_t
 */
size_t dataByteCount(size_t rows, size_t cols, size_t itemsize) {
    constexpr size_t kMax = std::numeric_limits<size_t>::max();
    if (cols != 0 && rows > kMax / cols) {
        throw MalformedSourceError("Shape (" + std::to_string(rows) + ", " + std::to_string(cols) +
                                   ") in .npy header is too large");
    }
    size_t count = rows * cols;
    if (count != 0 && itemsize > kMax / count) {
        throw MalformedSourceError("Shape (" + std::to_string(rows) + ", " + std::to_string(cols) +
                                   ") in .npy header is too large");
    }
    return count * itemsize;
}

/**
 * Read exactly byteCount bytes of array data
 *
 * Seekable streams are checked against their remaining size before anything
 * is allocated; other streams are read in chunks so that the buffer never
 * grows past the data actually present.
 */
std::vector<char> readData(std::istream& in, size_t byteCount) {
    const auto truncated = [byteCount]() {
        return MalformedSourceError("Truncated .npy data: expected " + std::to_string(byteCount) + " bytes");
    };

    std::streampos start = in.tellg();
    if (start != std::streampos(-1)) {
        in.seekg(0, std::ios::end);
        std::streampos end = in.tellg();
        in.clear();
        in.seekg(start);
        if (end != std::streampos(-1)) {
            std::streamoff remaining = end - start;
            if (remaining < 0 || static_cast<size_t>(remaining) < byteCount) {
                throw truncated();
            }
        }
    }

    constexpr size_t kChunkSize = size_t{1} << 20;
    std::vector<char> raw;
    while (raw.size() < byteCount) {
        size_t chunk = std::min(kChunkSize, byteCount - raw.size());
        size_t offset = raw.size();
        raw.resize(offset + chunk);
        if (!in.read(raw.data() + offset, static_cast<std::streamsize>(chunk))) {
            throw truncated();
        }
    }
    return raw;
}

} // anonymous namespace

FeatureMatrix NpyIO::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw MalformedSourceError("Cannot open .npy file: " + path);
    }
    try {
        return read(file);
    } catch (const MalformedSourceError& e) {
        throw MalformedSourceError(path + ": " + e.what());
    }
}

FeatureMatrix NpyIO::read(std::istream& in) {
    char magic[kMagicSize];
    if (!in.read(magic, kMagicSize) || std::memcmp(magic, kMagic, kMagicSize) != 0) {
        throw MalformedSourceError("Invalid .npy magic bytes");
    }

    uint8_t version[2];
    if (!in.read(reinterpret_cast<char*>(version), 2)) {
        throw MalformedSourceError("Truncated .npy header");
    }
    if (version[0] < 1 || version[0] > 3) {
        throw MalformedSourceError("Unsupported .npy format version: " + std::to_string(version[0]) + "." +
                                   std::to_string(version[1]));
    }

    // Header length is little endian: 2 bytes in v1, 4 bytes in v2/v3
    uint32_t headerLen = 0;
    uint8_t lenBytes[4] = {0, 0, 0, 0};
    size_t lenSize = version[0] == 1 ? 2 : 4;
    if (!in.read(reinterpret_cast<char*>(lenBytes), static_cast<std::streamsize>(lenSize))) {
        throw MalformedSourceError("Truncated .npy header");
    }
    for (size_t i = 0; i < lenSize; ++i) {
        headerLen |= static_cast<uint32_t>(lenBytes[i]) << (8 * i);
    }

    std::string header(headerLen, '\0');
    if (!in.read(&header[0], headerLen)) {
        throw MalformedSourceError("Truncated .npy header");
    }

    Header npy = parseHeader(header);
    DType dtype = parseDType(npy.descr);

    size_t rows = 0;
    size_t cols = 0;
    if (npy.shape.size() == 1) {
        rows = npy.shape[0];
        cols = 1;
    } else if (npy.shape.size() == 2) {
        rows = npy.shape[0];
        cols = npy.shape[1];
    } else {
        throw MalformedSourceError("Feature arrays must be 1-D or 2-D, got " +
                                   std::to_string(npy.shape.size()) + " dimensions");
    }

    const size_t byteCount = dataByteCount(rows, cols, dtype.itemsize);
    const size_t count = rows * cols;
    std::vector<char> raw = readData(in, byteCount);
    if (dtype.needsSwap) {
        swapBytes(raw.data(), count, dtype.itemsize);
    }

    std::vector<double> values(count);
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            size_t source = npy.fortranOrder ? c * rows + r : r * cols + c;
            values[r * cols + c] = toDouble(raw.data() + source * dtype.itemsize, dtype);
        }
    }
    return FeatureMatrix(rows, cols, std::move(values));
}

void NpyIO::save(const FeatureMatrix& matrix, const std::string& path) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    write(matrix, file);
    if (!file) {
        throw std::runtime_error("Failed to write .npy file: " + path);
    }
}

void NpyIO::write(const FeatureMatrix& matrix, std::ostream& out) {
    std::ostringstream dict;
    dict << "{'descr': '<f8', 'fortran_order': False, 'shape': (" << matrix.rows() << ", " << matrix.cols()
         << "), }";
    std::string header = dict.str();

    // Magic + version + 2-byte length + header + '\n' must be a multiple of 64
    size_t total = kMagicSize + 2 + 2 + header.size() + 1;
    header.append((64 - total % 64) % 64, ' ');
    header.push_back('\n');

    out.write(kMagic, kMagicSize);
    const char version[2] = {1, 0};
    out.write(version, 2);
    uint16_t len = static_cast<uint16_t>(header.size());
    const char lenBytes[2] = {static_cast<char>(len & 0xFF), static_cast<char>((len >> 8) & 0xFF)};
    out.write(lenBytes, 2);
    out.write(header.data(), static_cast<std::streamsize>(header.size()));

    for (double value : matrix.data()) {
        char bytes[sizeof(double)];
        std::memcpy(bytes, &value, sizeof(double));
        if (!isSystemLittleEndian()) {
            std::reverse(bytes, bytes + sizeof(double));
        }
        out.write(bytes, sizeof(double));
    }
}

} // namespace adapters
