#include <catch2/catch.hpp>
#include "adapters/NpyIO.hpp"
#include "model/Errors.hpp"
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace adapters;
using model::FeatureMatrix;
using model::MalformedSourceError;
using Catch::Detail::Approx;

// Build a version 1.0 .npy byte stream around a header dict and raw data
static std::string npyBytes(const std::string& dict, const std::string& data, char major = 1) {
    std::string header = dict;
    size_t lenSize = major == 1 ? 2 : 4;
    size_t total = 6 + 2 + lenSize + header.size() + 1;
    header.append((64 - total % 64) % 64, ' ');
    header.push_back('\n');

    std::string bytes = "\x93NUMPY";
    bytes.push_back(major);
    bytes.push_back(0);
    uint32_t len = static_cast<uint32_t>(header.size());
    for (size_t i = 0; i < lenSize; ++i) {
        bytes.push_back(static_cast<char>((len >> (8 * i)) & 0xFF));
    }
    return bytes + header + data;
}

static std::string littleEndian(uint64_t value, size_t size) {
    std::string out;
    for (size_t i = 0; i < size; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
    return out;
}

static std::string bigEndian(uint64_t value, size_t size) {
    std::string out = littleEndian(value, size);
    return std::string(out.rbegin(), out.rend());
}

class TempFile {
public:
    TempFile() : m_path("/tmp/test_npy_" + std::to_string(std::rand()) + ".npy") {}
    ~TempFile() { std::filesystem::remove(m_path); }
    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

TEST_CASE("Write and read back a feature matrix", "[NpyIO]") {
    auto matrix = FeatureMatrix::fromRows({{1.5, -2.0, 0.0}, {4.25, 5.0, 1e-3}});

    TempFile file;
    NpyIO::save(matrix, file.path());
    auto loaded = NpyIO::load(file.path());

    CHECK(loaded == matrix);
}

TEST_CASE("Written header is aligned to 64 bytes", "[NpyIO]") {
    std::ostringstream out;
    NpyIO::write(FeatureMatrix::fromRows({{1.0}}), out);
    std::string bytes = out.str();

    const size_t headerEnd = bytes.size() - sizeof(double);
    CHECK(headerEnd % 64 == 0);
    CHECK(bytes.substr(1, 5) == "NUMPY");
    CHECK(bytes[headerEnd - 1] == '\n');
    CHECK(bytes.find("'descr': '<f8'") != std::string::npos);
}

TEST_CASE("Read integer, boolean and float dtypes", "[NpyIO]") {
    SECTION("Little endian int32") {
        std::string data = littleEndian(1, 4) + littleEndian(2, 4) + littleEndian(3, 4) + littleEndian(4, 4);
        std::istringstream in(npyBytes("{'descr': '<i4', 'fortran_order': False, 'shape': (2, 2), }", data));
        auto m = NpyIO::read(in);
        CHECK(m.rows() == 2);
        CHECK(m.cols() == 2);
        CHECK(m.at(1, 0) == Approx(3.0));
    }

    SECTION("Big endian int16 with negative values") {
        std::string data = bigEndian(0xFFFF, 2) + bigEndian(7, 2);
        std::istringstream in(npyBytes("{'descr': '>i2', 'fortran_order': False, 'shape': (1, 2), }", data));
        auto m = NpyIO::read(in);
        CHECK(m.at(0, 0) == Approx(-1.0));
        CHECK(m.at(0, 1) == Approx(7.0));
    }

    SECTION("Booleans") {
        std::string data("\x01\x00\x01", 3);
        std::istringstream in(npyBytes("{'descr': '|b1', 'fortran_order': False, 'shape': (3,), }", data));
        auto m = NpyIO::read(in);
        REQUIRE(m.rows() == 3);
        CHECK(m.cols() == 1);
        CHECK(m.at(0, 0) == 1.0);
        CHECK(m.at(1, 0) == 0.0);
    }

    SECTION("Float32") {
        float values[2] = {0.5f, -1.25f};
        std::string data(reinterpret_cast<const char*>(values), sizeof(values));
        std::istringstream in(npyBytes("{'descr': '<f4', 'fortran_order': False, 'shape': (2, 1), }", data));
        auto m = NpyIO::read(in);
        CHECK(m.at(1, 0) == Approx(-1.25));
    }

    SECTION("Version 2.0 header") {
        std::string data = littleEndian(9, 8);
        std::istringstream in(npyBytes("{'descr': '<u8', 'fortran_order': False, 'shape': (1, 1), }", data, 2));
        CHECK(NpyIO::read(in).at(0, 0) == Approx(9.0));
    }
}

TEST_CASE("Fortran order arrays are transposed into rows", "[NpyIO]") {
    // Column-major [[1, 2, 3], [4, 5, 6]]
    std::string data;
    for (uint64_t v : {1, 4, 2, 5, 3, 6}) {
        data += littleEndian(v, 8);
    }
    std::istringstream in(npyBytes("{'descr': '<i8', 'fortran_order': True, 'shape': (2, 3), }", data));
    auto m = NpyIO::read(in);

    CHECK(m.row(0) == std::vector<double>{1.0, 2.0, 3.0});
    CHECK(m.row(1) == std::vector<double>{4.0, 5.0, 6.0});
}

TEST_CASE("Malformed .npy input", "[NpyIO]") {
    SECTION("Bad magic") {
        std::istringstream in("NOTNUMPY");
        CHECK_THROWS_AS(NpyIO::read(in), MalformedSourceError);
    }

    SECTION("Unsupported dtype") {
        std::istringstream in(npyBytes("{'descr': '<c16', 'fortran_order': False, 'shape': (1,), }",
                                       std::string(16, '\0')));
        CHECK_THROWS_AS(NpyIO::read(in), MalformedSourceError);
    }

    SECTION("Three dimensions") {
        std::istringstream in(npyBytes("{'descr': '<f8', 'fortran_order': False, 'shape': (1, 1, 1), }",
                                       std::string(8, '\0')));
        CHECK_THROWS_AS(NpyIO::read(in), MalformedSourceError);
    }

    SECTION("Truncated data") {
        std::istringstream in(npyBytes("{'descr': '<f8', 'fortran_order': False, 'shape': (2, 2), }",
                                       std::string(8, '\0')));
        CHECK_THROWS_AS(NpyIO::read(in), MalformedSourceError);
    }

    SECTION("Shape whose byte size overflows") {
        std::istringstream in(npyBytes("{'descr': '<f8', 'fortran_order': False, 'shape': (4611686018427387904, 4), }",
                                       std::string(8, '\0')));
        CHECK_THROWS_AS(NpyIO::read(in), MalformedSourceError);
    }

    SECTION("Shape larger than the data present") {
        std::istringstream in(npyBytes("{'descr': '<f8', 'fortran_order': False, 'shape': (100000000000, 1), }",
                                       std::string(8, '\0')));
        CHECK_THROWS_AS(NpyIO::read(in), MalformedSourceError);
    }

    SECTION("Oversized shape in a feats file") {
        TempFile file;
        {
            std::ofstream out(file.path(), std::ios::binary);
            out << npyBytes("{'descr': '<f4', 'fortran_order': False, 'shape': (100000000000, 3), }",
                            std::string(12, '\0'));
        }
        CHECK_THROWS_AS(NpyIO::load(file.path()), MalformedSourceError);
    }

    SECTION("Missing file") {
        CHECK_THROWS_AS(NpyIO::load("/tmp/does_not_exist_graphbridge.npy"), MalformedSourceError);
    }
}
