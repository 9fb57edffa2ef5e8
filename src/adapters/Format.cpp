#include "adapters/Format.hpp"
#include <stdexcept>

namespace adapters {

std::string formatToString(Format format) {
    switch (format) {
        case Format::Database:   return "database";
        case Format::BoostGraph: return "boost_graph";
        case Format::GraphSage:  return "graphsage";
    }
    return "unknown";
}

Format stringToFormat(const std::string& str) {
    if (str == "database" || str == "db") return Format::Database;
    if (str == "boost_graph" || str == "boost") return Format::BoostGraph;
    if (str == "graphsage") return Format::GraphSage;
    throw std::invalid_argument("Unknown graph format: " + str);
}

FormatCapabilities capabilitiesOf(Format format) {
    switch (format) {
        case Format::Database:
        case Format::BoostGraph:
            return FormatCapabilities{true, true, true};
        case Format::GraphSage:
            return FormatCapabilities{false, false, false};
    }
    return FormatCapabilities{};
}

} // namespace adapters
