#include "model/ExternalId.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace model {

std::string toString(const ExternalId& id) {
    if (const auto* value = std::get_if<int64_t>(&id)) {
        return std::to_string(*value);
    }
    return std::get<std::string>(id);
}

json idToJson(const ExternalId& id) {
    if (const auto* value = std::get_if<int64_t>(&id)) {
        return *value;
    }
    return std::get<std::string>(id);
}

ExternalId idFromJson(const json& j) {
    if (j.is_number_unsigned()) {
        auto value = j.get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw std::invalid_argument("External id is out of the 64-bit signed range: " + j.dump());
        }
        return static_cast<int64_t>(value);
    }
    if (j.is_number_integer()) {
        return j.get<int64_t>();
    }
    if (j.is_string()) {
        return j.get<std::string>();
    }
    throw std::invalid_argument("External id must be an integer or a string, got: " + j.dump());
}

ExternalId parseId(const std::string& text) {
    if (text.empty()) {
        return text;
    }
    size_t start = (text[0] == '-') ? 1 : 0;
    if (start == text.size()) {
        return text;
    }
    for (size_t i = start; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return text;
        }
    }
    // "007" must stay a string or its text form would change
    if ((text.size() - start > 1 && text[start] == '0') || text == "-0") {
        return text;
    }
    try {
        return static_cast<int64_t>(std::stoll(text));
    } catch (const std::out_of_range&) {
        return text;
    }
}

} // namespace model
