#include "util/Config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace util {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

Config parseStream(std::istream& in) {
    Config config;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (!key.empty()) {
            config.set(key, val);
        }
    }
    return config;
}

} // anonymous namespace

Config Config::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    return parseStream(file);
}

Config Config::fromString(const std::string& text) {
    std::istringstream in(text);
    return parseStream(in);
}

std::string Config::readConnectionFile(const std::string& path) {
    std::string filePath = (!path.empty() && path[0] == '@') ? path.substr(1) : path;
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open connection file: " + filePath);
    }

    std::string connString;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (!connString.empty()) connString += " ";
        connString += line;
    }
    return connString;
}

bool Config::has(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Config::get(const std::string& key, const std::string& fallback) const {
    auto it = m_values.find(key);
    return it != m_values.end() ? it->second : fallback;
}

bool Config::getBool(const std::string& key, bool fallback) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return fallback;
    }
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return fallback;
}

} // namespace util
