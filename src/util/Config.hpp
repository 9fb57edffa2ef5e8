#pragma once

#include <map>
#include <string>
#include <optional>

namespace util {

/**
 * Key/value configuration loaded from a plain text file
 *
 * File format (one entry per line, '#' starts a comment line):
 *   log_level = debug
 *   postgres = @/etc/graphbridge/postgres.conf
 *   walks = strict
 *
 * Values starting with '@' can be expanded with readConnectionFile(), which
 * joins the referenced file's non-comment lines with spaces (libpq style).
 */
class Config {
public:
    Config() = default;

    /**
     * Parse a configuration file
     * Throws std::runtime_error if the file cannot be opened
     */
    static Config fromFile(const std::string& path);

    /**
     * Parse configuration text (same format as files)
     */
    static Config fromString(const std::string& text);

    /**
     * Join the lines of a connection parameter file into one string.
     * Accepts the path with or without the leading '@'.
     */
    static std::string readConnectionFile(const std::string& path);

    bool has(const std::string& key) const;
    std::optional<std::string> get(const std::string& key) const;
    std::string get(const std::string& key, const std::string& fallback) const;
    bool getBool(const std::string& key, bool fallback) const;

    void set(const std::string& key, const std::string& value) { m_values[key] = value; }
    const std::map<std::string, std::string>& values() const { return m_values; }
    size_t size() const { return m_values.size(); }

private:
    std::map<std::string, std::string> m_values;
};

} // namespace util
