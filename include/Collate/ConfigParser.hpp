// =================================================================
// include/Collate/ConfigParser.hpp
// =================================================================
// Defines a parser for INI-style rule configuration files.

#pragma once

#include <string>
#include <vector>
#include <map>
#include <istream>

namespace Collate {

/**
 * @brief Parses a key-value document made of named sections
 *
 * Dialect:
 * - "[name]" starts a section; names are case-sensitive
 * - "key = value" or "key: value"; keys are case-insensitive
 * - lines starting with '#' or ';' are comments
 * - lines indented deeper than their key continue the previous value
 * - "[DEFAULT]" provides fallback keys for every other section
 *
 * Any syntax error raises ConfigError naming the source and line.
 */
class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the configuration file.
     * @throws ConfigError if the file is missing, unreadable or malformed.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Parses configuration text held in memory.
     * @param text Document contents
     * @param source_name Name used in error messages
     */
    static ConfigParser fromString(const std::string& text,
                                   const std::string& source_name = "<string>");

    /**
     * @brief Section names in declaration order, DEFAULT excluded.
     */
    const std::vector<std::string>& getSections() const { return m_section_order; }

    bool hasSection(const std::string& section) const;

    /**
     * @brief Check whether a key is set in a section or in DEFAULT.
     */
    bool hasKey(const std::string& section, const std::string& key) const;

    /**
     * @brief Retrieves a string value for a given key.
     * @param section Section name
     * @param key The configuration key (e.g., "extensions").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& section, const std::string& key) const;

    /**
     * @brief Retrieves a boolean value.
     *
     * Accepts 1/yes/true/on and 0/no/false/off in any case.
     * @param fallback Returned when the key is absent
     * @throws ConfigError if the value is not a recognized boolean
     */
    bool getBoolValue(const std::string& section, const std::string& key, bool fallback) const;

    const std::string& getSourceName() const { return m_source_name; }

private:
    ConfigParser() = default;

    void parse(std::istream& input);

    const std::string* findValue(const std::string& section, const std::string& key) const;

    std::string m_source_name;
    std::vector<std::string> m_section_order;
    std::map<std::string, std::map<std::string, std::string>> m_sections;
    std::map<std::string, std::string> m_defaults;
};

} // namespace Collate
