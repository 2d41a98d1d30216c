// =================================================================
// src/Collate/ConfigParser.cpp
// =================================================================
// Implementation for the INI-style configuration parser.

#include "Collate/ConfigParser.hpp"
#include "Collate/Errors.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <set>

namespace Collate {

namespace {

const char* const kDefaultSection = "DEFAULT";

// Helper function to trim whitespace from both ends of a string.
std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r\f\v");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(first, (last - first + 1));
}

std::string rtrim(const std::string& s) {
    size_t last = s.find_last_not_of(" \t\n\r\f\v");
    if (std::string::npos == last) {
        return "";
    }
    return s.substr(0, last + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return rtrim(joined);
}

} // namespace

ConfigParser::ConfigParser(const std::string& config_path)
    : m_source_name(config_path)
{
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        throw ConfigError("Cannot open config file '" + config_path + "'");
    }
    parse(config_file);
}

ConfigParser ConfigParser::fromString(const std::string& text, const std::string& source_name) {
    ConfigParser parser;
    parser.m_source_name = source_name;
    std::istringstream input(text);
    parser.parse(input);
    return parser;
}

void ConfigParser::parse(std::istream& input) {
    using LineValues = std::map<std::string, std::vector<std::string>>;

    std::map<std::string, LineValues> raw_sections;
    LineValues raw_defaults;
    std::set<std::string> seen_sections;

    LineValues* current = nullptr;
    std::string current_name;
    std::string current_key;
    size_t indent_level = 0;

    auto fail = [this](size_t line_number, const std::string& what) {
        throw ConfigError(m_source_name + ":" + std::to_string(line_number) + ": " + what);
    };

    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::string value = trim(line);
        bool is_comment = !value.empty() && (value[0] == '#' || value[0] == ';');

        if (value.empty() || is_comment) {
            // Blank lines are kept inside multi-line values; comments never are
            if (!is_comment && current != nullptr && !current_key.empty()) {
                (*current)[current_key].push_back("");
            }
            continue;
        }

        size_t line_indent = line.find_first_not_of(" \t");
        if (current != nullptr && !current_key.empty() && line_indent > indent_level) {
            (*current)[current_key].push_back(value);
            continue;
        }
        indent_level = line_indent;

        size_t close = value.rfind(']');
        if (value[0] == '[' && close != std::string::npos && close > 1) {
            std::string section_name = value.substr(1, close - 1);
            if (section_name == kDefaultSection) {
                current = &raw_defaults;
            } else {
                if (!seen_sections.insert(section_name).second) {
                    fail(line_number, "section '" + section_name + "' already exists");
                }
                m_section_order.push_back(section_name);
                current = &raw_sections[section_name];
            }
            current_name = section_name;
            current_key.clear();
            continue;
        }

        if (current == nullptr) {
            fail(line_number, "file contains no section headers");
        }

        size_t delimiter_pos = value.find_first_of("=:");
        if (delimiter_pos == std::string::npos) {
            fail(line_number, "expected 'key = value', got '" + value + "'");
        }

        std::string key = toLower(trim(value.substr(0, delimiter_pos)));
        if (key.empty()) {
            fail(line_number, "missing key before '" + std::string(1, value[delimiter_pos]) + "'");
        }
        if (current->count(key) > 0) {
            fail(line_number, "key '" + key + "' already set in section '" + current_name + "'");
        }

        current_key = key;
        (*current)[key] = {trim(value.substr(delimiter_pos + 1))};
    }

    if (input.bad()) {
        throw ConfigError("Error reading config file '" + m_source_name + "'");
    }

    for (const auto& entry : raw_defaults) {
        m_defaults[entry.first] = joinLines(entry.second);
    }
    for (const auto& section : raw_sections) {
        auto& values = m_sections[section.first];
        for (const auto& entry : section.second) {
            values[entry.first] = joinLines(entry.second);
        }
    }
}

bool ConfigParser::hasSection(const std::string& section) const {
    return m_sections.find(section) != m_sections.end();
}

bool ConfigParser::hasKey(const std::string& section, const std::string& key) const {
    return findValue(section, key) != nullptr;
}

std::string ConfigParser::getStringValue(const std::string& section, const std::string& key) const {
    const std::string* value = findValue(section, key);
    if (value != nullptr) {
        return *value;
    }
    return ""; // Return empty string if key not found
}

bool ConfigParser::getBoolValue(const std::string& section, const std::string& key, bool fallback) const {
    const std::string* value = findValue(section, key);
    if (value == nullptr) {
        return fallback;
    }

    std::string lowered = toLower(*value);
    if (lowered == "1" || lowered == "yes" || lowered == "true" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "no" || lowered == "false" || lowered == "off") {
        return false;
    }
    throw ConfigError(m_source_name + ": [" + section + "] " + toLower(key) +
                      ": not a boolean: '" + *value + "'");
}

const std::string* ConfigParser::findValue(const std::string& section, const std::string& key) const {
    auto section_it = m_sections.find(section);
    if (section_it == m_sections.end()) {
        return nullptr;
    }

    std::string lowered = toLower(key);
    auto it = section_it->second.find(lowered);
    if (it != section_it->second.end()) {
        return &it->second;
    }

    auto default_it = m_defaults.find(lowered);
    if (default_it != m_defaults.end()) {
        return &default_it->second;
    }
    return nullptr;
}

} // namespace Collate
