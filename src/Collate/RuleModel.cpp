// =================================================================
// src/Collate/RuleModel.cpp
// =================================================================
// Implementation for loading the rule model from INI or YAML files.

#include "Collate/RuleModel.hpp"
#include "Collate/ConfigParser.hpp"
#include "Collate/Errors.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <sstream>

namespace Collate {

namespace {

const char* const kGlobalSection = "global";
const char* const kSpecificFilesSection = "specific_files";

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r\f\v");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(first, (last - first + 1));
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> items;
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, delimiter)) {
        std::string trimmed = trim(item);
        if (!trimmed.empty()) {
            items.push_back(trimmed);
        }
    }
    return items;
}

bool hasSuffix(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void append(std::vector<std::string>& target, const std::vector<std::string>& items) {
    target.insert(target.end(), items.begin(), items.end());
}

Section makeSection(const std::string& source,
                    const std::string& name,
                    const std::vector<std::string>& raw_extensions,
                    bool include_subdirs,
                    const std::vector<std::string>& excluded_dirs,
                    const std::vector<std::string>& excluded_files,
                    const GlobalExclusions& global) {
    Section section;
    section.name = name;
    section.include_subdirs = include_subdirs;

    for (const auto& ext : raw_extensions) {
        section.extensions.push_back(normalizeExtension(ext));
    }
    if (section.extensions.empty()) {
        throw ConfigError(source + ": section '" + name + "' lists no extensions");
    }

    // Global exclusions come first, section exclusions are appended
    section.excluded_dirs = global.excluded_dirs;
    append(section.excluded_dirs, excluded_dirs);
    section.excluded_files = global.excluded_files;
    append(section.excluded_files, excluded_files);
    return section;
}

// A YAML list field may be a sequence or a single string in list syntax
std::vector<std::string> yamlList(const YAML::Node& node) {
    std::vector<std::string> items;
    if (!node || node.IsNull()) {
        return items;
    }
    if (node.IsSequence()) {
        for (const auto& item : node) {
            std::string value = trim(item.as<std::string>());
            if (!value.empty()) {
                items.push_back(value);
            }
        }
        return items;
    }
    return parseList(node.as<std::string>());
}

Section yamlSection(const std::string& source, const std::string& name,
                    const YAML::Node& body, const GlobalExclusions& global) {
    if (RuleModel::isReservedSection(name)) {
        throw ConfigError(source + ": '" + name + "' is reserved and cannot name a section");
    }
    if (!body["extensions"]) {
        throw ConfigError(source + ": section '" + name + "' is missing required key 'extensions'");
    }

    bool include_subdirs = true;
    if (body["include_subdirs"]) {
        include_subdirs = body["include_subdirs"].as<bool>();
    }

    return makeSection(source, name, yamlList(body["extensions"]), include_subdirs,
                       yamlList(body["excluded_dirs"]), yamlList(body["excluded_files"]),
                       global);
}

RuleModel fromYamlNode(const YAML::Node& root, const std::string& source) {
    RuleModel model;
    if (!root || root.IsNull()) {
        return model;
    }
    if (!root.IsMap()) {
        throw ConfigError(source + ": YAML rules must be a mapping at the top level");
    }

    if (root[kGlobalSection]) {
        YAML::Node global = root[kGlobalSection];
        model.global.excluded_dirs = yamlList(global["excluded_dirs"]);
        model.global.excluded_files = yamlList(global["excluded_files"]);
    }

    if (root[kSpecificFilesSection]) {
        YAML::Node specific = root[kSpecificFilesSection];
        // Accept both "specific_files: [..]" and "specific_files: {files: [..]}"
        model.specific_files = specific.IsMap() ? yamlList(specific["files"]) : yamlList(specific);
    }

    YAML::Node sections = root["sections"];
    if (sections && sections.IsSequence()) {
        for (const auto& entry : sections) {
            if (!entry["name"]) {
                throw ConfigError(source + ": YAML section entry is missing 'name'");
            }
            model.sections.push_back(yamlSection(source, entry["name"].as<std::string>(), entry, model.global));
        }
    } else if (sections && sections.IsMap()) {
        for (YAML::const_iterator it = sections.begin(); it != sections.end(); ++it) {
            model.sections.push_back(yamlSection(source, it->first.as<std::string>(), it->second, model.global));
        }
    } else if (sections && !sections.IsNull()) {
        throw ConfigError(source + ": 'sections' must be a list or a mapping");
    }

    return model;
}

} // namespace

std::vector<std::string> parseList(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    // A comma anywhere switches the whole value to comma splitting
    if (text.find(',') != std::string::npos) {
        return split(text, ',');
    }
    return split(text, '\n');
}

std::string normalizeExtension(const std::string& extension) {
    if (!extension.empty() && extension[0] == '.') {
        return extension;
    }
    return "." + extension;
}

std::vector<std::filesystem::path> Section::resolveExcludedDirs(const std::filesystem::path& section_dir) const {
    std::vector<std::filesystem::path> anchors;
    anchors.reserve(excluded_dirs.size());
    for (const auto& entry : excluded_dirs) {
        std::filesystem::path anchor = (section_dir / entry).lexically_normal();
        // "build/" normalizes to "build/" with an empty filename
        if (!anchor.has_filename() && anchor.has_relative_path()) {
            anchor = anchor.parent_path();
        }
        anchors.push_back(anchor);
    }
    return anchors;
}

bool Section::acceptsExtension(const std::string& filename) const {
    return std::any_of(extensions.begin(), extensions.end(),
                       [&filename](const std::string& ext) { return hasSuffix(filename, ext); });
}

RuleModel RuleModel::load(const std::string& config_path) {
    if (hasSuffix(config_path, ".yml") || hasSuffix(config_path, ".yaml")) {
        return fromYamlFile(config_path);
    }
    return fromConfig(ConfigParser(config_path));
}

RuleModel RuleModel::fromConfig(const ConfigParser& config) {
    RuleModel model;

    if (config.hasSection(kGlobalSection)) {
        model.global.excluded_dirs = parseList(config.getStringValue(kGlobalSection, "excluded_dirs"));
        model.global.excluded_files = parseList(config.getStringValue(kGlobalSection, "excluded_files"));
    }

    if (config.hasSection(kSpecificFilesSection)) {
        model.specific_files = parseList(config.getStringValue(kSpecificFilesSection, "files"));
    }

    for (const auto& name : config.getSections()) {
        if (isReservedSection(name)) {
            continue;
        }
        if (!config.hasKey(name, "extensions")) {
            throw ConfigError(config.getSourceName() + ": section '" + name +
                              "' is missing required key 'extensions'");
        }

        model.sections.push_back(makeSection(
            config.getSourceName(),
            name,
            parseList(config.getStringValue(name, "extensions")),
            config.getBoolValue(name, "include_subdirs", true),
            parseList(config.getStringValue(name, "excluded_dirs")),
            parseList(config.getStringValue(name, "excluded_files")),
            model.global));
    }

    return model;
}

RuleModel RuleModel::fromYamlFile(const std::string& config_path) {
    try {
        return fromYamlNode(YAML::LoadFile(config_path), config_path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot open config file '" + config_path + "'");
    } catch (const YAML::Exception& e) {
        throw ConfigError(config_path + ": " + e.what());
    }
}

RuleModel RuleModel::fromYamlString(const std::string& text) {
    try {
        return fromYamlNode(YAML::Load(text), "<yaml>");
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("<yaml>: ") + e.what());
    }
}

bool RuleModel::isReservedSection(const std::string& name) {
    return name == kGlobalSection || name == kSpecificFilesSection;
}

std::optional<std::filesystem::path> findConfigFile(const std::string& config_name,
                                                    const std::vector<std::filesystem::path>& search_dirs) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(config_name, ec)) {
        return std::filesystem::path(config_name);
    }

    std::string filename = config_name;
    if (!hasSuffix(filename, ".config") && !hasSuffix(filename, ".yml") && !hasSuffix(filename, ".yaml")) {
        filename += "_extract.config";
    }

    for (const auto& dir : search_dirs) {
        std::filesystem::path candidate = dir / filename;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::vector<std::filesystem::path> defaultConfigSearchPaths(const std::filesystem::path& executable_dir) {
    std::vector<std::filesystem::path> paths;
    if (!executable_dir.empty()) {
        paths.push_back(executable_dir / "configs");
        paths.push_back(executable_dir);
    }
    paths.emplace_back("configs");
    paths.emplace_back(".");
    return paths;
}

} // namespace Collate
