// =================================================================
// include/Collate/RuleModel.hpp
// =================================================================
// Rule model: which directories, extensions and exclusions make up a
// collection, and how it is loaded from a configuration file.

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace Collate {

class ConfigParser;

/**
 * @brief Exclusions applied to every section before its own
 */
struct GlobalExclusions {
    std::vector<std::string> excluded_dirs;
    std::vector<std::string> excluded_files;
};

/**
 * @brief A named rule group mapping to one subdirectory of the base
 * directory
 */
struct Section {
    std::string name;                         ///< Subdirectory, relative to the base directory
    std::vector<std::string> extensions;      ///< Always dot-prefixed
    bool include_subdirs = true;
    std::vector<std::string> excluded_dirs;   ///< Global entries first, then the section's own
    std::vector<std::string> excluded_files;  ///< Global entries first, then the section's own

    /**
     * @brief Resolve excluded_dirs against the section directory
     *
     * Each entry is joined onto @p section_dir (an absolute entry stays as
     * is), lexically normalized and stripped of a trailing separator.
     * @param section_dir Absolute path of this section's directory
     * @return Absolute anchors for boundary-aware prefix comparison
     */
    std::vector<std::filesystem::path> resolveExcludedDirs(const std::filesystem::path& section_dir) const;

    /**
     * @brief Check if a filename ends with one of the section's extensions
     */
    bool acceptsExtension(const std::string& filename) const;
};

/**
 * @brief In-memory rule set for one run
 */
struct RuleModel {
    GlobalExclusions global;
    std::vector<Section> sections;
    std::vector<std::string> specific_files;  ///< Relative to the base directory

    /**
     * @brief Load a rule model from a configuration file
     *
     * Files ending in .yml or .yaml are read as YAML, anything else as an
     * INI-style document.
     * @param config_path Path to the configuration file
     * @throws ConfigError if the file cannot be read or is invalid
     */
    static RuleModel load(const std::string& config_path);

    /**
     * @brief Build a rule model from an already parsed INI document
     * @throws ConfigError if a section lacks its extensions key
     */
    static RuleModel fromConfig(const ConfigParser& config);

    /**
     * @brief Build a rule model from a YAML file
     * @throws ConfigError on YAML syntax or layout errors
     */
    static RuleModel fromYamlFile(const std::string& config_path);

    /**
     * @brief Build a rule model from YAML text
     */
    static RuleModel fromYamlString(const std::string& text);

    /**
     * @brief "global" and "specific_files" never name a directory
     */
    static bool isReservedSection(const std::string& name);
};

/**
 * @brief Split a configuration value into list items
 *
 * Splits on commas when the text contains one, otherwise on newlines.
 * Items are trimmed and empty items dropped.
 */
std::vector<std::string> parseList(const std::string& text);

/**
 * @brief Prefix an extension with '.' unless it already has one
 */
std::string normalizeExtension(const std::string& extension);

/**
 * @brief Locate a configuration file by name
 *
 * An existing file path is returned as is. Otherwise a bare name such as
 * "web" becomes "web_extract.config" (names already ending in .config,
 * .yml or .yaml are kept) and is looked up in each search directory.
 * @param config_name Name or path given on the command line
 * @param search_dirs Directories to look in, in priority order
 * @return Path of the first match, or std::nullopt
 */
std::optional<std::filesystem::path> findConfigFile(const std::string& config_name,
                                                    const std::vector<std::filesystem::path>& search_dirs);

/**
 * @brief Default lookup order for configuration files
 * @param executable_dir Directory holding the running executable
 * @return configs/ beside the executable, the executable's directory,
 *         ./configs and the working directory
 */
std::vector<std::filesystem::path> defaultConfigSearchPaths(const std::filesystem::path& executable_dir);

} // namespace Collate
