// =================================================================
// include/Collate/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Collate/CliParser.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace Collate {

struct RuleModel;
struct SelectionResult;

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Runs one collection: load rules, select, render and write.
     * @return 0 on success, 1 on any fatal error.
     */
    int run();

    /**
     * @brief Replace the directories searched for a config given by name
     */
    void setConfigSearchPaths(const std::vector<std::filesystem::path>& search_paths);

    /**
     * @brief Streams used by the interactive checklist
     */
    void setInteractiveStreams(std::istream& input, std::ostream& output);

    /**
     * @brief Locate the config named on the command line
     * @throws ConfigError if no candidate exists
     */
    std::filesystem::path resolveConfigPath() const;

    /**
     * @brief Where the document goes: a bare filename lands under Extracts/
     */
    std::filesystem::path resolveOutputPath() const;

    /**
     * @brief Config name without directory, extension or "_extract" suffix
     */
    std::string getConfigLabel() const;

    /**
     * @brief Directory holding the running executable, or the working directory
     */
    static std::filesystem::path executableDirectory();

private:
    int handleCollect();
    bool reviewSelection(SelectionResult& selection);
    void logRules(const RuleModel& rules) const;

    const Commands& m_commands;
    std::vector<std::filesystem::path> m_config_search_paths;
    std::istream* m_input;
    std::ostream* m_output;
};

} // namespace Collate
