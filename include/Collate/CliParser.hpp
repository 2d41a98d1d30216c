// =================================================================
// include/Collate/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Collate {

// A simple struct to hold parsed command information.
struct Commands {
    std::string directory;                 // Base directory to scan
    std::string config_name = "default";   // Config name ("web") or path
    std::string output_path;               // Empty means Extracts/<config>_collection.md
    std::string manifest_path = "files.txt";
    std::string report_path;               // Optional JSON run report
    std::string log_dir;                   // Optional log file directory
    bool interactive = false;
    bool verbose = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Collate
