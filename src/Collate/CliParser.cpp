// =================================================================
// src/Collate/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Collate/CliParser.hpp"

namespace Collate {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Collate: collect project source files into a single Markdown document.");

    m_app->add_option("directory", m_commands.directory, "Base directory of the project")->required();
    m_app->add_option("-c,--config", m_commands.config_name,
                      "Config to use: a name such as 'web' (looked up as configs/web_extract.config) or a file path")
        ->capture_default_str();
    m_app->add_option("-o,--output", m_commands.output_path,
                      "Output file path; a bare filename is placed under Extracts/ (default: Extracts/<config>_collection.md)");
    m_app->add_option("-m,--manifest", m_commands.manifest_path, "Where to write the list of collected files")
        ->capture_default_str();
    m_app->add_option("-r,--report", m_commands.report_path, "Write a JSON summary of the run to this path");
    m_app->add_flag("-i,--interactive", m_commands.interactive,
                    "Review the selected files in a checklist before writing");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Show debug output");
    m_app->add_option("--log-dir", m_commands.log_dir, "Also write log files to this directory");

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

} // namespace Collate
