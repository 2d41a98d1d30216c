// =================================================================
// src/Collate/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Collate/Core.hpp"
#include "Collate/Errors.hpp"
#include "Collate/Logger.hpp"
#include "Collate/RuleModel.hpp"
#include "Collate/SelectionEngine.hpp"
#include "Collate/DocumentRenderer.hpp"
#include "Collate/InteractiveChecklist.hpp"
#include "Collate/RunReport.hpp"
#include <chrono>
#include <sstream>
#include <utility>

#if defined(_WIN32)
#ifndef NOGDI
#define NOGDI
#endif
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace Collate {

namespace {

const char* const OUTPUT_DIRECTORY = "Extracts";

// 1234567 -> "1,234,567"
std::string formatCount(size_t value) {
    std::string digits = std::to_string(value);
    std::string result;
    int counter = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (counter > 0 && counter % 3 == 0) {
            result.insert(result.begin(), ',');
        }
        result.insert(result.begin(), *it);
        ++counter;
    }
    return result;
}

std::string joinList(const std::vector<std::string>& items) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << "'" << items[i] << "'";
    }
    out << "]";
    return out.str();
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_config_search_paths(defaultConfigSearchPaths(executableDirectory())),
      m_input(&std::cin),
      m_output(&std::cout)
{
}

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();

    Logger& logger = Logger::getInstance();
    logger.initialize(m_commands.log_dir);
    logger.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : LogLevel::INFO);
    logger.setConsoleColors(Logger::consoleSupportsColor());

    int exit_code = 1;
    try {
        exit_code = handleCollect();
    } catch (const ConfigError& e) {
        COLLATE_LOG_ERROR("Core", std::string("Configuration error: ") + e.what());
    } catch (const DirectoryNotFoundError& e) {
        COLLATE_LOG_ERROR("Core", e.what());
    } catch (const EmptySelectionError& e) {
        COLLATE_LOG_ERROR("Core", std::string(e.what()) + " Exiting.");
    } catch (const OutputError& e) {
        COLLATE_LOG_ERROR("Core", std::string("Error writing output: ") + e.what());
    } catch (const std::exception& e) {
        COLLATE_LOG_CRITICAL("Core", std::string("Unexpected error: ") + e.what());
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger.logRunEnd(exit_code, static_cast<long>(duration.count()));
    logger.flush();
    return exit_code;
}

void Core::setConfigSearchPaths(const std::vector<fs::path>& search_paths) {
    m_config_search_paths = search_paths;
}

void Core::setInteractiveStreams(std::istream& input, std::ostream& output) {
    m_input = &input;
    m_output = &output;
}

fs::path Core::resolveConfigPath() const {
    auto config_path = findConfigFile(m_commands.config_name, m_config_search_paths);
    if (!config_path) {
        std::string searched;
        for (const auto& dir : m_config_search_paths) {
            searched += "\n  " + dir.string();
        }
        throw ConfigError("Config '" + m_commands.config_name + "' not found. Searched in:" + searched);
    }
    return *config_path;
}

fs::path Core::resolveOutputPath() const {
    std::string output = m_commands.output_path;
    if (output.empty()) {
        output = getConfigLabel() + "_collection.md";
    }

    fs::path output_path(output);
    if (!output_path.has_parent_path()) {
        return fs::path(OUTPUT_DIRECTORY) / output_path;
    }
    return output_path;
}

std::string Core::getConfigLabel() const {
    std::string label = fs::path(m_commands.config_name).filename().string();
    for (const char* extension : {".config", ".yml", ".yaml"}) {
        if (endsWith(label, extension)) {
            label.erase(label.size() - std::string(extension).size());
            break;
        }
    }
    if (endsWith(label, "_extract") && label.size() > std::string("_extract").size()) {
        label.erase(label.size() - std::string("_extract").size());
    }
    return label;
}

fs::path Core::executableDirectory() {
    std::error_code ec;
#if defined(_WIN32)
    std::vector<wchar_t> buffer(MAX_PATH);
    DWORD length = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
    while (length == buffer.size()) {
        buffer.resize(buffer.size() * 2);
        length = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
    }
    fs::path executable = length > 0 ? fs::path(std::wstring(buffer.data(), length)) : fs::path();
#else
    fs::path executable = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        executable.clear();
    }
#endif
    if (executable.has_parent_path()) {
        return executable.parent_path();
    }
    // No /proc (e.g. macOS): fall back to the working directory
    return fs::current_path(ec);
}

int Core::handleCollect() {
    Logger& logger = Logger::getInstance();

    fs::path config_path = resolveConfigPath();
    RuleModel rules = RuleModel::load(config_path.string());
    fs::path output_path = resolveOutputPath();

    logger.logRunStart(config_path.string(), m_commands.directory, output_path.string());
    logRules(rules);

    SelectionEngine engine;
    SelectionResult selection = engine.select(m_commands.directory, rules);
    logger.logSelection(selection);
    SelectionEngine::requireNonEmpty(selection);

    if (m_commands.interactive && !reviewSelection(selection)) {
        logger.warning("Core", "Collection aborted by user.");
        return 1;
    }

    DocumentRenderer renderer;
    RenderedDocument document = renderer.render(selection);
    for (const auto& warning : document.warnings) {
        COLLATE_LOG_WARNING("DocumentRenderer", warning.message);
    }

    DocumentRenderer::writeDocument(output_path, document.content);
    logger.info("Core", "Successfully wrote content to " + output_path.string());
    logger.info("Core", "Total size: " + formatCount(document.content.size()) + " characters");

    DocumentRenderer::writeManifest(m_commands.manifest_path, document.manifest);
    logger.info("Core", "Generated " + m_commands.manifest_path + " listing all " +
                std::to_string(document.manifest.size()) + " extracted files.");

    if (!m_commands.report_path.empty()) {
        RunReport report;
        report.config_path = config_path.string();
        report.base_directory = selection.base_directory.string();
        report.output_path = output_path.string();
        report.manifest_path = m_commands.manifest_path;
        report.generated_at = document.generated_at;
        report.total_characters = document.content.size();
        report.files = document.manifest;
        report.warnings = selection.warnings;
        report.warnings.insert(report.warnings.end(), document.warnings.begin(), document.warnings.end());
        report.write(m_commands.report_path);
        logger.info("Core", "Wrote run report to " + m_commands.report_path);
    }

    return 0;
}

bool Core::reviewSelection(SelectionResult& selection) {
    InteractiveChecklist checklist(*m_input, *m_output);
    auto ticked = checklist.run(selection.relativePaths());
    if (!ticked) {
        return false;
    }

    std::vector<fs::path> kept;
    kept.reserve(ticked->size());
    for (size_t index : *ticked) {
        kept.push_back(selection.files[index]);
    }
    COLLATE_LOG_DEBUG("Core", "Checklist kept " + std::to_string(kept.size()) + " of " +
                              std::to_string(selection.files.size()) + " files");
    selection.files = std::move(kept);

    SelectionEngine::requireNonEmpty(selection);
    return true;
}

void Core::logRules(const RuleModel& rules) const {
    Logger& logger = Logger::getInstance();
    logger.info("Core", "Global excluded directories: " + joinList(rules.global.excluded_dirs));
    logger.info("Core", "Global excluded files: " + joinList(rules.global.excluded_files));
    for (const auto& section : rules.sections) {
        logger.debug("Core", "Section '" + section.name + "': extensions " + joinList(section.extensions) +
                     (section.include_subdirs ? ", recursive" : ", top level only"));
    }
}

} // namespace Collate
