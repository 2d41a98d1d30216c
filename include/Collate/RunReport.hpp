// =================================================================
// include/Collate/RunReport.hpp
// =================================================================
// Machine-readable summary of one collection run.

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "SelectionEngine.hpp"

namespace Collate {

struct RunReport {
    std::string config_path;
    std::string base_directory;
    std::string output_path;
    std::string manifest_path;
    std::string generated_at;
    size_t total_characters = 0;
    std::vector<std::string> files;             ///< Manifest order
    std::vector<SelectionWarning> warnings;     ///< Selection and render warnings

    /**
     * @brief Serialize as a JSON object
     * @param indent Spaces per level; negative for a single line
     */
    std::string toJson(int indent = 2) const;

    /**
     * @brief Write the JSON report, creating parent directories
     * @throws OutputError if the file cannot be written
     */
    void write(const std::filesystem::path& report_path) const;
};

} // namespace Collate
