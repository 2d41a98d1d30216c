// =================================================================
// src/Collate/RunReport.cpp
// =================================================================
// JSON serialization of the run summary.

#include "Collate/RunReport.hpp"
#include "Collate/DocumentRenderer.hpp"
#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace Collate {

std::string RunReport::toJson(int indent) const {
    json warning_list = json::array();
    for (const auto& warning : warnings) {
        warning_list.push_back({
            {"kind", getWarningKindName(warning.kind)},
            {"path", warning.path},
            {"message", warning.message}
        });
    }

    json report = {
        {"config", config_path},
        {"base_directory", base_directory},
        {"output", output_path},
        {"manifest", manifest_path},
        {"generated_at", generated_at},
        {"total_characters", total_characters},
        {"files", files},
        {"warnings", warning_list}
    };

    // Replace invalid UTF-8 in paths instead of throwing
    return report.dump(indent, ' ', false, json::error_handler_t::replace);
}

void RunReport::write(const std::filesystem::path& report_path) const {
    DocumentRenderer::writeDocument(report_path, toJson() + "\n");
}

} // namespace Collate
