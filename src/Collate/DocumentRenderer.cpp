// =================================================================
// src/Collate/DocumentRenderer.cpp
// =================================================================
// Implementation for Markdown document rendering.

#include "Collate/DocumentRenderer.hpp"
#include "Collate/Errors.hpp"
#include "Collate/Logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <iomanip>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <utility>

namespace fs = std::filesystem;

namespace Collate {

DocumentRenderer::DocumentRenderer()
    : m_title("Project Code Collection"),
      m_clock([]() { return std::chrono::system_clock::now(); })
{
    initializeDefaultLanguages();
}

RenderedDocument DocumentRenderer::render(const std::vector<fs::path>& file_paths,
                                          const fs::path& base_directory) const {
    RenderedDocument document;

    // Pair each file with its heading path, then order by heading path
    std::vector<std::pair<std::string, fs::path>> entries;
    entries.reserve(file_paths.size());
    for (const auto& file_path : file_paths) {
        std::string relative = file_path.lexically_relative(base_directory).generic_string();
        if (relative.empty()) {
            relative = file_path.generic_string();
        }
        entries.emplace_back(relative, file_path);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    document.generated_at = formatTimestamp(m_clock());

    std::ostringstream out;
    out << "# " << m_title << "\n\n";
    out << "Generated on: " << document.generated_at << "\n\n";

    for (const auto& entry : entries) {
        const std::string& relative_path = entry.first;
        const fs::path& file_path = entry.second;

        out << "## " << relative_path << "\n\n";

        std::string content;
        std::string error;
        if (!readFile(file_path, content, error)) {
            out << "Error reading " << file_path.string() << ": " << error << "\n\n";
            document.warnings.push_back({WarningKind::UNREADABLE_FILE, file_path.string(),
                                         "Error reading " + file_path.string() + ": " + error});
        } else {
            std::string language = getLanguageForExtension(file_path.extension().string());
            out << formatFileContent(language, content);
            ++document.files_rendered;
        }
        document.manifest.push_back(relative_path);
    }

    document.content = out.str();
    return document;
}

RenderedDocument DocumentRenderer::render(const SelectionResult& selection) const {
    return render(selection.files, selection.base_directory);
}

void DocumentRenderer::setClock(Clock clock) {
    m_clock = std::move(clock);
}

void DocumentRenderer::setLanguage(const std::string& extension, const std::string& language) {
    std::string key = extension;
    std::transform(key.begin(), key.end(), key.begin(), ::tolower);
    m_language_map[key] = language;
}

std::string DocumentRenderer::getLanguageForExtension(const std::string& extension) const {
    std::string key = extension;
    std::transform(key.begin(), key.end(), key.begin(), ::tolower);

    auto it = m_language_map.find(key);
    if (it != m_language_map.end()) {
        return it->second;
    }
    return "text";
}

void DocumentRenderer::writeDocument(const fs::path& output_path, const std::string& content) {
    fs::path directory = output_path.parent_path();
    if (!directory.empty()) {
        std::error_code ec;
        if (!fs::exists(directory, ec)) {
            if (!fs::create_directories(directory, ec) && ec) {
                throw OutputError("Cannot create directory '" + directory.string() + "': " + ec.message());
            }
            COLLATE_LOG_INFO("DocumentRenderer", "Created directory: " + directory.string());
        }
    }

    std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw OutputError("Cannot open '" + output_path.string() + "' for writing: " + std::strerror(errno));
    }
    output << content;
    output.flush();
    if (!output) {
        throw OutputError("Failed writing '" + output_path.string() + "'");
    }
}

void DocumentRenderer::writeManifest(const fs::path& manifest_path, const std::vector<std::string>& entries) {
    std::ostringstream lines;
    for (const auto& entry : entries) {
        lines << entry << "\n";
    }
    writeDocument(manifest_path, lines.str());
}

void DocumentRenderer::initializeDefaultLanguages() {
    m_language_map = {
        {".kt", "kotlin"},
        {".java", "java"},
        {".cpp", "cpp"},
        {".h", "cpp"},
        {".xml", "xml"},
        {".json", "json"},
        {".mjs", "javascript"},
        {".yaml", "yaml"},
        {".yml", "yaml"},
        {".config", "ini"},
        {".tsx", "tsx"},
        {".ts", "typescript"},
        {".jsx", "jsx"},
        {".js", "javascript"},
        {".html", "html"},
        {".css", "css"}
    };
}

std::string DocumentRenderer::formatFileContent(const std::string& language, const std::string& content) const {
    std::ostringstream formatted;
    formatted << "```" << language << "\n" << content << "\n```\n\n";
    return formatted.str();
}

std::string DocumentRenderer::formatTimestamp(const std::chrono::system_clock::time_point& time_point) const {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

bool DocumentRenderer::readFile(const fs::path& file_path, std::string& content, std::string& error) const {
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        error = ec ? ec.message() : "not a regular file";
        return false;
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        error = std::strerror(errno);
        return false;
    }

    std::ostringstream content_stream;
    content_stream << file.rdbuf();
    if (file.bad()) {
        error = "read failed";
        return false;
    }

    content = content_stream.str();
    return true;
}

} // namespace Collate
