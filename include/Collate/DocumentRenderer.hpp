// =================================================================
// include/Collate/DocumentRenderer.hpp
// =================================================================
// Header for turning a file selection into a single Markdown document.

#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <filesystem>
#include <functional>
#include <chrono>
#include "SelectionEngine.hpp"

namespace Collate {

/**
 * @brief Output of one render pass
 */
struct RenderedDocument {
    std::string content;
    std::vector<std::string> manifest;        ///< Relative paths, in document order
    std::vector<SelectionWarning> warnings;   ///< Files that could not be read
    std::string generated_at;                 ///< Timestamp printed in the header
    size_t files_rendered = 0;
};

/**
 * @brief Renders selected files into one Markdown document
 *
 * Files are sorted by their path relative to the base directory. Each gets
 * a "## <relative path>" heading followed by its raw contents in a fenced
 * code block tagged with a language derived from the file extension. A file
 * that cannot be read is replaced by an inline error notice.
 */
class DocumentRenderer {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    DocumentRenderer();

    /**
     * @brief Render a document from absolute file paths
     * @param file_paths Files to include, in any order
     * @param base_directory Directory headings are relative to
     * @return Document text, manifest and read warnings
     */
    RenderedDocument render(const std::vector<std::filesystem::path>& file_paths,
                            const std::filesystem::path& base_directory) const;

    /**
     * @brief Render the files of a selection result
     */
    RenderedDocument render(const SelectionResult& selection) const;

    /**
     * @brief Replace the clock used for the "Generated on" line
     */
    void setClock(Clock clock);

    /**
     * @brief Map an extension (e.g. ".rs") to a code block language
     */
    void setLanguage(const std::string& extension, const std::string& language);

    /**
     * @brief Code block language for an extension, "text" when unknown
     * @param extension Extension including the dot; case-insensitive
     */
    std::string getLanguageForExtension(const std::string& extension) const;

    /**
     * @brief Write the document, creating missing parent directories
     * @throws OutputError if the file cannot be written
     */
    static void writeDocument(const std::filesystem::path& output_path, const std::string& content);

    /**
     * @brief Write one manifest entry per line
     * @throws OutputError if the file cannot be written
     */
    static void writeManifest(const std::filesystem::path& manifest_path,
                              const std::vector<std::string>& entries);

private:
    std::string m_title;
    Clock m_clock;
    std::unordered_map<std::string, std::string> m_language_map;

    void initializeDefaultLanguages();

    std::string formatFileContent(const std::string& language, const std::string& content) const;

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point) const;

    /**
     * @brief Read a whole file as raw bytes
     * @param error Set to a reason when reading fails
     * @return false if the file could not be read
     */
    bool readFile(const std::filesystem::path& file_path, std::string& content, std::string& error) const;
};

} // namespace Collate
