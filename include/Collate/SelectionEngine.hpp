// =================================================================
// include/Collate/SelectionEngine.hpp
// =================================================================
// Header for evaluating a rule model against a directory tree.

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <unordered_set>
#include "RuleModel.hpp"
#include "ExclusionPattern.hpp"

namespace Collate {

/**
 * @brief Non-fatal conditions reported alongside a result
 */
enum class WarningKind {
    MISSING_SECTION_DIRECTORY,
    NOT_A_DIRECTORY,
    UNREADABLE_DIRECTORY,
    MISSING_SPECIFIC_FILE,
    EXCLUDED_SPECIFIC_FILE,
    UNREADABLE_FILE
};

struct SelectionWarning {
    WarningKind kind;
    std::string path;
    std::string message;
};

/**
 * @brief Stable identifier for a warning kind (e.g. "missing_section_directory")
 */
std::string getWarningKindName(WarningKind kind);

/**
 * @brief What one section contributed to a result
 */
struct SectionReport {
    std::string name;
    std::filesystem::path directory;
    size_t files_found = 0;
    bool skipped = false;
};

/**
 * @brief Files chosen by a selection run, in walk order, plus every
 * warning raised while choosing them
 */
struct SelectionResult {
    std::filesystem::path base_directory;      ///< Absolute, normalized
    std::vector<std::filesystem::path> files;  ///< Absolute, unique
    std::vector<SelectionWarning> warnings;
    std::vector<SectionReport> sections;
    size_t specific_files_added = 0;

    bool empty() const { return files.empty(); }

    bool contains(const std::filesystem::path& file) const;

    /**
     * @brief Paths relative to base_directory with '/' separators, in
     * result order
     */
    std::vector<std::string> relativePaths() const;
};

/**
 * @brief Walks the filesystem and selects the files a rule model asks for
 *
 * Sections are processed in declaration order, then specific files. The
 * engine keeps no state between calls; the same tree and rules always
 * give the same result.
 */
class SelectionEngine {
public:
    SelectionEngine() = default;

    /**
     * @brief Select files under a base directory
     * @param base_directory Project root; relative paths are made absolute
     * @param rules Rule model to evaluate
     * @return Selected files and accumulated warnings
     * @throws DirectoryNotFoundError if base_directory is missing or not a
     *         directory
     */
    SelectionResult select(const std::filesystem::path& base_directory, const RuleModel& rules) const;

    /**
     * @brief Throw EmptySelectionError when nothing was selected
     */
    static void requireNonEmpty(const SelectionResult& result);

    /**
     * @brief Boundary-aware ancestor test
     * @param directory Absolute normalized directory
     * @param anchor Absolute normalized excluded directory
     * @return true if directory equals anchor or lies beneath it
     */
    static bool isWithin(const std::filesystem::path& directory, const std::filesystem::path& anchor);

private:
    /**
     * @brief Collect the files of one section in walk order
     * @return Number of files collected
     */
    size_t collectSection(const Section& section,
                          const std::filesystem::path& dir_path,
                          std::vector<std::filesystem::path>& collected,
                          SelectionResult& result) const;

    void walkDirectory(const std::filesystem::path& directory,
                       const Section& section,
                       const ExclusionPatternSet& excluded_files,
                       const std::vector<std::filesystem::path>& excluded_dirs,
                       std::vector<std::filesystem::path>& collected,
                       SelectionResult& result) const;

    void listDirectFiles(const std::filesystem::path& directory,
                         const Section& section,
                         const ExclusionPatternSet& excluded_files,
                         std::vector<std::filesystem::path>& collected,
                         SelectionResult& result) const;

    void addSpecificFiles(const RuleModel& rules,
                          std::unordered_set<std::string>& seen,
                          SelectionResult& result) const;

    bool acceptFile(const std::string& filename,
                    const Section& section,
                    const ExclusionPatternSet& excluded_files) const;
};

} // namespace Collate
