// =================================================================
// src/Collate/SelectionEngine.cpp
// =================================================================
// Implementation for rule evaluation over a directory tree.

#include "Collate/SelectionEngine.hpp"
#include "Collate/Errors.hpp"
#include <algorithm>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace Collate {

namespace {

// Lexically normalize and drop a trailing separator ("a/b/" -> "a/b")
fs::path normalizeDirectory(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

bool byFilename(const fs::path& a, const fs::path& b) {
    return a.filename().string() < b.filename().string();
}

} // namespace

std::string getWarningKindName(WarningKind kind) {
    switch (kind) {
        case WarningKind::MISSING_SECTION_DIRECTORY: return "missing_section_directory";
        case WarningKind::NOT_A_DIRECTORY: return "not_a_directory";
        case WarningKind::UNREADABLE_DIRECTORY: return "unreadable_directory";
        case WarningKind::MISSING_SPECIFIC_FILE: return "missing_specific_file";
        case WarningKind::EXCLUDED_SPECIFIC_FILE: return "excluded_specific_file";
        case WarningKind::UNREADABLE_FILE: return "unreadable_file";
        default: return "unknown";
    }
}

bool SelectionResult::contains(const fs::path& file) const {
    fs::path normal = file.lexically_normal();
    return std::find(files.begin(), files.end(), normal) != files.end();
}

std::vector<std::string> SelectionResult::relativePaths() const {
    std::vector<std::string> relative;
    relative.reserve(files.size());
    for (const auto& file : files) {
        relative.push_back(file.lexically_relative(base_directory).generic_string());
    }
    return relative;
}

SelectionResult SelectionEngine::select(const fs::path& base_directory, const RuleModel& rules) const {
    std::error_code ec;
    fs::path base = fs::absolute(base_directory, ec);
    if (ec || !fs::is_directory(base, ec)) {
        throw DirectoryNotFoundError(base_directory.string());
    }

    SelectionResult result;
    result.base_directory = normalizeDirectory(base);

    std::unordered_set<std::string> seen;

    for (const auto& section : rules.sections) {
        if (RuleModel::isReservedSection(section.name)) {
            continue;
        }

        SectionReport report;
        report.name = section.name;
        report.directory = normalizeDirectory(result.base_directory / section.name);

        if (!fs::exists(report.directory, ec)) {
            result.warnings.push_back({WarningKind::MISSING_SECTION_DIRECTORY, report.directory.string(),
                                       "Directory '" + report.directory.string() + "' does not exist. Skipping..."});
            report.skipped = true;
            result.sections.push_back(report);
            continue;
        }
        if (!fs::is_directory(report.directory, ec)) {
            result.warnings.push_back({WarningKind::NOT_A_DIRECTORY, report.directory.string(),
                                       "'" + report.directory.string() + "' is not a directory. Skipping..."});
            report.skipped = true;
            result.sections.push_back(report);
            continue;
        }

        std::vector<fs::path> collected;
        report.files_found = collectSection(section, report.directory, collected, result);

        // Overlapping sections may yield the same file twice
        for (auto& file : collected) {
            if (seen.insert(file.string()).second) {
                result.files.push_back(std::move(file));
            }
        }
        result.sections.push_back(report);
    }

    addSpecificFiles(rules, seen, result);
    return result;
}

void SelectionEngine::requireNonEmpty(const SelectionResult& result) {
    if (result.empty()) {
        throw EmptySelectionError();
    }
}

bool SelectionEngine::isWithin(const fs::path& directory, const fs::path& anchor) {
    if (directory == anchor) {
        return true;
    }

    std::string prefix = anchor.string();
    if (prefix.empty()) {
        return false;
    }
    if (prefix.back() != fs::path::preferred_separator) {
        prefix += fs::path::preferred_separator;
    }

    const std::string candidate = directory.string();
    return candidate.size() > prefix.size() && candidate.compare(0, prefix.size(), prefix) == 0;
}

size_t SelectionEngine::collectSection(const Section& section,
                                       const fs::path& dir_path,
                                       std::vector<fs::path>& collected,
                                       SelectionResult& result) const {
    ExclusionPatternSet excluded_files(section.excluded_files);

    if (section.include_subdirs) {
        // Anchors are relative to the section directory, not the base
        std::vector<fs::path> excluded_dirs = section.resolveExcludedDirs(dir_path);
        walkDirectory(dir_path, section, excluded_files, excluded_dirs, collected, result);
    } else {
        listDirectFiles(dir_path, section, excluded_files, collected, result);
    }
    return collected.size();
}

void SelectionEngine::walkDirectory(const fs::path& directory,
                                    const Section& section,
                                    const ExclusionPatternSet& excluded_files,
                                    const std::vector<fs::path>& excluded_dirs,
                                    std::vector<fs::path>& collected,
                                    SelectionResult& result) const {
    for (const auto& anchor : excluded_dirs) {
        if (isWithin(directory, anchor)) {
            return;
        }
    }

    std::vector<fs::path> files;
    std::vector<fs::path> subdirectories;

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            // Symlinked directories are listed but never descended into
            if (!entry.is_symlink(entry_ec)) {
                subdirectories.push_back(entry.path());
            }
        } else if (entry.is_regular_file(entry_ec)) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        result.warnings.push_back({WarningKind::UNREADABLE_DIRECTORY, directory.string(),
                                   "Cannot read directory '" + directory.string() + "': " + ec.message()});
        return;
    }

    // Files of a directory come before its subdirectories, each sorted by name
    std::sort(files.begin(), files.end(), byFilename);
    std::sort(subdirectories.begin(), subdirectories.end(), byFilename);

    for (const auto& file : files) {
        if (acceptFile(file.filename().string(), section, excluded_files)) {
            collected.push_back(file);
        }
    }
    for (const auto& subdirectory : subdirectories) {
        walkDirectory(subdirectory, section, excluded_files, excluded_dirs, collected, result);
    }
}

void SelectionEngine::listDirectFiles(const fs::path& directory,
                                      const Section& section,
                                      const ExclusionPatternSet& excluded_files,
                                      std::vector<fs::path>& collected,
                                      SelectionResult& result) const {
    std::vector<fs::path> files;

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        result.warnings.push_back({WarningKind::UNREADABLE_DIRECTORY, directory.string(),
                                   "Cannot read directory '" + directory.string() + "': " + ec.message()});
        return;
    }

    std::sort(files.begin(), files.end(), byFilename);
    for (const auto& file : files) {
        if (acceptFile(file.filename().string(), section, excluded_files)) {
            collected.push_back(file);
        }
    }
}

void SelectionEngine::addSpecificFiles(const RuleModel& rules,
                                       std::unordered_set<std::string>& seen,
                                       SelectionResult& result) const {
    // Only the global file exclusions apply to explicitly named files
    ExclusionPatternSet global_excluded(rules.global.excluded_files);

    for (const auto& specific_file : rules.specific_files) {
        fs::path full_path = (result.base_directory / specific_file).lexically_normal();

        std::error_code ec;
        if (!fs::is_regular_file(full_path, ec)) {
            result.warnings.push_back({WarningKind::MISSING_SPECIFIC_FILE, specific_file,
                                       "Specific file '" + specific_file + "' not found. Skipping..."});
            continue;
        }

        if (global_excluded.matchesFile(full_path)) {
            result.warnings.push_back({WarningKind::EXCLUDED_SPECIFIC_FILE, specific_file,
                                       "Skipping excluded specific file: " + specific_file});
            continue;
        }

        if (seen.insert(full_path.string()).second) {
            result.files.push_back(full_path);
            ++result.specific_files_added;
        }
    }
}

bool SelectionEngine::acceptFile(const std::string& filename,
                                 const Section& section,
                                 const ExclusionPatternSet& excluded_files) const {
    if (!section.acceptsExtension(filename)) {
        return false;
    }
    return excluded_files.empty() || !excluded_files.matches(filename);
}

} // namespace Collate
