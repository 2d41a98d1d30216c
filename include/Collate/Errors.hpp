// =================================================================
// include/Collate/Errors.hpp
// =================================================================
// Exception types raised by the rule model, selection engine and
// document writer.

#pragma once

#include <stdexcept>
#include <string>

namespace Collate {

/**
 * @brief Configuration source missing, unreadable, malformed, or missing
 * a required key. Raised before any filesystem walk.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The base directory handed to the selection engine does not exist
 * or is not a directory.
 */
class DirectoryNotFoundError : public std::runtime_error {
public:
    explicit DirectoryNotFoundError(const std::string& directory)
        : std::runtime_error("Directory '" + directory + "' not found."),
          m_directory(directory) {}

    const std::string& getDirectory() const { return m_directory; }

private:
    std::string m_directory;
};

/**
 * @brief No file matched any rule; no document is produced.
 */
class EmptySelectionError : public std::runtime_error {
public:
    EmptySelectionError()
        : std::runtime_error("No matching files found.") {}
};

/**
 * @brief The document, manifest or report could not be written.
 */
class OutputError : public std::runtime_error {
public:
    explicit OutputError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace Collate
