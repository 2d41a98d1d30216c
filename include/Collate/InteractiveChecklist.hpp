// =================================================================
// include/Collate/InteractiveChecklist.hpp
// =================================================================
// Header for the terminal checklist used to review a selection before
// the document is written.

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <iostream>
#include <unordered_map>

namespace Collate {

/**
 * @brief Commands understood by the checklist prompt
 */
enum class ChecklistAction {
    TOGGLE,      ///< Toggle one entry or a range ("3", "2-5")
    SELECT_ALL,  ///< Tick every entry
    SELECT_NONE, ///< Untick every entry
    LIST,        ///< Print the checklist again
    HELP,        ///< Show help
    DONE,        ///< Accept the current ticks
    QUIT,        ///< Abort the run
    INVALID
};

struct ChecklistOptions {
    bool show_summary = true;    ///< Print counts when the session ends
};

/**
 * @brief Lets the operator untick files before rendering
 *
 * Entries start ticked. The session reads one command per line from the
 * input stream until "d", an empty line, "q" or end of input.
 */
class InteractiveChecklist {
public:
    InteractiveChecklist(std::istream& input = std::cin, std::ostream& output = std::cout);

    /**
     * @brief Run a checklist session
     * @param entries Labels shown to the operator, usually relative paths
     * @param options Display options
     * @return Indices of ticked entries in their original order, or
     *         std::nullopt if the operator quit
     */
    std::optional<std::vector<size_t>> run(const std::vector<std::string>& entries,
                                           const ChecklistOptions& options = ChecklistOptions());

    void setPrompt(const std::string& prompt);

private:
    std::istream& m_input;
    std::ostream& m_output;
    std::string m_prompt;
    std::unordered_map<std::string, ChecklistAction> m_key_bindings;

    void initializeKeyBindings();

    void displayChecklist(const std::vector<std::string>& entries,
                          const std::vector<bool>& ticked) const;

    void displayHelp() const;

    ChecklistAction parseUserInput(const std::string& input) const;

    /**
     * @brief Parse "N" or "A-B" into a zero-based inclusive range
     * @return false if the text is not a valid range for @p count entries
     */
    bool parseRange(const std::string& text, size_t count, size_t& first, size_t& last) const;
};

} // namespace Collate
