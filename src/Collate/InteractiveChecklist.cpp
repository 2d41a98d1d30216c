// =================================================================
// src/Collate/InteractiveChecklist.cpp
// =================================================================
// Implementation for the terminal file checklist.

#include "Collate/InteractiveChecklist.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <stdexcept>

namespace Collate {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, (last - first + 1));
}

bool parseIndex(const std::string& text, size_t& value) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        value = std::stoul(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

InteractiveChecklist::InteractiveChecklist(std::istream& input, std::ostream& output)
    : m_input(input), m_output(output), m_prompt("Toggle files (h for help): ") {
    initializeKeyBindings();
}

std::optional<std::vector<size_t>> InteractiveChecklist::run(const std::vector<std::string>& entries,
                                                             const ChecklistOptions& options) {
    std::vector<bool> ticked(entries.size(), true);

    displayChecklist(entries, ticked);

    std::string line;
    while (true) {
        m_output << m_prompt << std::flush;
        if (!std::getline(m_input, line)) {
            // End of input accepts the current ticks
            m_output << std::endl;
            break;
        }

        std::string command = trim(line);
        ChecklistAction action = parseUserInput(command);

        if (action == ChecklistAction::DONE) {
            break;
        }

        switch (action) {
            case ChecklistAction::TOGGLE: {
                size_t first = 0;
                size_t last = 0;
                if (!parseRange(command, entries.size(), first, last)) {
                    m_output << "No such entry: " << command << std::endl;
                    break;
                }
                for (size_t i = first; i <= last; ++i) {
                    ticked[i] = !ticked[i];
                }
                displayChecklist(entries, ticked);
                break;
            }

            case ChecklistAction::SELECT_ALL:
                std::fill(ticked.begin(), ticked.end(), true);
                displayChecklist(entries, ticked);
                break;

            case ChecklistAction::SELECT_NONE:
                std::fill(ticked.begin(), ticked.end(), false);
                displayChecklist(entries, ticked);
                break;

            case ChecklistAction::LIST:
                displayChecklist(entries, ticked);
                break;

            case ChecklistAction::HELP:
                displayHelp();
                break;

            case ChecklistAction::QUIT:
                m_output << "Aborted, nothing will be written." << std::endl;
                return std::nullopt;

            case ChecklistAction::INVALID:
            default:
                m_output << "Unknown command: " << command << std::endl;
                break;
        }
    }

    std::vector<size_t> selected;
    for (size_t i = 0; i < ticked.size(); ++i) {
        if (ticked[i]) {
            selected.push_back(i);
        }
    }

    if (options.show_summary) {
        m_output << "Selected " << selected.size() << " of " << entries.size() << " files." << std::endl;
    }
    return selected;
}

void InteractiveChecklist::setPrompt(const std::string& prompt) {
    m_prompt = prompt;
}

void InteractiveChecklist::initializeKeyBindings() {
    m_key_bindings = {
        {"a", ChecklistAction::SELECT_ALL},
        {"all", ChecklistAction::SELECT_ALL},
        {"n", ChecklistAction::SELECT_NONE},
        {"none", ChecklistAction::SELECT_NONE},
        {"l", ChecklistAction::LIST},
        {"list", ChecklistAction::LIST},
        {"h", ChecklistAction::HELP},
        {"?", ChecklistAction::HELP},
        {"help", ChecklistAction::HELP},
        {"d", ChecklistAction::DONE},
        {"done", ChecklistAction::DONE},
        {"", ChecklistAction::DONE},
        {"q", ChecklistAction::QUIT},
        {"quit", ChecklistAction::QUIT}
    };
}

void InteractiveChecklist::displayChecklist(const std::vector<std::string>& entries,
                                            const std::vector<bool>& ticked) const {
    size_t width = std::to_string(entries.size()).size();
    for (size_t i = 0; i < entries.size(); ++i) {
        m_output << std::setw(static_cast<int>(width)) << (i + 1) << ". "
                 << (ticked[i] ? "[x] " : "[ ] ") << entries[i] << "\n";
    }
    m_output << std::flush;
}

void InteractiveChecklist::displayHelp() const {
    m_output << "Commands:\n"
             << "  N or A-B   toggle entry N or entries A through B\n"
             << "  a          tick all\n"
             << "  n          untick all\n"
             << "  l          list again\n"
             << "  d, Enter   done, write the ticked files\n"
             << "  q          quit without writing\n"
             << std::flush;
}

ChecklistAction InteractiveChecklist::parseUserInput(const std::string& input) const {
    std::string lowered = input;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);

    auto it = m_key_bindings.find(lowered);
    if (it != m_key_bindings.end()) {
        return it->second;
    }

    if (!lowered.empty() && std::isdigit(static_cast<unsigned char>(lowered[0]))) {
        return ChecklistAction::TOGGLE;
    }
    return ChecklistAction::INVALID;
}

bool InteractiveChecklist::parseRange(const std::string& text, size_t count, size_t& first, size_t& last) const {
    size_t dash = text.find('-');
    size_t from = 0;
    size_t to = 0;

    if (dash == std::string::npos) {
        if (!parseIndex(trim(text), from)) {
            return false;
        }
        to = from;
    } else if (!parseIndex(trim(text.substr(0, dash)), from) ||
               !parseIndex(trim(text.substr(dash + 1)), to)) {
        return false;
    }

    if (from == 0 || to == 0 || from > to || to > count) {
        return false;
    }

    first = from - 1;
    last = to - 1;
    return true;
}

} // namespace Collate
