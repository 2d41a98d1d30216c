// =================================================================
// tests/SelectionEngineTest.cpp
// =================================================================
// Unit tests for the SelectionEngine component.

#include "Collate/SelectionEngine.hpp"
#include "Collate/RuleModel.hpp"
#include "Collate/ConfigParser.hpp"
#include "Collate/Errors.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class SelectionEngineTest {
private:
    std::string test_dir;

    void touch(const std::string& relative, const std::string& content = "x") {
        fs::path path = fs::path(test_dir) / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    void cleanup() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    Collate::RuleModel rulesFrom(const std::string& ini) {
        return Collate::RuleModel::fromConfig(Collate::ConfigParser::fromString(ini));
    }

    std::set<std::string> relativeSet(const Collate::SelectionResult& result) {
        auto relative = result.relativePaths();
        return std::set<std::string>(relative.begin(), relative.end());
    }

    size_t countWarnings(const Collate::SelectionResult& result, Collate::WarningKind kind) {
        return static_cast<size_t>(std::count_if(result.warnings.begin(), result.warnings.end(),
                                                 [kind](const Collate::SelectionWarning& w) {
                                                     return w.kind == kind;
                                                 }));
    }

public:
    SelectionEngineTest() : test_dir("test_selection_engine") {}

    void testExtensionFiltering() {
        std::cout << "Testing extension filtering..." << std::endl;

        cleanup();
        touch("src/a.py");
        touch("src/b.pyc");

        Collate::SelectionEngine engine;
        auto result = engine.select(test_dir, rulesFrom("[src]\nextensions = py\n"));

        assert((relativeSet(result) == std::set<std::string>{"src/a.py"}));
        assert(result.warnings.empty());
        assert(result.sections.size() == 1);
        assert(result.sections[0].files_found == 1);
        assert(!result.sections[0].skipped);

        cleanup();
        std::cout << "✓ Extension filtering test passed" << std::endl;
    }

    void testGlobalFileExclusion() {
        std::cout << "Testing global file exclusions..." << std::endl;

        cleanup();
        touch("web/app.js");
        touch("web/app.min.js");

        Collate::SelectionEngine engine;
        auto result = engine.select(test_dir, rulesFrom(
            "[global]\nexcluded_files = *.min.js\n"
            "[web]\nextensions = .js\n"));

        assert((relativeSet(result) == std::set<std::string>{"web/app.js"}));

        cleanup();
        std::cout << "✓ Global file exclusion test passed" << std::endl;
    }

    void testNonRecursiveSection() {
        std::cout << "Testing include_subdirs = false..." << std::endl;

        cleanup();
        touch("scripts/build.sh");
        touch("scripts/nested/deploy.sh");

        Collate::SelectionEngine engine;
        auto result = engine.select(test_dir, rulesFrom(
            "[scripts]\nextensions = sh\ninclude_subdirs = false\n"));

        assert((relativeSet(result) == std::set<std::string>{"scripts/build.sh"}));

        cleanup();
        std::cout << "✓ Non-recursive section test passed" << std::endl;
    }

    void testDirectoryExclusionBoundary() {
        std::cout << "Testing directory exclusion boundaries..." << std::endl;

        cleanup();
        touch("app/main.kt");
        touch("app/build/Generated.kt");
        touch("app/build/deep/More.kt");
        touch("app/build2/Kept.kt");
        touch("app/src/build/Nested.kt");

        Collate::SelectionEngine engine;
        auto result = engine.select(test_dir, rulesFrom(
            "[app]\nextensions = kt\nexcluded_dirs = build\n"));

        auto selected = relativeSet(result);
        assert(selected.count("app/main.kt") == 1);
        assert(selected.count("app/build2/Kept.kt") == 1 && "A sibling sharing the prefix is kept");
        assert(selected.count("app/src/build/Nested.kt") == 1 && "Anchors are relative to the section");
        assert(selected.count("app/build/Generated.kt") == 0);
        assert(selected.count("app/build/deep/More.kt") == 0 && "Descendants of an anchor are excluded");

        // Nested anchors name a path below the section directory
        auto nested = engine.select(test_dir, rulesFrom(
            "[app]\nextensions = kt\nexcluded_dirs = src/build\n"));
        auto nested_selected = relativeSet(nested);
        assert(nested_selected.count("app/src/build/Nested.kt") == 0);
        assert(nested_selected.count("app/build/Generated.kt") == 1);

        assert(Collate::SelectionEngine::isWithin("/p/build", "/p/build"));
        assert(Collate::SelectionEngine::isWithin("/p/build/x", "/p/build"));
        assert(!Collate::SelectionEngine::isWithin("/p/build2", "/p/build"));
        assert(!Collate::SelectionEngine::isWithin("/p", "/p/build"));

        cleanup();
        std::cout << "✓ Directory exclusion boundary test passed" << std::endl;
    }

    void testSpecificFiles() {
        std::cout << "Testing specific files..." << std::endl;

        cleanup();
        touch("src/main.py");
        touch("setup.py");
        touch("notes.min.js");

        Collate::SelectionEngine engine;
        auto result = engine.select(test_dir, rulesFrom(
            "[global]\nexcluded_files = *.min.js\n"
            "[specific_files]\nfiles = README.md, setup.py, src/main.py, notes.min.js\n"
            "[src]\nextensions = py\n"));

        assert((relativeSet(result) == std::set<std::string>{"src/main.py", "setup.py"}));
        assert(result.files.size() == 2 && "A file selected twice appears once");
        assert(result.specific_files_added == 1);

        assert(countWarnings(result, Collate::WarningKind::MISSING_SPECIFIC_FILE) == 1);
        assert(countWarnings(result, Collate::WarningKind::EXCLUDED_SPECIFIC_FILE) == 1);

        auto missing = std::find_if(result.warnings.begin(), result.warnings.end(),
                                    [](const Collate::SelectionWarning& w) {
                                        return w.kind == Collate::WarningKind::MISSING_SPECIFIC_FILE;
                                    });
        assert(missing != result.warnings.end());
        assert(missing->path == "README.md");
        assert(missing->message == "Specific file 'README.md' not found. Skipping...");

        // Section files come first, specific files follow
        assert(result.files.front().filename() == "main.py");
        assert(result.files.back().filename() == "setup.py");

        cleanup();
        std::cout << "✓ Specific files test passed" << std::endl;
    }

    void testMissingAndInvalidSections() {
        std::cout << "Testing sections that do not resolve to directories..." << std::endl;

        cleanup();
        touch("lib/util.py");
        touch("notes");

        Collate::SelectionEngine engine;
        auto result = engine.select(test_dir, rulesFrom(
            "[missing]\nextensions = py\n"
            "[notes]\nextensions = py\n"
            "[lib]\nextensions = py\n"));

        assert((relativeSet(result) == std::set<std::string>{"lib/util.py"}));
        assert(countWarnings(result, Collate::WarningKind::MISSING_SECTION_DIRECTORY) == 1);
        assert(countWarnings(result, Collate::WarningKind::NOT_A_DIRECTORY) == 1);
        assert(result.sections.size() == 3);
        assert(result.sections[0].skipped);
        assert(result.sections[1].skipped);
        assert(!result.sections[2].skipped);

        cleanup();
        std::cout << "✓ Missing section test passed" << std::endl;
    }

    void testOverlappingSections() {
        std::cout << "Testing overlapping sections..." << std::endl;

        cleanup();
        touch("src/core/engine.cpp");
        touch("src/core/engine.hpp");
        touch("src/main.cpp");

        Collate::SelectionEngine engine;
        auto result = engine.select(test_dir, rulesFrom(
            "[src]\nextensions = cpp, hpp\n"
            "[src/core]\nextensions = cpp\n"));

        assert(result.files.size() == 3 && "No duplicates across sections");
        assert(result.sections[1].files_found == 1);

        // Top-down, files of a directory before its subdirectories
        auto relative = result.relativePaths();
        assert(relative[0] == "src/main.cpp");
        assert(relative[1] == "src/core/engine.cpp");
        assert(relative[2] == "src/core/engine.hpp");

        cleanup();
        std::cout << "✓ Overlapping sections test passed" << std::endl;
    }

    void testIdempotence() {
        std::cout << "Testing repeated selection over the same tree..." << std::endl;

        cleanup();
        touch("src/b.py");
        touch("src/a.py");
        touch("src/pkg/c.py");
        touch("src/pkg/test_c.py");

        auto rules = rulesFrom("[src]\nextensions = py\nexcluded_files = test_*\n");
        Collate::SelectionEngine engine;
        auto first = engine.select(test_dir, rules);
        auto second = engine.select(test_dir, rules);

        assert(first.files == second.files);
        assert(first.files.size() == 3);
        assert(first.contains(fs::absolute(test_dir) / "src" / "pkg" / "c.py"));
        assert(!first.contains(fs::absolute(test_dir) / "src" / "pkg" / "test_c.py"));

        cleanup();
        std::cout << "✓ Idempotence test passed" << std::endl;
    }

    void testEmptyAndInvalidBase() {
        std::cout << "Testing empty selections and invalid base directories..." << std::endl;

        cleanup();
        touch("docs/readme.txt");

        Collate::SelectionEngine engine;
        auto result = engine.select(test_dir, rulesFrom(
            "[docs]\nextensions = md\n[specific_files]\nfiles = README.md\n"));
        assert(result.empty());
        assert(countWarnings(result, Collate::WarningKind::MISSING_SPECIFIC_FILE) == 1);

        bool threw_empty = false;
        try {
            Collate::SelectionEngine::requireNonEmpty(result);
        } catch (const Collate::EmptySelectionError& e) {
            threw_empty = std::string(e.what()) == "No matching files found.";
        }
        assert(threw_empty);

        bool threw_missing = false;
        try {
            engine.select(test_dir + "/does_not_exist", rulesFrom("[src]\nextensions = py\n"));
        } catch (const Collate::DirectoryNotFoundError& e) {
            threw_missing = e.getDirectory() == test_dir + "/does_not_exist";
        }
        assert(threw_missing);

        bool threw_file = false;
        try {
            engine.select(test_dir + "/docs/readme.txt", rulesFrom("[src]\nextensions = py\n"));
        } catch (const Collate::DirectoryNotFoundError&) {
            threw_file = true;
        }
        assert(threw_file && "A regular file is not a base directory");

        cleanup();
        std::cout << "✓ Empty and invalid base test passed" << std::endl;
    }

    void testSymlinkedDirectoriesAreNotFollowed() {
        std::cout << "Testing symlinked directories..." << std::endl;

        cleanup();
        touch("outside/secret.py");
        touch("src/real.py");

        std::error_code ec;
        fs::create_directory_symlink(fs::absolute(test_dir) / "outside",
                                     fs::path(test_dir) / "src" / "link", ec);
        if (ec) {
            std::cout << "  (symlinks unavailable, skipped)" << std::endl;
            cleanup();
            return;
        }

        Collate::SelectionEngine engine;
        auto result = engine.select(test_dir, rulesFrom("[src]\nextensions = py\n"));
        assert((relativeSet(result) == std::set<std::string>{"src/real.py"}));

        cleanup();
        std::cout << "✓ Symlink test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running SelectionEngine unit tests..." << std::endl;

        testExtensionFiltering();
        testGlobalFileExclusion();
        testNonRecursiveSection();
        testDirectoryExclusionBoundary();
        testSpecificFiles();
        testMissingAndInvalidSections();
        testOverlappingSections();
        testIdempotence();
        testEmptyAndInvalidBase();
        testSymlinkedDirectoriesAreNotFollowed();

        std::cout << "All SelectionEngine tests passed!" << std::endl;
    }
};

int main() {
    try {
        SelectionEngineTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
