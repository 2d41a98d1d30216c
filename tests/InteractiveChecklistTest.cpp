// =================================================================
// tests/InteractiveChecklistTest.cpp
// =================================================================
// Unit tests for the terminal checklist, driven through string streams.

#include "Collate/InteractiveChecklist.hpp"
#include <iostream>
#include <sstream>
#include <cassert>
#include <string>
#include <vector>

class InteractiveChecklistTest {
private:
    std::vector<std::string> entries = {"src/a.py", "src/b.py", "src/c.py", "README.md"};

    std::optional<std::vector<size_t>> runWith(const std::string& input, std::string& transcript) {
        std::istringstream in(input);
        std::ostringstream out;
        Collate::InteractiveChecklist checklist(in, out);
        auto result = checklist.run(entries);
        transcript = out.str();
        return result;
    }

public:
    void testAcceptAll() {
        std::cout << "Testing immediate acceptance..." << std::endl;

        std::string transcript;
        auto result = runWith("\n", transcript);

        assert(result.has_value());
        assert((*result == std::vector<size_t>{0, 1, 2, 3}) && "Everything starts ticked");
        assert(transcript.find("1. [x] src/a.py") != std::string::npos);
        assert(transcript.find("4. [x] README.md") != std::string::npos);
        assert(transcript.find("Selected 4 of 4 files.") != std::string::npos);

        std::cout << "✓ Accept all test passed" << std::endl;
    }

    void testToggleAndRanges() {
        std::cout << "Testing toggles and ranges..." << std::endl;

        std::string transcript;
        auto result = runWith("2\n3-4\n4\nd\n", transcript);

        assert(result.has_value());
        assert((*result == std::vector<size_t>{0, 3}));
        assert(transcript.find("2. [ ] src/b.py") != std::string::npos);
        assert(transcript.find("Selected 2 of 4 files.") != std::string::npos);

        std::cout << "✓ Toggle and range test passed" << std::endl;
    }

    void testSelectNoneThenSome() {
        std::cout << "Testing none/all commands..." << std::endl;

        std::string transcript;
        auto result = runWith("n\n1\nall\nNONE\n4\ndone\n", transcript);

        assert(result.has_value());
        assert((*result == std::vector<size_t>{3}) && "Commands are case-insensitive");

        auto empty = runWith("none\nd\n", transcript);
        assert(empty.has_value() && empty->empty() && "Unticking everything is not an abort");
        assert(transcript.find("Selected 0 of 4 files.") != std::string::npos);

        std::cout << "✓ None/all test passed" << std::endl;
    }

    void testQuit() {
        std::cout << "Testing quit..." << std::endl;

        std::string transcript;
        auto result = runWith("2\nq\n", transcript);

        assert(!result.has_value());
        assert(transcript.find("Aborted, nothing will be written.") != std::string::npos);
        assert(transcript.find("Selected") == std::string::npos);

        std::cout << "✓ Quit test passed" << std::endl;
    }

    void testInvalidInput() {
        std::cout << "Testing invalid commands..." << std::endl;

        std::string transcript;
        auto result = runWith("9\n0\n3-1\n2-x\nfrobnicate\nh\nl\n", transcript);

        // End of input accepts the current ticks
        assert(result.has_value());
        assert(result->size() == 4);
        assert(transcript.find("No such entry: 9") != std::string::npos);
        assert(transcript.find("No such entry: 0") != std::string::npos);
        assert(transcript.find("No such entry: 3-1") != std::string::npos);
        assert(transcript.find("No such entry: 2-x") != std::string::npos);
        assert(transcript.find("Unknown command: frobnicate") != std::string::npos);
        assert(transcript.find("Commands:") != std::string::npos);

        std::cout << "✓ Invalid input test passed" << std::endl;
    }

    void testOptionsAndPrompt() {
        std::cout << "Testing prompt and summary options..." << std::endl;

        std::istringstream in("1\n");
        std::ostringstream out;
        Collate::InteractiveChecklist checklist(in, out);
        checklist.setPrompt("pick> ");

        Collate::ChecklistOptions options;
        options.show_summary = false;
        auto result = checklist.run(entries, options);

        assert(result.has_value());
        assert((*result == std::vector<size_t>{1, 2, 3}));
        assert(out.str().find("pick> ") != std::string::npos);
        assert(out.str().find("Selected") == std::string::npos);

        std::cout << "✓ Options test passed" << std::endl;
    }

    void testWideNumbering() {
        std::cout << "Testing numbering alignment..." << std::endl;

        std::vector<std::string> many;
        for (int i = 0; i < 12; ++i) {
            many.push_back("file" + std::to_string(i) + ".txt");
        }

        std::istringstream in("d\n");
        std::ostringstream out;
        Collate::InteractiveChecklist checklist(in, out);
        auto result = checklist.run(many);

        assert(result.has_value() && result->size() == 12);
        assert(out.str().find(" 1. [x] file0.txt") != std::string::npos);
        assert(out.str().find("12. [x] file11.txt") != std::string::npos);

        std::cout << "✓ Numbering test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running InteractiveChecklist unit tests..." << std::endl;

        testAcceptAll();
        testToggleAndRanges();
        testSelectNoneThenSome();
        testQuit();
        testInvalidInput();
        testOptionsAndPrompt();
        testWideNumbering();

        std::cout << "All InteractiveChecklist tests passed!" << std::endl;
    }
};

int main() {
    try {
        InteractiveChecklistTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
