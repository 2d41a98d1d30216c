// =================================================================
// tests/LoggerTest.cpp
// =================================================================
// Unit tests for console formatting, level filtering and log files.

#include "Collate/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cassert>
#include <string>

namespace fs = std::filesystem;

class LoggerTest {
private:
    std::string test_dir;

    // Swaps a stream buffer for the lifetime of the object
    class StreamCapture {
    public:
        explicit StreamCapture(std::ostream& stream) : m_stream(stream), m_saved(stream.rdbuf(m_buffer.rdbuf())) {}
        ~StreamCapture() { m_stream.rdbuf(m_saved); }
        std::string text() const { return m_buffer.str(); }

    private:
        std::ostream& m_stream;
        std::ostringstream m_buffer;
        std::streambuf* m_saved;
    };

    void cleanup() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    std::string readLogFile() {
        for (const auto& entry : fs::directory_iterator(test_dir)) {
            if (entry.path().filename().string().rfind("collate_", 0) == 0 &&
                entry.path().extension() == ".log") {
                std::ifstream file(entry.path());
                std::ostringstream content;
                content << file.rdbuf();
                return content.str();
            }
        }
        return "";
    }

public:
    LoggerTest() : test_dir("test_logger") {}

    void testConsoleColors() {
        std::cout << "Testing console colors..." << std::endl;

        Collate::Logger& logger = Collate::Logger::getInstance();
        logger.initialize();
        logger.setConsoleLogLevel(Collate::LogLevel::INFO);

        std::string plain;
        {
            StreamCapture capture(std::cout);
            logger.setConsoleColors(false);
            COLLATE_LOG_INFO("Core", "plain line");
            plain = capture.text();
        }
        assert(plain.find("[INFO] Core: plain line") != std::string::npos);
        assert(plain.find("\033[") == std::string::npos && "No escape codes when colors are off");

        std::string colored;
        {
            StreamCapture capture(std::cout);
            logger.setConsoleColors(true);
            COLLATE_LOG_INFO("Core", "colored line");
            colored = capture.text();
        }
        assert(colored.find("\033[36m[INFO]\033[0m") != std::string::npos);

        logger.setConsoleColors(false);
        std::cout << "✓ Console color test passed" << std::endl;
    }

    void testLevelFiltering() {
        std::cout << "Testing console level filtering..." << std::endl;

        Collate::Logger& logger = Collate::Logger::getInstance();
        logger.initialize();
        logger.setConsoleColors(false);
        logger.setConsoleLogLevel(Collate::LogLevel::INFO);

        std::string out;
        std::string err;
        {
            StreamCapture capture_out(std::cout);
            StreamCapture capture_err(std::cerr);
            COLLATE_LOG_DEBUG("Core", "hidden detail");
            COLLATE_LOG_WARNING("DocumentRenderer", "could not read file");
            COLLATE_LOG_ERROR("Core", "bad config");
            out = capture_out.text();
            err = capture_err.text();
        }
        assert(out.find("hidden detail") == std::string::npos && "DEBUG is below the console level");
        assert(out.find("[WARN] DocumentRenderer: could not read file") != std::string::npos);
        assert(out.find("bad config") == std::string::npos && "Errors go to stderr");
        assert(err.find("[ERROR] Core: bad config") != std::string::npos);

        {
            StreamCapture capture_out(std::cout);
            logger.setConsoleLogLevel(Collate::LogLevel::DEBUG);
            COLLATE_LOG_DEBUG("Core", "shown detail");
            out = capture_out.text();
        }
        assert(out.find("[DEBUG] Core: shown detail") != std::string::npos);

        logger.setConsoleLogLevel(Collate::LogLevel::INFO);
        std::cout << "✓ Level filtering test passed" << std::endl;
    }

    void testLogFile() {
        std::cout << "Testing the log file..." << std::endl;

        cleanup();
        Collate::Logger& logger = Collate::Logger::getInstance();
        logger.setConsoleColors(true);

        {
            StreamCapture capture_out(std::cout);
            StreamCapture capture_err(std::cerr);
            logger.initialize(test_dir);
            COLLATE_LOG_DEBUG("Core", "file only detail");
            COLLATE_LOG_WARNING("Core", "Collection aborted by user.");
            COLLATE_LOG_CRITICAL("Core", "Unexpected error: boom");
            logger.flush();
        }

        std::string log = readLogFile();
        assert(!log.empty() && "A collate_*.log file is created");
        assert(log.find("[DEBUG] Core: file only detail") != std::string::npos && "Files keep DEBUG entries");
        assert(log.find("[WARN] Core: Collection aborted by user.") != std::string::npos);
        assert(log.find("[CRIT] Core: Unexpected error: boom") != std::string::npos);
        assert(log.find("\033[") == std::string::npos && "Log files never carry colors");

        // Re-initializing without a directory closes the file
        logger.initialize();
        logger.setConsoleColors(false);
        cleanup();
        std::cout << "✓ Log file test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Logger unit tests..." << std::endl;

        testConsoleColors();
        testLevelFiltering();
        testLogFile();

        std::cout << "All Logger tests passed!" << std::endl;
    }
};

int main() {
    try {
        LoggerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
