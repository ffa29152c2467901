/**
 * @file test_cli_reporter.cpp
 * @brief Catch2 listener that announces each test case on stdout.
 *
 * CTest runs every discovered case as its own process and keeps stdout, so a
 * crash inside ICU or the filesystem code is attributed to the case that was
 * running. The "[ebook-renamer test]" prefix keeps the lines apart from the
 * spdlog output of the code under test.
 */
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <catch2/catch_test_case_info.hpp>

#include <iostream>

/**
 * @brief Prints "[ebook-renamer test] <name>" when a test case starts.
 */
class TestNamePrinter : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    /**
     * @brief Called by Catch2 before the first section of a test case runs.
     * @param info Test case metadata; only the name is used.
     */
    void testCaseStarting(Catch::TestCaseInfo const& info) override {
        std::cout << "[ebook-renamer test] " << info.name << std::endl;
    }
};

CATCH_REGISTER_LISTENER(TestNamePrinter)
