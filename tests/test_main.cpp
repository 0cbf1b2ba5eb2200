/**
 * CardForge Engine - Test Runner
 *
 * Simple assert-based test framework for the C++ engine.
 * Run with: ./cardforge_tests [pattern | --list]
 */

#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <stdexcept>
#include <functional>
#include <chrono>

// Test result tracking
struct TestResult {
    std::string name;
    bool passed;
    std::string message;
    double duration_ms;
};

static std::vector<TestResult> g_results;
static int g_tests_run = 0;
static int g_tests_passed = 0;
static int g_tests_failed = 0;

// ============================================================================
// TEST MACROS
// ============================================================================

#define TEST_ASSERT(condition) \
    do { \
        if (!(condition)) { \
            throw std::runtime_error("Assertion failed: " #condition); \
        } \
    } while (0)

#define TEST_ASSERT_MSG(condition, msg) \
    do { \
        if (!(condition)) { \
            throw std::runtime_error(std::string("Assertion failed: ") + msg); \
        } \
    } while (0)

#define TEST_ASSERT_EQ(expected, actual) \
    do { \
        if ((expected) != (actual)) { \
            std::ostringstream oss; \
            oss << "Expected " << (expected) << " but got " << (actual); \
            throw std::runtime_error(oss.str()); \
        } \
    } while (0)

#define TEST_ASSERT_NE(val1, val2) \
    do { \
        if ((val1) == (val2)) { \
            throw std::runtime_error("Expected values to be different"); \
        } \
    } while (0)

#define TEST_ASSERT_TRUE(condition) TEST_ASSERT(condition)
#define TEST_ASSERT_FALSE(condition) TEST_ASSERT(!(condition))
#define TEST_ASSERT_NULL(ptr) TEST_ASSERT((ptr) == nullptr)
#define TEST_ASSERT_NOT_NULL(ptr) TEST_ASSERT((ptr) != nullptr)

// Expression must throw the given exception type
#define TEST_ASSERT_THROWS(expression, exception_type) \
    do { \
        bool thrown_ = false; \
        try { \
            (void)(expression); \
        } catch (const exception_type&) { \
            thrown_ = true; \
        } \
        if (!thrown_) { \
            throw std::runtime_error("Expected " #exception_type " from: " #expression); \
        } \
    } while (0)

// Expression must throw an exception whose message contains text
#define TEST_ASSERT_THROWS_MSG(expression, exception_type, text) \
    do { \
        bool thrown_ = false; \
        try { \
            (void)(expression); \
        } catch (const exception_type& e_) { \
            thrown_ = true; \
            if (std::string(e_.what()).find(text) == std::string::npos) { \
                throw std::runtime_error(std::string("Unexpected message: ") + e_.what()); \
            } \
        } \
        if (!thrown_) { \
            throw std::runtime_error("Expected " #exception_type " from: " #expression); \
        } \
    } while (0)

// ============================================================================
// TEST REGISTRATION
// ============================================================================

using TestFunc = std::function<void()>;

struct TestCase {
    std::string name;
    std::string suite;
    TestFunc func;
};

static std::vector<TestCase> g_tests;

class TestRegistrar {
public:
    TestRegistrar(const std::string& suite, const std::string& name, TestFunc func) {
        g_tests.push_back({name, suite, func});
    }
};

#define TEST(suite, name) \
    void test_##suite##_##name(); \
    static TestRegistrar g_registrar_##suite##_##name(#suite, #name, test_##suite##_##name); \
    void test_##suite##_##name()

// ============================================================================
// TEST RUNNER
// ============================================================================

std::string full_name(const TestCase& test) {
    return test.suite + "::" + test.name;
}

bool matches(const TestCase& test, const std::string& pattern) {
    return pattern.empty() || full_name(test).find(pattern) != std::string::npos;
}

void record(TestResult result) {
    g_tests_run++;
    if (result.passed) {
        g_tests_passed++;
        std::cout << "  [PASS] " << result.name << "\n";
    } else {
        g_tests_failed++;
        std::cout << "  [FAIL] " << result.name << "\n"
                  << "         " << result.message << "\n";
    }
    g_results.push_back(std::move(result));
}

void run_test(const TestCase& test) {
    TestResult result{full_name(test), false, "", 0.0};
    auto start = std::chrono::steady_clock::now();

    try {
        test.func();
        result.passed = true;
        result.message = "OK";
    } catch (const std::exception& e) {
        result.message = e.what();
    } catch (...) {
        result.message = "Unknown exception";
    }

    result.duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    record(std::move(result));
}

void print_summary() {
    double total_ms = 0.0;
    const TestResult* slowest = nullptr;
    for (const auto& result : g_results) {
        total_ms += result.duration_ms;
        if (!slowest || result.duration_ms > slowest->duration_ms) {
            slowest = &result;
        }
    }

    std::cout << "\n=== Summary ===\n"
              << "Total:  " << g_tests_run << "\n"
              << "Passed: " << g_tests_passed << "\n"
              << "Failed: " << g_tests_failed << "\n"
              << "Time:   " << total_ms << " ms\n";
    if (slowest) {
        std::cout << "Slowest: " << slowest->name << " (" << slowest->duration_ms << " ms)\n";
    }

    if (g_tests_failed > 0) {
        std::cout << "\nFailed tests:\n";
        for (const auto& result : g_results) {
            if (!result.passed) {
                std::cout << "  - " << result.name << ": " << result.message << "\n";
            }
        }
    }
    std::cout << "\n";
}

// Empty pattern runs everything; suites print as headers
void run_tests(const std::string& pattern) {
    if (pattern.empty()) {
        std::cout << "\n=== CardForge Engine Tests ===\n\n";
    } else {
        std::cout << "\n=== CardForge Engine Tests matching '" << pattern << "' ===\n\n";
    }

    std::string current_suite;
    for (const auto& test : g_tests) {
        if (!matches(test, pattern)) {
            continue;
        }
        if (test.suite != current_suite) {
            current_suite = test.suite;
            std::cout << "[" << current_suite << "]\n";
        }
        run_test(test);
    }

    print_summary();
}

void list_tests() {
    for (const auto& test : g_tests) {
        std::cout << full_name(test) << "\n";
    }
}

// ============================================================================
// MAIN
// ============================================================================

// Test files register through static initializers
#include "test_helpers.hpp"
#include "test_primitives.cpp"
#include "test_game.cpp"
#include "test_actions.cpp"
#include "test_events.cpp"
#include "test_rule_compiler.cpp"
#include "test_game_loader.cpp"

int main(int argc, char* argv[]) {
    std::string pattern = argc > 1 ? argv[1] : "";
    if (pattern == "--list") {
        list_tests();
        return 0;
    }

    run_tests(pattern);
    return g_tests_failed > 0 ? 1 : 0;
}
