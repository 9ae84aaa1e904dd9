#ifndef FOUNDRY_TEST_HARNESS_HPP
#define FOUNDRY_TEST_HARNESS_HPP

/**
 * Minimal test harness shared by the test executables.
 *
 * Each RUN_TEST block counts as one test; any exception fails it.
 * FINISH_TESTS() prints the summary and yields the process exit status.
 */

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

static int passed = 0;
static int failed = 0;
static int total = 0;

#define RUN_TEST(name, ...) do { \
    total++; \
    std::cout << "  [" << total << "] " << name << "... " << std::flush; \
    try { __VA_ARGS__; passed++; std::cout << "OK" << std::endl; } \
    catch (const std::exception& e) { failed++; std::cout << "FAIL: " << e.what() << std::endl; } \
    catch (...) { failed++; std::cout << "FAIL: unknown exception" << std::endl; } \
} while(0)

#define EXPECT_THROW(expr, etype) do { \
    bool caught = false; \
    try { expr; } catch (const etype&) { caught = true; } \
    if (!caught) throw std::runtime_error("Expected " #etype " but none thrown"); \
} while(0)

#define EXPECT(cond) do { \
    if (!(cond)) { \
        std::ostringstream where_; \
        where_ << __FILE__ << ":" << __LINE__ << ": " #cond; \
        throw std::runtime_error(where_.str()); \
    } \
} while(0)

#define EXPECT_EQ(actual, expected) do { \
    if (!((actual) == (expected))) { \
        std::ostringstream where_; \
        where_ << __FILE__ << ":" << __LINE__ << ": " #actual " == " #expected \
               << " (got '" << (actual) << "')"; \
        throw std::runtime_error(where_.str()); \
    } \
} while(0)

#define SECTION(title) \
    std::cout << "--- " << title << " ---" << std::endl

#define FINISH_TESTS() ( \
    std::cout << std::endl << "Results: " << passed << " passed, " \
              << failed << " failed, " << total << " total" << std::endl, \
    failed > 0 ? 1 : 0)

/** Message of an error, for substring checks. */
static inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

#endif // FOUNDRY_TEST_HARNESS_HPP
