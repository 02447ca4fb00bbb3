#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

struct TestFailure : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

#define TEST_WHERE (std::string(__FILE__) + ":" + std::to_string(__LINE__) + ": ")

#define EXPECT_TRUE(cond) \
    do { if (!(cond)) throw TestFailure(TEST_WHERE + "EXPECT_TRUE failed: " + #cond); } while (false)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(lhs, rhs) \
    do { \
        auto _lhs = (lhs); \
        auto _rhs = (rhs); \
        if (!(_lhs == _rhs)) { \
            throw TestFailure(TEST_WHERE + "EXPECT_EQ failed: " + #lhs + " != " + #rhs); \
        } \
    } while (false)

#define EXPECT_NE(lhs, rhs) EXPECT_FALSE((lhs) == (rhs))

// EXPECT_THROW(SomeError, statement...) passes only when the statement throws SomeError.
#define EXPECT_THROW(exception_type, ...) \
    do { \
        bool _thrown = false; \
        try { \
            __VA_ARGS__; \
        } catch (const exception_type&) { \
            _thrown = true; \
        } \
        if (!_thrown) { \
            throw TestFailure(TEST_WHERE + "expected " #exception_type " from: " #__VA_ARGS__); \
        } \
    } while (false)

struct TestEntry {
    const char* name;
    std::function<void()> fn;
};

inline int run_tests(std::initializer_list<TestEntry> tests) {
    int failed = 0;
    for (const auto& t : tests) {
        const auto started = std::chrono::steady_clock::now();
        try {
            t.fn();
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            std::cout << "[PASS] " << t.name << " (" << elapsed.count() << " ms)\n";
        } catch (const std::exception& ex) {
            ++failed;
            std::cerr << "[FAIL] " << t.name << ": " << ex.what() << "\n";
        }
    }
    if (failed) {
        std::cerr << failed << " of " << tests.size() << " test(s) failed\n";
        return 1;
    }
    std::cout << "All " << tests.size() << " tests passed\n";
    return 0;
}
