#ifndef PX_TEST_HPP
#define PX_TEST_HPP

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <functional>
#include <vector>

namespace px {
namespace test {

class TestRunner {
public:
    static TestRunner& instance() {
        static TestRunner runner;
        return runner;
    }

    void registerTest(const std::string& name, std::function<void()> test) {
        tests_.push_back({name, test});
    }

    // Runs every test whose name contains filter; returns the failure count
    int run(const std::string& filter = "") {
        int failed = 0;
        int passed = 0;

        std::cout << "Running " << tests_.size() << " tests...\n\n";

        for (const auto& t : tests_) {
            if (!filter.empty() && t.name.find(filter) == std::string::npos) {
                continue;
            }
            std::cout << "[ RUN      ] " << t.name << "\n";
            try {
                t.test();
                std::cout << "[       OK ] " << t.name << "\n";
                passed++;
            } catch (const std::exception& e) {
                std::cout << "[  FAILED  ] " << t.name << "\n";
                std::cout << "  Error: " << e.what() << "\n";
                failed++;
            }
        }

        std::cout << "\n";
        std::cout << "Tests passed: " << passed << "\n";
        std::cout << "Tests failed: " << failed << "\n";

        return failed;
    }

private:
    struct Test {
        std::string name;
        std::function<void()> test;
    };

    std::vector<Test> tests_;
};

class TestCase {
public:
    TestCase(const std::string& name, std::function<void()> test) {
        TestRunner::instance().registerTest(name, test);
    }
};

inline void assertTrue(bool condition, const std::string& message = "") {
    if (!condition) {
        throw std::runtime_error("Assertion failed: " + message);
    }
}

template <typename A, typename B>
void assertEqual(const A& expected, const B& actual, const std::string& message = "") {
    if (!(expected == actual)) {
        std::ostringstream oss;
        oss << "Expected '" << expected << "', got '" << actual << "'. " << message;
        throw std::runtime_error(oss.str());
    }
}

inline void assertContains(const std::string& haystack, const std::string& needle,
                           const std::string& message = "") {
    if (haystack.find(needle) == std::string::npos) {
        throw std::runtime_error("Expected '" + haystack + "' to contain '" + needle + "'. " + message);
    }
}

#define TEST(name) \
    static void test_##name(); \
    static px::test::TestCase testcase_##name(#name, test_##name); \
    static void test_##name()

#define ASSERT_TRUE(cond, msg) px::test::assertTrue((cond), (msg))
#define ASSERT_EQUALS(expected, actual, msg) px::test::assertEqual((expected), (actual), (msg))
#define ASSERT_CONTAINS(haystack, needle, msg) px::test::assertContains((haystack), (needle), (msg))

} // namespace test
} // namespace px

#endif // PX_TEST_HPP
