// test_harness.hpp - Minimal test macros and filesystem fixtures
// Part of web_compile - Web Asset Compiler

#ifndef WEB_COMPILE_TEST_HARNESS_HPP
#define WEB_COMPILE_TEST_HARNESS_HPP

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { \
        tests_run++; \
        std::cout << "  Testing: " << #name << "... "; \
        try { \
            test_##name(); \
            tests_passed++; \
            std::cout << "PASS\n"; \
        } catch (const std::exception& e) { \
            std::cout << "FAIL: " << e.what() << "\n"; \
        } \
    } while(0)

#define ASSERT(cond) \
    if (!(cond)) { \
        throw std::runtime_error("Assertion failed: " #cond); \
    }

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) { \
        throw std::runtime_error("Assertion failed: " #a " == " #b); \
    }

#define ASSERT_THROWS(expr, type) \
    do { \
        bool thrown_ = false; \
        try { \
            expr; \
        } catch (const type&) { \
            thrown_ = true; \
        } \
        if (!thrown_) { \
            throw std::runtime_error("Expected " #type " from: " #expr); \
        } \
    } while(0)

inline int finish_tests() {
    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "/" << tests_run << "\n";
    return tests_passed == tests_run ? 0 : 1;
}

// =============================================================================
// Test Fixtures
// =============================================================================

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        static int counter = 0;
        path = fs::temp_directory_path() /
               ("web_compile_" + name + "_" + std::to_string(::getpid()) + "_" +
                std::to_string(counter++));
        fs::remove_all(path);
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    fs::path operator/(const fs::path& rel) const { return path / rel; }

    fs::path path;
};

inline void write_file(const fs::path& path, const std::string& contents) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::string read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Regular files directly inside `dir`, by name
inline size_t count_files(const fs::path& dir) {
    size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file()) ++n;
    }
    return n;
}

#endif // WEB_COMPILE_TEST_HARNESS_HPP
