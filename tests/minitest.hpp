#pragma once

#include <iostream>
#include <stdexcept>
#include <string>

// Self-check helpers: each test is a `static bool test_x()` returning false
// on the first failed check; run_test prints one status line per test.

#define CHECK(cond)                                                              \
    do {                                                                         \
        if (!(cond)) {                                                           \
            std::cerr << __FILE__ << ":" << __LINE__ << ": check failed: " #cond \
                      << "\n";                                                   \
            return false;                                                        \
        }                                                                        \
    } while (0)

#define CHECK_THROWS(expr, type)                                                  \
    do {                                                                          \
        bool thrown_ = false;                                                     \
        try {                                                                     \
            (void)(expr);                                                         \
        } catch (const type&) {                                                   \
            thrown_ = true;                                                       \
        }                                                                         \
        if (!thrown_) {                                                           \
            std::cerr << __FILE__ << ":" << __LINE__ << ": expected " #type       \
                      << " from " #expr "\n";                                     \
            return false;                                                         \
        }                                                                         \
    } while (0)

inline bool run_test(const char* name, bool (*fn)()) {
    bool ok = false;
    try {
        ok = fn();
    } catch (const std::exception& e) {
        std::cerr << name << ": unexpected exception: " << e.what() << "\n";
    }
    std::cout << "[" << (ok ? " OK " : "FAIL") << "] " << name << "\n";
    return ok;
}

inline int finish(bool ok) {
    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
