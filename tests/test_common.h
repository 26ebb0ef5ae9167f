#pragma once

#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>

inline void die(const std::string& msg) {
    std::cerr << "TEST FAIL: " << msg << std::endl;
    std::exit(1);
}

inline void expect_true(bool cond, const std::string& msg) {
    if (!cond) die(msg);
}

inline void expect_eq_ll(long long a, long long b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=" + std::to_string(a) + ", want=" + std::to_string(b) + ")");
    }
}

inline void expect_eq_str(const std::string& a, const std::string& b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=\"" + a + "\", want=\"" + b + "\")");
    }
}

// Unwraps a std::variant alternative or fails the test.
template <typename T, typename V>
const T& expect_holds(const V& v, const std::string& msg) {
    const T* p = std::get_if<T>(&v);
    if (!p) die(msg);
    return *p;
}
