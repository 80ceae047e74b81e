#pragma once

#include <sstream>
#include <string>

// Parse a whole whitespace-free token as a number. Fails on partial
// parses such as "2.5" for an integer or "1500m" for a double.
template<typename T>
bool parseNumber(const std::string& token, T& out) {
    std::istringstream ts(token);
    T value;
    if (!(ts >> value)) return false;
    if (ts.peek() != std::char_traits<char>::eof()) return false;
    out = value;
    return true;
}
