#include <algorithm>
#include <cctype>
#include <stdexcept>
#include "permits/common/utility.hpp"

bool is_truthy(const char* str) {
    if (!str) {
        return false;
    }

    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char)tolower(c); });
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on" || lower == "y" || lower == "enable";
}

u64 get_int(const char* str) {
    std::string text = str;
    // stoull accepts a sign and wraps negative numbers around
    if (text.empty() || text.find_first_of("+-") != std::string::npos) {
        throw std::invalid_argument("not an unsigned integer: " + text);
    }

    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
    }

    size_t consumed = 0;
    u64 value = std::stoull(text, &consumed, base);
    if (consumed != text.size()) {
        throw std::invalid_argument("trailing characters after integer: " + text);
    }
    return value;
}
