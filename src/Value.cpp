/**
 * @file Value.cpp
 * @brief Text rendering of Values
 */

#include "patchwork/Value.hpp"

#include <cstdlib>

namespace patchwork {

namespace {

/**
 * @brief Rewrite "d.ddde[+-]x" as plain decimal digits, keeping the shortest
 *        round-trip digits that dump() chose
 */
std::string expand_exponent(const std::string& text) {
    const std::size_t e = text.find_first_of("eE");
    if (e == std::string::npos) {
        return text;
    }

    std::string mantissa = text.substr(0, e);
    const long exponent = std::strtol(text.c_str() + e + 1, nullptr, 10);

    std::string sign;
    if (!mantissa.empty() && mantissa[0] == '-') {
        sign = "-";
        mantissa.erase(0, 1);
    }

    std::string digits;
    long point = -1;
    for (char c : mantissa) {
        if (c == '.') {
            point = static_cast<long>(digits.size());
        } else {
            digits += c;
        }
    }
    if (point < 0) point = static_cast<long>(digits.size());
    point += exponent;

    std::string out;
    if (point <= 0) {
        out = "0." + std::string(static_cast<std::size_t>(-point), '0') + digits;
    } else if (static_cast<std::size_t>(point) >= digits.size()) {
        out = digits + std::string(static_cast<std::size_t>(point) - digits.size(), '0');
    } else {
        out = digits.substr(0, static_cast<std::size_t>(point)) + "." +
              digits.substr(static_cast<std::size_t>(point));
    }
    return sign + out;
}

} // anonymous namespace

std::string to_display_string(const Value& val) {
    if (val.is_string()) {
        return val.get<std::string>();
    }
    if (val.is_number_float()) {
        std::string text = expand_exponent(val.dump());
        if (text.size() > 2 && text.compare(text.size() - 2, 2, ".0") == 0) {
            text.resize(text.size() - 2);
        }
        return text;
    }
    return val.dump();
}

} // namespace patchwork
