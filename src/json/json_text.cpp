//! # JSON Text Primitives
//!
//! Scalar rendering shared by the writer and the field-name encoders.

#include "json/json_text.hpp"

#include <charconv>
#include <cmath>

namespace jemit::json {

void append_escaped(std::string& out, std::string_view s) {
    static constexpr char kHex[] = "0123456789abcdef";

    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default: {
            auto byte = static_cast<unsigned char>(c);
            if (byte < 0x20) {
                // Control character - escape as \u00XX
                out += "\\u00";
                out += kHex[byte >> 4];
                out += kHex[byte & 0x0F];
            } else {
                out += c;
            }
            break;
        }
        }
    }
}

auto quote_string(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size() + 2);
    result += '"';
    append_escaped(result, s);
    result += '"';
    return result;
}

auto format_integer(int64_t value) -> std::string {
    char buf[24];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, end);
}

auto format_unsigned(uint64_t value) -> std::string {
    char buf[24];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, end);
}

auto format_double(double value) -> std::string {
    if (std::isnan(value) || std::isinf(value)) {
        return "null";
    }

    // Shortest representation that round-trips
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    std::string result(buf, end);

    // Ensure there's a decimal point for floats
    if (result.find('.') == std::string::npos && result.find('e') == std::string::npos &&
        result.find('E') == std::string::npos) {
        result += ".0";
    }

    return result;
}

} // namespace jemit::json
