//! # JSON Serializer
//!
//! Indented output for `JsonValue`, the layout of stored comment sets.
//! Integers are written without a fraction, control characters as `\u00XX`,
//! everything else (including UTF-8) verbatim.

#include "json/json_value.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace vcm::json {

namespace {

constexpr size_t INDENT = 2;

void append_escaped(std::string& out, const std::string& s) {
    out += '"';
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
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                out += oss.str();
            } else {
                out += c;
            }
            break;
        }
    }
    out += '"';
}

auto format_number(const JsonNumber& num) -> std::string {
    if (num.is_integer()) {
        return std::to_string(num.i64);
    }
    // JSON has no NaN or infinity
    if (std::isnan(num.f64) || std::isinf(num.f64)) {
        return "null";
    }

    std::ostringstream oss;
    oss << std::setprecision(17) << num.f64;
    std::string result = oss.str();
    if (result.find_first_of(".eE") == std::string::npos) {
        result += ".0";
    }
    return result;
}

void serialize_pretty(const JsonValue& value, std::string& out, size_t depth) {
    if (value.is_null()) {
        out += "null";
        return;
    }
    if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
        return;
    }
    if (value.is_number()) {
        out += format_number(value.as_number());
        return;
    }
    if (value.is_string()) {
        append_escaped(out, value.as_string());
        return;
    }

    std::string closing(depth * INDENT, ' ');
    std::string inner((depth + 1) * INDENT, ' ');

    if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            out += "[]";
            return;
        }
        out += "[\n";
        for (size_t i = 0; i < arr.size(); ++i) {
            out += inner;
            serialize_pretty(arr[i], out, depth + 1);
            out += (i + 1 < arr.size()) ? ",\n" : "\n";
        }
        out += closing;
        out += ']';
        return;
    }

    const auto& obj = value.as_object();
    if (obj.empty()) {
        out += "{}";
        return;
    }
    out += "{\n";
    size_t i = 0;
    for (const auto& [key, val] : obj) {
        out += inner;
        append_escaped(out, key);
        out += ": ";
        serialize_pretty(val, out, depth + 1);
        out += (++i < obj.size()) ? ",\n" : "\n";
    }
    out += closing;
    out += '}';
}

} // namespace

auto JsonValue::to_string_pretty() const -> std::string {
    std::string out;
    serialize_pretty(*this, out, 0);
    return out;
}

} // namespace vcm::json
