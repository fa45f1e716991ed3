//! # JSON Error
//!
//! Parse failures with the position they were detected at. The comment
//! store reports these when a persisted set cannot be read back.

#pragma once

#include <cstddef>
#include <string>

namespace vcm::json {

/// A JSON parse or shape error.
///
/// `line` and `column` are 1-based; 0 means unknown.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// `"line 3, column 7: message"`, or just the message without a location.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace vcm::json
