//! # Line Utilities
//!
//! Text is handled as a vector of lines split on `\n`. A trailing newline
//! produces a final empty line, so `join_lines(split_lines(t)) == t` for
//! every input. Carriage returns stay inside the line they end.

#ifndef VCM_ANCHOR_LINES_HPP
#define VCM_ANCHOR_LINES_HPP

#include <string>
#include <string_view>
#include <vector>

namespace vcm::anchor {

[[nodiscard]] inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines);

[[nodiscard]] std::string_view trim(std::string_view s);

[[nodiscard]] std::string_view trim_start(std::string_view s);

[[nodiscard]] std::string_view trim_end(std::string_view s);

/// Empty or whitespace only.
[[nodiscard]] bool is_blank(std::string_view s);

} // namespace vcm::anchor

#endif // VCM_ANCHOR_LINES_HPP
