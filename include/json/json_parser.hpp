//! # JSON Parser
//!
//! Strict RFC 8259 parsing: no comments, no trailing commas, nesting
//! capped at `JsonParser::MAX_DEPTH`. Errors carry the line and column of
//! the offending token.

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace vcm::json {

enum class JsonTokenKind : uint8_t {
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Colon,
    Comma,
    String,
    Number,
    True,
    False,
    Null,
    Eof,
    Error
};

struct JsonToken {
    JsonTokenKind kind = JsonTokenKind::Eof;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;
    std::string string_value; ///< Decoded string, or the error message for `Error`
    JsonNumber number_value;
};

/// Splits input into tokens, decoding strings and numbers as it goes.
class JsonLexer {
public:
    explicit JsonLexer(std::string_view input);

    auto next_token() -> JsonToken;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();

    auto token_at(JsonTokenKind kind, size_t start_pos, size_t start_line, size_t start_col) const
        -> JsonToken;
    auto error_at(std::string msg, size_t start_pos, size_t start_line, size_t start_col) const
        -> JsonToken;

    auto scan_string() -> JsonToken;
    auto scan_number() -> JsonToken;
    auto scan_keyword() -> JsonToken;
    auto read_hex4(unsigned int& out) -> bool;
};

/// Recursive descent over a `JsonLexer`.
class JsonParser {
public:
    static constexpr size_t MAX_DEPTH = 256;

    explicit JsonParser(std::string_view input);

    /// Parses exactly one value followed by end of input.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    JsonLexer lexer_;
    JsonToken current_;
    size_t depth_ = 0;

    void advance();
    [[nodiscard]] auto check(JsonTokenKind kind) const -> bool;
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
};

[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace vcm::json
