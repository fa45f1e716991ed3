//! # JSON Parser
//!
//! Lexer and recursive descent parser. Integers without fraction or
//! exponent stay integers; everything else becomes a double.

#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace vcm::json {

// ============================================================================
// JsonLexer
// ============================================================================

JsonLexer::JsonLexer(std::string_view input) : input_(input) {}

auto JsonLexer::peek() const -> char {
    return pos_ < input_.size() ? input_[pos_] : '\0';
}

auto JsonLexer::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonLexer::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonLexer::token_at(JsonTokenKind kind, size_t start_pos, size_t start_line,
                         size_t start_col) const -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.line = start_line;
    tok.column = start_col;
    tok.offset = start_pos;
    return tok;
}

auto JsonLexer::error_at(std::string msg, size_t start_pos, size_t start_line,
                         size_t start_col) const -> JsonToken {
    JsonToken tok = token_at(JsonTokenKind::Error, start_pos, start_line, start_col);
    tok.string_value = std::move(msg);
    return tok;
}

auto JsonLexer::read_hex4(unsigned int& out) -> bool {
    if (pos_ + 4 > input_.size()) {
        return false;
    }
    const char* first = input_.data() + pos_;
    auto [ptr, ec] = std::from_chars(first, first + 4, out, 16);
    if (ec != std::errc{} || ptr != first + 4) {
        return false;
    }
    pos_ += 4;
    column_ += 4;
    return true;
}

static void append_utf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto JsonLexer::scan_string() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    advance(); // opening quote

    std::string value;
    while (pos_ < input_.size()) {
        char c = peek();

        if (c == '"') {
            advance();
            JsonToken tok = token_at(JsonTokenKind::String, start_pos, start_line, start_col);
            tok.string_value = std::move(value);
            return tok;
        }

        if (static_cast<unsigned char>(c) < 0x20) {
            return error_at("Control character in string", pos_, line_, column_);
        }

        if (c != '\\') {
            value += c;
            advance();
            continue;
        }

        advance(); // backslash
        char escaped = advance();
        switch (escaped) {
        case '"':
        case '\\':
        case '/':
            value += escaped;
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            unsigned int cp = 0;
            if (!read_hex4(cp)) {
                return error_at("Invalid unicode escape sequence", pos_, line_, column_);
            }
            // UTF-16 surrogate pair
            if (cp >= 0xD800 && cp <= 0xDBFF && peek() == '\\' && pos_ + 1 < input_.size() &&
                input_[pos_ + 1] == 'u') {
                advance();
                advance();
                unsigned int low = 0;
                if (!read_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
                    return error_at("Invalid surrogate pair", pos_, line_, column_);
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(value, cp);
            break;
        }
        default:
            return error_at("Invalid escape sequence: \\" + std::string(1, escaped), pos_, line_,
                            column_);
        }
    }

    return error_at("Unterminated string", start_pos, start_line, start_col);
}

auto JsonLexer::scan_number() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;
    bool is_float = false;

    auto digit = [this] { return std::isdigit(static_cast<unsigned char>(peek())) != 0; };

    if (peek() == '-') {
        advance();
    }

    if (peek() == '0') {
        advance();
    } else if (digit()) {
        while (digit()) {
            advance();
        }
    } else {
        return error_at("Invalid number", start_pos, start_line, start_col);
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!digit()) {
            return error_at("Expected digit after decimal point", pos_, line_, column_);
        }
        while (digit()) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!digit()) {
            return error_at("Expected digit in exponent", pos_, line_, column_);
        }
        while (digit()) {
            advance();
        }
    }

    std::string_view text = input_.substr(start_pos, pos_ - start_pos);
    JsonToken tok = token_at(JsonTokenKind::Number, start_pos, start_line, start_col);

    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{}) {
            tok.number_value = JsonNumber(value);
            return tok;
        }
        // Out of int64 range: keep the magnitude as a double
    }

    tok.number_value = JsonNumber(std::strtod(std::string(text).c_str(), nullptr));
    return tok;
}

auto JsonLexer::scan_keyword() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    while (std::isalpha(static_cast<unsigned char>(peek()))) {
        advance();
    }

    std::string_view word = input_.substr(start_pos, pos_ - start_pos);
    if (word == "true") {
        return token_at(JsonTokenKind::True, start_pos, start_line, start_col);
    }
    if (word == "false") {
        return token_at(JsonTokenKind::False, start_pos, start_line, start_col);
    }
    if (word == "null") {
        return token_at(JsonTokenKind::Null, start_pos, start_line, start_col);
    }
    return error_at("Unknown keyword: " + std::string(word), start_pos, start_line, start_col);
}

auto JsonLexer::next_token() -> JsonToken {
    skip_whitespace();

    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    if (pos_ >= input_.size()) {
        return token_at(JsonTokenKind::Eof, start_pos, start_line, start_col);
    }

    char c = peek();
    auto single = [&](JsonTokenKind kind) {
        advance();
        return token_at(kind, start_pos, start_line, start_col);
    };

    switch (c) {
    case '{':
        return single(JsonTokenKind::LBrace);
    case '}':
        return single(JsonTokenKind::RBrace);
    case '[':
        return single(JsonTokenKind::LBracket);
    case ']':
        return single(JsonTokenKind::RBracket);
    case ':':
        return single(JsonTokenKind::Colon);
    case ',':
        return single(JsonTokenKind::Comma);
    case '"':
        return scan_string();
    case 't':
    case 'f':
    case 'n':
        return scan_keyword();
    default:
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return scan_number();
        }
        advance();
        return error_at("Unexpected character: " + std::string(1, c), start_pos, start_line,
                        start_col);
    }
}

// ============================================================================
// JsonParser
// ============================================================================

JsonParser::JsonParser(std::string_view input) : lexer_(input) {
    advance();
}

void JsonParser::advance() {
    current_ = lexer_.next_token();
}

auto JsonParser::check(JsonTokenKind kind) const -> bool {
    return current_.kind == kind;
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, current_.line, current_.column, current_.offset);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    if (!check(JsonTokenKind::Eof)) {
        return make_error("Unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    if (depth_ >= MAX_DEPTH) {
        return make_error("Maximum nesting depth exceeded");
    }

    switch (current_.kind) {
    case JsonTokenKind::Null:
        advance();
        return JsonValue();
    case JsonTokenKind::True:
        advance();
        return JsonValue(true);
    case JsonTokenKind::False:
        advance();
        return JsonValue(false);
    case JsonTokenKind::Number: {
        JsonNumber num = current_.number_value;
        advance();
        return JsonValue(num);
    }
    case JsonTokenKind::String: {
        std::string str = std::move(current_.string_value);
        advance();
        return JsonValue(std::move(str));
    }
    case JsonTokenKind::LBrace:
        return parse_object();
    case JsonTokenKind::LBracket:
        return parse_array();
    case JsonTokenKind::Error:
        return make_error(current_.string_value);
    case JsonTokenKind::Eof:
        return make_error("Unexpected end of input");
    default:
        return make_error("Unexpected token");
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '{'

    JsonObject obj;
    if (check(JsonTokenKind::RBrace)) {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        if (!check(JsonTokenKind::String)) {
            return make_error("Expected string key in object");
        }
        std::string key = std::move(current_.string_value);
        advance();

        if (!check(JsonTokenKind::Colon)) {
            return make_error("Expected ':' after object key");
        }
        advance();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj.insert_or_assign(std::move(key), std::move(unwrap(value)));

        if (check(JsonTokenKind::Comma)) {
            advance();
            if (check(JsonTokenKind::RBrace)) {
                return make_error("Trailing comma in object");
            }
        } else if (check(JsonTokenKind::RBrace)) {
            advance();
            --depth_;
            return JsonValue(std::move(obj));
        } else {
            return make_error("Expected ',' or '}' in object");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '['

    JsonArray arr;
    if (check(JsonTokenKind::RBracket)) {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        if (check(JsonTokenKind::Comma)) {
            advance();
            if (check(JsonTokenKind::RBracket)) {
                return make_error("Trailing comma in array");
            }
        } else if (check(JsonTokenKind::RBracket)) {
            advance();
            --depth_;
            return JsonValue(std::move(arr));
        } else {
            return make_error("Expected ',' or ']' in array");
        }
    }
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace vcm::json
