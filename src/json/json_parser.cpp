//! # JSON Parser Implementation
//!
//! Lexer and recursive descent parser for RFC 8259 JSON. Integers without a
//! fraction or exponent stay integers; everything else becomes a double.

#include "maplint/json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace maplint::json {

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

auto JsonLexer::make_token(JsonTokenKind kind, size_t start_pos, size_t start_line,
                           size_t start_col) -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.lexeme = input_.substr(start_pos, pos_ - start_pos);
    tok.line = start_line;
    tok.column = start_col;
    tok.offset = start_pos;
    return tok;
}

auto JsonLexer::make_error(std::string msg, size_t start_pos, size_t start_line, size_t start_col)
    -> JsonToken {
    JsonToken tok = make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
    tok.error = std::move(msg);
    return tok;
}

/// Appends `cp` to `out` as UTF-8.
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
        char c = advance();

        if (c == '"') {
            JsonToken tok = make_token(JsonTokenKind::String, start_pos, start_line, start_col);
            tok.string_value = std::move(value);
            return tok;
        }

        if (static_cast<unsigned char>(c) < 0x20) {
            return make_error("control character in string", start_pos, start_line, start_col);
        }

        if (c != '\\') {
            value += c;
            continue;
        }

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
            if (pos_ + 4 > input_.size()) {
                return make_error("incomplete unicode escape", start_pos, start_line, start_col);
            }
            unsigned int cp = 0;
            const char* begin = input_.data() + pos_;
            auto [ptr, ec] = std::from_chars(begin, begin + 4, cp, 16);
            if (ec != std::errc{} || ptr != begin + 4) {
                return make_error("invalid unicode escape", start_pos, start_line, start_col);
            }
            for (int i = 0; i < 4; ++i) {
                advance();
            }
            append_utf8(value, cp);
            break;
        }
        default:
            return make_error("invalid escape sequence: \\" + std::string(1, escaped), start_pos,
                              start_line, start_col);
        }
    }

    return make_error("unterminated string", start_pos, start_line, start_col);
}

auto JsonLexer::scan_number() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    auto is_digit = [this]() { return std::isdigit(static_cast<unsigned char>(peek())) != 0; };

    bool is_float = false;
    if (peek() == '-') {
        advance();
    }

    if (peek() == '0') {
        advance();
    } else if (is_digit()) {
        while (is_digit()) {
            advance();
        }
    } else {
        return make_error("invalid number", start_pos, start_line, start_col);
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!is_digit()) {
            return make_error("expected digit after decimal point", start_pos, start_line,
                              start_col);
        }
        while (is_digit()) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!is_digit()) {
            return make_error("expected digit in exponent", start_pos, start_line, start_col);
        }
        while (is_digit()) {
            advance();
        }
    }

    JsonToken tok = make_token(JsonTokenKind::Number, start_pos, start_line, start_col);
    std::string_view text = tok.lexeme;

    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{}) {
            tok.number_value = JsonNumber(value);
            return tok;
        }
        // Out of int64 range: keep the magnitude as a double.
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
        return make_token(JsonTokenKind::True, start_pos, start_line, start_col);
    }
    if (word == "false") {
        return make_token(JsonTokenKind::False, start_pos, start_line, start_col);
    }
    if (word == "null") {
        return make_token(JsonTokenKind::Null, start_pos, start_line, start_col);
    }
    return make_error("unknown keyword: " + std::string(word), start_pos, start_line, start_col);
}

auto JsonLexer::next_token() -> JsonToken {
    skip_whitespace();

    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    if (pos_ >= input_.size()) {
        return make_token(JsonTokenKind::Eof, start_pos, start_line, start_col);
    }

    auto single = [&](JsonTokenKind kind) {
        advance();
        return make_token(kind, start_pos, start_line, start_col);
    };

    char c = peek();
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
    default:
        break;
    }

    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return scan_number();
    }
    if (std::isalpha(static_cast<unsigned char>(c))) {
        return scan_keyword();
    }

    advance();
    return make_error("unexpected character: " + std::string(1, c), start_pos, start_line,
                      start_col);
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
    if (current_.kind == JsonTokenKind::Error) {
        return JsonError::make(current_.error, current_.line, current_.column, current_.offset);
    }
    return JsonError::make(msg, current_.line, current_.column, current_.offset);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    if (!check(JsonTokenKind::Eof)) {
        return make_error("unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    switch (current_.kind) {
    case JsonTokenKind::LBrace:
        return parse_object();
    case JsonTokenKind::LBracket:
        return parse_array();
    case JsonTokenKind::String: {
        JsonValue value(std::move(current_.string_value));
        advance();
        return value;
    }
    case JsonTokenKind::Number: {
        JsonValue value(current_.number_value);
        advance();
        return value;
    }
    case JsonTokenKind::True:
        advance();
        return json_bool(true);
    case JsonTokenKind::False:
        advance();
        return json_bool(false);
    case JsonTokenKind::Null:
        advance();
        return json_null();
    case JsonTokenKind::Eof:
        return make_error("unexpected end of input");
    default:
        return make_error("expected a JSON value");
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("maximum nesting depth exceeded");
    }
    advance(); // '{'

    JsonObject obj;
    if (check(JsonTokenKind::RBrace)) {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        if (!check(JsonTokenKind::String)) {
            return make_error("expected string key");
        }
        std::string key = std::move(current_.string_value);
        advance();

        if (!check(JsonTokenKind::Colon)) {
            return make_error("expected ':' after object key");
        }
        advance();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj.insert_or_assign(std::move(key), std::move(unwrap(value)));

        if (check(JsonTokenKind::Comma)) {
            advance();
            continue;
        }
        if (check(JsonTokenKind::RBrace)) {
            advance();
            break;
        }
        return make_error("expected ',' or '}' in object");
    }

    --depth_;
    return JsonValue(std::move(obj));
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("maximum nesting depth exceeded");
    }
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
            continue;
        }
        if (check(JsonTokenKind::RBracket)) {
            advance();
            break;
        }
        return make_error("expected ',' or ']' in array");
    }

    --depth_;
    return JsonValue(std::move(arr));
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace maplint::json
