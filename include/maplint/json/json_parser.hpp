//! # JSON Parser
//!
//! A two-stage parser: `JsonLexer` produces tokens over a `string_view`,
//! `JsonParser` builds a `JsonValue` by recursive descent.
//!
//! ```cpp
//! auto result = parse_json(text);
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << "\n";
//! }
//! ```

#pragma once

#include "maplint/common.hpp"
#include "maplint/json/json_error.hpp"
#include "maplint/json/json_value.hpp"

#include <string>
#include <string_view>

namespace maplint::json {

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
    std::string_view lexeme;
    size_t line = 1;
    size_t column = 1;
    size_t offset = 0;

    std::string string_value; ///< Unescaped content for String tokens
    JsonNumber number_value;  ///< Parsed value for Number tokens
    std::string error;        ///< Message for Error tokens
};

/// Tokenizer over borrowed input. The input must outlive the lexer.
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

    auto make_token(JsonTokenKind kind, size_t start_pos, size_t start_line, size_t start_col)
        -> JsonToken;
    auto make_error(std::string msg, size_t start_pos, size_t start_line, size_t start_col)
        -> JsonToken;

    auto scan_string() -> JsonToken;
    auto scan_number() -> JsonToken;
    auto scan_keyword() -> JsonToken;
};

/// Recursive descent parser. Nesting deeper than MAX_DEPTH is rejected.
class JsonParser {
public:
    static constexpr size_t MAX_DEPTH = 1000;

    explicit JsonParser(std::string_view input);

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

/// Parses a complete JSON document. Trailing content is an error.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace maplint::json
