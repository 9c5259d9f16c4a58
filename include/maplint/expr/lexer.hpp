//! # Mapping Expression Lexer
//!
//! Tokenizes the lambda text of `MapFrom` / `Condition` configurations.
//! It covers the subset of C# expression syntax that appears in mapping
//! lambdas: identifiers and keywords, numeric/char/string literals
//! (including `@"verbatim"` and `$"interpolated {holes}"`), and operators.
//!
//! ```cpp
//! Lexer lexer("src => src.Items.Count()");
//! auto tokens = lexer.tokenize();
//! if (lexer.has_errors()) { ... }
//! ```

#ifndef MAPLINT_EXPR_LEXER_HPP
#define MAPLINT_EXPR_LEXER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace maplint::expr {

enum class TokenKind {
    Ident,
    IntLiteral,
    FloatLiteral,
    StringLiteral,       ///< `"..."` or `@"..."`; lexeme keeps quotes
    InterpStringLiteral, ///< `$"..."`; lexeme keeps `$` and quotes
    CharLiteral,
    Punct, ///< Operators and delimiters; see `Token::lexeme`
    Eof,
    Error
};

struct Token {
    TokenKind kind = TokenKind::Eof;
    std::string lexeme;
    size_t offset = 0;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_punct(std::string_view p) const -> bool {
        return kind == TokenKind::Punct && lexeme == p;
    }

    [[nodiscard]] auto is_ident(std::string_view name) const -> bool {
        return kind == TokenKind::Ident && lexeme == name;
    }
};

struct LexerError {
    std::string message;
    size_t offset = 0;
};

class Lexer {
public:
    explicit Lexer(std::string_view text);

    [[nodiscard]] auto next_token() -> Token;

    /// All tokens including the trailing Eof.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    std::string_view text_;
    size_t pos_ = 0;
    std::vector<LexerError> errors_;

    [[nodiscard]] auto peek(size_t ahead = 0) const -> char;
    void skip_trivia();

    auto make(TokenKind kind, size_t start) -> Token;
    auto error(const std::string& message, size_t start) -> Token;

    auto lex_identifier(size_t start) -> Token;
    auto lex_number(size_t start) -> Token;
    auto lex_string(size_t start, bool verbatim, bool interpolated) -> Token;
    auto lex_char(size_t start) -> Token;
    auto lex_punct(size_t start) -> Token;
};

} // namespace maplint::expr

#endif // MAPLINT_EXPR_LEXER_HPP
