//! # Mapping Expression Lexer

#include "maplint/expr/lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace maplint::expr {

namespace {

auto is_ident_start(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

auto is_ident_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

auto is_digit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Longest first, so "?." wins over "?" and "=>" over "=".
// ">>" is left as two tokens so nested generic arguments close cleanly.
constexpr std::array<std::string_view, 17> MULTI_CHAR_PUNCT = {
    "??=", "?.", "?[", "??", "=>", "==", "!=", "<=", ">=",
    "&&",  "||", "++", "--", "+=", "-=", "*=", "::",
};

} // namespace

Lexer::Lexer(std::string_view text) : text_(text) {}

auto Lexer::peek(size_t ahead) const -> char {
    size_t i = pos_ + ahead;
    return i < text_.size() ? text_[i] : '\0';
}

void Lexer::skip_trivia() {
    while (pos_ < text_.size()) {
        char c = peek();
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos_;
        } else if (c == '/' && peek(1) == '/') {
            while (pos_ < text_.size() && peek() != '\n') {
                ++pos_;
            }
        } else if (c == '/' && peek(1) == '*') {
            pos_ += 2;
            while (pos_ < text_.size() && !(peek() == '*' && peek(1) == '/')) {
                ++pos_;
            }
            pos_ = std::min(pos_ + 2, text_.size());
        } else {
            break;
        }
    }
}

auto Lexer::make(TokenKind kind, size_t start) -> Token {
    return Token{kind, std::string(text_.substr(start, pos_ - start)), start};
}

auto Lexer::error(const std::string& message, size_t start) -> Token {
    errors_.push_back(LexerError{message, start});
    return make(TokenKind::Error, start);
}

auto Lexer::next_token() -> Token {
    skip_trivia();
    size_t start = pos_;
    if (pos_ >= text_.size()) {
        return Token{TokenKind::Eof, "", pos_};
    }

    char c = peek();
    if (c == '@' && peek(1) == '"') {
        pos_ += 1;
        return lex_string(start, true, false);
    }
    if (c == '$' && peek(1) == '"') {
        pos_ += 1;
        return lex_string(start, false, true);
    }
    if ((c == '$' && peek(1) == '@' && peek(2) == '"') ||
        (c == '@' && peek(1) == '$' && peek(2) == '"')) {
        pos_ += 2;
        return lex_string(start, true, true);
    }
    if (c == '@' && is_ident_start(peek(1))) {
        ++pos_; // @keyword escapes
        return lex_identifier(start);
    }
    if (is_ident_start(c)) {
        return lex_identifier(start);
    }
    if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
        return lex_number(start);
    }
    if (c == '"') {
        return lex_string(start, false, false);
    }
    if (c == '\'') {
        return lex_char(start);
    }
    return lex_punct(start);
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (true) {
        Token tok = next_token();
        bool done = tok.is(TokenKind::Eof);
        tokens.push_back(std::move(tok));
        if (done) {
            break;
        }
    }
    return tokens;
}

auto Lexer::lex_identifier(size_t start) -> Token {
    while (is_ident_char(peek())) {
        ++pos_;
    }
    Token tok = make(TokenKind::Ident, start);
    if (!tok.lexeme.empty() && tok.lexeme[0] == '@') {
        tok.lexeme.erase(0, 1);
    }
    return tok;
}

auto Lexer::lex_number(size_t start) -> Token {
    bool is_float = false;

    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X')) {
        pos_ += 2;
        while (std::isxdigit(static_cast<unsigned char>(peek())) || peek() == '_') {
            ++pos_;
        }
    } else {
        while (is_digit(peek()) || peek() == '_') {
            ++pos_;
        }
        if (peek() == '.' && is_digit(peek(1))) {
            is_float = true;
            ++pos_;
            while (is_digit(peek()) || peek() == '_') {
                ++pos_;
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            size_t save = pos_;
            ++pos_;
            if (peek() == '+' || peek() == '-') {
                ++pos_;
            }
            if (is_digit(peek())) {
                is_float = true;
                while (is_digit(peek())) {
                    ++pos_;
                }
            } else {
                pos_ = save;
            }
        }
    }

    // Type suffixes: L, U, UL, F, D, M
    while (true) {
        char s = static_cast<char>(std::tolower(static_cast<unsigned char>(peek())));
        if (s == 'f' || s == 'd' || s == 'm') {
            is_float = true;
            ++pos_;
        } else if (s == 'l' || s == 'u') {
            ++pos_;
        } else {
            break;
        }
    }

    if (is_ident_char(peek())) {
        return error("invalid numeric literal", start);
    }
    return make(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
}

auto Lexer::lex_string(size_t start, bool verbatim, bool interpolated) -> Token {
    ++pos_; // opening quote
    int brace_depth = 0;

    while (pos_ < text_.size()) {
        char c = peek();

        if (interpolated) {
            if (c == '{' && peek(1) == '{' && brace_depth == 0) {
                pos_ += 2;
                continue;
            }
            if (c == '{') {
                ++brace_depth;
                ++pos_;
                continue;
            }
            if (c == '}' && brace_depth > 0) {
                --brace_depth;
                ++pos_;
                continue;
            }
            if (brace_depth > 0 && (c == '"' || c == '\'')) {
                // Nested literal inside a hole.
                Token inner = c == '"' ? lex_string(pos_, false, false) : lex_char(pos_);
                if (inner.is(TokenKind::Error)) {
                    return error("unterminated string literal", start);
                }
                continue;
            }
        }

        if (verbatim) {
            if (c == '"' && peek(1) == '"') {
                pos_ += 2;
                continue;
            }
        } else if (c == '\\') {
            pos_ += 2;
            continue;
        }

        if (c == '"' && brace_depth == 0) {
            ++pos_;
            return make(interpolated ? TokenKind::InterpStringLiteral : TokenKind::StringLiteral,
                        start);
        }
        if (c == '\n' && !verbatim) {
            break;
        }
        ++pos_;
    }

    pos_ = text_.size();
    return error("unterminated string literal", start);
}

auto Lexer::lex_char(size_t start) -> Token {
    ++pos_; // opening quote
    while (pos_ < text_.size() && peek() != '\'') {
        if (peek() == '\\') {
            ++pos_;
        }
        ++pos_;
    }
    if (pos_ >= text_.size()) {
        return error("unterminated character literal", start);
    }
    ++pos_;
    return make(TokenKind::CharLiteral, start);
}

auto Lexer::lex_punct(size_t start) -> Token {
    std::string_view rest = text_.substr(pos_);
    for (auto p : MULTI_CHAR_PUNCT) {
        if (rest.starts_with(p)) {
            pos_ += p.size();
            return make(TokenKind::Punct, start);
        }
    }

    static constexpr std::string_view SINGLE = "()[]{},.;:?+-*/%<>=!&|^~";
    if (SINGLE.find(peek()) != std::string_view::npos) {
        ++pos_;
        return make(TokenKind::Punct, start);
    }

    ++pos_;
    return error(std::string("unexpected character '") + text_[start] + "'", start);
}

} // namespace maplint::expr
