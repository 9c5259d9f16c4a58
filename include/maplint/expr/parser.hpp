//! # Mapping Expression Parser
//!
//! Recursive descent parser producing an `Expr` tree from lambda text.
//! Anything outside the supported subset yields a `ParseError`; callers
//! treat that as an opaque expression.
//!
//! ## Precedence (lowest first)
//!
//! | Level | Operators              | Assoc |
//! |-------|------------------------|-------|
//! | 1     | `=>` lambda            | right |
//! | 2     | `?:`                   | right |
//! | 3     | `??`                   | right |
//! | 4     | `\|\|`                 | left  |
//! | 5     | `&&`                   | left  |
//! | 6     | `\|`                   | left  |
//! | 7     | `^`                    | left  |
//! | 8     | `&`                    | left  |
//! | 9     | `==` `!=`              | left  |
//! | 10    | `<` `>` `<=` `>=` `is` `as` | left |
//! | 11    | `+` `-`                | left  |
//! | 12    | `*` `/` `%`            | left  |
//! | 13    | unary, casts           | right |
//! | 14    | `.` `?.` calls index   | left  |

#ifndef MAPLINT_EXPR_PARSER_HPP
#define MAPLINT_EXPR_PARSER_HPP

#include "maplint/common.hpp"
#include "maplint/expr/ast.hpp"
#include "maplint/expr/lexer.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace maplint::expr {

struct ParseError {
    std::string message;
    size_t offset = 0;

    [[nodiscard]] auto to_string() const -> std::string {
        return "offset " + std::to_string(offset) + ": " + message;
    }
};

/// Binding power of a binary operator, 0 if `op` is not one.
[[nodiscard]] auto binary_precedence(std::string_view op) -> int;

class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    /// Parses one complete expression; trailing tokens are an error.
    [[nodiscard]] auto parse() -> Result<ExprPtr, ParseError>;

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    std::optional<ParseError> error_;

    // Token access
    [[nodiscard]] auto peek(size_t ahead = 0) const -> const Token&;
    auto advance() -> const Token&;
    auto match_punct(std::string_view p) -> bool;
    auto expect_punct(std::string_view p) -> bool;
    void fail(const std::string& message);
    [[nodiscard]] auto failed() const -> bool {
        return error_.has_value();
    }
    [[nodiscard]] auto span_from(size_t start) const -> Span;

    // Lookahead helpers
    [[nodiscard]] auto at_lambda() const -> bool;
    [[nodiscard]] auto at_cast() const -> bool;
    [[nodiscard]] auto scan_type_name(size_t& index) const -> bool;
    [[nodiscard]] auto scan_type_args(size_t& index) const -> bool;
    auto parse_type_name() -> std::string;
    auto parse_type_args() -> std::vector<std::string>;

    // Grammar
    auto parse_expression() -> ExprPtr;
    auto parse_lambda() -> ExprPtr;
    auto parse_lambda_block(LambdaExpr& lambda) -> bool;
    auto parse_ternary() -> ExprPtr;
    auto parse_binary(int min_prec) -> ExprPtr;
    auto parse_unary() -> ExprPtr;
    auto parse_postfix(ExprPtr expr) -> ExprPtr;
    auto parse_primary() -> ExprPtr;
    auto parse_new() -> ExprPtr;
    auto parse_arguments(std::string_view close) -> std::vector<ExprPtr>;
    auto parse_initializer_entry() -> ExprPtr;
    auto parse_interpolated(const Token& tok) -> ExprPtr;
};

/// Lexes and parses `text`.
[[nodiscard]] auto parse_expression(std::string_view text) -> Result<ExprPtr, ParseError>;

} // namespace maplint::expr

#endif // MAPLINT_EXPR_PARSER_HPP
