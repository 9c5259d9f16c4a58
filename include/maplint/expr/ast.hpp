//! # Mapping Expression AST
//!
//! Tree for the lambda bodies found in member configurations.
//!
//! ## Node Kinds
//!
//! - **Literals**: `42`, `1.5m`, `"text"`, `'c'`, `true`, `null`, `default`
//! - **Names**: `src`, `DateTime`
//! - **Access**: `src.Name`, `src?.Name`, `src.Items[0]`
//! - **Calls**: `src.Items.Count()`, `Method<T>(x)`
//! - **Operators**: unary, binary (including `??`, `is`, `as`), ternary
//! - **Construction**: `new T(args) { inits }`, `new T[] { ... }`
//! - **Casts**: `(int)src.Price`
//! - **Lambdas**: `x => e`, `(a, b) => e`, `x => { var y = e; return y; }`
//! - **Interpolation**: `$"{src.First} {src.Last}"`
//!
//! Spans are byte offsets into the lambda text.

#ifndef MAPLINT_EXPR_AST_HPP
#define MAPLINT_EXPR_AST_HPP

#include "maplint/common.hpp"

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace maplint::expr {

struct Expr;
using ExprPtr = Box<Expr>;

/// Half-open byte range `[start, end)` in the parsed text.
struct Span {
    size_t start = 0;
    size_t end = 0;
};

enum class LiteralKind { Int, Float, String, Char, Bool, Null, Default };

/// Literal as written, including quotes and numeric suffixes.
struct LiteralExpr {
    LiteralKind kind;
    std::string text;
};

/// Bare identifier, optionally with generic arguments (`Method<T>`).
struct IdentExpr {
    std::string name;
    std::vector<std::string> type_args;
};

/// `object.name` or `object?.name`.
struct MemberExpr {
    ExprPtr object;
    std::string name;
    std::vector<std::string> type_args;
    bool conditional = false;
};

struct CallExpr {
    ExprPtr callee;
    std::vector<ExprPtr> args;
};

/// `object[indices]` or `object?[indices]`.
struct IndexExpr {
    ExprPtr object;
    std::vector<ExprPtr> indices;
    bool conditional = false;
};

/// Prefix operator: `!`, `-`, `+`, `~`, `++`, `--`.
struct UnaryExpr {
    std::string op;
    ExprPtr operand;
};

/// Infix operator. `is`/`as` carry the type as an IdentExpr on the right.
/// Object initializer entries use op `=`.
struct BinaryExpr {
    std::string op;
    ExprPtr left;
    ExprPtr right;
};

struct TernaryExpr {
    ExprPtr condition;
    ExprPtr then_expr;
    ExprPtr else_expr;
};

/// `var name = init;` inside a block-bodied lambda.
struct LocalDecl {
    std::string type_name; ///< "var" or the declared type
    std::string name;
    ExprPtr init;
};

struct LambdaExpr {
    std::vector<std::string> params;
    bool parenthesized = false;
    std::vector<LocalDecl> locals;
    ExprPtr body; ///< Expression body, or the `return` operand of a block body
    bool block_body = false;
};

/// `new T(args) { initializers }`, `new T[] { ... }`, `new { A = x }`.
struct NewExpr {
    std::string type_name; ///< Empty for anonymous objects
    std::vector<ExprPtr> args;
    bool has_args = false;
    std::vector<ExprPtr> initializers;
    bool has_initializer = false;
};

struct CastExpr {
    std::string type_name;
    ExprPtr operand;
};

/// `$"..."`. `pieces` has one more element than `holes`; `formats` holds
/// each hole's `:format` / `,align` suffix (possibly empty).
struct InterpolatedStringExpr {
    std::string prefix; ///< "$" or "$@"
    std::vector<std::string> pieces;
    std::vector<ExprPtr> holes;
    std::vector<std::string> formats;
};

struct Expr {
    std::variant<LiteralExpr, IdentExpr, MemberExpr, CallExpr, IndexExpr, UnaryExpr, BinaryExpr,
                 TernaryExpr, LambdaExpr, NewExpr, CastExpr, InterpolatedStringExpr>
        kind;
    Span span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }
};

/// Builds a boxed node.
template <typename T> [[nodiscard]] auto make_expr(T node, Span span = {}) -> ExprPtr {
    return make_box<Expr>(Expr{std::move(node), span});
}

/// Deep copy of a tree.
[[nodiscard]] auto clone_expr(const Expr& expr) -> ExprPtr;

} // namespace maplint::expr

#endif // MAPLINT_EXPR_AST_HPP
