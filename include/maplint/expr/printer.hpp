//! # Mapping Expression Printer
//!
//! Renders an `Expr` back to C# source text on a single line. Parentheses
//! are emitted only where operator precedence requires them, so
//! `print_expr(parse(text))` normalizes spacing but keeps meaning.

#ifndef MAPLINT_EXPR_PRINTER_HPP
#define MAPLINT_EXPR_PRINTER_HPP

#include "maplint/expr/ast.hpp"

#include <string>

namespace maplint::expr {

[[nodiscard]] auto print_expr(const Expr& expr) -> std::string;

/// Precedence level of the node's outermost operator (14 for primaries).
[[nodiscard]] auto expr_precedence(const Expr& expr) -> int;

} // namespace maplint::expr

#endif // MAPLINT_EXPR_PRINTER_HPP
