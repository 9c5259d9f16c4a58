//! # Mapping Expression Printer

#include "maplint/expr/printer.hpp"

#include "maplint/expr/parser.hpp"

#include <type_traits>

namespace maplint::expr {

namespace {

constexpr int PREC_LAMBDA = 1;
constexpr int PREC_TERNARY = 2;
constexpr int PREC_COALESCE = 3;
constexpr int PREC_UNARY = 13;
constexpr int PREC_PRIMARY = 14;

auto print_at(const ExprPtr& expr, int min_prec) -> std::string;

auto join(const std::vector<ExprPtr>& exprs) -> std::string {
    std::string out;
    for (size_t i = 0; i < exprs.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += print_at(exprs[i], PREC_LAMBDA);
    }
    return out;
}

auto type_args_text(const std::vector<std::string>& args) -> std::string {
    if (args.empty()) {
        return {};
    }
    std::string out = "<";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += args[i];
    }
    return out + ">";
}

auto print_lambda(const LambdaExpr& node) -> std::string {
    std::string out;
    if (node.parenthesized || node.params.size() != 1) {
        out += "(";
        for (size_t i = 0; i < node.params.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += node.params[i];
        }
        out += ")";
    } else {
        out += node.params[0];
    }
    out += " => ";

    if (!node.block_body) {
        return out + print_at(node.body, PREC_LAMBDA);
    }
    out += "{ ";
    for (const auto& local : node.locals) {
        out += local.type_name + " " + local.name + " = " + print_at(local.init, PREC_LAMBDA) +
               "; ";
    }
    return out + "return " + print_at(node.body, PREC_LAMBDA) + "; }";
}

auto print_node(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, LiteralExpr>) {
                return node.text;
            } else if constexpr (std::is_same_v<T, IdentExpr>) {
                return node.name + type_args_text(node.type_args);
            } else if constexpr (std::is_same_v<T, MemberExpr>) {
                return print_at(node.object, PREC_PRIMARY) + (node.conditional ? "?." : ".") +
                       node.name + type_args_text(node.type_args);
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                return print_at(node.callee, PREC_PRIMARY) + "(" + join(node.args) + ")";
            } else if constexpr (std::is_same_v<T, IndexExpr>) {
                return print_at(node.object, PREC_PRIMARY) + (node.conditional ? "?[" : "[") +
                       join(node.indices) + "]";
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                std::string operand = print_at(node.operand, PREC_UNARY);
                bool spaced = node.op == "await" ||
                              (!operand.empty() && (node.op == "-" || node.op == "+") &&
                               operand[0] == node.op[0]);
                return node.op + (spaced ? " " : "") + operand;
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                int prec = node.op == "=" ? PREC_LAMBDA : binary_precedence(node.op);
                if (node.op == "is not") {
                    prec = binary_precedence("is");
                }
                bool right_assoc = node.op == "??";
                return print_at(node.left, right_assoc ? prec + 1 : prec) + " " + node.op + " " +
                       print_at(node.right, right_assoc ? prec : prec + 1);
            } else if constexpr (std::is_same_v<T, TernaryExpr>) {
                return print_at(node.condition, PREC_COALESCE) + " ? " +
                       print_at(node.then_expr, PREC_LAMBDA) + " : " +
                       print_at(node.else_expr, PREC_LAMBDA);
            } else if constexpr (std::is_same_v<T, LambdaExpr>) {
                return print_lambda(node);
            } else if constexpr (std::is_same_v<T, NewExpr>) {
                std::string out = "new";
                if (node.type_name == "[]") {
                    out += "[]";
                } else if (!node.type_name.empty()) {
                    out += " " + node.type_name;
                }
                if (node.has_args) {
                    out += "(" + join(node.args) + ")";
                }
                if (node.has_initializer) {
                    out += node.initializers.empty() ? " { }" : " { " + join(node.initializers) + " }";
                }
                return out;
            } else if constexpr (std::is_same_v<T, CastExpr>) {
                return "(" + node.type_name + ")" + print_at(node.operand, PREC_UNARY);
            } else if constexpr (std::is_same_v<T, InterpolatedStringExpr>) {
                std::string out = node.prefix + "\"";
                for (size_t i = 0; i < node.holes.size(); ++i) {
                    out += node.pieces[i];
                    // Holes must not expose a top-level ':' from a conditional.
                    out += "{" + print_at(node.holes[i], PREC_COALESCE) + node.formats[i] + "}";
                }
                out += node.pieces.empty() ? "" : node.pieces.back();
                return out + "\"";
            } else {
                static_assert(always_false_v<T>, "unhandled expression kind");
            }
        },
        expr.kind);
}

auto print_at(const ExprPtr& expr, int min_prec) -> std::string {
    if (!expr) {
        return {};
    }
    std::string text = print_node(*expr);
    if (expr_precedence(*expr) < min_prec) {
        return "(" + text + ")";
    }
    return text;
}

} // namespace

auto expr_precedence(const Expr& expr) -> int {
    if (expr.is<LambdaExpr>()) {
        return PREC_LAMBDA;
    }
    if (expr.is<TernaryExpr>()) {
        return PREC_TERNARY;
    }
    if (expr.is<BinaryExpr>()) {
        const auto& op = expr.as<BinaryExpr>().op;
        if (op == "=") {
            return PREC_LAMBDA;
        }
        return op == "is not" ? binary_precedence("is") : binary_precedence(op);
    }
    if (expr.is<UnaryExpr>() || expr.is<CastExpr>()) {
        return PREC_UNARY;
    }
    return PREC_PRIMARY;
}

auto print_expr(const Expr& expr) -> std::string {
    return print_node(expr);
}

} // namespace maplint::expr
