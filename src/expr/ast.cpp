//! # Mapping Expression AST

#include "maplint/expr/ast.hpp"

#include <type_traits>

namespace maplint::expr {

namespace {

auto clone_opt(const ExprPtr& expr) -> ExprPtr {
    return expr ? clone_expr(*expr) : nullptr;
}

auto clone_all(const std::vector<ExprPtr>& exprs) -> std::vector<ExprPtr> {
    std::vector<ExprPtr> out;
    out.reserve(exprs.size());
    for (const auto& e : exprs) {
        out.push_back(clone_opt(e));
    }
    return out;
}

} // namespace

auto clone_expr(const Expr& expr) -> ExprPtr {
    return std::visit(
        [&expr](const auto& node) -> ExprPtr {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, LiteralExpr> || std::is_same_v<T, IdentExpr>) {
                return make_expr(node, expr.span);
            } else if constexpr (std::is_same_v<T, MemberExpr>) {
                return make_expr(
                    MemberExpr{clone_opt(node.object), node.name, node.type_args, node.conditional},
                    expr.span);
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                return make_expr(CallExpr{clone_opt(node.callee), clone_all(node.args)}, expr.span);
            } else if constexpr (std::is_same_v<T, IndexExpr>) {
                return make_expr(
                    IndexExpr{clone_opt(node.object), clone_all(node.indices), node.conditional},
                    expr.span);
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                return make_expr(UnaryExpr{node.op, clone_opt(node.operand)}, expr.span);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return make_expr(BinaryExpr{node.op, clone_opt(node.left), clone_opt(node.right)},
                                 expr.span);
            } else if constexpr (std::is_same_v<T, TernaryExpr>) {
                return make_expr(TernaryExpr{clone_opt(node.condition), clone_opt(node.then_expr),
                                             clone_opt(node.else_expr)},
                                 expr.span);
            } else if constexpr (std::is_same_v<T, LambdaExpr>) {
                LambdaExpr copy;
                copy.params = node.params;
                copy.parenthesized = node.parenthesized;
                for (const auto& local : node.locals) {
                    copy.locals.push_back(
                        LocalDecl{local.type_name, local.name, clone_opt(local.init)});
                }
                copy.body = clone_opt(node.body);
                copy.block_body = node.block_body;
                return make_expr(std::move(copy), expr.span);
            } else if constexpr (std::is_same_v<T, NewExpr>) {
                return make_expr(NewExpr{node.type_name, clone_all(node.args), node.has_args,
                                         clone_all(node.initializers), node.has_initializer},
                                 expr.span);
            } else if constexpr (std::is_same_v<T, CastExpr>) {
                return make_expr(CastExpr{node.type_name, clone_opt(node.operand)}, expr.span);
            } else if constexpr (std::is_same_v<T, InterpolatedStringExpr>) {
                return make_expr(InterpolatedStringExpr{node.prefix, node.pieces,
                                                        clone_all(node.holes), node.formats},
                                 expr.span);
            } else {
                static_assert(always_false_v<T>, "unhandled expression kind");
            }
        },
        expr.kind);
}

} // namespace maplint::expr
