//! # Expression Shape Summaries
//!
//! A single pre-order walk over the lambda tree. Identifiers bound by any
//! lambda parameter list or block-local declaration are never treated as
//! dependencies; unbound roots are classified by the capture table, by
//! naming convention, and by the well-known static types below.

#include "maplint/expr/summary.hpp"

#include "maplint/expr/parser.hpp"
#include "maplint/expr/printer.hpp"

#include <cctype>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace maplint::expr {

namespace {

const std::unordered_set<std::string_view>& enumeration_methods() {
    static const std::unordered_set<std::string_view> methods = {
        "ToList", "ToArray",       "Sum",  "Average",       "Count", "First", "FirstOrDefault",
        "Last",   "LastOrDefault", "Any",  "All",           "Max",   "Min",
    };
    return methods;
}

const std::unordered_set<std::string_view>& deferred_operators() {
    static const std::unordered_set<std::string_view> ops = {
        "Where",     "Select",   "SelectMany", "OrderBy",   "OrderByDescending", "ThenBy",
        "ThenByDescending", "Skip", "Take",    "SkipWhile", "TakeWhile",         "Distinct",
        "Reverse",   "GroupBy",  "Cast",       "OfType",    "Concat",            "Union",
        "Intersect", "Except",   "Zip",        "DefaultIfEmpty", "AsEnumerable",
    };
    return ops;
}

const std::unordered_set<std::string_view>& reflection_methods() {
    static const std::unordered_set<std::string_view> methods = {
        "GetMethod", "GetProperty", "GetField", "GetCustomAttributes", "Invoke",
    };
    return methods;
}

const std::unordered_set<std::string_view>& file_io_types() {
    static const std::unordered_set<std::string_view> types = {
        "File", "Directory", "Path", "FileInfo", "DirectoryInfo", "FileStream", "StreamReader",
        "StreamWriter",
    };
    return types;
}

auto matches_any(std::string_view type_name, const std::vector<std::string>& patterns) -> bool {
    for (const auto& pattern : patterns) {
        if (!pattern.empty() && type_name.find(pattern) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

/// Last dotted segment with generic arguments removed: "System.IO.File" -> "File".
auto simple_type_name(std::string_view name) -> std::string_view {
    auto lt = name.find('<');
    if (lt != std::string_view::npos) {
        name = name.substr(0, lt);
    }
    auto dot = name.rfind('.');
    return dot == std::string_view::npos ? name : name.substr(dot + 1);
}

auto is_task_type(const model::TypeRefPtr& type) -> bool {
    auto core = model::strip_nullable(type);
    if (!core) {
        return false;
    }
    std::string name;
    if (core->is<model::GenericType>()) {
        name = core->as<model::GenericType>().name;
    } else if (core->is<model::UserDefinedType>()) {
        name = core->as<model::UserDefinedType>().name;
    }
    return name == "Task" || name == "ValueTask";
}

auto is_task_type_name(std::string_view type_text) -> bool {
    auto name = type_text.substr(0, type_text.find('<'));
    name = simple_type_name(name);
    return name == "Task" || name == "ValueTask";
}

/// Names along a member/call/index chain, root first. Empty when the chain
/// does not bottom out at an identifier. A leading `this` is dropped.
auto chain_names(const Expr& expr) -> std::vector<std::string> {
    std::vector<std::string> reversed;
    const Expr* cur = &expr;
    while (cur) {
        if (cur->is<MemberExpr>()) {
            const auto& m = cur->as<MemberExpr>();
            reversed.push_back(m.name);
            cur = m.object.get();
        } else if (cur->is<CallExpr>()) {
            cur = cur->as<CallExpr>().callee.get();
        } else if (cur->is<IndexExpr>()) {
            cur = cur->as<IndexExpr>().object.get();
        } else if (cur->is<IdentExpr>()) {
            reversed.push_back(cur->as<IdentExpr>().name);
            break;
        } else {
            return {};
        }
    }
    if (!cur) {
        return {};
    }
    std::vector<std::string> names(reversed.rbegin(), reversed.rend());
    if (!names.empty() && names.front() == "this") {
        names.erase(names.begin());
    }
    return names;
}

auto is_static_looking(std::string_view name) -> bool {
    static const std::unordered_set<std::string_view> keyword_types = {
        "bool",  "byte",  "sbyte",  "short",   "ushort", "int",    "uint",  "long",
        "ulong", "float", "double", "decimal", "char",   "string", "object", "System",
    };
    if (keyword_types.contains(name)) {
        return true;
    }
    return !name.empty() && std::isupper(static_cast<unsigned char>(name[0]));
}

class Summarizer {
public:
    Summarizer(const SummaryContext& context, ExprSummary& out) : context_(context), out_(out) {}

    void run(const LambdaExpr& root) {
        out_.source_param = root.params.empty() ? "" : root.params.front();
        bind(root);

        if (!root.block_body && root.body && root.body->is<MemberExpr>()) {
            const auto& member = root.body->as<MemberExpr>();
            if (!member.conditional && member.type_args.empty() && member.object &&
                member.object->is<IdentExpr>() &&
                member.object->as<IdentExpr>().name == out_.source_param &&
                !out_.source_param.empty()) {
                out_.facts.emplace_back(BareAccess{member.name});
            }
        }

        for (const auto& local : root.locals) {
            walk(local.init);
        }
        walk(root.body);
    }

private:
    const SummaryContext& context_;
    ExprSummary& out_;
    std::multiset<std::string> bound_;
    std::set<std::pair<std::string, std::string>> seen_dependencies_;
    std::set<std::string> seen_nondeterministic_;

    void bind(const LambdaExpr& lambda) {
        for (const auto& p : lambda.params) {
            bound_.insert(p);
        }
        for (const auto& local : lambda.locals) {
            bound_.insert(local.name);
        }
    }

    void unbind(const LambdaExpr& lambda) {
        for (const auto& p : lambda.params) {
            bound_.erase(bound_.find(p));
        }
        for (const auto& local : lambda.locals) {
            bound_.erase(bound_.find(local.name));
        }
    }

    [[nodiscard]] auto is_bound(const std::string& name) const -> bool {
        return bound_.contains(name);
    }

    [[nodiscard]] auto capture_type(const std::string& name) const -> const std::string* {
        if (!context_.captures || is_bound(name)) {
            return nullptr;
        }
        auto it = context_.captures->find(name);
        return it == context_.captures->end() ? nullptr : &it->second;
    }

    [[nodiscard]] auto capture_category(const std::string& type) const -> std::string {
        if (matches_any(type, context_.patterns.data_access)) {
            return "database query";
        }
        if (matches_any(type, context_.patterns.http)) {
            return "HTTP request";
        }
        return {};
    }

    void add_dependency(const std::string& dependency, const std::string& category) {
        if (seen_dependencies_.emplace(dependency, category).second) {
            out_.facts.emplace_back(DependencyCall{dependency, category});
        }
    }

    void add_nondeterministic(const std::string& primitive) {
        if (seen_nondeterministic_.insert(primitive).second) {
            out_.facts.emplace_back(NonDeterministic{primitive});
        }
    }

    [[nodiscard]] auto source_member(std::string_view path) const -> const model::Member* {
        if (!context_.shapes) {
            return nullptr;
        }
        return resolve_member_path(*context_.shapes, context_.source_type, path);
    }

    /// True when `expr` evaluates to a Task that `.Result` would block on.
    [[nodiscard]] auto is_task_like(const Expr& expr) const -> bool {
        if (expr.is<CallExpr>()) {
            auto names = chain_names(expr);
            return !names.empty() && names.back().ends_with("Async");
        }
        if (expr.is<IdentExpr>()) {
            const auto* type = capture_type(expr.as<IdentExpr>().name);
            return type && is_task_type_name(*type);
        }
        if (auto path = source_accessor_path(expr, out_.source_param)) {
            const auto* member = source_member(*path);
            return member && is_task_type(member->type);
        }
        if (expr.is<MemberExpr>()) {
            auto names = chain_names(expr);
            if (names.size() == 1) {
                const auto* type = capture_type(names.front());
                return type && is_task_type_name(*type);
            }
        }
        return false;
    }

    void visit_member(const MemberExpr& node) {
        if (node.object && node.object->is<IdentExpr>()) {
            const auto& root = node.object->as<IdentExpr>().name;
            if (root == out_.source_param && !out_.source_param.empty()) {
                out_.source_members.insert(node.name);
            }
            if (!is_bound(root)) {
                if ((root == "DateTime" || root == "DateTimeOffset") &&
                    (node.name == "Now" || node.name == "UtcNow" || node.name == "Today")) {
                    add_nondeterministic(root + "." + node.name);
                }
                if (root == "Random" && node.name == "Shared") {
                    add_nondeterministic("Random");
                }
            }
        }

        if (node.name == "Result" && node.object && is_task_like(*node.object)) {
            out_.facts.emplace_back(BlockingUnwrap{print_expr(*node.object)});
        }

        if (!node.object) {
            return;
        }
        // Reading through a data-access or remote capture is already a query.
        auto names = chain_names(*node.object);
        if (!names.empty()) {
            if (const auto* type = capture_type(names.front())) {
                auto category = capture_category(*type);
                if (!category.empty()) {
                    add_dependency(names.front(), category);
                }
            }
        }
    }

    void visit_call(const Expr& call_expr, const CallExpr& node) {
        std::string method;
        const Expr* receiver = nullptr;
        if (node.callee && node.callee->is<MemberExpr>()) {
            method = node.callee->as<MemberExpr>().name;
            receiver = node.callee->as<MemberExpr>().object.get();
        } else if (node.callee && node.callee->is<IdentExpr>()) {
            method = node.callee->as<IdentExpr>().name;
        }

        auto names = receiver ? chain_names(*receiver) : std::vector<std::string>{};
        std::string root = names.empty() ? "" : names.front();

        if (root == "Guid" && names.size() == 1 && method == "NewGuid" && !is_bound(root)) {
            add_nondeterministic("Guid.NewGuid()");
        }

        if (receiver && method == "Wait") {
            out_.facts.emplace_back(BlockingUnwrap{print_expr(*receiver)});
        }
        if (receiver && method == "GetResult" && receiver->is<CallExpr>()) {
            const auto& inner = receiver->as<CallExpr>();
            if (inner.callee && inner.callee->is<MemberExpr>() &&
                inner.callee->as<MemberExpr>().name == "GetAwaiter") {
                const auto& awaited = inner.callee->as<MemberExpr>().object;
                out_.facts.emplace_back(BlockingUnwrap{awaited ? print_expr(*awaited) : ""});
            }
        }

        if (reflection_methods().contains(method)) {
            add_dependency(root.empty() || is_bound(root) ? method : root, "reflection operation");
        }

        if (is_enumeration_method(method)) {
            if (const Expr* recv = enumeration_receiver(call_expr)) {
                if (auto path = source_accessor_path(*recv, out_.source_param)) {
                    const auto* member = source_member(*path);
                    if (member && model::is_collection(member->type)) {
                        out_.facts.emplace_back(EnumerationSite{*path, method});
                    }
                }
            }
        }

        if (root.empty() || is_bound(root)) {
            return;
        }
        for (const auto& name : names) {
            if (file_io_types().contains(name) && is_static_looking(root)) {
                add_dependency(name, "file I/O operation");
                return;
            }
        }
        if (const auto* type = capture_type(root)) {
            auto category = capture_category(*type);
            add_dependency(root, category.empty() ? "method call" : category);
            return;
        }
        if (!is_static_looking(root)) {
            // Undeclared lower-case or underscore roots are fields of the profile.
            add_dependency(root, "method call");
        }
    }

    void visit_new(const NewExpr& node) {
        auto simple = simple_type_name(node.type_name);
        if (simple == "Random") {
            add_nondeterministic("Random");
        } else if (matches_any(node.type_name, context_.patterns.http)) {
            add_dependency(std::string(simple), "HTTP request");
        } else if (matches_any(node.type_name, context_.patterns.data_access)) {
            add_dependency(std::string(simple), "database query");
        } else if (file_io_types().contains(simple)) {
            add_dependency(std::string(simple), "file I/O operation");
        }
    }

    void walk(const ExprPtr& expr) {
        if (expr) {
            walk(*expr);
        }
    }

    void walk_all(const std::vector<ExprPtr>& exprs) {
        for (const auto& e : exprs) {
            walk(e);
        }
    }

    void walk(const Expr& expr) {
        std::visit(
            [this, &expr](const auto& node) {
                using T = std::decay_t<decltype(node)>;

                if constexpr (std::is_same_v<T, LiteralExpr> || std::is_same_v<T, IdentExpr>) {
                    // leaves
                } else if constexpr (std::is_same_v<T, MemberExpr>) {
                    visit_member(node);
                    walk(node.object);
                } else if constexpr (std::is_same_v<T, CallExpr>) {
                    visit_call(expr, node);
                    walk(node.callee);
                    walk_all(node.args);
                } else if constexpr (std::is_same_v<T, IndexExpr>) {
                    walk(node.object);
                    walk_all(node.indices);
                } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                    walk(node.operand);
                } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                    if (node.op != "=") {
                        walk(node.left);
                    }
                    walk(node.right);
                } else if constexpr (std::is_same_v<T, TernaryExpr>) {
                    walk(node.condition);
                    walk(node.then_expr);
                    walk(node.else_expr);
                } else if constexpr (std::is_same_v<T, LambdaExpr>) {
                    bind(node);
                    for (const auto& local : node.locals) {
                        walk(local.init);
                    }
                    walk(node.body);
                    unbind(node);
                } else if constexpr (std::is_same_v<T, NewExpr>) {
                    visit_new(node);
                    walk_all(node.args);
                    walk_all(node.initializers);
                } else if constexpr (std::is_same_v<T, CastExpr>) {
                    walk(node.operand);
                } else if constexpr (std::is_same_v<T, InterpolatedStringExpr>) {
                    walk_all(node.holes);
                } else {
                    static_assert(always_false_v<T>, "unhandled expression kind");
                }
            },
            expr.kind);
    }
};

} // namespace

auto is_enumeration_method(std::string_view name) -> bool {
    return enumeration_methods().contains(name);
}

auto is_deferred_operator(std::string_view name) -> bool {
    return deferred_operators().contains(name);
}

auto source_accessor_path(const Expr& expr, std::string_view param) -> std::optional<std::string> {
    if (param.empty()) {
        return std::nullopt;
    }
    std::vector<std::string_view> segments;
    const Expr* cur = &expr;
    while (cur->is<MemberExpr>()) {
        const auto& member = cur->as<MemberExpr>();
        if (member.conditional || !member.type_args.empty() || !member.object) {
            return std::nullopt;
        }
        segments.push_back(member.name);
        cur = member.object.get();
    }
    if (segments.empty() || !cur->is<IdentExpr>() || cur->as<IdentExpr>().name != param) {
        return std::nullopt;
    }

    std::string path;
    for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
        if (!path.empty()) {
            path += '.';
        }
        path += *it;
    }
    return path;
}

auto enumeration_receiver(const Expr& expr) -> const Expr* {
    if (!expr.is<CallExpr>()) {
        return nullptr;
    }
    const auto& call = expr.as<CallExpr>();
    if (!call.callee || !call.callee->is<MemberExpr>()) {
        return nullptr;
    }
    const auto& member = call.callee->as<MemberExpr>();
    if (!is_enumeration_method(member.name) || member.conditional || !member.object) {
        return nullptr;
    }

    const Expr* recv = member.object.get();
    while (recv->is<CallExpr>()) {
        const auto& inner = recv->as<CallExpr>();
        if (!inner.callee || !inner.callee->is<MemberExpr>()) {
            break;
        }
        const auto& inner_member = inner.callee->as<MemberExpr>();
        if (!is_deferred_operator(inner_member.name) || !inner_member.object) {
            break;
        }
        recv = inner_member.object.get();
    }
    return recv;
}

auto resolve_member_path(const model::ShapeTable& shapes, std::string_view type_name,
                         std::string_view path) -> const model::Member* {
    const model::TypeShape* shape = shapes.find(type_name);
    while (shape) {
        auto dot = path.find('.');
        std::string_view segment = path.substr(0, dot);
        const model::Member* member = shape->find_member(segment);
        if (!member || dot == std::string_view::npos) {
            return member;
        }
        path.remove_prefix(dot + 1);

        auto core = model::strip_nullable(member->type);
        if (!core || !core->is<model::UserDefinedType>()) {
            return nullptr;
        }
        shape = shapes.find(core->as<model::UserDefinedType>().name);
    }
    return nullptr;
}

auto summarize_tree(const Expr& root, const SummaryContext& context) -> ExprSummary {
    ExprSummary summary;
    if (!root.is<LambdaExpr>()) {
        summary.facts.emplace_back(Opaque{"expression is not a lambda"});
        return summary;
    }
    summary.parsed = true;
    Summarizer summarizer(context, summary);
    summarizer.run(root.as<LambdaExpr>());
    return summary;
}

auto summarize_expression(std::string_view text, const SummaryContext& context) -> ExprSummary {
    auto parsed = parse_expression(text);
    if (is_err(parsed)) {
        ExprSummary summary;
        summary.facts.emplace_back(Opaque{unwrap_err(parsed).to_string()});
        return summary;
    }
    return summarize_tree(*unwrap(parsed), context);
}

} // namespace maplint::expr
