#include "maplint/fix/synthesizer.hpp"

#include "maplint/analysis/classifier.hpp"
#include "maplint/expr/parser.hpp"
#include "maplint/expr/printer.hpp"
#include "maplint/expr/summary.hpp"
#include "maplint/log/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <set>
#include <string_view>
#include <type_traits>
#include <unordered_map>

namespace maplint::fix {

using analysis::Diagnostic;
using analysis::Rule;
using model::ConfigKind;
using model::Edit;
using model::MemberConfig;
using model::TypeRefPtr;

// ============================================================================
// Literals
// ============================================================================

namespace {

auto primitive_name(const TypeRefPtr& type) -> std::string {
    auto core = model::strip_nullable(type);
    if (core && core->is<model::PrimitiveType>()) {
        return core->as<model::PrimitiveType>().name;
    }
    return {};
}

/// Concrete type to instantiate for an empty collection of this container.
auto concrete_collection(const model::CollectionType& coll) -> std::string {
    const auto& container = coll.container;
    auto element = model::type_to_string(coll.element);
    if (container == "HashSet" || container == "Queue" || container == "Stack" ||
        container == "List" || container == "Collection") {
        return container + "<" + element + ">";
    }
    if (container == "ISet") {
        return "HashSet<" + element + ">";
    }
    return "List<" + element + ">";
}

} // namespace

auto default_literal(const TypeRefPtr& type) -> std::string {
    if (!type || model::is_nullable(type)) {
        return "default";
    }
    if (type->is<model::CollectionType>()) {
        const auto& coll = type->as<model::CollectionType>();
        if (coll.container == "[]") {
            return "Array.Empty<" + model::type_to_string(coll.element) + ">()";
        }
        return "new " + concrete_collection(coll) + "()";
    }

    static const std::unordered_map<std::string, std::string> defaults = {
        {"string", "string.Empty"},
        {"int", "0"},
        {"short", "0"},
        {"byte", "0"},
        {"sbyte", "0"},
        {"ushort", "0"},
        {"uint", "0"},
        {"long", "0L"},
        {"ulong", "0UL"},
        {"double", "0.0"},
        {"float", "0.0f"},
        {"decimal", "0m"},
        {"bool", "false"},
        {"DateTime", "DateTime.MinValue"},
        {"DateTimeOffset", "DateTimeOffset.MinValue"},
        {"TimeSpan", "TimeSpan.Zero"},
        {"Guid", "Guid.Empty"},
    };
    auto it = defaults.find(primitive_name(type));
    return it == defaults.end() ? "default" : it->second;
}

auto sample_literal(const TypeRefPtr& type) -> std::string {
    auto core = model::strip_nullable(type);
    if (!core) {
        return "default";
    }
    if (core->is<model::UserDefinedType>()) {
        const auto& name = core->as<model::UserDefinedType>().name;
        auto dot = name.rfind('.');
        std::string_view simple = dot == std::string::npos
                                      ? std::string_view(name)
                                      : std::string_view(name).substr(dot + 1);
        if (simple.size() >= 2 && simple[0] == 'I' &&
            std::isupper(static_cast<unsigned char>(simple[1]))) {
            return "default";
        }
        return "new " + name + "()";
    }
    if (core->is<model::CollectionType>()) {
        const auto& coll = core->as<model::CollectionType>();
        if (coll.container == "[]") {
            return "Array.Empty<" + model::type_to_string(coll.element) + ">()";
        }
        return "new " + concrete_collection(coll) + "()";
    }

    static const std::unordered_map<std::string, std::string> samples = {
        {"string", "string.Empty"},
        {"int", "1"},
        {"short", "1"},
        {"byte", "1"},
        {"sbyte", "1"},
        {"ushort", "1"},
        {"uint", "1"},
        {"long", "1L"},
        {"ulong", "1UL"},
        {"double", "1.0"},
        {"float", "1.0f"},
        {"decimal", "1.0m"},
        {"bool", "true"},
        {"DateTime", "DateTime.MinValue"},
        {"DateTimeOffset", "DateTimeOffset.MinValue"},
        {"TimeSpan", "TimeSpan.Zero"},
        {"Guid", "Guid.Empty"},
    };
    auto it = samples.find(primitive_name(core));
    return it == samples.end() ? "default" : it->second;
}

// ============================================================================
// Enumeration Caching
// ============================================================================

namespace {

void collect_names(const expr::Expr& node, std::set<std::string>& names);

void collect_all(const std::vector<expr::ExprPtr>& exprs, std::set<std::string>& names) {
    for (const auto& e : exprs) {
        if (e) {
            collect_names(*e, names);
        }
    }
}

/// Every identifier, parameter and local name used anywhere in the tree.
void collect_names(const expr::Expr& node, std::set<std::string>& names) {
    auto sub = [&names](const expr::ExprPtr& e) {
        if (e) {
            collect_names(*e, names);
        }
    };
    std::visit(
        [&](const auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, expr::IdentExpr>) {
                names.insert(n.name);
            } else if constexpr (std::is_same_v<T, expr::LiteralExpr>) {
            } else if constexpr (std::is_same_v<T, expr::MemberExpr>) {
                sub(n.object);
            } else if constexpr (std::is_same_v<T, expr::CallExpr>) {
                sub(n.callee);
                collect_all(n.args, names);
            } else if constexpr (std::is_same_v<T, expr::IndexExpr>) {
                sub(n.object);
                collect_all(n.indices, names);
            } else if constexpr (std::is_same_v<T, expr::UnaryExpr>) {
                sub(n.operand);
            } else if constexpr (std::is_same_v<T, expr::BinaryExpr>) {
                sub(n.left);
                sub(n.right);
            } else if constexpr (std::is_same_v<T, expr::TernaryExpr>) {
                sub(n.condition);
                sub(n.then_expr);
                sub(n.else_expr);
            } else if constexpr (std::is_same_v<T, expr::LambdaExpr>) {
                names.insert(n.params.begin(), n.params.end());
                for (const auto& local : n.locals) {
                    names.insert(local.name);
                    sub(local.init);
                }
                sub(n.body);
            } else if constexpr (std::is_same_v<T, expr::NewExpr>) {
                collect_all(n.args, names);
                collect_all(n.initializers, names);
            } else if constexpr (std::is_same_v<T, expr::CastExpr>) {
                sub(n.operand);
            } else if constexpr (std::is_same_v<T, expr::InterpolatedStringExpr>) {
                collect_all(n.holes, names);
            } else {
                static_assert(always_false_v<T>, "unhandled expression kind");
            }
        },
        node.kind);
}

/// Replaces every `param.path` with `name`; returns the number replaced.
auto replace_accessor(expr::ExprPtr& node, const std::string& param, const std::string& path,
                      const std::string& name) -> int {
    if (!node) {
        return 0;
    }
    if (auto found = expr::source_accessor_path(*node, param); found && *found == path) {
        node = expr::make_expr(expr::IdentExpr{name, {}}, node->span);
        return 1;
    }

    int count = 0;
    auto sub = [&](expr::ExprPtr& e) { count += replace_accessor(e, param, path, name); };
    auto sub_all = [&](std::vector<expr::ExprPtr>& exprs) {
        for (auto& e : exprs) {
            sub(e);
        }
    };
    std::visit(
        [&](auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, expr::IdentExpr> ||
                          std::is_same_v<T, expr::LiteralExpr>) {
            } else if constexpr (std::is_same_v<T, expr::MemberExpr>) {
                sub(n.object);
            } else if constexpr (std::is_same_v<T, expr::CallExpr>) {
                sub(n.callee);
                sub_all(n.args);
            } else if constexpr (std::is_same_v<T, expr::IndexExpr>) {
                sub(n.object);
                sub_all(n.indices);
            } else if constexpr (std::is_same_v<T, expr::UnaryExpr>) {
                sub(n.operand);
            } else if constexpr (std::is_same_v<T, expr::BinaryExpr>) {
                sub(n.left);
                sub(n.right);
            } else if constexpr (std::is_same_v<T, expr::TernaryExpr>) {
                sub(n.condition);
                sub(n.then_expr);
                sub(n.else_expr);
            } else if constexpr (std::is_same_v<T, expr::LambdaExpr>) {
                // A nested lambda rebinding the parameter hides it.
                if (std::find(n.params.begin(), n.params.end(), param) == n.params.end()) {
                    for (auto& local : n.locals) {
                        sub(local.init);
                    }
                    sub(n.body);
                }
            } else if constexpr (std::is_same_v<T, expr::NewExpr>) {
                sub_all(n.args);
                sub_all(n.initializers);
            } else if constexpr (std::is_same_v<T, expr::CastExpr>) {
                sub(n.operand);
            } else if constexpr (std::is_same_v<T, expr::InterpolatedStringExpr>) {
                sub_all(n.holes);
            } else {
                static_assert(always_false_v<T>, "unhandled expression kind");
            }
        },
        node->kind);
    return count;
}

auto accessor_expr(const std::string& param, const std::string& path) -> expr::ExprPtr {
    auto node = expr::make_expr(expr::IdentExpr{param, {}});
    size_t start = 0;
    while (start <= path.size()) {
        auto dot = path.find('.', start);
        auto segment = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        node = expr::make_expr(expr::MemberExpr{std::move(node), segment, {}, false});
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return node;
}

auto cache_name(const std::string& path, std::set<std::string>& taken) -> std::string {
    auto dot = path.rfind('.');
    std::string base = dot == std::string::npos ? path : path.substr(dot + 1);
    if (!base.empty()) {
        base[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(base[0])));
    }
    base += "Cache";

    std::string name = base;
    for (int suffix = 2; taken.contains(name); ++suffix) {
        name = base + std::to_string(suffix);
    }
    taken.insert(name);
    return name;
}

} // namespace

auto cache_enumerations(const std::string& lambda_text, const std::vector<std::string>& accessors,
                        const std::map<std::string, std::string>& captures) -> std::string {
    auto parsed = expr::parse_expression(lambda_text);
    if (is_err(parsed)) {
        return {};
    }
    auto& root = unwrap(parsed);
    if (!root->is<expr::LambdaExpr>()) {
        return {};
    }
    auto& lambda = root->as<expr::LambdaExpr>();
    if (lambda.params.empty()) {
        return {};
    }
    const std::string param = lambda.params.front();

    std::set<std::string> taken;
    collect_names(*root, taken);
    for (const auto& [name, type] : captures) {
        taken.insert(name);
    }

    std::vector<expr::LocalDecl> cached;
    for (const auto& path : accessors) {
        auto name = cache_name(path, taken);
        int replaced = replace_accessor(lambda.body, param, path, name);
        for (auto& local : lambda.locals) {
            replaced += replace_accessor(local.init, param, path, name);
        }
        if (replaced == 0) {
            continue;
        }
        auto materialize = expr::make_expr(expr::CallExpr{
            expr::make_expr(expr::MemberExpr{accessor_expr(param, path), "ToList", {}, false}),
            {}});
        cached.push_back(expr::LocalDecl{"var", name, std::move(materialize)});
    }
    if (cached.empty()) {
        return {};
    }

    for (auto& local : lambda.locals) {
        cached.push_back(std::move(local));
    }
    lambda.locals = std::move(cached);
    lambda.block_body = true;
    return expr::print_expr(*root);
}

// ============================================================================
// Synthesis
// ============================================================================

namespace {

struct FixContext {
    const Diagnostic& diag;
    const model::MappingDeclaration& decl;
    const model::TypeShape* source = nullptr;
    const model::TypeShape* dest = nullptr;
    const model::Member* source_member = nullptr;
    const model::Member* dest_member = nullptr;

    [[nodiscard]] auto anchor() const -> model::EditAnchor {
        return model::EditAnchor{decl.source_type, decl.dest_type, diag.member, decl.location,
                                 diag.declaration_index};
    }

    [[nodiscard]] auto map_from(std::string title, std::string lambda) const -> Edit {
        Edit edit{std::move(title), anchor(), {}};
        edit.operations.emplace_back(model::AppendMemberConfig{
            MemberConfig{diag.member, ConfigKind::MapFrom, std::move(lambda)}});
        return edit;
    }

    [[nodiscard]] auto comment(std::string title, std::string line) const -> Edit {
        Edit edit{std::move(title), anchor(), {}};
        edit.operations.emplace_back(model::InsertComment{{std::move(line)}});
        return edit;
    }

    [[nodiscard]] auto accessor() const -> std::string {
        return "src." + (source_member ? source_member->name : diag.member);
    }
};

auto materializer(const model::CollectionType& dest, const std::string& sequence) -> std::string {
    auto element = model::type_to_string(dest.element);
    if (dest.container == "[]") {
        return sequence + ".ToArray()";
    }
    if (dest.container == "HashSet" || dest.container == "ISet") {
        return sequence + ".ToHashSet()";
    }
    if (dest.container == "Queue" || dest.container == "Stack") {
        return "new " + dest.container + "<" + element + ">(" + sequence + ")";
    }
    return sequence + ".ToList()";
}

auto fix_type_mismatch(const FixContext& ctx) -> std::vector<Edit> {
    std::vector<Edit> edits;
    if (!ctx.source_member || !ctx.dest_member) {
        return edits;
    }
    const auto& from = ctx.source_member->type;
    const auto& to = ctx.dest_member->type;
    const auto& member = ctx.diag.member;

    // A nullable source feeding a non-nullable destination is coalesced.
    bool coalesce = model::is_nullable(from) && !model::is_nullable(to);
    if (model::is_string_type(to)) {
        auto access = ctx.accessor() + (coalesce                     ? "?.ToString() ?? string.Empty"
                                        : model::is_nullable(from) ? "?.ToString()"
                                                                   : ".ToString()");
        edits.push_back(ctx.map_from("Convert " + member + " with ToString()", "src => " + access));
    } else if (model::is_numeric(from) && model::is_numeric(to)) {
        auto value = coalesce ? "(" + ctx.accessor() + " ?? " + default_literal(to) + ")"
                              : ctx.accessor();
        edits.push_back(ctx.map_from("Cast " + member + " to " + model::type_to_string(to),
                                     "src => (" + model::type_to_string(to) + ")" + value));
    } else if (model::is_string_type(from) && model::is_numeric(to)) {
        auto target = primitive_name(to);
        edits.push_back(ctx.map_from("Parse " + member + " as " + target,
                                     "src => " + ctx.accessor() + " != null ? " + target +
                                         ".Parse(" + ctx.accessor() + ") : " +
                                         default_literal(to)));
    }
    return edits;
}

auto fix_collection(const FixContext& ctx) -> std::vector<Edit> {
    std::vector<Edit> edits;
    if (!ctx.source_member || !ctx.dest_member) {
        return edits;
    }
    auto from_element = model::element_type(ctx.source_member->type);
    auto dest_core = model::strip_nullable(ctx.dest_member->type);
    if (!from_element || !dest_core || !dest_core->is<model::CollectionType>()) {
        return edits;
    }
    const auto& dest_coll = dest_core->as<model::CollectionType>();
    const auto& to_element = dest_coll.element;

    std::string convert;
    if (model::is_string_type(to_element)) {
        convert = "x => x.ToString()";
    } else if (model::is_string_type(from_element) && model::is_numeric(to_element) &&
               !model::is_nullable(to_element)) {
        convert = "x => " + primitive_name(to_element) + ".Parse(x)";
    } else if (model::is_numeric(from_element) && model::is_numeric(to_element)) {
        convert = "x => (" + model::type_to_string(to_element) + ")x";
    } else {
        return edits;
    }

    auto receiver = ctx.accessor();
    if (model::is_nullable(ctx.source_member->type)) {
        receiver = "(" + receiver + " ?? " +
                   default_literal(model::strip_nullable(ctx.source_member->type)) + ")";
    }
    auto sequence = receiver + ".Select(" + convert + ")";
    edits.push_back(ctx.map_from("Convert " + ctx.diag.member + " elements to " +
                                     model::type_to_string(to_element),
                                 "src => " + materializer(dest_coll, sequence)));
    return edits;
}

/// Coalesces to the empty value of the source's underlying type.
auto fix_nullable(const FixContext& ctx) -> std::vector<Edit> {
    if (!ctx.source_member) {
        return {};
    }
    auto fallback = default_literal(model::strip_nullable(ctx.source_member->type));
    if (fallback == "default") {
        // Coalescing a reference type to its default changes nothing.
        return {};
    }
    return {ctx.map_from("Use " + fallback + " when " + ctx.diag.member + " is null",
                         "src => " + ctx.accessor() + " ?? " + fallback)};
}

auto fix_case_mismatch(const FixContext& ctx) -> std::vector<Edit> {
    const auto& member = ctx.diag.member;
    const auto& source_name = ctx.diag.source_member;
    std::vector<Edit> edits;
    edits.push_back(ctx.map_from("Map " + member + " from " + source_name,
                                 "src => src." + source_name));
    edits.push_back(ctx.comment("Use a case-insensitive naming convention",
                                "Configure case-insensitive member matching for " +
                                    ctx.decl.source_type + " -> " + ctx.decl.dest_type));
    edits.push_back(ctx.comment("Rename source property " + source_name,
                                "Rename " + ctx.decl.source_type + "." + source_name + " to " +
                                    member));
    return edits;
}

auto fix_required(const FixContext& ctx) -> std::vector<Edit> {
    std::vector<Edit> edits;
    const auto& member = ctx.diag.member;
    if (ctx.dest_member && ctx.dest_member->is_resolved()) {
        edits.push_back(ctx.map_from("Map " + member + " from a constant",
                                     "src => " + sample_literal(ctx.dest_member->type)));
    }
    edits.push_back(ctx.comment("Add a source property for " + member,
                                "Add " + ctx.decl.source_type + "." + member +
                                    " or configure " + member + " explicitly"));
    return edits;
}

auto fix_redundant(const FixContext& ctx) -> std::vector<Edit> {
    Edit edit{"Remove redundant MapFrom for " + ctx.diag.member, ctx.anchor(), {}};
    edit.operations.emplace_back(model::RemoveMemberConfig{ctx.diag.member});
    return {edit};
}

/// Moves the computation out of the mapping: the value becomes a source member.
auto fix_precompute(const FixContext& ctx) -> std::vector<Edit> {
    if (!ctx.source || !ctx.dest_member || !ctx.dest_member->is_resolved()) {
        return {};
    }
    const auto* existing = ctx.source->find_member(ctx.diag.member);
    if (existing && !(existing->is_resolved() &&
                      model::types_equal(existing->type, ctx.dest_member->type))) {
        // Removing the config would expose a type mismatch.
        return {};
    }

    Edit edit{"Compute " + ctx.diag.member + " before mapping", ctx.anchor(), {}};
    edit.operations.emplace_back(model::RemoveMemberConfig{ctx.diag.member});
    edit.operations.emplace_back(model::InsertSourceMember{
        ctx.source->name, ctx.diag.member, model::type_to_string(ctx.dest_member->type),
        POPULATE_MARKER});
    return {edit};
}

constexpr uint32_t FIX_MAX_DEPTH = 2;

/// A single self-referencing destination member is ignored first; otherwise
/// MaxDepth is the primary alternative.
auto fix_recursion(const FixContext& ctx) -> std::vector<Edit> {
    std::vector<std::string> members;
    if (ctx.dest) {
        members = analysis::self_referencing_members(*ctx.dest);
    }

    Edit max_depth{"Add MaxDepth(" + std::to_string(FIX_MAX_DEPTH) +
                       ") to prevent infinite recursion",
                   ctx.anchor(),
                   {}};
    max_depth.operations.emplace_back(model::SetMaxDepth{FIX_MAX_DEPTH});

    auto ignore_all = [&](std::string title) {
        Edit edit{std::move(title), ctx.anchor(), {}};
        for (const auto& member : members) {
            edit.operations.emplace_back(
                model::AppendMemberConfig{MemberConfig{member, ConfigKind::Ignore, {}}});
        }
        return edit;
    };

    if (members.size() == 1) {
        return {ignore_all("Ignore self-referencing property '" + members.front() + "'"),
                max_depth};
    }
    std::vector<Edit> edits{max_depth};
    if (members.size() > 1) {
        edits.push_back(ignore_all("Ignore all " + std::to_string(members.size()) +
                                   " self-referencing properties"));
    }
    return edits;
}

auto fix_multiple_enumeration(const FixContext& ctx, const model::ShapeTable& shapes)
    -> std::vector<Edit> {
    auto overrides = model::build_override_map(ctx.decl);
    auto it = overrides.find(ctx.diag.member);
    if (it == overrides.end() || it->second->kind != ConfigKind::MapFrom) {
        return {};
    }
    const auto& text = it->second->text;

    expr::SummaryContext summary_ctx;
    summary_ctx.captures = &ctx.decl.captures;
    summary_ctx.shapes = &shapes;
    summary_ctx.source_type = ctx.decl.source_type;
    auto summary = expr::summarize_expression(text, summary_ctx);

    std::vector<std::string> order;
    std::unordered_map<std::string, int> counts;
    for (const auto* site : summary.facts_of<expr::EnumerationSite>()) {
        if (counts[site->accessor]++ == 0) {
            order.push_back(site->accessor);
        }
    }
    std::vector<std::string> repeated;
    for (const auto& accessor : order) {
        if (counts[accessor] >= 2) {
            repeated.push_back(accessor);
        }
    }
    if (repeated.empty()) {
        return {};
    }

    auto rewritten = cache_enumerations(text, repeated, ctx.decl.captures);
    if (rewritten.empty()) {
        return {};
    }
    Edit edit{"Cache " + repeated.front() + " before enumerating", ctx.anchor(), {}};
    edit.operations.emplace_back(model::RewriteExpression{ctx.diag.member, rewritten});
    return {edit};
}

/// True when an appended MapFrom would itself be reported as a hazard.
auto introduces_hazard(const Edit& edit, const model::MappingDeclaration& decl,
                       const model::ShapeTable& shapes, const expr::HazardPatterns& patterns)
    -> bool {
    expr::SummaryContext context;
    context.captures = &decl.captures;
    context.shapes = &shapes;
    context.source_type = decl.source_type;
    context.patterns = patterns;
    for (const auto& op : edit.operations) {
        const auto* append = std::get_if<model::AppendMemberConfig>(&op);
        if (!append || append->config.kind != ConfigKind::MapFrom) {
            continue;
        }
        auto summary = expr::summarize_expression(append->config.text, context);
        if (!summary.facts_of<expr::DependencyCall>().empty() ||
            !summary.facts_of<expr::NonDeterministic>().empty() ||
            !summary.facts_of<expr::BlockingUnwrap>().empty()) {
            return true;
        }
    }
    return false;
}

} // namespace

auto synthesize_fixes(const Diagnostic& diag, const model::MappingDeclaration& decl,
                      const model::ShapeTable& shapes, const expr::HazardPatterns& patterns)
    -> std::vector<Edit> {
    FixContext ctx{diag, decl};
    ctx.source = shapes.find(decl.source_type);
    ctx.dest = shapes.find(decl.dest_type);
    if (ctx.source) {
        ctx.source_member = ctx.source->find_member(
            diag.source_member.empty() ? diag.member : diag.source_member);
    }
    if (ctx.dest) {
        ctx.dest_member = ctx.dest->find_member(diag.member);
    }

    std::vector<Edit> edits;
    switch (diag.rule) {
    case Rule::PropertyTypeMismatch:
        edits = fix_type_mismatch(ctx);
        break;
    case Rule::NullableCompatibility:
        edits = fix_nullable(ctx);
        break;
    case Rule::GenericTypeMismatch:
        edits = fix_collection(ctx);
        break;
    case Rule::CaseSensitivityMismatch:
        edits = fix_case_mismatch(ctx);
        break;
    case Rule::UnmappedRequiredProperty:
        edits = fix_required(ctx);
        break;
    case Rule::RedundantMapFrom:
        edits = fix_redundant(ctx);
        break;
    case Rule::ExpensiveOperationInMapFrom:
    case Rule::NonDeterministicOperation:
    case Rule::TaskResultSynchronousAccess:
        edits = fix_precompute(ctx);
        break;
    case Rule::MultipleEnumeration:
        edits = fix_multiple_enumeration(ctx, shapes);
        break;
    case Rule::SelfReferencingType:
    case Rule::InfiniteRecursion:
        edits = fix_recursion(ctx);
        break;
    case Rule::ComplexTypeMappingMissing:
    case Rule::MissingDestinationProperty:
    case Rule::DuplicateMapping:
        break;
    }

    auto hazardous = std::remove_if(edits.begin(), edits.end(), [&](const Edit& edit) {
        if (!introduces_hazard(edit, decl, shapes, patterns)) {
            return false;
        }
        MAPLINT_LOG_DEBUG("fix", "Withholding '" << edit.title << "': expression is a hazard");
        return true;
    });
    edits.erase(hazardous, edits.end());

    MAPLINT_LOG_DEBUG("fix", diag.code << " " << diag.member << ": " << edits.size()
                                       << " alternative(s)");
    return edits;
}

} // namespace maplint::fix
