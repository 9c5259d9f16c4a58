#include "maplint/analysis/classifier.hpp"

#include "maplint/analysis/collection.hpp"
#include "maplint/expr/summary.hpp"
#include "maplint/log/log.hpp"

#include <algorithm>
#include <set>

namespace maplint::analysis {

namespace {

void fill_types(Diagnostic& diag, const model::Member& source_member, const model::Member& dest) {
    diag.source_member = source_member.name;
    diag.source_member_type = model::type_to_string(source_member.type);
    diag.dest_member_type = model::type_to_string(dest.type);
}

auto starts_with_ignore_case(std::string_view text, std::string_view prefix) -> bool {
    return text.size() >= prefix.size() &&
           model::equals_ignore_case(text.substr(0, prefix.size()), prefix);
}

constexpr int MAX_RECURSION_HOPS = 10;

/// User-defined type a member holds, looking through `?` and collections.
auto referenced_type(const model::Member& member) -> std::string {
    if (!member.is_resolved()) {
        return {};
    }
    auto core = model::strip_nullable(member.type);
    if (auto element = model::element_type(core)) {
        core = model::strip_nullable(element);
    }
    if (core && core->is<model::UserDefinedType>()) {
        return core->as<model::UserDefinedType>().name;
    }
    return {};
}

/// Depth-first walk over member types. `clean` remembers types already
/// proven to reach neither the target nor a cycle.
auto reaches_target_or_cycle(const model::ShapeTable& shapes, const std::string& type,
                             const std::string& target, std::set<std::string>& path,
                             std::set<std::string>& clean, int hops) -> bool {
    if (type == target || path.contains(type)) {
        return true;
    }
    if (hops > MAX_RECURSION_HOPS || clean.contains(type)) {
        return false;
    }
    const auto* shape = shapes.find(type);
    if (!shape) {
        return false;
    }
    path.insert(type);
    for (const auto& member : shape->members) {
        auto next = referenced_type(member);
        if (!next.empty() &&
            reaches_target_or_cycle(shapes, next, target, path, clean, hops + 1)) {
            return true;
        }
    }
    path.erase(type);
    clean.insert(type);
    return false;
}

} // namespace

auto self_referencing_members(const model::TypeShape& shape) -> std::vector<std::string> {
    std::vector<std::string> found;
    for (const auto& member : shape.members) {
        if (referenced_type(member) == shape.name) {
            found.push_back(member.name);
        }
    }
    return found;
}

Classifier::Classifier(const model::ShapeTable& shapes, const MappingRegistry& registry)
    : shapes_(shapes), registry_(registry) {}

auto Classifier::classify_member(const model::MappingDeclaration& decl,
                                 const model::OverrideMap& overrides,
                                 const model::TypeShape& source, const model::Member& dest) const
    -> std::optional<Diagnostic> {
    if (decl.has_custom_construction || !dest.settable) {
        return std::nullopt;
    }
    if (overrides.contains(dest.name)) {
        return std::nullopt;
    }
    if (!dest.is_resolved()) {
        MAPLINT_LOG_TRACE("classify", "Skipping " << decl.dest_type << "." << dest.name
                                                  << ": unresolvable type '" << dest.type_text
                                                  << "'");
        return std::nullopt;
    }

    if (const auto* exact = source.find_member(dest.name)) {
        if (!exact->is_resolved()) {
            MAPLINT_LOG_TRACE("classify", "Skipping " << decl.source_type << "." << exact->name
                                                      << ": unresolvable type '"
                                                      << exact->type_text << "'");
            return std::nullopt;
        }
        return classify_exact(decl, *exact, dest);
    }

    if (const auto* folded = source.find_member_ignore_case(dest.name)) {
        auto diag = make_diagnostic(Rule::CaseSensitivityMismatch, decl, dest.name);
        fill_types(diag, *folded, dest);
        diag.message = render_message(diag);
        return diag;
    }

    if (dest.required) {
        auto diag = make_diagnostic(Rule::UnmappedRequiredProperty, decl, dest.name);
        diag.dest_member_type = model::type_to_string(dest.type);
        diag.message = render_message(diag);
        return diag;
    }
    return std::nullopt;
}

auto Classifier::classify_exact(const model::MappingDeclaration& decl,
                                const model::Member& source_member,
                                const model::Member& dest) const -> std::optional<Diagnostic> {
    const auto& from = source_member.type;
    const auto& to = dest.type;

    if (model::implicitly_widens(from, to)) {
        return std::nullopt;
    }

    // Nullability is judged on the underlying types; a nullable source
    // whose core is itself incompatible reports the core defect.
    auto core_rule = classify_core(model::strip_nullable(from), to);
    std::optional<Rule> rule;
    if (!core_rule) {
        if (!model::is_nullable(from) || model::is_nullable(to)) {
            return std::nullopt;
        }
        rule = Rule::NullableCompatibility;
    } else {
        rule = core_rule;
    }

    auto diag = make_diagnostic(*rule, decl, dest.name);
    fill_types(diag, source_member, dest);
    diag.message = render_message(diag);
    return diag;
}

auto Classifier::classify_core(const model::TypeRefPtr& from, const model::TypeRefPtr& to) const
    -> std::optional<Rule> {
    if (model::implicitly_widens(from, to)) {
        return std::nullopt;
    }
    if (model::is_collection(from) && model::is_collection(to)) {
        if (check_collection(from, to, registry_) == CollectionVerdict::Compatible) {
            return std::nullopt;
        }
        return Rule::GenericTypeMismatch;
    }
    if (model::is_user_defined(from) && model::is_user_defined(to)) {
        const auto& from_name = model::strip_nullable(from)->as<model::UserDefinedType>().name;
        const auto& to_name = model::strip_nullable(to)->as<model::UserDefinedType>().name;
        if (registry_.effectively_mapped(from_name, to_name)) {
            return std::nullopt;
        }
        return Rule::ComplexTypeMappingMissing;
    }
    return Rule::PropertyTypeMismatch;
}

auto Classifier::check_redundant(const model::MappingDeclaration& decl,
                                 const model::TypeShape& source, const model::TypeShape& dest,
                                 const model::MemberConfig& config) const
    -> std::optional<Diagnostic> {
    if (config.kind != model::ConfigKind::MapFrom) {
        return std::nullopt;
    }
    const auto* dest_member = dest.find_member(config.dest_member);
    if (!dest_member || !dest_member->is_resolved()) {
        return std::nullopt;
    }

    expr::SummaryContext context;
    context.captures = &decl.captures;
    context.shapes = &shapes_;
    context.source_type = decl.source_type;
    auto summary = expr::summarize_expression(config.text, context);

    auto bare = summary.facts_of<expr::BareAccess>();
    if (bare.empty() || bare.front()->member != dest_member->name) {
        return std::nullopt;
    }

    const auto* source_member = source.find_member(dest_member->name);
    if (!source_member || !source_member->is_resolved() ||
        !model::types_equal(source_member->type, dest_member->type)) {
        return std::nullopt;
    }

    auto diag = make_diagnostic(Rule::RedundantMapFrom, decl, dest_member->name);
    fill_types(diag, *source_member, *dest_member);
    diag.message = render_message(diag);
    return diag;
}

auto Classifier::check_missing_destination(const model::MappingDeclaration& decl,
                                           const model::TypeShape& source,
                                           const model::TypeShape& dest) const
    -> std::vector<Diagnostic> {
    std::vector<Diagnostic> found;
    if (decl.has_custom_construction) {
        return found;
    }

    // Source members read by any explicit config.
    std::set<std::string> referenced;
    std::vector<const std::string*> opaque_texts;
    expr::SummaryContext context;
    context.captures = &decl.captures;
    context.shapes = &shapes_;
    context.source_type = decl.source_type;
    for (const auto& config : decl.member_configs) {
        if (config.kind != model::ConfigKind::MapFrom &&
            config.kind != model::ConfigKind::Condition) {
            continue;
        }
        auto summary = expr::summarize_expression(config.text, context);
        if (summary.is_opaque()) {
            opaque_texts.push_back(&config.text);
        }
        referenced.insert(summary.source_members.begin(), summary.source_members.end());
    }

    for (const auto& member : source.members) {
        if (dest.find_member_ignore_case(member.name)) {
            continue;
        }
        if (referenced.contains(member.name)) {
            continue;
        }
        if (std::find(decl.ignored_source_members.begin(), decl.ignored_source_members.end(),
                      member.name) != decl.ignored_source_members.end()) {
            continue;
        }
        bool opaque_mention = std::any_of(opaque_texts.begin(), opaque_texts.end(),
                                          [&](const std::string* text) {
                                              return text->find(member.name) != std::string::npos;
                                          });
        if (opaque_mention) {
            continue;
        }
        if (member.is_resolved() && model::is_user_defined(member.type)) {
            bool flattened = std::any_of(dest.members.begin(), dest.members.end(),
                                         [&](const model::Member& d) {
                                             return starts_with_ignore_case(d.name, member.name);
                                         });
            if (flattened) {
                continue;
            }
        }

        auto diag = make_diagnostic(Rule::MissingDestinationProperty, decl, member.name);
        diag.source_member = member.name;
        diag.source_member_type =
            member.is_resolved() ? model::type_to_string(member.type) : member.type_text;
        diag.message = render_message(diag);
        found.push_back(std::move(diag));
    }
    return found;
}

auto Classifier::circular_member(const model::TypeShape& source, const std::string& target) const
    -> std::optional<std::string> {
    std::set<std::string> clean;
    for (const auto& member : source.members) {
        auto type = referenced_type(member);
        if (type.empty()) {
            continue;
        }
        std::set<std::string> path{source.name};
        if (reaches_target_or_cycle(shapes_, type, target, path, clean, 1)) {
            return member.name;
        }
    }
    return std::nullopt;
}

auto Classifier::check_recursion(const model::MappingDeclaration& decl,
                                 const model::TypeShape& source,
                                 const model::TypeShape& dest) const
    -> std::optional<Diagnostic> {
    if (decl.has_custom_construction || decl.max_depth) {
        return std::nullopt;
    }

    auto self_source = self_referencing_members(source);
    auto self_dest = self_referencing_members(dest);
    auto circular = circular_member(source, dest.name);

    std::set<std::string> ignored(decl.ignored_source_members.begin(),
                                  decl.ignored_source_members.end());
    for (const auto& [member, config] : model::build_override_map(decl)) {
        if (config->kind == model::ConfigKind::Ignore) {
            ignored.insert(member);
        }
    }
    auto is_ignored = [&](const std::string& name) { return ignored.contains(name); };
    if (std::any_of(self_source.begin(), self_source.end(), is_ignored) ||
        std::any_of(self_dest.begin(), self_dest.end(), is_ignored) ||
        (circular && is_ignored(*circular))) {
        MAPLINT_LOG_TRACE("classify", decl.source_type << " -> " << decl.dest_type
                                                       << ": recursive member ignored");
        return std::nullopt;
    }

    if (!self_source.empty() || !self_dest.empty()) {
        const auto& member = self_dest.empty() ? self_source.front() : self_dest.front();
        auto diag = make_diagnostic(Rule::SelfReferencingType, decl, member);
        diag.detail = self_source.empty() ? dest.name : source.name;
        diag.message = render_message(diag);
        return diag;
    }
    if (circular) {
        auto diag = make_diagnostic(Rule::InfiniteRecursion, decl, *circular);
        diag.source_member = *circular;
        diag.message = render_message(diag);
        return diag;
    }
    return std::nullopt;
}

} // namespace maplint::analysis
