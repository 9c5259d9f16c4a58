#include "maplint/analysis/diagnostic.hpp"

#include <tuple>

namespace maplint::analysis {

auto make_diagnostic(Rule rule, const model::MappingDeclaration& decl, std::string member)
    -> Diagnostic {
    const auto& info = rule_info(rule);
    Diagnostic diag;
    diag.rule = rule;
    diag.code = info.code;
    diag.severity = info.severity;
    diag.member = std::move(member);
    diag.source_type = decl.source_type;
    diag.dest_type = decl.dest_type;
    diag.location = decl.location;
    return diag;
}

auto render_message(const Diagnostic& diag) -> std::string {
    const char* tmpl = rule_info(diag.rule).message_template;

    switch (diag.rule) {
    case Rule::PropertyTypeMismatch:
    case Rule::NullableCompatibility:
    case Rule::GenericTypeMismatch:
    case Rule::ComplexTypeMappingMissing:
        return format_template(tmpl, {diag.member, diag.source_type, diag.source_member_type,
                                      diag.dest_type, diag.dest_member_type});
    case Rule::CaseSensitivityMismatch:
        return format_template(tmpl, {diag.source_member, diag.member});
    case Rule::ExpensiveOperationInMapFrom:
    case Rule::MultipleEnumeration:
    case Rule::NonDeterministicOperation:
        return format_template(tmpl, {diag.member, diag.detail});
    case Rule::DuplicateMapping:
    case Rule::InfiniteRecursion:
        return format_template(tmpl, {diag.source_type, diag.dest_type});
    case Rule::SelfReferencingType:
        return format_template(tmpl, {diag.detail});
    case Rule::MissingDestinationProperty:
    case Rule::UnmappedRequiredProperty:
    case Rule::TaskResultSynchronousAccess:
    case Rule::RedundantMapFrom:
        return format_template(tmpl, {diag.member});
    }
    return tmpl;
}

auto diagnostic_less(const Diagnostic& a, const Diagnostic& b) -> bool {
    return std::tie(a.location.file, a.location.line, a.member, a.code, a.rule) <
           std::tie(b.location.file, b.location.line, b.member, b.code, b.rule);
}

} // namespace maplint::analysis
