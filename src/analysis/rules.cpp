//! # Rule Catalogue
//!
//! Static table behind `rules.hpp`. Message wording here is part of the
//! tool's output contract.

#include "maplint/analysis/rules.hpp"

#include "maplint/model/type_shape.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace maplint::analysis {

auto severity_name(Severity severity) -> const char* {
    switch (severity) {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Info:
        return "info";
    }
    return "unknown";
}

auto parse_severity(std::string_view text) -> std::optional<Severity> {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "error") {
        return Severity::Error;
    }
    if (lower == "warning" || lower == "warn") {
        return Severity::Warning;
    }
    if (lower == "info") {
        return Severity::Info;
    }
    return std::nullopt;
}

auto all_rules() -> const std::vector<RuleInfo>& {
    static const std::vector<RuleInfo> rules = {
        {Rule::PropertyTypeMismatch, "PropertyTypeMismatch", "AM001", Severity::Error,
         "Property type mismatch",
         "Property '{0}' type mismatch: {1}.{0} is '{2}' but {3}.{0} is '{4}'"},
        {Rule::NullableCompatibility, "NullableCompatibility", "AM002", Severity::Error,
         "Nullable to non-nullable assignment",
         "Property '{0}' has nullable compatibility issue: {1}.{0} ({2}) can be null but {3}.{0} "
         "({4}) is non-nullable"},
        {Rule::GenericTypeMismatch, "GenericTypeMismatch", "AM003", Severity::Error,
         "Incompatible collection element types",
         "Property '{0}' has incompatible generic types: {1}.{0} ({2}) cannot be mapped to "
         "{3}.{0} ({4}) without explicit conversion"},
        {Rule::MissingDestinationProperty, "MissingDestinationProperty", "AM004",
         Severity::Warning, "Source property has no destination",
         "Source property '{0}' will not be mapped - potential data loss"},
        {Rule::CaseSensitivityMismatch, "CaseSensitivityMismatch", "AM005", Severity::Warning,
         "Property names differ only in casing",
         "Property '{0}' in source differs only in casing from destination property '{1}' - "
         "consider explicit mapping or case-insensitive configuration"},
        {Rule::UnmappedRequiredProperty, "UnmappedRequiredProperty", "AM011", Severity::Error,
         "Required destination property is not mapped",
         "Required property '{0}' in destination is not mapped from any source property and "
         "will cause a runtime exception"},
        {Rule::ComplexTypeMappingMissing, "ComplexTypeMappingMissing", "AM020", Severity::Warning,
         "Nested type mapping is not configured",
         "Property '{0}' requires mapping configuration: {1}.{0} ({2}) to {3}.{0} ({4}). "
         "Consider adding CreateMap<{2}, {4}>()."},
        {Rule::SelfReferencingType, "SelfReferencingType", "AM022", Severity::Warning,
         "Self-referencing type without MaxDepth",
         "Self-referencing type detected: {0} contains properties of its own type, which may "
         "cause infinite recursion"},
        {Rule::InfiniteRecursion, "InfiniteRecursion", "AM022", Severity::Warning,
         "Circular type references without MaxDepth",
         "Potential infinite recursion detected: {0} to {1} mapping may cause stack overflow due "
         "to circular references"},
        {Rule::ExpensiveOperationInMapFrom, "ExpensiveOperationInMapFrom", "AM031",
         Severity::Warning, "Expensive operation inside MapFrom",
         "Property '{0}' mapping contains {1} that should be performed before mapping to avoid "
         "performance issues"},
        {Rule::MultipleEnumeration, "MultipleEnumeration", "AM031", Severity::Warning,
         "Collection enumerated more than once",
         "Property '{0}' mapping enumerates collection '{1}' multiple times. Consider caching "
         "the result with ToList() or ToArray()."},
        {Rule::TaskResultSynchronousAccess, "TaskResultSynchronousAccess", "AM031",
         Severity::Warning, "Synchronous wait on an asynchronous result",
         "Property '{0}' mapping uses Task.Result which can cause deadlocks. Perform async "
         "operations before mapping."},
        {Rule::NonDeterministicOperation, "NonDeterministicOperation", "AM031", Severity::Info,
         "Non-deterministic value inside MapFrom",
         "Property '{0}' mapping uses {1} which produces non-deterministic results. Consider "
         "computing before mapping for testability."},
        {Rule::DuplicateMapping, "DuplicateMapping", "AM041", Severity::Warning,
         "Mapping registered more than once",
         "Mapping from '{0}' to '{1}' is already registered"},
        {Rule::RedundantMapFrom, "RedundantMapFrom", "AM050", Severity::Info,
         "Redundant explicit mapping",
         "Explicit mapping for '{0}' is redundant because the property name matches the source"},
    };
    return rules;
}

auto rule_info(Rule rule) -> const RuleInfo& {
    for (const auto& info : all_rules()) {
        if (info.rule == rule) {
            return info;
        }
    }
    throw std::out_of_range("rule missing from catalogue");
}

auto rule_name(Rule rule) -> const char* {
    return rule_info(rule).name;
}

auto rule_code(Rule rule) -> const char* {
    return rule_info(rule).code;
}

auto rules_matching(std::string_view name_or_code) -> std::vector<Rule> {
    std::vector<Rule> matched;
    for (const auto& info : all_rules()) {
        if (model::equals_ignore_case(name_or_code, info.name) ||
            model::equals_ignore_case(name_or_code, info.code)) {
            matched.push_back(info.rule);
        }
    }
    return matched;
}

auto format_template(std::string_view tmpl, const std::vector<std::string>& args) -> std::string {
    std::string out;
    out.reserve(tmpl.size() + 32);

    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            size_t close = tmpl.find('}', i + 1);
            if (close != std::string_view::npos && close > i + 1) {
                auto digits = tmpl.substr(i + 1, close - i - 1);
                bool numeric = std::all_of(digits.begin(), digits.end(), [](unsigned char c) {
                    return std::isdigit(c) != 0;
                });
                if (numeric && digits.size() < 3) {
                    size_t index = 0;
                    for (char c : digits) {
                        index = index * 10 + static_cast<size_t>(c - '0');
                    }
                    if (index < args.size()) {
                        out += args[index];
                        i = close + 1;
                        continue;
                    }
                }
            }
        }
        out += tmpl[i];
        ++i;
    }
    return out;
}

} // namespace maplint::analysis
