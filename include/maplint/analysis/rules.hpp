//! # Rule Catalogue
//!
//! Every finding maplint can report, with its public code, default severity
//! and message template.
//!
//! ## Codes
//!
//! | Code  | Rules                                                      |
//! |-------|------------------------------------------------------------|
//! | AM001 | PropertyTypeMismatch                                       |
//! | AM002 | NullableCompatibility                                      |
//! | AM003 | GenericTypeMismatch                                        |
//! | AM004 | MissingDestinationProperty                                 |
//! | AM005 | CaseSensitivityMismatch                                    |
//! | AM011 | UnmappedRequiredProperty                                   |
//! | AM020 | ComplexTypeMappingMissing                                  |
//! | AM022 | SelfReferencingType, InfiniteRecursion                     |
//! | AM031 | ExpensiveOperationInMapFrom, MultipleEnumeration,          |
//! |       | TaskResultSynchronousAccess, NonDeterministicOperation     |
//! | AM041 | DuplicateMapping                                           |
//! | AM050 | RedundantMapFrom                                           |
//!
//! Templates use positional `{n}` placeholders filled by `render_message`.

#ifndef MAPLINT_ANALYSIS_RULES_HPP
#define MAPLINT_ANALYSIS_RULES_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace maplint::analysis {

enum class Severity { Info, Warning, Error };

[[nodiscard]] auto severity_name(Severity severity) -> const char*;

/// Accepts "error", "warning"/"warn", "info" in any case.
[[nodiscard]] auto parse_severity(std::string_view text) -> std::optional<Severity>;

enum class Rule {
    PropertyTypeMismatch,
    NullableCompatibility,
    GenericTypeMismatch,
    MissingDestinationProperty,
    CaseSensitivityMismatch,
    UnmappedRequiredProperty,
    ComplexTypeMappingMissing,
    SelfReferencingType,
    InfiniteRecursion,
    ExpensiveOperationInMapFrom,
    MultipleEnumeration,
    TaskResultSynchronousAccess,
    NonDeterministicOperation,
    DuplicateMapping,
    RedundantMapFrom,
};

struct RuleInfo {
    Rule rule;
    const char* name;
    const char* code;
    Severity severity;
    const char* title;
    const char* message_template;
};

/// All rules in code order.
[[nodiscard]] auto all_rules() -> const std::vector<RuleInfo>&;

[[nodiscard]] auto rule_info(Rule rule) -> const RuleInfo&;
[[nodiscard]] auto rule_name(Rule rule) -> const char*;
[[nodiscard]] auto rule_code(Rule rule) -> const char*;

/// Rules selected by a rule name or an `AMnnn` code (case-insensitive).
/// A code selects every rule sharing it; unknown text selects nothing.
[[nodiscard]] auto rules_matching(std::string_view name_or_code) -> std::vector<Rule>;

/// Replaces `{0}`, `{1}`, ... with `args`. Out-of-range placeholders stay as written.
[[nodiscard]] auto format_template(std::string_view tmpl, const std::vector<std::string>& args)
    -> std::string;

} // namespace maplint::analysis

#endif // MAPLINT_ANALYSIS_RULES_HPP
