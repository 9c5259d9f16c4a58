//! # Diagnostics
//!
//! One record per finding. The message is derived from the fields through
//! the rule's template, so two findings with equal fields print identically.

#ifndef MAPLINT_ANALYSIS_DIAGNOSTIC_HPP
#define MAPLINT_ANALYSIS_DIAGNOSTIC_HPP

#include "maplint/analysis/rules.hpp"
#include "maplint/model/declaration.hpp"

#include <string>

namespace maplint::analysis {

struct Diagnostic {
    Rule rule = Rule::PropertyTypeMismatch;
    std::string code;
    Severity severity = Severity::Error;

    std::string member;             ///< Destination member (source member for AM004, recursive member for AM022)
    std::string source_member;      ///< Matched source member when it differs from `member`
    std::string source_type;
    std::string source_member_type;
    std::string dest_type;
    std::string dest_member_type;
    std::string detail;             ///< Hazard operation kind, enumerated accessor or recursive type
    model::SourceLocation location;
    std::string message;

    std::string unit;               ///< Owning analysis unit
    size_t unit_index = 0;          ///< Position of the unit in the snapshot
    size_t declaration_index = 0;   ///< Position of the declaration inside its unit
};

/// Creates a diagnostic carrying the rule's code and default severity.
[[nodiscard]] auto make_diagnostic(Rule rule, const model::MappingDeclaration& decl,
                                   std::string member) -> Diagnostic;

/// Fills the rule template from the diagnostic fields.
[[nodiscard]] auto render_message(const Diagnostic& diag) -> std::string;

/// Ordering used for reports: file, line, member, code, rule.
[[nodiscard]] auto diagnostic_less(const Diagnostic& a, const Diagnostic& b) -> bool;

} // namespace maplint::analysis

#endif // MAPLINT_ANALYSIS_DIAGNOSTIC_HPP
