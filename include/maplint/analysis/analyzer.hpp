//! # Analysis Pass
//!
//! Drives one pass over an analysis unit:
//!
//! ```text
//! analyze(unit)
//!   ├─ MappingRegistry(unit)          phase 1: edges and duplicates
//!   └─ for each declaration
//!        ├─ DuplicateMapping
//!        ├─ check_recursion               AM022
//!        ├─ for each destination member   classify_member
//!        ├─ for each effective config     check_redundant, detect_hazards
//!        └─ MissingDestinationProperty
//! ```
//!
//! Every member is evaluated in isolation: an exception escaping one member
//! is logged and the pass moves on. Disabled rules, severity overrides and
//! the minimum severity are applied to the result.

#ifndef MAPLINT_ANALYSIS_ANALYZER_HPP
#define MAPLINT_ANALYSIS_ANALYZER_HPP

#include "maplint/analysis/diagnostic.hpp"
#include "maplint/analysis/rules.hpp"
#include "maplint/expr/summary.hpp"
#include "maplint/model/declaration.hpp"
#include "maplint/model/type_shape.hpp"

#include <map>
#include <set>
#include <vector>

namespace maplint::analysis {

struct AnalyzerOptions {
    std::set<Rule> disabled_rules;
    std::map<Rule, Severity> severity_overrides;
    Severity min_severity = Severity::Info;
    bool check_missing_destination = true;
    bool check_duplicates = true;
    expr::HazardPatterns patterns;

    [[nodiscard]] auto is_enabled(Rule rule) const -> bool {
        return !disabled_rules.contains(rule);
    }
};

class Analyzer {
public:
    explicit Analyzer(const model::ShapeTable& shapes, AnalyzerOptions options = {});

    /// Findings for one unit, in discovery order.
    [[nodiscard]] auto analyze(const model::AnalysisUnit& unit) const -> std::vector<Diagnostic>;

    /// Findings for every unit of a snapshot, sorted for reporting.
    [[nodiscard]] auto analyze_all(const std::vector<model::AnalysisUnit>& units) const
        -> std::vector<Diagnostic>;

    [[nodiscard]] auto options() const -> const AnalyzerOptions& {
        return options_;
    }

private:
    const model::ShapeTable& shapes_;
    AnalyzerOptions options_;

    /// Applies overrides; false when the finding is filtered out.
    auto accept(Diagnostic& diag) const -> bool;
};

} // namespace maplint::analysis

#endif // MAPLINT_ANALYSIS_ANALYZER_HPP
