//! # Performance Hazard Detector
//!
//! Runs on each effective `MapFrom` expression, independent of the
//! convention rules. Four tags, each reported at most once per expression:
//!
//! | Fact             | Rule                          | Detail             |
//! |------------------|-------------------------------|--------------------|
//! | DependencyCall   | ExpensiveOperationInMapFrom   | operation kind     |
//! | EnumerationSite  | MultipleEnumeration (>= 2)    | accessor path      |
//! | BlockingUnwrap   | TaskResultSynchronousAccess   | awaited expression |
//! | NonDeterministic | NonDeterministicOperation     | primitive          |
//!
//! Opaque expressions produce nothing.

#ifndef MAPLINT_ANALYSIS_HAZARDS_HPP
#define MAPLINT_ANALYSIS_HAZARDS_HPP

#include "maplint/analysis/diagnostic.hpp"
#include "maplint/expr/summary.hpp"
#include "maplint/model/declaration.hpp"
#include "maplint/model/type_shape.hpp"

#include <vector>

namespace maplint::analysis {

/// Hazards of an already summarized expression, in rule order.
[[nodiscard]] auto hazards_from_summary(const expr::ExprSummary& summary,
                                        const model::MappingDeclaration& decl,
                                        const std::string& member) -> std::vector<Diagnostic>;

/// Summarizes `config` and reports its hazards. Non-MapFrom configs yield nothing.
[[nodiscard]] auto detect_hazards(const model::MappingDeclaration& decl,
                                  const model::MemberConfig& config,
                                  const model::ShapeTable& shapes,
                                  const expr::HazardPatterns& patterns) -> std::vector<Diagnostic>;

} // namespace maplint::analysis

#endif // MAPLINT_ANALYSIS_HAZARDS_HPP
