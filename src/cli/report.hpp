//! # Finding Reports
//!
//! Renders analyzer findings for `maplint check`, either as compiler-style
//! text or as one JSON document:
//!
//! ```text
//! error[AM001]: Property 'Age' type mismatch: ...
//!   --> Profiles/UserProfile.cs:12:9
//!    = PropertyTypeMismatch in UserProfile (Source -> Destination)
//!    = fix 1: Convert Age to string
//!        ForMember(Age, MapFrom(src => src.Age.ToString()))
//! ```

#pragma once

#include "maplint/analysis/diagnostic.hpp"
#include "maplint/expr/summary.hpp"
#include "maplint/json/json_value.hpp"
#include "maplint/model/declaration.hpp"
#include "maplint/model/edit.hpp"

#include <ostream>
#include <vector>

namespace maplint::cli {

struct ReportOptions {
    bool with_fixes = false;
    bool colors = false;
    expr::HazardPatterns patterns;
};

/// Fix alternatives for a finding, looked up through its unit and declaration indices.
[[nodiscard]] auto fixes_for(const analysis::Diagnostic& diag, const model::Snapshot& snapshot,
                             const expr::HazardPatterns& patterns = {})
    -> std::vector<model::Edit>;

void write_text_report(std::ostream& out, const std::vector<analysis::Diagnostic>& diagnostics,
                       const model::Snapshot& snapshot, const ReportOptions& options);

[[nodiscard]] auto report_to_json(const std::vector<analysis::Diagnostic>& diagnostics,
                                  const model::Snapshot& snapshot, bool with_fixes,
                                  const expr::HazardPatterns& patterns = {})
    -> json::JsonValue;

} // namespace maplint::cli
