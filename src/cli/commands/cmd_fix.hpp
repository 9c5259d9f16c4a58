//! # Fix Command Interface
//!
//! ```bash
//! maplint fix snapshot.json --output=fixed.json
//! maplint fix snapshot.json --rule=AM002          # only NullableCompatibility
//! maplint fix snapshot.json --alternative=2       # second alternative where offered
//! ```
//!
//! The loop analyzes, applies one edit for the first fixable finding not yet
//! attempted, and analyzes again. Each finding is attempted at most once, so
//! comment-only alternatives are never retried and the loop always ends.

#pragma once
#include "maplint/analysis/rules.hpp"
#include "maplint/config/config.hpp"
#include "maplint/model/declaration.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace maplint::cli {

struct FixOptions {
    std::string snapshot_path;
    std::optional<std::string> config_path;
    std::optional<std::string> output_path; ///< stdout when unset
    std::set<analysis::Rule> rules;         ///< empty selects every rule
    size_t alternative = 1;                 ///< 1-based
    std::optional<int> max_iterations;      ///< overrides `[fix] max-iterations`
};

struct FixOutcome {
    size_t applied = 0;      ///< Edits that changed the snapshot
    size_t comment_only = 0; ///< Comment edits among them
    size_t failed = 0;       ///< Edits rejected by apply_edit
    int iterations = 0;
    bool hit_limit = false;
    size_t remaining = 0; ///< Findings left after the last pass
};

std::optional<FixOptions> parse_fix_args(const std::vector<std::string>& args);

/// Runs the fix loop over `snapshot` in place.
FixOutcome fix_snapshot(model::Snapshot& snapshot, const config::Settings& settings,
                        const FixOptions& options);

int run_fix(const std::vector<std::string>& args);

} // namespace maplint::cli
