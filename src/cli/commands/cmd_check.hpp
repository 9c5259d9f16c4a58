//! # Check Command Interface
//!
//! ```bash
//! maplint check snapshot.json                 # text report
//! maplint check snapshot.json --format=json   # machine-readable report
//! maplint check snapshot.json --fixes         # include fix alternatives
//! ```
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                           |
//! |------|---------------------------------------------------|
//! | 0    | No finding at or above `fail-on`                  |
//! | 1    | At least one finding at or above `fail-on`        |
//! | 2    | Usage, configuration or snapshot error            |

#pragma once
#include "maplint/analysis/diagnostic.hpp"
#include "maplint/analysis/rules.hpp"

#include <optional>
#include <string>
#include <vector>

namespace maplint::cli {

enum class ReportFormat { Text, Json };

struct CheckOptions {
    std::string snapshot_path;
    ReportFormat format = ReportFormat::Text;
    std::optional<std::string> config_path;
    bool with_fixes = false;
    bool quiet = false;
};

/// Parses the arguments following `check`. Nullopt after printing a usage error.
std::optional<CheckOptions> parse_check_args(const std::vector<std::string>& args);

/// 1 when any finding reaches `fail_on`, else 0.
int exit_code_for(const std::vector<analysis::Diagnostic>& diagnostics,
                  std::optional<analysis::Severity> fail_on);

int run_check(const std::vector<std::string>& args);

} // namespace maplint::cli
