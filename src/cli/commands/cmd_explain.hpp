//! # Explain Command Interface
//!
//! | Command                | Output                                   |
//! |------------------------|------------------------------------------|
//! | `maplint explain AM001`| Property type mismatch explanation       |
//! | `maplint explain am31` | Suggestions: AM031, AM001, ...           |

#pragma once
#include <string>
#include <vector>

namespace maplint::cli {

/// Explanation text for a normalized code, or nullptr.
const std::string* find_explanation(const std::string& code);

/// Every code with an explanation, sorted.
std::vector<std::string> explained_codes();

/// Returns 0 on success, 1 if the code is not found.
int run_explain(const std::string& code);

} // namespace maplint::cli
