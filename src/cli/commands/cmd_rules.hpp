//! # Rules Command Interface

#pragma once
#include <ostream>

namespace maplint::cli {

/// Writes the rule table: code, name, default severity and title.
void write_rule_table(std::ostream& out);

int run_rules();

} // namespace maplint::cli
