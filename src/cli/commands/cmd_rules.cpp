//! # Rules Command

#include "cli/commands/cmd_rules.hpp"

#include "maplint/analysis/rules.hpp"

#include <iomanip>
#include <iostream>

namespace maplint::cli {

void write_rule_table(std::ostream& out) {
    out << std::left << std::setw(7) << "CODE" << std::setw(30) << "RULE" << std::setw(9)
        << "SEVERITY"
        << "TITLE\n";
    for (const auto& info : analysis::all_rules()) {
        out << std::left << std::setw(7) << info.code << std::setw(30) << info.name
            << std::setw(9) << analysis::severity_name(info.severity) << info.title << "\n";
    }
}

int run_rules() {
    write_rule_table(std::cout);
    return 0;
}

} // namespace maplint::cli
