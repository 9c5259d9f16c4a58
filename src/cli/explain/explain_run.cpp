//! # Explain Command Entry Point
//!
//! The explanation database is split by rule family:
//! - `type_rules.cpp`   - AM001-AM003, AM020
//! - `member_rules.cpp` - AM004, AM005, AM011, AM041, AM050
//! - `hazard_rules.cpp` - AM031

#include "cli/commands/cmd_explain.hpp"
#include "cli/explain/explain_internal.hpp"
#include "cli/terminal.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <unordered_map>

namespace maplint::cli {

static const std::unordered_map<std::string, std::string>& get_all_explanations() {
    static const std::unordered_map<std::string, std::string> merged = [] {
        std::unordered_map<std::string, std::string> all;
        const auto& type = explain::get_type_explanations();
        const auto& member = explain::get_member_explanations();
        const auto& hazard = explain::get_hazard_explanations();
        all.insert(type.begin(), type.end());
        all.insert(member.begin(), member.end());
        all.insert(hazard.begin(), hazard.end());
        return all;
    }();
    return merged;
}

static std::string normalize_code(const std::string& code) {
    std::string normalized;
    normalized.reserve(code.size());
    for (char c : code) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            normalized += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return normalized;
}

const std::string* find_explanation(const std::string& code) {
    const auto& explanations = get_all_explanations();
    auto it = explanations.find(normalize_code(code));
    return it == explanations.end() ? nullptr : &it->second;
}

std::vector<std::string> explained_codes() {
    std::vector<std::string> codes;
    for (const auto& [code, _] : get_all_explanations()) {
        codes.push_back(code);
    }
    std::sort(codes.begin(), codes.end());
    return codes;
}

int run_explain(const std::string& code) {
    std::string normalized = normalize_code(code);
    if (normalized.empty()) {
        std::cerr << "Usage: maplint explain <rule-code>\n";
        std::cerr << "Example: maplint explain AM001\n";
        return 1;
    }

    if (const auto* text = find_explanation(normalized)) {
        bool colors = terminal_supports_colors();
        if (colors) {
            std::cout << Colors::Bold << Colors::BrightCyan;
        }
        std::cout << "Explanation for " << normalized;
        if (colors) {
            std::cout << Colors::Reset;
        }
        std::cout << "\n" << *text;
        if (!text->empty() && text->back() != '\n') {
            std::cout << "\n";
        }
        return 0;
    }

    std::cerr << "No explanation available for rule code `" << normalized << "`.\n\n";
    auto suggestions = find_similar_candidates(normalized, explained_codes(), 3, 2);
    if (!suggestions.empty()) {
        std::cerr << "Did you mean:\n";
        for (const auto& s : suggestions) {
            std::cerr << "  maplint explain " << s << "\n";
        }
        std::cerr << "\n";
    }
    std::cerr << "Run `maplint rules` to list every rule.\n";
    return 1;
}

} // namespace maplint::cli
