//! # Explanation Database Interface
//!
//! One lookup table per rule family, merged by `explain_run.cpp`.

#pragma once
#include <string>
#include <unordered_map>

namespace maplint::cli::explain {

/// AM001, AM002, AM003, AM020
const std::unordered_map<std::string, std::string>& get_type_explanations();

/// AM004, AM005, AM011, AM041, AM050
const std::unordered_map<std::string, std::string>& get_member_explanations();

/// AM031
const std::unordered_map<std::string, std::string>& get_hazard_explanations();

} // namespace maplint::cli::explain
