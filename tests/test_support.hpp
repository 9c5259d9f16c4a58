//! # Test Support
//!
//! Builders shared by the analysis, fix and CLI tests.

#pragma once

#include "maplint/model/declaration.hpp"
#include "maplint/model/type_shape.hpp"

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace maplint::test {

inline auto shape(std::string name, std::vector<model::Member> members) -> model::TypeShape {
    return model::TypeShape{std::move(name), std::move(members)};
}

inline auto map_from(std::string dest, std::string text) -> model::MemberConfig {
    return model::MemberConfig{std::move(dest), model::ConfigKind::MapFrom, std::move(text)};
}

inline auto ignore(std::string dest) -> model::MemberConfig {
    return model::MemberConfig{std::move(dest), model::ConfigKind::Ignore, ""};
}

inline auto declaration(std::string source, std::string dest,
                        std::vector<model::MemberConfig> configs = {}) -> model::MappingDeclaration {
    model::MappingDeclaration decl;
    decl.source_type = std::move(source);
    decl.dest_type = std::move(dest);
    decl.member_configs = std::move(configs);
    decl.location = model::SourceLocation{"Profiles/TestProfile.cs", 10, 9};
    return decl;
}

inline auto unit(std::string name, std::vector<model::MappingDeclaration> declarations)
    -> model::AnalysisUnit {
    return model::AnalysisUnit{std::move(name), std::move(declarations)};
}

} // namespace maplint::test
