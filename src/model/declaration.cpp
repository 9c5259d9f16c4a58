//! # Mapping Declarations

#include "maplint/model/declaration.hpp"

namespace maplint::model {

auto SourceLocation::to_string() const -> std::string {
    if (file.empty()) {
        return "<unknown>";
    }
    return file + ":" + std::to_string(line) + ":" + std::to_string(column);
}

auto config_kind_name(ConfigKind kind) -> const char* {
    switch (kind) {
    case ConfigKind::MapFrom:
        return "map_from";
    case ConfigKind::Ignore:
        return "ignore";
    case ConfigKind::Condition:
        return "condition";
    case ConfigKind::Constant:
        return "constant";
    }
    return "map_from";
}

auto parse_config_kind(std::string_view name) -> std::optional<ConfigKind> {
    if (name == "map_from") {
        return ConfigKind::MapFrom;
    }
    if (name == "ignore") {
        return ConfigKind::Ignore;
    }
    if (name == "condition") {
        return ConfigKind::Condition;
    }
    if (name == "constant") {
        return ConfigKind::Constant;
    }
    return std::nullopt;
}

auto build_override_map(const MappingDeclaration& decl) -> OverrideMap {
    OverrideMap overrides;
    for (const auto& config : decl.member_configs) {
        overrides[config.dest_member] = &config;
    }
    return overrides;
}

} // namespace maplint::model
