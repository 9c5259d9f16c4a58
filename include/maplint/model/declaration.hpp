//! # Mapping Declarations
//!
//! A declaration registers the intent to map one shape onto another, with
//! zero or more explicit per-member overrides. Declarations are grouped into
//! analysis units; a unit is the visibility boundary for reverse-map and
//! nested-mapping lookups.

#ifndef MAPLINT_MODEL_DECLARATION_HPP
#define MAPLINT_MODEL_DECLARATION_HPP

#include "maplint/model/type_shape.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace maplint::model {

/// Position of a declaration in the profile source.
struct SourceLocation {
    std::string file;
    uint32_t line = 0;
    uint32_t column = 0;

    [[nodiscard]] auto to_string() const -> std::string;
};

enum class ConfigKind {
    MapFrom,   ///< `opt.MapFrom(src => ...)`
    Ignore,    ///< `opt.Ignore()`
    Condition, ///< `opt.Condition(src => ...)`
    Constant   ///< `opt.MapFrom(_ => literal)` / `UseValue`
};

[[nodiscard]] auto config_kind_name(ConfigKind kind) -> const char*;
[[nodiscard]] auto parse_config_kind(std::string_view name) -> std::optional<ConfigKind>;

/// One explicit `ForMember` override.
struct MemberConfig {
    std::string dest_member;
    ConfigKind kind = ConfigKind::MapFrom;
    std::string text; ///< Lambda text for MapFrom/Condition, literal for Constant.

    bool operator==(const MemberConfig& other) const = default;
};

struct MappingDeclaration {
    std::string source_type;
    std::string dest_type;
    std::vector<MemberConfig> member_configs;
    bool has_reverse_map = false;
    bool has_custom_construction = false; ///< ConstructUsing / ConvertUsing
    std::optional<uint32_t> max_depth;    ///< `MaxDepth(n)`
    std::map<std::string, std::string> captures; ///< identifier -> declared type
    std::vector<std::string> ignored_source_members;
    std::vector<std::string> comments;
    SourceLocation location;
};

/// Effective config per destination member: the last one declared wins.
using OverrideMap = std::unordered_map<std::string, const MemberConfig*>;

[[nodiscard]] auto build_override_map(const MappingDeclaration& decl) -> OverrideMap;

struct AnalysisUnit {
    std::string name;
    std::vector<MappingDeclaration> declarations;
};

/// Everything the external collaborators hand over.
struct Snapshot {
    ShapeTable shapes;
    std::vector<AnalysisUnit> units;
};

} // namespace maplint::model

#endif // MAPLINT_MODEL_DECLARATION_HPP
