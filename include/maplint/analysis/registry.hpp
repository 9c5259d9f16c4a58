//! # Mapping Registry
//!
//! Directed edge set `source -> destination` for one analysis unit. A
//! declaration with `ReverseMap()` contributes the inverse edge as well.
//! Reachability is one hop; the set is never transitively closed.
//!
//! Type names are keyed by their last dotted segment so that `App.Dto`
//! and `Dto` name the same node, matching how shapes are looked up.

#ifndef MAPLINT_ANALYSIS_REGISTRY_HPP
#define MAPLINT_ANALYSIS_REGISTRY_HPP

#include "maplint/model/declaration.hpp"

#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace maplint::analysis {

class MappingRegistry {
public:
    explicit MappingRegistry(const model::AnalysisUnit& unit);

    /// True iff the edge `source -> dest` was declared in this unit.
    [[nodiscard]] auto effectively_mapped(std::string_view source, std::string_view dest) const
        -> bool;

    /// Indices of declarations whose forward or reverse edge was already
    /// registered by an earlier declaration, in declaration order.
    [[nodiscard]] auto duplicates() const -> const std::vector<size_t>& {
        return duplicates_;
    }

    [[nodiscard]] auto edge_count() const -> size_t {
        return edges_.size();
    }

private:
    std::set<std::pair<std::string, std::string>> edges_;
    std::vector<size_t> duplicates_;
};

/// Registry key for a type name: generic arguments kept, namespace dropped.
[[nodiscard]] auto registry_key(std::string_view type_name) -> std::string;

} // namespace maplint::analysis

#endif // MAPLINT_ANALYSIS_REGISTRY_HPP
