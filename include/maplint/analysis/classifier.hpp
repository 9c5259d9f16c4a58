//! # Compatibility Classifier
//!
//! Convention rules for one destination member, plus the rules that look
//! at explicit configs (`RedundantMapFrom`) and at leftover source members
//! (`MissingDestinationProperty`).
//!
//! ## Member Decision Order
//!
//! ```text
//! explicit config?            -> skip
//! exact source name?
//!   assignable / widening     -> ok
//!   underlying types (nullability stripped from the source):
//!     both collections        -> AM003 if elements differ
//!     both user-defined       -> AM020 unless mapped in the unit
//!     otherwise incompatible  -> AM001
//!   compatible, but nullable -> non-nullable
//!                             -> AM002
//! case-insensitive name?      -> AM005
//! required destination?       -> AM011
//! ```
//!
//! Classification of one member never reads another member's result.
//!
//! ## Recursion
//!
//! `check_recursion` looks at the declaration as a whole: a type holding a
//! member of its own type (AM022 SelfReferencingType), or a source graph that
//! reaches the destination type or loops back on itself within ten hops
//! (AM022 InfiniteRecursion). `MaxDepth`, custom construction or an ignored
//! recursive member silence it.

#ifndef MAPLINT_ANALYSIS_CLASSIFIER_HPP
#define MAPLINT_ANALYSIS_CLASSIFIER_HPP

#include "maplint/analysis/diagnostic.hpp"
#include "maplint/analysis/registry.hpp"
#include "maplint/model/declaration.hpp"
#include "maplint/model/type_shape.hpp"

#include <optional>
#include <string>
#include <vector>

namespace maplint::analysis {

class Classifier {
public:
    Classifier(const model::ShapeTable& shapes, const MappingRegistry& registry);

    /// Convention verdict for `dest`; nullopt when compatible or skipped.
    [[nodiscard]] auto classify_member(const model::MappingDeclaration& decl,
                                       const model::OverrideMap& overrides,
                                       const model::TypeShape& source,
                                       const model::Member& dest) const
        -> std::optional<Diagnostic>;

    /// `RedundantMapFrom` for one effective config. Fails closed: anything
    /// that is not provably a same-typed bare access is not redundant.
    [[nodiscard]] auto check_redundant(const model::MappingDeclaration& decl,
                                       const model::TypeShape& source,
                                       const model::TypeShape& dest,
                                       const model::MemberConfig& config) const
        -> std::optional<Diagnostic>;

    /// `MissingDestinationProperty` for every source member without a home.
    [[nodiscard]] auto check_missing_destination(const model::MappingDeclaration& decl,
                                                 const model::TypeShape& source,
                                                 const model::TypeShape& dest) const
        -> std::vector<Diagnostic>;

    /// AM022 for the declaration, reported once on the recursive member.
    [[nodiscard]] auto check_recursion(const model::MappingDeclaration& decl,
                                       const model::TypeShape& source,
                                       const model::TypeShape& dest) const
        -> std::optional<Diagnostic>;

private:
    const model::ShapeTable& shapes_;
    const MappingRegistry& registry_;

    /// First member of `source` whose type graph reaches `target` or a cycle.
    [[nodiscard]] auto circular_member(const model::TypeShape& source,
                                       const std::string& target) const
        -> std::optional<std::string>;

    [[nodiscard]] auto classify_exact(const model::MappingDeclaration& decl,
                                      const model::Member& source_member,
                                      const model::Member& dest) const
        -> std::optional<Diagnostic>;

    /// Rule for an incompatible pair of underlying types, nullopt when the
    /// source core converts to `to`.
    [[nodiscard]] auto classify_core(const model::TypeRefPtr& from,
                                     const model::TypeRefPtr& to) const -> std::optional<Rule>;
};

/// Members of `shape` typed as the shape itself, directly, nullable or as a
/// collection element.
[[nodiscard]] auto self_referencing_members(const model::TypeShape& shape)
    -> std::vector<std::string>;

} // namespace maplint::analysis

#endif // MAPLINT_ANALYSIS_CLASSIFIER_HPP
