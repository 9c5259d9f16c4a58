//! # Collection Compatibility
//!
//! Element-level comparison for two collection-typed members. Only one
//! level of element recursion is classified: elements that are themselves
//! collections or generics compare structurally.

#ifndef MAPLINT_ANALYSIS_COLLECTION_HPP
#define MAPLINT_ANALYSIS_COLLECTION_HPP

#include "maplint/analysis/registry.hpp"
#include "maplint/model/type_ref.hpp"

namespace maplint::analysis {

enum class CollectionVerdict { Compatible, ElementMismatch };

/// Compares the element types of two collection types. User-defined
/// elements are compatible when the registry maps one onto the other.
[[nodiscard]] auto check_collection(const model::TypeRefPtr& source, const model::TypeRefPtr& dest,
                                    const MappingRegistry& registry) -> CollectionVerdict;

} // namespace maplint::analysis

#endif // MAPLINT_ANALYSIS_COLLECTION_HPP
