//! # Fix Synthesizer
//!
//! Turns one diagnostic into its independently selectable edits. Edits are
//! computed against the original declaration and never assume another fix
//! has been applied first.
//!
//! | Rule                          | Alternatives                                  |
//! |-------------------------------|-----------------------------------------------|
//! | PropertyTypeMismatch          | conversion MapFrom                            |
//! | NullableCompatibility         | coalescing MapFrom                            |
//! | GenericTypeMismatch           | element conversion MapFrom                    |
//! | CaseSensitivityMismatch       | explicit MapFrom, convention comment, rename comment |
//! | UnmappedRequiredProperty      | sample-literal MapFrom, comment               |
//! | RedundantMapFrom              | remove config                                 |
//! | Expensive / Task / NonDeterministic | remove config + add source member       |
//! | MultipleEnumeration           | rewrite to block body with cached locals      |
//! | SelfReferencing / InfiniteRecursion | ignore recursive members, MaxDepth(2)   |
//!
//! Literals are fixed constants. A constant that the summarizer would
//! flag, such as `new HttpClientOptions()`, is withheld.

#ifndef MAPLINT_FIX_SYNTHESIZER_HPP
#define MAPLINT_FIX_SYNTHESIZER_HPP

#include "maplint/analysis/diagnostic.hpp"
#include "maplint/expr/summary.hpp"
#include "maplint/model/declaration.hpp"
#include "maplint/model/edit.hpp"
#include "maplint/model/type_shape.hpp"

#include <map>
#include <string>
#include <vector>

namespace maplint::fix {

/// Marker carried by members moved out of a mapping expression.
constexpr const char* POPULATE_MARKER = "Populate before mapping";

/// Ordered alternatives for `diag`; empty when the rule has no fix.
/// Alternatives whose lambda `patterns` would flag as a hazard are dropped.
[[nodiscard]] auto synthesize_fixes(const analysis::Diagnostic& diag,
                                    const model::MappingDeclaration& decl,
                                    const model::ShapeTable& shapes,
                                    const expr::HazardPatterns& patterns = {})
    -> std::vector<model::Edit>;

/// Default value literal of a type, e.g. `string.Empty`, `0L`, `new List<int>()`.
[[nodiscard]] auto default_literal(const model::TypeRefPtr& type) -> std::string;

/// Non-default sample literal for a required member, e.g. `1`, `true`, `new Address()`.
/// Interface-named types (`IClock`) get `default`.
[[nodiscard]] auto sample_literal(const model::TypeRefPtr& type) -> std::string;

/// Rewrites a lambda so each accessor in `accessors` is materialized once
/// into a local. Empty when the text does not parse or nothing matches.
[[nodiscard]] auto cache_enumerations(const std::string& lambda_text,
                                      const std::vector<std::string>& accessors,
                                      const std::map<std::string, std::string>& captures)
    -> std::string;

} // namespace maplint::fix

#endif // MAPLINT_FIX_SYNTHESIZER_HPP
