//! # Expression Shape Summaries
//!
//! Reduces a mapping lambda to a closed set of facts the rules match on.
//! The fact set is a tagged variant; rule code visits it exhaustively, so a
//! new fact kind fails to compile until every rule decides how to treat it.
//!
//! | Fact              | Produced for                                        |
//! |-------------------|-----------------------------------------------------|
//! | BareAccess        | `src => src.Name`                                   |
//! | EnumerationSite   | `src.Items.Count()`, `src.Items.Where(..).Sum(..)`  |
//! | DependencyCall    | `_context.Users.Find(src.Id)`, `File.ReadAllText(..)` |
//! | NonDeterministic  | `DateTime.Now`, `Guid.NewGuid()`, `new Random()`    |
//! | BlockingUnwrap    | `LoadAsync(src.Id).Result`, `.Wait()`, `.GetAwaiter().GetResult()` |
//! | Opaque            | text that does not parse as a lambda                |

#ifndef MAPLINT_EXPR_SUMMARY_HPP
#define MAPLINT_EXPR_SUMMARY_HPP

#include "maplint/expr/ast.hpp"
#include "maplint/model/type_shape.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace maplint::expr {

// ============================================================================
// Facts
// ============================================================================

/// The whole body reads one member directly off the source parameter.
struct BareAccess {
    std::string member;
};

/// A materializing or aggregating call over a collection-typed source accessor.
struct EnumerationSite {
    std::string accessor; ///< Dotted path below the source parameter, e.g. "Items"
    std::string method;   ///< "Count", "Sum", ...
};

/// Work delegated to something outside the source object.
struct DependencyCall {
    std::string dependency; ///< Root identifier, e.g. "_context" or "File"
    std::string category;   ///< "database query", "HTTP request", ...
};

struct NonDeterministic {
    std::string primitive; ///< "DateTime.Now", "Guid.NewGuid()", "Random"
};

struct BlockingUnwrap {
    std::string receiver; ///< Text of the awaited expression
};

struct Opaque {
    std::string reason;
};

using ShapeFact = std::variant<BareAccess, EnumerationSite, DependencyCall, NonDeterministic,
                               BlockingUnwrap, Opaque>;

// ============================================================================
// Inputs
// ============================================================================

/// Type-name fragments that classify captured dependencies.
struct HazardPatterns {
    std::vector<std::string> data_access = {"DbSet",         "DbContext", "IQueryable",
                                            "Queryable",     "NHibernate", "SqlConnection",
                                            "System.Data",   "Dapper",    "Repository"};
    std::vector<std::string> http = {"HttpClient", "WebClient", "HttpMessageInvoker"};
};

/// What the summarizer may consult while classifying identifiers.
struct SummaryContext {
    const std::map<std::string, std::string>* captures = nullptr;
    const model::ShapeTable* shapes = nullptr;
    std::string source_type;
    HazardPatterns patterns;
};

// ============================================================================
// Summary
// ============================================================================

struct ExprSummary {
    bool parsed = false;
    std::string source_param;
    std::vector<ShapeFact> facts;

    /// First-level source members read anywhere in the expression.
    std::set<std::string> source_members;

    /// Facts of one kind, in discovery order.
    template <typename T> [[nodiscard]] auto facts_of() const -> std::vector<const T*> {
        std::vector<const T*> out;
        for (const auto& fact : facts) {
            if (const auto* f = std::get_if<T>(&fact)) {
                out.push_back(f);
            }
        }
        return out;
    }

    [[nodiscard]] auto is_opaque() const -> bool {
        return !parsed;
    }
};

/// Summarizes lambda text. Unparseable text produces a single Opaque fact.
[[nodiscard]] auto summarize_expression(std::string_view text, const SummaryContext& context)
    -> ExprSummary;

/// Summarizes an already parsed tree.
[[nodiscard]] auto summarize_tree(const Expr& root, const SummaryContext& context) -> ExprSummary;

// ============================================================================
// Shared Helpers
// ============================================================================

/// Methods that force a sequence to be enumerated.
[[nodiscard]] auto is_enumeration_method(std::string_view name) -> bool;

/// Lazy operators that pass enumeration through to their receiver.
[[nodiscard]] auto is_deferred_operator(std::string_view name) -> bool;

/// "Items" for `src.Items`, "Order.Lines" for `src.Order.Lines`; nullopt
/// for anything that is not a plain (non-conditional) member path off `param`.
[[nodiscard]] auto source_accessor_path(const Expr& expr, std::string_view param)
    -> std::optional<std::string>;

/// For `recv.M(...)` where M enumerates, the expression at the bottom of any
/// chain of deferred operators below M. Null otherwise.
[[nodiscard]] auto enumeration_receiver(const Expr& expr) -> const Expr*;

/// Resolves a dotted member path from `type_name` through user-defined types.
[[nodiscard]] auto resolve_member_path(const model::ShapeTable& shapes, std::string_view type_name,
                                       std::string_view path) -> const model::Member*;

} // namespace maplint::expr

#endif // MAPLINT_EXPR_SUMMARY_HPP
