//! # Snapshot Edits
//!
//! A fix is an `Edit`: a title, an anchor naming the declaration and member
//! it was computed for, and an ordered list of primitive operations applied
//! as one unit.
//!
//! | Operation          | Effect                                                   |
//! |--------------------|----------------------------------------------------------|
//! | AppendMemberConfig | Appends a config unless the effective one is identical   |
//! | RemoveMemberConfig | Removes every config for the destination member          |
//! | RewriteExpression  | Replaces the effective MapFrom text                      |
//! | InsertComment      | Adds comment lines not already present                   |
//! | InsertSourceMember | Adds a member to a type unless the name is taken         |
//! | SetMaxDepth        | Sets the declaration's MaxDepth                          |
//!
//! Every operation is idempotent, so applying an edit twice equals applying
//! it once.

#ifndef MAPLINT_MODEL_EDIT_HPP
#define MAPLINT_MODEL_EDIT_HPP

#include "maplint/common.hpp"
#include "maplint/model/declaration.hpp"
#include "maplint/model/type_shape.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace maplint::model {

/// Locates the declaration an edit was synthesized against.
struct EditAnchor {
    std::string source_type;
    std::string dest_type;
    std::string member;
    SourceLocation location;
    size_t declaration_index = 0; ///< Preferred match inside the unit
};

struct AppendMemberConfig {
    MemberConfig config;
};

struct RemoveMemberConfig {
    std::string dest_member;
};

struct RewriteExpression {
    std::string dest_member;
    std::string text;
};

struct InsertComment {
    std::vector<std::string> lines;
};

struct InsertSourceMember {
    std::string type_name;
    std::string member_name;
    std::string type_text;
    std::string note;
};

struct SetMaxDepth {
    uint32_t depth = 0;
};

using EditOperation = std::variant<AppendMemberConfig, RemoveMemberConfig, RewriteExpression,
                                   InsertComment, InsertSourceMember, SetMaxDepth>;

struct Edit {
    std::string title;
    EditAnchor anchor;
    std::vector<EditOperation> operations;

    /// True when the edit only adds comments and leaves behaviour unchanged.
    [[nodiscard]] auto is_comment_only() const -> bool;
};

struct EditError {
    std::string message;
};

/// Declaration targeted by `anchor`: the indexed one when its types match,
/// else the first declaration with the same source and destination.
[[nodiscard]] auto find_anchor(AnalysisUnit& unit, const EditAnchor& anchor)
    -> MappingDeclaration*;

/// Applies all operations of `edit`. Returns whether anything changed.
[[nodiscard]] auto apply_edit(AnalysisUnit& unit, ShapeTable& shapes, const Edit& edit)
    -> Result<bool, EditError>;

/// One-line rendering of an operation for listings.
[[nodiscard]] auto describe_operation(const EditOperation& op) -> std::string;

} // namespace maplint::model

#endif // MAPLINT_MODEL_EDIT_HPP
