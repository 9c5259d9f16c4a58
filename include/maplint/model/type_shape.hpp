//! # Type Shapes
//!
//! The member lists of source and destination types, as produced by the
//! external shape extractor, and the table used to look them up by name.

#ifndef MAPLINT_MODEL_TYPE_SHAPE_HPP
#define MAPLINT_MODEL_TYPE_SHAPE_HPP

#include "maplint/model/type_ref.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace maplint::model {

/// One property or field of a type.
struct Member {
    std::string name;
    TypeRefPtr type;       ///< Null when `type_text` could not be parsed.
    std::string type_text; ///< Descriptor as written in the snapshot.
    bool settable = true;
    bool required = false;
    bool nullable = false; ///< Mirrors `is_nullable(type)` once normalized.
    std::string note;      ///< Free-form marker, e.g. "Populate before mapping"

    [[nodiscard]] auto is_resolved() const -> bool {
        return type != nullptr;
    }
};

/// Builds a member from a descriptor. A `nullable` flag on a descriptor
/// without `?` wraps the parsed type.
[[nodiscard]] auto make_member(std::string name, std::string type_text, bool settable = true,
                               bool required = false, bool nullable = false) -> Member;

/// A type and its members in declaration order.
struct TypeShape {
    std::string name;
    std::vector<Member> members;

    [[nodiscard]] auto find_member(std::string_view member_name) const -> const Member*;

    /// First member, in declaration order, whose name matches ignoring case.
    [[nodiscard]] auto find_member_ignore_case(std::string_view member_name) const
        -> const Member*;
};

/// Name-indexed collection of shapes. Iteration follows insertion order.
class ShapeTable {
public:
    /// Adds or replaces a shape.
    void add(TypeShape shape);

    /// Exact lookup, falling back to a unique match on the last dotted segment.
    [[nodiscard]] auto find(std::string_view name) const -> const TypeShape*;
    [[nodiscard]] auto find_mut(std::string_view name) -> TypeShape*;

    [[nodiscard]] auto shapes() const -> const std::vector<TypeShape>& {
        return shapes_;
    }

    [[nodiscard]] auto size() const -> size_t {
        return shapes_.size();
    }

private:
    std::vector<TypeShape> shapes_;
    std::unordered_map<std::string, size_t> index_;

    [[nodiscard]] auto find_index(std::string_view name) const -> std::optional<size_t>;
};

/// Case-insensitive ASCII string comparison.
[[nodiscard]] auto equals_ignore_case(std::string_view a, std::string_view b) -> bool;

} // namespace maplint::model

#endif // MAPLINT_MODEL_TYPE_SHAPE_HPP
