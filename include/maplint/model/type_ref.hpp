//! # Type References
//!
//! Structural descriptions of member types as handed over by the shape
//! extractor. A descriptor string such as `List<string>`, `int?` or `Address`
//! is parsed into a `TypeRef` tree.
//!
//! ## Variants
//!
//! | Kind            | Example                          |
//! |-----------------|----------------------------------|
//! | PrimitiveType   | `int`, `string`, `DateTime`      |
//! | NullableType    | `int?`, `string?`, `Nullable<T>` |
//! | CollectionType  | `List<T>`, `IEnumerable<T>`, `T[]` |
//! | UserDefinedType | `Address`, `Orders.Line`         |
//! | GenericType     | `Dictionary<K, V>`, `Task<T>`    |
//!
//! Primitive names are canonicalized to their C# keyword form, so `Int32`,
//! `System.Int32` and `int` compare equal.

#ifndef MAPLINT_MODEL_TYPE_REF_HPP
#define MAPLINT_MODEL_TYPE_REF_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace maplint::model {

struct TypeRef;

/// Type references are immutable and freely shared between shapes.
using TypeRefPtr = std::shared_ptr<const TypeRef>;

/// Built-in scalar type in keyword form.
struct PrimitiveType {
    std::string name;
};

/// `T?` / `Nullable<T>`.
struct NullableType {
    TypeRefPtr inner;
};

/// Single-element container. `container` is the generic name, or "[]" for arrays.
struct CollectionType {
    std::string container;
    TypeRefPtr element;
};

/// Named application type with members of its own.
struct UserDefinedType {
    std::string name;
};

/// Any other generic instantiation.
struct GenericType {
    std::string name;
    std::vector<TypeRefPtr> args;
};

struct TypeRef {
    std::variant<PrimitiveType, NullableType, CollectionType, UserDefinedType, GenericType> kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }
};

// ============================================================================
// Construction
// ============================================================================

[[nodiscard]] auto make_primitive(std::string name) -> TypeRefPtr;
[[nodiscard]] auto make_nullable(TypeRefPtr inner) -> TypeRefPtr;
[[nodiscard]] auto make_collection(std::string container, TypeRefPtr element) -> TypeRefPtr;
[[nodiscard]] auto make_array(TypeRefPtr element) -> TypeRefPtr;
[[nodiscard]] auto make_user_defined(std::string name) -> TypeRefPtr;
[[nodiscard]] auto make_generic(std::string name, std::vector<TypeRefPtr> args) -> TypeRefPtr;

/// Parses a type descriptor. Returns nullopt for malformed descriptors,
/// which callers treat as an unresolvable type.
[[nodiscard]] auto parse_type_ref(std::string_view text) -> std::optional<TypeRefPtr>;

/// Keyword form of a built-in type name ("Int32" -> "int"), if it is one.
[[nodiscard]] auto canonical_primitive(std::string_view name) -> std::optional<std::string>;

/// True for generic names treated as single-element collections.
[[nodiscard]] auto is_collection_container(std::string_view name) -> bool;

// ============================================================================
// Queries
// ============================================================================

/// Structural equality. Two null pointers are equal; null never equals non-null.
[[nodiscard]] auto types_equal(const TypeRefPtr& a, const TypeRefPtr& b) -> bool;

/// Descriptor text: `int?`, `List<string>`, `int[]`, `Dictionary<string, int>`.
[[nodiscard]] auto type_to_string(const TypeRefPtr& type) -> std::string;

[[nodiscard]] auto is_nullable(const TypeRefPtr& type) -> bool;

/// The non-nullable core of a type (the type itself when not nullable).
[[nodiscard]] auto strip_nullable(const TypeRefPtr& type) -> TypeRefPtr;

[[nodiscard]] auto is_collection(const TypeRefPtr& type) -> bool;
[[nodiscard]] auto is_user_defined(const TypeRefPtr& type) -> bool;
[[nodiscard]] auto is_primitive(const TypeRefPtr& type, std::string_view name) -> bool;
[[nodiscard]] auto is_string_type(const TypeRefPtr& type) -> bool;

/// Element type of a collection (after stripping nullability), else null.
[[nodiscard]] auto element_type(const TypeRefPtr& type) -> TypeRefPtr;

/// Position in the implicit numeric widening order, 0 for non-numeric types:
/// byte/sbyte=1, short/ushort=2, int/uint=3, long/ulong=4, float=5,
/// double=6, decimal=7.
[[nodiscard]] auto numeric_rank(const TypeRefPtr& type) -> int;

[[nodiscard]] auto is_numeric(const TypeRefPtr& type) -> bool;

/// True when a value of `from` converts implicitly to `to` without loss of
/// nullability: identical types, or a numeric widening.
[[nodiscard]] auto implicitly_widens(const TypeRefPtr& from, const TypeRefPtr& to) -> bool;

} // namespace maplint::model

#endif // MAPLINT_MODEL_TYPE_REF_HPP
