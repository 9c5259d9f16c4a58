//! # Type References
//!
//! Descriptor parsing, structural equality and printing for `TypeRef`.

#include "maplint/model/type_ref.hpp"

#include "maplint/common.hpp"

#include <cctype>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>

namespace maplint::model {

// ============================================================================
// Construction
// ============================================================================

auto make_primitive(std::string name) -> TypeRefPtr {
    return std::make_shared<const TypeRef>(TypeRef{PrimitiveType{std::move(name)}});
}

auto make_nullable(TypeRefPtr inner) -> TypeRefPtr {
    // T?? collapses to T?
    if (is_nullable(inner)) {
        return inner;
    }
    return std::make_shared<const TypeRef>(TypeRef{NullableType{std::move(inner)}});
}

auto make_collection(std::string container, TypeRefPtr element) -> TypeRefPtr {
    return std::make_shared<const TypeRef>(
        TypeRef{CollectionType{std::move(container), std::move(element)}});
}

auto make_array(TypeRefPtr element) -> TypeRefPtr {
    return make_collection("[]", std::move(element));
}

auto make_user_defined(std::string name) -> TypeRefPtr {
    return std::make_shared<const TypeRef>(TypeRef{UserDefinedType{std::move(name)}});
}

auto make_generic(std::string name, std::vector<TypeRefPtr> args) -> TypeRefPtr {
    return std::make_shared<const TypeRef>(TypeRef{GenericType{std::move(name), std::move(args)}});
}

// ============================================================================
// Name Tables
// ============================================================================

static auto strip_namespace(std::string_view name) -> std::string_view {
    if (name.starts_with("global::")) {
        name.remove_prefix(8);
    }
    if (name.starts_with("System.")) {
        std::string_view rest = name.substr(7);
        if (rest.find('.') == std::string_view::npos) {
            return rest;
        }
    }
    if (name.starts_with("System.Collections.Generic.") ||
        name.starts_with("System.Collections.ObjectModel.")) {
        return name.substr(name.rfind('.') + 1);
    }
    return name;
}

auto canonical_primitive(std::string_view name) -> std::optional<std::string> {
    static const std::unordered_map<std::string_view, std::string_view> aliases = {
        {"bool", "bool"},         {"Boolean", "bool"},
        {"byte", "byte"},         {"Byte", "byte"},
        {"sbyte", "sbyte"},       {"SByte", "sbyte"},
        {"short", "short"},       {"Int16", "short"},
        {"ushort", "ushort"},     {"UInt16", "ushort"},
        {"int", "int"},           {"Int32", "int"},
        {"uint", "uint"},         {"UInt32", "uint"},
        {"long", "long"},         {"Int64", "long"},
        {"ulong", "ulong"},       {"UInt64", "ulong"},
        {"float", "float"},       {"Single", "float"},
        {"double", "double"},     {"Double", "double"},
        {"decimal", "decimal"},   {"Decimal", "decimal"},
        {"char", "char"},         {"Char", "char"},
        {"string", "string"},     {"String", "string"},
        {"object", "object"},     {"Object", "object"},
        {"dynamic", "dynamic"},   {"DateTime", "DateTime"},
        {"DateTimeOffset", "DateTimeOffset"},
        {"DateOnly", "DateOnly"}, {"TimeOnly", "TimeOnly"},
        {"TimeSpan", "TimeSpan"}, {"Guid", "Guid"},
    };

    auto it = aliases.find(strip_namespace(name));
    if (it == aliases.end()) {
        return std::nullopt;
    }
    return std::string(it->second);
}

auto is_collection_container(std::string_view name) -> bool {
    static const std::unordered_set<std::string_view> containers = {
        "List",       "IList",   "ICollection", "IEnumerable", "IReadOnlyList", "IReadOnlyCollection",
        "Collection", "HashSet", "ISet",        "Queue",       "Stack",
    };
    return containers.contains(strip_namespace(name));
}

// ============================================================================
// Descriptor Parser
// ============================================================================

namespace {

/// Recursive descent over `name [<args>] ([] | ?)*`.
class DescriptorParser {
public:
    explicit DescriptorParser(std::string_view text) : text_(text) {}

    auto parse() -> TypeRefPtr {
        auto type = parse_type();
        skip_ws();
        if (!type || pos_ != text_.size()) {
            return nullptr;
        }
        return type;
    }

private:
    std::string_view text_;
    size_t pos_ = 0;

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    auto eat(char c) -> bool {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    auto parse_name() -> std::string {
        skip_ws();
        size_t start = pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
                ++pos_;
            } else if (c == ':' && pos_ + 1 < text_.size() && text_[pos_ + 1] == ':') {
                pos_ += 2;
            } else {
                break;
            }
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    auto parse_type() -> TypeRefPtr {
        std::string name = parse_name();
        if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) {
            return nullptr;
        }

        std::vector<TypeRefPtr> args;
        if (eat('<')) {
            do {
                auto arg = parse_type();
                if (!arg) {
                    return nullptr;
                }
                args.push_back(std::move(arg));
            } while (eat(','));
            if (!eat('>')) {
                return nullptr;
            }
        }

        auto type = resolve(name, std::move(args));
        if (!type) {
            return nullptr;
        }

        while (true) {
            if (eat('?')) {
                type = make_nullable(std::move(type));
            } else if (eat('[')) {
                if (!eat(']')) {
                    return nullptr;
                }
                type = make_array(std::move(type));
            } else {
                break;
            }
        }
        return type;
    }

    static auto resolve(const std::string& name, std::vector<TypeRefPtr> args) -> TypeRefPtr {
        std::string_view bare = strip_namespace(name);
        if (args.empty()) {
            if (auto prim = canonical_primitive(name)) {
                return make_primitive(*prim);
            }
            return make_user_defined(std::string(bare));
        }
        if (bare == "Nullable" && args.size() == 1) {
            return make_nullable(std::move(args[0]));
        }
        if (is_collection_container(bare) && args.size() == 1) {
            return make_collection(std::string(bare), std::move(args[0]));
        }
        return make_generic(std::string(bare), std::move(args));
    }
};

} // namespace

auto parse_type_ref(std::string_view text) -> std::optional<TypeRefPtr> {
    DescriptorParser parser(text);
    auto type = parser.parse();
    if (!type) {
        return std::nullopt;
    }
    return type;
}

// ============================================================================
// Equality and Printing
// ============================================================================

auto types_equal(const TypeRefPtr& a, const TypeRefPtr& b) -> bool {
    if (!a || !b) {
        return !a && !b;
    }
    if (a == b) {
        return true;
    }
    if (a->kind.index() != b->kind.index()) {
        return false;
    }

    return std::visit(
        [&b](const auto& a_kind) -> bool {
            using T = std::decay_t<decltype(a_kind)>;
            const auto& b_kind = std::get<T>(b->kind);

            if constexpr (std::is_same_v<T, PrimitiveType>) {
                return a_kind.name == b_kind.name;
            } else if constexpr (std::is_same_v<T, NullableType>) {
                return types_equal(a_kind.inner, b_kind.inner);
            } else if constexpr (std::is_same_v<T, CollectionType>) {
                return a_kind.container == b_kind.container &&
                       types_equal(a_kind.element, b_kind.element);
            } else if constexpr (std::is_same_v<T, UserDefinedType>) {
                return a_kind.name == b_kind.name;
            } else if constexpr (std::is_same_v<T, GenericType>) {
                if (a_kind.name != b_kind.name || a_kind.args.size() != b_kind.args.size()) {
                    return false;
                }
                for (size_t i = 0; i < a_kind.args.size(); ++i) {
                    if (!types_equal(a_kind.args[i], b_kind.args[i])) {
                        return false;
                    }
                }
                return true;
            } else {
                static_assert(always_false_v<T>, "unhandled TypeRef kind");
            }
        },
        a->kind);
}

auto type_to_string(const TypeRefPtr& type) -> std::string {
    if (!type) {
        return "<unresolved>";
    }

    return std::visit(
        [](const auto& kind) -> std::string {
            using T = std::decay_t<decltype(kind)>;

            if constexpr (std::is_same_v<T, PrimitiveType> || std::is_same_v<T, UserDefinedType>) {
                return kind.name;
            } else if constexpr (std::is_same_v<T, NullableType>) {
                return type_to_string(kind.inner) + "?";
            } else if constexpr (std::is_same_v<T, CollectionType>) {
                if (kind.container == "[]") {
                    return type_to_string(kind.element) + "[]";
                }
                return kind.container + "<" + type_to_string(kind.element) + ">";
            } else if constexpr (std::is_same_v<T, GenericType>) {
                std::string out = kind.name + "<";
                for (size_t i = 0; i < kind.args.size(); ++i) {
                    if (i > 0) {
                        out += ", ";
                    }
                    out += type_to_string(kind.args[i]);
                }
                return out + ">";
            } else {
                static_assert(always_false_v<T>, "unhandled TypeRef kind");
            }
        },
        type->kind);
}

// ============================================================================
// Queries
// ============================================================================

auto is_nullable(const TypeRefPtr& type) -> bool {
    return type && type->is<NullableType>();
}

auto strip_nullable(const TypeRefPtr& type) -> TypeRefPtr {
    if (is_nullable(type)) {
        return type->as<NullableType>().inner;
    }
    return type;
}

auto is_collection(const TypeRefPtr& type) -> bool {
    auto core = strip_nullable(type);
    return core && core->is<CollectionType>();
}

auto is_user_defined(const TypeRefPtr& type) -> bool {
    auto core = strip_nullable(type);
    return core && core->is<UserDefinedType>();
}

auto is_primitive(const TypeRefPtr& type, std::string_view name) -> bool {
    auto core = strip_nullable(type);
    return core && core->is<PrimitiveType>() && core->as<PrimitiveType>().name == name;
}

auto is_string_type(const TypeRefPtr& type) -> bool {
    return is_primitive(type, "string");
}

auto element_type(const TypeRefPtr& type) -> TypeRefPtr {
    auto core = strip_nullable(type);
    if (core && core->is<CollectionType>()) {
        return core->as<CollectionType>().element;
    }
    return nullptr;
}

auto numeric_rank(const TypeRefPtr& type) -> int {
    auto core = strip_nullable(type);
    if (!core || !core->is<PrimitiveType>()) {
        return 0;
    }
    static const std::unordered_map<std::string_view, int> ranks = {
        {"byte", 1},  {"sbyte", 1}, {"short", 2}, {"ushort", 2}, {"int", 3},
        {"uint", 3},  {"long", 4},  {"ulong", 4}, {"float", 5},  {"double", 6},
        {"decimal", 7},
    };
    auto it = ranks.find(core->as<PrimitiveType>().name);
    return it == ranks.end() ? 0 : it->second;
}

auto is_numeric(const TypeRefPtr& type) -> bool {
    return numeric_rank(type) > 0;
}

auto implicitly_widens(const TypeRefPtr& from, const TypeRefPtr& to) -> bool {
    if (types_equal(from, to)) {
        return true;
    }
    if (is_nullable(from) && !is_nullable(to)) {
        return false;
    }
    auto from_core = strip_nullable(from);
    auto to_core = strip_nullable(to);
    if (types_equal(from_core, to_core)) {
        return true;
    }
    int from_rank = numeric_rank(from_core);
    int to_rank = numeric_rank(to_core);
    return from_rank > 0 && to_rank > 0 && from_rank < to_rank;
}

} // namespace maplint::model
