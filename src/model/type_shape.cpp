//! # Type Shapes
//!
//! Member construction and shape lookup.

#include "maplint/model/type_shape.hpp"

#include <cctype>

namespace maplint::model {

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

auto make_member(std::string name, std::string type_text, bool settable, bool required,
                 bool nullable) -> Member {
    Member member;
    member.name = std::move(name);
    member.settable = settable;
    member.required = required;

    if (auto parsed = parse_type_ref(type_text)) {
        member.type = *parsed;
        if (nullable && !is_nullable(member.type)) {
            member.type = make_nullable(member.type);
        }
        member.nullable = is_nullable(member.type);
    } else {
        member.nullable = nullable;
    }

    member.type_text = std::move(type_text);
    return member;
}

auto TypeShape::find_member(std::string_view member_name) const -> const Member* {
    for (const auto& member : members) {
        if (member.name == member_name) {
            return &member;
        }
    }
    return nullptr;
}

auto TypeShape::find_member_ignore_case(std::string_view member_name) const -> const Member* {
    for (const auto& member : members) {
        if (equals_ignore_case(member.name, member_name)) {
            return &member;
        }
    }
    return nullptr;
}

void ShapeTable::add(TypeShape shape) {
    auto it = index_.find(shape.name);
    if (it != index_.end()) {
        shapes_[it->second] = std::move(shape);
        return;
    }
    index_.emplace(shape.name, shapes_.size());
    shapes_.push_back(std::move(shape));
}

auto ShapeTable::find_index(std::string_view name) const -> std::optional<size_t> {
    auto it = index_.find(std::string(name));
    if (it != index_.end()) {
        return it->second;
    }

    auto last_segment = [](std::string_view n) {
        auto dot = n.rfind('.');
        return dot == std::string_view::npos ? n : n.substr(dot + 1);
    };

    std::optional<size_t> found;
    std::string_view wanted = last_segment(name);
    for (size_t i = 0; i < shapes_.size(); ++i) {
        if (last_segment(shapes_[i].name) == wanted) {
            if (found) {
                return std::nullopt; // ambiguous
            }
            found = i;
        }
    }
    return found;
}

auto ShapeTable::find(std::string_view name) const -> const TypeShape* {
    auto idx = find_index(name);
    return idx ? &shapes_[*idx] : nullptr;
}

auto ShapeTable::find_mut(std::string_view name) -> TypeShape* {
    auto idx = find_index(name);
    return idx ? &shapes_[*idx] : nullptr;
}

} // namespace maplint::model
