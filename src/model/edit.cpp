#include "maplint/model/edit.hpp"

#include <algorithm>
#include <type_traits>

namespace maplint::model {

auto Edit::is_comment_only() const -> bool {
    return !operations.empty() &&
           std::all_of(operations.begin(), operations.end(), [](const EditOperation& op) {
               return std::holds_alternative<InsertComment>(op);
           });
}

auto find_anchor(AnalysisUnit& unit, const EditAnchor& anchor) -> MappingDeclaration* {
    auto matches = [&](const MappingDeclaration& decl) {
        return decl.source_type == anchor.source_type && decl.dest_type == anchor.dest_type;
    };
    if (anchor.declaration_index < unit.declarations.size() &&
        matches(unit.declarations[anchor.declaration_index])) {
        return &unit.declarations[anchor.declaration_index];
    }
    for (auto& decl : unit.declarations) {
        if (matches(decl)) {
            return &decl;
        }
    }
    return nullptr;
}

namespace {

auto effective_config(MappingDeclaration& decl, const std::string& member) -> MemberConfig* {
    for (auto it = decl.member_configs.rbegin(); it != decl.member_configs.rend(); ++it) {
        if (it->dest_member == member) {
            return &*it;
        }
    }
    return nullptr;
}

/// Checks that every operation can be applied, so nothing is half-applied.
auto validate(MappingDeclaration& decl, ShapeTable& shapes, const Edit& edit)
    -> std::optional<EditError> {
    for (const auto& op : edit.operations) {
        if (const auto* rewrite = std::get_if<RewriteExpression>(&op)) {
            auto* config = effective_config(decl, rewrite->dest_member);
            if (!config || config->kind != ConfigKind::MapFrom) {
                return EditError{"no MapFrom configured for '" + rewrite->dest_member + "'"};
            }
        } else if (const auto* insert = std::get_if<InsertSourceMember>(&op)) {
            if (!shapes.find(insert->type_name)) {
                return EditError{"unknown type '" + insert->type_name + "'"};
            }
        }
    }
    return std::nullopt;
}

} // namespace

auto apply_edit(AnalysisUnit& unit, ShapeTable& shapes, const Edit& edit)
    -> Result<bool, EditError> {
    auto* decl = find_anchor(unit, edit.anchor);
    if (!decl) {
        return EditError{"no declaration " + edit.anchor.source_type + " -> " +
                         edit.anchor.dest_type + " in unit '" + unit.name + "'"};
    }
    if (auto error = validate(*decl, shapes, edit)) {
        return *error;
    }

    bool changed = false;
    for (const auto& op : edit.operations) {
        std::visit(
            [&](const auto& o) {
                using T = std::decay_t<decltype(o)>;

                if constexpr (std::is_same_v<T, AppendMemberConfig>) {
                    const auto* current = effective_config(*decl, o.config.dest_member);
                    if (!current || !(*current == o.config)) {
                        decl->member_configs.push_back(o.config);
                        changed = true;
                    }
                } else if constexpr (std::is_same_v<T, RemoveMemberConfig>) {
                    auto& configs = decl->member_configs;
                    auto removed = std::remove_if(configs.begin(), configs.end(),
                                                  [&](const MemberConfig& c) {
                                                      return c.dest_member == o.dest_member;
                                                  });
                    if (removed != configs.end()) {
                        configs.erase(removed, configs.end());
                        changed = true;
                    }
                } else if constexpr (std::is_same_v<T, RewriteExpression>) {
                    auto* config = effective_config(*decl, o.dest_member);
                    if (config->text != o.text) {
                        config->text = o.text;
                        changed = true;
                    }
                } else if constexpr (std::is_same_v<T, InsertComment>) {
                    for (const auto& line : o.lines) {
                        if (std::find(decl->comments.begin(), decl->comments.end(), line) ==
                            decl->comments.end()) {
                            decl->comments.push_back(line);
                            changed = true;
                        }
                    }
                } else if constexpr (std::is_same_v<T, InsertSourceMember>) {
                    auto* shape = shapes.find_mut(o.type_name);
                    if (!shape->find_member(o.member_name)) {
                        auto member = make_member(o.member_name, o.type_text);
                        member.note = o.note;
                        shape->members.push_back(std::move(member));
                        changed = true;
                    }
                } else if constexpr (std::is_same_v<T, SetMaxDepth>) {
                    if (decl->max_depth != o.depth) {
                        decl->max_depth = o.depth;
                        changed = true;
                    }
                } else {
                    static_assert(always_false_v<T>, "unhandled edit operation");
                }
            },
            op);
    }
    return changed;
}

auto describe_operation(const EditOperation& op) -> std::string {
    return std::visit(
        [](const auto& o) -> std::string {
            using T = std::decay_t<decltype(o)>;

            if constexpr (std::is_same_v<T, AppendMemberConfig>) {
                std::string text = "ForMember(" + o.config.dest_member + ", ";
                switch (o.config.kind) {
                case ConfigKind::MapFrom:
                    return text + "MapFrom(" + o.config.text + "))";
                case ConfigKind::Ignore:
                    return text + "Ignore())";
                case ConfigKind::Condition:
                    return text + "Condition(" + o.config.text + "))";
                case ConfigKind::Constant:
                    return text + "MapFrom(_ => " + o.config.text + "))";
                }
                return text + ")";
            } else if constexpr (std::is_same_v<T, RemoveMemberConfig>) {
                return "remove ForMember(" + o.dest_member + ")";
            } else if constexpr (std::is_same_v<T, RewriteExpression>) {
                return "rewrite " + o.dest_member + ": " + o.text;
            } else if constexpr (std::is_same_v<T, InsertComment>) {
                std::string text = "comment";
                for (const auto& line : o.lines) {
                    text += " // " + line;
                }
                return text;
            } else if constexpr (std::is_same_v<T, InsertSourceMember>) {
                return "add " + o.type_text + " " + o.type_name + "." + o.member_name +
                       (o.note.empty() ? "" : " // " + o.note);
            } else if constexpr (std::is_same_v<T, SetMaxDepth>) {
                return "MaxDepth(" + std::to_string(o.depth) + ")";
            } else {
                static_assert(always_false_v<T>, "unhandled edit operation");
            }
        },
        op);
}

} // namespace maplint::model
