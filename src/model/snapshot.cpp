#include "maplint/model/snapshot.hpp"

#include "maplint/json/json_parser.hpp"
#include "maplint/log/log.hpp"

#include <fstream>
#include <limits>
#include <sstream>

namespace maplint::model {

namespace {

/// Walks the decoded JSON, recording the first error with its JSON path.
class SnapshotDecoder {
public:
    auto decode(const json::JsonValue& root, Snapshot& out) -> bool {
        if (!root.is_object()) {
            return fail("$", "snapshot must be a JSON object");
        }
        if (const auto* types = root.get("types")) {
            if (!types->is_array()) {
                return fail("types", "expected an array");
            }
            for (size_t i = 0; i < types->as_array().size(); ++i) {
                TypeShape shape;
                if (!decode_shape(types->as_array()[i], "types[" + std::to_string(i) + "]",
                                  shape)) {
                    return false;
                }
                out.shapes.add(std::move(shape));
            }
        }
        if (const auto* units = root.get("units")) {
            if (!units->is_array()) {
                return fail("units", "expected an array");
            }
            for (size_t i = 0; i < units->as_array().size(); ++i) {
                AnalysisUnit unit;
                if (!decode_unit(units->as_array()[i], "units[" + std::to_string(i) + "]", unit)) {
                    return false;
                }
                out.units.push_back(std::move(unit));
            }
        }
        return true;
    }

    [[nodiscard]] auto error() const -> const std::string& {
        return error_;
    }

private:
    std::string error_;

    auto fail(const std::string& where, const std::string& message) -> bool {
        error_ = where + ": " + message;
        return false;
    }

    auto read_string(const json::JsonValue& obj, const std::string& key, const std::string& where,
                     std::string& out, bool required) -> bool {
        const auto* value = obj.get(key);
        if (!value) {
            return required ? fail(where, "missing \"" + key + "\"") : true;
        }
        if (!value->is_string()) {
            return fail(where + "." + key, "expected a string");
        }
        out = value->as_string();
        return true;
    }

    auto read_bool(const json::JsonValue& obj, const std::string& key, const std::string& where,
                   bool& out) -> bool {
        const auto* value = obj.get(key);
        if (!value) {
            return true;
        }
        if (!value->is_bool()) {
            return fail(where + "." + key, "expected true or false");
        }
        out = value->as_bool();
        return true;
    }

    auto read_u32(const json::JsonValue& obj, const std::string& key, const std::string& where,
                  uint32_t& out) -> bool {
        const auto* value = obj.get(key);
        if (!value) {
            return true;
        }
        std::optional<int64_t> number;
        if (value->is_number()) {
            number = value->as_number().try_as_i64();
        }
        if (!number || *number < 0 || *number > std::numeric_limits<uint32_t>::max()) {
            return fail(where + "." + key, "expected a non-negative integer");
        }
        out = static_cast<uint32_t>(*number);
        return true;
    }

    auto read_string_array(const json::JsonValue& obj, const std::string& key,
                           const std::string& where, std::vector<std::string>& out) -> bool {
        const auto* value = obj.get(key);
        if (!value) {
            return true;
        }
        if (!value->is_array()) {
            return fail(where + "." + key, "expected an array of strings");
        }
        for (const auto& item : value->as_array()) {
            if (!item.is_string()) {
                return fail(where + "." + key, "expected an array of strings");
            }
            out.push_back(item.as_string());
        }
        return true;
    }

    auto decode_shape(const json::JsonValue& value, const std::string& where, TypeShape& shape)
        -> bool {
        if (!value.is_object()) {
            return fail(where, "expected an object");
        }
        if (!read_string(value, "name", where, shape.name, true)) {
            return false;
        }
        const auto* members = value.get("members");
        if (!members) {
            return true;
        }
        if (!members->is_array()) {
            return fail(where + ".members", "expected an array");
        }
        for (size_t i = 0; i < members->as_array().size(); ++i) {
            const auto& m = members->as_array()[i];
            auto at = where + ".members[" + std::to_string(i) + "]";
            if (!m.is_object()) {
                return fail(at, "expected an object");
            }
            std::string name;
            std::string type;
            std::string note;
            bool settable = true;
            bool required = false;
            bool nullable = false;
            if (!read_string(m, "name", at, name, true) || !read_string(m, "type", at, type, true) ||
                !read_bool(m, "settable", at, settable) || !read_bool(m, "required", at, required) ||
                !read_bool(m, "nullable", at, nullable) ||
                !read_string(m, "note", at, note, false)) {
                return false;
            }
            auto member = make_member(name, type, settable, required, nullable);
            if (!member.is_resolved()) {
                MAPLINT_LOG_DEBUG("snapshot", shape.name << "." << name
                                                         << ": unresolvable type '" << type << "'");
            }
            member.note = std::move(note);
            shape.members.push_back(std::move(member));
        }
        return true;
    }

    auto decode_unit(const json::JsonValue& value, const std::string& where, AnalysisUnit& unit)
        -> bool {
        if (!value.is_object()) {
            return fail(where, "expected an object");
        }
        if (!read_string(value, "name", where, unit.name, false)) {
            return false;
        }
        const auto* decls = value.get("declarations");
        if (!decls) {
            return true;
        }
        if (!decls->is_array()) {
            return fail(where + ".declarations", "expected an array");
        }
        for (size_t i = 0; i < decls->as_array().size(); ++i) {
            MappingDeclaration decl;
            if (!decode_declaration(decls->as_array()[i],
                                    where + ".declarations[" + std::to_string(i) + "]", decl)) {
                return false;
            }
            unit.declarations.push_back(std::move(decl));
        }
        return true;
    }

    auto decode_declaration(const json::JsonValue& value, const std::string& where,
                            MappingDeclaration& decl) -> bool {
        if (!value.is_object()) {
            return fail(where, "expected an object");
        }
        if (!read_string(value, "source", where, decl.source_type, true) ||
            !read_string(value, "destination", where, decl.dest_type, true) ||
            !read_bool(value, "reverse_map", where, decl.has_reverse_map) ||
            !read_bool(value, "custom_construction", where, decl.has_custom_construction) ||
            !read_string_array(value, "ignored_source_members", where,
                               decl.ignored_source_members) ||
            !read_string_array(value, "comments", where, decl.comments)) {
            return false;
        }

        if (value.get("max_depth")) {
            uint32_t depth = 0;
            if (!read_u32(value, "max_depth", where, depth)) {
                return false;
            }
            decl.max_depth = depth;
        }

        if (const auto* loc = value.get("location")) {
            auto at = where + ".location";
            if (!loc->is_object()) {
                return fail(at, "expected an object");
            }
            if (!read_string(*loc, "file", at, decl.location.file, false) ||
                !read_u32(*loc, "line", at, decl.location.line) ||
                !read_u32(*loc, "column", at, decl.location.column)) {
                return false;
            }
        }

        if (const auto* captures = value.get("captures")) {
            if (!captures->is_object()) {
                return fail(where + ".captures", "expected an object");
            }
            for (const auto& [name, type] : captures->as_object()) {
                if (!type.is_string()) {
                    return fail(where + ".captures." + name, "expected a type name");
                }
                decl.captures[name] = type.as_string();
            }
        }

        const auto* members = value.get("members");
        if (!members) {
            return true;
        }
        if (!members->is_array()) {
            return fail(where + ".members", "expected an array");
        }
        for (size_t i = 0; i < members->as_array().size(); ++i) {
            const auto& m = members->as_array()[i];
            auto at = where + ".members[" + std::to_string(i) + "]";
            if (!m.is_object()) {
                return fail(at, "expected an object");
            }
            MemberConfig config;
            std::string kind_name = "map_from";
            if (!read_string(m, "destination", at, config.dest_member, true) ||
                !read_string(m, "kind", at, kind_name, false)) {
                return false;
            }
            auto kind = parse_config_kind(kind_name);
            if (!kind) {
                return fail(at + ".kind", "unknown member kind '" + kind_name + "'");
            }
            config.kind = *kind;
            switch (config.kind) {
            case ConfigKind::MapFrom:
            case ConfigKind::Condition:
                if (!read_string(m, "expression", at, config.text, true)) {
                    return false;
                }
                break;
            case ConfigKind::Constant:
                if (!read_string(m, "value", at, config.text, true)) {
                    return false;
                }
                break;
            case ConfigKind::Ignore:
                break;
            }
            decl.member_configs.push_back(std::move(config));
        }
        return true;
    }
};

auto string_array(const std::vector<std::string>& items) -> json::JsonValue {
    auto array = json::json_array();
    for (const auto& item : items) {
        array.push(json::json_string(item));
    }
    return array;
}

} // namespace

auto load_snapshot(std::string_view text, const std::string& origin)
    -> Result<Snapshot, SnapshotError> {
    auto parsed = json::parse_json(text);
    if (is_err(parsed)) {
        return SnapshotError{unwrap_err(parsed).to_string(), origin};
    }

    Snapshot snapshot;
    SnapshotDecoder decoder;
    if (!decoder.decode(unwrap(parsed), snapshot)) {
        return SnapshotError{decoder.error(), origin};
    }
    MAPLINT_LOG_DEBUG("snapshot", origin << ": " << snapshot.shapes.size() << " types, "
                                         << snapshot.units.size() << " units");
    return snapshot;
}

auto load_snapshot_file(const std::filesystem::path& path) -> Result<Snapshot, SnapshotError> {
    std::ifstream file(path);
    if (!file) {
        return SnapshotError{"cannot open file", path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_snapshot(buffer.str(), path.string());
}

auto snapshot_to_json(const Snapshot& snapshot) -> json::JsonValue {
    auto root = json::json_object();

    auto types = json::json_array();
    for (const auto& shape : snapshot.shapes.shapes()) {
        auto type = json::json_object();
        type.set("name", json::json_string(shape.name));
        auto members = json::json_array();
        for (const auto& member : shape.members) {
            auto m = json::json_object();
            m.set("name", json::json_string(member.name));
            m.set("type", json::json_string(member.type_text));
            m.set("settable", json::json_bool(member.settable));
            m.set("required", json::json_bool(member.required));
            m.set("nullable", json::json_bool(member.nullable));
            if (!member.note.empty()) {
                m.set("note", json::json_string(member.note));
            }
            members.push(std::move(m));
        }
        type.set("members", std::move(members));
        types.push(std::move(type));
    }
    root.set("types", std::move(types));

    auto units = json::json_array();
    for (const auto& unit : snapshot.units) {
        auto u = json::json_object();
        u.set("name", json::json_string(unit.name));
        auto decls = json::json_array();
        for (const auto& decl : unit.declarations) {
            auto d = json::json_object();
            d.set("source", json::json_string(decl.source_type));
            d.set("destination", json::json_string(decl.dest_type));
            d.set("reverse_map", json::json_bool(decl.has_reverse_map));
            d.set("custom_construction", json::json_bool(decl.has_custom_construction));
            if (decl.max_depth) {
                d.set("max_depth", json::json_int(*decl.max_depth));
            }

            auto location = json::json_object();
            location.set("file", json::json_string(decl.location.file));
            location.set("line", json::json_int(decl.location.line));
            location.set("column", json::json_int(decl.location.column));
            d.set("location", std::move(location));

            auto captures = json::json_object();
            for (const auto& [name, type] : decl.captures) {
                captures.set(name, json::json_string(type));
            }
            d.set("captures", std::move(captures));
            d.set("ignored_source_members", string_array(decl.ignored_source_members));

            auto members = json::json_array();
            for (const auto& config : decl.member_configs) {
                auto m = json::json_object();
                m.set("destination", json::json_string(config.dest_member));
                m.set("kind", json::json_string(config_kind_name(config.kind)));
                if (config.kind == ConfigKind::Constant) {
                    m.set("value", json::json_string(config.text));
                } else if (config.kind != ConfigKind::Ignore) {
                    m.set("expression", json::json_string(config.text));
                }
                members.push(std::move(m));
            }
            d.set("members", std::move(members));
            d.set("comments", string_array(decl.comments));
            decls.push(std::move(d));
        }
        u.set("declarations", std::move(decls));
        units.push(std::move(u));
    }
    root.set("units", std::move(units));
    return root;
}

auto save_snapshot_file(const Snapshot& snapshot, const std::filesystem::path& path)
    -> Result<bool, SnapshotError> {
    std::ofstream file(path);
    if (!file) {
        return SnapshotError{"cannot write file", path.string()};
    }
    file << snapshot_to_json(snapshot).to_string_pretty() << "\n";
    if (!file) {
        return SnapshotError{"write failed", path.string()};
    }
    return true;
}

} // namespace maplint::model
