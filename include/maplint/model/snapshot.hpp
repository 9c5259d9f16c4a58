//! # Snapshot Files
//!
//! JSON encoding of the shapes and declarations handed over by the shape
//! extractor and declaration collector.
//!
//! ```json
//! {
//!   "types": [{"name": "Source", "members": [
//!       {"name": "Name", "type": "string?", "settable": true, "required": false}]}],
//!   "units": [{"name": "UserProfile", "declarations": [
//!       {"source": "Source", "destination": "Destination", "reverse_map": false,
//!        "custom_construction": false,
//!        "location": {"file": "Profiles/UserProfile.cs", "line": 12, "column": 9},
//!        "captures": {"_context": "AppDbContext"},
//!        "ignored_source_members": ["Secret"],
//!        "members": [{"destination": "Name", "kind": "map_from",
//!                     "expression": "src => src.Name"}],
//!        "comments": []}]}]
//! }
//! ```
//!
//! Optional fields default to false/empty. Unknown member kinds, missing
//! required fields and wrongly typed values are errors.

#ifndef MAPLINT_MODEL_SNAPSHOT_HPP
#define MAPLINT_MODEL_SNAPSHOT_HPP

#include "maplint/common.hpp"
#include "maplint/json/json_value.hpp"
#include "maplint/model/declaration.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace maplint::model {

struct SnapshotError {
    std::string message;
    std::string path; ///< File, or "<input>" for in-memory text

    [[nodiscard]] auto to_string() const -> std::string {
        return path + ": " + message;
    }
};

/// Decodes snapshot JSON text.
[[nodiscard]] auto load_snapshot(std::string_view text, const std::string& origin = "<input>")
    -> Result<Snapshot, SnapshotError>;

[[nodiscard]] auto load_snapshot_file(const std::filesystem::path& path)
    -> Result<Snapshot, SnapshotError>;

/// Encodes a snapshot back into the input format.
[[nodiscard]] auto snapshot_to_json(const Snapshot& snapshot) -> json::JsonValue;

/// Writes pretty-printed JSON to `path`.
[[nodiscard]] auto save_snapshot_file(const Snapshot& snapshot, const std::filesystem::path& path)
    -> Result<bool, SnapshotError>;

} // namespace maplint::model

#endif // MAPLINT_MODEL_SNAPSHOT_HPP
