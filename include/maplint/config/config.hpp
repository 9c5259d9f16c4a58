//! # Configuration
//!
//! Loads `maplint.toml`.
//!
//! ```toml
//! [lint]
//! fail-on = "error"              # error | warning | info | never
//! min-severity = "info"
//! check-missing-destination = true
//! check-duplicates = true
//!
//! [lint.rules]
//! AM050 = false                  # disable every rule sharing the code
//! MultipleEnumeration = "off"    # disable by name
//! AM005 = "error"                # override severity
//!
//! [lint.hazards]
//! data-access = ["DbSet", "DbContext", "Repository"]
//! http = ["HttpClient"]
//!
//! [fix]
//! max-iterations = 50
//! ```
//!
//! Unknown keys and malformed values are logged and ignored; only an
//! unreadable file or broken TOML syntax is an error.

#ifndef MAPLINT_CONFIG_CONFIG_HPP
#define MAPLINT_CONFIG_CONFIG_HPP

#include "maplint/analysis/analyzer.hpp"
#include "maplint/analysis/rules.hpp"
#include "maplint/common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace maplint::config {

/// Name of the file looked up in the working directory.
constexpr const char* CONFIG_FILE_NAME = "maplint.toml";

struct Settings {
    analysis::AnalyzerOptions analyzer;

    /// Lowest severity that makes `check` exit with 1; nullopt means never.
    std::optional<analysis::Severity> fail_on = analysis::Severity::Error;

    int max_fix_iterations = 50;
};

struct ConfigError {
    std::string message;
    std::string path;
    size_t line = 0;

    [[nodiscard]] auto to_string() const -> std::string;
};

/// Parses configuration text. `origin` names the file in messages.
[[nodiscard]] auto parse_config(std::string_view text, const std::string& origin = CONFIG_FILE_NAME)
    -> Result<Settings, ConfigError>;

/// Reads and parses a configuration file.
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<Settings, ConfigError>;

/// `dir/maplint.toml` when it exists.
[[nodiscard]] auto find_config(const std::filesystem::path& dir)
    -> std::optional<std::filesystem::path>;

} // namespace maplint::config

#endif // MAPLINT_CONFIG_CONFIG_HPP
