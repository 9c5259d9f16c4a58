//! # CLI Utilities Interface
//!
//! | Function             | Description                                  |
//! |----------------------|----------------------------------------------|
//! | `option_value()`     | Value of a `--name=value` argument           |
//! | `resolve_settings()` | `--config=` file, else `./maplint.toml`      |
//! | `print_usage()`      | Print CLI help text                          |
//! | `print_version()`    | Print maplint version                        |

#pragma once
#include "maplint/common.hpp"
#include "maplint/config/config.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace maplint::cli {

/// Exit codes shared by all commands.
constexpr int EXIT_OK = 0;
constexpr int EXIT_FINDINGS = 1;
constexpr int EXIT_USAGE = 2;

/// Returns the text after `prefix` when `arg` starts with it.
std::optional<std::string> option_value(std::string_view arg, std::string_view prefix);

/// Loads `explicit_path` when given, otherwise `maplint.toml` from the working
/// directory when present, otherwise defaults.
Result<config::Settings, config::ConfigError>
resolve_settings(const std::optional<std::string>& explicit_path);

void print_usage();
void print_version();

} // namespace maplint::cli
