//! # CLI Utilities

#include "cli/utils.hpp"

#include "maplint/log/log.hpp"

#include <filesystem>
#include <iostream>

namespace maplint::cli {

std::optional<std::string> option_value(std::string_view arg, std::string_view prefix) {
    if (!arg.starts_with(prefix)) {
        return std::nullopt;
    }
    return std::string(arg.substr(prefix.size()));
}

Result<config::Settings, config::ConfigError>
resolve_settings(const std::optional<std::string>& explicit_path) {
    if (explicit_path) {
        return config::load_config(*explicit_path);
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        MAPLINT_LOG_DEBUG("config", "No working directory: " << ec.message());
        return config::Settings{};
    }
    if (auto found = config::find_config(cwd)) {
        return config::load_config(*found);
    }
    return config::Settings{};
}

void print_usage() {
    std::cout << "maplint " << VERSION << "\n\n";
    std::cout << "Usage: maplint <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  check <snapshot.json>   Report mapping findings\n";
    std::cout << "  fix <snapshot.json>     Apply fixes and write the edited snapshot\n";
    std::cout << "  explain <code>          Explain a rule code (e.g. AM001)\n";
    std::cout << "  rules                   List all rules\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h              Show this help\n";
    std::cout << "  --version, -V           Show version\n";
    std::cout << "  --config=<path>         Use this maplint.toml\n";
    std::cout << "  -v, -vv, -vvv           Increase log verbosity\n";
    std::cout << "  -q                      Only log errors\n";
    std::cout << "  --log-level=<level>     trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>     Per-module levels, e.g. classify=trace,*=warn\n";
    std::cout << "  --log-file=<path>       Also write logs to a file\n";
    std::cout << "  --log-format=<fmt>      text or json\n";
}

void print_version() {
    std::cout << "maplint " << VERSION << "\n";
}

} // namespace maplint::cli
