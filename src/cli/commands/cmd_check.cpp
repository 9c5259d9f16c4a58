//! # Check Command
//!
//! Loads configuration and the snapshot, analyzes every unit and prints the
//! sorted findings.

#include "cli/commands/cmd_check.hpp"

#include "cli/report.hpp"
#include "cli/terminal.hpp"
#include "cli/utils.hpp"
#include "maplint/analysis/analyzer.hpp"
#include "maplint/log/log.hpp"
#include "maplint/model/snapshot.hpp"

#include <algorithm>
#include <iostream>

namespace maplint::cli {

static void print_check_usage() {
    std::cerr << "Usage: maplint check <snapshot.json> [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --format=text|json  Report format (default text)\n";
    std::cerr << "  --config=<path>     Configuration file\n";
    std::cerr << "  --fixes             List fix alternatives for each finding\n";
    std::cerr << "  --quiet             Print nothing; only set the exit code\n";
}

std::optional<CheckOptions> parse_check_args(const std::vector<std::string>& args) {
    CheckOptions options;
    for (const auto& arg : args) {
        if (auto format = option_value(arg, "--format=")) {
            if (*format == "text") {
                options.format = ReportFormat::Text;
            } else if (*format == "json") {
                options.format = ReportFormat::Json;
            } else {
                std::cerr << "error: unknown format '" << *format << "' (expected text or json)\n";
                return std::nullopt;
            }
        } else if (auto path = option_value(arg, "--config=")) {
            options.config_path = *path;
        } else if (arg == "--fixes") {
            options.with_fixes = true;
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (arg.starts_with("-")) {
            std::cerr << "error: unknown option '" << arg << "'\n";
            print_check_usage();
            return std::nullopt;
        } else if (options.snapshot_path.empty()) {
            options.snapshot_path = arg;
        } else {
            std::cerr << "error: unexpected argument '" << arg << "'\n";
            return std::nullopt;
        }
    }

    if (options.snapshot_path.empty()) {
        print_check_usage();
        return std::nullopt;
    }
    return options;
}

int exit_code_for(const std::vector<analysis::Diagnostic>& diagnostics,
                  std::optional<analysis::Severity> fail_on) {
    if (!fail_on) {
        return EXIT_OK;
    }
    bool failed = std::any_of(diagnostics.begin(), diagnostics.end(),
                              [&](const auto& diag) { return diag.severity >= *fail_on; });
    return failed ? EXIT_FINDINGS : EXIT_OK;
}

int run_check(const std::vector<std::string>& args) {
    auto options = parse_check_args(args);
    if (!options) {
        return EXIT_USAGE;
    }

    auto settings_result = resolve_settings(options->config_path);
    if (is_err(settings_result)) {
        std::cerr << "error: " << unwrap_err(settings_result).to_string() << "\n";
        return EXIT_USAGE;
    }
    const auto& settings = unwrap(settings_result);

    auto snapshot_result = model::load_snapshot_file(options->snapshot_path);
    if (is_err(snapshot_result)) {
        std::cerr << "error: " << unwrap_err(snapshot_result).to_string() << "\n";
        return EXIT_USAGE;
    }
    const auto& snapshot = unwrap(snapshot_result);

    analysis::Analyzer analyzer(snapshot.shapes, settings.analyzer);
    auto diagnostics = analyzer.analyze_all(snapshot.units);
    MAPLINT_LOG_INFO("check", "Analyzed " << snapshot.units.size() << " unit(s), "
                                          << diagnostics.size() << " finding(s)");

    if (!options->quiet) {
        if (options->format == ReportFormat::Json) {
            std::cout << report_to_json(diagnostics, snapshot, options->with_fixes,
                                     settings.analyzer.patterns)
                             .to_string_pretty()
                      << "\n";
        } else {
            ReportOptions report;
            report.with_fixes = options->with_fixes;
            report.colors = terminal_supports_colors();
            report.patterns = settings.analyzer.patterns;
            write_text_report(std::cout, diagnostics, snapshot, report);
        }
    }

    return exit_code_for(diagnostics, settings.fail_on);
}

} // namespace maplint::cli
