//! # Fix Command

#include "cli/commands/cmd_fix.hpp"

#include "cli/report.hpp"
#include "cli/terminal.hpp"
#include "cli/utils.hpp"
#include "maplint/analysis/analyzer.hpp"
#include "maplint/log/log.hpp"
#include "maplint/model/edit.hpp"
#include "maplint/model/snapshot.hpp"

#include <charconv>
#include <iostream>

namespace maplint::cli {

static void print_fix_usage() {
    std::cerr << "Usage: maplint fix <snapshot.json> [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --rule=<name|code>     Only fix findings of this rule (repeatable)\n";
    std::cerr << "  --alternative=<n>      Apply the n-th alternative (default 1)\n";
    std::cerr << "  --output=<path>        Write the fixed snapshot here (default stdout)\n";
    std::cerr << "  --max-iterations=<n>   Stop after n analysis passes\n";
    std::cerr << "  --config=<path>        Configuration file\n";
}

static std::optional<int> parse_positive(const std::string& text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 1) {
        return std::nullopt;
    }
    return value;
}

static std::vector<std::string> known_rule_names() {
    std::vector<std::string> names;
    for (const auto& info : analysis::all_rules()) {
        names.emplace_back(info.name);
        names.emplace_back(info.code);
    }
    return names;
}

std::optional<FixOptions> parse_fix_args(const std::vector<std::string>& args) {
    FixOptions options;
    for (const auto& arg : args) {
        if (auto rule = option_value(arg, "--rule=")) {
            auto matched = analysis::rules_matching(*rule);
            if (matched.empty()) {
                std::cerr << "error: unknown rule '" << *rule << "'\n";
                auto similar = find_similar_candidates(*rule, known_rule_names(), 3, 3);
                if (!similar.empty()) {
                    std::cerr << "Did you mean:";
                    for (const auto& s : similar) {
                        std::cerr << " " << s;
                    }
                    std::cerr << "\n";
                }
                return std::nullopt;
            }
            options.rules.insert(matched.begin(), matched.end());
        } else if (auto alt = option_value(arg, "--alternative=")) {
            auto n = parse_positive(*alt);
            if (!n) {
                std::cerr << "error: --alternative expects a positive integer\n";
                return std::nullopt;
            }
            options.alternative = static_cast<size_t>(*n);
        } else if (auto limit = option_value(arg, "--max-iterations=")) {
            auto n = parse_positive(*limit);
            if (!n) {
                std::cerr << "error: --max-iterations expects a positive integer\n";
                return std::nullopt;
            }
            options.max_iterations = *n;
        } else if (auto output = option_value(arg, "--output=")) {
            options.output_path = *output;
        } else if (auto path = option_value(arg, "--config=")) {
            options.config_path = *path;
        } else if (arg.starts_with("-")) {
            std::cerr << "error: unknown option '" << arg << "'\n";
            print_fix_usage();
            return std::nullopt;
        } else if (options.snapshot_path.empty()) {
            options.snapshot_path = arg;
        } else {
            std::cerr << "error: unexpected argument '" << arg << "'\n";
            return std::nullopt;
        }
    }

    if (options.snapshot_path.empty()) {
        print_fix_usage();
        return std::nullopt;
    }
    return options;
}

namespace {

/// Identity of a finding across passes. Declarations are never added or
/// removed by edits, so indices stay stable.
auto attempt_key(const analysis::Diagnostic& diag) -> std::string {
    return std::to_string(diag.unit_index) + "/" + std::to_string(diag.declaration_index) + "/" +
           diag.member + "/" + analysis::rule_name(diag.rule);
}

} // namespace

FixOutcome fix_snapshot(model::Snapshot& snapshot, const config::Settings& settings,
                        const FixOptions& options) {
    FixOutcome outcome;
    std::set<std::string> attempted;
    int limit = options.max_iterations.value_or(settings.max_fix_iterations);

    analysis::Analyzer analyzer(snapshot.shapes, settings.analyzer);
    auto diagnostics = analyzer.analyze_all(snapshot.units);

    while (true) {
        if (outcome.iterations >= limit) {
            outcome.hit_limit = true;
            MAPLINT_LOG_WARN("fix", "Stopped after " << limit << " iteration(s)");
            break;
        }
        ++outcome.iterations;

        bool changed = false;
        for (const auto& diag : diagnostics) {
            if (!options.rules.empty() && !options.rules.contains(diag.rule)) {
                continue;
            }
            auto key = attempt_key(diag);
            if (!attempted.insert(key).second) {
                continue;
            }

            auto fixes = fixes_for(diag, snapshot, settings.analyzer.patterns);
            if (fixes.empty()) {
                continue;
            }
            if (options.alternative > fixes.size()) {
                MAPLINT_LOG_DEBUG("fix", diag.code << " on " << diag.member << " has only "
                                                   << fixes.size() << " alternative(s)");
                continue;
            }

            const auto& edit = fixes[options.alternative - 1];
            auto result =
                model::apply_edit(snapshot.units[diag.unit_index], snapshot.shapes, edit);
            if (is_err(result)) {
                ++outcome.failed;
                MAPLINT_LOG_WARN("fix", "Could not apply '" << edit.title
                                                            << "': " << unwrap_err(result).message);
                continue;
            }
            if (!unwrap(result)) {
                continue;
            }

            ++outcome.applied;
            if (edit.is_comment_only()) {
                ++outcome.comment_only;
            }
            MAPLINT_LOG_INFO("fix", diag.location.to_string()
                                        << ": " << edit.title << " [" << diag.code << "]");
            changed = true;
            break;
        }

        if (!changed) {
            break;
        }
        diagnostics = analyzer.analyze_all(snapshot.units);
    }

    outcome.remaining = diagnostics.size();
    return outcome;
}

int run_fix(const std::vector<std::string>& args) {
    auto options = parse_fix_args(args);
    if (!options) {
        return EXIT_USAGE;
    }

    auto settings_result = resolve_settings(options->config_path);
    if (is_err(settings_result)) {
        std::cerr << "error: " << unwrap_err(settings_result).to_string() << "\n";
        return EXIT_USAGE;
    }

    auto snapshot_result = model::load_snapshot_file(options->snapshot_path);
    if (is_err(snapshot_result)) {
        std::cerr << "error: " << unwrap_err(snapshot_result).to_string() << "\n";
        return EXIT_USAGE;
    }
    auto& snapshot = unwrap(snapshot_result);

    auto outcome = fix_snapshot(snapshot, unwrap(settings_result), *options);

    if (options->output_path) {
        auto saved = model::save_snapshot_file(snapshot, *options->output_path);
        if (is_err(saved)) {
            std::cerr << "error: " << unwrap_err(saved).to_string() << "\n";
            return EXIT_USAGE;
        }
    } else {
        std::cout << model::snapshot_to_json(snapshot).to_string_pretty() << "\n";
    }

    std::cerr << "Applied " << outcome.applied << " fix(es)";
    if (outcome.comment_only > 0) {
        std::cerr << " (" << outcome.comment_only << " comment-only)";
    }
    std::cerr << "; " << outcome.remaining << " finding(s) remain\n";
    return EXIT_OK;
}

} // namespace maplint::cli
