//! # Finding Reports

#include "cli/report.hpp"

#include "cli/terminal.hpp"
#include "maplint/common.hpp"
#include "maplint/fix/synthesizer.hpp"

#include <array>
#include <string>
#include <utility>

namespace maplint::cli {

namespace {

struct Counts {
    size_t errors = 0;
    size_t warnings = 0;
    size_t infos = 0;
};

auto count(const std::vector<analysis::Diagnostic>& diagnostics) -> Counts {
    Counts counts;
    for (const auto& diag : diagnostics) {
        switch (diag.severity) {
        case analysis::Severity::Error:
            ++counts.errors;
            break;
        case analysis::Severity::Warning:
            ++counts.warnings;
            break;
        case analysis::Severity::Info:
            ++counts.infos;
            break;
        }
    }
    return counts;
}

auto severity_color(analysis::Severity severity) -> const char* {
    switch (severity) {
    case analysis::Severity::Error:
        return Colors::BrightRed;
    case analysis::Severity::Warning:
        return Colors::BrightYellow;
    case analysis::Severity::Info:
        return Colors::BrightCyan;
    }
    return Colors::Reset;
}

auto plural(size_t n, const char* word) -> std::string {
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

auto location_json(const model::SourceLocation& location) -> json::JsonValue {
    auto obj = json::json_object();
    obj.set("file", json::json_string(location.file));
    obj.set("line", json::json_int(location.line));
    obj.set("column", json::json_int(location.column));
    return obj;
}

auto edit_json(const model::Edit& edit) -> json::JsonValue {
    auto obj = json::json_object();
    obj.set("title", json::json_string(edit.title));
    obj.set("comment_only", json::json_bool(edit.is_comment_only()));
    auto ops = json::json_array();
    for (const auto& op : edit.operations) {
        ops.push(json::json_string(model::describe_operation(op)));
    }
    obj.set("operations", std::move(ops));
    return obj;
}

} // namespace

auto fixes_for(const analysis::Diagnostic& diag, const model::Snapshot& snapshot,
               const expr::HazardPatterns& patterns) -> std::vector<model::Edit> {
    if (diag.unit_index >= snapshot.units.size()) {
        return {};
    }
    const auto& unit = snapshot.units[diag.unit_index];
    if (diag.declaration_index >= unit.declarations.size()) {
        return {};
    }
    return fix::synthesize_fixes(diag, unit.declarations[diag.declaration_index], snapshot.shapes,
                                 patterns);
}

void write_text_report(std::ostream& out, const std::vector<analysis::Diagnostic>& diagnostics,
                       const model::Snapshot& snapshot, const ReportOptions& options) {
    const char* reset = options.colors ? Colors::Reset : "";
    const char* bold = options.colors ? Colors::Bold : "";
    const char* dim = options.colors ? Colors::Dim : "";

    for (const auto& diag : diagnostics) {
        const char* color = options.colors ? severity_color(diag.severity) : "";
        out << color << bold << analysis::severity_name(diag.severity) << "[" << diag.code << "]"
            << reset << bold << ": " << diag.message << reset << "\n";
        out << dim << "  --> " << reset << diag.location.to_string() << "\n";
        out << dim << "   = " << reset << analysis::rule_name(diag.rule) << " in " << diag.unit
            << " (" << diag.source_type << " -> " << diag.dest_type << ")\n";

        if (options.with_fixes) {
            auto fixes = fixes_for(diag, snapshot, options.patterns);
            for (size_t i = 0; i < fixes.size(); ++i) {
                out << dim << "   = " << reset << "fix " << (i + 1) << ": " << fixes[i].title
                    << "\n";
                for (const auto& op : fixes[i].operations) {
                    out << "       " << model::describe_operation(op) << "\n";
                }
            }
        }
        out << "\n";
    }

    if (diagnostics.empty()) {
        out << "No findings.\n";
        return;
    }
    auto counts = count(diagnostics);
    out << bold << plural(diagnostics.size(), "finding") << reset << " ("
        << plural(counts.errors, "error") << ", " << plural(counts.warnings, "warning") << ", "
        << counts.infos << " info)\n";
}

auto report_to_json(const std::vector<analysis::Diagnostic>& diagnostics,
                    const model::Snapshot& snapshot, bool with_fixes,
                    const expr::HazardPatterns& patterns) -> json::JsonValue {
    auto root = json::json_object();
    root.set("version", json::json_string(VERSION));

    auto findings = json::json_array();
    for (const auto& diag : diagnostics) {
        auto obj = json::json_object();
        obj.set("code", json::json_string(diag.code));
        obj.set("rule", json::json_string(analysis::rule_name(diag.rule)));
        obj.set("severity", json::json_string(analysis::severity_name(diag.severity)));
        obj.set("message", json::json_string(diag.message));
        obj.set("unit", json::json_string(diag.unit));
        obj.set("source_type", json::json_string(diag.source_type));
        obj.set("destination_type", json::json_string(diag.dest_type));
        obj.set("member", json::json_string(diag.member));

        const std::array<std::pair<const char*, const std::string*>, 4> optional_fields{{
            {"source_member", &diag.source_member},
            {"source_member_type", &diag.source_member_type},
            {"destination_member_type", &diag.dest_member_type},
            {"detail", &diag.detail},
        }};
        for (const auto& [key, value] : optional_fields) {
            if (!value->empty()) {
                obj.set(key, json::json_string(*value));
            }
        }
        obj.set("location", location_json(diag.location));

        if (with_fixes) {
            auto fixes = json::json_array();
            for (const auto& edit : fixes_for(diag, snapshot, patterns)) {
                fixes.push(edit_json(edit));
            }
            obj.set("fixes", std::move(fixes));
        }
        findings.push(std::move(obj));
    }
    root.set("findings", std::move(findings));

    auto counts = count(diagnostics);
    auto summary = json::json_object();
    summary.set("errors", json::json_int(static_cast<int64_t>(counts.errors)));
    summary.set("warnings", json::json_int(static_cast<int64_t>(counts.warnings)));
    summary.set("infos", json::json_int(static_cast<int64_t>(counts.infos)));
    root.set("summary", std::move(summary));
    return root;
}

} // namespace maplint::cli
