#include "maplint/analysis/analyzer.hpp"

#include "maplint/analysis/classifier.hpp"
#include "maplint/analysis/hazards.hpp"
#include "maplint/analysis/registry.hpp"
#include "maplint/log/log.hpp"

#include <algorithm>
#include <exception>
#include <iterator>

namespace maplint::analysis {

Analyzer::Analyzer(const model::ShapeTable& shapes, AnalyzerOptions options)
    : shapes_(shapes), options_(std::move(options)) {}

auto Analyzer::accept(Diagnostic& diag) const -> bool {
    if (!options_.is_enabled(diag.rule)) {
        return false;
    }
    if (auto it = options_.severity_overrides.find(diag.rule);
        it != options_.severity_overrides.end()) {
        diag.severity = it->second;
    }
    return diag.severity >= options_.min_severity;
}

auto Analyzer::analyze(const model::AnalysisUnit& unit) const -> std::vector<Diagnostic> {
    std::vector<Diagnostic> out;
    MappingRegistry registry(unit);
    Classifier classifier(shapes_, registry);

    auto report = [&](Diagnostic diag, size_t index) {
        diag.unit = unit.name;
        diag.declaration_index = index;
        if (accept(diag)) {
            out.push_back(std::move(diag));
        }
    };

    const auto& duplicates = registry.duplicates();
    for (size_t index = 0; index < unit.declarations.size(); ++index) {
        const auto& decl = unit.declarations[index];

        if (options_.check_duplicates &&
            std::find(duplicates.begin(), duplicates.end(), index) != duplicates.end()) {
            auto diag = make_diagnostic(Rule::DuplicateMapping, decl, "");
            diag.message = render_message(diag);
            report(std::move(diag), index);
        }

        const auto* source = shapes_.find(decl.source_type);
        const auto* dest = shapes_.find(decl.dest_type);
        if (!source || !dest) {
            MAPLINT_LOG_DEBUG("classify", "No shape for " << (source ? decl.dest_type
                                                                     : decl.source_type)
                                                          << "; convention rules skipped");
        }

        auto overrides = model::build_override_map(decl);

        if (source && dest) {
            try {
                if (auto diag = classifier.check_recursion(decl, *source, *dest)) {
                    report(std::move(*diag), index);
                }
            } catch (const std::exception& e) {
                MAPLINT_LOG_WARN("classify", "Failed to check recursion for "
                                                 << decl.source_type << " -> " << decl.dest_type
                                                 << ": " << e.what());
            }

            for (const auto& member : dest->members) {
                try {
                    if (auto diag = classifier.classify_member(decl, overrides, *source, member)) {
                        report(std::move(*diag), index);
                    }
                } catch (const std::exception& e) {
                    MAPLINT_LOG_WARN("classify", "Failed to classify " << decl.dest_type << "."
                                                                       << member.name << ": "
                                                                       << e.what());
                }
            }
        }

        for (const auto& config : decl.member_configs) {
            auto effective = overrides.find(config.dest_member);
            if (effective == overrides.end() || effective->second != &config) {
                continue;
            }
            try {
                if (source && dest) {
                    if (auto diag = classifier.check_redundant(decl, *source, *dest, config)) {
                        report(std::move(*diag), index);
                    }
                }
                for (auto& diag : detect_hazards(decl, config, shapes_, options_.patterns)) {
                    report(std::move(diag), index);
                }
            } catch (const std::exception& e) {
                MAPLINT_LOG_WARN("hazard", "Failed to inspect " << decl.dest_type << "."
                                                                << config.dest_member << ": "
                                                                << e.what());
            }
        }

        if (options_.check_missing_destination && source && dest) {
            try {
                for (auto& diag : classifier.check_missing_destination(decl, *source, *dest)) {
                    report(std::move(diag), index);
                }
            } catch (const std::exception& e) {
                MAPLINT_LOG_WARN("classify", "Failed to check source members of "
                                                 << decl.source_type << ": " << e.what());
            }
        }
    }

    MAPLINT_LOG_DEBUG("check", "Unit " << unit.name << ": " << unit.declarations.size()
                                       << " declarations, " << out.size() << " findings");
    return out;
}

auto Analyzer::analyze_all(const std::vector<model::AnalysisUnit>& units) const
    -> std::vector<Diagnostic> {
    std::vector<Diagnostic> all;
    for (size_t i = 0; i < units.size(); ++i) {
        auto found = analyze(units[i]);
        for (auto& diag : found) {
            diag.unit_index = i;
        }
        all.insert(all.end(), std::make_move_iterator(found.begin()),
                   std::make_move_iterator(found.end()));
    }
    std::stable_sort(all.begin(), all.end(), diagnostic_less);
    return all;
}

} // namespace maplint::analysis
