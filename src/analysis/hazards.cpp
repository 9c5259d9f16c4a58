#include "maplint/analysis/hazards.hpp"

#include "maplint/log/log.hpp"

#include <map>
#include <optional>
#include <type_traits>

namespace maplint::analysis {

auto hazards_from_summary(const expr::ExprSummary& summary, const model::MappingDeclaration& decl,
                          const std::string& member) -> std::vector<Diagnostic> {
    std::vector<Diagnostic> found;
    if (summary.is_opaque()) {
        return found;
    }

    std::optional<std::string> expensive;
    std::optional<std::string> nondeterministic;
    bool blocking = false;
    std::vector<std::string> accessor_order;
    std::map<std::string, int> enumerations;

    for (const auto& fact : summary.facts) {
        std::visit(
            [&](const auto& f) {
                using T = std::decay_t<decltype(f)>;
                if constexpr (std::is_same_v<T, expr::DependencyCall>) {
                    if (!expensive) {
                        expensive = f.category;
                    }
                } else if constexpr (std::is_same_v<T, expr::EnumerationSite>) {
                    if (enumerations[f.accessor]++ == 0) {
                        accessor_order.push_back(f.accessor);
                    }
                } else if constexpr (std::is_same_v<T, expr::BlockingUnwrap>) {
                    blocking = true;
                } else if constexpr (std::is_same_v<T, expr::NonDeterministic>) {
                    if (!nondeterministic) {
                        nondeterministic = f.primitive;
                    }
                } else if constexpr (std::is_same_v<T, expr::BareAccess> ||
                                     std::is_same_v<T, expr::Opaque>) {
                    // not hazards
                } else {
                    static_assert(always_false_v<T>, "unhandled shape fact");
                }
            },
            fact);
    }

    auto emit = [&](Rule rule, std::string detail) {
        auto diag = make_diagnostic(rule, decl, member);
        diag.detail = std::move(detail);
        diag.message = render_message(diag);
        found.push_back(std::move(diag));
    };

    if (expensive) {
        emit(Rule::ExpensiveOperationInMapFrom, *expensive);
    }
    for (const auto& accessor : accessor_order) {
        if (enumerations[accessor] >= 2) {
            emit(Rule::MultipleEnumeration, accessor);
            break;
        }
    }
    if (blocking) {
        emit(Rule::TaskResultSynchronousAccess, "Task.Result");
    }
    if (nondeterministic) {
        emit(Rule::NonDeterministicOperation, *nondeterministic);
    }
    return found;
}

auto detect_hazards(const model::MappingDeclaration& decl, const model::MemberConfig& config,
                    const model::ShapeTable& shapes, const expr::HazardPatterns& patterns)
    -> std::vector<Diagnostic> {
    if (config.kind != model::ConfigKind::MapFrom) {
        return {};
    }

    expr::SummaryContext context;
    context.captures = &decl.captures;
    context.shapes = &shapes;
    context.source_type = decl.source_type;
    context.patterns = patterns;

    auto summary = expr::summarize_expression(config.text, context);
    if (summary.is_opaque()) {
        MAPLINT_LOG_DEBUG("hazard", "Opaque expression for " << decl.dest_type << "."
                                                             << config.dest_member << ": "
                                                             << config.text);
    }
    return hazards_from_summary(summary, decl, config.dest_member);
}

} // namespace maplint::analysis
