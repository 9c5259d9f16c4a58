#include "maplint/analysis/registry.hpp"

#include "maplint/log/log.hpp"

namespace maplint::analysis {

auto registry_key(std::string_view type_name) -> std::string {
    auto lt = type_name.find('<');
    auto head = type_name.substr(0, lt);
    auto dot = head.rfind('.');
    if (dot != std::string_view::npos) {
        type_name.remove_prefix(dot + 1);
    }
    if (type_name.starts_with("global::")) {
        type_name.remove_prefix(8);
    }
    return std::string(type_name);
}

MappingRegistry::MappingRegistry(const model::AnalysisUnit& unit) {
    for (size_t i = 0; i < unit.declarations.size(); ++i) {
        const auto& decl = unit.declarations[i];
        auto source = registry_key(decl.source_type);
        auto dest = registry_key(decl.dest_type);

        bool duplicate = !edges_.emplace(source, dest).second;
        if (decl.has_reverse_map && source != dest) {
            duplicate = !edges_.emplace(dest, source).second || duplicate;
        }

        if (duplicate) {
            MAPLINT_LOG_DEBUG("registry", "Duplicate mapping " << decl.source_type << " -> "
                                                               << decl.dest_type << " in unit "
                                                               << unit.name);
            duplicates_.push_back(i);
        }
    }
    MAPLINT_LOG_TRACE("registry", "Unit " << unit.name << ": " << edges_.size() << " edges");
}

auto MappingRegistry::effectively_mapped(std::string_view source, std::string_view dest) const
    -> bool {
    return edges_.contains({registry_key(source), registry_key(dest)});
}

} // namespace maplint::analysis
