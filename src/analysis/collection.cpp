#include "maplint/analysis/collection.hpp"

namespace maplint::analysis {

namespace {

auto is_composite(const model::TypeRefPtr& type) -> bool {
    auto core = model::strip_nullable(type);
    return core && (core->is<model::CollectionType>() || core->is<model::GenericType>());
}

} // namespace

auto check_collection(const model::TypeRefPtr& source, const model::TypeRefPtr& dest,
                      const MappingRegistry& registry) -> CollectionVerdict {
    auto source_element = model::element_type(source);
    auto dest_element = model::element_type(dest);
    if (!source_element || !dest_element) {
        return CollectionVerdict::Compatible;
    }

    if (is_composite(source_element) || is_composite(dest_element)) {
        return model::types_equal(source_element, dest_element) ? CollectionVerdict::Compatible
                                                                : CollectionVerdict::ElementMismatch;
    }

    if (model::implicitly_widens(source_element, dest_element)) {
        return CollectionVerdict::Compatible;
    }

    if (source_element->is<model::UserDefinedType>() && dest_element->is<model::UserDefinedType>() &&
        registry.effectively_mapped(source_element->as<model::UserDefinedType>().name,
                                    dest_element->as<model::UserDefinedType>().name)) {
        return CollectionVerdict::Compatible;
    }

    return CollectionVerdict::ElementMismatch;
}

} // namespace maplint::analysis
