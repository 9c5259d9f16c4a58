//! # Performance Hazard Explanations
//!
//! Rule code AM031, shared by the four expression hazards.

#include "cli/explain/explain_internal.hpp"

namespace maplint::cli::explain {

const std::unordered_map<std::string, std::string>& get_hazard_explanations() {
    static const std::unordered_map<std::string, std::string> db = {

        {"AM031", R"EX(
Performance hazard in MapFrom [AM031]

A MapFrom expression runs once per mapped object. Work that is expensive,
blocking or non-deterministic inside it multiplies with the number of
objects and makes the mapping hard to test.

AM031 covers four rules:

ExpensiveOperationInMapFrom (warning)
    Database, HTTP, file or reflection access, or calls into methods of
    the profile:

        opt.MapFrom(src => _context.Orders.Count(o => o.UserId == src.Id))

MultipleEnumeration (warning)
    The same source collection is enumerated more than once:

        opt.MapFrom(src => src.Items.Sum(i => i.Price) / src.Items.Count())

TaskResultSynchronousAccess (warning)
    `.Result`, `.Wait()` or `.GetAwaiter().GetResult()` on a task blocks
    the mapping thread and can deadlock.

NonDeterministicOperation (info)
    DateTime.Now, DateTime.UtcNow, Guid.NewGuid() or Random make the
    mapped value differ from run to run.

How to fix:

1. Compute the value before mapping, store it on the source object and
   let convention map it. `maplint fix` removes the MapFrom and adds a
   member marked "Populate before mapping" to the source type.
2. For repeated enumeration, materialize the collection once:

        opt.MapFrom(src => {
            var itemsCache = src.Items.ToList();
            return itemsCache.Sum(i => i.Price) / itemsCache.Count();
        })
)EX"},
    };
    return db;
}

} // namespace maplint::cli::explain
