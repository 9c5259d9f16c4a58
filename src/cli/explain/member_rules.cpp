//! # Member Coverage Explanations
//!
//! Rule codes AM004, AM005, AM011, AM041 and AM050.

#include "cli/explain/explain_internal.hpp"

namespace maplint::cli::explain {

const std::unordered_map<std::string, std::string>& get_member_explanations() {
    static const std::unordered_map<std::string, std::string> db = {

        {"AM004", R"EX(
Missing destination property [AM004]

A source member has no destination counterpart and is not consumed by any
explicit configuration, so its data is dropped by the mapping.

Members are not reported when they are:
- referenced from a MapFrom or Condition expression,
- listed with DoNotValidate / ignored on the source side,
- flattened into destination members that start with their name
  (Address -> AddressStreet),
- part of a mapping with ConstructUsing / ConvertUsing.

How to fix:

1. Add the member to the destination type
2. Map it explicitly into another destination member
3. Ignore it on the source side if dropping it is intended
)EX"},

        {"AM005", R"EX(
Case sensitivity mismatch [AM005]

A destination member only matches a source member when case is ignored,
for example `userName` and `UserName`. Name matching depends on the naming
conventions configured for the profile, so this mapping is fragile.

How to fix:

1. Map explicitly:

    .ForMember(dest => dest.UserName, opt => opt.MapFrom(src => src.userName))

2. Rely on a case-insensitive naming convention and document it
3. Rename one of the members so the names agree
)EX"},

        {"AM011", R"EX(
Unmapped required property [AM011]

A destination member marked `required` has no counterpart in the source
type and no explicit configuration. Mapping will leave it unset.

Example:

    class Destination { public required string Code { get; set; } }

How to fix:

    .ForMember(dest => dest.Code, opt => opt.MapFrom(src => "X"))

or add a `Code` member to the source type.
)EX"},

        {"AM041", R"EX(
Duplicate mapping [AM041]

The same source and destination pair is declared more than once in the
same profile, either directly or through ReverseMap(). Only one of the
declarations takes effect, and which one depends on registration order.

Example:

    CreateMap<User, UserDto>();
    CreateMap<UserDto, User>().ReverseMap();   // User -> UserDto again

How to fix:

Remove one of the declarations and move its member configuration into the
one that remains.
)EX"},

        {"AM050", R"EX(
Redundant MapFrom [AM050]

A MapFrom reads the same-named source member with the same type, which
convention mapping already does.

Example:

    .ForMember(dest => dest.Name, opt => opt.MapFrom(src => src.Name))

How to fix:

Remove the ForMember call. Expressions that transform the value
(`src.Name.ToUpper()`) or read other objects are not reported.
)EX"},
    };
    return db;
}

} // namespace maplint::cli::explain
