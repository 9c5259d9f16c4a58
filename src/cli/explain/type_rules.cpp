//! # Type Compatibility Explanations
//!
//! Rule codes AM001-AM003, AM020 and AM022.

#include "cli/explain/explain_internal.hpp"

namespace maplint::cli::explain {

const std::unordered_map<std::string, std::string>& get_type_explanations() {
    static const std::unordered_map<std::string, std::string> db = {

        {"AM001", R"EX(
Property type mismatch [AM001]

A destination member is mapped by convention from a source member with the
same name, but the two types are not compatible and no explicit
configuration converts between them.

Example:

    class Source      { public int Age { get; set; } }
    class Destination { public string Age { get; set; } }

    CreateMap<Source, Destination>();          // Age: int -> string

Implicit widenings (int -> long, float -> double, T -> T?) are accepted.

How to fix:

    CreateMap<Source, Destination>()
        .ForMember(dest => dest.Age, opt => opt.MapFrom(src => src.Age.ToString()));

`maplint fix` offers this conversion for string and numeric targets.
)EX"},

        {"AM002", R"EX(
Nullable compatibility [AM002]

A nullable source member is mapped by convention into a non-nullable
destination member. A null value at runtime either throws or silently
becomes the default value.

Example:

    class Source      { public string? Name { get; set; } }
    class Destination { public string Name { get; set; } }

How to fix:

    .ForMember(dest => dest.Name, opt => opt.MapFrom(src => src.Name ?? string.Empty))

AM002 is reported only when the underlying types are compatible
(int? -> long, List<int>? -> List<long>). When they are not, the member is
reported as AM001, AM003 or AM020 instead, and the conversion fix handles
the null:

    .ForMember(dest => dest.Count, opt => opt.MapFrom(src => (int)(src.Count ?? 0)))
)EX"},

        {"AM003", R"EX(
Generic type mismatch [AM003]

Two collection members share a name but their element types are not
compatible, and no mapping is declared between the element types.

Example:

    class Source      { public List<string> Ids { get; set; } }
    class Destination { public List<int> Ids { get; set; } }

How to fix:

1. Convert the elements explicitly:

    .ForMember(dest => dest.Ids,
               opt => opt.MapFrom(src => src.Ids.Select(x => int.Parse(x)).ToList()))

2. For user-defined element types, declare the element mapping:

    CreateMap<OrderItem, OrderItemDto>();
)EX"},

        {"AM020", R"EX(
Complex type mapping missing [AM020]

A member holds a user-defined type on both sides, but no mapping between
the two types is declared in the same profile, either directly or through
a ReverseMap() of the opposite declaration.

Example:

    class Source      { public Address Address { get; set; } }
    class Destination { public AddressDto Address { get; set; } }

    CreateMap<Source, Destination>();          // Address -> AddressDto unknown

How to fix:

    CreateMap<Address, AddressDto>();
    // or
    CreateMap<AddressDto, Address>().ReverseMap();

Reverse inference is one hop only: A -> B with ReverseMap() implies B -> A,
but nothing further.
)EX"},

        {"AM022", R"EX(
Infinite recursion risk [AM022]

The mapped types reference themselves, directly or through a cycle of
other types, and the declaration neither sets MaxDepth() nor ignores the
recursive member. Mapping a deep or cyclic object graph can overflow the
stack.

Example:

    class Category    { public Category? Parent { get; set; } }
    class CategoryDto { public CategoryDto? Parent { get; set; } }

    CreateMap<Category, CategoryDto>();        // self-referencing type

    class Person  { public Address Home { get; set; } }
    class Address { public Person Owner { get; set; } }

    CreateMap<Person, PersonDto>();            // Person -> Address -> Person

How to fix:

    CreateMap<Category, CategoryDto>().MaxDepth(2);
    // or
    CreateMap<Category, CategoryDto>()
        .ForMember(dest => dest.Parent, opt => opt.Ignore());

Ignoring any one recursive member, or any MaxDepth() value, clears the
finding. Custom construction skips the check.
)EX"},
    };
    return db;
}

} // namespace maplint::cli::explain
