//! # Type Reference Tests
//!
//! Descriptor parsing, canonical names, structural equality and the
//! widening relation, plus shape lookup.

#include "maplint/model/type_ref.hpp"
#include "maplint/model/type_shape.hpp"

#include <gtest/gtest.h>

using namespace maplint::model;

class TypeRefTest : public ::testing::Test {
protected:
    static auto parse(std::string_view text) -> TypeRefPtr {
        auto parsed = parse_type_ref(text);
        EXPECT_TRUE(parsed.has_value()) << "failed to parse " << text;
        return parsed ? *parsed : nullptr;
    }
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(TypeRefTest, PrimitiveAliasesCanonicalize) {
    EXPECT_TRUE(types_equal(parse("Int32"), parse("int")));
    EXPECT_TRUE(types_equal(parse("System.Int32"), parse("int")));
    EXPECT_TRUE(types_equal(parse("String"), parse("string")));
    EXPECT_EQ(type_to_string(parse("System.Boolean")), "bool");
}

TEST_F(TypeRefTest, NullableForms) {
    auto short_form = parse("int?");
    auto long_form = parse("Nullable<int>");
    EXPECT_TRUE(is_nullable(short_form));
    EXPECT_TRUE(types_equal(short_form, long_form));
    EXPECT_EQ(type_to_string(long_form), "int?");
    EXPECT_TRUE(types_equal(strip_nullable(short_form), parse("int")));
}

TEST_F(TypeRefTest, DoubleNullableCollapses) {
    auto type = make_nullable(make_nullable(make_primitive("int")));
    EXPECT_EQ(type_to_string(type), "int?");
}

TEST_F(TypeRefTest, Collections) {
    auto list = parse("List<string>");
    ASSERT_TRUE(is_collection(list));
    EXPECT_EQ(list->as<CollectionType>().container, "List");
    EXPECT_TRUE(is_string_type(element_type(list)));

    auto array = parse("int[]");
    ASSERT_TRUE(is_collection(array));
    EXPECT_EQ(array->as<CollectionType>().container, "[]");
    EXPECT_EQ(type_to_string(array), "int[]");

    EXPECT_EQ(type_to_string(parse("System.Collections.Generic.IEnumerable<Order>")),
              "IEnumerable<Order>");
}

TEST_F(TypeRefTest, NullableCollectionStillCollection) {
    auto type = parse("List<int>?");
    EXPECT_TRUE(is_nullable(type));
    EXPECT_TRUE(is_collection(type));
    EXPECT_TRUE(types_equal(element_type(type), parse("int")));
}

TEST_F(TypeRefTest, GenericsAndUserTypes) {
    auto dict = parse("Dictionary<string, int>");
    ASSERT_TRUE(dict->is<GenericType>());
    EXPECT_EQ(dict->as<GenericType>().args.size(), 2u);
    EXPECT_EQ(type_to_string(dict), "Dictionary<string, int>");

    auto user = parse("global::Shop.Address");
    EXPECT_TRUE(is_user_defined(user));
    EXPECT_FALSE(is_collection(user));
}

TEST_F(TypeRefTest, MalformedDescriptors) {
    EXPECT_FALSE(parse_type_ref("").has_value());
    EXPECT_FALSE(parse_type_ref("List<int").has_value());
    EXPECT_FALSE(parse_type_ref("int[").has_value());
    EXPECT_FALSE(parse_type_ref("1abc").has_value());
    EXPECT_FALSE(parse_type_ref("int int").has_value());
}

TEST_F(TypeRefTest, CollectionContainerNames) {
    EXPECT_TRUE(is_collection_container("IReadOnlyList"));
    EXPECT_TRUE(is_collection_container("HashSet"));
    EXPECT_FALSE(is_collection_container("Dictionary"));
    EXPECT_FALSE(is_collection_container("Task"));
}

// ============================================================================
// Equality and Widening
// ============================================================================

TEST_F(TypeRefTest, NullPointerEquality) {
    EXPECT_TRUE(types_equal(nullptr, nullptr));
    EXPECT_FALSE(types_equal(nullptr, parse("int")));
    EXPECT_EQ(type_to_string(nullptr), "<unresolved>");
}

TEST_F(TypeRefTest, ContainerMatters) {
    EXPECT_FALSE(types_equal(parse("List<int>"), parse("int[]")));
    EXPECT_FALSE(types_equal(parse("List<int>"), parse("List<long>")));
}

TEST_F(TypeRefTest, NumericRanks) {
    EXPECT_EQ(numeric_rank(parse("byte")), 1);
    EXPECT_EQ(numeric_rank(parse("int?")), 3);
    EXPECT_EQ(numeric_rank(parse("decimal")), 7);
    EXPECT_EQ(numeric_rank(parse("string")), 0);
    EXPECT_FALSE(is_numeric(parse("DateTime")));
}

TEST_F(TypeRefTest, ImplicitWidening) {
    EXPECT_TRUE(implicitly_widens(parse("int"), parse("long")));
    EXPECT_TRUE(implicitly_widens(parse("int"), parse("decimal")));
    EXPECT_TRUE(implicitly_widens(parse("int"), parse("int?")));
    EXPECT_TRUE(implicitly_widens(parse("int?"), parse("long?")));
    EXPECT_FALSE(implicitly_widens(parse("long"), parse("int")));
    EXPECT_FALSE(implicitly_widens(parse("int?"), parse("int")));
    EXPECT_FALSE(implicitly_widens(parse("int"), parse("string")));
}

// ============================================================================
// Shapes
// ============================================================================

TEST(TypeShapeTest, MakeMemberAppliesNullableFlag) {
    auto member = make_member("Name", "string", true, false, true);
    EXPECT_TRUE(member.nullable);
    EXPECT_EQ(type_to_string(member.type), "string?");
    EXPECT_EQ(member.type_text, "string");

    auto broken = make_member("Broken", "List<", true, false, false);
    EXPECT_FALSE(broken.is_resolved());
}

TEST(TypeShapeTest, MemberLookup) {
    TypeShape shape{"User", {make_member("FirstName", "string"), make_member("Age", "int")}};
    ASSERT_NE(shape.find_member("Age"), nullptr);
    EXPECT_EQ(shape.find_member("age"), nullptr);
    ASSERT_NE(shape.find_member_ignore_case("firstname"), nullptr);
    EXPECT_EQ(shape.find_member_ignore_case("firstname")->name, "FirstName");
}

TEST(TypeShapeTest, TableFallsBackToLastSegment) {
    ShapeTable table;
    table.add(TypeShape{"Shop.Models.Order", {}});
    table.add(TypeShape{"Customer", {}});

    EXPECT_NE(table.find("Shop.Models.Order"), nullptr);
    EXPECT_NE(table.find("Order"), nullptr);
    EXPECT_EQ(table.find("Invoice"), nullptr);
}

TEST(TypeShapeTest, AmbiguousLastSegmentIsUnresolved) {
    ShapeTable table;
    table.add(TypeShape{"A.Order", {}});
    table.add(TypeShape{"B.Order", {}});
    EXPECT_EQ(table.find("Order"), nullptr);
    EXPECT_NE(table.find("A.Order"), nullptr);
}

TEST(TypeShapeTest, AddReplacesExisting) {
    ShapeTable table;
    table.add(TypeShape{"User", {make_member("Id", "int")}});
    table.add(TypeShape{"User", {make_member("Id", "int"), make_member("Name", "string")}});
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.find("User")->members.size(), 2u);
}

TEST(TypeShapeTest, EqualsIgnoreCase) {
    EXPECT_TRUE(equals_ignore_case("UserName", "username"));
    EXPECT_FALSE(equals_ignore_case("UserName", "UserNames"));
}
