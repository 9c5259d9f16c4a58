//! # Collection Compatibility Tests

#include "maplint/analysis/collection.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace maplint;
using namespace maplint::analysis;
using namespace maplint::test;

class CollectionTest : public ::testing::Test {
protected:
    model::AnalysisUnit mapped_unit = unit("P", {declaration("OrderLine", "OrderLineDto")});
    model::AnalysisUnit empty_unit = unit("Empty", {});

    static auto type(std::string_view text) -> model::TypeRefPtr {
        return *model::parse_type_ref(text);
    }

    auto check(std::string_view from, std::string_view to, const model::AnalysisUnit& u)
        -> CollectionVerdict {
        MappingRegistry registry(u);
        return check_collection(type(from), type(to), registry);
    }
};

TEST_F(CollectionTest, SameElementDifferentContainer) {
    EXPECT_EQ(check("List<int>", "int[]", empty_unit), CollectionVerdict::Compatible);
    EXPECT_EQ(check("IEnumerable<string>", "HashSet<string>", empty_unit),
              CollectionVerdict::Compatible);
}

TEST_F(CollectionTest, WideningElements) {
    EXPECT_EQ(check("List<int>", "List<long>", empty_unit), CollectionVerdict::Compatible);
    EXPECT_EQ(check("List<long>", "List<int>", empty_unit), CollectionVerdict::ElementMismatch);
}

TEST_F(CollectionTest, PrimitiveMismatch) {
    EXPECT_EQ(check("List<string>", "List<int>", empty_unit), CollectionVerdict::ElementMismatch);
    EXPECT_EQ(check("List<int?>", "List<int>", empty_unit), CollectionVerdict::ElementMismatch);
}

TEST_F(CollectionTest, UserDefinedElementsNeedMapping) {
    EXPECT_EQ(check("List<OrderLine>", "List<OrderLineDto>", mapped_unit),
              CollectionVerdict::Compatible);
    EXPECT_EQ(check("List<OrderLine>", "List<OrderLineDto>", empty_unit),
              CollectionVerdict::ElementMismatch);
    EXPECT_EQ(check("List<OrderLineDto>", "List<OrderLine>", mapped_unit),
              CollectionVerdict::ElementMismatch);
}

TEST_F(CollectionTest, NestedCollectionsCompareStructurally) {
    EXPECT_EQ(check("List<List<int>>", "List<List<int>>", empty_unit),
              CollectionVerdict::Compatible);
    EXPECT_EQ(check("List<List<int>>", "List<int[]>", empty_unit),
              CollectionVerdict::ElementMismatch);
}

TEST_F(CollectionTest, NullableCollectionsUseTheirElements) {
    EXPECT_EQ(check("List<int>?", "List<int>", empty_unit), CollectionVerdict::Compatible);
}
