//! # Snapshot Edit Tests
//!
//! Each primitive operation, anchor resolution, validation before mutation,
//! and idempotence.

#include "maplint/model/edit.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace maplint;
using namespace maplint::model;
using namespace maplint::test;

class EditTest : public ::testing::Test {
protected:
    ShapeTable shapes;
    AnalysisUnit profile;

    void SetUp() override {
        shapes.add(shape("User", {make_member("Name", "string")}));
        shapes.add(shape("UserDto", {make_member("Name", "string")}));
        profile = unit("UserProfile",
                       {declaration("User", "UserDto", {map_from("Name", "src => src.Name")})});
    }

    static auto anchored(std::vector<EditOperation> ops) -> Edit {
        Edit edit;
        edit.title = "test edit";
        edit.anchor = EditAnchor{"User", "UserDto", "Name", {}, 0};
        edit.operations = std::move(ops);
        return edit;
    }

    auto apply(const Edit& edit) -> bool {
        auto result = apply_edit(profile, shapes, edit);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).message : "");
        return is_ok(result) && unwrap(result);
    }

    auto configs() -> std::vector<MemberConfig>& {
        return profile.declarations[0].member_configs;
    }
};

TEST_F(EditTest, AppendMemberConfig) {
    auto edit = anchored({AppendMemberConfig{map_from("Email", "src => src.Mail")}});
    EXPECT_TRUE(apply(edit));
    ASSERT_EQ(configs().size(), 2u);
    EXPECT_EQ(configs()[1].dest_member, "Email");
    EXPECT_FALSE(apply(edit));
    EXPECT_EQ(configs().size(), 2u);
}

TEST_F(EditTest, AppendShadowsEarlierConfig) {
    EXPECT_TRUE(apply(anchored({AppendMemberConfig{map_from("Name", "src => src.Name.Trim()")}})));
    auto overrides = build_override_map(profile.declarations[0]);
    EXPECT_EQ(overrides.at("Name")->text, "src => src.Name.Trim()");
}

TEST_F(EditTest, RemoveMemberConfigRemovesAll) {
    configs().push_back(map_from("Name", "src => src.Name.Trim()"));
    EXPECT_TRUE(apply(anchored({RemoveMemberConfig{"Name"}})));
    EXPECT_TRUE(configs().empty());
    EXPECT_FALSE(apply(anchored({RemoveMemberConfig{"Name"}})));
}

TEST_F(EditTest, RewriteExpression) {
    EXPECT_TRUE(apply(anchored({RewriteExpression{"Name", "src => src.Name.ToUpper()"}})));
    EXPECT_EQ(configs()[0].text, "src => src.Name.ToUpper()");
    EXPECT_FALSE(apply(anchored({RewriteExpression{"Name", "src => src.Name.ToUpper()"}})));
}

TEST_F(EditTest, RewriteWithoutMapFromFails) {
    auto result = apply_edit(profile, shapes, anchored({RewriteExpression{"Email", "src => 1"}}));
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("Email"), std::string::npos);
}

TEST_F(EditTest, InsertCommentSkipsExistingLines) {
    EXPECT_TRUE(apply(anchored({InsertComment{{"first", "second"}}})));
    EXPECT_FALSE(apply(anchored({InsertComment{{"second"}}})));
    EXPECT_EQ(profile.declarations[0].comments.size(), 2u);
}

TEST_F(EditTest, InsertSourceMember) {
    auto edit = anchored({InsertSourceMember{"User", "Total", "decimal", "Populate before mapping"}});
    EXPECT_TRUE(apply(edit));
    const auto* member = shapes.find("User")->find_member("Total");
    ASSERT_NE(member, nullptr);
    EXPECT_EQ(type_to_string(member->type), "decimal");
    EXPECT_EQ(member->note, "Populate before mapping");
    EXPECT_FALSE(apply(edit));
}

TEST_F(EditTest, InsertIntoUnknownTypeFailsWithoutPartialChanges) {
    auto edit = anchored({RemoveMemberConfig{"Name"},
                          InsertSourceMember{"Ghost", "Total", "decimal", ""}});
    auto result = apply_edit(profile, shapes, edit);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(configs().size(), 1u);
}

TEST_F(EditTest, MissingAnchorIsError) {
    Edit edit = anchored({RemoveMemberConfig{"Name"}});
    edit.anchor.dest_type = "AdminDto";
    auto result = apply_edit(profile, shapes, edit);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("User -> AdminDto"), std::string::npos);
}

TEST_F(EditTest, AnchorFallsBackToFirstTypeMatch) {
    profile.declarations.insert(profile.declarations.begin(), declaration("Order", "OrderDto"));
    Edit edit = anchored({RemoveMemberConfig{"Name"}});
    edit.anchor.declaration_index = 0;
    EXPECT_TRUE(apply(edit));
    EXPECT_TRUE(profile.declarations[1].member_configs.empty());
}

TEST_F(EditTest, AnchorPrefersIndexedDeclaration) {
    profile.declarations.push_back(
        declaration("User", "UserDto", {map_from("Name", "src => src.Name")}));
    Edit edit = anchored({RemoveMemberConfig{"Name"}});
    edit.anchor.declaration_index = 1;
    EXPECT_TRUE(apply(edit));
    EXPECT_EQ(profile.declarations[0].member_configs.size(), 1u);
    EXPECT_TRUE(profile.declarations[1].member_configs.empty());
}

TEST_F(EditTest, SetMaxDepth) {
    auto edit = anchored({SetMaxDepth{2}});
    EXPECT_TRUE(apply(edit));
    EXPECT_EQ(profile.declarations[0].max_depth.value_or(0), 2u);
    EXPECT_FALSE(apply(edit));
    EXPECT_TRUE(apply(anchored({SetMaxDepth{4}})));
    EXPECT_EQ(profile.declarations[0].max_depth.value_or(0), 4u);
}

TEST_F(EditTest, CommentOnlyDetection) {
    EXPECT_TRUE(anchored({InsertComment{{"note"}}}).is_comment_only());
    EXPECT_FALSE(anchored({InsertComment{{"note"}}, RemoveMemberConfig{"Name"}}).is_comment_only());
    EXPECT_FALSE(anchored({}).is_comment_only());
}

TEST_F(EditTest, DescribeOperations) {
    EXPECT_EQ(describe_operation(AppendMemberConfig{map_from("Age", "src => src.Age")}),
              "ForMember(Age, MapFrom(src => src.Age))");
    EXPECT_EQ(describe_operation(AppendMemberConfig{ignore("Age")}), "ForMember(Age, Ignore())");
    EXPECT_EQ(describe_operation(RemoveMemberConfig{"Age"}), "remove ForMember(Age)");
    EXPECT_EQ(describe_operation(InsertComment{{"a", "b"}}), "comment // a // b");
    EXPECT_EQ(describe_operation(InsertSourceMember{"User", "Total", "decimal", "note"}),
              "add decimal User.Total // note");
    EXPECT_EQ(describe_operation(SetMaxDepth{2}), "MaxDepth(2)");
}
