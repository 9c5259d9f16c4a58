//! # Fix Synthesizer Tests
//!
//! Edits proposed per rule, and the round trip through `apply_edit`:
//! re-analysis after a fix must clear the finding without introducing a
//! finding of another rule for the same member.

#include "maplint/analysis/analyzer.hpp"
#include "maplint/fix/synthesizer.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace maplint;
using namespace maplint::analysis;
using namespace maplint::test;
using model::make_member;

class FixTest : public ::testing::Test {
protected:
    model::Snapshot snapshot;

    void add(std::string name, std::vector<model::Member> members) {
        snapshot.shapes.add(shape(std::move(name), std::move(members)));
    }

    void declare(model::MappingDeclaration decl) {
        if (snapshot.units.empty()) {
            snapshot.units.push_back(unit("TestProfile", {}));
        }
        snapshot.units[0].declarations.push_back(std::move(decl));
    }

    auto analyze() -> std::vector<Diagnostic> {
        Analyzer analyzer(snapshot.shapes);
        return analyzer.analyze(snapshot.units[0]);
    }

    auto only(Rule rule) -> Diagnostic {
        auto diags = analyze();
        EXPECT_EQ(diags.size(), 1u);
        if (diags.empty()) {
            return Diagnostic{};
        }
        EXPECT_EQ(diags[0].rule, rule);
        return diags[0];
    }

    auto fixes_for(const Diagnostic& diag) -> std::vector<model::Edit> {
        const auto& decl = snapshot.units[0].declarations[diag.declaration_index];
        return fix::synthesize_fixes(diag, decl, snapshot.shapes);
    }

    auto apply(const model::Edit& edit) -> bool {
        auto result = model::apply_edit(snapshot.units[0], snapshot.shapes, edit);
        EXPECT_TRUE(is_ok(result));
        return is_ok(result) && unwrap(result);
    }

    static auto appended_text(const model::Edit& edit) -> std::string {
        for (const auto& op : edit.operations) {
            if (const auto* append = std::get_if<model::AppendMemberConfig>(&op)) {
                return append->config.text;
            }
        }
        return {};
    }

    /// Applies the first alternative and checks that `member` is now clean.
    void expect_resolved(const Diagnostic& diag) {
        auto edits = fixes_for(diag);
        ASSERT_FALSE(edits.empty());
        EXPECT_TRUE(apply(edits[0]));
        for (const auto& after : analyze()) {
            EXPECT_NE(after.member, diag.member)
                << after.code << " left on " << after.member << ": " << after.message;
        }
    }
};

// ============================================================================
// Type Conversions
// ============================================================================

TEST_F(FixTest, IntToStringUsesToString) {
    add("Source", {make_member("Age", "int")});
    add("Destination", {make_member("Age", "string")});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::PropertyTypeMismatch);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(edits[0].title, "Convert Age with ToString()");
    EXPECT_EQ(appended_text(edits[0]), "src => src.Age.ToString()");
    expect_resolved(diag);
}

TEST_F(FixTest, NarrowingNumericUsesCast) {
    add("Source", {make_member("Total", "double")});
    add("Destination", {make_member("Total", "int")});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::PropertyTypeMismatch);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(appended_text(edits[0]), "src => (int)src.Total");
    expect_resolved(diag);
}

TEST_F(FixTest, StringToNumberUsesParse) {
    add("Source", {make_member("Zip", "string")});
    add("Destination", {make_member("Zip", "int")});
    declare(declaration("Source", "Destination"));

    auto edits = fixes_for(only(Rule::PropertyTypeMismatch));
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(appended_text(edits[0]), "src => src.Zip != null ? int.Parse(src.Zip) : 0");
}

TEST_F(FixTest, UnconvertibleMismatchHasNoFix) {
    add("Source", {make_member("When", "DateTime")});
    add("Destination", {make_member("When", "bool")});
    declare(declaration("Source", "Destination"));
    EXPECT_TRUE(fixes_for(only(Rule::PropertyTypeMismatch)).empty());
}

// ============================================================================
// Nullability
// ============================================================================

TEST_F(FixTest, NullableStringCoalescesAndIsIdempotent) {
    add("Source", {make_member("Name", "string?")});
    add("Destination", {make_member("Name", "string")});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::NullableCompatibility);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(edits[0].title, "Use string.Empty when Name is null");
    EXPECT_EQ(appended_text(edits[0]), "src => src.Name ?? string.Empty");

    EXPECT_TRUE(apply(edits[0]));
    EXPECT_TRUE(analyze().empty());
    EXPECT_FALSE(apply(edits[0]));
    EXPECT_EQ(snapshot.units[0].declarations[0].member_configs.size(), 1u);
}

TEST_F(FixTest, NullableWideningCoalescesInSourceType) {
    add("Source", {make_member("Count", "int?")});
    add("Destination", {make_member("Count", "long")});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::NullableCompatibility);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(appended_text(edits[0]), "src => src.Count ?? 0");
    expect_resolved(diag);
}

TEST_F(FixTest, NullableIntToStringConverts) {
    add("Source", {make_member("Age", "int?")});
    add("Destination", {make_member("Age", "string")});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::PropertyTypeMismatch);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(appended_text(edits[0]), "src => src.Age?.ToString() ?? string.Empty");
    expect_resolved(diag);
}

TEST_F(FixTest, NullableNumericNarrowingCastsCoalescedValue) {
    add("Source", {make_member("Score", "long?")});
    add("Destination", {make_member("Score", "int")});
    declare(declaration("Source", "Destination"));

    auto edits = fixes_for(only(Rule::PropertyTypeMismatch));
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(appended_text(edits[0]), "src => (int)(src.Score ?? 0)");
}

TEST_F(FixTest, NullableToNullableNarrowingKeepsNull) {
    add("Source", {make_member("Score", "long?"), make_member("Age", "int?")});
    add("Destination", {make_member("Score", "int?"), make_member("Age", "string?")});
    declare(declaration("Source", "Destination"));

    auto diags = analyze();
    ASSERT_EQ(diags.size(), 2u);
    for (const auto& diag : diags) {
        auto edits = fixes_for(diag);
        ASSERT_EQ(edits.size(), 1u);
        if (diag.member == "Score") {
            EXPECT_EQ(appended_text(edits[0]), "src => (int?)src.Score");
        } else {
            EXPECT_EQ(appended_text(edits[0]), "src => src.Age?.ToString()");
        }
    }
}

TEST_F(FixTest, NullableStringToBoolHasNoFix) {
    add("Source", {make_member("Flag", "string?")});
    add("Destination", {make_member("Flag", "bool")});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::PropertyTypeMismatch);
    EXPECT_TRUE(fixes_for(diag).empty());
}

TEST_F(FixTest, NullableComplexTypeWithoutMapHasNoFix) {
    add("Source", {make_member("Address", "AddrA?")});
    add("Destination", {make_member("Address", "AddrB")});
    add("AddrA", {});
    add("AddrB", {});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::ComplexTypeMappingMissing);
    EXPECT_TRUE(fixes_for(diag).empty());
}

TEST_F(FixTest, NullableMappedComplexTypeHasNoCoalesce) {
    add("Source", {make_member("Address", "AddrA?")});
    add("Destination", {make_member("Address", "AddrB")});
    add("AddrA", {});
    add("AddrB", {});
    declare(declaration("Source", "Destination"));
    declare(declaration("AddrA", "AddrB"));

    auto diag = only(Rule::NullableCompatibility);
    EXPECT_TRUE(fixes_for(diag).empty());
}

// ============================================================================
// Collections
// ============================================================================

TEST_F(FixTest, CollectionElementConversion) {
    add("Source", {make_member("Ids", "List<int>")});
    add("Destination", {make_member("Ids", "List<string>")});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::GenericTypeMismatch);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(appended_text(edits[0]), "src => src.Ids.Select(x => x.ToString()).ToList()");
    expect_resolved(diag);
}

TEST_F(FixTest, NullableCollectionMismatchConvertsElements) {
    add("Source", {make_member("Items", "List<string>?")});
    add("Destination", {make_member("Items", "List<int>")});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::GenericTypeMismatch);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(appended_text(edits[0]),
              "src => (src.Items ?? new List<string>()).Select(x => int.Parse(x)).ToList()");
    expect_resolved(diag);
}

TEST_F(FixTest, CollectionMaterializerFollowsDestination) {
    add("Source", {make_member("Codes", "List<string>")});
    add("Destination", {make_member("Codes", "int[]")});
    declare(declaration("Source", "Destination"));

    auto edits = fixes_for(only(Rule::GenericTypeMismatch));
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(appended_text(edits[0]), "src => src.Codes.Select(x => int.Parse(x)).ToArray()");
}

// ============================================================================
// Names and Required Members
// ============================================================================

TEST_F(FixTest, CaseMismatchAlternatives) {
    add("Source", {make_member("email", "string")});
    add("Destination", {make_member("Email", "string")});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::CaseSensitivityMismatch);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 3u);
    EXPECT_EQ(appended_text(edits[0]), "src => src.email");
    EXPECT_FALSE(edits[0].is_comment_only());
    EXPECT_TRUE(edits[1].is_comment_only());
    EXPECT_TRUE(edits[2].is_comment_only());
    expect_resolved(diag);
}

TEST_F(FixTest, CommentOnlyFixLeavesFindingOpen) {
    add("Source", {make_member("email", "string")});
    add("Destination", {make_member("Email", "string")});
    declare(declaration("Source", "Destination"));

    auto edits = fixes_for(only(Rule::CaseSensitivityMismatch));
    ASSERT_EQ(edits.size(), 3u);
    EXPECT_TRUE(apply(edits[1]));
    EXPECT_EQ(snapshot.units[0].declarations[0].comments.size(), 1u);
    only(Rule::CaseSensitivityMismatch);
}

TEST_F(FixTest, RequiredMemberGetsSampleLiteral) {
    add("Source", {});
    add("Destination", {make_member("Priority", "int", true, true)});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::UnmappedRequiredProperty);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 2u);
    EXPECT_EQ(appended_text(edits[0]), "src => 1");
    EXPECT_TRUE(edits[1].is_comment_only());
    expect_resolved(diag);
}

TEST_F(FixTest, RequiredMemberConstantNeverIntroducesHazard) {
    add("Source", {});
    add("Destination", {make_member("Client", "HttpClientOptions", true, true)});
    add("HttpClientOptions", {});
    declare(declaration("Source", "Destination"));

    auto diag = only(Rule::UnmappedRequiredProperty);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_TRUE(edits[0].is_comment_only());
}

TEST_F(FixTest, RequiredMemberConstantHonorsConfiguredPatterns) {
    add("Source", {});
    add("Destination", {make_member("Gateway", "PaymentGateway", true, true)});
    add("PaymentGateway", {});
    declare(declaration("Source", "Destination"));
    auto diag = only(Rule::UnmappedRequiredProperty);
    const auto& decl = snapshot.units[0].declarations[0];

    EXPECT_EQ(fix::synthesize_fixes(diag, decl, snapshot.shapes).size(), 2u);

    expr::HazardPatterns patterns;
    patterns.http.push_back("PaymentGateway");
    auto edits = fix::synthesize_fixes(diag, decl, snapshot.shapes, patterns);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_TRUE(edits[0].is_comment_only());
}

TEST_F(FixTest, RequiredInterfaceMemberGetsDefault) {
    add("Source", {});
    add("Destination", {make_member("Clock", "IClock", true, true)});
    add("IClock", {});
    declare(declaration("Source", "Destination"));

    auto edits = fixes_for(only(Rule::UnmappedRequiredProperty));
    ASSERT_EQ(edits.size(), 2u);
    EXPECT_EQ(appended_text(edits[0]), "src => default");
}

TEST_F(FixTest, RedundantMapFromIsRemoved) {
    add("Source", {make_member("Name", "string")});
    add("Destination", {make_member("Name", "string")});
    declare(declaration("Source", "Destination", {map_from("Name", "src => src.Name")}));

    auto diag = only(Rule::RedundantMapFrom);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(edits[0].title, "Remove redundant MapFrom for Name");
    expect_resolved(diag);
    EXPECT_TRUE(snapshot.units[0].declarations[0].member_configs.empty());
}

// ============================================================================
// Hazards
// ============================================================================

TEST_F(FixTest, ExpensiveOperationMovesValueToSource) {
    add("Order", {make_member("CustomerId", "int")});
    add("OrderDto", {make_member("CustomerId", "int"), make_member("CustomerName", "string")});
    auto decl = declaration("Order", "OrderDto",
                            {map_from("CustomerName",
                                      "src => _context.Customers.Find(src.CustomerId).Name")});
    decl.captures["_context"] = "ShopDbContext";
    declare(decl);

    auto diag = only(Rule::ExpensiveOperationInMapFrom);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(edits[0].title, "Compute CustomerName before mapping");
    EXPECT_TRUE(apply(edits[0]));

    EXPECT_TRUE(snapshot.units[0].declarations[0].member_configs.empty());
    const auto* added = snapshot.shapes.find("Order")->find_member("CustomerName");
    ASSERT_NE(added, nullptr);
    EXPECT_EQ(model::type_to_string(added->type), "string");
    EXPECT_EQ(added->note, fix::POPULATE_MARKER);
    EXPECT_TRUE(analyze().empty());
}

TEST_F(FixTest, PrecomputeWithheldWhenSourceMemberConflicts) {
    add("Order", {make_member("Stamp", "string")});
    add("OrderDto", {make_member("Stamp", "DateTime")});
    declare(declaration("Order", "OrderDto", {map_from("Stamp", "src => DateTime.Now")}));

    auto diag = only(Rule::NonDeterministicOperation);
    EXPECT_TRUE(fixes_for(diag).empty());
}

TEST_F(FixTest, MultipleEnumerationIsCached) {
    add("Order", {make_member("Items", "List<Line>")});
    add("Line", {make_member("Price", "decimal")});
    add("OrderDto", {make_member("Average", "decimal")});
    declare(declaration("Order", "OrderDto",
                        {map_from("Average", "src => src.Items.Sum(i => i.Price) / "
                                             "src.Items.Count()")}));

    auto diag = only(Rule::MultipleEnumeration);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(edits[0].title, "Cache Items before enumerating");
    ASSERT_EQ(edits[0].operations.size(), 1u);
    const auto* rewrite = std::get_if<model::RewriteExpression>(&edits[0].operations[0]);
    ASSERT_NE(rewrite, nullptr);
    EXPECT_EQ(rewrite->text, "src => { var itemsCache = src.Items.ToList(); return "
                             "itemsCache.Sum(i => i.Price) / itemsCache.Count(); }");
    expect_resolved(diag);
}

TEST_F(FixTest, RulesWithoutFixes) {
    add("Source", {make_member("Address", "AddrA"), make_member("Secret", "string")});
    add("Destination", {make_member("Address", "AddrB")});
    add("AddrA", {});
    add("AddrB", {});
    declare(declaration("Source", "Destination"));
    declare(declaration("Source", "Destination"));

    for (const auto& diag : analyze()) {
        EXPECT_TRUE(fixes_for(diag).empty()) << diag.code;
    }
}

// ============================================================================
// Recursion
// ============================================================================

TEST_F(FixTest, SingleSelfReferenceIsIgnoredFirst) {
    add("Category", {make_member("Name", "string"), make_member("Parent", "Category?")});
    add("CategoryDto", {make_member("Name", "string"), make_member("Parent", "CategoryDto?")});
    declare(declaration("Category", "CategoryDto"));

    auto diag = only(Rule::SelfReferencingType);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 2u);
    EXPECT_EQ(edits[0].title, "Ignore self-referencing property 'Parent'");
    ASSERT_EQ(edits[0].operations.size(), 1u);
    EXPECT_EQ(model::describe_operation(edits[0].operations[0]), "ForMember(Parent, Ignore())");
    EXPECT_EQ(edits[1].title, "Add MaxDepth(2) to prevent infinite recursion");
    expect_resolved(diag);
}

TEST_F(FixTest, MaxDepthResolvesRecursion) {
    add("Category",
        {make_member("Parent", "Category?"), make_member("Children", "List<Category>")});
    add("CategoryDto",
        {make_member("Parent", "CategoryDto?"), make_member("Children", "List<CategoryDto>")});
    declare(declaration("Category", "CategoryDto"));

    auto diag = only(Rule::SelfReferencingType);
    auto edits = fixes_for(diag);
    ASSERT_EQ(edits.size(), 2u);
    EXPECT_EQ(edits[0].title, "Add MaxDepth(2) to prevent infinite recursion");
    EXPECT_EQ(edits[1].title, "Ignore all 2 self-referencing properties");
    EXPECT_EQ(edits[1].operations.size(), 2u);

    EXPECT_TRUE(apply(edits[0]));
    EXPECT_EQ(snapshot.units[0].declarations[0].max_depth.value_or(0), 2u);
    EXPECT_TRUE(analyze().empty());
}

TEST_F(FixTest, CircularReferenceOffersMaxDepth) {
    add("Person", {make_member("Name", "string"), make_member("Home", "Address")});
    add("Address", {make_member("Owner", "Person")});
    add("PersonDto", {make_member("Name", "string"), make_member("Home", "AddressDto")});
    add("AddressDto", {make_member("Street", "string")});
    declare(declaration("Person", "PersonDto"));
    declare(declaration("Address", "AddressDto"));

    auto diags = analyze();
    auto it = std::find_if(diags.begin(), diags.end(), [](const Diagnostic& d) {
        return d.rule == Rule::InfiniteRecursion && d.source_type == "Person";
    });
    ASSERT_NE(it, diags.end());
    auto edits = fixes_for(*it);
    ASSERT_EQ(edits.size(), 1u);
    ASSERT_EQ(edits[0].operations.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<model::SetMaxDepth>(edits[0].operations[0]));
    expect_resolved(*it);
}

// ============================================================================
// Helpers
// ============================================================================

TEST(FixLiteralTest, DefaultLiterals) {
    auto parse = [](std::string_view text) { return *model::parse_type_ref(text); };
    EXPECT_EQ(fix::default_literal(parse("string")), "string.Empty");
    EXPECT_EQ(fix::default_literal(parse("long")), "0L");
    EXPECT_EQ(fix::default_literal(parse("decimal")), "0m");
    EXPECT_EQ(fix::default_literal(parse("int?")), "default");
    EXPECT_EQ(fix::default_literal(parse("List<int>")), "new List<int>()");
    EXPECT_EQ(fix::default_literal(parse("IEnumerable<int>")), "new List<int>()");
    EXPECT_EQ(fix::default_literal(parse("string[]")), "Array.Empty<string>()");
    EXPECT_EQ(fix::default_literal(parse("Address")), "default");
}

TEST(FixLiteralTest, SampleLiterals) {
    auto parse = [](std::string_view text) { return *model::parse_type_ref(text); };
    EXPECT_EQ(fix::sample_literal(parse("int")), "1");
    EXPECT_EQ(fix::sample_literal(parse("bool")), "true");
    EXPECT_EQ(fix::sample_literal(parse("string")), "string.Empty");
    EXPECT_EQ(fix::sample_literal(parse("Address")), "new Address()");
    EXPECT_EQ(fix::sample_literal(parse("Item")), "new Item()");
    EXPECT_EQ(fix::sample_literal(parse("IClock")), "default");
    EXPECT_EQ(fix::sample_literal(parse("Billing.IPaymentProvider")), "default");
    EXPECT_EQ(fix::sample_literal(parse("ISet<int>")), "new HashSet<int>()");
}

TEST(CacheEnumerationsTest, AvoidsNameCollisions) {
    auto text = fix::cache_enumerations(
        "src => src.Items.Count() + itemsCache.Count() + src.Items.Count()", {"Items"}, {});
    EXPECT_EQ(text, "src => { var itemsCache2 = src.Items.ToList(); return itemsCache2.Count() + "
                    "itemsCache.Count() + itemsCache2.Count(); }");
}

TEST(CacheEnumerationsTest, NestedLambdaShadowingIsRespected) {
    auto text = fix::cache_enumerations(
        "src => src.Items.Count() + src.Children.Sum(src => src.Items.Count())", {"Items"}, {});
    EXPECT_EQ(text, "src => { var itemsCache = src.Items.ToList(); return itemsCache.Count() + "
                    "src.Children.Sum(src => src.Items.Count()); }");
}

TEST(CacheEnumerationsTest, UnparseableOrUnmatched) {
    EXPECT_EQ(fix::cache_enumerations("src => src.", {"Items"}, {}), "");
    EXPECT_EQ(fix::cache_enumerations("src => src.Name", {"Items"}, {}), "");
}
