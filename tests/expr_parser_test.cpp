//! # Expression Parser Tests
//!
//! Lambda bodies parse into the expected node kinds, and printing a parsed
//! tree reproduces the source modulo redundant parentheses.

#include "maplint/expr/ast.hpp"
#include "maplint/expr/parser.hpp"
#include "maplint/expr/printer.hpp"

#include <gtest/gtest.h>

using namespace maplint;
using namespace maplint::expr;

class ExprParserTest : public ::testing::Test {
protected:
    ExprPtr parse_ok(std::string_view text) {
        auto result = parse_expression(text);
        EXPECT_TRUE(is_ok(result)) << text << ": "
                                   << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return nullptr;
        }
        return std::move(unwrap(result));
    }

    ParseError parse_err(std::string_view text) {
        auto result = parse_expression(text);
        EXPECT_TRUE(is_err(result)) << text;
        if (is_ok(result)) {
            return ParseError{"unexpectedly parsed", 0};
        }
        return unwrap_err(result);
    }

    std::string reprint(std::string_view text) {
        auto expr = parse_ok(text);
        return expr ? print_expr(*expr) : std::string{};
    }

    const LambdaExpr& as_lambda(const ExprPtr& expr) {
        return expr->as<LambdaExpr>();
    }
};

// ============================================================================
// Node Shapes
// ============================================================================

TEST_F(ExprParserTest, SimpleMemberAccess) {
    auto expr = parse_ok("src => src.Name");
    ASSERT_TRUE(expr);
    const auto& lambda = as_lambda(expr);
    ASSERT_EQ(lambda.params.size(), 1u);
    EXPECT_EQ(lambda.params[0], "src");
    EXPECT_FALSE(lambda.block_body);

    ASSERT_TRUE(lambda.body->is<MemberExpr>());
    const auto& member = lambda.body->as<MemberExpr>();
    EXPECT_EQ(member.name, "Name");
    EXPECT_TRUE(member.object->is<IdentExpr>());
    EXPECT_EQ(lambda.body->span.start, 7u);
    EXPECT_EQ(lambda.body->span.end, 15u);
}

TEST_F(ExprParserTest, MethodChainWithNestedLambda) {
    auto expr = parse_ok("src => src.Items.Sum(i => i.Price)");
    ASSERT_TRUE(expr);
    const auto& body = as_lambda(expr).body;
    ASSERT_TRUE(body->is<CallExpr>());
    const auto& call = body->as<CallExpr>();
    ASSERT_EQ(call.args.size(), 1u);
    EXPECT_TRUE(call.args[0]->is<LambdaExpr>());
    EXPECT_EQ(call.callee->as<MemberExpr>().name, "Sum");
}

TEST_F(ExprParserTest, CastVersusParenthesizedExpression) {
    auto cast = parse_ok("src => (int)src.Price");
    ASSERT_TRUE(cast);
    ASSERT_TRUE(as_lambda(cast).body->is<CastExpr>());
    EXPECT_EQ(as_lambda(cast).body->as<CastExpr>().type_name, "int");

    auto grouped = parse_ok("src => (src.Price) * 2");
    ASSERT_TRUE(grouped);
    EXPECT_TRUE(as_lambda(grouped).body->is<BinaryExpr>());
}

TEST_F(ExprParserTest, NullableCast) {
    auto expr = parse_ok("src => (int?)src.Count");
    ASSERT_TRUE(expr);
    ASSERT_TRUE(as_lambda(expr).body->is<CastExpr>());
    EXPECT_EQ(as_lambda(expr).body->as<CastExpr>().type_name, "int?");
}

TEST_F(ExprParserTest, TernaryAndCoalesce) {
    auto expr = parse_ok("src => src.Age != null ? src.Age : 0");
    ASSERT_TRUE(expr);
    EXPECT_TRUE(as_lambda(expr).body->is<TernaryExpr>());

    auto coalesce = parse_ok("src => src.Name ?? string.Empty");
    ASSERT_TRUE(coalesce);
    ASSERT_TRUE(as_lambda(coalesce).body->is<BinaryExpr>());
    EXPECT_EQ(as_lambda(coalesce).body->as<BinaryExpr>().op, "??");
}

TEST_F(ExprParserTest, ParenthesizedLambdaParameters) {
    auto expr = parse_ok("(src, dest) => src.Name");
    ASSERT_TRUE(expr);
    const auto& lambda = as_lambda(expr);
    ASSERT_EQ(lambda.params.size(), 2u);
    EXPECT_EQ(lambda.params[1], "dest");
    EXPECT_TRUE(lambda.parenthesized);
}

TEST_F(ExprParserTest, TypedLambdaParameters) {
    auto expr = parse_ok("(Source s, Destination d) => s.Name");
    ASSERT_TRUE(expr);
    const auto& lambda = as_lambda(expr);
    ASSERT_EQ(lambda.params.size(), 2u);
    EXPECT_EQ(lambda.params[0], "s");
    EXPECT_EQ(lambda.params[1], "d");
}

TEST_F(ExprParserTest, BlockBodyWithLocals) {
    auto expr = parse_ok("src => { var total = src.Items.Count(); return total * 2; }");
    ASSERT_TRUE(expr);
    const auto& lambda = as_lambda(expr);
    EXPECT_TRUE(lambda.block_body);
    ASSERT_EQ(lambda.locals.size(), 1u);
    EXPECT_EQ(lambda.locals[0].type_name, "var");
    EXPECT_EQ(lambda.locals[0].name, "total");
    EXPECT_TRUE(lambda.body->is<BinaryExpr>());
}

TEST_F(ExprParserTest, ObjectCreation) {
    auto expr = parse_ok("src => new Address { Street = src.Street, City = src.City }");
    ASSERT_TRUE(expr);
    const auto& node = as_lambda(expr).body->as<NewExpr>();
    EXPECT_EQ(node.type_name, "Address");
    EXPECT_TRUE(node.has_initializer);
    EXPECT_FALSE(node.has_args);
    EXPECT_EQ(node.initializers.size(), 2u);

    auto generic = parse_ok("src => new List<string>(src.Tags)");
    ASSERT_TRUE(generic);
    EXPECT_EQ(as_lambda(generic).body->as<NewExpr>().type_name, "List<string>");
}

TEST_F(ExprParserTest, InterpolatedString) {
    auto expr = parse_ok(R"(src => $"{src.First} {src.Last:u}")");
    ASSERT_TRUE(expr);
    const auto& node = as_lambda(expr).body->as<InterpolatedStringExpr>();
    ASSERT_EQ(node.holes.size(), 2u);
    ASSERT_EQ(node.pieces.size(), 3u);
    EXPECT_EQ(node.pieces[1], " ");
    EXPECT_EQ(node.formats[0], "");
    EXPECT_EQ(node.formats[1], ":u");
}

TEST_F(ExprParserTest, ConditionalAccessAndIndex) {
    auto expr = parse_ok("src => src.Tags?[0]");
    ASSERT_TRUE(expr);
    ASSERT_TRUE(as_lambda(expr).body->is<IndexExpr>());
    EXPECT_TRUE(as_lambda(expr).body->as<IndexExpr>().conditional);
}

TEST_F(ExprParserTest, NullForgivingIsDropped) {
    EXPECT_EQ(reprint("src => src.Address!.City"), "src => src.Address.City");
}

TEST_F(ExprParserTest, GenericMethodCall) {
    auto expr = parse_ok("src => src.Items.OfType<Order>().Count()");
    ASSERT_TRUE(expr);
    EXPECT_EQ(print_expr(*expr), "src => src.Items.OfType<Order>().Count()");
}

TEST_F(ExprParserTest, IsPatterns) {
    EXPECT_EQ(reprint("src => src.Value is null"), "src => src.Value is null");
    EXPECT_EQ(reprint("src => src.Shape is not Circle"), "src => src.Shape is not Circle");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ExprParserTest, MissingMemberName) {
    auto err = parse_err("src => src.");
    EXPECT_NE(err.message.find("expected member name"), std::string::npos);
    EXPECT_NE(err.message.find("end of input"), std::string::npos);
}

TEST_F(ExprParserTest, UnbalancedParenthesis) {
    auto err = parse_err("src => (src.A + 1");
    EXPECT_NE(err.message.find("expected ')'"), std::string::npos);
}

TEST_F(ExprParserTest, TrailingInput) {
    auto err = parse_err("src => src.A src.B");
    EXPECT_NE(err.message.find("unexpected trailing input"), std::string::npos);
    EXPECT_EQ(err.offset, 13u);
}

TEST_F(ExprParserTest, UnterminatedStringFromLexer) {
    auto err = parse_err("src => \"abc");
    EXPECT_NE(err.message.find("unterminated string"), std::string::npos);
}

TEST_F(ExprParserTest, UnsupportedStatementInBlock) {
    auto err = parse_err("src => { if (src.A) return 1; return 2; }");
    EXPECT_NE(err.message.find("unsupported statement"), std::string::npos);
}

// ============================================================================
// Printing
// ============================================================================

TEST_F(ExprParserTest, PrintRoundTrips) {
    const char* samples[] = {
        "src => src.Name",
        "src => src.Items.Sum(i => i.Price) / src.Items.Count()",
        "src => src.Age.ToString()",
        "src => src.X != null ? int.Parse(src.X) : 0",
        "src => (int)src.Price",
        "src => src?.Address?.City",
        "src => new Address { Street = src.Street }",
        "src => { var itemsCache = src.Items.ToList(); return itemsCache.Count(); }",
        "(a, b) => a + b",
        "src => !src.IsActive",
        "src => src.A ?? src.B ?? src.C",
        R"(src => $"{src.First} {src.Last}")",
    };
    for (const char* sample : samples) {
        EXPECT_EQ(reprint(sample), sample);
    }
}

TEST_F(ExprParserTest, PrinterKeepsRequiredParentheses) {
    EXPECT_EQ(reprint("src => (src.A + src.B) * 2"), "src => (src.A + src.B) * 2");
    EXPECT_EQ(reprint("src => src.A - (src.B - src.C)"), "src => src.A - (src.B - src.C)");
    EXPECT_EQ(reprint("src => (src.A ?? src.B) ?? src.C"), "src => (src.A ?? src.B) ?? src.C");
    EXPECT_EQ(reprint("src => (int)(src.A ?? 0)"), "src => (int)(src.A ?? 0)");
}

TEST_F(ExprParserTest, PrinterDropsRedundantParentheses) {
    EXPECT_EQ(reprint("src => (src.A * src.B) + 2"), "src => src.A * src.B + 2");
    EXPECT_EQ(reprint("src => ((src.Name))"), "src => src.Name");
}

TEST_F(ExprParserTest, CloneMatchesOriginal) {
    auto expr = parse_ok("src => src.Orders.Where(o => o.Total > 10).Select(o => o.Id).ToList()");
    ASSERT_TRUE(expr);
    auto copy = clone_expr(*expr);
    ASSERT_TRUE(copy);
    EXPECT_EQ(print_expr(*copy), print_expr(*expr));
}
