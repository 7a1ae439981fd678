#include "tests/helpers.h"
#include "core/pattern/rewrite.h"

TEST(Substitute, symbols) {
    const Bindings b = Bindings().bind(sym("x"), num(1)).bind(sym("y"), str("a"));
    const BaseExpressionRef result = substitute(call("f", {sym("x"), call("g", {sym("y"), sym("z")})}), b);
    EXPECT_TRUE(same(result, call("f", {num(1), call("g", {str("a"), sym("z")})})));
}

TEST(Substitute, splices_sequences) {
    const Bindings b = Bindings().bind(sym("x"), sequence(LeafVector{num(1), num(2)}));
    EXPECT_TRUE(same(substitute(call("f", {sym("x")}), b), call("f", {num(1), num(2)})));
    EXPECT_TRUE(same(
        substitute(call("f", {num(0), sym("x"), num(3)}), b),
        call("f", {num(0), num(1), num(2), num(3)})));

    const Bindings empty = Bindings().bind(sym("x"), sequence(LeafVector()));
    EXPECT_TRUE(same(substitute(call("f", {num(0), sym("x")}), empty), call("f", {num(0)})));
}

TEST(Substitute, keeps_literal_sequences) {
    const BaseExpressionRef item = call("f", {sequence(LeafVector{num(1), num(2)}), sym("x")});
    const Bindings b = Bindings().bind(sym("x"), num(3));
    EXPECT_TRUE(same(
        substitute(item, b),
        call("f", {sequence(LeafVector{num(1), num(2)}), num(3)})));
}

TEST(Substitute, top_level) {
    const Bindings b = Bindings().bind(sym("x"), sequence(LeafVector{num(1), num(2)}));
    EXPECT_TRUE(same(substitute(sym("x"), b), sequence(LeafVector{num(1), num(2)})));
}

TEST(Substitute, heads) {
    const Bindings b = Bindings().bind(sym("h"), sym("g"));
    EXPECT_TRUE(same(substitute(call("h", {num(1)}), b), call("g", {num(1)})));
    EXPECT_TRUE(same(
        substitute(expression(call("h", {num(1)}), {num(2)}), b),
        expression(call("g", {num(1)}), {num(2)})));
}

TEST(Substitute, shares_unchanged) {
    const ExpressionRef untouched = call("g", {num(1), sym("y")});
    const ExpressionRef item = call("f", {untouched, sym("x")});
    const Bindings b = Bindings().bind(sym("x"), num(2));

    const BaseExpressionRef result = substitute(item, b);
    ASSERT_TRUE(result->is_expression());
    EXPECT_EQ(result->as_expression()->leaf(0), untouched);

    EXPECT_EQ(substitute(untouched, b), untouched);
    EXPECT_EQ(substitute(item, Bindings()), item);
}

TEST(Substitute, does_not_evaluate) {
    const Bindings b = Bindings().bind(sym("x"), num(2));
    EXPECT_TRUE(same(
        substitute(call("Plus", {sym("x"), num(1)}), b),
        call("Plus", {num(2), num(1)})));
}

TEST(Substitute, keeps_attributes) {
    const ExpressionRef item = expression(sym("f"), LeafVector{sym("x")}, Attributes::HoldAll);
    const BaseExpressionRef result = substitute(item, Bindings().bind(sym("x"), num(1)));
    ASSERT_TRUE(result->is_expression());
    EXPECT_TRUE((result->as_expression()->attributes() & Attributes::HoldAll));
}
