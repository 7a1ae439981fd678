#include "tests/helpers.h"
#include "core/sort.h"

TEST(Expression, structural_equality) {
    const ExpressionRef a = call("Plus", {num(1), num(2)});
    const ExpressionRef b = call("Plus", {num(1), num(2)});
    const ExpressionRef c = call("Plus", {num(2), num(1)});

    EXPECT_TRUE(a->same(*b));
    EXPECT_EQ(a->hash(), b->hash());
    EXPECT_FALSE(a->same(*c));
    EXPECT_EQ(a->debugform(), "Plus[1, 2]");
}

TEST(Expression, attributes_are_not_identity) {
    const ExpressionRef plain = call("f", {num(1)});
    const ExpressionRef held = plain->add_attributes(Attributes::HoldAll);

    EXPECT_TRUE((held->attributes() & Attributes::HoldAll));
    EXPECT_TRUE(is_empty(plain->attributes()));
    EXPECT_TRUE(plain->same(*held));
    EXPECT_EQ(plain->hash(), held->hash());

    const ExpressionRef released = held->remove_attributes(Attributes::HoldFirst);
    EXPECT_TRUE((released->attributes() & Attributes::HoldRest));
    EXPECT_FALSE((released->attributes() & Attributes::HoldFirst));
}

TEST(Expression, nested_heads) {
    const ExpressionRef curried = expression(call("f", {num(1)}), {num(2)});
    EXPECT_EQ(curried->debugform(), "f[1][2]");
    EXPECT_EQ(curried->lookup_name(), sym("f").get());
    EXPECT_EQ(root_symbol(curried).get(), sym("f").get());
    EXPECT_TRUE(same(curried->head(), call("f", {num(1)})));
}

TEST(Expression, construction_errors) {
    EXPECT_THROW(expression(num(1), {num(2)}), ConstructionError);
    EXPECT_THROW(expression(str("f"), LeafVector()), ConstructionError);
    EXPECT_THROW(expression(sym("f"), {num(1), BaseExpressionRef()}), ConstructionError);

    EXPECT_THROW(expression(sym("f"), LeafVector(), std::vector<BaseExpressionRef>{num(1)}),
        ConstructionError);
    EXPECT_THROW(expression(sym("f"), LeafVector(), std::vector<BaseExpressionRef>{sym("NoSuchAttribute")}),
        ConstructionError);

    const ExpressionRef ok = expression(sym("f"), LeafVector(),
        std::vector<BaseExpressionRef>{system_symbols().Orderless, system_symbols().Flat});
    EXPECT_TRUE((ok->attributes() & (Attributes::Orderless + Attributes::Flat)));
}

TEST(Expression, with_leaves) {
    const ExpressionRef a = call("f", {num(1), num(2)});
    const ExpressionRef b = a->with_leaves(LeafVector{num(3)});
    EXPECT_TRUE(same(b, call("f", {num(3)})));
    EXPECT_TRUE(same(a, call("f", {num(1), num(2)})));

    const ExpressionRef c = a->with_head(sym("g"));
    EXPECT_TRUE(same(c, call("g", {num(1), num(2)})));
}

TEST(Expression, map_shares_unchanged) {
    const ExpressionRef a = call("f", {num(1), num(2)});

    const ExpressionRef unchanged = a->map([] (const BaseExpressionRef&) {
        return BaseExpressionRef();
    });
    EXPECT_EQ(unchanged, nullptr);

    const ExpressionRef changed = a->map([] (const BaseExpressionRef &leaf) {
        return leaf->same(*num(2)) ? num(5) : BaseExpressionRef();
    });
    ASSERT_NE(changed, nullptr);
    EXPECT_TRUE(same(changed, call("f", {num(1), num(5)})));
    EXPECT_EQ(changed->leaf(0), a->leaf(0));
}

TEST(Expression, atoms) {
    EXPECT_TRUE(same(num(1)->head(), system_symbols().Integer));
    EXPECT_TRUE(same(from_primitive(1.5)->head(), system_symbols().Real));
    EXPECT_TRUE(same(str("a")->head(), system_symbols().String));

    EXPECT_FALSE(num(1)->same(*from_primitive(1.)));
    EXPECT_TRUE(str("a")->same(*str("a")));
    EXPECT_EQ(str("a\"b")->debugform(), "\"a\\\"b\"");
    EXPECT_EQ(from_primitive(2.)->debugform(), "2.");
    EXPECT_EQ(num(1)->lookup_name(), nullptr);
}

TEST(Expression, canonical_order) {
    LeafVector leaves{sym("b"), call("f", {num(1)}), str("s"), num(3), sym("a"), num(-2)};
    sort_canonical(leaves);

    const ExpressionRef sorted = list(std::move(leaves));
    EXPECT_EQ(sorted->debugform(), "List[-2, 3, \"s\", a, b, f[1]]");

    EXPECT_EQ(compare_canonical(*num(1), *num(1)), 0);
    EXPECT_LT(compare_canonical(*num(1), *from_primitive(1.5)), 0);
    EXPECT_GT(compare_canonical(*sym("x"), *num(100)), 0);
}

TEST(Attributes, operators) {
    const Attributes a = Attributes::Flat + Attributes::Orderless;
    EXPECT_TRUE((a & Attributes::Flat));
    EXPECT_TRUE((a & (Attributes::Flat + Attributes::Orderless)));
    EXPECT_FALSE((a & Attributes::Listable));
    EXPECT_FALSE((a & Attributes::None));
    EXPECT_FALSE(((a - Attributes::Flat) & Attributes::Flat));
    EXPECT_EQ(count(a, Attributes::Flat + Attributes::Listable), 1u);

    EXPECT_TRUE((Attributes::HoldAll & Attributes::HoldFirst));
    EXPECT_FALSE((Attributes::HoldFirst & Attributes::HoldAll));
}

TEST(Attributes, symbols) {
    const Symbols &symbols = system_symbols();

    EXPECT_EQ(*attribute_from_symbol(symbols.Listable.get()), Attributes::Listable);
    EXPECT_FALSE(attribute_from_symbol(sym("f").get()));

    const std::vector<SymbolRef> names = attributes_to_symbols(
        Attributes::HoldAll + Attributes::Protected);
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0].get(), symbols.HoldAll.get());
    EXPECT_EQ(names[1].get(), symbols.Protected.get());
}
