#include "tests/helpers.h"
#include "core/pattern/bindings.h"

TEST(Bindings, bind) {
    const Bindings empty;
    EXPECT_TRUE(empty.empty());

    const Bindings b = empty.bind(sym("x"), num(1));
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(b.size(), 1u);
    EXPECT_TRUE(b.contains(sym("x").get()));
    EXPECT_TRUE(same(b.get(sym("x").get()), num(1)));
    EXPECT_EQ(b.get(sym("y").get()), nullptr);
}

TEST(Bindings, rebinding_same_value) {
    const Bindings b = Bindings().bind(sym("x"), num(1));
    const Bindings c = b.bind(sym("x"), num(1));
    EXPECT_EQ(c.size(), 1u);
    EXPECT_TRUE(c.same(b));
}

TEST(Bindings, conflict) {
    const Bindings b = Bindings().bind(sym("x"), num(1));

    EXPECT_FALSE(b.try_bind(sym("x"), num(2)));

    try {
        b.bind(sym("x"), num(2));
        FAIL() << "expected a BindingConflict";
    } catch (const BindingConflict &conflict) {
        EXPECT_EQ(conflict.name.get(), sym("x").get());
        EXPECT_TRUE(same(conflict.existing, num(1)));
        EXPECT_TRUE(same(conflict.value, num(2)));
    }
}

TEST(Bindings, merge) {
    const Bindings a = Bindings().bind(sym("x"), num(1));
    const Bindings b = Bindings().bind(sym("y"), num(2)).bind(sym("x"), num(1));
    const Bindings c = Bindings().bind(sym("x"), num(3));

    EXPECT_TRUE(a.is_compatible(b));
    EXPECT_FALSE(a.is_compatible(c));

    const Bindings merged = a.merge(b);
    EXPECT_EQ(merged.size(), 2u);
    EXPECT_TRUE(same(merged.get(sym("y").get()), num(2)));

    EXPECT_THROW(a.merge(c), BindingConflict);
}

TEST(Bindings, same) {
    const Bindings a = Bindings().bind(sym("x"), num(1));
    EXPECT_FALSE(a.same(Bindings().bind(sym("y"), num(1))));
    EXPECT_FALSE(a.same(Bindings()));
    EXPECT_TRUE(a.same(Bindings().bind(sym("x"), num(1))));
}

TEST(Bindings, debugform) {
    const Bindings b = Bindings().bind(sym("x"), num(1)).bind(sym("y"), str("a"));
    EXPECT_EQ(b.debugform(), "{x -> 1, y -> \"a\"}");
}
