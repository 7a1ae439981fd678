#include "tests/helpers.h"
#include "core/evaluate.h"

namespace {

// multiplies machine integers and leaves everything else alone.
BaseExpressionRef times(const ExpressionRef &expr, const Evaluation&) {
    machine_integer_t product = 1;
    for (const BaseExpressionRef &leaf : *expr) {
        if (!leaf->is_machine_integer()) {
            return BaseExpressionRef();
        }
        product *= static_cast<const MachineInteger*>(leaf.get())->value;
    }
    return from_primitive(product);
}

} // namespace

class Evaluate : public ::testing::Test {
protected:
    EvaluationContext context;
    BuiltinRegistry builtins;
    std::shared_ptr<TestOutput> output;

    Evaluate() : output(std::make_shared<TestOutput>()) {
        builtins.add(system_symbols().Times, Attributes::None, times);

        const SymbolRef &General = system_symbols().General;
        context.add_message(General, "tdlen", "Objects of unequal length in `1` cannot be combined.");
        context.add_message(General, "bfail", "Evaluation of `1` failed: `2`.");
        context.add_message(General, "reclim", "Recursion depth of `1` exceeded.");
        context.add_message(General, "itlim", "Iteration limit of `1` exceeded.");
    }

    BaseExpressionRef eval(
        const BaseExpressionRef &item,
        optional<EvaluationLimits> limits = optional<EvaluationLimits>()) {

        return evaluate(item, context, builtins, output, limits);
    }

    BaseExpressionRef times_of(std::initializer_list<BaseExpressionRef> leaves) {
        return expression(system_symbols().Times, leaves);
    }
};

TEST_F(Evaluate, atoms) {
    EXPECT_TRUE(same(eval(num(1)), num(1)));
    EXPECT_TRUE(same(eval(str("a")), str("a")));
    EXPECT_TRUE(same(eval(sym("unbound")), sym("unbound")));
}

TEST_F(Evaluate, own_values) {
    context.define_own_value(sym("x"), sym("y"));
    context.define_own_value(sym("y"), num(5));
    EXPECT_TRUE(same(eval(sym("x")), num(5)));
    EXPECT_TRUE(same(eval(call("f", {sym("x")})), call("f", {num(5)})));
}

TEST_F(Evaluate, down_values_with_builtin) {
    context.define_down_value(sym("f"), call("f", {var("x")}), times_of({num(2), sym("x")}));
    EXPECT_TRUE(same(eval(call("f", {num(5)})), num(10)));
    EXPECT_TRUE(output->empty());
}

TEST_F(Evaluate, builtin_not_applicable) {
    const BaseExpressionRef item = times_of({num(2), sym("a")});
    EXPECT_TRUE(same(eval(item), item));
}

TEST_F(Evaluate, evaluates_heads) {
    context.define_own_value(sym("h"), sym("f"));
    context.define_down_value(sym("f"), call("f", {var("x")}), times_of({num(2), sym("x")}));
    EXPECT_TRUE(same(eval(call("h", {num(4)})), num(8)));
}

TEST_F(Evaluate, iteration_limit) {
    context.define_down_value(sym("f"), call("f", {var("x")}), call("f", {sym("x")}));

    try {
        eval(call("f", {num(1)}), EvaluationLimits(DefaultRecursionLimit, 50));
        FAIL() << "expected an IterationLimitError";
    } catch (const IterationLimitError &error) {
        EXPECT_EQ(error.limit, 50);
        EXPECT_TRUE(same(error.expr, call("f", {num(1)})));
    }

    EXPECT_TRUE(output->test_line("$IterationLimit::itlim: Iteration limit of 50 exceeded."));
}

TEST_F(Evaluate, iteration_limit_default) {
    context.define_down_value(sym("f"), call("f", {var("x")}), call("f", {sym("x")}));
    EXPECT_THROW(eval(call("f", {num(1)})), IterationLimitError);
    EXPECT_TRUE(output->contains("1000"));
}

TEST_F(Evaluate, iteration_limit_not_reached) {
    // g[3] -> g[2] -> g[1] -> g[0] -> done takes four rewrites
    for (machine_integer_t i = 1; i <= 3; i++) {
        context.define_down_value(sym("g"), call("g", {num(i)}), call("g", {num(i - 1)}));
    }
    context.define_down_value(sym("g"), call("g", {num(0)}), sym("done"));

    EXPECT_TRUE(same(eval(call("g", {num(3)}), EvaluationLimits(DefaultRecursionLimit, 4)), sym("done")));
    EXPECT_THROW(eval(call("g", {num(3)}), EvaluationLimits(DefaultRecursionLimit, 3)), IterationLimitError);
}

TEST_F(Evaluate, iteration_limit_counts_each_chain) {
    // six rewrites in total, but no single chain is longer than one
    const char *names[] = {"a1", "a2", "a3", "a4", "a5"};
    for (const char *name : names) {
        context.define_own_value(sym(name), num(2));
    }

    const BaseExpressionRef item = times_of(
        {sym("a1"), sym("a2"), sym("a3"), sym("a4"), sym("a5")});
    EXPECT_TRUE(same(eval(item, EvaluationLimits(DefaultRecursionLimit, 1)), num(32)));
}

TEST_F(Evaluate, iteration_limit_from_context) {
    context.define_own_value(system_symbols().StateIterationLimit, num(5));
    context.define_down_value(sym("f"), call("f", {var("x")}), call("f", {sym("x")}));

    try {
        eval(call("f", {num(1)}));
        FAIL() << "expected an IterationLimitError";
    } catch (const IterationLimitError &error) {
        EXPECT_EQ(error.limit, 5);
    }

    const EvaluationLimits limits = EvaluationLimits::from_context(context);
    EXPECT_EQ(limits.iteration_limit, 5);
    EXPECT_EQ(limits.recursion_limit, DefaultRecursionLimit);
}

TEST_F(Evaluate, invalid_limits_in_context) {
    context.define_own_value(system_symbols().StateRecursionLimit, num(-3));
    context.define_own_value(system_symbols().StateIterationLimit, str("many"));

    const EvaluationLimits limits = EvaluationLimits::from_context(context);
    EXPECT_EQ(limits.recursion_limit, DefaultRecursionLimit);
    EXPECT_EQ(limits.iteration_limit, DefaultIterationLimit);
}

TEST_F(Evaluate, recursion_limit) {
    context.define_down_value(sym("f"), call("f", {var("x")}), call("h", {call("f", {sym("x")})}));

    try {
        eval(call("f", {num(1)}), EvaluationLimits(20, DefaultIterationLimit));
        FAIL() << "expected a RecursionLimitError";
    } catch (const RecursionLimitError &error) {
        EXPECT_EQ(error.limit, 20);
    }

    EXPECT_TRUE(output->test_line("$RecursionLimit::reclim: Recursion depth of 20 exceeded."));

    // the context is still usable
    EXPECT_TRUE(same(eval(call("k", {num(1)})), call("k", {num(1)})));
}

TEST_F(Evaluate, recursion_limit_is_an_evaluation_error) {
    context.define_down_value(sym("f"), call("f", {var("x")}), call("h", {call("f", {sym("x")})}));
    EXPECT_THROW(eval(call("f", {num(1)})), EvaluationError);
}

TEST_F(Evaluate, hold_attributes) {
    context.define_own_value(sym("x"), num(1));
    context.set_attributes(sym("hold"), Attributes::HoldAll);
    context.set_attributes(sym("holdFirst"), Attributes::HoldFirst);
    context.set_attributes(sym("holdRest"), Attributes::HoldRest);

    EXPECT_TRUE(same(
        eval(call("hold", {sym("x"), sym("x")})),
        call("hold", {sym("x"), sym("x")})));
    EXPECT_TRUE(same(
        eval(call("holdFirst", {sym("x"), sym("x")})),
        call("holdFirst", {sym("x"), num(1)})));
    EXPECT_TRUE(same(
        eval(call("holdRest", {sym("x"), sym("x")})),
        call("holdRest", {num(1), sym("x")})));
}

TEST_F(Evaluate, local_attributes) {
    context.define_own_value(sym("x"), num(1));
    const ExpressionRef held = expression(sym("f"), LeafVector{sym("x")}, Attributes::HoldAll);
    const BaseExpressionRef result = eval(held);
    EXPECT_TRUE(same(result, call("f", {sym("x")})));
}

TEST_F(Evaluate, evaluate_in_held_position) {
    context.define_own_value(sym("x"), num(1));
    context.set_attributes(sym("hold"), Attributes::HoldAll);

    EXPECT_TRUE(same(
        eval(call("hold", {call("Evaluate", {sym("x")}), sym("x")})),
        call("hold", {num(1), sym("x")})));
}

TEST_F(Evaluate, unevaluated) {
    context.define_own_value(sym("x"), num(1));

    const BaseExpressionRef item = call("f", {call("Unevaluated", {sym("x")}), sym("x")});
    EXPECT_TRUE(same(eval(item), call("f", {call("Unevaluated", {sym("x")}), num(1)})));
}

TEST_F(Evaluate, hold_all_complete) {
    context.define_own_value(sym("x"), num(1));
    context.set_attributes(sym("hc"), Attributes::HoldAllComplete);
    context.define_up_value(sym("a"), call("hc", {sym("a")}), str("up"));

    const BaseExpressionRef item = call("hc", {
        call("Evaluate", {sym("x")}), sequence(LeafVector{num(1), num(2)})});
    EXPECT_TRUE(same(eval(item), item));
    EXPECT_TRUE(same(eval(call("hc", {sym("a")})), call("hc", {sym("a")})));
}

TEST_F(Evaluate, sequence_splicing) {
    EXPECT_TRUE(same(
        eval(call("f", {num(1), sequence(LeafVector{num(2), num(3)}), sequence(LeafVector())})),
        call("f", {num(1), num(2), num(3)})));

    context.set_attributes(sym("sh"), Attributes::SequenceHold);
    const BaseExpressionRef held = call("sh", {sequence(LeafVector{num(1), num(2)})});
    EXPECT_TRUE(same(eval(held), held));
}

TEST_F(Evaluate, sequence_from_rule) {
    context.define_own_value(sym("s"), sequence(LeafVector{num(1), num(2)}));
    EXPECT_TRUE(same(eval(call("f", {sym("s"), num(3)})), call("f", {num(1), num(2), num(3)})));
}

TEST_F(Evaluate, flat_and_orderless) {
    context.set_attributes(sym("p"), Attributes::Flat + Attributes::Orderless);

    const BaseExpressionRef result = eval(call("p", {sym("c"), call("p", {sym("b"), sym("a")})}));
    EXPECT_TRUE(same(result, call("p", {sym("a"), sym("b"), sym("c")})));

    // normal form is a fixed point
    EXPECT_TRUE(same(eval(result), result));
}

TEST_F(Evaluate, orderless_is_idempotent) {
    context.set_attributes(sym("o"), Attributes::Orderless);

    const BaseExpressionRef once = eval(call("o", {num(3), str("z"), sym("b"), num(1), sym("a")}));
    EXPECT_TRUE(same(once, call("o", {num(1), num(3), str("z"), sym("a"), sym("b")})));
    EXPECT_TRUE(same(eval(once), once));
}

TEST_F(Evaluate, flat_only) {
    context.set_attributes(sym("fl"), Attributes::Flat);
    EXPECT_TRUE(same(
        eval(call("fl", {num(1), call("fl", {num(2), call("fl", {num(3)})}), num(4)})),
        call("fl", {num(1), num(2), num(3), num(4)})));
}

TEST_F(Evaluate, listable) {
    context.set_attributes(sym("l"), Attributes::Listable);

    const BaseExpressionRef result = eval(call("l", {
        list(LeafVector{num(1), num(2)}), list(LeafVector{num(3), num(4)}), num(5)}));
    EXPECT_TRUE(same(result, list(LeafVector{
        call("l", {num(1), num(3), num(5)}),
        call("l", {num(2), num(4), num(5)})})));
}

TEST_F(Evaluate, listable_then_rules) {
    context.set_attributes(system_symbols().Times, Attributes::Listable);
    EXPECT_TRUE(same(
        eval(times_of({num(2), list(LeafVector{num(1), num(2), num(3)})})),
        list(LeafVector{num(2), num(4), num(6)})));
}

TEST_F(Evaluate, listable_length_mismatch) {
    context.set_attributes(sym("l"), Attributes::Listable);

    const BaseExpressionRef item = call("l", {list(LeafVector{num(1), num(2)}), list(LeafVector{num(3)})});
    EXPECT_TRUE(same(eval(item), item));
    EXPECT_TRUE(output->test_line(
        "General::tdlen: Objects of unequal length in l[List[1, 2], List[3]] cannot be combined."));
}

TEST_F(Evaluate, up_values_before_down_values) {
    context.define_down_value(sym("f"), call("f", {var("x")}), str("down"));
    context.define_up_value(sym("a"), call("f", {sym("a")}), str("up"));
    context.define_up_value(sym("a"), call("g", {call("a", {var("x")})}), sym("x"));

    EXPECT_TRUE(same(eval(call("f", {sym("a")})), str("up")));
    EXPECT_TRUE(same(eval(call("f", {sym("b")})), str("down")));
    EXPECT_TRUE(same(eval(call("g", {call("a", {num(7)})})), num(7)));
}

TEST_F(Evaluate, sub_values) {
    context.define_sub_value(sym("g"),
        expression(call("g", {var("x")}), {var("y")}),
        times_of({sym("x"), sym("y")}));

    EXPECT_TRUE(same(eval(expression(call("g", {num(2)}), {num(3)})), num(6)));

    const BaseExpressionRef unmatched = expression(call("g", {num(2)}), {num(3), num(4)});
    EXPECT_TRUE(same(eval(unmatched), unmatched));
}

TEST_F(Evaluate, conditional_rules) {
    const Symbols &symbols = system_symbols();
    context.define_own_value(sym("flag"), symbols.False);
    context.define_down_value(sym("f"), call("f", {var("x")}), str("guarded"), RuleKind::Delayed, sym("flag"));
    context.define_down_value(sym("f"), call("f", {var("x")}), str("fallback"));

    EXPECT_TRUE(same(eval(call("f", {num(1)})), str("fallback")));

    context.define_own_value(sym("flag"), symbols.True);
    EXPECT_TRUE(same(eval(call("f", {num(1)})), str("guarded")));
}

TEST_F(Evaluate, builtin_failure) {
    builtins.add(sym("fail"), Attributes::None,
        [] (const ExpressionRef&, const Evaluation&) -> BaseExpressionRef {
            throw std::runtime_error("boom");
        });

    const BaseExpressionRef item = call("fail", {num(1)});
    EXPECT_TRUE(same(eval(item), item));
    EXPECT_TRUE(output->test_line("fail::bfail: Evaluation of fail[1] failed: \"boom\"."));
    EXPECT_TRUE(output->empty());
}

TEST_F(Evaluate, builtin_without_change) {
    int calls = 0;
    builtins.add(sym("idem"), Attributes::None,
        [&calls] (const ExpressionRef &expr, const Evaluation&) -> BaseExpressionRef {
            calls++;
            return call("idem", {expr->leaf(0)});
        });

    const BaseExpressionRef item = call("idem", {num(1)});
    EXPECT_TRUE(same(eval(item), item));
    EXPECT_EQ(calls, 1);
}

TEST_F(Evaluate, builtin_attributes) {
    context.define_own_value(sym("x"), num(1));
    builtins.add(sym("bhold"), Attributes::HoldAll, BuiltinFunction());

    EXPECT_TRUE(same(eval(call("bhold", {sym("x")})), call("bhold", {sym("x")})));

    // the context overrides the builtin
    context.set_attributes(sym("bhold"), Attributes::None);
    EXPECT_TRUE(same(eval(call("bhold", {sym("x")})), call("bhold", {num(1)})));
}

TEST_F(Evaluate, builtin_attributes_survive_definitions) {
    context.define_own_value(sym("x"), num(1));
    builtins.add(sym("bkeep"), Attributes::HoldAll, BuiltinFunction());

    // rules and messages give bkeep a state in the context, but no attributes
    context.define_down_value(sym("bkeep"), call("bkeep", {num(99)}), str("special"));
    context.add_message(sym("bkeep"), "info", "about `1`");

    EXPECT_TRUE(same(eval(call("bkeep", {sym("x")})), call("bkeep", {sym("x")})));
    EXPECT_TRUE(same(eval(call("bkeep", {num(99)})), str("special")));

    const Evaluation evaluation(context, builtins, output, EvaluationLimits());
    EXPECT_EQ(evaluation.attributes_of(sym("bkeep").get()), Attributes::HoldAll);
}

TEST_F(Evaluate, condition_clears_own_rules) {
    builtins.add(sym("forget"), Attributes::HoldAll,
        [] (const ExpressionRef &expr, const Evaluation &evaluation) -> BaseExpressionRef {
            evaluation.context.clear_values(static_pointer_cast_symbol(expr->leaf(0)));
            return evaluation.symbols.True;
        });

    context.define_down_value(sym("pf"), call("pf", {var("x")}), num(1),
        RuleKind::Delayed, call("forget", {sym("pf")}));
    context.define_down_value(sym("pf"), call("pf", {var("x"), var("y")}), num(2));

    EXPECT_TRUE(same(eval(call("pf", {num(7)})), num(1)));
    EXPECT_EQ(context.rules(sym("pf").get(), ValueCategory::Down), nullptr);
    EXPECT_TRUE(same(eval(call("pf", {num(7)})), call("pf", {num(7)})));
}

TEST_F(Evaluate, immediate_rule_redefines_own_symbol) {
    builtins.add(sym("grow"), Attributes::None,
        [] (const ExpressionRef &expr, const Evaluation &evaluation) -> BaseExpressionRef {
            for (machine_integer_t i = 0; i < 32; i++) {
                evaluation.context.define_down_value(
                    sym("pg"), call("pg", {num(i), num(i)}), num(i));
            }
            return expr->leaf(0);
        });

    // the rhs is evaluated while pg's rules are being tried
    context.define_down_value(sym("pg"), call("pg", {var("x")}),
        call("grow", {sym("x")}), RuleKind::Immediate);
    context.define_down_value(sym("pg"), call("pg", {num(0), var("y")}), str("late"));

    EXPECT_TRUE(same(eval(call("pg", {num(7)})), num(7)));
    EXPECT_EQ(context.rules(sym("pg").get(), ValueCategory::Down)->size(), size_t(34));
    EXPECT_TRUE(same(eval(call("pg", {num(3), num(3)})), num(3)));
}

TEST_F(Evaluate, rules_before_builtins) {
    context.define_down_value(system_symbols().Times,
        times_of({num(0), var("x")}), str("zero"), RuleKind::Delayed, BaseExpressionRef(), 0);
    EXPECT_TRUE(same(eval(times_of({num(0), num(5)})), str("zero")));
    EXPECT_TRUE(same(eval(times_of({num(2), num(5)})), num(10)));
}

TEST_F(Evaluate, format_values) {
    context.define_format_value(sym("f"), call("f", {var("x")}), call("shown", {sym("x")}));

    const Evaluation evaluation(context, builtins, output, EvaluationLimits());
    EXPECT_EQ(evaluation.format_output(call("g", {call("f", {num(1)})})), "g[shown[1]]");
    EXPECT_EQ(evaluation.format_output(num(1)), "1");

    context.add_message(sym("f"), "msg", "see `1`");
    evaluation.message(sym("f"), "msg", call("f", {num(2)}));
    EXPECT_TRUE(output->test_line("f::msg: see shown[2]"));

    // unknown messages are dropped
    evaluation.message(sym("f"), "unknown");
    EXPECT_TRUE(output->empty());
}

TEST_F(Evaluate, nested_contexts) {
    EvaluationContext child("Child", &context);
    context.define_own_value(sym("x"), num(2));
    child.define_own_value(sym("y"), num(3));

    const BaseExpressionRef item = times_of({sym("x"), sym("y")});
    EXPECT_TRUE(same(evaluate(item, child, builtins, output), num(6)));
    EXPECT_TRUE(same(evaluate(item, context, builtins, output), times_of({num(2), sym("y")})));
}

TEST(EvaluateSteps, flatten_sequence) {
    const ExpressionRef plain = call("f", {num(1)});
    EXPECT_EQ(flatten_sequence(plain), plain);

    EXPECT_TRUE(same(
        flatten_sequence(call("f", {sequence(LeafVector{num(1), num(2)}), num(3)})),
        call("f", {num(1), num(2), num(3)})));
}

TEST(EvaluateSteps, flatten_flat) {
    const ExpressionRef plain = call("f", {call("g", {num(1)})});
    EXPECT_EQ(flatten_flat(plain), plain);

    EXPECT_TRUE(same(
        flatten_flat(call("f", {call("f", {num(1), call("f", {num(2)})}), num(3)})),
        call("f", {num(1), num(2), num(3)})));
    const ExpressionRef nested = call("f", {num(1), call("f", {call("f", {num(2)}), call("g", {num(3)})})});
    const ExpressionRef flat = flatten_flat(nested);
    EXPECT_TRUE(same(flat, call("f", {num(1), num(2), call("g", {num(3)})})));
    EXPECT_EQ(flatten_flat(flat), flat);
}

TEST(EvaluateSteps, sort_orderless) {
    const ExpressionRef sorted = call("f", {num(1), sym("a")});
    EXPECT_EQ(sort_orderless(sorted), sorted);
    EXPECT_TRUE(same(sort_orderless(call("f", {sym("a"), num(1)})), sorted));
}

TEST(EvaluateSteps, thread_listable) {
    ExpressionRef threaded;
    EXPECT_EQ(thread_listable(call("f", {num(1)}), threaded), ThreadResult::NoLists);
    EXPECT_EQ(
        thread_listable(call("f", {list(LeafVector{num(1)}), list(LeafVector())}), threaded),
        ThreadResult::LengthMismatch);

    ASSERT_EQ(
        thread_listable(call("f", {list(LeafVector{num(1), num(2)}), num(3)}), threaded),
        ThreadResult::Threaded);
    EXPECT_TRUE(same(threaded, list(LeafVector{call("f", {num(1), num(3)}), call("f", {num(2), num(3)})})));
}
