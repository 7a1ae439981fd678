#ifndef TERMKERNEL_EVALUATE_H
#define TERMKERNEL_EVALUATE_H

#include "core/types.h"
#include "core/expression.h"
#include "core/evaluation.h"

// the rewriting steps the evaluator applies to an argument-evaluated
// expression. each returns expr itself if nothing changed.

// splices Sequence[...] leaves into the leaves of expr; Sequence[] vanishes.
ExpressionRef flatten_sequence(const ExpressionRef &expr);

// splices leaves with the same head as expr, recursively.
ExpressionRef flatten_flat(const ExpressionRef &expr);

// sorts the leaves into canonical order.
ExpressionRef sort_orderless(const ExpressionRef &expr);

enum class ThreadResult {
	NoLists,
	Threaded,
	LengthMismatch
};

// for f[{a, b}, {c, d}, e] sets threaded to {f[a, c, e], f[b, d, e]}.
ThreadResult thread_listable(const ExpressionRef &expr, ExpressionRef &threaded);

// evaluates item in context. limits default to the ones configured in the
// context, output to DefaultOutput.
BaseExpressionRef evaluate(
	const BaseExpressionRef &item,
	EvaluationContext &context,
	const BuiltinDispatch &builtins = BuiltinRegistry::global(),
	const OutputRef &output = OutputRef(),
	optional<EvaluationLimits> limits = optional<EvaluationLimits>());

#endif
