#include <algorithm>

#include "core/evaluate.h"
#include "core/sort.h"

namespace {

inline bool has_head(const BaseExpressionRef &leaf, SymbolName head) {
	return leaf->is_expression() && leaf->as_expression()->head_ref()->symbol() == head;
}

inline bool is_sequence(const BaseExpressionRef &leaf) {
	return has_head(leaf, S::Sequence);
}

void flatten_into(LeafVector &leaves, const Expression *expr, const BaseExpression &head) {
	for (const BaseExpressionRef &leaf : *expr) {
		if (leaf->is_expression() && leaf->as_expression()->head_ref()->same(head)) {
			flatten_into(leaves, leaf->as_expression(), head);
		} else {
			leaves.push_back(leaf);
		}
	}
}

} // namespace

ExpressionRef flatten_sequence(const ExpressionRef &expr) {
	if (std::none_of(expr->begin(), expr->end(), is_sequence)) {
		return expr;
	}

	LeafVector leaves;
	leaves.reserve(expr->size());

	for (const BaseExpressionRef &leaf : *expr) {
		if (is_sequence(leaf)) {
			const Expression *seq = leaf->as_expression();
			leaves.insert(leaves.end(), seq->begin(), seq->end());
		} else {
			leaves.push_back(leaf);
		}
	}

	return expr->with_leaves(std::move(leaves));
}

ExpressionRef flatten_flat(const ExpressionRef &expr) {
	const BaseExpression &head = *expr->head_ref();

	const bool nested = std::any_of(expr->begin(), expr->end(),
		[&head] (const BaseExpressionRef &leaf) {
			return leaf->is_expression() && leaf->as_expression()->head_ref()->same(head);
		});

	if (!nested) {
		return expr;
	}

	LeafVector leaves;
	leaves.reserve(expr->size());
	flatten_into(leaves, expr.get(), head);
	return expr->with_leaves(std::move(leaves));
}

ExpressionRef sort_orderless(const ExpressionRef &expr) {
	if (std::is_sorted(expr->begin(), expr->end(), CanonicalLess())) {
		return expr;
	}

	LeafVector leaves(expr->leaves());
	sort_canonical(leaves);
	return expr->with_leaves(std::move(leaves));
}

ThreadResult thread_listable(const ExpressionRef &expr, ExpressionRef &threaded) {
	optional<size_t> length;

	for (const BaseExpressionRef &leaf : *expr) {
		if (has_head(leaf, S::List)) {
			const size_t n = leaf->as_expression()->size();
			if (length && *length != n) {
				return ThreadResult::LengthMismatch;
			}
			length = n;
		}
	}

	if (!length) {
		return ThreadResult::NoLists;
	}

	LeafVector items;
	items.reserve(*length);

	for (size_t i = 0; i < *length; i++) {
		LeafVector leaves;
		leaves.reserve(expr->size());

		for (const BaseExpressionRef &leaf : *expr) {
			if (has_head(leaf, S::List)) {
				leaves.push_back(leaf->as_expression()->leaf(i));
			} else {
				leaves.push_back(leaf);
			}
		}

		items.push_back(expression(expr->head_ref(), std::move(leaves), expr->attributes()));
	}

	threaded = list(std::move(items));
	return ThreadResult::Threaded;
}

BaseExpressionRef evaluate(
	const BaseExpressionRef &item,
	EvaluationContext &context,
	const BuiltinDispatch &builtins,
	const OutputRef &output,
	optional<EvaluationLimits> limits) {

	const Evaluation evaluation(
		context,
		builtins,
		output,
		limits ? *limits : EvaluationLimits::from_context(context));

	return evaluation.evaluate(item);
}
