#include "core/pattern/rewrite.h"
#include "core/expression.h"

namespace {

BaseExpressionRef replace(const BaseExpressionRef &item, const Bindings &bindings, bool &spliced);

ExpressionRef replace_expression(const Expression *expr, const Bindings &bindings) {
	bool head_spliced = false;
	const BaseExpressionRef head = replace(expr->head_ref(), bindings, head_spliced);
	bool changed = head.get() != expr->head_ref().get();

	LeafVector leaves;
	leaves.reserve(expr->size());

	for (const BaseExpressionRef &leaf : *expr) {
		bool spliced = false;
		const BaseExpressionRef value = replace(leaf, bindings, spliced);
		if (value.get() != leaf.get()) {
			changed = true;
		}
		if (spliced) {
			const Expression *sequence = value->as_expression();
			leaves.insert(leaves.end(), sequence->begin(), sequence->end());
		} else {
			leaves.push_back(value);
		}
	}

	if (!changed) {
		return ExpressionRef();
	}

	return std::make_shared<Expression>(head, std::move(leaves), expr->attributes());
}

BaseExpressionRef replace(const BaseExpressionRef &item, const Bindings &bindings, bool &spliced) {
	switch (item->type()) {
		case SymbolType: {
			const BaseExpressionRef value = bindings.get(item->as_symbol());
			if (value) {
				spliced = value->is_expression() &&
					value->as_expression()->head_ref()->symbol() == S::Sequence;
				return value;
			} else {
				return item;
			}
		}

		case ExpressionType: {
			const ExpressionRef replaced = replace_expression(item->as_expression(), bindings);
			if (replaced) {
				return replaced;
			} else {
				return item;
			}
		}

		default:
			return item;
	}
}

} // namespace

BaseExpressionRef substitute(const BaseExpressionRef &item, const Bindings &bindings) {
	if (bindings.empty()) {
		return item;
	}
	bool spliced = false;
	return replace(item, bindings, spliced);
}
