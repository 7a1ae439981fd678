#include "builtin/assignment.h"
#include "core/atoms/string.h"

namespace {

BaseExpressionRef assign(
	const SymbolRef &head,
	const BaseExpressionRef &lhs,
	const BaseExpressionRef &rhs,
	RuleKind kind,
	const BaseExpressionRef &condition,
	const Evaluation &evaluation) {

	try {
		evaluation.context.add_rule(lhs, rhs, kind, condition);
	} catch (const DefinitionError &e) {
		evaluation.message(head, "wrsym", e.symbol);
		return evaluation.symbols.StateFailed;
	} catch (const ConstructionError&) {
		evaluation.message(head, "setraw", lhs);
		return evaluation.symbols.StateFailed;
	}

	return kind == RuleKind::Immediate ? rhs : evaluation.symbols.Null;
}

// the symbol named by a Clear argument, which may be a symbol or a string.
SymbolRef clear_target(const SymbolRef &head, const BaseExpressionRef &leaf, const Evaluation &evaluation) {
	switch (leaf->type()) {
		case SymbolType:
			return static_pointer_cast_symbol(leaf);
		case StringType:
			return lookup_symbol(static_cast<const String*>(leaf.get())->utf8());
		default:
			evaluation.message(head, "ssym", leaf);
			return SymbolRef();
	}
}

template<typename Clear>
BaseExpressionRef clear_symbols(
	const ExpressionRef &expr,
	const Evaluation &evaluation,
	const Clear &clear) {

	const SymbolRef head = static_pointer_cast_symbol(expr->head_ref());

	for (const BaseExpressionRef &leaf : *expr) {
		const SymbolRef symbol = clear_target(head, leaf, evaluation);
		if (!symbol) {
			continue;
		}
		try {
			clear(symbol);
		} catch (const DefinitionError &e) {
			evaluation.message(head, "wrsym", e.symbol);
		}
	}

	return evaluation.symbols.Null;
}

} // namespace

namespace Builtins {

void Assignment::initialize() {
	add("Set", Attributes::HoldFirst + Attributes::Protected + Attributes::SequenceHold,
		builtin<2>(
			[] (const BaseExpressionRef &lhs, const BaseExpressionRef &rhs, const Evaluation &evaluation) {
				return assign(evaluation.symbols.Set, lhs, rhs,
					RuleKind::Immediate, BaseExpressionRef(), evaluation);
			}));

	add("SetDelayed", Attributes::HoldAll + Attributes::Protected + Attributes::SequenceHold,
		builtin<2>(
			[] (const BaseExpressionRef &lhs, const BaseExpressionRef &rhs, const Evaluation &evaluation) {
				// f[x_] := r /; test defines a conditional rule
				if (rhs->has_form(S::Condition, 2)) {
					const Expression *condition = rhs->as_expression();
					return assign(evaluation.symbols.SetDelayed, lhs, condition->leaf(0),
						RuleKind::Delayed, condition->leaf(1), evaluation);
				} else {
					return assign(evaluation.symbols.SetDelayed, lhs, rhs,
						RuleKind::Delayed, BaseExpressionRef(), evaluation);
				}
			}));

	add("Clear", Attributes::HoldAll + Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation &evaluation) {
			return clear_symbols(expr, evaluation,
				[&evaluation] (const SymbolRef &symbol) {
					evaluation.context.clear_values(symbol);
				});
		});

	add("ClearAll", Attributes::HoldAll + Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation &evaluation) {
			return clear_symbols(expr, evaluation,
				[&evaluation] (const SymbolRef &symbol) {
					evaluation.context.clear_all(symbol);
				});
		});
}

} // end namespace Builtins
