#include "builtin/logic.h"

namespace {

// evaluates the leaves of expr in order until one evaluates to stop. leaves
// that evaluate to skip are dropped, the others are kept.
BaseExpressionRef short_circuit(
	const ExpressionRef &expr,
	const Evaluation &evaluation,
	const SymbolRef &stop,
	const SymbolRef &skip) {

	LeafVector rest;

	for (const BaseExpressionRef &leaf : *expr) {
		const BaseExpressionRef value = evaluation.evaluate(leaf);
		if (value == stop) {
			return stop;
		} else if (value != skip) {
			rest.push_back(value);
		}
	}

	switch (rest.size()) {
		case 0:
			return skip;
		case 1:
			return rest[0];
		default:
			return expression(expr->head_ref(), std::move(rest), expr->attributes());
	}
}

} // namespace

namespace Builtins {

void Logic::initialize() {
	add("Not", Attributes::Protected,
		builtin<1>(
			[] (const BaseExpressionRef &x, const Evaluation &evaluation) -> BaseExpressionRef {
				switch (x->symbol()) {
					case S::True:
						return evaluation.symbols.False;
					case S::False:
						return evaluation.symbols.True;
					default:
						if (x->has_form(S::Not, 1)) {
							return x->as_expression()->leaf(0);
						}
						return BaseExpressionRef();
				}
			}));

	add("And",
		Attributes::Flat + Attributes::HoldAll + Attributes::OneIdentity + Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation &evaluation) {
			return short_circuit(expr, evaluation,
				evaluation.symbols.False, evaluation.symbols.True);
		});

	add("Or",
		Attributes::Flat + Attributes::HoldAll + Attributes::OneIdentity + Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation &evaluation) {
			return short_circuit(expr, evaluation,
				evaluation.symbols.True, evaluation.symbols.False);
		});
}

} // end namespace Builtins
