#include "builtin/control.h"

namespace Builtins {

void Control::initialize() {
	add("If", Attributes::HoldRest + Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation &evaluation) -> BaseExpressionRef {
			const size_t n = expr->size();
			if (n < 2 || n > 4) {
				return BaseExpressionRef();
			}

			switch (expr->leaf(0)->symbol()) {
				case S::True:
					return expr->leaf(1);
				case S::False:
					if (n >= 3) {
						return expr->leaf(2);
					} else {
						return evaluation.symbols.Null;
					}
				default:
					if (n == 4) {
						return expr->leaf(3);
					} else {
						return BaseExpressionRef();
					}
			}
		});

	add("CompoundExpression", Attributes::HoldAll + Attributes::Protected + Attributes::ReadProtected,
		[] (const ExpressionRef &expr, const Evaluation &evaluation) {
			BaseExpressionRef result = evaluation.symbols.Null;
			for (const BaseExpressionRef &leaf : *expr) {
				result = evaluation.evaluate(leaf);
			}
			return result;
		});
}

} // end namespace Builtins
