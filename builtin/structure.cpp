#include "builtin/structure.h"
#include "core/atoms/integer.h"
#include "core/atoms/real.h"

namespace {

inline BaseExpressionRef boolean(const Evaluation &evaluation, bool value) {
	return value ? evaluation.symbols.True : evaluation.symbols.False;
}

// turns exact numbers into machine reals, except below NHold heads.
BaseExpressionRef numericalize(const BaseExpressionRef &item, const Evaluation &evaluation) {
	switch (item->type()) {
		case MachineIntegerType:
		case BigIntegerType:
			return from_primitive(to_mpz(item.get()).get_d());

		case ExpressionType: {
			const Expression *expr = item->as_expression();
			const Attributes attributes = evaluation.effective_attributes(expr);
			const bool hold_first = attributes & Attributes::NHoldFirst;
			const bool hold_rest = attributes & Attributes::NHoldRest;

			size_t index = 0;
			const ExpressionRef result = expr->map(
				[&evaluation, &index, hold_first, hold_rest] (const BaseExpressionRef &leaf) {
					const bool hold = index++ == 0 ? hold_first : hold_rest;
					return hold ? BaseExpressionRef() : numericalize(leaf, evaluation);
				});

			return result ? BaseExpressionRef(result) : item;
		}

		default:
			return item;
	}
}

// enables NValues for the lifetime of the scope.
class NumericScope {
private:
	const Evaluation &m_evaluation;
	const bool m_numeric;

public:
	inline NumericScope(const Evaluation &evaluation) :
		m_evaluation(evaluation), m_numeric(evaluation.numeric) {

		evaluation.numeric = true;
	}

	inline ~NumericScope() {
		m_evaluation.numeric = m_numeric;
	}
};

} // namespace

namespace Builtins {

void Structure::initialize() {
	add("List", Attributes::Locked + Attributes::Protected);

	add("Sequence", Attributes::Protected);

	add("Evaluate", Attributes::Protected,
		builtin<1>(
			[] (const BaseExpressionRef &x, const Evaluation&) {
				return x;
			}));

	add("Head", Attributes::Protected,
		builtin<1>(
			[] (const BaseExpressionRef &x, const Evaluation&) {
				return x->head();
			}));

	add("Length", Attributes::Protected,
		builtin<1>(
			[] (const BaseExpressionRef &x, const Evaluation&) {
				if (x->is_expression()) {
					return from_primitive(machine_integer_t(x->as_expression()->size()));
				} else {
					return from_primitive(0);
				}
			}));

	add("IntegerQ", Attributes::Protected,
		builtin<1>(
			[] (const BaseExpressionRef &x, const Evaluation &evaluation) {
				return boolean(evaluation, x->is_integer());
			}));

	add("NumberQ", Attributes::Protected,
		builtin<1>(
			[] (const BaseExpressionRef &x, const Evaluation &evaluation) {
				return boolean(evaluation, x->is_number());
			}));

	// the argument is held so that NValues apply while it evaluates.
	add("N", Attributes::HoldAll + Attributes::Protected,
		builtin<1>(
			[] (const BaseExpressionRef &x, const Evaluation &evaluation) {
				const NumericScope scope(evaluation);
				const BaseExpressionRef value = evaluation.evaluate(x);
				return evaluation.evaluate(numericalize(value, evaluation));
			}));
}

} // end namespace Builtins
