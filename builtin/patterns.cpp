#include "builtin/patterns.h"
#include "core/matcher.h"
#include "core/rule.h"

namespace {

// Rule and RuleDelayed expressions, alone or in a list, as rules. both kinds
// only substitute; the result is evaluated by the caller.
optional<std::vector<RuleRef>> to_rules(const BaseExpressionRef &item) {
	LeafVector items;
	if (item->is_expression() && item->as_expression()->head_ref()->symbol() == S::List) {
		items = item->as_expression()->leaves();
	} else {
		items.push_back(item);
	}

	std::vector<RuleRef> rules;
	rules.reserve(items.size());

	for (const BaseExpressionRef &rule : items) {
		if (rule->has_form(S::Rule, 2) || rule->has_form(S::RuleDelayed, 2)) {
			const Expression *expr = rule->as_expression();
			rules.push_back(std::make_shared<Rule>(expr->leaf(0), expr->leaf(1), RuleKind::Delayed));
		} else {
			return optional<std::vector<RuleRef>>();
		}
	}

	return rules;
}

// rewrites the outermost parts of item some rule applies to, head included.
BaseExpressionRef replace_all(
	const BaseExpressionRef &item,
	const std::vector<RuleRef> &rules,
	const Evaluation &evaluation) {

	for (const RuleRef &rule : rules) {
		const optional<BaseExpressionRef> result = rule->try_apply(item, &evaluation);
		if (result) {
			return *result;
		}
	}

	if (!item->is_expression()) {
		return item;
	}

	const Expression *expr = item->as_expression();

	ExpressionRef result = expr->map(
		[&rules, &evaluation] (const BaseExpressionRef &leaf) {
			return replace_all(leaf, rules, evaluation);
		});

	const BaseExpressionRef head = replace_all(expr->head_ref(), rules, evaluation);
	if (head != expr->head_ref()) {
		result = (result ? result.get() : expr)->with_head(head);
	}

	return result ? BaseExpressionRef(result) : item;
}

} // namespace

namespace Builtins {

void Patterns::initialize() {
	add("MatchQ", Attributes::Protected,
		builtin<2>(
			[] (const BaseExpressionRef &item, const BaseExpressionRef &patt, const Evaluation &evaluation) {
				const Match m = match(patt, item, Bindings(), &evaluation);
				return m ? evaluation.symbols.True : evaluation.symbols.False;
			}));

	add("Replace", Attributes::Protected,
		builtin<2>(
			[] (const BaseExpressionRef &item, const BaseExpressionRef &rules, const Evaluation &evaluation) {
				const optional<std::vector<RuleRef>> parsed = to_rules(rules);
				if (!parsed) {
					evaluation.message(evaluation.symbols.Replace, "reps", rules);
					return BaseExpressionRef();
				}
				return try_rules(*parsed, item, &evaluation);
			}));

	add("ReplaceAll", Attributes::Protected,
		builtin<2>(
			[] (const BaseExpressionRef &item, const BaseExpressionRef &rules, const Evaluation &evaluation) {
				const optional<std::vector<RuleRef>> parsed = to_rules(rules);
				if (!parsed) {
					evaluation.message(evaluation.symbols.ReplaceAll, "reps", rules);
					return BaseExpressionRef();
				}
				return replace_all(item, *parsed, evaluation);
			}));

	add("Rule", Attributes::Protected + Attributes::SequenceHold);
	add("RuleDelayed", Attributes::HoldRest + Attributes::Protected + Attributes::SequenceHold);

	add("Hold", Attributes::HoldAll + Attributes::Protected);
	add("HoldComplete", Attributes::HoldAllComplete + Attributes::Protected);
	add("HoldPattern", Attributes::HoldAll + Attributes::Protected);
	add("Unevaluated", Attributes::HoldAllComplete + Attributes::Protected);

	add("Condition", Attributes::HoldAll + Attributes::Protected);
	add("Pattern", Attributes::HoldFirst + Attributes::Protected);
	add("PatternTest", Attributes::HoldRest + Attributes::Protected);

	add("Blank", Attributes::Protected);
	add("BlankSequence", Attributes::Protected);
	add("BlankNullSequence", Attributes::Protected);
	add("Alternatives", Attributes::Protected);
	add("Optional", Attributes::Protected);
	add("Repeated", Attributes::Protected);
	add("RepeatedNull", Attributes::Protected);
	add("Except", Attributes::Protected);
	add("Verbatim", Attributes::Protected);
}

} // end namespace Builtins
