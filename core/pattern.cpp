#include <algorithm>

#include "core/pattern.h"

namespace {

inline BaseExpressionRef blank_of(const SymbolRef &head, const BaseExpressionRef &constraint) {
	if (constraint) {
		return expression(head, {constraint});
	} else {
		return expression(head, {});
	}
}

} // namespace

BaseExpressionRef blank(const BaseExpressionRef &head) {
	return blank_of(system_symbols().Blank, head);
}

BaseExpressionRef blank_sequence(const BaseExpressionRef &head) {
	return blank_of(system_symbols().BlankSequence, head);
}

BaseExpressionRef blank_null_sequence(const BaseExpressionRef &head) {
	return blank_of(system_symbols().BlankNullSequence, head);
}

BaseExpressionRef pattern(const SymbolRef &name, const BaseExpressionRef &patt) {
	if (!name) {
		throw ConstructionError("Pattern needs a symbol as its name");
	}
	return expression(system_symbols().Pattern, {name, patt});
}

BaseExpressionRef condition(const BaseExpressionRef &patt, const BaseExpressionRef &test) {
	return expression(system_symbols().Condition, {patt, test});
}

BaseExpressionRef alternatives(LeafVector &&alternatives) {
	return expression(system_symbols().Alternatives, std::move(alternatives));
}

BaseExpressionRef pattern_test(const BaseExpressionRef &patt, const BaseExpressionRef &test) {
	return expression(system_symbols().PatternTest, {patt, test});
}

BaseExpressionRef optional_pattern(
	const BaseExpressionRef &patt,
	const BaseExpressionRef &default_value) {

	if (default_value) {
		return expression(system_symbols().Optional, {patt, default_value});
	} else {
		return expression(system_symbols().Optional, {patt});
	}
}

BaseExpressionRef repeated(const BaseExpressionRef &patt) {
	return expression(system_symbols().Repeated, {patt});
}

BaseExpressionRef repeated_null(const BaseExpressionRef &patt) {
	return expression(system_symbols().RepeatedNull, {patt});
}

BaseExpressionRef except(
	const BaseExpressionRef &exclude,
	const BaseExpressionRef &patt) {

	if (patt) {
		return expression(system_symbols().Except, {exclude, patt});
	} else {
		return expression(system_symbols().Except, {exclude});
	}
}

BaseExpressionRef verbatim(const BaseExpressionRef &item) {
	return expression(system_symbols().Verbatim, {item});
}

BaseExpressionRef hold_pattern(const BaseExpressionRef &patt) {
	return expression(system_symbols().HoldPattern, {patt});
}

bool blank_matches_head(const Expression *blank, const BaseExpression &item) {
	if (blank->size() == 0) {
		return true;
	}
	return item.head()->same(*blank->leaf(0));
}

MatchSize pattern_match_size(const BaseExpression *patt) {
	if (!patt->is_expression()) {
		return MatchSize::exactly(1);
	}

	const Expression *expr = patt->as_expression();
	const size_t n = expr->size();

	switch (expr->head_ref()->symbol()) {
		case S::Blank:
			return MatchSize::exactly(1);

		case S::BlankSequence:
			return MatchSize::at_least(1);

		case S::BlankNullSequence:
			return MatchSize::at_least(0);

		case S::Pattern:
			if (n == 2) {
				return pattern_match_size(expr->leaf(1).get());
			}
			break;

		case S::Condition:
		case S::PatternTest:
			if (n == 2) {
				return pattern_match_size(expr->leaf(0).get());
			}
			break;

		case S::HoldPattern:
			if (n == 1) {
				return pattern_match_size(expr->leaf(0).get());
			}
			break;

		case S::Optional:
			if (n == 1 || n == 2) {
				return MatchSize::between(
					0, pattern_match_size(expr->leaf(0).get()).max());
			}
			break;

		case S::Repeated:
			if (n == 1) {
				return MatchSize::at_least(1);
			}
			break;

		case S::RepeatedNull:
			if (n == 1) {
				return MatchSize::at_least(0);
			}
			break;

		case S::Alternatives:
			if (n > 0) {
				match_size_t min = MatchSizeUnbounded;
				match_size_t max = 0;
				for (const BaseExpressionRef &alternative : *expr) {
					const MatchSize size = pattern_match_size(alternative.get());
					min = std::min(min, size.min());
					max = std::max(max, size.max());
				}
				return MatchSize::between(min, max);
			}
			break;

		default:
			break;
	}

	return MatchSize::exactly(1);
}

bool is_literal(const BaseExpression *item) {
	if (!item->is_expression()) {
		return true;
	}

	const Expression *expr = item->as_expression();
	switch (expr->head_ref()->symbol()) {
		case S::Blank:
		case S::BlankSequence:
		case S::BlankNullSequence:
		case S::Pattern:
		case S::Condition:
		case S::PatternTest:
		case S::Optional:
		case S::Alternatives:
		case S::Repeated:
		case S::RepeatedNull:
		case S::Except:
		case S::Verbatim:
		case S::HoldPattern:
			return false;
		default:
			break;
	}

	if (!is_literal(expr->head_ref().get())) {
		return false;
	}
	for (const BaseExpressionRef &leaf : *expr) {
		if (!is_literal(leaf.get())) {
			return false;
		}
	}
	return true;
}
