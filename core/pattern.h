#ifndef TERMKERNEL_PATTERN_H
#define TERMKERNEL_PATTERN_H

#include "core/types.h"
#include "core/expression.h"

// builders for the pattern constructs. patterns are ordinary expressions
// with reserved heads, so these only save typing.

BaseExpressionRef blank(const BaseExpressionRef &head = BaseExpressionRef());

BaseExpressionRef blank_sequence(const BaseExpressionRef &head = BaseExpressionRef());

BaseExpressionRef blank_null_sequence(const BaseExpressionRef &head = BaseExpressionRef());

BaseExpressionRef pattern(const SymbolRef &name, const BaseExpressionRef &patt);

BaseExpressionRef condition(const BaseExpressionRef &patt, const BaseExpressionRef &test);

BaseExpressionRef alternatives(LeafVector &&alternatives);

BaseExpressionRef pattern_test(const BaseExpressionRef &patt, const BaseExpressionRef &test);

BaseExpressionRef optional_pattern(
	const BaseExpressionRef &patt,
	const BaseExpressionRef &default_value = BaseExpressionRef());

BaseExpressionRef repeated(const BaseExpressionRef &patt);

BaseExpressionRef repeated_null(const BaseExpressionRef &patt);

BaseExpressionRef except(
	const BaseExpressionRef &exclude,
	const BaseExpressionRef &patt = BaseExpressionRef());

BaseExpressionRef verbatim(const BaseExpressionRef &item);

BaseExpressionRef hold_pattern(const BaseExpressionRef &patt);

inline bool is_blank(const BaseExpression *item) {
	if (!item->is_expression() || item->as_expression()->size() > 1) {
		return false;
	}
	switch (item->as_expression()->head_ref()->symbol()) {
		case S::Blank:
		case S::BlankSequence:
		case S::BlankNullSequence:
			return true;
		default:
			return false;
	}
}

// true if item satisfies the head constraint of a Blank[h] family
// expression; unconstrained blanks accept everything.
bool blank_matches_head(const Expression *blank, const BaseExpression &item);

// the number of sequence elements patt may consume.
MatchSize pattern_match_size(const BaseExpression *patt);

inline bool is_sequence_pattern(const BaseExpression *patt) {
	const MatchSize size = pattern_match_size(patt);
	return size.min() != 1 || size.max() != 1;
}

// true if item contains no pattern constructs at all.
bool is_literal(const BaseExpression *item);

#endif
