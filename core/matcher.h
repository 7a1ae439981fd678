#ifndef TERMKERNEL_MATCHER_H
#define TERMKERNEL_MATCHER_H

#include "core/types.h"
#include "core/pattern/match.h"

// how the leaves of a sequence may be matched: Flat allows a single
// pattern to take a run of leaves (regrouped under head), Orderless allows
// patterns to take leaves in any order. head also selects DefaultValues
// for Optional patterns without an explicit default.
struct MatchOptions {
	BaseExpressionRef head;
	bool flat;
	bool orderless;

	inline MatchOptions() : flat(false), orderless(false) {
	}

	inline MatchOptions(const BaseExpressionRef &head_, bool flat_, bool orderless_) :
		head(head_), flat(flat_), orderless(orderless_) {
	}
};

// a pattern prepared for repeated matching. without an Evaluation, tests
// in Condition and PatternTest only pass if they already are True, and
// Flat and Orderless are taken from the local attributes of the item.
class Matcher {
private:
	const BaseExpressionRef m_patt;
	const Evaluation * const m_evaluation;

public:
	Matcher(const BaseExpressionRef &patt, const Evaluation *evaluation = nullptr);

	inline const BaseExpressionRef &pattern() const {
		return m_patt;
	}

	Match operator()(const BaseExpressionRef &item, const Bindings &bindings = Bindings()) const;
};

Match match(
	const BaseExpressionRef &patt,
	const BaseExpressionRef &item,
	const Bindings &bindings = Bindings(),
	const Evaluation *evaluation = nullptr);

// matches patts against items as the leaves of one expression.
Match match_sequence(
	const LeafVector &patts,
	const LeafVector &items,
	const Bindings &bindings = Bindings(),
	const MatchOptions &options = MatchOptions(),
	const Evaluation *evaluation = nullptr);

#endif
