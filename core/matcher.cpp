#include "core/matcher.h"
#include "core/pattern.h"
#include "core/pattern/rewrite.h"
#include "core/evaluation.h"

namespace {

typedef std::function<bool(const Bindings &bindings)> MatchContinuation;

// called with the bindings so far, the value the first pattern consumed
// (a single leaf, a regrouped Flat run or a Sequence[...]) and the leaves
// that are still unmatched.
typedef std::function<bool(
	const Bindings &bindings,
	const BaseExpressionRef &value,
	const LeafVector &rest)> SequenceContinuation;

// enumerates the k-subsets of {0, ..., n - 1} in lexicographic order until
// f returns true.
template<typename F>
bool for_each_combination(size_t n, size_t k, const F &f) {
	if (k > n) {
		return false;
	}

	std::vector<size_t> chosen(k);
	for (size_t i = 0; i < k; i++) {
		chosen[i] = i;
	}

	while (true) {
		if (f(chosen)) {
			return true;
		}

		size_t i = k;
		while (i > 0 && chosen[i - 1] == n - k + i - 1) {
			i--;
		}
		if (i == 0) {
			return false;
		}
		chosen[i - 1]++;
		for (size_t j = i; j < k; j++) {
			chosen[j] = chosen[j - 1] + 1;
		}
	}
}

void split(
	const LeafVector &items,
	const std::vector<size_t> &chosen,
	LeafVector &taken,
	LeafVector &rest) {

	size_t j = 0;
	for (size_t i = 0; i < items.size(); i++) {
		if (j < chosen.size() && chosen[j] == i) {
			taken.push_back(items[i]);
			j++;
		} else {
			rest.push_back(items[i]);
		}
	}
}

class MatchContext {
private:
	const Evaluation * const m_evaluation;

	bool test(const BaseExpressionRef &test, const Bindings &bindings) const;

	bool test_item(const BaseExpressionRef &f, const BaseExpressionRef &item) const;

	BaseExpressionRef default_value(const MatchOptions &options, size_t position) const;

	bool match_expression(
		const Expression *patt,
		const Expression *item,
		const Bindings &bindings,
		const MatchContinuation &cont) const;

	bool match_first(
		const BaseExpressionRef &patt,
		size_t position,
		size_t reserve,
		const LeafVector &items,
		const Bindings &bindings,
		const MatchOptions &options,
		const SequenceContinuation &next) const;

	bool match_blank_sequence(
		const Expression *blank,
		size_t min,
		size_t available,
		const LeafVector &items,
		const Bindings &bindings,
		const MatchOptions &options,
		const SequenceContinuation &next) const;

	bool match_repeated(
		const BaseExpressionRef &patt,
		size_t min,
		size_t available,
		const LeafVector &items,
		const Bindings &bindings,
		const SequenceContinuation &next) const;

	bool match_optional(
		const Expression *patt,
		size_t position,
		size_t reserve,
		const LeafVector &items,
		const Bindings &bindings,
		const MatchOptions &options,
		const SequenceContinuation &next) const;

	bool match_single(
		const BaseExpressionRef &patt,
		size_t available,
		const LeafVector &items,
		const Bindings &bindings,
		const MatchOptions &options,
		const SequenceContinuation &next) const;

public:
	inline MatchContext(const Evaluation *evaluation) : m_evaluation(evaluation) {
	}

	MatchOptions options_for(const Expression *item) const;

	bool match(
		const BaseExpressionRef &patt,
		const BaseExpressionRef &item,
		const Bindings &bindings,
		const MatchContinuation &cont) const;

	bool match_sequence(
		const LeafVector &patts,
		size_t index,
		const LeafVector &items,
		const Bindings &bindings,
		const MatchOptions &options,
		const MatchContinuation &cont) const;
};

bool MatchContext::test(const BaseExpressionRef &test, const Bindings &bindings) const {
	const BaseExpressionRef substituted = substitute(test, bindings);
	if (m_evaluation) {
		return m_evaluation->evaluate(substituted)->is_true();
	} else {
		return substituted->is_true();
	}
}

bool MatchContext::test_item(const BaseExpressionRef &f, const BaseExpressionRef &item) const {
	if (!m_evaluation) {
		return false;
	}
	return m_evaluation->evaluate(expression(f, {item}))->is_true();
}

BaseExpressionRef MatchContext::default_value(const MatchOptions &options, size_t position) const {
	if (!m_evaluation || !options.head || !options.head->is_symbol()) {
		return BaseExpressionRef();
	}
	return m_evaluation->default_value(static_pointer_cast_symbol(options.head), position);
}

MatchOptions MatchContext::options_for(const Expression *item) const {
	const Attributes attributes = m_evaluation ?
		m_evaluation->effective_attributes(item) : item->attributes();

	return MatchOptions(
		item->head_ref(),
		attributes & Attributes::Flat,
		attributes & Attributes::Orderless);
}

bool MatchContext::match(
	const BaseExpressionRef &patt,
	const BaseExpressionRef &item,
	const Bindings &bindings,
	const MatchContinuation &cont) const {

	if (patt->is_expression()) {
		const Expression *p = patt->as_expression();
		const size_t n = p->size();

		switch (p->head_ref()->symbol()) {
			case S::HoldPattern:
				if (n == 1) {
					return match(p->leaf(0), item, bindings, cont);
				}
				break;

			case S::Verbatim:
				if (n == 1) {
					return p->leaf(0)->same(*item) && cont(bindings);
				}
				break;

			case S::Blank:
			case S::BlankSequence:
			case S::BlankNullSequence:
				if (n <= 1) {
					return blank_matches_head(p, *item) && cont(bindings);
				}
				break;

			case S::Pattern:
				if (n == 2 && p->leaf(0)->is_symbol()) {
					// a sequence pattern outside of a leaf list captures Sequence[item]
					const optional<Bindings> bound = bindings.try_bind(
						static_pointer_cast_symbol(p->leaf(0)),
						is_sequence_pattern(p->leaf(1).get()) ?
							BaseExpressionRef(sequence(LeafVector{item})) : item);
					if (!bound) {
						return false;
					}
					return match(p->leaf(1), item, *bound, cont);
				}
				break;

			case S::Condition:
				if (n == 2) {
					return match(p->leaf(0), item, bindings,
						[this, p, &cont] (const Bindings &inner) {
							return test(p->leaf(1), inner) && cont(inner);
						});
				}
				break;

			case S::Alternatives:
				for (const BaseExpressionRef &alternative : *p) {
					if (match(alternative, item, bindings, cont)) {
						return true;
					}
				}
				return false;

			case S::PatternTest:
				if (n == 2) {
					return match(p->leaf(0), item, bindings,
						[this, p, &item, &cont] (const Bindings &inner) {
							return test_item(p->leaf(1), item) && cont(inner);
						});
				}
				break;

			case S::Optional:
				if (n == 1 || n == 2) {
					return match(p->leaf(0), item, bindings, cont);
				}
				break;

			case S::Repeated:
			case S::RepeatedNull:
				if (n == 1) {
					return match(p->leaf(0), item, bindings, cont);
				}
				break;

			case S::Except:
				if (n == 1 || n == 2) {
					const bool excluded = match(p->leaf(0), item, bindings,
						[] (const Bindings&) {
							return true;
						});
					if (excluded) {
						return false;
					} else if (n == 2) {
						return match(p->leaf(1), item, bindings, cont);
					} else {
						return cont(bindings);
					}
				}
				break;

			default:
				break;
		}

		if (!item->is_expression()) {
			return false;
		}
		return match_expression(p, item->as_expression(), bindings, cont);
	}

	return patt->same(*item) && cont(bindings);
}

bool MatchContext::match_expression(
	const Expression *patt,
	const Expression *item,
	const Bindings &bindings,
	const MatchContinuation &cont) const {

	return match(patt->head_ref(), item->head_ref(), bindings,
		[this, patt, item, &cont] (const Bindings &inner) {
			const MatchOptions options = options_for(item);

			if (!options.flat) {
				MatchSize size = MatchSize::exactly(0);
				for (const BaseExpressionRef &leaf : *patt) {
					size += pattern_match_size(leaf.get());
				}
				if (!size.contains(item->size())) {
					return false;
				}
			}

			return match_sequence(patt->leaves(), 0, item->leaves(), inner, options, cont);
		});
}

bool MatchContext::match_sequence(
	const LeafVector &patts,
	size_t index,
	const LeafVector &items,
	const Bindings &bindings,
	const MatchOptions &options,
	const MatchContinuation &cont) const {

	if (index == patts.size()) {
		return items.empty() && cont(bindings);
	}

	size_t reserve = 0;
	for (size_t i = index + 1; i < patts.size(); i++) {
		reserve += pattern_match_size(patts[i].get()).min();
	}
	if (reserve > items.size()) {
		return false;
	}

	return match_first(patts[index], index + 1, reserve, items, bindings, options,
		[this, &patts, index, &options, &cont] (
			const Bindings &inner, const BaseExpressionRef&, const LeafVector &rest) {

			return match_sequence(patts, index + 1, rest, inner, options, cont);
		});
}

bool MatchContext::match_first(
	const BaseExpressionRef &patt,
	size_t position,
	size_t reserve,
	const LeafVector &items,
	const Bindings &bindings,
	const MatchOptions &options,
	const SequenceContinuation &next) const {

	const size_t available = items.size() - reserve;

	if (patt->is_expression()) {
		const Expression *p = patt->as_expression();
		const size_t n = p->size();
		const SymbolName head = p->head_ref()->symbol();

		switch (head) {
			case S::HoldPattern:
				if (n == 1) {
					return match_first(p->leaf(0), position, reserve, items, bindings, options, next);
				}
				break;

			case S::BlankSequence:
			case S::BlankNullSequence:
				if (n <= 1) {
					return match_blank_sequence(
						p, head == S::BlankSequence ? 1 : 0, available, items, bindings, options, next);
				}
				break;

			case S::Pattern:
				if (n == 2 && p->leaf(0)->is_symbol() && is_sequence_pattern(p->leaf(1).get())) {
					const SymbolRef name = static_pointer_cast_symbol(p->leaf(0));
					return match_first(p->leaf(1), position, reserve, items, bindings, options,
						[&name, &next] (
							const Bindings &inner, const BaseExpressionRef &value, const LeafVector &rest) {

							const optional<Bindings> bound = inner.try_bind(name, value);
							return bound && next(*bound, value, rest);
						});
				}
				break;

			case S::Condition:
				if (n == 2 && is_sequence_pattern(p->leaf(0).get())) {
					return match_first(p->leaf(0), position, reserve, items, bindings, options,
						[this, p, &next] (
							const Bindings &inner, const BaseExpressionRef &value, const LeafVector &rest) {

							return test(p->leaf(1), inner) && next(inner, value, rest);
						});
				}
				break;

			case S::PatternTest:
				if (n == 2 && is_sequence_pattern(p->leaf(0).get())) {
					return match_first(p->leaf(0), position, reserve, items, bindings, options,
						[this, p, &next] (
							const Bindings &inner, const BaseExpressionRef &value, const LeafVector &rest) {

							if (value->is_expression() &&
								value->as_expression()->head_ref()->symbol() == S::Sequence) {
								for (const BaseExpressionRef &leaf : *value->as_expression()) {
									if (!test_item(p->leaf(1), leaf)) {
										return false;
									}
								}
							} else if (!test_item(p->leaf(1), value)) {
								return false;
							}
							return next(inner, value, rest);
						});
				}
				break;

			case S::Alternatives:
				if (is_sequence_pattern(p)) {
					for (const BaseExpressionRef &alternative : *p) {
						if (match_first(alternative, position, reserve, items, bindings, options, next)) {
							return true;
						}
					}
					return false;
				}
				break;

			case S::Optional:
				if (n == 1 || n == 2) {
					return match_optional(p, position, reserve, items, bindings, options, next);
				}
				break;

			case S::Repeated:
			case S::RepeatedNull:
				if (n == 1) {
					return match_repeated(
						p->leaf(0), head == S::Repeated ? 1 : 0, available, items, bindings, next);
				}
				break;

			default:
				break;
		}
	}

	return match_single(patt, available, items, bindings, options, next);
}

bool MatchContext::match_blank_sequence(
	const Expression *blank,
	size_t min,
	size_t available,
	const LeafVector &items,
	const Bindings &bindings,
	const MatchOptions &options,
	const SequenceContinuation &next) const {

	if (options.orderless) {
		for (size_t k = min; k <= available; k++) {
			const bool found = for_each_combination(items.size(), k,
				[blank, &items, &bindings, &next] (const std::vector<size_t> &chosen) {
					LeafVector taken;
					LeafVector rest;
					split(items, chosen, taken, rest);
					for (const BaseExpressionRef &item : taken) {
						if (!blank_matches_head(blank, *item)) {
							return false;
						}
					}
					return next(bindings, sequence(std::move(taken)), rest);
				});
			if (found) {
				return true;
			}
		}
		return false;
	}

	// shortest first. once a leaf fails the head test, no longer prefix can match.
	for (size_t k = min; k <= available; k++) {
		if (k > 0 && !blank_matches_head(blank, *items[k - 1])) {
			return false;
		}
		if (next(bindings,
			sequence(LeafVector(items.begin(), items.begin() + k)),
			LeafVector(items.begin() + k, items.end()))) {
			return true;
		}
	}
	return false;
}

bool MatchContext::match_repeated(
	const BaseExpressionRef &patt,
	size_t min,
	size_t available,
	const LeafVector &items,
	const Bindings &bindings,
	const SequenceContinuation &next) const {

	std::function<bool(const Bindings&, size_t)> repeat;

	repeat = [this, &patt, min, available, &items, &next, &repeat] (
		const Bindings &current, size_t count) {

		if (count >= min) {
			if (next(current,
				sequence(LeafVector(items.begin(), items.begin() + count)),
				LeafVector(items.begin() + count, items.end()))) {
				return true;
			}
		}

		if (count < available) {
			return match(patt, items[count], current,
				[&repeat, count] (const Bindings &inner) {
					return repeat(inner, count + 1);
				});
		}

		return false;
	};

	return repeat(bindings, 0);
}

bool MatchContext::match_optional(
	const Expression *patt,
	size_t position,
	size_t reserve,
	const LeafVector &items,
	const Bindings &bindings,
	const MatchOptions &options,
	const SequenceContinuation &next) const {

	if (items.size() > reserve &&
		match_first(patt->leaf(0), position, reserve, items, bindings, options, next)) {
		return true;
	}

	const BaseExpressionRef value = patt->size() == 2 ?
		patt->leaf(1) : default_value(options, position);
	if (!value) {
		return false;
	}

	// matching the default binds the pattern variables inside patt.
	return match(patt->leaf(0), value, bindings,
		[&value, &items, &next] (const Bindings &inner) {
			return next(inner, value, items);
		});
}

bool MatchContext::match_single(
	const BaseExpressionRef &patt,
	size_t available,
	const LeafVector &items,
	const Bindings &bindings,
	const MatchOptions &options,
	const SequenceContinuation &next) const {

	if (available == 0) {
		return false;
	}

	if (options.orderless) {
		for (size_t i = 0; i < items.size(); i++) {
			const BaseExpressionRef &item = items[i];
			LeafVector rest;
			rest.reserve(items.size() - 1);
			rest.insert(rest.end(), items.begin(), items.begin() + i);
			rest.insert(rest.end(), items.begin() + i + 1, items.end());

			const bool found = match(patt, item, bindings,
				[&item, &rest, &next] (const Bindings &inner) {
					return next(inner, item, rest);
				});
			if (found) {
				return true;
			}
		}

		if (options.flat) {
			for (size_t k = 2; k <= available; k++) {
				const bool found = for_each_combination(items.size(), k,
					[this, &patt, &items, &bindings, &options, &next] (const std::vector<size_t> &chosen) {
						LeafVector taken;
						LeafVector rest;
						split(items, chosen, taken, rest);
						const BaseExpressionRef value = expression(options.head, std::move(taken));
						return match(patt, value, bindings,
							[&value, &rest, &next] (const Bindings &inner) {
								return next(inner, value, rest);
							});
					});
				if (found) {
					return true;
				}
			}
		}

		return false;
	}

	const size_t max = options.flat ? available : 1;
	for (size_t k = 1; k <= max; k++) {
		const BaseExpressionRef value = k == 1 ?
			items[0] : expression(options.head, LeafVector(items.begin(), items.begin() + k));
		const LeafVector rest(items.begin() + k, items.end());

		const bool found = match(patt, value, bindings,
			[&value, &rest, &next] (const Bindings &inner) {
				return next(inner, value, rest);
			});
		if (found) {
			return true;
		}
	}

	return false;
}

} // namespace

Matcher::Matcher(const BaseExpressionRef &patt, const Evaluation *evaluation) :
	m_patt(patt), m_evaluation(evaluation) {

	if (!m_patt) {
		throw ConstructionError("Matcher needs a pattern");
	}
}

Match Matcher::operator()(const BaseExpressionRef &item, const Bindings &bindings) const {
	return match(m_patt, item, bindings, m_evaluation);
}

Match match(
	const BaseExpressionRef &patt,
	const BaseExpressionRef &item,
	const Bindings &bindings,
	const Evaluation *evaluation) {

	const MatchContext context(evaluation);

	Bindings result;
	const bool found = context.match(patt, item, bindings,
		[&result] (const Bindings &matched) {
			result = matched;
			return true;
		});

	if (found) {
		return Match::success(result);
	} else {
		return Match::none();
	}
}

Match match_sequence(
	const LeafVector &patts,
	const LeafVector &items,
	const Bindings &bindings,
	const MatchOptions &options,
	const Evaluation *evaluation) {

	const MatchContext context(evaluation);

	Bindings result;
	const bool found = context.match_sequence(patts, 0, items, bindings, options,
		[&result] (const Bindings &matched) {
			result = matched;
			return true;
		});

	if (found) {
		return Match::success(result);
	} else {
		return Match::none();
	}
}
