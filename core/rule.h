#ifndef TERMKERNEL_RULE_H
#define TERMKERNEL_RULE_H

#include "core/types.h"
#include "core/pattern/bindings.h"

enum class RuleKind : int {
	Immediate, // the substituted replacement is evaluated before it is returned
	Delayed    // the substituted replacement is returned as is
};

// builds the replacement from the bindings of a successful match.
typedef std::function<BaseExpressionRef(const Bindings &bindings)> NativeReplacement;

class Rule {
public:
	const BaseExpressionRef pattern;
	const BaseExpressionRef replacement; // null for native rules
	const NativeReplacement native;
	const RuleKind kind;
	const BaseExpressionRef condition; // may be null
	const int priority;

	Rule(
		const BaseExpressionRef &pattern,
		const BaseExpressionRef &replacement,
		RuleKind kind = RuleKind::Delayed,
		const BaseExpressionRef &condition = BaseExpressionRef(),
		int priority = 0);

	Rule(
		const BaseExpressionRef &pattern,
		const NativeReplacement &native,
		RuleKind kind = RuleKind::Delayed,
		const BaseExpressionRef &condition = BaseExpressionRef(),
		int priority = 0);

	// nothing if the pattern does not match or the condition does not
	// evaluate to True.
	optional<BaseExpressionRef> try_apply(
		const BaseExpressionRef &item,
		const Evaluation *evaluation) const;

	// same pattern and same condition, i.e. a redefinition.
	bool same_lhs(const Rule &rule) const;

	std::string debugform() const;
};

typedef std::shared_ptr<const Rule> RuleRef;

// the rewritten item and true, or the item and false.
std::pair<BaseExpressionRef, bool> apply_rule(
	const Rule &rule,
	const BaseExpressionRef &item,
	const Evaluation *evaluation = nullptr);

// tries rules by descending priority, ties in list order; returns the
// first rewrite or item itself.
BaseExpressionRef try_rules(
	const std::vector<RuleRef> &rules,
	const BaseExpressionRef &item,
	const Evaluation *evaluation = nullptr);

// a priority ordered rule list, as kept for each value category.
class Rules {
private:
	std::vector<RuleRef> m_rules;

public:
	// inserts after all rules of the same or higher priority. a rule
	// with the same lhs as an existing one replaces it in place.
	void add(const RuleRef &rule);

	optional<BaseExpressionRef> apply(
		const BaseExpressionRef &item,
		const Evaluation *evaluation) const;

	inline void clear() {
		m_rules.clear();
	}

	inline size_t size() const {
		return m_rules.size();
	}

	inline bool empty() const {
		return m_rules.empty();
	}

	inline const RuleRef &operator[](size_t i) const {
		return m_rules[i];
	}

	inline std::vector<RuleRef>::const_iterator begin() const {
		return m_rules.begin();
	}

	inline std::vector<RuleRef>::const_iterator end() const {
		return m_rules.end();
	}
};

#endif
