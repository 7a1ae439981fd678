#include <algorithm>

#include "core/rule.h"
#include "core/matcher.h"
#include "core/pattern/rewrite.h"
#include "core/evaluation.h"

Rule::Rule(
	const BaseExpressionRef &pattern_,
	const BaseExpressionRef &replacement_,
	RuleKind kind_,
	const BaseExpressionRef &condition_,
	int priority_) :

	pattern(pattern_),
	replacement(replacement_),
	kind(kind_),
	condition(condition_),
	priority(priority_) {

	if (!pattern || !replacement) {
		throw ConstructionError("Rule needs a pattern and a replacement");
	}
}

Rule::Rule(
	const BaseExpressionRef &pattern_,
	const NativeReplacement &native_,
	RuleKind kind_,
	const BaseExpressionRef &condition_,
	int priority_) :

	pattern(pattern_),
	native(native_),
	kind(kind_),
	condition(condition_),
	priority(priority_) {

	if (!pattern || !native) {
		throw ConstructionError("Rule needs a pattern and a replacement");
	}
}

optional<BaseExpressionRef> Rule::try_apply(
	const BaseExpressionRef &item,
	const Evaluation *evaluation) const {

	const Match m = match(pattern, item, Bindings(), evaluation);
	if (!m) {
		return optional<BaseExpressionRef>();
	}

	if (condition) {
		const BaseExpressionRef test = substitute(condition, m.bindings());
		const bool passed = evaluation ?
			evaluation->evaluate(test)->is_true() : test->is_true();
		if (!passed) {
			return optional<BaseExpressionRef>();
		}
	}

	BaseExpressionRef result = native ?
		native(m.bindings()) : substitute(replacement, m.bindings());
	if (!result) {
		return optional<BaseExpressionRef>();
	}

	if (kind == RuleKind::Immediate && evaluation) {
		result = evaluation->evaluate(result);
	}

	return result;
}

bool Rule::same_lhs(const Rule &rule) const {
	if (!pattern->same(*rule.pattern)) {
		return false;
	}
	if (condition && rule.condition) {
		return condition->same(*rule.condition);
	} else {
		return !condition && !rule.condition;
	}
}

std::string Rule::debugform() const {
	std::string s(kind == RuleKind::Immediate ? "Rule[" : "RuleDelayed[");
	s += pattern->debugform();
	s += ", ";
	s += replacement ? replacement->debugform() : std::string("<native>");
	s += "]";
	if (condition) {
		s += " /; ";
		s += condition->debugform();
	}
	return s;
}

std::pair<BaseExpressionRef, bool> apply_rule(
	const Rule &rule,
	const BaseExpressionRef &item,
	const Evaluation *evaluation) {

	const optional<BaseExpressionRef> result = rule.try_apply(item, evaluation);
	if (result) {
		return std::make_pair(*result, true);
	} else {
		return std::make_pair(item, false);
	}
}

BaseExpressionRef try_rules(
	const std::vector<RuleRef> &rules,
	const BaseExpressionRef &item,
	const Evaluation *evaluation) {

	std::vector<RuleRef> ordered(rules);
	std::stable_sort(ordered.begin(), ordered.end(),
		[] (const RuleRef &x, const RuleRef &y) {
			return x->priority > y->priority;
		});

	for (const RuleRef &rule : ordered) {
		const optional<BaseExpressionRef> result = rule->try_apply(item, evaluation);
		if (result) {
			return *result;
		}
	}

	return item;
}

void Rules::add(const RuleRef &rule) {
	for (RuleRef &existing : m_rules) {
		if (existing->priority == rule->priority && existing->same_lhs(*rule)) {
			existing = rule;
			return;
		}
	}

	const auto i = std::find_if(m_rules.begin(), m_rules.end(),
		[&rule] (const RuleRef &existing) {
			return existing->priority < rule->priority;
		});
	m_rules.insert(i, rule);
}

optional<BaseExpressionRef> Rules::apply(
	const BaseExpressionRef &item,
	const Evaluation *evaluation) const {

	// conditions and Immediate rhs may redefine or clear this list
	// while we walk it.
	const std::vector<RuleRef> rules(m_rules);

	for (const RuleRef &rule : rules) {
		const optional<BaseExpressionRef> result = rule->try_apply(item, evaluation);
		if (result) {
			return result;
		}
	}

	return optional<BaseExpressionRef>();
}
