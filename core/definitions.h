#ifndef TERMKERNEL_DEFINITIONS_H
#define TERMKERNEL_DEFINITIONS_H

#include <map>
#include <unordered_map>

#include "core/types.h"
#include "core/attributes.h"
#include "core/symbol.h"
#include "core/rule.h"

enum class ValueCategory : int {
	Own,
	Down,
	Up,
	Sub,
	N,
	Default,
	Format
};

constexpr size_t NumberOfValueCategories = 7;

// OwnValues, DownValues, ...
const char *value_category_name(ValueCategory category);

// a definition refused because of Protected or Locked.
class DefinitionError : public std::runtime_error {
public:
	const SymbolRef symbol;

	DefinitionError(const SymbolRef &symbol, const std::string &what);
};

class SymbolRules {
private:
	Rules m_rules[NumberOfValueCategories];

public:
	inline Rules &operator[](ValueCategory category) {
		return m_rules[static_cast<int>(category)];
	}

	inline const Rules &operator[](ValueCategory category) const {
		return m_rules[static_cast<int>(category)];
	}
};

typedef std::shared_ptr<SymbolRules> SymbolRulesRef;

typedef std::map<std::string, std::string> MessageTexts;

// attributes, values and message texts of one symbol in one context. copies
// share their rules until the first write.
class SymbolState {
private:
	Attributes m_attributes;
	bool m_attributes_set;
	SymbolRulesRef m_rules;
	std::shared_ptr<MessageTexts> m_messages;
	mutable bool m_copy_on_write;

public:
	inline SymbolState() :
		m_attributes(Attributes::None),
		m_attributes_set(false),
		m_copy_on_write(false) {
	}

	inline SymbolState(const SymbolState &state) :
		m_attributes(state.m_attributes),
		m_attributes_set(state.m_attributes_set),
		m_rules(state.m_rules),
		m_messages(state.m_messages),
		m_copy_on_write(true) {

		// both sides now share m_rules; whoever writes first copies.
		state.m_copy_on_write = true;
	}

	SymbolState &operator=(const SymbolState&) = delete;

	inline Attributes attributes() const {
		return m_attributes;
	}

	inline void set_attributes(Attributes attributes) {
		m_attributes = attributes;
		m_attributes_set = true;
	}

	// false for states that only carry rules or messages; their symbol's
	// attributes then come from its builtin, if any.
	inline bool attributes_set() const {
		return m_attributes_set;
	}

	inline bool has_attributes(Attributes attributes) const {
		return m_attributes & attributes;
	}

	// nullptr if there are no rules of that category.
	inline const Rules *rules(ValueCategory category) const {
		if (m_rules && !(*m_rules)[category].empty()) {
			return &(*m_rules)[category];
		} else {
			return nullptr;
		}
	}

	Rules &mutable_rules(ValueCategory category);

	void clear_rules();

	const std::string *message(const std::string &tag) const;

	void add_message(const std::string &tag, const std::string &text);

	void clear_messages();
};

// the kernel state definitions are made in: per symbol attributes and
// values. reads fall back through the parent chain, writes always go to
// this context, which first copies the inherited state. not synchronized,
// see SynchronizedContext.
class EvaluationContext {
private:
	const std::string m_name;
	EvaluationContext * const m_parent;

	std::unordered_map<const Symbol*, std::pair<SymbolRef, SymbolState>> m_symbols;

	void check_protected(const SymbolRef &symbol) const;

	void check_locked(const SymbolRef &symbol) const;

public:
	explicit EvaluationContext(
		const std::string &name = "Global",
		EvaluationContext *parent = nullptr);

	EvaluationContext(const EvaluationContext&) = delete;
	EvaluationContext &operator=(const EvaluationContext&) = delete;

	inline const std::string &name() const {
		return m_name;
	}

	inline EvaluationContext *parent() const {
		return m_parent;
	}

	// nullptr if no context in the chain knows symbol.
	const SymbolState *lookup(const Symbol *symbol) const;

	SymbolState &mutable_state(const SymbolRef &symbol);

	inline Attributes attributes(const Symbol *symbol) const {
		const SymbolState *state = lookup(symbol);
		return state ? state->attributes() : Attributes::None;
	}

	void set_attributes(const SymbolRef &symbol, Attributes attributes);

	void add_attributes(const SymbolRef &symbol, Attributes attributes);

	void remove_attributes(const SymbolRef &symbol, Attributes attributes);

	inline void clear_attributes(const SymbolRef &symbol) {
		set_attributes(symbol, Attributes::None);
	}

	const Rules *rules(const Symbol *symbol, ValueCategory category) const;

	void define(ValueCategory category, const SymbolRef &symbol, const RuleRef &rule);

	void define_own_value(
		const SymbolRef &symbol,
		const BaseExpressionRef &value,
		RuleKind kind = RuleKind::Delayed,
		const BaseExpressionRef &condition = BaseExpressionRef(),
		int priority = 0);

	void define_down_value(
		const SymbolRef &symbol,
		const BaseExpressionRef &pattern,
		const BaseExpressionRef &replacement,
		RuleKind kind = RuleKind::Delayed,
		const BaseExpressionRef &condition = BaseExpressionRef(),
		int priority = 0);

	void define_up_value(
		const SymbolRef &symbol,
		const BaseExpressionRef &pattern,
		const BaseExpressionRef &replacement,
		RuleKind kind = RuleKind::Delayed,
		const BaseExpressionRef &condition = BaseExpressionRef(),
		int priority = 0);

	void define_sub_value(
		const SymbolRef &symbol,
		const BaseExpressionRef &pattern,
		const BaseExpressionRef &replacement,
		RuleKind kind = RuleKind::Delayed,
		const BaseExpressionRef &condition = BaseExpressionRef(),
		int priority = 0);

	void define_n_value(
		const SymbolRef &symbol,
		const BaseExpressionRef &pattern,
		const BaseExpressionRef &replacement,
		RuleKind kind = RuleKind::Delayed,
		const BaseExpressionRef &condition = BaseExpressionRef(),
		int priority = 0);

	// the value of Default[symbol] or, given a position, Default[symbol, position].
	void define_default_value(
		const SymbolRef &symbol,
		const BaseExpressionRef &value,
		optional<size_t> position = optional<size_t>());

	void define_format_value(
		const SymbolRef &symbol,
		const BaseExpressionRef &pattern,
		const BaseExpressionRef &replacement,
		RuleKind kind = RuleKind::Delayed,
		const BaseExpressionRef &condition = BaseExpressionRef());

	// stores lhs -> rhs where Set and SetDelayed would: as an own value of a
	// symbol, a down value of the head, or a sub value of a curried head.
	ValueCategory add_rule(
		const BaseExpressionRef &lhs,
		const BaseExpressionRef &rhs,
		RuleKind kind,
		const BaseExpressionRef &condition = BaseExpressionRef());

	// without a category, clears all values but keeps attributes.
	void clear_values(
		const SymbolRef &symbol,
		optional<ValueCategory> category = optional<ValueCategory>());

	// values, attributes and messages.
	void clear_all(const SymbolRef &symbol);

	void add_message(const SymbolRef &symbol, const std::string &tag, const std::string &text);

	// looks up symbol::tag in the chain.
	const std::string *message(const Symbol *symbol, const std::string &tag) const;
};

#endif
