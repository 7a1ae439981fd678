#include "core/definitions.h"
#include "core/expression.h"
#include "core/atoms/integer.h"

namespace {

const char *category_names[] = {
	"OwnValues",
	"DownValues",
	"UpValues",
	"SubValues",
	"NValues",
	"DefaultValues",
	"FormatValues"
};

struct DefinitionTarget {
	ValueCategory category;
	SymbolRef symbol;
	BaseExpressionRef pattern;
	BaseExpressionRef condition;
};

// see core/definitions.py:get_tag_position() in Mathics
DefinitionTarget get_definition_target(const BaseExpressionRef &lhs) {
	BaseExpressionRef pattern = lhs;
	BaseExpressionRef condition;

	if (pattern->has_form(S::Condition, 2)) {
		condition = pattern->as_expression()->leaf(1);
		pattern = pattern->as_expression()->leaf(0);
	}

	BaseExpressionRef tag = pattern;
	while (tag->has_form(S::HoldPattern, 1)) {
		tag = tag->as_expression()->leaf(0);
	}

	if (tag->is_symbol()) {
		return DefinitionTarget{
			ValueCategory::Own, static_pointer_cast_symbol(tag), pattern, condition};
	} else if (tag->is_expression()) {
		const BaseExpressionRef &head = tag->as_expression()->head_ref();
		if (head->is_symbol()) {
			return DefinitionTarget{
				ValueCategory::Down, static_pointer_cast_symbol(head), pattern, condition};
		}
		const SymbolRef root = root_symbol(head);
		if (root) {
			return DefinitionTarget{
				ValueCategory::Sub, root, pattern, condition};
		}
	}

	throw ConstructionError("cannot assign to " + lhs->debugform());
}

} // namespace

const char *value_category_name(ValueCategory category) {
	return category_names[static_cast<int>(category)];
}

DefinitionError::DefinitionError(const SymbolRef &symbol_, const std::string &what) :
	std::runtime_error(what), symbol(symbol_) {
}

Rules &SymbolState::mutable_rules(ValueCategory category) {
	if (!m_rules) {
		m_rules = std::make_shared<SymbolRules>();
	} else if (m_copy_on_write) {
		m_rules = std::make_shared<SymbolRules>(*m_rules);
	}
	m_copy_on_write = false;
	return (*m_rules)[category];
}

void SymbolState::clear_rules() {
	m_rules.reset();
	m_copy_on_write = false;
}

const std::string *SymbolState::message(const std::string &tag) const {
	if (!m_messages) {
		return nullptr;
	}
	const auto i = m_messages->find(tag);
	if (i != m_messages->end()) {
		return &i->second;
	} else {
		return nullptr;
	}
}

void SymbolState::add_message(const std::string &tag, const std::string &text) {
	auto messages = m_messages ?
		std::make_shared<MessageTexts>(*m_messages) : std::make_shared<MessageTexts>();
	(*messages)[tag] = text;
	m_messages = messages;
}

void SymbolState::clear_messages() {
	m_messages.reset();
}

EvaluationContext::EvaluationContext(const std::string &name, EvaluationContext *parent) :
	m_name(name), m_parent(parent) {
}

const SymbolState *EvaluationContext::lookup(const Symbol *symbol) const {
	for (const EvaluationContext *context = this; context; context = context->m_parent) {
		const auto i = context->m_symbols.find(symbol);
		if (i != context->m_symbols.end()) {
			return &i->second.second;
		}
	}
	return nullptr;
}

SymbolState &EvaluationContext::mutable_state(const SymbolRef &symbol) {
	const auto i = m_symbols.find(symbol.get());
	if (i != m_symbols.end()) {
		return i->second.second;
	}

	const SymbolState *inherited = m_parent ? m_parent->lookup(symbol.get()) : nullptr;
	if (inherited) {
		return m_symbols.emplace(symbol.get(),
			std::make_pair(symbol, SymbolState(*inherited))).first->second.second;
	} else {
		return m_symbols.emplace(symbol.get(),
			std::make_pair(symbol, SymbolState())).first->second.second;
	}
}

void EvaluationContext::check_protected(const SymbolRef &symbol) const {
	if (attributes(symbol.get()) & Attributes::Protected) {
		throw DefinitionError(symbol, "Symbol " + symbol->name() + " is Protected.");
	}
}

void EvaluationContext::check_locked(const SymbolRef &symbol) const {
	if (attributes(symbol.get()) & Attributes::Locked) {
		throw DefinitionError(symbol, "Symbol " + symbol->name() + " is Locked.");
	}
}

void EvaluationContext::set_attributes(const SymbolRef &symbol, Attributes attributes) {
	check_locked(symbol);
	mutable_state(symbol).set_attributes(attributes);
}

void EvaluationContext::add_attributes(const SymbolRef &symbol, Attributes attributes) {
	set_attributes(symbol, this->attributes(symbol.get()) + attributes);
}

void EvaluationContext::remove_attributes(const SymbolRef &symbol, Attributes attributes) {
	set_attributes(symbol, this->attributes(symbol.get()) - attributes);
}

const Rules *EvaluationContext::rules(const Symbol *symbol, ValueCategory category) const {
	const SymbolState *state = lookup(symbol);
	return state ? state->rules(category) : nullptr;
}

void EvaluationContext::define(ValueCategory category, const SymbolRef &symbol, const RuleRef &rule) {
	check_protected(symbol);
	mutable_state(symbol).mutable_rules(category).add(rule);
}

void EvaluationContext::define_own_value(
	const SymbolRef &symbol,
	const BaseExpressionRef &value,
	RuleKind kind,
	const BaseExpressionRef &condition,
	int priority) {

	define(ValueCategory::Own, symbol,
		std::make_shared<Rule>(symbol, value, kind, condition, priority));
}

void EvaluationContext::define_down_value(
	const SymbolRef &symbol,
	const BaseExpressionRef &pattern,
	const BaseExpressionRef &replacement,
	RuleKind kind,
	const BaseExpressionRef &condition,
	int priority) {

	define(ValueCategory::Down, symbol,
		std::make_shared<Rule>(pattern, replacement, kind, condition, priority));
}

void EvaluationContext::define_up_value(
	const SymbolRef &symbol,
	const BaseExpressionRef &pattern,
	const BaseExpressionRef &replacement,
	RuleKind kind,
	const BaseExpressionRef &condition,
	int priority) {

	define(ValueCategory::Up, symbol,
		std::make_shared<Rule>(pattern, replacement, kind, condition, priority));
}

void EvaluationContext::define_sub_value(
	const SymbolRef &symbol,
	const BaseExpressionRef &pattern,
	const BaseExpressionRef &replacement,
	RuleKind kind,
	const BaseExpressionRef &condition,
	int priority) {

	define(ValueCategory::Sub, symbol,
		std::make_shared<Rule>(pattern, replacement, kind, condition, priority));
}

void EvaluationContext::define_n_value(
	const SymbolRef &symbol,
	const BaseExpressionRef &pattern,
	const BaseExpressionRef &replacement,
	RuleKind kind,
	const BaseExpressionRef &condition,
	int priority) {

	define(ValueCategory::N, symbol,
		std::make_shared<Rule>(pattern, replacement, kind, condition, priority));
}

void EvaluationContext::define_default_value(
	const SymbolRef &symbol,
	const BaseExpressionRef &value,
	optional<size_t> position) {

	const SymbolRef &Default = system_symbols().Default;
	const BaseExpressionRef pattern = position ?
		expression(Default, {symbol, from_primitive(machine_integer_t(*position))}) :
		expression(Default, {symbol});

	define(ValueCategory::Default, symbol, std::make_shared<Rule>(pattern, value));
}

void EvaluationContext::define_format_value(
	const SymbolRef &symbol,
	const BaseExpressionRef &pattern,
	const BaseExpressionRef &replacement,
	RuleKind kind,
	const BaseExpressionRef &condition) {

	define(ValueCategory::Format, symbol,
		std::make_shared<Rule>(pattern, replacement, kind, condition));
}

ValueCategory EvaluationContext::add_rule(
	const BaseExpressionRef &lhs,
	const BaseExpressionRef &rhs,
	RuleKind kind,
	const BaseExpressionRef &condition) {

	const DefinitionTarget target = get_definition_target(lhs);

	BaseExpressionRef combined = condition;
	if (target.condition) {
		combined = condition ?
			expression(system_symbols().And, {target.condition, condition}) :
			target.condition;
	}

	define(target.category, target.symbol,
		std::make_shared<Rule>(target.pattern, rhs, kind, combined));

	return target.category;
}

void EvaluationContext::clear_values(
	const SymbolRef &symbol,
	optional<ValueCategory> category) {

	check_protected(symbol);

	if (!lookup(symbol.get())) {
		return;
	}

	SymbolState &state = mutable_state(symbol);
	if (category) {
		state.mutable_rules(*category).clear();
	} else {
		state.clear_rules();
	}
}

void EvaluationContext::clear_all(const SymbolRef &symbol) {
	check_protected(symbol);
	check_locked(symbol);

	SymbolState &state = mutable_state(symbol);
	state.clear_rules();
	state.set_attributes(Attributes::None);
	state.clear_messages();
}

void EvaluationContext::add_message(
	const SymbolRef &symbol,
	const std::string &tag,
	const std::string &text) {

	mutable_state(symbol).add_message(tag, text);
}

const std::string *EvaluationContext::message(const Symbol *symbol, const std::string &tag) const {
	const SymbolState *state = lookup(symbol);
	return state ? state->message(tag) : nullptr;
}
