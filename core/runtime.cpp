#include "core/runtime.h"
#include "core/atoms/integer.h"

#include "builtin/arithmetic.h"
#include "builtin/assignment.h"
#include "builtin/attributes.h"
#include "builtin/comparison.h"
#include "builtin/control.h"
#include "builtin/logic.h"
#include "builtin/patterns.h"
#include "builtin/structure.h"

void Runtime::init() {
	SymbolTable::init();
}

Runtime::Runtime(const OutputRef &output) :
	m_context("Global"),
	m_output(output ? output : std::make_shared<DefaultOutput>()) {

	const Symbols &symbols = system_symbols();
	const SymbolRef &General = symbols.General;

	m_context.add_message(General, "reclim", "Recursion depth of `1` exceeded.");
	m_context.add_message(General, "itlim", "Iteration limit of `1` exceeded.");
	m_context.add_message(General, "tdlen", "Objects of unequal length in `1` cannot be combined.");
	m_context.add_message(General, "bfail", "Evaluation of `1` failed: `2`.");
	m_context.add_message(General, "wrsym", "Symbol `1` is Protected.");
	m_context.add_message(General, "locked", "Symbol `1` is locked.");
	m_context.add_message(General, "sym", "Argument `1` at position `2` is expected to be a symbol.");
	m_context.add_message(General, "ssym", "`1` is not a symbol or a string.");
	m_context.add_message(General, "setraw", "Cannot assign to raw object `1`.");
	m_context.add_message(General, "reps", "`1` is not a valid replacement rule.");
	m_context.add_message(General, "attnf", "`1` is not a known attribute.");

	m_context.define_own_value(symbols.StateRecursionLimit,
		from_primitive(DefaultRecursionLimit));
	m_context.define_own_value(symbols.StateIterationLimit,
		from_primitive(DefaultIterationLimit));

	Builtins::Arithmetic(*this).initialize();
	Builtins::Assignment(*this).initialize();
	Builtins::AttributeFunctions(*this).initialize();
	Builtins::Comparison(*this).initialize();
	Builtins::Control(*this).initialize();
	Builtins::Logic(*this).initialize();
	Builtins::Patterns(*this).initialize();
	Builtins::Structure(*this).initialize();
}

void Runtime::add(
	const char *name,
	Attributes attributes,
	const BuiltinFunction &apply) {

	const SymbolRef symbol = lookup_symbol(name);
	m_builtins.add(symbol, attributes, apply);
	m_context.set_attributes(symbol, attributes);
}

BaseExpressionRef Runtime::evaluate(
	const BaseExpressionRef &item,
	optional<EvaluationLimits> limits) {

	return ::evaluate(item, m_context, m_builtins, m_output, limits);
}
