#ifndef TERMKERNEL_RUNTIME_H
#define TERMKERNEL_RUNTIME_H

#include "core/types.h"
#include "core/builtin.h"
#include "core/definitions.h"
#include "core/evaluation.h"
#include "core/evaluate.h"
#include "core/output.h"

// a kernel: a global context with the reference builtins installed.
class Runtime {
private:
	BuiltinRegistry m_builtins;
	EvaluationContext m_context;
	OutputRef m_output;

public:
	static void init(); // call once

	explicit Runtime(const OutputRef &output = OutputRef());

	Runtime(const Runtime&) = delete;
	Runtime &operator=(const Runtime&) = delete;

	inline EvaluationContext &context() {
		return m_context;
	}

	inline BuiltinRegistry &builtins() {
		return m_builtins;
	}

	inline const Symbols &symbols() const {
		return system_symbols();
	}

	inline const OutputRef &output() const {
		return m_output;
	}

	// registers a builtin and sets its attributes in the global context.
	void add(
		const char *name,
		Attributes attributes,
		const BuiltinFunction &apply = BuiltinFunction());

	BaseExpressionRef evaluate(
		const BaseExpressionRef &item,
		optional<EvaluationLimits> limits = optional<EvaluationLimits>());
};

// a group of related builtins.
class Unit {
protected:
	Runtime &m_runtime;

	inline void add(
		const char *name,
		Attributes attributes,
		const BuiltinFunction &apply = BuiltinFunction()) {

		m_runtime.add(name, attributes, apply);
	}

public:
	Unit(Runtime &runtime) : m_runtime(runtime) {
	}
};

#endif
