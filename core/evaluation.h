#ifndef TERMKERNEL_EVALUATION_H
#define TERMKERNEL_EVALUATION_H

#include <mutex>
#include <sstream>

#include "core/types.h"
#include "core/symbol.h"
#include "core/expression.h"
#include "core/definitions.h"
#include "core/builtin.h"
#include "core/output.h"

// failures that end the current evaluation call.
class EvaluationError : public std::runtime_error {
public:
	EvaluationError(const std::string &what) : std::runtime_error(what) {
	}
};

class RecursionLimitError : public EvaluationError {
public:
	const int64_t limit;

	RecursionLimitError(int64_t limit);
};

class IterationLimitError : public EvaluationError {
public:
	const int64_t limit;
	const BaseExpressionRef expr; // the expression that kept changing

	IterationLimitError(int64_t limit, const BaseExpressionRef &expr);
};

constexpr int64_t DefaultRecursionLimit = 256;
constexpr int64_t DefaultIterationLimit = 1000;

struct EvaluationLimits {
	int64_t recursion_limit;
	int64_t iteration_limit;

	inline EvaluationLimits(
		int64_t recursion_limit_ = DefaultRecursionLimit,
		int64_t iteration_limit_ = DefaultIterationLimit) :

		recursion_limit(recursion_limit_),
		iteration_limit(iteration_limit_) {
	}

	// reads positive machine integer own values of $RecursionLimit and
	// $IterationLimit; uses the defaults for everything else.
	static EvaluationLimits from_context(const EvaluationContext &context);
};

inline std::string message_placeholder(size_t index) {
	std::ostringstream s;
	s << "`";
	s << index;
	s << "`";
	return s.str();
}

// the state of one top-level evaluate() call. not shared between threads;
// several Evaluations may read the same context as long as nobody defines
// into it meanwhile.
class Evaluation {
private:
	struct Step {
		BaseExpressionRef value;
		bool rewritten;
	};

	Step evaluate_symbol(const SymbolRef &symbol) const;

	Step evaluate_expression(const ExpressionRef &expr) const;

	// step 8: rules and builtins. nullptr if nothing applied.
	BaseExpressionRef dispatch(const ExpressionRef &expr, Attributes attributes) const;

	BaseExpressionRef apply_builtin(const Builtin &builtin, const ExpressionRef &expr) const;

	void write_message(const Symbol *name, const char *tag, std::string &&text) const;

	static std::mutex s_output_mutex;

public:
	EvaluationContext &context;
	const BuiltinDispatch &builtins;
	const Symbols &symbols;
	const OutputRef output;
	const EvaluationLimits limits;

	mutable int64_t recursion_depth;

	// set while N[] evaluates its argument; enables NValues.
	mutable bool numeric;

	Evaluation(
		EvaluationContext &context,
		const BuiltinDispatch &builtins,
		const OutputRef &output,
		const EvaluationLimits &limits);

	Evaluation(const Evaluation&) = delete;
	Evaluation &operator=(const Evaluation&) = delete;

	BaseExpressionRef evaluate(const BaseExpressionRef &item) const;

	// attributes set for symbol in the context chain, else those of its builtin.
	Attributes attributes_of(const Symbol *symbol) const;

	Attributes effective_attributes(const Expression *expr) const;

	// the value of Default[symbol, position], else Default[symbol], else nullptr.
	BaseExpressionRef default_value(const SymbolRef &symbol, size_t position) const;

	// item with FormatValues applied, innermost first.
	BaseExpressionRef format(const BaseExpressionRef &item) const;

	std::string format_output(const BaseExpressionRef &item) const;

	// writes symbol::tag, falling back to General::tag. `1`, `2`, ... in the
	// text are replaced by the formatted args. unknown messages are dropped.
	template<typename... Args>
	void message(const SymbolRef &name, const char *tag, const Args&... args) const;
};

#include "core/evaluation.tcc"

#endif
