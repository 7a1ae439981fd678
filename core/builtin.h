#ifndef TERMKERNEL_BUILTIN_H
#define TERMKERNEL_BUILTIN_H

#include <mutex>
#include <unordered_map>
#include <utility>

#include "core/types.h"
#include "core/attributes.h"
#include "core/expression.h"

// computes a builtin on an argument-evaluated expression. returns nullptr
// when the builtin does not apply; the expression then stays as it is.
typedef std::function<BaseExpressionRef(
	const ExpressionRef &expr,
	const Evaluation &evaluation)> BuiltinFunction;

class Builtin {
public:
	const SymbolRef symbol;
	const Attributes attributes;
	const BuiltinFunction apply;

	inline Builtin(
		const SymbolRef &symbol_,
		Attributes attributes_,
		const BuiltinFunction &apply_) :

		symbol(symbol_), attributes(attributes_), apply(apply_) {
	}
};

typedef std::shared_ptr<const Builtin> BuiltinRef;

// the evaluator's view of the builtin functions.
class BuiltinDispatch {
public:
	virtual ~BuiltinDispatch() {
	}

	// nullptr if symbol has no builtin.
	virtual BuiltinRef lookup_builtin(const Symbol *symbol) const = 0;
};

// a lock guarded symbol -> builtin table. lookups fall back to the parent
// registry, if any. global() is the process-wide instance the evaluator
// uses unless given another one.
class BuiltinRegistry : public BuiltinDispatch {
private:
	mutable std::mutex m_mutex;
	std::unordered_map<const Symbol*, BuiltinRef> m_builtins;
	const BuiltinRegistry * const m_parent;

public:
	explicit BuiltinRegistry(const BuiltinRegistry *parent = nullptr);

	BuiltinRegistry(const BuiltinRegistry&) = delete;
	BuiltinRegistry &operator=(const BuiltinRegistry&) = delete;

	static BuiltinRegistry &global();

	void add(const BuiltinRef &builtin);

	void add(const SymbolRef &symbol, Attributes attributes, const BuiltinFunction &apply);

	bool remove(const Symbol *symbol);

	void clear();

	size_t size() const;

	virtual BuiltinRef lookup_builtin(const Symbol *symbol) const;
};

template<typename F, size_t... I>
inline BaseExpressionRef apply_leaves(
	const F &f,
	const Expression *expr,
	const Evaluation &evaluation,
	std::index_sequence<I...>) {

	return f(expr->leaf(I)..., evaluation);
}

// wraps f(leaf_1, ..., leaf_N, evaluation) as a BuiltinFunction that only
// applies to expressions with exactly N leaves.
template<int N, typename F>
inline BuiltinFunction builtin(const F &f) {
	return [f] (const ExpressionRef &expr, const Evaluation &evaluation) -> BaseExpressionRef {
		if (expr->size() != N) {
			return BaseExpressionRef();
		}
		return apply_leaves(f, expr.get(), evaluation, std::make_index_sequence<N>());
	};
}

#endif
