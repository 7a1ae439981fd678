#ifndef TERMKERNEL_SYNCHRONIZED_H
#define TERMKERNEL_SYNCHRONIZED_H

#include <mutex>
#include <shared_mutex>
#include <utility>

#include "core/evaluate.h"

// shares one EvaluationContext between threads. evaluations run under a
// shared lock and may run concurrently; definitions go through modify(),
// which takes the lock exclusively. expressions given to evaluate() must
// not define anything (no Set, SetDelayed, Clear, SetAttributes, ...).
class SynchronizedContext {
private:
	mutable std::shared_timed_mutex m_mutex;
	EvaluationContext &m_context;
	const BuiltinDispatch &m_builtins;

public:
	explicit SynchronizedContext(
		EvaluationContext &context,
		const BuiltinDispatch &builtins = BuiltinRegistry::global()) :

		m_context(context),
		m_builtins(builtins) {
	}

	SynchronizedContext(const SynchronizedContext&) = delete;
	SynchronizedContext &operator=(const SynchronizedContext&) = delete;

	BaseExpressionRef evaluate(
		const BaseExpressionRef &item,
		const OutputRef &output = OutputRef(),
		optional<EvaluationLimits> limits = optional<EvaluationLimits>()) const {

		std::shared_lock<std::shared_timed_mutex> lock(m_mutex);
		return ::evaluate(item, m_context, m_builtins, output, limits);
	}

	// calls f(context) with exclusive access and returns its result.
	template<typename F>
	auto modify(const F &f) -> decltype(f(std::declval<EvaluationContext&>())) {
		std::unique_lock<std::shared_timed_mutex> lock(m_mutex);
		return f(m_context);
	}
};

#endif
