#ifndef TERMKERNEL_MATCH_H
#define TERMKERNEL_MATCH_H

#include "core/pattern/bindings.h"

// the outcome of matching a pattern. a failed match is an ordinary value,
// never an exception.
class Match {
private:
	bool m_success;
	Bindings m_bindings;

	inline Match(bool success, const Bindings &bindings) :
		m_success(success), m_bindings(bindings) {
	}

public:
	static inline Match none() {
		return Match(false, Bindings());
	}

	static inline Match success(const Bindings &bindings) {
		return Match(true, bindings);
	}

	inline explicit operator bool() const {
		return m_success;
	}

	inline bool succeeded() const {
		return m_success;
	}

	inline const Bindings &bindings() const {
		return m_bindings;
	}

	inline BaseExpressionRef operator[](const Symbol *name) const {
		return m_bindings.get(name);
	}
};

#endif
