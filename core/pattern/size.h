#ifndef TERMKERNEL_PATTERN_SIZE_H
#define TERMKERNEL_PATTERN_SIZE_H

#include <stdint.h>

typedef int64_t match_size_t;
constexpr match_size_t MatchSizeUnbounded = INT64_MAX >> 2; // sums of two stay finite

// the range of leaf counts a pattern consumes from a leaf sequence.
class MatchSize {
private:
	match_size_t m_min;
	match_size_t m_max;

	inline MatchSize(match_size_t min, match_size_t max) : m_min(min), m_max(max) {
	}

public:
	static inline MatchSize exactly(match_size_t n) {
		return MatchSize(n, n);
	}

	static inline MatchSize at_least(match_size_t n) {
		return MatchSize(n, MatchSizeUnbounded);
	}

	static inline MatchSize between(match_size_t min, match_size_t max) {
		return MatchSize(min, max);
	}

	inline match_size_t min() const {
		return m_min;
	}

	inline match_size_t max() const {
		return m_max;
	}

	inline bool contains(size_t n) const {
		return match_size_t(n) >= m_min && match_size_t(n) <= m_max;
	}

	// the size of a sequence of two patterns.
	inline MatchSize &operator+=(const MatchSize &size) {
		m_min += size.m_min;
		if (m_max == MatchSizeUnbounded || size.m_max == MatchSizeUnbounded) {
			m_max = MatchSizeUnbounded;
		} else {
			m_max += size.m_max;
		}
		return *this;
	}
};

#endif
