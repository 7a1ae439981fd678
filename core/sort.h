#ifndef TERMKERNEL_SORT_H
#define TERMKERNEL_SORT_H

#include "core/types.h"

// canonical order: numbers < strings < symbols < expressions. numbers are
// ordered by value, everything else and all ties by printed form.
int compare_canonical(const BaseExpression &x, const BaseExpression &y);

struct CanonicalLess {
	inline bool operator()(const BaseExpressionRef &x, const BaseExpressionRef &y) const {
		return compare_canonical(*x, *y) < 0;
	}
};

// stable, so equal elements keep their relative order.
void sort_canonical(LeafVector &leaves);

#endif
