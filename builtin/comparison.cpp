#include "builtin/comparison.h"
#include "core/atoms/integer.h"
#include "core/atoms/real.h"
#include "core/atoms/complex.h"
#include "core/atoms/string.h"

namespace {

enum class Order {
	Less,
	Equal,
	Greater,
	Undecided
};

inline bool is_real_number(const BaseExpression *item) {
	switch (item->type()) {
		case MachineIntegerType:
		case BigIntegerType:
		case MachineRealType:
			return true;
		default:
			return false;
	}
}

inline machine_real_t real_value(const BaseExpression *item) {
	if (item->is_machine_real()) {
		return static_cast<const MachineReal*>(item)->value;
	} else {
		return to_mpz(item).get_d();
	}
}

// compares real numbers by value. integers compare exactly.
Order compare_reals(const BaseExpression *x, const BaseExpression *y) {
	if (!is_real_number(x) || !is_real_number(y)) {
		return Order::Undecided;
	}

	int sign;
	if (x->is_integer() && y->is_integer()) {
		sign = cmp(to_mpz(x), to_mpz(y));
	} else {
		const machine_real_t a = real_value(x);
		const machine_real_t b = real_value(y);
		if (a != a || b != b) { // NaN
			return Order::Undecided;
		}
		sign = a < b ? -1 : (a > b ? 1 : 0);
	}

	if (sign < 0) {
		return Order::Less;
	} else if (sign > 0) {
		return Order::Greater;
	} else {
		return Order::Equal;
	}
}

// nothing if x == y is undecidable without further knowledge.
optional<bool> equal(const BaseExpression *x, const BaseExpression *y) {
	if (x->same(*y)) {
		return true;
	}

	if (x->is_number() && y->is_number()) {
		if (x->is_machine_complex() || y->is_machine_complex()) {
			const auto as_complex = [] (const BaseExpression *item) {
				if (item->is_machine_complex()) {
					return static_cast<const MachineComplex*>(item)->value;
				} else {
					return std::complex<machine_real_t>(real_value(item), 0.);
				}
			};
			return as_complex(x) == as_complex(y);
		}
		return compare_reals(x, y) == Order::Equal;
	}

	if (x->is_string() && y->is_string()) {
		return false; // not same, so different
	}

	return optional<bool>();
}

inline BaseExpressionRef boolean(bool value) {
	const Symbols &symbols = system_symbols();
	return value ? symbols.True : symbols.False;
}

// applies an ordering test to every adjacent pair of leaves. nullptr if
// some pair cannot be compared.
template<typename Test>
BaseExpressionRef chain(const ExpressionRef &expr, const Test &test) {
	const size_t n = expr->size();

	for (size_t i = 0; i + 1 < n; i++) {
		const Order order = compare_reals(expr->leaf(i).get(), expr->leaf(i + 1).get());
		if (order == Order::Undecided) {
			return BaseExpressionRef();
		}
		if (!test(order)) {
			return boolean(false);
		}
	}

	return boolean(true);
}

} // namespace

namespace Builtins {

void Comparison::initialize() {
	add("SameQ", Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation&) {
			const size_t n = expr->size();
			for (size_t i = 0; i + 1 < n; i++) {
				if (!expr->leaf(i)->same(expr->leaf(i + 1))) {
					return boolean(false);
				}
			}
			return boolean(true);
		});

	add("UnsameQ", Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation&) {
			const size_t n = expr->size();
			for (size_t i = 0; i < n; i++) {
				for (size_t j = i + 1; j < n; j++) {
					if (expr->leaf(i)->same(expr->leaf(j))) {
						return boolean(false);
					}
				}
			}
			return boolean(true);
		});

	add("Equal", Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation&) {
			const size_t n = expr->size();
			for (size_t i = 0; i + 1 < n; i++) {
				const optional<bool> result = equal(expr->leaf(i).get(), expr->leaf(i + 1).get());
				if (!result) {
					return BaseExpressionRef();
				}
				if (!*result) {
					return boolean(false);
				}
			}
			return boolean(true);
		});

	add("Unequal", Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation&) {
			const size_t n = expr->size();
			for (size_t i = 0; i < n; i++) {
				for (size_t j = i + 1; j < n; j++) {
					const optional<bool> result = equal(expr->leaf(i).get(), expr->leaf(j).get());
					if (!result) {
						return BaseExpressionRef();
					}
					if (*result) {
						return boolean(false);
					}
				}
			}
			return boolean(true);
		});

	add("Less", Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation&) {
			return chain(expr, [] (Order order) {
				return order == Order::Less;
			});
		});

	add("LessEqual", Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation&) {
			return chain(expr, [] (Order order) {
				return order != Order::Greater;
			});
		});

	add("Greater", Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation&) {
			return chain(expr, [] (Order order) {
				return order == Order::Greater;
			});
		});

	add("GreaterEqual", Attributes::Protected,
		[] (const ExpressionRef &expr, const Evaluation&) {
			return chain(expr, [] (Order order) {
				return order != Order::Less;
			});
		});
}

} // end namespace Builtins
