#include <algorithm>

#include "core/sort.h"
#include "core/atoms/integer.h"
#include "core/atoms/real.h"
#include "core/atoms/complex.h"

namespace {

inline int type_order(const BaseExpression &x) {
	switch (x.type()) {
		case MachineIntegerType:
		case BigIntegerType:
		case MachineRealType:
		case MachineComplexType:
			return 0;
		case StringType:
			return 1;
		case SymbolType:
			return 2;
		default:
			return 3;
	}
}

template<typename T>
inline int compare_values(const T &x, const T &y) {
	if (x < y) {
		return -1;
	} else if (y < x) {
		return 1;
	} else {
		return 0;
	}
}

machine_real_t real_part(const BaseExpression &x) {
	switch (x.type()) {
		case MachineIntegerType:
			return machine_real_t(static_cast<const MachineInteger*>(&x)->value);
		case BigIntegerType:
			return static_cast<const BigInteger*>(&x)->value.get_d();
		case MachineRealType:
			return static_cast<const MachineReal*>(&x)->value;
		case MachineComplexType:
			return static_cast<const MachineComplex*>(&x)->value.real();
		default:
			throw std::runtime_error("not a number");
	}
}

int compare_numbers(const BaseExpression &x, const BaseExpression &y) {
	if (x.is_integer() && y.is_integer()) {
		if (x.is_machine_integer() && y.is_machine_integer()) {
			return compare_values(
				static_cast<const MachineInteger*>(&x)->value,
				static_cast<const MachineInteger*>(&y)->value);
		}
		return compare_values(to_mpz(&x), to_mpz(&y));
	}

	const int order = compare_values(real_part(x), real_part(y));
	if (order != 0) {
		return order;
	}

	const machine_real_t x_imag = x.is_machine_complex() ?
		static_cast<const MachineComplex*>(&x)->value.imag() : 0.;
	const machine_real_t y_imag = y.is_machine_complex() ?
		static_cast<const MachineComplex*>(&y)->value.imag() : 0.;
	return compare_values(x_imag, y_imag);
}

} // namespace

int compare_canonical(const BaseExpression &x, const BaseExpression &y) {
	const int x_order = type_order(x);
	const int y_order = type_order(y);

	if (x_order != y_order) {
		return x_order < y_order ? -1 : 1;
	}

	if (x_order == 0) {
		const int order = compare_numbers(x, y);
		if (order != 0) {
			return order;
		}
	}

	return x.debugform().compare(y.debugform());
}

void sort_canonical(LeafVector &leaves) {
	std::stable_sort(leaves.begin(), leaves.end(), CanonicalLess());
}
