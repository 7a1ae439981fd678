#include <algorithm>
#include <cmath>
#include <complex>

#include "builtin/arithmetic.h"
#include "core/atoms/integer.h"
#include "core/atoms/real.h"
#include "core/atoms/complex.h"

namespace {

// an exact integer, a machine real or a machine complex. combining two
// numbers yields the more general kind of both.
class Number {
public:
	enum Kind {
		Integer = 0,
		Real = 1,
		Complex = 2
	};

private:
	Kind m_kind;
	mpz_class m_integer;
	std::complex<machine_real_t> m_inexact;

	inline std::complex<machine_real_t> as_complex() const {
		if (m_kind == Integer) {
			return std::complex<machine_real_t>(m_integer.get_d(), 0.);
		} else {
			return m_inexact;
		}
	}

public:
	explicit Number(const BaseExpression *item) {
		switch (item->type()) {
			case MachineIntegerType:
			case BigIntegerType:
				m_kind = Integer;
				m_integer = to_mpz(item);
				break;

			case MachineRealType:
				m_kind = Real;
				m_inexact = static_cast<const MachineReal*>(item)->value;
				break;

			case MachineComplexType:
				m_kind = Complex;
				m_inexact = static_cast<const MachineComplex*>(item)->value;
				break;

			default:
				throw std::invalid_argument("not a number: " + item->debugform());
		}
	}

	inline bool is_exactly(machine_integer_t value) const {
		return m_kind == Integer && m_integer == long(value);
	}

	void add(const Number &y) {
		if (m_kind == Integer && y.m_kind == Integer) {
			m_integer += y.m_integer;
		} else {
			m_inexact = as_complex() + y.as_complex();
			m_kind = std::max(m_kind, y.m_kind);
		}
	}

	void multiply(const Number &y) {
		if (m_kind == Integer && y.m_kind == Integer) {
			m_integer *= y.m_integer;
		} else {
			m_inexact = as_complex() * y.as_complex();
			m_kind = std::max(m_kind, y.m_kind);
		}
	}

	BaseExpressionRef value() const {
		switch (m_kind) {
			case Integer:
				return Integer_from_mpz(m_integer);
			case Real:
				return from_primitive(m_inexact.real());
			default:
				return from_primitive(m_inexact);
		}
	}
};

// folds all number leaves of expr into one and keeps the others in order.
template<typename Combine>
BaseExpressionRef fold_numbers(
	const ExpressionRef &expr,
	machine_integer_t identity,
	bool zero_absorbs,
	const Combine &combine) {

	optional<Number> folded;
	LeafVector rest;

	for (const BaseExpressionRef &leaf : *expr) {
		if (leaf->is_number()) {
			if (folded) {
				combine(*folded, Number(leaf.get()));
			} else {
				folded = Number(leaf.get());
			}
		} else {
			rest.push_back(leaf);
		}
	}

	if (zero_absorbs && folded && folded->is_exactly(0)) {
		return from_primitive(0);
	}

	LeafVector leaves;
	leaves.reserve(rest.size() + 1);
	if (folded && !folded->is_exactly(identity)) {
		leaves.push_back(folded->value());
	}
	leaves.insert(leaves.end(), rest.begin(), rest.end());

	switch (leaves.size()) {
		case 0:
			return from_primitive(identity);
		case 1:
			return leaves[0];
		default:
			return expression(expr->head_ref(), std::move(leaves), expr->attributes());
	}
}

BaseExpressionRef power(const BaseExpressionRef &base, const BaseExpressionRef &exponent) {
	if (exponent->is_integer()) {
		const mpz_class n = to_mpz(exponent.get());

		if (n == 1) {
			return base;
		}

		if (base->is_integer()) {
			const mpz_class b = to_mpz(base.get());

			if (n == 0) {
				return b == 0 ? BaseExpressionRef() : from_primitive(1);
			} else if (n > 0) {
				if (!n.fits_ulong_p()) {
					return BaseExpressionRef();
				}
				mpz_class r;
				mpz_pow_ui(r.get_mpz_t(), b.get_mpz_t(), n.get_ui());
				return Integer_from_mpz(r);
			} else if (b == 1) {
				return from_primitive(1);
			} else if (b == -1) {
				return from_primitive(mpz_odd_p(n.get_mpz_t()) ? -1 : 1);
			} else {
				// would be a rational
				return BaseExpressionRef();
			}
		}
	}

	if (!base->is_number() || !exponent->is_number()) {
		return BaseExpressionRef();
	}

	const auto to_complex = [] (const BaseExpressionRef &item) {
		switch (item->type()) {
			case MachineComplexType:
				return static_cast<const MachineComplex*>(item.get())->value;
			case MachineRealType:
				return std::complex<machine_real_t>(static_cast<const MachineReal*>(item.get())->value, 0.);
			default:
				return std::complex<machine_real_t>(to_mpz(item.get()).get_d(), 0.);
		}
	};

	const std::complex<machine_real_t> x = to_complex(base);
	const std::complex<machine_real_t> y = to_complex(exponent);

	if (x.imag() == 0. && y.imag() == 0. &&
		(x.real() >= 0. || std::trunc(y.real()) == y.real())) {
		return from_primitive(std::pow(x.real(), y.real()));
	} else {
		return from_primitive(std::pow(x, y));
	}
}

} // namespace

namespace Builtins {

void Arithmetic::initialize() {
	const Attributes arithmetic = Attributes::Flat + Attributes::Listable +
		Attributes::NumericFunction + Attributes::OneIdentity +
		Attributes::Orderless + Attributes::Protected;

	add("Plus", arithmetic,
		[] (const ExpressionRef &expr, const Evaluation&) {
			return fold_numbers(expr, 0, false,
				[] (Number &x, const Number &y) {
					x.add(y);
				});
		});

	add("Times", arithmetic,
		[] (const ExpressionRef &expr, const Evaluation&) {
			return fold_numbers(expr, 1, true,
				[] (Number &x, const Number &y) {
					x.multiply(y);
				});
		});

	add("Power",
		Attributes::Listable + Attributes::NumericFunction +
		Attributes::OneIdentity + Attributes::Protected,
		builtin<2>(
			[] (const BaseExpressionRef &base, const BaseExpressionRef &exponent, const Evaluation&) {
				return power(base, exponent);
			}));
}

} // end namespace Builtins
