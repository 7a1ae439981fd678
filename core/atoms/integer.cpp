#include "core/atoms/integer.h"
#include "core/symbol.h"

std::string MachineInteger::debugform() const {
	return std::to_string(value);
}

BaseExpressionRef MachineInteger::head() const {
    return system_symbols().Integer;
}

std::string BigInteger::debugform() const {
	return value.get_str();
}

BaseExpressionRef BigInteger::head() const {
    return system_symbols().Integer;
}

BaseExpressionRef Integer_from_mpz(const mpz_class &value) {
	if (value.fits_slong_p()) {
		return std::make_shared<MachineInteger>(value.get_si());
	} else {
		return std::make_shared<BigInteger>(value);
	}
}

mpz_class to_mpz(const BaseExpression *item) {
	switch (item->type()) {
		case MachineIntegerType:
			return mpz_class(static_cast<signed long>(
				static_cast<const MachineInteger*>(item)->value));
		case BigIntegerType:
			return static_cast<const BigInteger*>(item)->value;
		default:
			throw std::runtime_error("not an integer: " + item->debugform());
	}
}
