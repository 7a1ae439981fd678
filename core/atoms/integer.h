#ifndef TERMKERNEL_INTEGER_H
#define TERMKERNEL_INTEGER_H

#include <gmpxx.h>
#include <stdint.h>

#include "core/types.h"
#include "core/hash.h"

class MachineInteger : public BaseExpression {
public:
    const machine_integer_t value;

    inline MachineInteger(machine_integer_t new_value) :
	    BaseExpression(MachineIntegerExtendedType), value(new_value) {
    }

	virtual std::string debugform() const;

    virtual BaseExpressionRef head() const final;

    virtual const Symbol *lookup_name() const {
        return nullptr;
    }

    virtual inline bool same(const BaseExpression &expr) const final {
        if (expr.is_machine_integer()) {
            return value == static_cast<const MachineInteger*>(&expr)->value;
        } else {
            return false;
        }
    }

    virtual hash_t hash() const {
	    return hash_pair(machine_integer_hash, value);
    }
};

// only holds values outside the machine_integer_t range, see Integer_from_mpz.
class BigInteger : public BaseExpression {
private:
    const hash_t m_hash;

public:
	const mpz_class value;

	inline BigInteger(const mpz_class &new_value) :
		BaseExpression(BigIntegerExtendedType),
		m_hash(hash_pair(big_integer_hash, hash_mpz(new_value))),
		value(new_value) {
	}

	virtual std::string debugform() const;

	virtual BaseExpressionRef head() const final;

    virtual const Symbol *lookup_name() const {
        return nullptr;
    }

    virtual inline bool same(const BaseExpression &expr) const final {
        if (expr.is_big_integer()) {
            return value == static_cast<const BigInteger*>(&expr)->value;
        } else {
            return false;
        }
    }

    virtual hash_t hash() const {
        return m_hash;
    }
};

inline BaseExpressionRef from_primitive(machine_integer_t value) {
    return std::make_shared<MachineInteger>(value);
}

inline BaseExpressionRef from_primitive(int value) {
    return std::make_shared<MachineInteger>(value);
}

BaseExpressionRef Integer_from_mpz(const mpz_class &value);

inline BaseExpressionRef from_primitive(const mpz_class &value) {
    return Integer_from_mpz(value);
}

// the exact value of an integer atom.
mpz_class to_mpz(const BaseExpression *item);

#endif
