#ifndef TERMKERNEL_REAL_H
#define TERMKERNEL_REAL_H

#include <stdint.h>

#include "core/types.h"
#include "core/hash.h"

class MachineReal : public BaseExpression {
public:
    const machine_real_t value;

    explicit inline MachineReal(machine_real_t new_value) :
	    BaseExpression(MachineRealExtendedType), value(new_value) {
    }

    virtual std::string debugform() const;

    virtual BaseExpressionRef head() const final;

    virtual const Symbol *lookup_name() const {
        return nullptr;
    }

    virtual inline bool same(const BaseExpression &expr) const final {
        if (expr.is_machine_real()) {
            return value == static_cast<const MachineReal*>(&expr)->value;
        } else {
            return false;
        }
    }

    virtual hash_t hash() const {
        return hash_pair(machine_real_hash, hash_real(value));
    }
};

inline BaseExpressionRef from_primitive(machine_real_t value) {
    return std::make_shared<MachineReal>(value);
}

// prints like 1.5 or 2. (never as an integer)
std::string format_machine_real(machine_real_t value);

#endif
