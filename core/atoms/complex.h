#ifndef TERMKERNEL_COMPLEX_H
#define TERMKERNEL_COMPLEX_H

#include <complex>

#include "core/types.h"
#include "core/hash.h"

class MachineComplex : public BaseExpression {
public:
    const std::complex<machine_real_t> value;

    explicit inline MachineComplex(machine_real_t real, machine_real_t imag) :
        BaseExpression(MachineComplexExtendedType), value(real, imag) {
    }

    explicit inline MachineComplex(const std::complex<machine_real_t> &new_value) :
        BaseExpression(MachineComplexExtendedType), value(new_value) {
    }

    virtual std::string debugform() const;

    virtual BaseExpressionRef head() const final;

    virtual const Symbol *lookup_name() const {
        return nullptr;
    }

    virtual inline bool same(const BaseExpression &expr) const final {
        if (expr.is_machine_complex()) {
            return value == static_cast<const MachineComplex*>(&expr)->value;
        } else {
            return false;
        }
    }

    virtual hash_t hash() const {
        return hash_pair(machine_complex_hash, hash_complex(value));
    }
};

inline BaseExpressionRef from_primitive(const std::complex<machine_real_t> &value) {
    return std::make_shared<MachineComplex>(value);
}

#endif
