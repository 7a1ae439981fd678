#include "core/atoms/complex.h"
#include "core/atoms/real.h"
#include "core/symbol.h"

std::string MachineComplex::debugform() const {
    return "Complex[" + format_machine_real(value.real()) + ", " +
        format_machine_real(value.imag()) + "]";
}

BaseExpressionRef MachineComplex::head() const {
    return system_symbols().Complex;
}
