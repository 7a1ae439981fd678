#ifndef TERMKERNEL_BUILTIN_ARITHMETIC_H
#define TERMKERNEL_BUILTIN_ARITHMETIC_H

#include "core/runtime.h"

namespace Builtins {

class Arithmetic : public Unit {
public:
	Arithmetic(Runtime &runtime) : Unit(runtime) {
	}

	void initialize();
};

} // end namespace Builtins

#endif //TERMKERNEL_BUILTIN_ARITHMETIC_H
