#ifndef TERMKERNEL_BUILTIN_ATTRIBUTES_H
#define TERMKERNEL_BUILTIN_ATTRIBUTES_H

#include "core/runtime.h"

namespace Builtins {

class AttributeFunctions : public Unit {
public:
	AttributeFunctions(Runtime &runtime) : Unit(runtime) {
	}

	void initialize();
};

} // end namespace Builtins

#endif //TERMKERNEL_BUILTIN_ATTRIBUTES_H
