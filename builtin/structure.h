#ifndef TERMKERNEL_BUILTIN_STRUCTURE_H
#define TERMKERNEL_BUILTIN_STRUCTURE_H

#include "core/runtime.h"

namespace Builtins {

class Structure : public Unit {
public:
	Structure(Runtime &runtime) : Unit(runtime) {
	}

	void initialize();
};

} // end namespace Builtins

#endif //TERMKERNEL_BUILTIN_STRUCTURE_H
