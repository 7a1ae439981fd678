#ifndef TERMKERNEL_BUILTIN_LOGIC_H
#define TERMKERNEL_BUILTIN_LOGIC_H

#include "core/runtime.h"

namespace Builtins {

class Logic : public Unit {
public:
	Logic(Runtime &runtime) : Unit(runtime) {
	}

	void initialize();
};

} // end namespace Builtins

#endif //TERMKERNEL_BUILTIN_LOGIC_H
