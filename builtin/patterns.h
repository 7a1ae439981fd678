#ifndef TERMKERNEL_BUILTIN_PATTERNS_H
#define TERMKERNEL_BUILTIN_PATTERNS_H

#include "core/runtime.h"

namespace Builtins {

class Patterns : public Unit {
public:
	Patterns(Runtime &runtime) : Unit(runtime) {
	}

	void initialize();
};

} // end namespace Builtins

#endif //TERMKERNEL_BUILTIN_PATTERNS_H
