#ifndef TERMKERNEL_BUILTIN_COMPARISON_H
#define TERMKERNEL_BUILTIN_COMPARISON_H

#include "core/runtime.h"

namespace Builtins {

class Comparison : public Unit {
public:
	Comparison(Runtime &runtime) : Unit(runtime) {
	}

	void initialize();
};

} // end namespace Builtins

#endif //TERMKERNEL_BUILTIN_COMPARISON_H
