#ifndef TERMKERNEL_BUILTIN_ASSIGNMENT_H
#define TERMKERNEL_BUILTIN_ASSIGNMENT_H

#include "core/runtime.h"

namespace Builtins {

class Assignment : public Unit {
public:
	Assignment(Runtime &runtime) : Unit(runtime) {
	}

	void initialize();
};

} // end namespace Builtins

#endif //TERMKERNEL_BUILTIN_ASSIGNMENT_H
