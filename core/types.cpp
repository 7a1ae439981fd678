#include "core/types.h"

const char *type_name(Type type) {
	switch (type) {
		case SymbolType:
			return "Symbol";
		case MachineIntegerType:
			return "MachineInteger";
		case BigIntegerType:
			return "BigInteger";
		case MachineRealType:
			return "MachineReal";
		case MachineComplexType:
			return "MachineComplex";
		case StringType:
			return "String";
		case ExpressionType:
			return "Expression";
		default:
			return "Unknown";
	}
}
