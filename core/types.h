#ifndef TERMKERNEL_TYPES_H
#define TERMKERNEL_TYPES_H

#include <string>
#include <stdint.h>
#include <functional>
#include <vector>
#include <memory>
#include <cstdlib>
#include <stdexcept>
#include <ostream>

#include <experimental/optional>
using std::experimental::optional;

class BaseExpression;
typedef const BaseExpression* BaseExpressionPtr;
typedef std::shared_ptr<const BaseExpression> BaseExpressionRef;

enum Type : uint8_t {
	SymbolType = 0,
	MachineIntegerType = 1,
	BigIntegerType = 2,
	MachineRealType = 3,
	MachineComplexType = 4,
	StringType = 5,
	ExpressionType = 6,
    TypeCount
};

// CoreTypeShift is the number of bits needed to represent the additional
// extended type information attached to a core type.
constexpr int CoreTypeShift = 8;

// extended type infos carry the system symbol code for symbols.
enum ExtendedType {
	SymbolExtendedType = SymbolType << CoreTypeShift,
	MachineIntegerExtendedType = MachineIntegerType << CoreTypeShift,
	BigIntegerExtendedType = BigIntegerType << CoreTypeShift,
	MachineRealExtendedType = MachineRealType << CoreTypeShift,
	MachineComplexExtendedType = MachineComplexType << CoreTypeShift,
	StringExtendedType = StringType << CoreTypeShift,
	ExpressionExtendedType = ExpressionType << CoreTypeShift
};

namespace S {
	enum _Name {
		GENERIC = SymbolExtendedType,
		#define SYMBOL(SYMBOLNAME) SYMBOLNAME,
		#include "system_symbols.h"
		#undef SYMBOL
		_COUNT
	};
}

using SymbolName = S::_Name;

static_assert(S::_COUNT < (1 << CoreTypeShift), "too many system symbols for CoreTypeShift");

const char *type_name(Type type);

typedef int64_t index_t; // may be negative as well
constexpr index_t INDEX_MAX = INT64_MAX;

typedef int64_t machine_integer_t;
typedef double machine_real_t;

#include "core/hash.h"
#include "core/pattern/size.h"

class Symbol;
typedef std::shared_ptr<const Symbol> SymbolRef;
using SymbolPtr = const Symbol*;

class Expression;
typedef std::shared_ptr<const Expression> ExpressionRef;
typedef const Expression *ExpressionPtr;

class String;
typedef std::shared_ptr<const String> StringRef;

class Symbols;
class Evaluation;
class EvaluationContext;

typedef std::vector<BaseExpressionRef> LeafVector;

// malformed expressions, patterns and attribute lists.
class ConstructionError : public std::runtime_error {
public:
	ConstructionError(const std::string &what) : std::runtime_error(what) {
	}
};

class BaseExpression {
protected:
    const ExtendedType _extended_type;

	inline ExtendedType extended_type() const {
		return _extended_type;
	}

public:
    inline BaseExpression(ExtendedType type) : _extended_type(type) {
    }

    virtual ~BaseExpression() {
    }

	// FullForm text, e.g. Plus[1, x]
	virtual std::string debugform() const = 0;

	inline Type type() const {
		return Type(_extended_type >> CoreTypeShift);
	}

	inline SymbolName symbol() const {
		return SymbolName(extended_type());
	}

	inline bool is_symbol() const {
		return type() == SymbolType;
	}

	inline bool is_expression() const {
		return type() == ExpressionType;
	}

	inline bool is_atom() const {
		return type() != ExpressionType;
	}

	inline bool is_machine_integer() const {
		return type() == MachineIntegerType;
	}

	inline bool is_big_integer() const {
		return type() == BigIntegerType;
	}

	inline bool is_integer() const {
		return is_machine_integer() || is_big_integer();
	}

	inline bool is_machine_real() const {
		return type() == MachineRealType;
	}

	inline bool is_machine_complex() const {
		return type() == MachineComplexType;
	}

	inline bool is_string() const {
		return type() == StringType;
	}

	inline bool is_number() const {
		switch (type()) {
			case MachineIntegerType:
			case BigIntegerType:
			case MachineRealType:
			case MachineComplexType:
				return true;
			default:
				return false;
		}
	}

	inline bool is_true() const {
		return symbol() == S::True;
	}

	virtual bool same(const BaseExpression &expr) const = 0;

	inline bool same(const BaseExpressionRef &expr) const {
		return same(*expr);
	}

	virtual hash_t hash() const = 0;

	// Integer, Real, String, ... for atoms; the head for expressions.
	virtual BaseExpressionRef head() const = 0;

	// the root symbol of the head chain, or nullptr.
	virtual const Symbol *lookup_name() const = 0;

	inline bool has_form(SymbolName head, size_t n) const;

	inline const Symbol *as_symbol() const;

	inline const Expression *as_expression() const;
};

inline bool operator==(const BaseExpression &x, const BaseExpression &y) {
	return x.same(y);
}

inline bool operator!=(const BaseExpression &x, const BaseExpression &y) {
	return !x.same(y);
}

inline std::ostream &operator<<(std::ostream &s, const BaseExpression &expr) {
	s << expr.debugform();
	return s;
}

inline std::ostream &operator<<(std::ostream &s, const BaseExpressionRef &expr) {
	if (expr) {
		s << expr->debugform();
	} else {
		s << "null";
	}
	return s;
}

#endif
