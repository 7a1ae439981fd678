#ifndef TERMKERNEL_TESTS_HELPERS_H
#define TERMKERNEL_TESTS_HELPERS_H

#include <gtest/gtest.h>

#include "core/types.h"
#include "core/symbol.h"
#include "core/expression.h"
#include "core/pattern.h"
#include "core/atoms/integer.h"
#include "core/atoms/real.h"
#include "core/atoms/string.h"

inline SymbolRef sym(const char *name) {
    return lookup_symbol(name);
}

inline BaseExpressionRef num(machine_integer_t value) {
    return from_primitive(value);
}

inline BaseExpressionRef str(const char *value) {
    return from_primitive(std::string(value));
}

// head[leaves...] with head given by name.
inline ExpressionRef call(const char *head, std::initializer_list<BaseExpressionRef> leaves) {
    return expression(lookup_symbol(head), leaves);
}

// name_
inline BaseExpressionRef var(const char *name) {
    return pattern(lookup_symbol(name), blank());
}

// name__
inline BaseExpressionRef seq(const char *name) {
    return pattern(lookup_symbol(name), blank_sequence());
}

// name___
inline BaseExpressionRef null_seq(const char *name) {
    return pattern(lookup_symbol(name), blank_null_sequence());
}

inline ::testing::AssertionResult same(const BaseExpressionRef &x, const BaseExpressionRef &y) {
    if (!x || !y) {
        return ::testing::AssertionFailure() << x << " vs " << y;
    } else if (x->same(*y)) {
        return ::testing::AssertionSuccess();
    } else {
        return ::testing::AssertionFailure() << x << " is not " << y;
    }
}

#endif //TERMKERNEL_TESTS_HELPERS_H
