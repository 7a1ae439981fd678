#ifndef TERMKERNEL_REWRITE_H
#define TERMKERNEL_REWRITE_H

#include "core/pattern/bindings.h"

// replaces every bound pattern variable in item by its value. a value of the
// form Sequence[...] that lands in a leaf position is spliced into the
// enclosing leaves. never evaluates; unchanged subtrees are shared.
BaseExpressionRef substitute(const BaseExpressionRef &item, const Bindings &bindings);

#endif
