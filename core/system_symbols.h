// note: having List here first should guarantee that Lists
// are efficiently handled if they occur as "default" case
// in switch statements.

SYMBOL(List)
SYMBOL(Sequence)
SYMBOL(Rule)
SYMBOL(RuleDelayed)

SYMBOL(True)
SYMBOL(False)
SYMBOL(Null)
SYMBOL(StateFailed)

SYMBOL(Blank)
SYMBOL(BlankSequence)
SYMBOL(BlankNullSequence)
SYMBOL(Pattern)
SYMBOL(PatternTest)
SYMBOL(Condition)
SYMBOL(Optional)
SYMBOL(Alternatives)
SYMBOL(Repeated)
SYMBOL(RepeatedNull)
SYMBOL(Except)
SYMBOL(Verbatim)
SYMBOL(HoldPattern)
SYMBOL(Default)

SYMBOL(_Symbol)
SYMBOL(Integer)
SYMBOL(Real)
SYMBOL(Complex)
SYMBOL(String)

SYMBOL(Plus)
SYMBOL(Times)
SYMBOL(Power)

SYMBOL(Hold)
SYMBOL(HoldComplete)
SYMBOL(Unevaluated)
SYMBOL(Evaluate)
SYMBOL(N)

SYMBOL(Set)
SYMBOL(SetDelayed)
SYMBOL(Clear)
SYMBOL(ClearAll)

// names of the reference builtins

SYMBOL(Not)
SYMBOL(And)
SYMBOL(Or)
SYMBOL(If)
SYMBOL(CompoundExpression)
SYMBOL(SameQ)
SYMBOL(UnsameQ)
SYMBOL(Equal)
SYMBOL(Unequal)
SYMBOL(Less)
SYMBOL(LessEqual)
SYMBOL(Greater)
SYMBOL(GreaterEqual)
SYMBOL(Attributes)
SYMBOL(SetAttributes)
SYMBOL(ClearAttributes)
SYMBOL(MatchQ)
SYMBOL(Replace)
SYMBOL(ReplaceAll)
SYMBOL(Head)
SYMBOL(Length)
SYMBOL(IntegerQ)
SYMBOL(NumberQ)

// attribute names

SYMBOL(Orderless)
SYMBOL(Flat)
SYMBOL(OneIdentity)
SYMBOL(Listable)
SYMBOL(Constant)
SYMBOL(NumericFunction)
SYMBOL(Protected)
SYMBOL(Locked)
SYMBOL(ReadProtected)
SYMBOL(HoldFirst)
SYMBOL(HoldRest)
SYMBOL(HoldAll)
SYMBOL(HoldAllComplete)
SYMBOL(NHoldFirst)
SYMBOL(NHoldRest)
SYMBOL(NHoldAll)
SYMBOL(SequenceHold)
SYMBOL(Temporary)
SYMBOL(Stub)

SYMBOL(General)
SYMBOL(MessageName)

SYMBOL(StateRecursionLimit)
SYMBOL(StateIterationLimit)
