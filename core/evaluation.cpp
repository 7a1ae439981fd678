#include <algorithm>

#include "core/evaluation.h"
#include "core/evaluate.h"
#include "core/atoms/integer.h"
#include "core/atoms/string.h"

RecursionLimitError::RecursionLimitError(int64_t limit_) :
	EvaluationError("recursion depth of " + std::to_string(limit_) + " exceeded"),
	limit(limit_) {
}

IterationLimitError::IterationLimitError(int64_t limit_, const BaseExpressionRef &expr_) :
	EvaluationError("iteration limit of " + std::to_string(limit_) +
		" exceeded while evaluating " + expr_->debugform()),
	limit(limit_),
	expr(expr_) {
}

namespace {

int64_t limit_value(const EvaluationContext &context, const SymbolRef &symbol, int64_t fallback) {
	const Rules *rules = context.rules(symbol.get(), ValueCategory::Own);
	if (!rules) {
		return fallback;
	}

	const optional<BaseExpressionRef> value = rules->apply(symbol, nullptr);
	if (value && (*value)->is_machine_integer()) {
		const machine_integer_t limit = static_cast<const MachineInteger*>(value->get())->value;
		if (limit > 0) {
			return limit;
		}
	}

	return fallback;
}

// counts the nesting of evaluate() calls.
class RecursionScope {
private:
	const Evaluation &m_evaluation;

public:
	inline RecursionScope(const Evaluation &evaluation) : m_evaluation(evaluation) {
		if (++evaluation.recursion_depth > evaluation.limits.recursion_limit) {
			--evaluation.recursion_depth;
			evaluation.message(evaluation.symbols.StateRecursionLimit, "reclim",
				from_primitive(evaluation.limits.recursion_limit));
			throw RecursionLimitError(evaluation.limits.recursion_limit);
		}
	}

	inline ~RecursionScope() {
		--m_evaluation.recursion_depth;
	}
};

} // namespace

EvaluationLimits EvaluationLimits::from_context(const EvaluationContext &context) {
	const Symbols &symbols = system_symbols();

	return EvaluationLimits(
		limit_value(context, symbols.StateRecursionLimit, DefaultRecursionLimit),
		limit_value(context, symbols.StateIterationLimit, DefaultIterationLimit));
}

std::mutex Evaluation::s_output_mutex;

Evaluation::Evaluation(
	EvaluationContext &context_,
	const BuiltinDispatch &builtins_,
	const OutputRef &output_,
	const EvaluationLimits &limits_) :

	context(context_),
	builtins(builtins_),
	symbols(system_symbols()),
	output(output_ ? output_ : std::make_shared<DefaultOutput>()),
	limits(limits_),
	recursion_depth(0),
	numeric(false) {
}

BaseExpressionRef Evaluation::evaluate(const BaseExpressionRef &item) const {
	const RecursionScope scope(*this);

	BaseExpressionRef current = item;
	int64_t iterations = 0;

	while (true) {
		Step step;

		switch (current->type()) {
			case SymbolType:
				step = evaluate_symbol(static_pointer_cast_symbol(current));
				break;

			case ExpressionType:
				step = evaluate_expression(static_pointer_cast_expression(current));
				break;

			default:
				return current;
		}

		if (!step.rewritten) {
			return step.value;
		}

		if (++iterations > limits.iteration_limit) {
			message(symbols.StateIterationLimit, "itlim", from_primitive(limits.iteration_limit));
			throw IterationLimitError(limits.iteration_limit, current);
		}

		current = step.value;
	}
}

Evaluation::Step Evaluation::evaluate_symbol(const SymbolRef &symbol) const {
	const Rules *own = context.rules(symbol.get(), ValueCategory::Own);
	if (own) {
		const optional<BaseExpressionRef> value = own->apply(symbol, this);
		if (value) {
			return Step{*value, true};
		}
	}

	if (numeric) {
		const Rules *n = context.rules(symbol.get(), ValueCategory::N);
		if (n) {
			const optional<BaseExpressionRef> value = n->apply(symbol, this);
			if (value) {
				return Step{*value, true};
			}
		}
	}

	return Step{symbol, false};
}

Evaluation::Step Evaluation::evaluate_expression(const ExpressionRef &expr) const {
	const BaseExpressionRef &head = expr->head_ref();

	// step 2
	const Attributes head_attributes = head->is_symbol() ?
		attributes_of(head->as_symbol()) : Attributes::None;

	ExpressionRef current = expr;
	if (!((head_attributes + expr->attributes()) & Attributes::HoldAllComplete)) {
		const BaseExpressionRef new_head = evaluate(head);
		if (new_head != head) {
			current = expr->with_head(new_head);
		}
	}

	// step 3
	const Attributes attributes = effective_attributes(current.get());
	const bool hold_complete = attributes & Attributes::HoldAllComplete;

	// step 4
	if (!hold_complete) {
		const bool hold_first = attributes & Attributes::HoldFirst;
		const bool hold_rest = attributes & Attributes::HoldRest;

		size_t index = 0;
		const ExpressionRef evaluated = current->map(
			[this, &index, hold_first, hold_rest] (const BaseExpressionRef &leaf) {
				const bool hold = index++ == 0 ? hold_first : hold_rest;

				if (leaf->has_form(S::Unevaluated, 1)) {
					return BaseExpressionRef();
				} else if (leaf->has_form(S::Evaluate, 1)) {
					return evaluate(leaf->as_expression()->leaf(0));
				} else if (hold) {
					return BaseExpressionRef();
				} else {
					return evaluate(leaf);
				}
			});

		if (evaluated) {
			current = evaluated;
		}
	}

	// step 5
	if (!hold_complete && !(attributes & Attributes::SequenceHold)) {
		current = flatten_sequence(current);
	}

	// step 6
	if (attributes & Attributes::Flat) {
		current = flatten_flat(current);
	}
	if (attributes & Attributes::Orderless) {
		current = sort_orderless(current);
	}

	// step 7
	if (attributes & Attributes::Listable) {
		ExpressionRef threaded;
		switch (thread_listable(current, threaded)) {
			case ThreadResult::Threaded:
				return Step{evaluate(threaded), false};

			case ThreadResult::LengthMismatch:
				message(symbols.General, "tdlen", current);
				break;

			case ThreadResult::NoLists:
				break;
		}
	}

	// steps 8 and 9
	const BaseExpressionRef result = dispatch(current, attributes);
	if (result) {
		return Step{result, true};
	} else {
		return Step{current, false};
	}
}

BaseExpressionRef Evaluation::dispatch(const ExpressionRef &expr, Attributes attributes) const {
	if (!(attributes & Attributes::HoldAllComplete)) {
		std::vector<const Symbol*> seen;

		for (const BaseExpressionRef &leaf : *expr) {
			const Symbol *name = leaf->lookup_name();
			if (!name || std::find(seen.begin(), seen.end(), name) != seen.end()) {
				continue;
			}
			seen.push_back(name);

			const Rules *up = context.rules(name, ValueCategory::Up);
			if (up) {
				const optional<BaseExpressionRef> result = up->apply(expr, this);
				if (result) {
					return *result;
				}
			}
		}
	}

	const BaseExpressionRef &head = expr->head_ref();

	if (head->is_symbol()) {
		const Rules *down = context.rules(head->as_symbol(), ValueCategory::Down);
		if (down) {
			const optional<BaseExpressionRef> result = down->apply(expr, this);
			if (result) {
				return *result;
			}
		}
	} else {
		const Symbol *root = expr->lookup_name();
		const Rules *sub = root ? context.rules(root, ValueCategory::Sub) : nullptr;
		if (sub) {
			const optional<BaseExpressionRef> result = sub->apply(expr, this);
			if (result) {
				return *result;
			}
		}
	}

	if (numeric) {
		const Symbol *name = expr->lookup_name();
		const Rules *n = name ? context.rules(name, ValueCategory::N) : nullptr;
		if (n) {
			const optional<BaseExpressionRef> result = n->apply(expr, this);
			if (result) {
				return *result;
			}
		}
	}

	if (head->is_symbol()) {
		const BuiltinRef builtin = builtins.lookup_builtin(head->as_symbol());
		if (builtin && builtin->apply) {
			return apply_builtin(*builtin, expr);
		}
	}

	return BaseExpressionRef();
}

BaseExpressionRef Evaluation::apply_builtin(const Builtin &builtin, const ExpressionRef &expr) const {
	BaseExpressionRef result;

	try {
		result = builtin.apply(expr, *this);
	} catch (const EvaluationError&) {
		throw;
	} catch (const std::exception &e) {
		message(builtin.symbol, "bfail", expr, from_primitive(e.what()));
		return BaseExpressionRef();
	}

	if (!result || result == expr || result->same(*expr)) {
		return BaseExpressionRef();
	} else {
		return result;
	}
}

Attributes Evaluation::attributes_of(const Symbol *symbol) const {
	const SymbolState *state = context.lookup(symbol);
	if (state && state->attributes_set()) {
		return state->attributes();
	}

	const BuiltinRef builtin = builtins.lookup_builtin(symbol);
	if (builtin) {
		return builtin->attributes;
	}

	return Attributes::None;
}

Attributes Evaluation::effective_attributes(const Expression *expr) const {
	const BaseExpressionRef &head = expr->head_ref();
	if (head->is_symbol()) {
		return attributes_of(head->as_symbol()) + expr->attributes();
	} else {
		return expr->attributes();
	}
}

BaseExpressionRef Evaluation::default_value(const SymbolRef &symbol, size_t position) const {
	const Rules *rules = context.rules(symbol.get(), ValueCategory::Default);
	if (!rules) {
		return BaseExpressionRef();
	}

	const optional<BaseExpressionRef> at_position = rules->apply(
		expression(symbols.Default, {symbol, from_primitive(machine_integer_t(position))}), this);
	if (at_position) {
		return *at_position;
	}

	const optional<BaseExpressionRef> value = rules->apply(
		expression(symbols.Default, {symbol}), this);
	if (value) {
		return *value;
	}

	return BaseExpressionRef();
}

BaseExpressionRef Evaluation::format(const BaseExpressionRef &item) const {
	BaseExpressionRef current = item;

	if (item->is_expression()) {
		const ExpressionRef formatted = item->as_expression()->map(
			[this] (const BaseExpressionRef &leaf) {
				return format(leaf);
			});
		if (formatted) {
			current = formatted;
		}
	}

	const Symbol *name = current->lookup_name();
	const Rules *rules = name ? context.rules(name, ValueCategory::Format) : nullptr;
	if (rules) {
		const optional<BaseExpressionRef> result = rules->apply(current, this);
		if (result) {
			return *result;
		}
	}

	return current;
}

std::string Evaluation::format_output(const BaseExpressionRef &item) const {
	return format(item)->debugform();
}

void Evaluation::write_message(const Symbol *name, const char *tag, std::string &&text) const {
	std::lock_guard<std::mutex> lock(s_output_mutex);
	output->write(name->name().c_str(), tag, std::move(text));
}
