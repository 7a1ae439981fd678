#include "builtin/attributes.h"
#include "core/atoms/integer.h"
#include "core/atoms/string.h"

namespace {

// the symbols of a symbol, string or list of them; nothing if some leaf is
// neither.
optional<std::vector<SymbolRef>> symbols_of(const BaseExpressionRef &item) {
	std::vector<SymbolRef> symbols;

	const auto add = [&symbols] (const BaseExpressionRef &leaf) {
		switch (leaf->type()) {
			case SymbolType:
				symbols.push_back(static_pointer_cast_symbol(leaf));
				return true;
			case StringType:
				symbols.push_back(lookup_symbol(static_cast<const String*>(leaf.get())->utf8()));
				return true;
			default:
				return false;
		}
	};

	if (item->is_expression() && item->as_expression()->head_ref()->symbol() == S::List) {
		for (const BaseExpressionRef &leaf : *item->as_expression()) {
			if (!add(leaf)) {
				return optional<std::vector<SymbolRef>>();
			}
		}
	} else if (!add(item)) {
		return optional<std::vector<SymbolRef>>();
	}

	return symbols;
}

// the attribute set named by a symbol or a list of symbols.
optional<Attributes> attributes_of(
	const SymbolRef &head,
	const BaseExpressionRef &item,
	const Evaluation &evaluation) {

	LeafVector names;
	if (item->is_expression() && item->as_expression()->head_ref()->symbol() == S::List) {
		names = item->as_expression()->leaves();
	} else {
		names.push_back(item);
	}

	for (const BaseExpressionRef &name : names) {
		if (!name->is_symbol() || !attribute_from_symbol(name->as_symbol())) {
			evaluation.message(head, "attnf", name);
			return optional<Attributes>();
		}
	}

	return attributes_from_symbols(names);
}

template<typename Modify>
BaseExpressionRef modify_attributes(
	const SymbolRef &head,
	const BaseExpressionRef &targets,
	const BaseExpressionRef &names,
	const Evaluation &evaluation,
	const Modify &modify) {

	const optional<std::vector<SymbolRef>> symbols = symbols_of(targets);
	if (!symbols) {
		evaluation.message(head, "sym", targets, from_primitive(1));
		return BaseExpressionRef();
	}

	const optional<Attributes> attributes = attributes_of(head, names, evaluation);
	if (!attributes) {
		return BaseExpressionRef();
	}

	for (const SymbolRef &symbol : *symbols) {
		try {
			modify(symbol, *attributes);
		} catch (const DefinitionError &e) {
			evaluation.message(head, "locked", e.symbol);
		}
	}

	return evaluation.symbols.Null;
}

} // namespace

namespace Builtins {

void AttributeFunctions::initialize() {
	add("Attributes", Attributes::HoldAll + Attributes::Listable + Attributes::Protected,
		builtin<1>(
			[] (const BaseExpressionRef &item, const Evaluation &evaluation) -> BaseExpressionRef {
				const optional<std::vector<SymbolRef>> symbols = symbols_of(item);
				if (!symbols || symbols->size() != 1) {
					evaluation.message(evaluation.symbols.Attributes, "ssym", item);
					return BaseExpressionRef();
				}

				LeafVector leaves;
				for (const SymbolRef &symbol : attributes_to_symbols(
					evaluation.attributes_of(symbols->front().get()))) {
					leaves.push_back(symbol);
				}
				return list(std::move(leaves));
			}));

	add("SetAttributes", Attributes::HoldFirst + Attributes::Protected,
		builtin<2>(
			[] (const BaseExpressionRef &targets, const BaseExpressionRef &names, const Evaluation &evaluation) {
				return modify_attributes(evaluation.symbols.SetAttributes, targets, names, evaluation,
					[&evaluation] (const SymbolRef &symbol, Attributes attributes) {
						evaluation.context.set_attributes(symbol,
							evaluation.attributes_of(symbol.get()) + attributes);
					});
			}));

	add("ClearAttributes", Attributes::HoldFirst + Attributes::Protected,
		builtin<2>(
			[] (const BaseExpressionRef &targets, const BaseExpressionRef &names, const Evaluation &evaluation) {
				return modify_attributes(evaluation.symbols.ClearAttributes, targets, names, evaluation,
					[&evaluation] (const SymbolRef &symbol, Attributes attributes) {
						evaluation.context.set_attributes(symbol,
							evaluation.attributes_of(symbol.get()) - attributes);
					});
			}));
}

} // end namespace Builtins
