#include "core/attributes.h"
#include "core/symbol.h"

namespace {

struct AttributeName {
	SymbolName symbol;
	Attributes attribute;
};

// @formatter:off
const AttributeName attribute_names[] = {
	{S::Constant, Attributes::Constant},
	{S::Flat, Attributes::Flat},
	{S::HoldAll, Attributes::HoldAll},
	{S::HoldAllComplete, Attributes::HoldAllComplete},
	{S::HoldFirst, Attributes::HoldFirst},
	{S::HoldRest, Attributes::HoldRest},
	{S::Listable, Attributes::Listable},
	{S::Locked, Attributes::Locked},
	{S::NHoldAll, Attributes::NHoldAll},
	{S::NHoldFirst, Attributes::NHoldFirst},
	{S::NHoldRest, Attributes::NHoldRest},
	{S::NumericFunction, Attributes::NumericFunction},
	{S::OneIdentity, Attributes::OneIdentity},
	{S::Orderless, Attributes::Orderless},
	{S::Protected, Attributes::Protected},
	{S::ReadProtected, Attributes::ReadProtected},
	{S::SequenceHold, Attributes::SequenceHold},
	{S::Stub, Attributes::Stub},
	{S::Temporary, Attributes::Temporary}
};
// @formatter:on

} // namespace

optional<Attributes> attribute_from_symbol(const Symbol *symbol) {
	const SymbolName name = symbol->symbol();
	for (const AttributeName &entry : attribute_names) {
		if (entry.symbol == name) {
			return entry.attribute;
		}
	}
	return optional<Attributes>();
}

Attributes attributes_from_symbols(const std::vector<BaseExpressionRef> &symbols) {
	Attributes attributes = Attributes::None;
	for (const BaseExpressionRef &item : symbols) {
		if (!item || !item->is_symbol()) {
			throw ConstructionError(
				"attribute " + (item ? item->debugform() : std::string("null")) + " is not a symbol");
		}
		const optional<Attributes> attribute = attribute_from_symbol(item->as_symbol());
		if (!attribute) {
			throw ConstructionError("unknown attribute " + item->debugform());
		}
		attributes = attributes + *attribute;
	}
	return attributes;
}

std::vector<SymbolRef> attributes_to_symbols(Attributes attributes) {
	const Symbols &symbols = system_symbols();
	std::vector<SymbolRef> result;

	for (const AttributeName &entry : attribute_names) {
		if (!(attributes & entry.attribute)) {
			continue;
		}
		// HoldAll subsumes HoldFirst and HoldRest, NHoldAll likewise.
		if ((entry.attribute == Attributes::HoldFirst || entry.attribute == Attributes::HoldRest) &&
			(attributes & Attributes::HoldAll)) {
			continue;
		}
		if ((entry.attribute == Attributes::NHoldFirst || entry.attribute == Attributes::NHoldRest) &&
			(attributes & Attributes::NHoldAll)) {
			continue;
		}
		result.push_back(symbols.lookup(entry.symbol));
	}

	return result;
}
