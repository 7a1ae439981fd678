#include <sstream>

#include "core/pattern/bindings.h"

BindingConflict::BindingConflict(
	const SymbolRef &name_,
	const BaseExpressionRef &existing_,
	const BaseExpressionRef &value_) :

	std::runtime_error("pattern variable " + name_->name() + " is bound to " +
		existing_->debugform() + ", cannot bind to " + value_->debugform()),
	name(name_),
	existing(existing_),
	value(value_) {
}

const Bindings::Entry *Bindings::find(const Symbol *name) const {
	if (m_entries) {
		for (const Entry &entry : *m_entries) {
			if (entry.first.get() == name) {
				return &entry;
			}
		}
	}
	return nullptr;
}

BaseExpressionRef Bindings::get(const Symbol *name) const {
	const Entry *entry = find(name);
	if (entry) {
		return entry->second;
	} else {
		return BaseExpressionRef();
	}
}

optional<Bindings> Bindings::try_bind(const SymbolRef &name, const BaseExpressionRef &value) const {
	const Entry *entry = find(name.get());
	if (entry) {
		if (entry->second->same(*value)) {
			return *this;
		} else {
			return optional<Bindings>();
		}
	}

	auto entries = m_entries ?
		std::make_shared<Entries>(*m_entries) : std::make_shared<Entries>();
	entries->emplace_back(name, value);
	return Bindings(std::shared_ptr<const Entries>(std::move(entries)));
}

Bindings Bindings::bind(const SymbolRef &name, const BaseExpressionRef &value) const {
	const optional<Bindings> bindings = try_bind(name, value);
	if (!bindings) {
		throw BindingConflict(name, get(name.get()), value);
	}
	return *bindings;
}

Bindings Bindings::merge(const Bindings &other) const {
	Bindings result(*this);
	other.for_each([&result] (const SymbolRef &name, const BaseExpressionRef &value) {
		result = result.bind(name, value);
	});
	return result;
}

bool Bindings::is_compatible(const Bindings &other) const {
	bool compatible = true;
	other.for_each([this, &compatible] (const SymbolRef &name, const BaseExpressionRef &value) {
		const BaseExpressionRef existing = get(name.get());
		if (existing && !existing->same(*value)) {
			compatible = false;
		}
	});
	return compatible;
}

bool Bindings::same(const Bindings &other) const {
	if (size() != other.size()) {
		return false;
	}
	bool same = true;
	other.for_each([this, &same] (const SymbolRef &name, const BaseExpressionRef &value) {
		const BaseExpressionRef existing = get(name.get());
		if (!existing || !existing->same(*value)) {
			same = false;
		}
	});
	return same;
}

std::string Bindings::debugform() const {
	std::ostringstream s;
	s << "{";
	bool first = true;
	for_each([&s, &first] (const SymbolRef &name, const BaseExpressionRef &value) {
		if (!first) {
			s << ", ";
		}
		first = false;
		s << name->name() << " -> " << value->debugform();
	});
	s << "}";
	return s.str();
}

std::ostream &operator<<(std::ostream &s, const Bindings &bindings) {
	s << bindings.debugform();
	return s;
}
