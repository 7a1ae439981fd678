#ifndef TERMKERNEL_BINDINGS_H
#define TERMKERNEL_BINDINGS_H

#include <utility>

#include "core/types.h"
#include "core/symbol.h"

// a pattern variable bound twice to different values.
class BindingConflict : public std::runtime_error {
public:
	const SymbolRef name;
	const BaseExpressionRef existing;
	const BaseExpressionRef value;

	BindingConflict(
		const SymbolRef &name,
		const BaseExpressionRef &existing,
		const BaseExpressionRef &value);
};

// an immutable map from pattern variables to values. every update returns
// a new Bindings; unchanged Bindings share their entries.
class Bindings {
public:
	typedef std::pair<SymbolRef, BaseExpressionRef> Entry;
	typedef std::vector<Entry> Entries;

private:
	std::shared_ptr<const Entries> m_entries;

	inline explicit Bindings(std::shared_ptr<const Entries> &&entries) :
		m_entries(std::move(entries)) {
	}

	const Entry *find(const Symbol *name) const;

public:
	inline Bindings() {
	}

	inline bool empty() const {
		return !m_entries || m_entries->empty();
	}

	inline size_t size() const {
		return m_entries ? m_entries->size() : 0;
	}

	// the bound value or nullptr.
	BaseExpressionRef get(const Symbol *name) const;

	inline bool contains(const Symbol *name) const {
		return find(name) != nullptr;
	}

	// throws BindingConflict if name is bound to a different value.
	Bindings bind(const SymbolRef &name, const BaseExpressionRef &value) const;

	// nothing if name is bound to a different value.
	optional<Bindings> try_bind(const SymbolRef &name, const BaseExpressionRef &value) const;

	// throws BindingConflict on the first name bound differently in both.
	Bindings merge(const Bindings &other) const;

	bool is_compatible(const Bindings &other) const;

	// same names bound to structurally equal values.
	bool same(const Bindings &other) const;

	template<typename F>
	inline void for_each(const F &f) const {
		if (m_entries) {
			for (const Entry &entry : *m_entries) {
				f(entry.first, entry.second);
			}
		}
	}

	std::string debugform() const;
};

std::ostream &operator<<(std::ostream &s, const Bindings &bindings);

#endif
