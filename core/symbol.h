#ifndef TERMKERNEL_SYMBOL_H
#define TERMKERNEL_SYMBOL_H

#include <mutex>
#include <unordered_map>

#include "core/types.h"

class Symbol : public BaseExpression {
private:
	const std::string m_name;
	const hash_t m_hash;

public:
	Symbol(const std::string &name, SymbolName code = S::GENERIC);

	inline const std::string &name() const {
		return m_name;
	}

	virtual std::string debugform() const;

	// symbols are interned, so identity is equality.
	virtual bool same(const BaseExpression &expr) const final {
		return this == &expr;
	}

	virtual hash_t hash() const {
		return m_hash;
	}

	virtual BaseExpressionRef head() const;

	virtual const Symbol *lookup_name() const {
		return this;
	}
};

inline const Symbol *BaseExpression::as_symbol() const {
	return static_cast<const Symbol*>(this);
}

class SymbolTable;

class Symbols {
public:
	#define SYMBOL(SYMBOLNAME) const SymbolRef SYMBOLNAME;
	#include "system_symbols.h"
	#undef SYMBOL

	Symbols(SymbolTable &table);

	inline const SymbolRef &lookup(SymbolName name) const {
		return m_by_code[name];
	}

private:
	SymbolRef m_by_code[S::_COUNT];
};

// the process-wide interning registry. system symbols are created with the
// table and survive reset(); all other symbols are created on first lookup.
class SymbolTable {
private:
	friend class Symbols;

	mutable std::mutex m_mutex;
	std::unordered_map<std::string, SymbolRef> m_symbols;
	std::unique_ptr<const Symbols> m_system;

	SymbolRef system_symbol(const char *name, SymbolName code);

	SymbolTable();

public:
	SymbolTable(const SymbolTable&) = delete;
	SymbolTable &operator=(const SymbolTable&) = delete;

	static void init();

	static SymbolTable &get();

	SymbolRef lookup(const std::string &name);

	SymbolRef lookup_no_create(const std::string &name) const;

	// drops all non-system symbols. symbols still referenced elsewhere stay
	// alive but are no longer returned by lookup().
	void reset();

	size_t size() const;

	inline const Symbols &symbols() const {
		return *m_system;
	}
};

inline const Symbols &system_symbols() {
	return SymbolTable::get().symbols();
}

inline SymbolRef lookup_symbol(const std::string &name) {
	return SymbolTable::get().lookup(name);
}

#endif
