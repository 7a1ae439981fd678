#include <cstring>

#include "core/symbol.h"

Symbol::Symbol(const std::string &name, SymbolName code) :
	BaseExpression(ExtendedType(code)),
	m_name(name),
	m_hash(hash_pair(symbol_hash, djb2(name.c_str()))) {
}

std::string Symbol::debugform() const {
	return m_name;
}

BaseExpressionRef Symbol::head() const {
	return system_symbols()._Symbol;
}

Symbols::Symbols(SymbolTable &table) :
	#define SYMBOL(SYMBOLNAME) \
		SYMBOLNAME(table.system_symbol(#SYMBOLNAME, S::SYMBOLNAME)),
	#include "system_symbols.h"
	#undef SYMBOL
	m_by_code() {

	#define SYMBOL(SYMBOLNAME) m_by_code[S::SYMBOLNAME] = SYMBOLNAME;
	#include "system_symbols.h"
	#undef SYMBOL
}

SymbolTable::SymbolTable() {
	m_system.reset(new Symbols(*this));
}

SymbolRef SymbolTable::system_symbol(const char *name, SymbolName code) {
	std::string fullname;
	if (strncmp(name, "State", 5) == 0) {
		fullname = "$";
		fullname += name + 5;
	} else if (name[0] == '_') {
		fullname = name + 1;
	} else {
		fullname = name;
	}
	const SymbolRef symbol = std::make_shared<Symbol>(fullname, code);
	m_symbols[fullname] = symbol;
	return symbol;
}

void SymbolTable::init() {
	get();
}

SymbolTable &SymbolTable::get() {
	static SymbolTable table;
	return table;
}

SymbolRef SymbolTable::lookup(const std::string &name) {
	if (name.empty()) {
		throw ConstructionError("symbol name must not be empty");
	}

	std::lock_guard<std::mutex> lock(m_mutex);

	const auto i = m_symbols.find(name);
	if (i != m_symbols.end()) {
		return i->second;
	}

	const SymbolRef symbol = std::make_shared<Symbol>(name);
	m_symbols.emplace(name, symbol);
	return symbol;
}

SymbolRef SymbolTable::lookup_no_create(const std::string &name) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto i = m_symbols.find(name);
	if (i != m_symbols.end()) {
		return i->second;
	} else {
		return SymbolRef();
	}
}

void SymbolTable::reset() {
	std::lock_guard<std::mutex> lock(m_mutex);

	auto i = m_symbols.begin();
	while (i != m_symbols.end()) {
		if (i->second->symbol() == S::GENERIC) {
			i = m_symbols.erase(i);
		} else {
			i++;
		}
	}
}

size_t SymbolTable::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_symbols.size();
}
