#include "core/builtin.h"

BuiltinRegistry::BuiltinRegistry(const BuiltinRegistry *parent) : m_parent(parent) {
}

BuiltinRegistry &BuiltinRegistry::global() {
	static BuiltinRegistry registry;
	return registry;
}

void BuiltinRegistry::add(const BuiltinRef &builtin) {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_builtins[builtin->symbol.get()] = builtin;
}

void BuiltinRegistry::add(const SymbolRef &symbol, Attributes attributes, const BuiltinFunction &apply) {
	add(std::make_shared<Builtin>(symbol, attributes, apply));
}

bool BuiltinRegistry::remove(const Symbol *symbol) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_builtins.erase(symbol) > 0;
}

void BuiltinRegistry::clear() {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_builtins.clear();
}

size_t BuiltinRegistry::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_builtins.size();
}

BuiltinRef BuiltinRegistry::lookup_builtin(const Symbol *symbol) const {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const auto i = m_builtins.find(symbol);
		if (i != m_builtins.end()) {
			return i->second;
		}
	}

	if (m_parent) {
		return m_parent->lookup_builtin(symbol);
	} else {
		return BuiltinRef();
	}
}
