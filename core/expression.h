#ifndef TERMKERNEL_EXPRESSION_H
#define TERMKERNEL_EXPRESSION_H

#include <initializer_list>

#include "core/types.h"
#include "core/attributes.h"
#include "core/symbol.h"

// an immutable compound: head[leaf1, leaf2, ...]. the local attribute set
// travels with the expression but is not part of its identity.
class Expression : public BaseExpression {
private:
	const BaseExpressionRef m_head;
	const LeafVector m_leaves;
	const Attributes m_attributes;
	const hash_t m_hash;

	hash_t compute_hash() const;

public:
	Expression(
		const BaseExpressionRef &head,
		LeafVector &&leaves,
		Attributes attributes = Attributes::None);

	virtual BaseExpressionRef head() const {
		return m_head;
	}

	inline const BaseExpressionRef &head_ref() const {
		return m_head;
	}

	inline size_t size() const {
		return m_leaves.size();
	}

	inline const BaseExpressionRef &leaf(size_t i) const {
		return m_leaves[i];
	}

	inline const LeafVector &leaves() const {
		return m_leaves;
	}

	inline LeafVector::const_iterator begin() const {
		return m_leaves.begin();
	}

	inline LeafVector::const_iterator end() const {
		return m_leaves.end();
	}

	inline Attributes attributes() const {
		return m_attributes;
	}

	virtual std::string debugform() const;

	virtual bool same(const BaseExpression &expr) const;

	virtual hash_t hash() const {
		return m_hash;
	}

	virtual const Symbol *lookup_name() const {
		return m_head->lookup_name();
	}

	ExpressionRef with_head(const BaseExpressionRef &head) const;

	ExpressionRef with_leaves(LeafVector &&leaves) const;

	ExpressionRef with_attributes(Attributes attributes) const;

	inline ExpressionRef add_attributes(Attributes attributes) const {
		return with_attributes(m_attributes + attributes);
	}

	inline ExpressionRef remove_attributes(Attributes attributes) const {
		return with_attributes(m_attributes - attributes);
	}

	// applies f to every leaf; returns nullptr if no leaf changed.
	template<typename F>
	ExpressionRef map(const F &f) const;
};

inline const Expression *BaseExpression::as_expression() const {
	return static_cast<const Expression*>(this);
}

inline bool BaseExpression::has_form(SymbolName head, size_t n) const {
	if (is_expression()) {
		const Expression *expr = as_expression();
		return expr->head_ref()->symbol() == head && expr->size() == n;
	} else {
		return false;
	}
}

inline ExpressionRef expression(
	const BaseExpressionRef &head,
	LeafVector &&leaves,
	Attributes attributes = Attributes::None) {

	return std::make_shared<Expression>(head, std::move(leaves), attributes);
}

template<typename F>
ExpressionRef Expression::map(const F &f) const {
	const size_t n = m_leaves.size();

	for (size_t i = 0; i < n; i++) {
		const BaseExpressionRef &leaf = m_leaves[i];
		BaseExpressionRef new_leaf = f(leaf);

		if (new_leaf && new_leaf != leaf) {
			// copy-on-write from the first changed leaf on
			LeafVector leaves;
			leaves.reserve(n);
			leaves.insert(leaves.end(), m_leaves.begin(), m_leaves.begin() + i);
			leaves.push_back(std::move(new_leaf));

			for (size_t j = i + 1; j < n; j++) {
				const BaseExpressionRef &old_leaf = m_leaves[j];
				BaseExpressionRef mapped = f(old_leaf);
				leaves.push_back(mapped ? std::move(mapped) : old_leaf);
			}

			return expression(m_head, std::move(leaves), m_attributes);
		}
	}

	return ExpressionRef();
}

inline ExpressionRef expression(
	const BaseExpressionRef &head,
	std::initializer_list<BaseExpressionRef> leaves) {

	return std::make_shared<Expression>(head, LeafVector(leaves));
}

// builds head[leaves...], rejecting non-symbol or unknown attributes.
ExpressionRef expression(
	const BaseExpressionRef &head,
	LeafVector &&leaves,
	const std::vector<BaseExpressionRef> &attributes);

inline ExpressionRef static_pointer_cast_expression(const BaseExpressionRef &item) {
	return std::static_pointer_cast<const Expression>(item);
}

inline SymbolRef static_pointer_cast_symbol(const BaseExpressionRef &item) {
	return std::static_pointer_cast<const Symbol>(item);
}

// the symbol at the end of the head chain, e.g. f for f[a][b]; nullptr if
// the chain ends in a non-symbol atom.
inline SymbolRef root_symbol(const BaseExpressionRef &item) {
	BaseExpressionRef current = item;
	while (current->is_expression()) {
		current = current->as_expression()->head_ref();
	}
	if (current->is_symbol()) {
		return static_pointer_cast_symbol(current);
	} else {
		return SymbolRef();
	}
}

inline ExpressionRef list(LeafVector &&leaves) {
	return expression(system_symbols().List, std::move(leaves));
}

inline ExpressionRef sequence(LeafVector &&leaves) {
	return expression(system_symbols().Sequence, std::move(leaves));
}

#endif
