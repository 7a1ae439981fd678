#include <sstream>

#include "core/expression.h"

Expression::Expression(
	const BaseExpressionRef &head,
	LeafVector &&leaves,
	Attributes attributes) :

	BaseExpression(ExpressionExtendedType),
	m_head(head),
	m_leaves(std::move(leaves)),
	m_attributes(attributes),
	m_hash(compute_hash()) {
}

hash_t Expression::compute_hash() const {
	if (!m_head) {
		throw ConstructionError("expression without head");
	}
	if (!m_head->is_symbol() && !m_head->is_expression()) {
		throw ConstructionError(std::string("head ") + m_head->debugform() +
			" is a " + type_name(m_head->type()) + ", not a symbol or an expression");
	}

	hash_t result = hash_pair(expression_hash, m_head->hash());
	for (size_t i = 0; i < m_leaves.size(); i++) {
		const BaseExpressionRef &leaf = m_leaves[i];
		if (!leaf) {
			throw ConstructionError(
				"leaf " + std::to_string(i + 1) + " of " + m_head->debugform() + " is null");
		}
		result = hash_combine(result, leaf->hash());
	}
	return result;
}

std::string Expression::debugform() const {
	std::ostringstream s;
	s << m_head->debugform() << "[";
	for (size_t i = 0; i < m_leaves.size(); i++) {
		if (i > 0) {
			s << ", ";
		}
		s << m_leaves[i]->debugform();
	}
	s << "]";
	return s.str();
}

bool Expression::same(const BaseExpression &item) const {
	if (this == &item) {
		return true;
	}
	if (!item.is_expression()) {
		return false;
	}

	const Expression *expr = item.as_expression();
	if (m_hash != expr->m_hash || m_leaves.size() != expr->m_leaves.size()) {
		return false;
	}
	if (!m_head->same(*expr->m_head)) {
		return false;
	}

	for (size_t i = 0; i < m_leaves.size(); i++) {
		if (!m_leaves[i]->same(*expr->m_leaves[i])) {
			return false;
		}
	}

	return true;
}

ExpressionRef Expression::with_head(const BaseExpressionRef &head) const {
	return std::make_shared<Expression>(head, LeafVector(m_leaves), m_attributes);
}

ExpressionRef Expression::with_leaves(LeafVector &&leaves) const {
	return std::make_shared<Expression>(m_head, std::move(leaves), m_attributes);
}

ExpressionRef Expression::with_attributes(Attributes attributes) const {
	return std::make_shared<Expression>(m_head, LeafVector(m_leaves), attributes);
}

ExpressionRef expression(
	const BaseExpressionRef &head,
	LeafVector &&leaves,
	const std::vector<BaseExpressionRef> &attributes) {

	return std::make_shared<Expression>(
		head, std::move(leaves), attributes_from_symbols(attributes));
}
