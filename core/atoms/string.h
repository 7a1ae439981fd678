#ifndef TERMKERNEL_STRING_H
#define TERMKERNEL_STRING_H

#include <string>

#include "core/types.h"
#include "core/hash.h"

// UTF-8 encoded text atom.
class String : public BaseExpression {
private:
    const std::string m_utf8;
    const hash_t m_hash;

public:
    explicit String(const std::string &utf8);

    inline const std::string &utf8() const {
        return m_utf8;
    }

    virtual std::string debugform() const;

    virtual BaseExpressionRef head() const final;

    virtual const Symbol *lookup_name() const {
        return nullptr;
    }

    virtual inline bool same(const BaseExpression &expr) const final {
        if (expr.is_string()) {
            return m_utf8 == static_cast<const String*>(&expr)->m_utf8;
        } else {
            return false;
        }
    }

    virtual hash_t hash() const {
        return m_hash;
    }
};

inline BaseExpressionRef from_primitive(const std::string &value) {
    return std::make_shared<String>(value);
}

inline BaseExpressionRef from_primitive(const char *value) {
    return std::make_shared<String>(value);
}

#endif
