#include "core/atoms/string.h"
#include "core/symbol.h"

String::String(const std::string &utf8) :
    BaseExpression(StringExtendedType),
    m_utf8(utf8),
    m_hash(hash_pair(string_hash, hash_string(utf8))) {
}

std::string String::debugform() const {
    std::string s;
    s.reserve(m_utf8.size() + 2);
    s += '"';
    for (const char c : m_utf8) {
        switch (c) {
            case '"':
                s += "\\\"";
                break;
            case '\\':
                s += "\\\\";
                break;
            case '\n':
                s += "\\n";
                break;
            default:
                s += c;
                break;
        }
    }
    s += '"';
    return s;
}

BaseExpressionRef String::head() const {
    return system_symbols().String;
}
