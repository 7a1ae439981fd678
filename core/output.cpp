#include "core/output.h"

void TestOutput::write(
    const char *name,
    const char *tag,
    std::string &&s) {

    m_output.emplace_back(std::string(name) + "::" + tag + ": " + s);
}

bool TestOutput::contains(const std::string &text) const {
    for (const std::string &line : m_output) {
        if (line.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool TestOutput::test_line(const std::string &expected) {
    if (m_output.empty()) {
        return false;
    }
    const std::string line = m_output.front();
    m_output.pop_front();
    return line == expected;
}
