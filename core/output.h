#ifndef TERMKERNEL_OUTPUT_H
#define TERMKERNEL_OUTPUT_H

#include <iostream>
#include <list>
#include <memory>
#include <string>

// the sink for kernel messages such as General::reclim.
class Output {
public:
    virtual ~Output() {
    }

    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s) = 0;
};

using OutputRef = std::shared_ptr<Output>;

class DefaultOutput : public Output {
public:
    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s) {

        std::cout << name << "::" << tag << ": " << s << std::endl;
    }
};

class NoOutput : public Output {
public:
    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s) {
    }
};

// collects "name::tag: text" lines for inspection in tests.
class TestOutput : public Output {
private:
    std::list<std::string> m_output;

public:
    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s);

    void clear() {
        m_output.clear();
    }

    bool empty() const {
        return m_output.empty();
    }

    size_t size() const {
        return m_output.size();
    }

    const std::list<std::string> &lines() const {
        return m_output;
    }

    // true if some line contains text.
    bool contains(const std::string &text) const;

    // removes the first line and compares it with expected.
    bool test_line(const std::string &expected);
};

#endif
