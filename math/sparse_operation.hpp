#ifndef __SPARITH_SPARSE_OPERATION_HPP__
#define __SPARITH_SPARSE_OPERATION_HPP__

#include <stdexcept>
#include <string>
#include <vector>

#include <math/sparse_matrix.hpp>
#include <misc/strings.hpp>

namespace sparith {

enum class operation { add, subtract, multiply };

class invalid_operation : public std::invalid_argument {
public:
    explicit invalid_operation(const std::string& name)
        : std::invalid_argument("Invalid operation"), m_name(name) {}

    const std::string& name() const { return m_name; }

private:
    std::string m_name;
};

inline const std::vector<std::string>& operation_names() {
    static const std::vector<std::string> names = {
        "add", "subtract", "multiply"
    };
    return names;
}

inline std::string operation_name(operation op) {
    switch (op) {
        case operation::add:      return "add";
        case operation::subtract: return "subtract";
        case operation::multiply: return "multiply";
    }
    throw std::logic_error("unknown operation");
}

// case-insensitive, surrounding whitespace ignored
inline operation parse_operation(const std::string& name) {
    std::string s = trimmed(name);
    lower_case(s);
    if (s == "add") return operation::add;
    else if (s == "subtract") return operation::subtract;
    else if (s == "multiply") return operation::multiply;
    throw invalid_operation(name);
}

template<typename Value_>
sparse_matrix<Value_> apply(operation op,
                            const sparse_matrix<Value_>& a,
                            const sparse_matrix<Value_>& b) {
    switch (op) {
        case operation::add:      return a.add(b);
        case operation::subtract: return a.subtract(b);
        case operation::multiply: return a.multiply(b);
    }
    throw std::logic_error("unknown operation");
}

} // namespace sparith

#endif // __SPARITH_SPARSE_OPERATION_HPP__
