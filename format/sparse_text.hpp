#ifndef __SPARITH_SPARSE_TEXT_HPP__
#define __SPARITH_SPARSE_TEXT_HPP__

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include <math/sparse_matrix.hpp>
#include <misc/strings.hpp>

// Line-oriented text encoding of a sparse matrix:
//
// rows=<int>
// cols=<int>
// (<row>,<col>,<value>)
// ...
//
// Blank lines are ignored. On output entries are written as
// "(<row>, <col>, <value>)" in storage order.

namespace sparith {

class format_error : public std::runtime_error {
public:
    explicit format_error(const std::string& line="")
        : std::runtime_error(line.empty() ?
                             std::string("Input file has wrong format") :
                             "Input file has wrong format: \"" + line + "\"") {}
};

namespace detail {

template<typename Int_>
inline Int_ parse_integer(const std::string& token, const std::string& line) {
    try {
        return boost::lexical_cast<Int_>(trimmed(token));
    }
    catch (boost::bad_lexical_cast&) {
        throw format_error(line);
    }
}

// "<key>=<int>": only the token after the first '=' is checked
template<typename Int_>
inline Int_ parse_header(const std::string& line) {
    std::vector<std::string> tokens = split(line, "=");
    if (tokens.size() < 2) throw format_error(line);
    return parse_integer<Int_>(tokens[1], line);
}

} // detail

template<typename Value_ = long>
sparse_matrix<Value_> from_text(const std::string& content) {
    typedef sparse_matrix<Value_>              matrix_type;
    typedef typename matrix_type::index_type   index_type;

    std::vector<std::string> lines = nonblank_lines(content);
    if (lines.size() < 2) throw format_error();

    const index_type rows = detail::parse_header<index_type>(lines[0]);
    const index_type cols = detail::parse_header<index_type>(lines[1]);
    matrix_type m(rows, cols);

    for (size_t i=2 ; i<lines.size() ; ++i) {
        const std::string& line = lines[i];
        // drop enclosing characters, normally '(' and ')'
        std::string inner = line.size() < 2 ? std::string() :
                            line.substr(1, line.size()-2);
        std::vector<std::string> tokens = split(inner, ",");
        if (tokens.size() != 3) throw format_error(line);
        index_type r = detail::parse_integer<index_type>(tokens[0], line);
        index_type c = detail::parse_integer<index_type>(tokens[1], line);
        Value_ v = detail::parse_integer<Value_>(tokens[2], line);
        m.set(r, c, v);
    }
    return m;
}

template<typename Value_>
std::string to_text(const sparse_matrix<Value_>& m) {
    typedef typename sparse_matrix<Value_>::index_type index_type;

    std::ostringstream os;
    os << "rows=" << m.rows() << '\n' << "cols=" << m.cols() << '\n';
    m.for_each([&](index_type r, index_type c, Value_ v) {
        os << boost::format("(%1%, %2%, %3%)\n") % r % c % v;
    });
    return os.str();
}

template<typename Value_ = long>
sparse_matrix<Value_> read_sparse_text(const std::string& filename) {
    std::ifstream in(filename.c_str());
    if (!in) {
        throw std::runtime_error("unable to open " + filename);
    }
    std::ostringstream os;
    os << in.rdbuf();
    return from_text<Value_>(os.str());
}

template<typename Value_>
void write_sparse_text(const std::string& filename,
                       const sparse_matrix<Value_>& m) {
    std::ofstream out(filename.c_str());
    if (!out) {
        throw std::runtime_error("unable to open " + filename + " for writing");
    }
    out << to_text(m);
    out.close();
    if (!out) {
        throw std::runtime_error("error while writing " + filename);
    }
}

template<typename Value_>
std::ostream& operator<<(std::ostream& os, const sparse_matrix<Value_>& m) {
    os << to_text(m);
    return os;
}

} // namespace sparith

#endif // __SPARITH_SPARSE_TEXT_HPP__
