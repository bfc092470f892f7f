#ifndef __SPARITH_SPARSE_MATRIX_HPP__
#define __SPARITH_SPARSE_MATRIX_HPP__

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace sparith {

// thrown when operand shapes are incompatible with the requested operator
class dimension_mismatch : public std::invalid_argument {
public:
    explicit dimension_mismatch(const std::string& what)
        : std::invalid_argument(what) {}
};

namespace detail {
// integer arithmetic throwing std::overflow_error instead of wrapping
template<typename T>
inline T checked_add(T a, T b) {
    T r;
    if (__builtin_add_overflow(a, b, &r))
        throw std::overflow_error("Integer overflow in addition");
    return r;
}

template<typename T>
inline T checked_sub(T a, T b) {
    T r;
    if (__builtin_sub_overflow(a, b, &r))
        throw std::overflow_error("Integer overflow in subtraction");
    return r;
}

template<typename T>
inline T checked_mul(T a, T b) {
    T r;
    if (__builtin_mul_overflow(a, b, &r))
        throw std::overflow_error("Integer overflow in multiplication");
    return r;
}
} // detail

/** sparse_matrix: dictionary of dictionaries storage of integer entries.
    - absent entries are implicitly zero
    - row keys, and column keys within a row, are kept in order of
      first insertion; overwriting an entry keeps its position
    - coordinates are opaque integers and are never bounds checked
    - add, subtract and multiply throw std::overflow_error when a result
      does not fit value_type
 */
template<typename Value_ = long>
class sparse_matrix {
    static_assert(std::is_integral<Value_>::value,
                  "sparse_matrix only supports integral value types");
public:
    typedef Value_                                       value_type;
    typedef long                                         index_type;
    typedef sparse_matrix<Value_>                        self_type;
    typedef std::tuple<index_type, index_type, value_type> entry_type;

private:
    struct row_type {
        std::vector<index_type>                     order;
        std::unordered_map<index_type, value_type>  values;
    };

    index_type                                m_rows;
    index_type                                m_cols;
    std::vector<index_type>                   m_row_order;
    std::unordered_map<index_type, row_type>  m_data;
    size_t                                    m_nnz;

    void check_same_shape(const self_type& other, const char* what) const {
        if (m_rows != other.m_rows || m_cols != other.m_cols) {
            throw dimension_mismatch(
                std::string("Matrices must have the same dimensions for ") +
                what + " to perform");
        }
    }

    template<typename BinaryOp_>
    self_type combine(const self_type& other, BinaryOp_ op) const {
        self_type result(m_rows, m_cols);
        for_each([&](index_type r, index_type c, value_type v) {
            result.set(r, c, v);
        });
        other.for_each([&](index_type r, index_type c, value_type v) {
            result.set(r, c, op(result.get(r, c), v));
        });
        return result;
    }

    // every nonzero entry of *this has the same value in other
    bool nonzeros_in(const self_type& other) const {
        bool found = true;
        for_each([&](index_type r, index_type c, value_type v) {
            if (found && v != 0 && other.get(r, c) != v) found = false;
        });
        return found;
    }

public:
    sparse_matrix(index_type rows=0, index_type cols=0)
        : m_rows(rows), m_cols(cols), m_nnz(0) {}

    index_type rows() const { return m_rows; }
    index_type cols() const { return m_cols; }

    // number of stored entries, explicit zeros included
    size_t nnz() const { return m_nnz; }
    bool empty() const { return m_nnz == 0; }

    bool contains(index_type row, index_type col) const {
        auto it = m_data.find(row);
        if (it == m_data.end()) return false;
        return it->second.values.find(col) != it->second.values.end();
    }

    value_type get(index_type row, index_type col) const {
        auto it = m_data.find(row);
        if (it == m_data.end()) return 0;
        auto jt = it->second.values.find(col);
        if (jt == it->second.values.end()) return 0;
        return jt->second;
    }

    void set(index_type row, index_type col, value_type value) {
        auto it = m_data.find(row);
        if (it == m_data.end()) {
            m_row_order.push_back(row);
            it = m_data.emplace(row, row_type()).first;
        }
        row_type& r = it->second;
        auto jt = r.values.find(col);
        if (jt == r.values.end()) {
            r.order.push_back(col);
            r.values.emplace(col, value);
            ++m_nnz;
        }
        else jt->second = value;
    }

    // visits (row, col, value) in storage order
    template<typename Func_>
    void for_each(Func_ f) const {
        for (index_type r : m_row_order) {
            const row_type& row = m_data.find(r)->second;
            for (index_type c : row.order) {
                f(r, c, row.values.find(c)->second);
            }
        }
    }

    // stored row keys in storage order
    const std::vector<index_type>& row_keys() const { return m_row_order; }

    std::vector<entry_type> entries() const {
        std::vector<entry_type> r;
        r.reserve(m_nnz);
        for_each([&](index_type i, index_type j, value_type v) {
            r.push_back(entry_type(i, j, v));
        });
        return r;
    }

    self_type add(const self_type& other) const {
        check_same_shape(other, "addition");
        return combine(other, detail::checked_add<value_type>);
    }

    self_type subtract(const self_type& other) const {
        check_same_shape(other, "subtraction");
        return combine(other, detail::checked_sub<value_type>);
    }

    // Only the rows stored in *this are visited. Per row, the products
    // are accumulated over the stored entries of both operands and the
    // nonzero sums are stored in increasing column order.
    self_type multiply(const self_type& other) const {
        if (m_cols != other.m_rows) {
            throw dimension_mismatch("Number of columns in the first matrix "
                "must be equal to the number of rows in the second matrix "
                "for multiplication to perform");
        }
        self_type result(m_rows, other.m_cols);
        std::map<index_type, value_type> acc;
        for (index_type r : m_row_order) {
            acc.clear();
            const row_type& row = m_data.find(r)->second;
            for (index_type k : row.order) {
                if (k < 0 || k >= m_cols) continue;
                auto ot = other.m_data.find(k);
                if (ot == other.m_data.end()) continue;
                const value_type a = row.values.find(k)->second;
                const row_type& orow = ot->second;
                for (index_type c : orow.order) {
                    if (c < 0 || c >= other.m_cols) continue;
                    value_type& sum = acc[c];
                    sum = detail::checked_add(sum,
                        detail::checked_mul(a, orow.values.find(c)->second));
                }
            }
            for (auto it=acc.begin() ; it!=acc.end() ; ++it) {
                if (it->second != 0) result.set(r, it->first, it->second);
            }
        }
        return result;
    }

    self_type operator+(const self_type& other) const { return add(other); }
    self_type operator-(const self_type& other) const { return subtract(other); }
    self_type operator*(const self_type& other) const { return multiply(other); }

    // value equality: same shape and same nonzero entries. Stored zeros
    // and storage order are ignored.
    bool operator==(const self_type& other) const {
        if (m_rows != other.m_rows || m_cols != other.m_cols) return false;
        return nonzeros_in(other) && other.nonzeros_in(*this);
    }

    bool operator!=(const self_type& other) const { return !(*this == other); }
};

typedef sparse_matrix<long> lmatrix;

} // namespace sparith

#endif // __SPARITH_SPARSE_MATRIX_HPP__
