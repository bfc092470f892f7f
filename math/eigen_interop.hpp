#ifndef __SPARITH_EIGEN_INTEROP_HPP__
#define __SPARITH_EIGEN_INTEROP_HPP__

#include <sstream>
#include <stdexcept>
#include <vector>

#include <Eigen/Sparse>

#include <math/sparse_matrix.hpp>

namespace sparith {

// Eigen counterpart of sparse_matrix<Value_> (column-major)
template<typename Value_>
using eigen_sparse_type = Eigen::SparseMatrix<Value_>;

// Build an Eigen sparse matrix from the stored entries of m. Explicit
// zeros are dropped. Throws std::out_of_range if a stored key does not
// fit the shape of m.
template<typename Value_>
eigen_sparse_type<Value_> to_eigen(const sparse_matrix<Value_>& m) {
    typedef typename sparse_matrix<Value_>::index_type index_type;
    typedef Eigen::Triplet<Value_>                      triplet_type;

    std::vector<triplet_type> triplets;
    triplets.reserve(m.nnz());
    m.for_each([&](index_type r, index_type c, Value_ v) {
        if (r < 0 || r >= m.rows() || c < 0 || c >= m.cols()) {
            std::ostringstream os;
            os << "entry (" << r << ", " << c << ") lies outside of a "
               << m.rows() << "x" << m.cols() << " matrix";
            throw std::out_of_range(os.str());
        }
        if (v != 0) triplets.push_back(triplet_type(r, c, v));
    });

    eigen_sparse_type<Value_> matrix(m.rows(), m.cols());
    matrix.setFromTriplets(triplets.begin(), triplets.end());
    return matrix;
}

// Nonzeros of A are inserted in Eigen's storage order (column-major).
template<typename Value_>
sparse_matrix<Value_> from_eigen(const eigen_sparse_type<Value_>& A) {
    sparse_matrix<Value_> m(A.rows(), A.cols());
    for (int k=0 ; k<A.outerSize() ; ++k) {
        for (typename eigen_sparse_type<Value_>::InnerIterator it(A, k);
             it ; ++it) {
            if (it.value() != 0) m.set(it.row(), it.col(), it.value());
        }
    }
    return m;
}

} // namespace sparith

#endif // __SPARITH_EIGEN_INTEROP_HPP__
