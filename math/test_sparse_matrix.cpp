#include <limits>
#include <stdexcept>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

#include <math/sparse_matrix.hpp>

using sparith::lmatrix;
using sparith::dimension_mismatch;

namespace {

// A = {(0,0):1, (1,1):2}, B = {(0,0):3, (0,1):4}, both 2x2
lmatrix matrix_a() {
    lmatrix a(2, 2);
    a.set(0, 0, 1);
    a.set(1, 1, 2);
    return a;
}

lmatrix matrix_b() {
    lmatrix b(2, 2);
    b.set(0, 0, 3);
    b.set(0, 1, 4);
    return b;
}

lmatrix pseudo_random(long rows, long cols, int n, unsigned int seed) {
    lmatrix m(rows, cols);
    for (int i=0 ; i<n ; ++i) {
        seed = seed*1103515245u + 12345u;
        long r = (seed >> 8) % rows;
        seed = seed*1103515245u + 12345u;
        long c = (seed >> 8) % cols;
        seed = seed*1103515245u + 12345u;
        long v = static_cast<long>((seed >> 8) % 19) - 9;
        m.set(r, c, v);
    }
    return m;
}

} // anonymous

TEST(SparseMatrix, ConstructionIsEmpty) {
    lmatrix m(3, 4);
    EXPECT_EQ(m.rows(), 3);
    EXPECT_EQ(m.cols(), 4);
    EXPECT_EQ(m.nnz(), 0u);
    EXPECT_TRUE(m.empty());
    for (long i=0 ; i<3 ; ++i)
        for (long j=0 ; j<4 ; ++j)
            EXPECT_EQ(m.get(i, j), 0);
}

TEST(SparseMatrix, GetAbsentAndOutOfRangeIsZero) {
    lmatrix m = matrix_a();
    EXPECT_EQ(m.get(0, 1), 0);
    EXPECT_EQ(m.get(5, 0), 0);
    EXPECT_EQ(m.get(-1, -1), 0);
    EXPECT_EQ(m.get(100000, 100000), 0);
}

TEST(SparseMatrix, SetOverwritesAndKeepsZeros) {
    lmatrix m(2, 2);
    m.set(1, 0, 7);
    m.set(1, 0, -3);
    EXPECT_EQ(m.get(1, 0), -3);
    EXPECT_EQ(m.nnz(), 1u);

    m.set(0, 1, 0);
    EXPECT_TRUE(m.contains(0, 1));
    EXPECT_EQ(m.get(0, 1), 0);
    EXPECT_EQ(m.nnz(), 2u);
}

TEST(SparseMatrix, CoordinatesAreNotBoundsChecked) {
    lmatrix m(2, 2);
    m.set(10, -4, 5);
    EXPECT_EQ(m.get(10, -4), 5);
    EXPECT_EQ(m.rows(), 2);
    EXPECT_EQ(m.cols(), 2);
}

TEST(SparseMatrix, EntriesFollowInsertionOrder) {
    lmatrix m(5, 5);
    m.set(3, 1, 1);
    m.set(0, 4, 2);
    m.set(3, 0, 3);
    m.set(0, 2, 4);
    m.set(3, 1, 5); // overwrite keeps position

    typedef lmatrix::entry_type e;
    std::vector<e> expected = {
        e(3, 1, 5), e(3, 0, 3), e(0, 4, 2), e(0, 2, 4)
    };
    EXPECT_EQ(m.entries(), expected);
    EXPECT_EQ(m.row_keys(), std::vector<long>({3, 0}));
}

TEST(SparseMatrix, AddExample) {
    lmatrix c = matrix_a().add(matrix_b());
    EXPECT_EQ(c.rows(), 2);
    EXPECT_EQ(c.cols(), 2);
    EXPECT_EQ(c.nnz(), 3u);
    EXPECT_EQ(c.get(0, 0), 4);
    EXPECT_EQ(c.get(0, 1), 4);
    EXPECT_EQ(c.get(1, 1), 2);
    EXPECT_EQ(c.get(1, 0), 0);
}

TEST(SparseMatrix, AddKeepsZeroSums) {
    lmatrix a(2, 2), b(2, 2);
    a.set(1, 1, 5);
    b.set(1, 1, -5);
    lmatrix c = a + b;
    EXPECT_TRUE(c.contains(1, 1));
    EXPECT_EQ(c.get(1, 1), 0);
    EXPECT_EQ(c.nnz(), 1u);
}

TEST(SparseMatrix, SubtractCoversKeyUnion) {
    lmatrix c = matrix_a().subtract(matrix_b());
    EXPECT_EQ(c.get(0, 0), -2);
    EXPECT_EQ(c.get(0, 1), -4);
    EXPECT_EQ(c.get(1, 1), 2);
    EXPECT_EQ(c.nnz(), 3u);
}

TEST(SparseMatrix, OperatorsDoNotMutateOperands) {
    lmatrix a = matrix_a(), b = matrix_b();
    lmatrix a0 = a, b0 = b;
    lmatrix c = a + b;
    c = a - b;
    c = a * b;
    EXPECT_EQ(a.entries(), a0.entries());
    EXPECT_EQ(b.entries(), b0.entries());
}

TEST(SparseMatrix, ElementwiseProperties) {
    lmatrix a = pseudo_random(7, 9, 25, 1);
    lmatrix b = pseudo_random(7, 9, 30, 2);
    lmatrix s = a.add(b);
    lmatrix d = a.subtract(b);
    for (long i=0 ; i<7 ; ++i) {
        for (long j=0 ; j<9 ; ++j) {
            EXPECT_EQ(s.get(i, j), a.get(i, j) + b.get(i, j));
            EXPECT_EQ(d.get(i, j), a.get(i, j) - b.get(i, j));
        }
    }
}

TEST(SparseMatrix, AddThenSubtractGivesBackValues) {
    lmatrix a = pseudo_random(6, 6, 12, 3);
    lmatrix b = pseudo_random(6, 6, 12, 4);
    lmatrix c = a.add(b).subtract(b);
    for (long i=0 ; i<6 ; ++i)
        for (long j=0 ; j<6 ; ++j)
            EXPECT_EQ(c.get(i, j), a.get(i, j));
    EXPECT_TRUE(c == a);
}

TEST(SparseMatrix, AddThenSubtractIsValueEqualWithNewKeys) {
    lmatrix a(2, 2), b(2, 2);
    a.set(0, 0, 1);
    b.set(0, 0, 3);
    b.set(1, 1, 4);
    lmatrix r = a.add(b).subtract(b);
    EXPECT_TRUE(r.contains(1, 1));
    EXPECT_EQ(r.get(1, 1), 0);
    EXPECT_TRUE(r == a);
    EXPECT_TRUE(a == r);
    EXPECT_TRUE(matrix_a().add(matrix_b()).subtract(matrix_b()) == matrix_a());
}

TEST(SparseMatrix, ShapeMismatchThrows) {
    lmatrix a(2, 3), b(3, 2);
    EXPECT_THROW(a.add(b), dimension_mismatch);
    EXPECT_THROW(a.subtract(b), dimension_mismatch);
    EXPECT_THROW(a.multiply(lmatrix(2, 3)), dimension_mismatch);
    EXPECT_NO_THROW(a.multiply(b));
}

TEST(SparseMatrix, MultiplyExample) {
    lmatrix c = matrix_a().multiply(matrix_b());
    EXPECT_EQ(c.rows(), 2);
    EXPECT_EQ(c.cols(), 2);
    EXPECT_EQ(c.nnz(), 2u);
    EXPECT_EQ(c.get(0, 0), 3);
    EXPECT_EQ(c.get(0, 1), 4);
    EXPECT_FALSE(c.contains(1, 0));
    EXPECT_FALSE(c.contains(1, 1));
}

TEST(SparseMatrix, MultiplyShapeAndDotProducts) {
    lmatrix a = pseudo_random(5, 8, 20, 5);
    lmatrix b = pseudo_random(8, 3, 12, 6);
    lmatrix c = a * b;
    ASSERT_EQ(c.rows(), 5);
    ASSERT_EQ(c.cols(), 3);
    for (long i=0 ; i<5 ; ++i) {
        for (long j=0 ; j<3 ; ++j) {
            long dot = 0;
            for (long k=0 ; k<8 ; ++k) dot += a.get(i, k)*b.get(k, j);
            EXPECT_EQ(c.get(i, j), dot);
            EXPECT_EQ(c.contains(i, j), dot != 0);
        }
    }
}

TEST(SparseMatrix, MultiplyPrunesCancellingProducts) {
    lmatrix a(1, 2), b(2, 1);
    a.set(0, 0, 2);
    a.set(0, 1, 3);
    b.set(0, 0, 3);
    b.set(1, 0, -2);
    lmatrix c = a * b;
    EXPECT_TRUE(c.empty());
}

TEST(SparseMatrix, MultiplyIgnoresOutOfRangeKeys) {
    lmatrix a(1, 2), b(2, 2);
    a.set(0, 0, 1);
    a.set(0, 5, 100);   // beyond a.cols()
    b.set(0, 0, 2);
    b.set(0, 7, 100);   // beyond b.cols()
    b.set(5, 0, 100);   // beyond b.rows()
    lmatrix c = a * b;
    EXPECT_EQ(c.nnz(), 1u);
    EXPECT_EQ(c.get(0, 0), 2);
}

TEST(SparseMatrix, MultiplyColumnsInIncreasingOrder) {
    lmatrix a(1, 1), b(1, 3);
    a.set(0, 0, 1);
    b.set(0, 2, 1);
    b.set(0, 0, 1);
    b.set(0, 1, 1);
    typedef lmatrix::entry_type e;
    std::vector<e> expected = { e(0, 0, 1), e(0, 1, 1), e(0, 2, 1) };
    EXPECT_EQ((a*b).entries(), expected);
}

TEST(SparseMatrix, ValueEqualityIgnoresOrder) {
    lmatrix a(3, 3), b(3, 3);
    a.set(0, 1, 1);
    a.set(2, 2, 2);
    b.set(2, 2, 2);
    b.set(0, 1, 1);
    EXPECT_TRUE(a == b);
    b.set(1, 1, 0);
    EXPECT_TRUE(a == b);
    a.set(1, 0, 0);
    EXPECT_TRUE(a == b);
    b.set(1, 1, 5);
    EXPECT_TRUE(a != b);
    EXPECT_FALSE(lmatrix(3, 3) == lmatrix(3, 4));
}

TEST(SparseMatrix, OverflowThrows) {
    const long big = std::numeric_limits<long>::max();
    const long small = std::numeric_limits<long>::min();
    lmatrix a(1, 1), b(1, 1), c(1, 1);
    a.set(0, 0, big);
    b.set(0, 0, -1);
    c.set(0, 0, small);
    EXPECT_THROW(a.add(a), std::overflow_error);
    EXPECT_THROW(a.subtract(b), std::overflow_error);
    EXPECT_THROW(c.subtract(a), std::overflow_error);
    EXPECT_THROW(a.multiply(a), std::overflow_error);
    EXPECT_EQ(a.add(b).get(0, 0), big-1);
    EXPECT_EQ(a.multiply(b).get(0, 0), -big);

    // the dot product accumulator is checked as well
    lmatrix row(1, 2), col(2, 1);
    row.set(0, 0, big);
    row.set(0, 1, 1);
    col.set(0, 0, 1);
    col.set(1, 0, 1);
    EXPECT_THROW(row.multiply(col), std::overflow_error);
}

TEST(SparseMatrix, LargeSparseMatrixStaysSparse) {
    lmatrix a(10000, 10000), b(10000, 10000);
    for (long i=0 ; i<50 ; ++i) {
        a.set(i*199, (i*7919) % 10000, i+1);
        b.set(i*199, (i*104729) % 10000, -(i+1));
    }
    lmatrix c = a + b;
    EXPECT_EQ(c.rows(), 10000);
    EXPECT_LE(c.nnz(), 100u);
    EXPECT_GE(c.nnz(), 50u);
    EXPECT_EQ(c.get(9999, 9999), 0);
}
