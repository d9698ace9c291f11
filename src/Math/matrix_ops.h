// -*-c++-*-
#ifndef CONFORMIX_MATRIX_OPS_H
#define CONFORMIX_MATRIX_OPS_H

#include <algorithm>
#include <cmath>
#include <vector>
#include "copyright.h"
#include "Constants/behavior.h"
#include "Constants/scaling.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "vector_ops.h"

namespace conformix {
namespace stmath {

using constants::ExceptionResponse;
using parse::realToString;

/// \brief The maximum number of sweeps over all column pairs that the one-sided Jacobi singular
///        value decomposition will take before it is declared non-convergent.
constexpr int maximum_svd_sweeps = 64;

/// \brief Column pairs whose normalized inner product falls below this value are considered
///        orthogonal by the one-sided Jacobi singular value decomposition.
constexpr double svd_orthogonality_tol = 1.0e-14;

/// \brief Enumerate the transpose states of a matrix, for some basic matrix operations
enum class TransposeState {
  AS_IS,     ///< The matrix shall be taken as it is found
  TRANSPOSE  ///< The matrix shall be handled by first taking its transpose (the original matrix
             ///<   will not be disturbed)
};

/// \brief Multiply two matrices, with or without transposition of either, after multiplying each
///        by scalar prefactors and any pre-existing result matrix by its own prefactor.  All
///        matrices are column-major.  This routine emulates BLAS functionality with a slightly
///        different API.
///
/// Overloaded:
///   - Operate on raw pointers to C-style arrays, with trusted row and column bounds
///   - Accept Standard Template Library objects
///
/// \param a        Hereafter "matrix A", the first of the operand matrices
/// \param row_a    Number of rows in matrix A
/// \param col_a    Number of columns in matrix A
/// \param b        Hereafter "matrix B", the second of the operand matrices
/// \param row_b    Number of rows in matrix B
/// \param col_b    Number of columns in matrix B
/// \param c        Hereafter "matrix C", the result (pre-allocated)
/// \param scale_a  Scalar prefactor for matrix A
/// \param scale_b  Scalar prefactor for matrix B
/// \param scale_c  Scalar prefactor for matrix C
/// \param x_a      Transpose instruction for matrix A
/// \param x_b      Transpose instruction for matrix B
/// \{
template <typename T>
void matrixMultiply(const T* a, size_t row_a, size_t col_a, const T* b, size_t row_b, size_t col_b,
                    T* c, T scale_a = 1.0, T scale_b = 1.0, T scale_c = 0.0,
                    TransposeState x_a = TransposeState::AS_IS,
                    TransposeState x_b = TransposeState::AS_IS);

template <typename T>
void matrixMultiply(const std::vector<T> &a, size_t row_a, size_t col_a, const std::vector<T> &b,
                    size_t row_b, size_t col_b, std::vector<T> *c, T scale_a = 1.0,
                    T scale_b = 1.0, T scale_c = 0.0, TransposeState x_a = TransposeState::AS_IS,
                    TransposeState x_b = TransposeState::AS_IS);
/// \}

/// \brief Transpose a column-major matrix out of place.
///
/// Overloaded:
///   - Operate on C-style arrays with trusted dimensions
///   - Operate on Standard Template Library vectors
///
/// \param a            The matrix to transpose
/// \param a_transpose  The transposed matrix (pre-allocated)
/// \param rows         Number of rows in the original matrix
/// \param columns      Number of columns in the original matrix
/// \{
template <typename T>
void transpose(const T* a, T* a_transpose, size_t rows, size_t columns);

template <typename T>
void transpose(const std::vector<T> &a, std::vector<T> *a_transpose, size_t rows, size_t columns);
/// \}

/// \brief Check that a matrix's storage matches its stated dimensions.
///
/// \param rows     Stated number of rows
/// \param columns  Stated number of columns
/// \param s_a      Number of elements allocated for the matrix
/// \param caller   Name of the calling function
/// \param label    Name of the matrix, for error reporting
void checkMatrixDimensions(size_t rows, size_t columns, size_t s_a, const char* caller,
                           const char* label);

/// \brief Compute the determinant of a small square matrix by the Leibniz formula.
///
/// Overloaded:
///   - Provide a C-style array with N^2 elements (N > 8 will be trapped as inefficient)
///   - Provide a Standard Template Library vector
///
/// \param amat  The matrix of interest, presented in column-major (Fortran) format
/// \param rank  Trusted square root of the length of amat
/// \{
template <typename T>
double leibnizDeterminant(const T* amat, size_t rank);

template <typename T>
double leibnizDeterminant(const std::vector<T> &amat);
/// \}

/// \brief Compute the singular value decomposition A = U S V^T of a real matrix with at least as
///        many rows as columns, by one-sided Jacobi rotations.  All matrices are column-major.
///        On output the singular values are non-negative and sorted in descending order, the
///        columns of U are orthonormal (columns for zero singular values are completed to an
///        orthonormal set), and V is orthogonal.
///
/// Overloaded:
///   - Provide C-style arrays with trusted dimensions
///   - Provide Standard Template Library vectors, which will be checked and resized as needed
///
/// \param a        The matrix to decompose (rows x columns, not modified)
/// \param u        The left singular vectors (rows x columns, filled on output)
/// \param sigma    The singular values (columns, filled on output)
/// \param v        The right singular vectors (columns x columns, filled on output)
/// \param rows     Number of rows in matrix A
/// \param columns  Number of columns in matrix A
/// \param policy   Procedure in the event that the rotations do not converge
/// \{
template <typename T>
void singularValueDecomposition(const T* a, T* u, T* sigma, T* v, size_t rows, size_t columns,
                                ExceptionResponse policy = ExceptionResponse::DIE);

template <typename T>
void singularValueDecomposition(const std::vector<T> &a, std::vector<T> *u,
                                std::vector<T> *sigma, std::vector<T> *v, size_t rows,
                                size_t columns,
                                ExceptionResponse policy = ExceptionResponse::DIE);
/// \}

} // namespace stmath
} // namespace conformix

#include "matrix_ops.tpp"

#endif
