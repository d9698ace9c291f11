#include <vector>
#include "copyright.h"
#include "../../src/Constants/behavior.h"
#include "../../src/Math/matrix_ops.h"
#include "../../src/Math/summation.h"
#include "../../src/Math/vector_ops.h"
#include "../../src/Random/random.h"
#include "../../src/Reporting/error_format.h"
#include "../../src/UnitTesting/approx.h"
#include "../../src/UnitTesting/unit_test.h"

using conformix::errors::ErrorKind;
using conformix::random::Xoroshiro128pGenerator;
using conformix::random::uniformRand;
using namespace conformix::stmath;
using namespace conformix::testing;

//-------------------------------------------------------------------------------------------------
// Multiply the singular value decomposition of a matrix back together, to check that it
// reproduces the original matrix.
//
// Arguments:
//   umat:   Left singular vectors, rows x columns, column-major
//   sigma:  Singular values
//   vmat:   Right singular vectors, columns x columns, column-major
//   rows:   Row count of the original matrix
//   cols:   Column count of the original matrix
//-------------------------------------------------------------------------------------------------
std::vector<double> recompose(const std::vector<double> &umat, const std::vector<double> &sigma,
                              const std::vector<double> &vmat, const size_t rows,
                              const size_t cols) {
  std::vector<double> us = umat;
  for (size_t j = 0; j < cols; j++) {
    for (size_t i = 0; i < rows; i++) {
      us[(j * rows) + i] *= sigma[j];
    }
  }
  std::vector<double> result;
  matrixMultiply(us, rows, cols, vmat, cols, cols, &result, 1.0, 1.0, 0.0,
                 TransposeState::AS_IS, TransposeState::TRANSPOSE);
  return result;
}

//-------------------------------------------------------------------------------------------------
int main(const int argc, const char* argv[]) {

  // Some baseline initialization
  TestEnvironment oe(argc, argv);
  Xoroshiro128pGenerator xrs(oe.getRandomSeed());

  // Section 1
  section("Vector processing capabilities");

  // Section 2
  section("Matrix multiplication and transposition");

  // Section 3
  section("Determinants and singular value decomposition");

  // Check vector processing capabilities
  section(1);
  const std::vector<double> dv_i = { 0.1, 0.5, 0.9, 0.7, 0.8 };
  check(mean(dv_i), RelationalOperator::EQUAL, Approx(0.6).margin(1.0e-12), "The mean value of a "
        "simple real number vector is incorrect.");
  const std::vector<int> iv_i = { 1, 5, 9, 7, 38 };
  check(sum<int>(iv_i), RelationalOperator::EQUAL, 60, "The sum of a simple integer vector is "
        "incorrect.");
  const std::vector<double> dv_i_long = { -0.3, -0.6, 0.1, 0.5, 0.9, 0.7, 0.8 };
  CHECK_THROWS(maxAbsoluteDifference(dv_i_long, dv_i), "Vectors of different lengths were "
               "compared to obtain a maximum difference.");
  const std::vector<double> dv_ii = { 2.1, 3.5, -9.9, 4.7, 7.8 };
  check(maxAbsoluteDifference(dv_i, dv_ii), RelationalOperator::EQUAL, Approx(10.8).margin(1.0e-12),
        "The maximum absolute difference between two vectors is incorrect.");
  check(dot(dv_i, dv_ii), RelationalOperator::EQUAL, Approx(3.37).margin(1.0e-12), "The dot "
        "product of two vectors is incorrect.");
  const std::vector<double> xvec = { 1.0, 0.0, 0.0 };
  const std::vector<double> yvec = { 0.0, 1.0, 0.0 };
  std::vector<double> zvec(3);
  crossProduct(xvec, yvec, &zvec);
  check(zvec, RelationalOperator::EQUAL, std::vector<double>({ 0.0, 0.0, 1.0 }), "The cross "
        "product of the unit X and Y vectors is not the unit Z vector.");
  std::vector<double> nvec = { 3.0, 0.0, 4.0 };
  check(magnitude(nvec), RelationalOperator::EQUAL, Approx(5.0).margin(1.0e-12), "The magnitude "
        "of a simple vector is incorrect.");
  normalize(&nvec);
  check(nvec, RelationalOperator::EQUAL, Approx(std::vector<double>({ 0.6, 0.0, 0.8 }),
                                                ComparisonType::ABSOLUTE, 1.0e-12),
        "Normalization of a simple vector produced the wrong result.");

  // Check matrix multiplication.  All matrices are column-major.
  section(2);
  const std::vector<double> amat = { 1.0, 4.0, 2.0, 5.0, 3.0, 6.0 };
  const std::vector<double> bmat = { 7.0, 9.0, 11.0, 8.0, 10.0, 12.0 };
  std::vector<double> cmat;
  matrixMultiply(amat, 2, 3, bmat, 3, 2, &cmat);
  check(cmat, RelationalOperator::EQUAL, std::vector<double>({ 58.0, 139.0, 64.0, 154.0 }),
        "The product of a 2 x 3 and a 3 x 2 matrix is incorrect.");
  std::vector<double> amat_t;
  transpose(amat, &amat_t, 2, 3);
  check(amat_t, RelationalOperator::EQUAL,
        std::vector<double>({ 1.0, 2.0, 3.0, 4.0, 5.0, 6.0 }), "The transpose of a 2 x 3 matrix "
        "is incorrect.");
  std::vector<double> ctmat;
  matrixMultiply(amat_t, 3, 2, bmat, 3, 2, &ctmat, 1.0, 1.0, 0.0, TransposeState::TRANSPOSE,
                 TransposeState::AS_IS);
  check(ctmat, RelationalOperator::EQUAL, cmat, "Multiplication with the first matrix transposed "
        "does not reproduce the direct product.");
  std::vector<double> scaled_c = cmat;
  matrixMultiply(amat, 2, 3, bmat, 3, 2, &scaled_c, 2.0, 1.0, -1.0);
  check(scaled_c, RelationalOperator::EQUAL, cmat, "A scaled product with accumulation into the "
        "result matrix is incorrect.");
  CHECK_THROWS_KIND(matrixMultiply(amat, 2, 2, bmat, 3, 2, &cmat), ErrorKind::SHAPE_MISMATCH,
                    "A matrix was accepted with the wrong number of elements for its stated "
                    "dimensions.");
  CHECK_THROWS(matrixMultiply(amat, 2, 3, amat, 2, 3, &cmat), "Matrices with incompatible inner "
               "dimensions were multiplied.");

  // Check determinants and singular value decomposition
  section(3);
  const std::vector<double> dmat = { 2.0, 1.0, 1.0, 0.0, 3.0, 1.0, 1.0, 2.0, 2.0 };
  check(leibnizDeterminant(dmat), RelationalOperator::EQUAL, Approx(6.0).margin(1.0e-12),
        "The determinant of a 3 x 3 matrix is incorrect.");
  const std::vector<double> rot_z = { 0.0, 1.0, 0.0, -1.0, 0.0, 0.0, 0.0, 0.0, 1.0 };
  check(leibnizDeterminant(rot_z), RelationalOperator::EQUAL, Approx(1.0).margin(1.0e-12),
        "The determinant of a proper rotation matrix is not one.");
  const std::vector<double> refl_x = { -1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0 };
  check(leibnizDeterminant(refl_x), RelationalOperator::EQUAL, Approx(-1.0).margin(1.0e-12),
        "The determinant of a reflection matrix is not minus one.");
  CHECK_THROWS(leibnizDeterminant(amat), "The determinant of a non-square matrix was computed.");
  const std::vector<double> svd_a = uniformRand(&xrs, 15, 4.0);
  std::vector<double> svd_u, svd_s, svd_v;
  singularValueDecomposition(svd_a, &svd_u, &svd_s, &svd_v, 5, 3);
  check(recompose(svd_u, svd_s, svd_v, 5, 3), RelationalOperator::EQUAL,
        Approx(svd_a, ComparisonType::ABSOLUTE, 1.0e-10), "The singular value decomposition of a "
        "5 x 3 matrix does not reproduce the original matrix.");
  check(svd_s[0] >= svd_s[1] && svd_s[1] >= svd_s[2] && svd_s[2] >= 0.0, "Singular values are "
        "not returned in descending order, or include negative values.");
  std::vector<double> vtv;
  matrixMultiply(svd_v, 3, 3, svd_v, 3, 3, &vtv, 1.0, 1.0, 0.0, TransposeState::TRANSPOSE,
                 TransposeState::AS_IS);
  check(vtv, RelationalOperator::EQUAL,
        Approx(std::vector<double>({ 1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0 }),
               ComparisonType::ABSOLUTE, 1.0e-10), "The right singular vectors are not "
        "orthonormal.");
  const std::vector<double> rank_def = { 1.0, 2.0, 3.0, 2.0, 4.0, 6.0, 0.0, 1.0, 0.0 };
  singularValueDecomposition(rank_def, &svd_u, &svd_s, &svd_v, 3, 3);
  check(svd_s[2], RelationalOperator::EQUAL, Approx(0.0).margin(1.0e-10), "The smallest singular "
        "value of a rank-deficient matrix is not zero.");
  check(recompose(svd_u, svd_s, svd_v, 3, 3), RelationalOperator::EQUAL,
        Approx(rank_def, ComparisonType::ABSOLUTE, 1.0e-10), "The singular value decomposition "
        "of a rank-deficient 3 x 3 matrix does not reproduce the original matrix.");

  // Print results
  printTestSummary(oe.getVerbosity());
  return countGlobalTestFailures();
}
