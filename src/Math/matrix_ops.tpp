// -*-c++-*-
#include "copyright.h"

namespace conformix {
namespace stmath {

//-------------------------------------------------------------------------------------------------
template <typename T>
void matrixMultiply(const T* a, const size_t row_a, const size_t col_a, const T* b,
                    const size_t row_b, const size_t col_b, T* c, const T scale_a,
                    const T scale_b, const T scale_c, const TransposeState x_a,
                    const TransposeState x_b) {

  // Check dimensions
  size_t relevant_row_a, relevant_col_a, relevant_row_b, relevant_col_b;
  switch (x_a) {
  case TransposeState::AS_IS:
    relevant_row_a = row_a;
    relevant_col_a = col_a;
    break;
  case TransposeState::TRANSPOSE:
    relevant_row_a = col_a;
    relevant_col_a = row_a;
    break;
  }
  switch (x_b) {
  case TransposeState::AS_IS:
    relevant_row_b = row_b;
    relevant_col_b = col_b;
    break;
  case TransposeState::TRANSPOSE:
    relevant_row_b = col_b;
    relevant_col_b = row_b;
    break;
  }
  if (relevant_col_a != relevant_row_b) {
    rtErr("The effective number of columns in matrix A (" +
          std::to_string(relevant_col_a) + ") must equal the effective number of rows in matrix "
          "B (" + std::to_string(relevant_row_b) + ").", "matrixMultiply");
  }

  // Step down each column of the result.  The element (i, k) of A, as it is to be applied, is
  // found at a[(k * row_a) + i] if A is taken as is, or a[(i * row_a) + k] if it is transposed.
  const double scale_ab = static_cast<double>(scale_a) * static_cast<double>(scale_b);
  for (size_t j = 0; j < relevant_col_b; j++) {
    for (size_t i = 0; i < relevant_row_a; i++) {
      double dsum = 0.0;
      for (size_t k = 0; k < relevant_col_a; k++) {
        const size_t a_idx = (x_a == TransposeState::AS_IS) ? (k * row_a) + i : (i * row_a) + k;
        const size_t b_idx = (x_b == TransposeState::AS_IS) ? (j * row_b) + k : (k * row_b) + j;
        dsum += static_cast<double>(a[a_idx]) * static_cast<double>(b[b_idx]);
      }
      const size_t c_idx = (j * relevant_row_a) + i;
      if (scale_c == static_cast<T>(0)) {
        c[c_idx] = scale_ab * dsum;
      }
      else {
        c[c_idx] = (scale_c * c[c_idx]) + (scale_ab * dsum);
      }
    }
  }
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void matrixMultiply(const std::vector<T> &a, const size_t row_a, const size_t col_a,
                    const std::vector<T> &b, const size_t row_b, const size_t col_b,
                    std::vector<T> *c, const T scale_a, const T scale_b, const T scale_c,
                    const TransposeState x_a, const TransposeState x_b) {
  checkMatrixDimensions(row_a, col_a, a.size(), "matrixMultiply", "A");
  checkMatrixDimensions(row_b, col_b, b.size(), "matrixMultiply", "B");
  const size_t row_c = (x_a == TransposeState::AS_IS) ? row_a : col_a;
  const size_t col_c = (x_b == TransposeState::AS_IS) ? col_b : row_b;
  if (c->size() != row_c * col_c) {
    if (scale_c != static_cast<T>(0)) {
      rtErr("Matrix C holds " + std::to_string(c->size()) + " elements but the product is " +
            std::to_string(row_c) + " x " + std::to_string(col_c) + ".", "matrixMultiply");
    }
    c->resize(row_c * col_c);
  }
  matrixMultiply(a.data(), row_a, col_a, b.data(), row_b, col_b, c->data(), scale_a, scale_b,
                 scale_c, x_a, x_b);
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void transpose(const T* a, T* a_transpose, const size_t rows, const size_t columns) {
  for (size_t i = 0; i < columns; i++) {
    for (size_t j = 0; j < rows; j++) {
      a_transpose[(j * columns) + i] = a[(i * rows) + j];
    }
  }
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void transpose(const std::vector<T> &a, std::vector<T> *a_transpose, const size_t rows,
               const size_t columns) {
  checkMatrixDimensions(rows, columns, a.size(), "transpose", "A");
  a_transpose->resize(rows * columns);
  transpose(a.data(), a_transpose->data(), rows, columns);
}

//-------------------------------------------------------------------------------------------------
template <typename T>
double leibnizDeterminant(const T* amat, const size_t rank) {
  if (rank == 1) {
    return amat[0];
  }
  else if (rank == 2) {
    return (amat[0] * amat[3]) - (amat[1] * amat[2]);
  }
  else if (rank == 3) {
    return (amat[0] * ((amat[4] * amat[8]) - (amat[5] * amat[7]))) -
           (amat[3] * ((amat[1] * amat[8]) - (amat[2] * amat[7]))) +
           (amat[6] * ((amat[1] * amat[5]) - (amat[2] * amat[4])));
  }
  else if (rank <= 8) {

    // Expand along the first row, taking minors of the remaining rows and columns
    double detsum = 0.0;
    double sgnfac = 1.0;
    const size_t subrank = rank - 1;
    std::vector<T> submat(subrank * subrank);
    for (size_t i = 0; i < rank; i++) {
      size_t jcon = 0;
      for (size_t j = 0; j < rank; j++) {
        if (j == i) {
          continue;
        }
        for (size_t k = 1; k < rank; k++) {
          submat[(jcon * subrank) + k - 1] = amat[(j * rank) + k];
        }
        jcon++;
      }
      detsum += sgnfac * amat[i * rank] * leibnizDeterminant(submat.data(), subrank);
      sgnfac = -sgnfac;
    }
    return detsum;
  }
  else {
    rtErr("The Leibniz formula is numerically ill-conditioned and requires O(N! * N) operations.  "
          "Matrices of rank " + std::to_string(rank) + " are not supported.",
          "leibnizDeterminant");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
template <typename T>
double leibnizDeterminant(const std::vector<T> &amat) {
  const size_t rank = round(sqrt(static_cast<double>(amat.size())));
  if (rank * rank != amat.size() || rank == 0) {
    rtErr("An array of length " + std::to_string(amat.size()) + " cannot represent a square "
          "matrix.", "leibnizDeterminant");
  }
  return leibnizDeterminant(amat.data(), rank);
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void singularValueDecomposition(const T* a, T* u, T* sigma, T* v, const size_t rows,
                                const size_t columns, const ExceptionResponse policy) {
  if (rows < columns || columns == 0) {
    rtErr("A matrix of " + std::to_string(rows) + " rows and " + std::to_string(columns) +
          " columns cannot be decomposed.  At least as many rows as columns are required.",
          "singularValueDecomposition");
  }

  // The rotations proceed in double precision regardless of the input type.  Work matrix W
  // begins as A and converges to U S, while V accumulates the rotations.
  std::vector<double> wmat(rows * columns);
  std::vector<double> vmat(columns * columns, 0.0);
  for (size_t i = 0; i < rows * columns; i++) {
    wmat[i] = a[i];
  }
  for (size_t i = 0; i < columns; i++) {
    vmat[(i * columns) + i] = 1.0;
  }
  bool converged = false;
  int sweep = 0;
  while (converged == false && sweep < maximum_svd_sweeps) {
    converged = true;
    for (size_t p = 0; p < columns - 1; p++) {
      double* wp = &wmat[p * rows];
      double* vp = &vmat[p * columns];
      for (size_t q = p + 1; q < columns; q++) {
        double* wq = &wmat[q * rows];
        double* vq = &vmat[q * columns];
        double alpha = 0.0;
        double beta = 0.0;
        double gamma = 0.0;
        for (size_t k = 0; k < rows; k++) {
          alpha += wp[k] * wp[k];
          beta  += wq[k] * wq[k];
          gamma += wp[k] * wq[k];
        }
        if (fabs(gamma) <= svd_orthogonality_tol * sqrt(alpha * beta)) {
          continue;
        }
        converged = false;

        // Compute the rotation that makes columns p and q orthogonal
        const double zeta = (beta - alpha) / (2.0 * gamma);
        const double zroot = (fabs(zeta) > 1.0e150) ? fabs(zeta) : sqrt(1.0 + (zeta * zeta));
        const double t = ((zeta >= 0.0) ? 1.0 : -1.0) / (fabs(zeta) + zroot);
        const double c = 1.0 / sqrt(1.0 + (t * t));
        const double s = c * t;
        for (size_t k = 0; k < rows; k++) {
          const double wkp = wp[k];
          wp[k] = (c * wkp) - (s * wq[k]);
          wq[k] = (s * wkp) + (c * wq[k]);
        }
        for (size_t k = 0; k < columns; k++) {
          const double vkp = vp[k];
          vp[k] = (c * vkp) - (s * vq[k]);
          vq[k] = (s * vkp) + (c * vq[k]);
        }
      }
    }
    sweep++;
  }
  if (converged == false) {
    switch (policy) {
    case ExceptionResponse::DIE:
      rtErr("One-sided Jacobi rotations did not converge after " +
            std::to_string(maximum_svd_sweeps) + " sweeps on a " + std::to_string(rows) + " x " +
            std::to_string(columns) + " matrix.", "singularValueDecomposition");
    case ExceptionResponse::WARN:
      rtWarn("One-sided Jacobi rotations did not converge after " +
             std::to_string(maximum_svd_sweeps) + " sweeps on a " + std::to_string(rows) + " x " +
             std::to_string(columns) + " matrix.  The decomposition may be inaccurate.",
             "singularValueDecomposition");
      break;
    case ExceptionResponse::SILENT:
      break;
    }
  }

  // The singular values are the norms of the columns of W.  Order them from largest to smallest.
  std::vector<double> svals(columns);
  std::vector<size_t> order(columns);
  for (size_t j = 0; j < columns; j++) {
    svals[j] = magnitude(&wmat[j * rows], rows);
    order[j] = j;
  }
  std::stable_sort(order.begin(), order.end(),
                   [&svals](const size_t ia, const size_t ib) { return svals[ia] > svals[ib]; });
  const double cutoff = constants::singular_value_cutoff * svals[order[0]];
  std::vector<double> umat(rows * columns, 0.0);
  std::vector<bool> deficient(columns, false);
  for (size_t jpos = 0; jpos < columns; jpos++) {
    const size_t j = order[jpos];
    sigma[jpos] = svals[j];
    for (size_t k = 0; k < columns; k++) {
      v[(jpos * columns) + k] = vmat[(j * columns) + k];
    }
    if (svals[j] > cutoff && svals[j] > 0.0) {
      const double inv_sv = 1.0 / svals[j];
      for (size_t k = 0; k < rows; k++) {
        umat[(jpos * rows) + k] = wmat[(j * rows) + k] * inv_sv;
      }
    }
    else {
      deficient[jpos] = true;
    }
  }

  // Complete the left singular vectors for any vanishing singular values.  Of all unit vectors
  // along the Cartesian axes, take the one with the largest component orthogonal to the columns
  // already established, then orthogonalize it twice for numerical stability.
  std::vector<double> trial(rows), best(rows);
  for (size_t jpos = 0; jpos < columns; jpos++) {
    if (deficient[jpos] == false) {
      continue;
    }
    double best_norm = -1.0;
    for (size_t m = 0; m < rows; m++) {
      for (size_t k = 0; k < rows; k++) {
        trial[k] = (k == m) ? 1.0 : 0.0;
      }
      for (int pass = 0; pass < 2; pass++) {
        for (size_t ip = 0; ip < columns; ip++) {
          if (deficient[ip] && ip >= jpos) {
            continue;
          }
          const double* uip = &umat[ip * rows];
          const double proj = dot(trial.data(), uip, rows);
          for (size_t k = 0; k < rows; k++) {
            trial[k] -= proj * uip[k];
          }
        }
      }
      const double tnorm = magnitude(trial.data(), rows);
      if (tnorm > best_norm) {
        best_norm = tnorm;
        best = trial;
      }
    }
    const double inv_norm = 1.0 / best_norm;
    for (size_t k = 0; k < rows; k++) {
      umat[(jpos * rows) + k] = best[k] * inv_norm;
    }
  }
  for (size_t i = 0; i < rows * columns; i++) {
    u[i] = umat[i];
  }
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void singularValueDecomposition(const std::vector<T> &a, std::vector<T> *u, std::vector<T> *sigma,
                                std::vector<T> *v, const size_t rows, const size_t columns,
                                const ExceptionResponse policy) {
  checkMatrixDimensions(rows, columns, a.size(), "singularValueDecomposition", "A");
  u->resize(rows * columns);
  sigma->resize(columns);
  v->resize(columns * columns);
  singularValueDecomposition(a.data(), u->data(), sigma->data(), v->data(), rows, columns,
                             policy);
}

} // namespace stmath
} // namespace conformix
