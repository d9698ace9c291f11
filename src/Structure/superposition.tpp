// -*-c++-*-
#include "copyright.h"

namespace conformix {
namespace structure {

//-------------------------------------------------------------------------------------------------
template <typename Tcalc>
Tcalc checkedWeightSum(const Tcalc* weights, const int natom, const char* caller) {
  Tcalc result = 0.0;
  if (weights == nullptr) {
    result = natom;
  }
  else {
    for (int i = 0; i < natom; i++) {
      result += weights[i];
    }
  }
  if (fabs(result) <= constants::degenerate_weight_sum) {
    rtErr(ErrorKind::DEGENERATE_WEIGHTS, "The sum of weights over " + std::to_string(natom) +
          " atoms is zero.  No weighted centroid or superposition can be defined.", caller);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
template <typename Tcoord, typename Tcalc>
double3 weightedCentroid(const Tcoord* xcrd, const Tcoord* ycrd, const Tcoord* zcrd,
                         const Tcalc* weights, const int natom) {
  const Tcalc sw = checkedWeightSum(weights, natom, "weightedCentroid");
  Tcalc sx = 0.0;
  Tcalc sy = 0.0;
  Tcalc sz = 0.0;
  if (weights == nullptr) {
    for (int i = 0; i < natom; i++) {
      sx += static_cast<Tcalc>(xcrd[i]);
      sy += static_cast<Tcalc>(ycrd[i]);
      sz += static_cast<Tcalc>(zcrd[i]);
    }
  }
  else {
    for (int i = 0; i < natom; i++) {
      sx += weights[i] * static_cast<Tcalc>(xcrd[i]);
      sy += weights[i] * static_cast<Tcalc>(ycrd[i]);
      sz += weights[i] * static_cast<Tcalc>(zcrd[i]);
    }
  }
  return { static_cast<double>(sx / sw), static_cast<double>(sy / sw),
           static_cast<double>(sz / sw) };
}

//-------------------------------------------------------------------------------------------------
template <typename Tcoord, typename Tcalc>
SuperpositionTransform computeSuperposition(const Tcoord* xcrd_mov, const Tcoord* ycrd_mov,
                                            const Tcoord* zcrd_mov, const Tcoord* xcrd_ref,
                                            const Tcoord* ycrd_ref, const Tcoord* zcrd_ref,
                                            const Tcalc* weights, const int natom) {
  if (isFloatingPointScalarType<Tcalc>() == false) {
    rtErr("Superposition must be computed in a floating point representation, not " +
          data_types::getConformixScalarTypeName<Tcalc>() + ".", "computeSuperposition");
  }
  const double3 com_a = weightedCentroid(xcrd_mov, ycrd_mov, zcrd_mov, weights, natom);
  const double3 com_b = weightedCentroid(xcrd_ref, ycrd_ref, zcrd_ref, weights, natom);

  // Accumulate the weighted cross-covariance of the centered coordinates.  Centering before
  // multiplication avoids the loss of precision that comes with sets far from the origin.
  Tcalc sab_xx = 0.0;
  Tcalc sab_xy = 0.0;
  Tcalc sab_xz = 0.0;
  Tcalc sab_yx = 0.0;
  Tcalc sab_yy = 0.0;
  Tcalc sab_yz = 0.0;
  Tcalc sab_zx = 0.0;
  Tcalc sab_zy = 0.0;
  Tcalc sab_zz = 0.0;
  const Tcalc value_one = 1.0;
  for (int i = 0; i < natom; i++) {
    const Tcalc wi = (weights == nullptr) ? value_one : weights[i];
    const Tcalc ax = static_cast<Tcalc>(xcrd_mov[i]) - com_a.x;
    const Tcalc ay = static_cast<Tcalc>(ycrd_mov[i]) - com_a.y;
    const Tcalc az = static_cast<Tcalc>(zcrd_mov[i]) - com_a.z;
    const Tcalc bx = static_cast<Tcalc>(xcrd_ref[i]) - com_b.x;
    const Tcalc by = static_cast<Tcalc>(ycrd_ref[i]) - com_b.y;
    const Tcalc bz = static_cast<Tcalc>(zcrd_ref[i]) - com_b.z;
    sab_xx += wi * ax * bx;
    sab_xy += wi * ax * by;
    sab_xz += wi * ax * bz;
    sab_yx += wi * ay * bx;
    sab_yy += wi * ay * by;
    sab_yz += wi * ay * bz;
    sab_zx += wi * az * bx;
    sab_zy += wi * az * by;
    sab_zz += wi * az * bz;
  }

  // H(i,j) = sum w a_i b_j, stored column-major.  Decompose H = U S V^T.
  double hmat[9], umat[9], sigma[3], vmat[9];
  hmat[0] = sab_xx;
  hmat[1] = sab_yx;
  hmat[2] = sab_zx;
  hmat[3] = sab_xy;
  hmat[4] = sab_yy;
  hmat[5] = sab_zy;
  hmat[6] = sab_xz;
  hmat[7] = sab_yz;
  hmat[8] = sab_zz;
  singularValueDecomposition(hmat, umat, sigma, vmat, 3, 3);

  // R = V U^T.  If this is an improper rotation, reverse the right singular vector belonging to
  // the smallest singular value (the last, as they are sorted in descending order).
  std::vector<double> rmat(9);
  matrixMultiply(vmat, 3, 3, umat, 3, 3, rmat.data(), 1.0, 1.0, 0.0, TransposeState::AS_IS,
                 TransposeState::TRANSPOSE);
  if (leibnizDeterminant(rmat.data(), 3) < 0.0) {
    for (int i = 6; i < 9; i++) {
      vmat[i] = -vmat[i];
    }
    matrixMultiply(vmat, 3, 3, umat, 3, 3, rmat.data(), 1.0, 1.0, 0.0, TransposeState::AS_IS,
                   TransposeState::TRANSPOSE);
  }
  return SuperpositionTransform(rmat, com_a, com_b);
}

//-------------------------------------------------------------------------------------------------
template <typename Tcoord>
void applySuperposition(Tcoord* xcrd, Tcoord* ycrd, Tcoord* zcrd, const int natom,
                        const SuperpositionTransform &xform) {
  const std::vector<double> &r = xform.rotation;
  const double3 ca = xform.moving_centroid;
  const double3 cb = xform.reference_centroid;
  for (int i = 0; i < natom; i++) {
    const double dx = static_cast<double>(xcrd[i]) - ca.x;
    const double dy = static_cast<double>(ycrd[i]) - ca.y;
    const double dz = static_cast<double>(zcrd[i]) - ca.z;
    xcrd[i] = (r[0] * dx) + (r[3] * dy) + (r[6] * dz) + cb.x;
    ycrd[i] = (r[1] * dx) + (r[4] * dy) + (r[7] * dz) + cb.y;
    zcrd[i] = (r[2] * dx) + (r[5] * dy) + (r[8] * dz) + cb.z;
  }
}

//-------------------------------------------------------------------------------------------------
template <typename Tcoord, typename Tcalc>
SuperpositionTransform superposeCoordinates(Tcoord* xcrd_mov, Tcoord* ycrd_mov, Tcoord* zcrd_mov,
                                            const Tcoord* xcrd_ref, const Tcoord* ycrd_ref,
                                            const Tcoord* zcrd_ref, const Tcalc* weights,
                                            const int natom) {
  const SuperpositionTransform result = computeSuperposition(xcrd_mov, ycrd_mov, zcrd_mov,
                                                             xcrd_ref, ycrd_ref, zcrd_ref,
                                                             weights, natom);
  applySuperposition(xcrd_mov, ycrd_mov, zcrd_mov, natom, result);
  return result;
}

//-------------------------------------------------------------------------------------------------
template <typename Tcoord, typename Tcalc>
Tcalc weightedRmsd(const Tcoord* xcrd_a, const Tcoord* ycrd_a, const Tcoord* zcrd_a,
                   const Tcoord* xcrd_b, const Tcoord* ycrd_b, const Tcoord* zcrd_b,
                   const Tcalc* weights, const int natom) {
  const Tcalc sw = checkedWeightSum(weights, natom, "weightedRmsd");
  Tcalc result = 0.0;
  const Tcalc value_one = 1.0;
  for (int i = 0; i < natom; i++) {
    const Tcalc dx = static_cast<Tcalc>(xcrd_b[i]) - static_cast<Tcalc>(xcrd_a[i]);
    const Tcalc dy = static_cast<Tcalc>(ycrd_b[i]) - static_cast<Tcalc>(ycrd_a[i]);
    const Tcalc dz = static_cast<Tcalc>(zcrd_b[i]) - static_cast<Tcalc>(zcrd_a[i]);
    const Tcalc wi = (weights == nullptr) ? value_one : weights[i];
    result += wi * ((dx * dx) + (dy * dy) + (dz * dz));
  }
  return (result > 0.0) ? sqrt(result / sw) : 0.0;
}

//-------------------------------------------------------------------------------------------------
template <typename Tcoord, typename Tcalc>
Tcalc alignedRmsd(const Tcoord* xcrd_a, const Tcoord* ycrd_a, const Tcoord* zcrd_a,
                  const Tcoord* xcrd_b, const Tcoord* ycrd_b, const Tcoord* zcrd_b,
                  const Tcalc* weights, const int natom) {
  const SuperpositionTransform xform = computeSuperposition(xcrd_a, ycrd_a, zcrd_a, xcrd_b,
                                                            ycrd_b, zcrd_b, weights, natom);
  const Tcalc sw = checkedWeightSum(weights, natom, "alignedRmsd");
  const std::vector<double> &r = xform.rotation;
  const double3 ca = xform.moving_centroid;
  const double3 cb = xform.reference_centroid;
  const Tcalc value_one = 1.0;
  Tcalc result = 0.0;
  for (int i = 0; i < natom; i++) {
    const double ax = static_cast<double>(xcrd_a[i]) - ca.x;
    const double ay = static_cast<double>(ycrd_a[i]) - ca.y;
    const double az = static_cast<double>(zcrd_a[i]) - ca.z;
    const Tcalc dx = (r[0] * ax) + (r[3] * ay) + (r[6] * az) + cb.x - xcrd_b[i];
    const Tcalc dy = (r[1] * ax) + (r[4] * ay) + (r[7] * az) + cb.y - ycrd_b[i];
    const Tcalc dz = (r[2] * ax) + (r[5] * ay) + (r[8] * az) + cb.z - zcrd_b[i];
    const Tcalc wi = (weights == nullptr) ? value_one : weights[i];
    result += wi * ((dx * dx) + (dy * dy) + (dz * dz));
  }
  return (result > 0.0) ? sqrt(result / sw) : 0.0;
}

} // namespace structure
} // namespace conformix
