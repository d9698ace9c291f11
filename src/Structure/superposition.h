// -*-c++-*-
#ifndef CONFORMIX_SUPERPOSITION_H
#define CONFORMIX_SUPERPOSITION_H

#include <cmath>
#include <vector>
#include "copyright.h"
#include "Constants/behavior.h"
#include "Constants/scaling.h"
#include "DataTypes/common_types.h"
#include "DataTypes/conformix_vector_types.h"
#include "Math/matrix_ops.h"
#include "Reporting/error_format.h"
#include "Trajectory/coordinateframe.h"
#include "structure_enumerators.h"

namespace conformix {
namespace structure {

using constants::ExceptionResponse;
using data_types::isFloatingPointScalarType;
using errors::ErrorKind;
using stmath::leibnizDeterminant;
using stmath::matrixMultiply;
using stmath::singularValueDecomposition;
using stmath::TransposeState;
using trajectory::CoordinateFrame;
using trajectory::CoordinateFrameReader;
using trajectory::CoordinateFrameWriter;

/// \brief The rigid-body motion that superimposes one set of coordinates onto another: move the
///        moving set's weighted centroid to the origin, rotate, then move the origin to the
///        reference set's weighted centroid.  x' = R (x - c_mov) + c_ref.
struct SuperpositionTransform {

  /// \brief The constructor takes all components or defaults to the identity transformation.
  ///
  /// Overloaded:
  ///   - Construct the identity transformation
  ///   - Construct from a rotation matrix and two centroids
  ///
  /// \param rotation_in            Rotation matrix (3 x 3, column-major)
  /// \param moving_centroid_in     Weighted centroid of the moving coordinates
  /// \param reference_centroid_in  Weighted centroid of the reference coordinates
  /// \{
  SuperpositionTransform();
  SuperpositionTransform(const std::vector<double> &rotation_in, const double3 moving_centroid_in,
                         const double3 reference_centroid_in);
  /// \}

  std::vector<double> rotation;  ///< Proper rotation matrix (3 x 3, column-major, det = +1)
  double3 moving_centroid;       ///< Weighted centroid of the moving coordinates
  double3 reference_centroid;    ///< Weighted centroid of the reference coordinates
};

/// \brief Compute the sum of per-atom weights, raising a DEGENERATE_WEIGHTS error if it is zero.
///        A null pointer implies uniform weights of one.
///
/// \param weights  Per-atom weights (nullptr for uniform weights)
/// \param natom    Number of atoms
/// \param caller   Name of the calling function, for error reporting
template <typename Tcalc>
Tcalc checkedWeightSum(const Tcalc* weights, int natom, const char* caller = nullptr);

/// \brief Compute the weighted centroid of a set of coordinates.
///
/// \param xcrd     Cartesian X coordinates
/// \param ycrd     Cartesian Y coordinates
/// \param zcrd     Cartesian Z coordinates
/// \param weights  Per-atom weights (nullptr for uniform weights)
/// \param natom    Number of atoms
template <typename Tcoord, typename Tcalc>
double3 weightedCentroid(const Tcoord* xcrd, const Tcoord* ycrd, const Tcoord* zcrd,
                         const Tcalc* weights, int natom);

/// \brief Compute the weighted least-squares superposition of one set of coordinates onto
///        another by the Kabsch procedure.  Neither set is moved.  The weighted cross-covariance
///        of the centered sets is decomposed as H = U S V^T, and the rotation is R = V U^T, with
///        the sign of the last column of V reversed if needed to make R a proper rotation.
///
/// Overloaded:
///   - Operate on C-style arrays of coordinates with a trusted atom count
///   - Operate on coordinate frame abstracts
///   - Operate on CoordinateFrame objects
///
/// \param xcrd_mov   Cartesian X coordinates of the moving set
/// \param ycrd_mov   Cartesian Y coordinates of the moving set
/// \param zcrd_mov   Cartesian Z coordinates of the moving set
/// \param xcrd_ref   Cartesian X coordinates of the reference set
/// \param ycrd_ref   Cartesian Y coordinates of the reference set
/// \param zcrd_ref   Cartesian Z coordinates of the reference set
/// \param weights    Per-atom weights (nullptr or an empty vector for uniform weights)
/// \param natom      Number of atoms in each set
/// \param moving     The moving set of coordinates
/// \param reference  The reference set of coordinates
/// \{
template <typename Tcoord, typename Tcalc>
SuperpositionTransform computeSuperposition(const Tcoord* xcrd_mov, const Tcoord* ycrd_mov,
                                            const Tcoord* zcrd_mov, const Tcoord* xcrd_ref,
                                            const Tcoord* ycrd_ref, const Tcoord* zcrd_ref,
                                            const Tcalc* weights, int natom);

SuperpositionTransform computeSuperposition(const CoordinateFrameReader &moving,
                                            const CoordinateFrameReader &reference,
                                            const std::vector<double> &weights = {});

SuperpositionTransform computeSuperposition(const CoordinateFrame &moving,
                                            const CoordinateFrame &reference,
                                            const std::vector<double> &weights = {});
/// \}

/// \brief Apply a superposition transform to every atom of a set of coordinates, regardless of
///        the weights that went into computing it.
///
/// Overloaded:
///   - Operate on C-style arrays of coordinates with a trusted atom count
///   - Operate on a coordinate frame abstract
///   - Operate on a CoordinateFrame object
///
/// \param xcrd   Cartesian X coordinates of the set to move
/// \param ycrd   Cartesian Y coordinates of the set to move
/// \param zcrd   Cartesian Z coordinates of the set to move
/// \param natom  Number of atoms in the set
/// \param cfw    Abstract of the set to move
/// \param cf     The set to move
/// \param xform  The transform to apply
/// \{
template <typename Tcoord>
void applySuperposition(Tcoord* xcrd, Tcoord* ycrd, Tcoord* zcrd, int natom,
                        const SuperpositionTransform &xform);

void applySuperposition(CoordinateFrameWriter *cfw, const SuperpositionTransform &xform);

void applySuperposition(CoordinateFrame *cf, const SuperpositionTransform &xform);
/// \}

/// \brief Superimpose one set of coordinates onto another, moving every atom of the first set.
///        The transform that was applied is returned.  Descriptions of parameters follow from
///        computeSuperposition() and applySuperposition() above.
///
/// Overloaded:
///   - Operate on C-style arrays of coordinates with a trusted atom count
///   - Operate on CoordinateFrame objects
/// \{
template <typename Tcoord, typename Tcalc>
SuperpositionTransform superposeCoordinates(Tcoord* xcrd_mov, Tcoord* ycrd_mov, Tcoord* zcrd_mov,
                                            const Tcoord* xcrd_ref, const Tcoord* ycrd_ref,
                                            const Tcoord* zcrd_ref, const Tcalc* weights,
                                            int natom);

SuperpositionTransform superposeCoordinates(CoordinateFrame *moving,
                                            const CoordinateFrame &reference,
                                            const std::vector<double> &weights = {});
/// \}

/// \brief Compute the weighted positional RMSD between two sets of coordinates as they stand:
///        sqrt(sum(w_i |a_i - b_i|^2) / sum(w_i)).
///
/// Overloaded:
///   - Operate on C-style arrays of coordinates with a trusted atom count
///   - Operate on CoordinateFrame objects
///
/// \param xcrd_a   Cartesian X coordinates of the first set
/// \param ycrd_a   Cartesian Y coordinates of the first set
/// \param zcrd_a   Cartesian Z coordinates of the first set
/// \param xcrd_b   Cartesian X coordinates of the second set
/// \param ycrd_b   Cartesian Y coordinates of the second set
/// \param zcrd_b   Cartesian Z coordinates of the second set
/// \param weights  Per-atom weights (nullptr or an empty vector for uniform weights)
/// \param natom    Number of atoms in each set
/// \param cf_a     The first set of coordinates
/// \param cf_b     The second set of coordinates
/// \{
template <typename Tcoord, typename Tcalc>
Tcalc weightedRmsd(const Tcoord* xcrd_a, const Tcoord* ycrd_a, const Tcoord* zcrd_a,
                   const Tcoord* xcrd_b, const Tcoord* ycrd_b, const Tcoord* zcrd_b,
                   const Tcalc* weights, int natom);

double weightedRmsd(const CoordinateFrame &cf_a, const CoordinateFrame &cf_b,
                    const std::vector<double> &weights = {});
/// \}

/// \brief Compute the weighted positional RMSD between two sets of coordinates after optimal
///        superposition of the first onto the second, without moving either set.  Descriptions
///        of parameters follow from weightedRmsd() above.
///
/// Overloaded:
///   - Operate on C-style arrays of coordinates with a trusted atom count
///   - Operate on CoordinateFrame objects
/// \{
template <typename Tcoord, typename Tcalc>
Tcalc alignedRmsd(const Tcoord* xcrd_a, const Tcoord* ycrd_a, const Tcoord* zcrd_a,
                  const Tcoord* xcrd_b, const Tcoord* ycrd_b, const Tcoord* zcrd_b,
                  const Tcalc* weights, int natom);

double alignedRmsd(const CoordinateFrame &cf_a, const CoordinateFrame &cf_b,
                   const std::vector<double> &weights = {});
/// \}

/// \brief Compute the positional RMSD between two frames by either of the available methods.
///
/// \param cf_a     The first set of coordinates
/// \param cf_b     The second set of coordinates
/// \param weights  Per-atom weights (an empty vector for uniform weights)
/// \param method   Indicate whether to align the first set onto the second before comparing
double rmsd(const CoordinateFrame &cf_a, const CoordinateFrame &cf_b,
            const std::vector<double> &weights, RMSDMethod method);

/// \brief Check that two frames and a set of weights describe the same number of atoms.
///
/// \param natom_a    Number of atoms in the first frame
/// \param natom_b    Number of atoms in the second frame
/// \param n_weights  Number of weights (zero is accepted, implying uniform weights)
/// \param caller     Name of the calling function
void checkSuperpositionInputs(int natom_a, int natom_b, size_t n_weights, const char* caller);

} // namespace structure
} // namespace conformix

#include "superposition.tpp"

#endif
