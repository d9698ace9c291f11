#include "copyright.h"
#include "superposition.h"

namespace conformix {
namespace structure {

//-------------------------------------------------------------------------------------------------
SuperpositionTransform::SuperpositionTransform() :
    rotation{ 1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0 }, moving_centroid{ 0.0, 0.0, 0.0 },
    reference_centroid{ 0.0, 0.0, 0.0 }
{}

//-------------------------------------------------------------------------------------------------
SuperpositionTransform::SuperpositionTransform(const std::vector<double> &rotation_in,
                                               const double3 moving_centroid_in,
                                               const double3 reference_centroid_in) :
    rotation{ rotation_in }, moving_centroid{ moving_centroid_in },
    reference_centroid{ reference_centroid_in }
{
  if (rotation.size() != 9LLU) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "A rotation matrix must have 9 elements, not " +
          std::to_string(rotation.size()) + ".", "SuperpositionTransform");
  }
}

//-------------------------------------------------------------------------------------------------
void checkSuperpositionInputs(const int natom_a, const int natom_b, const size_t n_weights,
                              const char* caller) {
  if (natom_a != natom_b) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "Coordinate sets of " + std::to_string(natom_a) + " and " +
          std::to_string(natom_b) + " atoms cannot be compared.", caller);
  }
  if (n_weights > 0LLU && n_weights != static_cast<size_t>(natom_a)) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "A set of " + std::to_string(n_weights) + " weights does "
          "not match coordinate sets of " + std::to_string(natom_a) + " atoms.", caller);
  }
}

//-------------------------------------------------------------------------------------------------
SuperpositionTransform computeSuperposition(const CoordinateFrameReader &moving,
                                            const CoordinateFrameReader &reference,
                                            const std::vector<double> &weights) {
  checkSuperpositionInputs(moving.natom, reference.natom, weights.size(), "computeSuperposition");
  const double* w_ptr = (weights.size() > 0LLU) ? weights.data() : nullptr;
  return computeSuperposition(moving.xcrd, moving.ycrd, moving.zcrd, reference.xcrd,
                              reference.ycrd, reference.zcrd, w_ptr, moving.natom);
}

//-------------------------------------------------------------------------------------------------
SuperpositionTransform computeSuperposition(const CoordinateFrame &moving,
                                            const CoordinateFrame &reference,
                                            const std::vector<double> &weights) {
  return computeSuperposition(moving.data(), reference.data(), weights);
}

//-------------------------------------------------------------------------------------------------
void applySuperposition(CoordinateFrameWriter *cfw, const SuperpositionTransform &xform) {
  applySuperposition(cfw->xcrd, cfw->ycrd, cfw->zcrd, cfw->natom, xform);
}

//-------------------------------------------------------------------------------------------------
void applySuperposition(CoordinateFrame *cf, const SuperpositionTransform &xform) {
  CoordinateFrameWriter cfw = cf->data();
  applySuperposition(&cfw, xform);
}

//-------------------------------------------------------------------------------------------------
SuperpositionTransform superposeCoordinates(CoordinateFrame *moving,
                                            const CoordinateFrame &reference,
                                            const std::vector<double> &weights) {
  const SuperpositionTransform result = computeSuperposition(*moving, reference, weights);
  applySuperposition(moving, result);
  return result;
}

//-------------------------------------------------------------------------------------------------
double weightedRmsd(const CoordinateFrame &cf_a, const CoordinateFrame &cf_b,
                    const std::vector<double> &weights) {
  const CoordinateFrameReader cfr_a = cf_a.data();
  const CoordinateFrameReader cfr_b = cf_b.data();
  checkSuperpositionInputs(cfr_a.natom, cfr_b.natom, weights.size(), "weightedRmsd");
  const double* w_ptr = (weights.size() > 0LLU) ? weights.data() : nullptr;
  return weightedRmsd(cfr_a.xcrd, cfr_a.ycrd, cfr_a.zcrd, cfr_b.xcrd, cfr_b.ycrd, cfr_b.zcrd,
                      w_ptr, cfr_a.natom);
}

//-------------------------------------------------------------------------------------------------
double alignedRmsd(const CoordinateFrame &cf_a, const CoordinateFrame &cf_b,
                   const std::vector<double> &weights) {
  const CoordinateFrameReader cfr_a = cf_a.data();
  const CoordinateFrameReader cfr_b = cf_b.data();
  checkSuperpositionInputs(cfr_a.natom, cfr_b.natom, weights.size(), "alignedRmsd");
  const double* w_ptr = (weights.size() > 0LLU) ? weights.data() : nullptr;
  return alignedRmsd(cfr_a.xcrd, cfr_a.ycrd, cfr_a.zcrd, cfr_b.xcrd, cfr_b.ycrd, cfr_b.zcrd,
                     w_ptr, cfr_a.natom);
}

//-------------------------------------------------------------------------------------------------
double rmsd(const CoordinateFrame &cf_a, const CoordinateFrame &cf_b,
            const std::vector<double> &weights, const RMSDMethod method) {
  switch (method) {
  case RMSDMethod::ALIGN:
    return alignedRmsd(cf_a, cf_b, weights);
  case RMSDMethod::NO_ALIGN:
    return weightedRmsd(cf_a, cf_b, weights);
  }
  __builtin_unreachable();
}

} // namespace structure
} // namespace conformix
