#include "copyright.h"
#include "Math/summation.h"
#include "Math/vector_ops.h"
#include "Reporting/error_format.h"
#include "ensemble_analysis.h"

namespace conformix {
namespace ensemble {

using errors::ErrorKind;
using namelist::SuperposeTarget;
using stmath::maxValue;
using stmath::sumRows;

//-------------------------------------------------------------------------------------------------
std::vector<double> calcSumOfWeights(const Ensemble &ens) {
  if (ens.hasPerSetWeights() == false) {
    rtErr(ErrorKind::TYPE_MISMATCH, "Ensemble \"" + ens.getTitle() + "\" does not carry "
          "weights for each coordinate set.  A weighted ensemble is required.",
          "calcSumOfWeights");
  }
  const int nset = ens.getCoordinateSetCount();
  if (nset == 0) {
    return std::vector<double>();
  }
  return sumRows<double>(ens.getWeights(), ens.getAtomCount(), nset);
}

//-------------------------------------------------------------------------------------------------
std::vector<double> calcSumOfWeights(const Ensemble *ens) {
  return calcSumOfWeights(*ens);
}

//-------------------------------------------------------------------------------------------------
std::vector<double> calcOccupancies(const Ensemble &ens, const bool normed) {
  std::vector<double> result = calcSumOfWeights(ens);
  if (normed && result.size() > 0LLU) {
    const double max_occ = maxValue(result);
    if (max_occ > 0.0) {
      const size_t natom = result.size();
      for (size_t i = 0; i < natom; i++) {
        result[i] /= max_occ;
      }
    }
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
WeightedEnsemble trimWeightedEnsemble(const Ensemble &ens, const double occupancy) {
  if (ens.hasPerSetWeights() == false) {
    rtErr(ErrorKind::TYPE_MISMATCH, "Ensemble \"" + ens.getTitle() + "\" does not carry "
          "weights for each coordinate set and cannot be trimmed by occupancy.",
          "trimWeightedEnsemble");
  }
  if (occupancy < 0.0 || occupancy > 1.0) {
    rtErr("A normalized occupancy threshold of " + std::to_string(occupancy) + " is invalid.  "
          "The threshold must lie in the range [0, 1].", "trimWeightedEnsemble");
  }
  const int nset = ens.getCoordinateSetCount();
  if (nset == 0) {
    return WeightedEnsemble(ens);
  }
  const std::vector<double> occ = calcOccupancies(ens, true);
  const int natom = ens.getAtomCount();
  std::vector<int> kept_atoms;
  for (int i = 0; i < natom; i++) {
    if (occ[i] >= occupancy) {
      kept_atoms.push_back(i);
    }
  }
  const size_t nkept = kept_atoms.size();
  if (nkept == 0LLU) {
    rtErr("No atoms of ensemble \"" + ens.getTitle() + "\" reach a normalized occupancy of " +
          std::to_string(occupancy) + ".", "trimWeightedEnsemble");
  }

  // Restrict the reference coordinates, coordinate sets, and weights to the surviving atoms
  const std::vector<double> ref_xyz = ens.getCoordinates().getInterlacedCoordinates();
  const std::vector<double> all_xyz = ens.getCoordinateSets();
  const std::vector<double> all_weights = ens.getWeights();
  std::vector<double> trim_ref(3LLU * nkept);
  std::vector<double> trim_xyz(3LLU * nkept * static_cast<size_t>(nset));
  std::vector<double> trim_weights(nkept * static_cast<size_t>(nset));
  for (size_t i = 0; i < nkept; i++) {
    const size_t atom_idx = kept_atoms[i];
    for (size_t k = 0; k < 3LLU; k++) {
      trim_ref[(3LLU * i) + k] = ref_xyz[(3LLU * atom_idx) + k];
    }
  }
  for (int i = 0; i < nset; i++) {
    const size_t src_offset = static_cast<size_t>(i) * static_cast<size_t>(natom);
    const size_t dst_offset = static_cast<size_t>(i) * nkept;
    for (size_t j = 0; j < nkept; j++) {
      const size_t atom_idx = src_offset + static_cast<size_t>(kept_atoms[j]);
      for (size_t k = 0; k < 3LLU; k++) {
        trim_xyz[(3LLU * (dst_offset + j)) + k] = all_xyz[(3LLU * atom_idx) + k];
      }
      trim_weights[dst_offset + j] = all_weights[atom_idx];
    }
  }
  WeightedEnsemble result(ens.getTitle());
  result.setCoordinates(trim_ref);
  result.addCoordinateSet(trim_xyz, trim_weights, ens.getLabels());
  return result;
}

//-------------------------------------------------------------------------------------------------
int superposeEnsemble(Ensemble *ens, const SuperposeControls &spcon) {
  switch (spcon.getTarget()) {
  case SuperposeTarget::REFERENCE:
    ens->superpose(spcon.getDegenerateWeightResponse());
    return 1;
  case SuperposeTarget::MEAN:
    return ens->iterativeSuperpose(spcon.getMaximumCycles(), spcon.getRmsdTolerance(),
                                   spcon.getReferenceUpdate(),
                                   spcon.getDegenerateWeightResponse());
  }
  __builtin_unreachable();
}

} // namespace ensemble
} // namespace conformix
