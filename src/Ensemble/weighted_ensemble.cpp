#include "copyright.h"
#include "weighted_ensemble.h"

namespace conformix {
namespace ensemble {

//-------------------------------------------------------------------------------------------------
WeightedEnsemble::WeightedEnsemble(const std::string &title_in) :
    Ensemble(title_in)
{
  per_set_weights = true;
}

//-------------------------------------------------------------------------------------------------
WeightedEnsemble::WeightedEnsemble(const CoordinateProvider &provider) :
    WeightedEnsemble(provider, provider.getTitle())
{}

//-------------------------------------------------------------------------------------------------
WeightedEnsemble::WeightedEnsemble(const CoordinateProvider &provider,
                                   const std::string &title_in) :
    Ensemble(provider, title_in)
{
  per_set_weights = true;
  set_weights.assign(static_cast<size_t>(set_count) * static_cast<size_t>(atom_count), 1.0);
}

//-------------------------------------------------------------------------------------------------
WeightedEnsemble::WeightedEnsemble(const Ensemble &original) :
    Ensemble(original)
{
  if (per_set_weights) {
    return;
  }
  set_weights.reserve(static_cast<size_t>(set_count) * static_cast<size_t>(atom_count));
  for (int i = 0; i < set_count; i++) {
    const std::vector<double> row = original.getSetWeights(i);
    set_weights.insert(set_weights.end(), row.begin(), row.end());
  }
  weights.resize(0);
  per_set_weights = true;
}

//-------------------------------------------------------------------------------------------------
WeightedConformation WeightedEnsemble::getConformation(const int index) const {
  validateSetIndex(index, "getConformation");
  return WeightedConformation(this, index);
}

//-------------------------------------------------------------------------------------------------
void WeightedEnsemble::addCoordinateSet(const std::vector<double> &xyz,
                                        const std::vector<double> &set_weights_in,
                                        const std::vector<std::string> &labels_in) {
  const int nset = validateIncomingSets(xyz.size(), 0, labels_in.size(), "addCoordinateSet");
  const int natom = xyz.size() / (3LLU * static_cast<size_t>(nset));
  appendSets(xyz, nset, labels_in, expandWeights(set_weights_in, natom, nset,
                                                 "addCoordinateSet"));
}

//-------------------------------------------------------------------------------------------------
void WeightedEnsemble::addCoordinateSet(const CoordinateFrame &cf,
                                        const std::vector<double> &set_weights_in,
                                        const std::string &label) {
  const std::vector<double> xyz = cf.getInterlacedCoordinates();
  validateIncomingSets(xyz.size(), cf.getAtomCount(), 1, "addCoordinateSet");
  appendSets(xyz, 1, std::vector<std::string>(1, label),
             expandWeights(set_weights_in, cf.getAtomCount(), 1, "addCoordinateSet"));
}

//-------------------------------------------------------------------------------------------------
void WeightedEnsemble::addCoordinateSet(const std::vector<CoordinateFrame> &frames,
                                        const std::vector<double> &set_weights_in,
                                        const std::vector<std::string> &labels_in) {
  if (frames.size() == 0LLU) {
    return;
  }
  const int natom = frames[0].getAtomCount();
  const size_t nfrm = frames.size();
  std::vector<double> xyz;
  xyz.reserve(3LLU * static_cast<size_t>(natom) * nfrm);
  for (size_t i = 0; i < nfrm; i++) {
    if (frames[i].getAtomCount() != natom) {
      rtErr(ErrorKind::SHAPE_MISMATCH, "Frame " + std::to_string(i) + " describes " +
            std::to_string(frames[i].getAtomCount()) + " atoms, but the first frame in the "
            "series describes " + std::to_string(natom) + ".", "WeightedEnsemble",
            "addCoordinateSet");
    }
    const std::vector<double> frm_xyz = frames[i].getInterlacedCoordinates();
    xyz.insert(xyz.end(), frm_xyz.begin(), frm_xyz.end());
  }
  const int nset = validateIncomingSets(xyz.size(), natom, labels_in.size(), "addCoordinateSet");
  appendSets(xyz, nset, labels_in, expandWeights(set_weights_in, natom, nset,
                                                 "addCoordinateSet"));
}

//-------------------------------------------------------------------------------------------------
WeightedEnsemble WeightedEnsemble::select(const std::vector<int> &indices) const {
  return WeightedEnsemble(Ensemble::select(indices));
}

//-------------------------------------------------------------------------------------------------
WeightedEnsemble WeightedEnsemble::selectRange(const int low_index, const int high_index) const {
  return WeightedEnsemble(Ensemble::selectRange(low_index, high_index));
}

//-------------------------------------------------------------------------------------------------
WeightedEnsemble WeightedEnsemble::selectAll() const {
  return WeightedEnsemble(*this);
}

//-------------------------------------------------------------------------------------------------
WeightedEnsemble WeightedEnsemble::concatenate(const Ensemble &other) const {
  return WeightedEnsemble(Ensemble::concatenate(other));
}

} // namespace ensemble
} // namespace conformix
