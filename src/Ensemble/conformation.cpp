#include "copyright.h"
#include "Reporting/error_format.h"
#include "Structure/superposition.h"
#include "conformation.h"
#include "ensemble.h"
#include "weighted_ensemble.h"

namespace conformix {
namespace ensemble {

//-------------------------------------------------------------------------------------------------
Conformation::Conformation(const Ensemble *ensemble_in, const int index_in) :
    ensemble_ptr{ensemble_in}, index{index_in}
{
  validateIndex("Conformation");
}

//-------------------------------------------------------------------------------------------------
int Conformation::getIndex() const {
  return index;
}

//-------------------------------------------------------------------------------------------------
int Conformation::getAtomCount() const {
  validateIndex("getAtomCount");
  return ensemble_ptr->getAtomCount();
}

//-------------------------------------------------------------------------------------------------
const Ensemble* Conformation::getEnsemble() const {
  return ensemble_ptr;
}

//-------------------------------------------------------------------------------------------------
CoordinateFrame Conformation::getCoordinates() const {
  validateIndex("getCoordinates");
  return ensemble_ptr->getCoordinateSet(index);
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Conformation::getWeights() const {
  validateIndex("getWeights");
  return ensemble_ptr->getSetWeights(index);
}

//-------------------------------------------------------------------------------------------------
std::string Conformation::getLabel() const {
  validateIndex("getLabel");
  return ensemble_ptr->getLabels()[index];
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Conformation::getDeviations() const {
  validateIndex("getDeviations");
  std::vector<double> result = ensemble_ptr->getCoordinateSet(index).getInterlacedCoordinates();
  const std::vector<double> ref_xyz = ensemble_ptr->getCoordinates().getInterlacedCoordinates();
  const size_t nval = result.size();
  for (size_t i = 0; i < nval; i++) {
    result[i] -= ref_xyz[i];
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
double Conformation::getRMSD() const {
  validateIndex("getRMSD");
  return structure::weightedRmsd(ensemble_ptr->getCoordinateSet(index),
                                 ensemble_ptr->getCoordinates(),
                                 ensemble_ptr->getSetWeights(index));
}

//-------------------------------------------------------------------------------------------------
void Conformation::validateIndex(const char* caller) const {
  if (ensemble_ptr == nullptr) {
    rtErr("The conformation is not associated with any ensemble.", "Conformation", caller);
  }
  if (index < 0 || index >= ensemble_ptr->getCoordinateSetCount()) {
    rtErr("Coordinate set " + std::to_string(index) + " no longer exists in an ensemble of " +
          std::to_string(ensemble_ptr->getCoordinateSetCount()) + " sets.", "Conformation",
          caller);
  }
}

//-------------------------------------------------------------------------------------------------
WeightedConformation::WeightedConformation(const WeightedEnsemble *ensemble_in,
                                           const int index_in) :
    Conformation(ensemble_in, index_in)
{}

//-------------------------------------------------------------------------------------------------
int WeightedConformation::getPresentAtomCount() const {
  const std::vector<double> w = getWeights();
  int result = 0;
  const size_t nw = w.size();
  for (size_t i = 0; i < nw; i++) {
    result += (w[i] > 0.0);
  }
  return result;
}

} // namespace ensemble
} // namespace conformix
