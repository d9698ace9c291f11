#include <cmath>
#include "copyright.h"
#include "Constants/scaling.h"
#include "Structure/superposition.h"
#include "ensemble.h"

namespace conformix {
namespace ensemble {

using errors::listSeparator;
using structure::applySuperposition;
using structure::computeSuperposition;
using structure::SuperpositionTransform;
using trajectory::interlacedAtomCount;

//-------------------------------------------------------------------------------------------------
CoordinateSetIterator::CoordinateSetIterator(const Ensemble *ensemble_in, const int index_in) :
    ensemble_ptr{ensemble_in}, index{index_in}
{}

//-------------------------------------------------------------------------------------------------
CoordinateFrame CoordinateSetIterator::operator*() const {
  return ensemble_ptr->getCoordinateSet(index);
}

//-------------------------------------------------------------------------------------------------
CoordinateSetIterator& CoordinateSetIterator::operator++() {
  index++;
  return *this;
}

//-------------------------------------------------------------------------------------------------
bool CoordinateSetIterator::operator==(const CoordinateSetIterator &other) const {
  return (ensemble_ptr == other.ensemble_ptr && index == other.index);
}

//-------------------------------------------------------------------------------------------------
bool CoordinateSetIterator::operator!=(const CoordinateSetIterator &other) const {
  return (ensemble_ptr != other.ensemble_ptr || index != other.index);
}

//-------------------------------------------------------------------------------------------------
Ensemble::Ensemble(const std::string &title_in) :
    CoordinateProvider(), title{title_in}, atom_count{0}, set_count{0}, reference{},
    x_coordinates{}, y_coordinates{}, z_coordinates{}, labels{}, weights{},
    per_set_weights{false}, set_weights{}
{}

//-------------------------------------------------------------------------------------------------
Ensemble::Ensemble(const CoordinateProvider &provider) :
    Ensemble(provider, provider.getTitle())
{}

//-------------------------------------------------------------------------------------------------
Ensemble::Ensemble(const CoordinateProvider &provider, const std::string &title_in) :
    Ensemble(title_in)
{
  const int natom = provider.getAtomCount();
  if (natom <= 0) {
    return;
  }
  const CoordinateFrame provider_cf = provider.getCoordinates();
  if (provider_cf.getAtomCount() != natom) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "The provider reports " + std::to_string(natom) + " atoms "
          "but its current coordinates describe " + std::to_string(provider_cf.getAtomCount()) +
          ".", "Ensemble");
  }
  atom_count = natom;
  reference = provider_cf;
  const int nset = provider.getCoordinateSetCount();
  if (nset > 0) {
    const std::vector<double> xyz = provider.getCoordinateSets();
    validateIncomingSets(xyz.size(), natom, 0, "Ensemble");
    appendSets(xyz, nset, std::vector<std::string>());
  }
}

//-------------------------------------------------------------------------------------------------
std::string Ensemble::getTitle() const {
  return title;
}

//-------------------------------------------------------------------------------------------------
int Ensemble::getAtomCount() const {
  return atom_count;
}

//-------------------------------------------------------------------------------------------------
int Ensemble::getCoordinateSetCount() const {
  return set_count;
}

//-------------------------------------------------------------------------------------------------
CoordinateFrame Ensemble::getCoordinates() const {
  return reference;
}

//-------------------------------------------------------------------------------------------------
CoordinateFrame Ensemble::getCoordinateSet(const int index) const {
  validateSetIndex(index, "getCoordinateSet");
  const size_t offset = static_cast<size_t>(index) * static_cast<size_t>(atom_count);
  return CoordinateFrame(atom_count, x_coordinates.data() + offset, y_coordinates.data() + offset,
                         z_coordinates.data() + offset);
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ensemble::getCoordinateSets() const {
  std::vector<double> result(3LLU * x_coordinates.size());
  const size_t npts = x_coordinates.size();
  for (size_t i = 0; i < npts; i++) {
    result[(3LLU * i)       ] = x_coordinates[i];
    result[(3LLU * i) + 1LLU] = y_coordinates[i];
    result[(3LLU * i) + 2LLU] = z_coordinates[i];
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ensemble::getCoordinateSets(const std::vector<int> &indices) const {
  if (set_count == 0) {
    return std::vector<double>();
  }
  const size_t nidx = indices.size();
  for (size_t i = 0; i < nidx; i++) {
    validateSetIndex(indices[i], "getCoordinateSets");
  }
  const size_t natom = atom_count;
  std::vector<double> result(3LLU * natom * nidx);
  size_t pos = 0;
  for (size_t i = 0; i < nidx; i++) {
    const size_t offset = static_cast<size_t>(indices[i]) * natom;
    for (size_t j = 0; j < natom; j++) {
      result[pos] = x_coordinates[offset + j];
      result[pos + 1LLU] = y_coordinates[offset + j];
      result[pos + 2LLU] = z_coordinates[offset + j];
      pos += 3LLU;
    }
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ensemble::getCoordinateSets(const int index) const {
  return getCoordinateSets(std::vector<int>(1, index));
}

//-------------------------------------------------------------------------------------------------
const std::vector<std::string>& Ensemble::getLabels() const {
  return labels;
}

//-------------------------------------------------------------------------------------------------
bool Ensemble::hasWeights() const {
  return (per_set_weights) ? (set_count > 0) : (weights.size() > 0LLU);
}

//-------------------------------------------------------------------------------------------------
bool Ensemble::hasPerSetWeights() const {
  return per_set_weights;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ensemble::getWeights() const {
  return (per_set_weights) ? set_weights : weights;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ensemble::getSetWeights(const int index) const {
  validateSetIndex(index, "getSetWeights");
  const double* w_ptr = getSetWeightPointer(index);
  if (w_ptr == nullptr) {
    return std::vector<double>(atom_count, 1.0);
  }
  return std::vector<double>(w_ptr, w_ptr + atom_count);
}

//-------------------------------------------------------------------------------------------------
Conformation Ensemble::getConformation(const int index) const {
  validateSetIndex(index, "getConformation");
  return Conformation(this, index);
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ensemble::getDeviations() const {
  if (set_count == 0) {
    return std::vector<double>();
  }
  const CoordinateFrameReader rcfr = reference.data();
  std::vector<double> result(3LLU * x_coordinates.size());
  size_t pos = 0;
  for (int i = 0; i < set_count; i++) {
    const size_t offset = static_cast<size_t>(i) * static_cast<size_t>(atom_count);
    for (int j = 0; j < atom_count; j++) {
      result[pos] = x_coordinates[offset + j] - rcfr.xcrd[j];
      result[pos + 1LLU] = y_coordinates[offset + j] - rcfr.ycrd[j];
      result[pos + 2LLU] = z_coordinates[offset + j] - rcfr.zcrd[j];
      pos += 3LLU;
    }
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ensemble::getRMSDs() const {
  std::vector<double> result(set_count);
  const CoordinateFrameReader rcfr = reference.data();
  for (int i = 0; i < set_count; i++) {
    const size_t offset = static_cast<size_t>(i) * static_cast<size_t>(atom_count);
    const double* w_ptr = getSetWeightPointer(i);
    result[i] = structure::weightedRmsd(&x_coordinates[offset], &y_coordinates[offset],
                                        &z_coordinates[offset], rcfr.xcrd, rcfr.ycrd, rcfr.zcrd,
                                        w_ptr, atom_count);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ensemble::getMeanCoordinates() const {
  if (set_count == 0) {
    return std::vector<double>();
  }
  const bool per_set = hasPerSetWeights();
  const CoordinateFrameReader rcfr = reference.data();
  std::vector<double> result(3LLU * static_cast<size_t>(atom_count));
  for (int j = 0; j < atom_count; j++) {
    double sw = 0.0;
    double sx = 0.0;
    double sy = 0.0;
    double sz = 0.0;
    for (int i = 0; i < set_count; i++) {
      const size_t idx = (static_cast<size_t>(i) * static_cast<size_t>(atom_count)) + j;
      const double wij = (per_set) ? getSetWeightPointer(i)[j] : 1.0;
      sw += wij;
      sx += wij * x_coordinates[idx];
      sy += wij * y_coordinates[idx];
      sz += wij * z_coordinates[idx];
    }
    if (sw > constants::degenerate_weight_sum) {
      result[(3 * j)    ] = sx / sw;
      result[(3 * j) + 1] = sy / sw;
      result[(3 * j) + 2] = sz / sw;
    }
    else {
      result[(3 * j)    ] = rcfr.xcrd[j];
      result[(3 * j) + 1] = rcfr.ycrd[j];
      result[(3 * j) + 2] = rcfr.zcrd[j];
    }
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ensemble::getMSFs() const {
  if (set_count == 0) {
    return std::vector<double>();
  }
  const bool per_set = hasPerSetWeights();
  const std::vector<double> mean_xyz = getMeanCoordinates();
  std::vector<double> result(atom_count, 0.0);
  for (int j = 0; j < atom_count; j++) {
    double sw = 0.0;
    double sdev = 0.0;
    for (int i = 0; i < set_count; i++) {
      const size_t idx = (static_cast<size_t>(i) * static_cast<size_t>(atom_count)) + j;
      const double wij = (per_set) ? getSetWeightPointer(i)[j] : 1.0;
      const double dx = x_coordinates[idx] - mean_xyz[(3 * j)    ];
      const double dy = y_coordinates[idx] - mean_xyz[(3 * j) + 1];
      const double dz = z_coordinates[idx] - mean_xyz[(3 * j) + 2];
      sw += wij;
      sdev += wij * ((dx * dx) + (dy * dy) + (dz * dz));
    }
    if (sw > constants::degenerate_weight_sum) {
      result[j] = sdev / sw;
    }
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ensemble::getRMSFs() const {
  std::vector<double> result = getMSFs();
  const size_t nval = result.size();
  for (size_t i = 0; i < nval; i++) {
    result[i] = sqrt(result[i]);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
CoordinateSetIterator Ensemble::begin() const {
  return CoordinateSetIterator(this, 0);
}

//-------------------------------------------------------------------------------------------------
CoordinateSetIterator Ensemble::end() const {
  return CoordinateSetIterator(this, set_count);
}

//-------------------------------------------------------------------------------------------------
void Ensemble::setTitle(const std::string &title_in) {
  title = title_in;
}

//-------------------------------------------------------------------------------------------------
void Ensemble::setCoordinates(const std::vector<double> &xyz) {
  const int natom = interlacedAtomCount(xyz, "setCoordinates");
  if (natom == 0) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "Reference coordinates must describe at least one atom.",
          "Ensemble", "setCoordinates");
  }
  if (atom_count > 0 && natom != atom_count) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "Reference coordinates for " + std::to_string(natom) +
          " atoms cannot be placed in an ensemble of " + std::to_string(atom_count) + " atoms.",
          "Ensemble", "setCoordinates");
  }
  reference = CoordinateFrame(xyz);
  atom_count = natom;
}

//-------------------------------------------------------------------------------------------------
void Ensemble::setCoordinates(const CoordinateFrame &cf) {
  setCoordinates(cf.getInterlacedCoordinates());
}

//-------------------------------------------------------------------------------------------------
void Ensemble::setLabels(const std::vector<std::string> &labels_in) {
  if (labels_in.size() != static_cast<size_t>(set_count)) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "A series of " + std::to_string(labels_in.size()) +
          " labels cannot be applied to " + std::to_string(set_count) + " coordinate sets.",
          "Ensemble", "setLabels");
  }
  labels = labels_in;
}

//-------------------------------------------------------------------------------------------------
void Ensemble::setWeights(const std::vector<double> &weights_in) {
  if (per_set_weights) {
    if (set_count == 0) {
      rtErr("Weights for each coordinate set cannot be assigned to an ensemble with no sets.",
            "Ensemble", "setWeights");
    }
    set_weights = expandWeights(weights_in, atom_count, set_count, "setWeights");
    return;
  }
  if (atom_count == 0) {
    rtErr("Weights cannot be assigned before the number of atoms is known.", "Ensemble",
          "setWeights");
  }
  if (weights_in.size() != static_cast<size_t>(atom_count)) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "A series of " + std::to_string(weights_in.size()) +
          " weights does not fit an ensemble of " + std::to_string(atom_count) + " atoms.",
          "Ensemble", "setWeights");
  }
  validateWeightValues(weights_in, "setWeights");
  weights = weights_in;
}

//-------------------------------------------------------------------------------------------------
void Ensemble::setWeights(const double weight_in) {
  if (per_set_weights) {
    if (set_count == 0) {
      rtErr("Weights for each coordinate set cannot be assigned to an ensemble with no sets.",
            "Ensemble", "setWeights");
    }
    validateWeightValues(std::vector<double>(1, weight_in), "setWeights");
    set_weights.assign(static_cast<size_t>(set_count) * static_cast<size_t>(atom_count),
                       weight_in);
    return;
  }
  if (atom_count == 0) {
    rtErr("Weights cannot be assigned before the number of atoms is known.", "Ensemble",
          "setWeights");
  }
  validateWeightValues(std::vector<double>(1, weight_in), "setWeights");
  weights.assign(atom_count, weight_in);
}

//-------------------------------------------------------------------------------------------------
void Ensemble::clearWeights() {
  if (per_set_weights) {
    set_weights.assign(static_cast<size_t>(set_count) * static_cast<size_t>(atom_count), 1.0);
  }
  else {
    weights.resize(0);
  }
}

//-------------------------------------------------------------------------------------------------
void Ensemble::addCoordinateSet(const std::vector<double> &xyz,
                                const std::vector<std::string> &labels_in) {
  const int nset = validateIncomingSets(xyz.size(), 0, labels_in.size(), "addCoordinateSet");
  appendSets(xyz, nset, labels_in);
}

//-------------------------------------------------------------------------------------------------
void Ensemble::addCoordinateSet(const CoordinateFrame &cf, const std::string &label) {
  const std::vector<double> xyz = cf.getInterlacedCoordinates();
  validateIncomingSets(xyz.size(), cf.getAtomCount(), 1, "addCoordinateSet");
  appendSets(xyz, 1, std::vector<std::string>(1, label));
}

//-------------------------------------------------------------------------------------------------
void Ensemble::addCoordinateSet(const std::vector<CoordinateFrame> &frames,
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
            "series describes " + std::to_string(natom) + ".", "Ensemble", "addCoordinateSet");
    }
    const std::vector<double> frm_xyz = frames[i].getInterlacedCoordinates();
    xyz.insert(xyz.end(), frm_xyz.begin(), frm_xyz.end());
  }
  const int nset = validateIncomingSets(xyz.size(), natom, labels_in.size(), "addCoordinateSet");
  appendSets(xyz, nset, labels_in);
}

//-------------------------------------------------------------------------------------------------
void Ensemble::deleteCoordinateSets(const int index) {
  deleteCoordinateSets(std::vector<int>(1, index));
}

//-------------------------------------------------------------------------------------------------
void Ensemble::deleteCoordinateSets(const std::vector<int> &indices) {
  const size_t nidx = indices.size();
  for (size_t i = 0; i < nidx; i++) {
    validateSetIndex(indices[i], "deleteCoordinateSets");
  }
  std::vector<bool> keep(set_count, true);
  for (size_t i = 0; i < nidx; i++) {
    keep[indices[i]] = false;
  }
  std::vector<int> kept_sets;
  kept_sets.reserve(set_count);
  for (int i = 0; i < set_count; i++) {
    if (keep[i]) {
      kept_sets.push_back(i);
    }
  }
  gatherSets(kept_sets);
}

//-------------------------------------------------------------------------------------------------
void Ensemble::deleteCoordinateSets(const int low_index, const int high_index) {
  validateSetRange(low_index, high_index, "deleteCoordinateSets");
  std::vector<int> kept_sets;
  kept_sets.reserve(set_count - (high_index - low_index));
  for (int i = 0; i < low_index; i++) {
    kept_sets.push_back(i);
  }
  for (int i = high_index; i < set_count; i++) {
    kept_sets.push_back(i);
  }
  gatherSets(kept_sets);
}

//-------------------------------------------------------------------------------------------------
Ensemble Ensemble::select(const std::vector<int> &indices) const {
  const size_t nidx = indices.size();
  for (size_t i = 0; i < nidx; i++) {
    validateSetIndex(indices[i], "select");
  }
  Ensemble result(*this);
  result.gatherSets(indices);
  return result;
}

//-------------------------------------------------------------------------------------------------
Ensemble Ensemble::selectRange(const int low_index, const int high_index) const {
  validateSetRange(low_index, high_index, "selectRange");
  std::vector<int> indices;
  indices.reserve(high_index - low_index);
  for (int i = low_index; i < high_index; i++) {
    indices.push_back(i);
  }
  return select(indices);
}

//-------------------------------------------------------------------------------------------------
Ensemble Ensemble::selectAll() const {
  return Ensemble(*this);
}

//-------------------------------------------------------------------------------------------------
Ensemble Ensemble::concatenate(const Ensemble &other) const {
  validateAtomMatch(other, "concatenate");
  Ensemble result(*this);
  result.title = title + " + " + other.title;
  if (per_set_weights == false && weights.size() == 0LLU) {
    if (other.per_set_weights) {
      result.per_set_weights = true;
      result.set_weights.assign(static_cast<size_t>(set_count) *
                                static_cast<size_t>(atom_count), 1.0);
    }
    else {
      result.weights = other.weights;
    }
  }
  result.appendSetsFrom(other);
  return result;
}

//-------------------------------------------------------------------------------------------------
void Ensemble::superpose(const ExceptionResponse policy) {
  if (set_count == 0) {
    return;
  }
  const std::vector<bool> fittable = findFittableSets(policy, "superpose");
  const CoordinateFrameReader rcfr = reference.data();
  for (int i = 0; i < set_count; i++) {
    if (fittable[i] == false) {
      continue;
    }
    const size_t offset = static_cast<size_t>(i) * static_cast<size_t>(atom_count);
    double* xptr = x_coordinates.data() + offset;
    double* yptr = y_coordinates.data() + offset;
    double* zptr = z_coordinates.data() + offset;
    const double* w_ptr = getSetWeightPointer(i);
    const SuperpositionTransform xform = computeSuperposition(xptr, yptr, zptr, rcfr.xcrd,
                                                              rcfr.ycrd, rcfr.zcrd, w_ptr,
                                                              atom_count);
    applySuperposition(xptr, yptr, zptr, atom_count, xform);
  }
}

//-------------------------------------------------------------------------------------------------
int Ensemble::iterativeSuperpose(const int maxcyc, const double rmsd_tol,
                                 const bool update_reference, const ExceptionResponse policy) {
  if (maxcyc < 0) {
    rtErr("The maximum number of refinement cycles cannot be negative (" +
          std::to_string(maxcyc) + ").", "Ensemble", "iterativeSuperpose");
  }
  if (rmsd_tol < 0.0) {
    rtErr("The convergence tolerance cannot be negative (" + std::to_string(rmsd_tol) + ").",
          "Ensemble", "iterativeSuperpose");
  }
  if (set_count == 0) {
    return 0;
  }

  // The first pass reports degenerate sets according to the policy.  Later passes skip them
  // quietly, as they have already been reported.
  const CoordinateFrame original_reference = reference;
  superpose(policy);
  int ncyc = 0;
  while (ncyc < maxcyc) {
    const CoordinateFrame mean_cf(getMeanCoordinates());
    const double rmsd_change = structure::weightedRmsd(mean_cf, reference);
    reference = mean_cf;
    superpose(ExceptionResponse::SILENT);
    ncyc++;
    if (rmsd_change < rmsd_tol) {
      break;
    }
  }
  if (update_reference == false) {
    reference = original_reference;
  }
  return ncyc;
}

//-------------------------------------------------------------------------------------------------
const double* Ensemble::getSetWeightPointer(const int index) const {
  if (per_set_weights) {
    return set_weights.data() + (static_cast<size_t>(index) * static_cast<size_t>(atom_count));
  }
  return (weights.size() > 0LLU) ? weights.data() : nullptr;
}

//-------------------------------------------------------------------------------------------------
void Ensemble::gatherSets(const std::vector<int> &indices) {
  const size_t nidx = indices.size();
  const size_t natom = atom_count;
  std::vector<double> tmp_x(nidx * natom), tmp_y(nidx * natom), tmp_z(nidx * natom);
  std::vector<std::string> tmp_labels(nidx);
  for (size_t i = 0; i < nidx; i++) {
    const size_t src_offset = static_cast<size_t>(indices[i]) * natom;
    const size_t dst_offset = i * natom;
    for (size_t j = 0; j < natom; j++) {
      tmp_x[dst_offset + j] = x_coordinates[src_offset + j];
      tmp_y[dst_offset + j] = y_coordinates[src_offset + j];
      tmp_z[dst_offset + j] = z_coordinates[src_offset + j];
    }
    tmp_labels[i] = labels[indices[i]];
  }
  if (per_set_weights) {
    std::vector<double> tmp_weights(nidx * natom);
    for (size_t i = 0; i < nidx; i++) {
      const size_t src_offset = static_cast<size_t>(indices[i]) * natom;
      const size_t dst_offset = i * natom;
      for (size_t j = 0; j < natom; j++) {
        tmp_weights[dst_offset + j] = set_weights[src_offset + j];
      }
    }
    set_weights = std::move(tmp_weights);
  }
  x_coordinates = std::move(tmp_x);
  y_coordinates = std::move(tmp_y);
  z_coordinates = std::move(tmp_z);
  labels = std::move(tmp_labels);
  set_count = nidx;
}

//-------------------------------------------------------------------------------------------------
int Ensemble::validateIncomingSets(const size_t n_values, const int natom_in,
                                   const size_t n_labels, const char* caller) const {
  if (n_values == 0LLU) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "No coordinates were provided.", "Ensemble", caller);
  }
  if (n_values % 3LLU != 0LLU) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "Interlaced coordinates must hold three values per atom (" +
          std::to_string(n_values) + " values found).", "Ensemble", caller);
  }
  int natom;
  if (atom_count > 0) {
    if (natom_in > 0 && natom_in != atom_count) {
      rtErr(ErrorKind::SHAPE_MISMATCH, "Coordinate sets of " + std::to_string(natom_in) +
            " atoms cannot be added to an ensemble of " + std::to_string(atom_count) + " atoms.",
            "Ensemble", caller);
    }
    natom = atom_count;
  }
  else {
    natom = (natom_in > 0) ? natom_in : n_values / 3LLU;
  }
  const size_t set_size = 3LLU * static_cast<size_t>(natom);
  if (n_values % set_size != 0LLU) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "A series of " + std::to_string(n_values) + " coordinate "
          "values does not form whole coordinate sets of " + std::to_string(natom) + " atoms.",
          "Ensemble", caller);
  }
  const size_t nset = n_values / set_size;
  if (n_labels > 0LLU && n_labels != nset) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "A series of " + std::to_string(n_labels) + " labels cannot "
          "be applied to " + std::to_string(nset) + " new coordinate sets.", "Ensemble", caller);
  }
  return nset;
}

//-------------------------------------------------------------------------------------------------
void Ensemble::appendSets(const std::vector<double> &xyz, const int nset,
                          const std::vector<std::string> &labels_in,
                          const std::vector<double> &weights_in) {
  const size_t npts = xyz.size() / 3LLU;
  establishAtoms(npts / static_cast<size_t>(nset), xyz);
  x_coordinates.reserve(x_coordinates.size() + npts);
  y_coordinates.reserve(y_coordinates.size() + npts);
  z_coordinates.reserve(z_coordinates.size() + npts);
  for (size_t i = 0; i < npts; i++) {
    x_coordinates.push_back(xyz[(3LLU * i)       ]);
    y_coordinates.push_back(xyz[(3LLU * i) + 1LLU]);
    z_coordinates.push_back(xyz[(3LLU * i) + 2LLU]);
  }
  if (labels_in.size() == 0LLU) {
    labels.resize(labels.size() + nset);
  }
  else {
    labels.insert(labels.end(), labels_in.begin(), labels_in.end());
  }
  if (per_set_weights) {
    if (weights_in.size() == 0LLU) {
      set_weights.resize(set_weights.size() +
                         (static_cast<size_t>(nset) * static_cast<size_t>(atom_count)), 1.0);
    }
    else {
      set_weights.insert(set_weights.end(), weights_in.begin(), weights_in.end());
    }
  }
  set_count += nset;
}

//-------------------------------------------------------------------------------------------------
void Ensemble::appendSetsFrom(const Ensemble &other) {
  if (other.set_count == 0) {
    return;
  }
  x_coordinates.insert(x_coordinates.end(), other.x_coordinates.begin(),
                       other.x_coordinates.end());
  y_coordinates.insert(y_coordinates.end(), other.y_coordinates.begin(),
                       other.y_coordinates.end());
  z_coordinates.insert(z_coordinates.end(), other.z_coordinates.begin(),
                       other.z_coordinates.end());
  labels.insert(labels.end(), other.labels.begin(), other.labels.end());
  if (per_set_weights) {
    for (int i = 0; i < other.set_count; i++) {
      const std::vector<double> row = other.getSetWeights(i);
      set_weights.insert(set_weights.end(), row.begin(), row.end());
    }
  }
  set_count += other.set_count;
}

//-------------------------------------------------------------------------------------------------
void Ensemble::validateSetIndex(const int index, const char* caller) const {
  if (index < 0 || index >= set_count) {
    rtErr("Coordinate set index " + std::to_string(index) + " is invalid for an ensemble of " +
          std::to_string(set_count) + " sets.", "Ensemble", caller);
  }
}

//-------------------------------------------------------------------------------------------------
void Ensemble::validateSetRange(const int low_index, const int high_index,
                                const char* caller) const {
  if (low_index < 0 || high_index < low_index || high_index > set_count) {
    rtErr("The range [" + std::to_string(low_index) + ", " + std::to_string(high_index) +
          ") is invalid for an ensemble of " + std::to_string(set_count) + " sets.", "Ensemble",
          caller);
  }
}

//-------------------------------------------------------------------------------------------------
void Ensemble::validateAtomMatch(const Ensemble &other, const char* caller) const {
  if (other.atom_count != atom_count) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "Ensembles of " + std::to_string(atom_count) + " and " +
          std::to_string(other.atom_count) + " atoms cannot be combined.", "Ensemble", caller);
  }
}

//-------------------------------------------------------------------------------------------------
void Ensemble::validateWeightValues(const std::vector<double> &w, const char* caller) const {
  const size_t nw = w.size();
  for (size_t i = 0; i < nw; i++) {
    if (w[i] < 0.0) {
      rtErr("Weights must be non-negative.  A weight of " + std::to_string(w[i]) + " was found "
            "at position " + std::to_string(i) + ".", "Ensemble", caller);
    }
  }
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ensemble::expandWeights(const std::vector<double> &weights_in,
                                            const int natom, const int nset,
                                            const char* caller) const {
  const size_t row_length = natom;
  const size_t block_length = row_length * static_cast<size_t>(nset);
  if (weights_in.size() != row_length && weights_in.size() != block_length) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "A series of " + std::to_string(weights_in.size()) +
          " weights does not fit " + std::to_string(nset) + " coordinate sets of " +
          std::to_string(natom) + " atoms.", "Ensemble", caller);
  }
  validateWeightValues(weights_in, caller);
  if (weights_in.size() == block_length) {
    return weights_in;
  }
  std::vector<double> result;
  result.reserve(block_length);
  for (int i = 0; i < nset; i++) {
    result.insert(result.end(), weights_in.begin(), weights_in.end());
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<bool> Ensemble::findFittableSets(const ExceptionResponse policy,
                                             const char* caller) const {
  std::vector<bool> result(set_count, true);
  std::vector<int> degenerate_sets;
  for (int i = 0; i < set_count; i++) {
    const double* w_ptr = getSetWeightPointer(i);
    double sw = 0.0;
    if (w_ptr == nullptr) {
      sw = atom_count;
    }
    else {
      for (int j = 0; j < atom_count; j++) {
        sw += w_ptr[j];
      }
    }
    if (sw <= constants::degenerate_weight_sum) {
      result[i] = false;
      degenerate_sets.push_back(i);
    }
  }
  const int ndegen = degenerate_sets.size();
  if (ndegen == 0) {
    return result;
  }
  std::string set_list;
  for (int i = 0; i < ndegen; i++) {
    set_list += std::to_string(degenerate_sets[i]);
    if (i < ndegen - 1) {
      set_list += listSeparator(i, ndegen);
    }
  }
  switch (policy) {
  case ExceptionResponse::DIE:
    rtErr(ErrorKind::DEGENERATE_WEIGHTS, "Coordinate sets " + set_list + " have zero total "
          "weight and cannot be fitted.", "Ensemble", caller);
  case ExceptionResponse::WARN:
    rtWarn("Coordinate sets " + set_list + " have zero total weight and will be left as they "
           "are.", "Ensemble", caller);
    break;
  case ExceptionResponse::SILENT:
    break;
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
void Ensemble::establishAtoms(const int natom_in, const std::vector<double> &xyz) {
  if (atom_count == 0) {
    atom_count = natom_in;
  }
  if (reference.getAtomCount() == 0) {
    reference = CoordinateFrame(std::vector<double>(xyz.begin(), xyz.begin() + (3 * natom_in)));
  }
}

} // namespace ensemble
} // namespace conformix
