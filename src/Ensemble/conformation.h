// -*-c++-*-
#ifndef CONFORMIX_CONFORMATION_H
#define CONFORMIX_CONFORMATION_H

#include <string>
#include <vector>
#include "copyright.h"
#include "Trajectory/coordinateframe.h"

namespace conformix {
namespace ensemble {

using trajectory::CoordinateFrame;

class Ensemble;
class WeightedEnsemble;

/// \brief A read-only view of one coordinate set within an Ensemble.  The view holds nothing but
///        a pointer to its owner and the index of the set, and it re-reads the owner with every
///        call.  Adding, deleting, or reordering sets in the owner after the view is created
///        changes what the view points to.  An index that has fallen out of range is reported as
///        an error when the view is next read.
class Conformation {
public:

  /// \brief The constructor takes the owning ensemble and the index of the set.
  ///
  /// \param ensemble_in  The owning ensemble
  /// \param index_in     Index of the coordinate set within the owner
  Conformation(const Ensemble *ensemble_in, int index_in);

  /// \brief Get the index of the coordinate set within the owner.
  int getIndex() const;

  /// \brief Get the number of atoms in the coordinate set.
  int getAtomCount() const;

  /// \brief Get a pointer to the owning ensemble.
  const Ensemble* getEnsemble() const;

  /// \brief Get the coordinates of the set.
  CoordinateFrame getCoordinates() const;

  /// \brief Get the weights applied to each atom of the set.  For a plain ensemble these are the
  ///        weights shared by all sets, or ones if no weights have been given.
  std::vector<double> getWeights() const;

  /// \brief Get the label of the coordinate set.
  std::string getLabel() const;

  /// \brief Get the displacement of each atom of the set from the owner's reference
  ///        coordinates, interlaced as (natom, 3).
  std::vector<double> getDeviations() const;

  /// \brief Get the weighted RMSD of the set with respect to the owner's reference coordinates,
  ///        without superposition.
  double getRMSD() const;

protected:
  const Ensemble *ensemble_ptr;  ///< The owning ensemble
  int index;                     ///< Index of the coordinate set in the owner

  /// \brief Confirm that the owner still holds a coordinate set at this view's index.
  ///
  /// \param caller  Name of the calling function
  void validateIndex(const char* caller) const;
};

/// \brief A view of one coordinate set within a WeightedEnsemble.  The weights it returns are
///        the set's own row of per-atom weights.
class WeightedConformation : public Conformation {
public:

  /// \brief The constructor takes the owning weighted ensemble and the index of the set.
  ///
  /// \param ensemble_in  The owning ensemble
  /// \param index_in     Index of the coordinate set within the owner
  WeightedConformation(const WeightedEnsemble *ensemble_in, int index_in);

  /// \brief Get the number of atoms with non-zero weight in this set.
  int getPresentAtomCount() const;
};

} // namespace ensemble
} // namespace conformix

#endif
