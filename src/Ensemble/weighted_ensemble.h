// -*-c++-*-
#ifndef CONFORMIX_WEIGHTED_ENSEMBLE_H
#define CONFORMIX_WEIGHTED_ENSEMBLE_H

#include <string>
#include <vector>
#include "copyright.h"
#include "conformation.h"
#include "ensemble.h"

namespace conformix {
namespace ensemble {

/// \brief An ensemble in which every coordinate set carries its own per-atom weights.  This is
///        the natural container for structures solved or modeled independently, in which some
///        atoms may be missing from some sets: a weight of zero marks an atom as absent (its
///        coordinates in that set need not be meaningful), a weight of one marks it present, and
///        other values scale the atom's contribution to fits and RMSD calculations.  There is
///        always one row of weights for every coordinate set.
class WeightedEnsemble : public Ensemble {
public:

  /// \brief The constructor can create an empty ensemble with only a title, copy the sets of a
  ///        coordinate provider with weights of one, or convert an ensemble.  An ensemble that
  ///        already carries weights for each set keeps them.  Otherwise, its shared weights (or
  ///        ones) become the weights of every set.
  ///
  /// \param title_in  Title of the ensemble
  /// \param provider  The source of coordinates
  /// \param original  The plain ensemble to convert
  /// \{
  explicit WeightedEnsemble(const std::string &title_in = std::string(""));
  explicit WeightedEnsemble(const CoordinateProvider &provider);
  WeightedEnsemble(const CoordinateProvider &provider, const std::string &title_in);
  explicit WeightedEnsemble(const Ensemble &original);
  /// \}

  /// \brief The default copy and move constructors and assignment operators are valid.
  ///
  /// \param original  The object to copy or move
  /// \param other     Another object placed on the right hand side of the assignment statement
  /// \{
  WeightedEnsemble(const WeightedEnsemble &original) = default;
  WeightedEnsemble(WeightedEnsemble &&original) = default;
  WeightedEnsemble& operator=(const WeightedEnsemble &other) = default;
  WeightedEnsemble& operator=(WeightedEnsemble &&other) = default;
  /// \}

  /// \brief Get a view of one coordinate set.
  ///
  /// \param index  Index of the coordinate set of interest
  WeightedConformation getConformation(int index) const;

  /// \brief Add one or more coordinate sets with their weights.  Sets added without weights,
  ///        through the overloads inherited from Ensemble, receive weights of one.
  ///
  /// Overloaded:
  ///   - Accept interlaced coordinates (natom, 3) or (k, natom, 3)
  ///   - Accept a single coordinate frame
  ///   - Accept a series of coordinate frames
  ///
  /// \param xyz             Interlaced Cartesian coordinates of the new sets
  /// \param cf              The new coordinate set
  /// \param frames          The new coordinate sets
  /// \param set_weights_in  Weights for the new sets: one row of natom weights applied to every
  ///                        new set, or (k, natom, 1) weights
  /// \param labels          Labels for the new sets (if empty, each set receives a blank label)
  /// \param label           Label for the new set
  /// \{
  using Ensemble::addCoordinateSet;

  void addCoordinateSet(const std::vector<double> &xyz, const std::vector<double> &set_weights_in,
                        const std::vector<std::string> &labels = {});

  void addCoordinateSet(const CoordinateFrame &cf, const std::vector<double> &set_weights_in,
                        const std::string &label = std::string(""));

  void addCoordinateSet(const std::vector<CoordinateFrame> &frames,
                        const std::vector<double> &set_weights_in,
                        const std::vector<std::string> &labels = {});
  /// \}

  /// \brief Produce a new weighted ensemble with selected coordinate sets and their weights.
  ///        Descriptions of parameters follow from the eponymous member functions of Ensemble.
  /// \{
  WeightedEnsemble select(const std::vector<int> &indices) const;
  WeightedEnsemble selectRange(int low_index, int high_index) const;
  WeightedEnsemble selectAll() const;
  /// \}

  /// \brief Produce a new weighted ensemble with the sets of this ensemble followed by the sets
  ///        of another.  The other ensemble's sets bring their own weights if they have them, its
  ///        shared weights if it is a plain ensemble with weights, or ones.
  ///
  /// \param other  The ensemble to append
  WeightedEnsemble concatenate(const Ensemble &other) const;
};

} // namespace ensemble
} // namespace conformix

#endif
