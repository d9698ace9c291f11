// -*-c++-*-
#ifndef CONFORMIX_ENSEMBLE_H
#define CONFORMIX_ENSEMBLE_H

#include <string>
#include <vector>
#include "copyright.h"
#include "Constants/behavior.h"
#include "Reporting/error_format.h"
#include "Trajectory/coordinate_provider.h"
#include "Trajectory/coordinateframe.h"
#include "conformation.h"

namespace conformix {
namespace ensemble {

using constants::ExceptionResponse;
using errors::ErrorKind;
using trajectory::CoordinateFrame;
using trajectory::CoordinateFrameReader;
using trajectory::CoordinateProvider;

/// \brief A forward iterator over the coordinate sets of an ensemble.  Each step yields a copy
///        of one set.  Iteration may be restarted by calling begin() on the ensemble again.
class CoordinateSetIterator {
public:

  /// \brief The constructor takes the ensemble and a starting position.
  ///
  /// \param ensemble_in  The ensemble to iterate over
  /// \param index_in     The starting index
  CoordinateSetIterator(const Ensemble *ensemble_in, int index_in);

  /// \brief Produce the coordinate set at the current position.
  CoordinateFrame operator*() const;

  /// \brief Advance to the next coordinate set.
  CoordinateSetIterator& operator++();

  /// \brief Compare iterator positions.
  ///
  /// \param other  The iterator to compare against
  /// \{
  bool operator==(const CoordinateSetIterator &other) const;
  bool operator!=(const CoordinateSetIterator &other) const;
  /// \}

private:
  const Ensemble *ensemble_ptr;  ///< The ensemble being traversed
  int index;                     ///< Current position
};

/// \brief An ensemble of alternative coordinate sets for one system with a fixed number of atoms.
///        The ensemble holds a set of reference coordinates, the target of superposition, which
///        is independent of the coordinate sets themselves.  Optional per-atom weights are shared
///        by all coordinate sets, unless the ensemble carries a row of weights for each set (as
///        a WeightedEnsemble does).  Rows of weights live alongside the coordinates in this
///        class, so that copies, selections, and concatenations made through the base class
///        keep them.
class Ensemble : public CoordinateProvider {
public:

  /// \brief The constructor can create an empty ensemble with only a title, or copy the atom
  ///        count, current coordinates, and all coordinate sets of a provider.  The provider is
  ///        read once and later changes to it are not reflected in the ensemble.
  ///
  /// \param title_in  Title of the ensemble
  /// \param provider  The source of coordinates
  /// \{
  explicit Ensemble(const std::string &title_in = std::string(""));
  explicit Ensemble(const CoordinateProvider &provider);
  Ensemble(const CoordinateProvider &provider, const std::string &title_in);
  /// \}

  /// \brief The default copy and move constructors and assignment operators are valid, as the
  ///        object contains only Standard Template Library components.
  ///
  /// \param original  The object to copy or move
  /// \param other     Another object placed on the right hand side of the assignment statement
  /// \{
  Ensemble(const Ensemble &original) = default;
  Ensemble(Ensemble &&original) = default;
  Ensemble& operator=(const Ensemble &other) = default;
  Ensemble& operator=(Ensemble &&other) = default;
  /// \}

  /// \brief The destructor is virtual, as weighted ensembles derive from this class.
  virtual ~Ensemble() = default;

  /// \brief Get the title of the ensemble.
  std::string getTitle() const override;

  /// \brief Get the number of atoms in each coordinate set.  This is zero until the first
  ///        coordinates arrive.
  int getAtomCount() const override;

  /// \brief Get the number of coordinate sets in the ensemble.
  int getCoordinateSetCount() const override;

  /// \brief Get the reference coordinates.  An ensemble with no atoms returns an empty frame.
  CoordinateFrame getCoordinates() const override;

  /// \brief Get one coordinate set as a new frame.
  ///
  /// \param index  Index of the coordinate set of interest
  CoordinateFrame getCoordinateSet(int index) const override;

  /// \brief Get a deep copy of coordinate sets, interlaced and stacked as (k, natom, 3).  An
  ///        ensemble with no coordinate sets returns an empty vector whatever is requested.
  ///
  /// Overloaded:
  ///   - Get all coordinate sets
  ///   - Get a list of coordinate sets, in the order given
  ///   - Get a single coordinate set
  ///
  /// \param indices  Indices of the coordinate sets of interest
  /// \param index    Index of the coordinate set of interest
  /// \{
  std::vector<double> getCoordinateSets() const override;
  std::vector<double> getCoordinateSets(const std::vector<int> &indices) const;
  std::vector<double> getCoordinateSets(int index) const;
  /// \}

  /// \brief Get the labels of all coordinate sets.
  const std::vector<std::string>& getLabels() const;

  /// \brief Indicate whether weights have been provided for the ensemble.  An ensemble with a
  ///        row of weights for each set has weights whenever it has coordinate sets.
  bool hasWeights() const;

  /// \brief Indicate whether each coordinate set carries its own row of weights.
  bool hasPerSetWeights() const;

  /// \brief Get the weights.  With shared weights this returns natom values, or an empty vector
  ///        if there are none.  With a row of weights for each set it returns all rows, stacked
  ///        as (nset, natom, 1), or an empty vector if there are no sets.
  std::vector<double> getWeights() const;

  /// \brief Get the weights applied to each atom of one coordinate set.  Ones are returned for
  ///        each atom if the ensemble has no weights.
  ///
  /// \param index  Index of the coordinate set of interest
  std::vector<double> getSetWeights(int index) const;

  /// \brief Get a view of one coordinate set.
  ///
  /// \param index  Index of the coordinate set of interest
  Conformation getConformation(int index) const;

  /// \brief Get the displacements of every coordinate set from the reference coordinates,
  ///        interlaced and stacked as (nset, natom, 3).
  std::vector<double> getDeviations() const;

  /// \brief Get the weighted RMSD of each coordinate set to the reference coordinates, in index
  ///        order.  Sets are not moved.  An ensemble with no sets returns an empty vector.
  std::vector<double> getRMSDs() const;

  /// \brief Get the mean structure of the coordinate sets, interlaced as (natom, 3).  In a
  ///        weighted ensemble each atom's mean is weighted by its per-set weights, and an atom
  ///        with no weight in any set takes its reference position.
  std::vector<double> getMeanCoordinates() const;

  /// \brief Get the mean square fluctuation of each atom about the mean structure.
  std::vector<double> getMSFs() const;

  /// \brief Get the root mean square fluctuation of each atom about the mean structure.
  std::vector<double> getRMSFs() const;

  /// \brief Begin and end iterators over the coordinate sets.
  /// \{
  CoordinateSetIterator begin() const;
  CoordinateSetIterator end() const;
  /// \}

  /// \brief Set the title of the ensemble.
  ///
  /// \param title_in  The new title
  void setTitle(const std::string &title_in);

  /// \brief Set the reference coordinates.  If the ensemble has no atoms yet, this establishes
  ///        the atom count.  Otherwise the atom count must match.
  ///
  /// Overloaded:
  ///   - Accept interlaced coordinates (natom, 3)
  ///   - Accept a coordinate frame
  ///
  /// \param xyz  Interlaced Cartesian coordinates
  /// \param cf   The new reference coordinates
  /// \{
  void setCoordinates(const std::vector<double> &xyz);
  void setCoordinates(const CoordinateFrame &cf);
  /// \}

  /// \brief Set the labels of all coordinate sets.  There must be one label per set.
  ///
  /// \param labels_in  The new labels
  void setLabels(const std::vector<std::string> &labels_in);

  /// \brief Set the weights.  Weights must be non-negative.  With shared weights, natom values
  ///        are expected.  With a row of weights for each set, there must be at least one set and
  ///        the input may be (nset, natom, 1) values or one row of natom values to apply to every
  ///        set.
  ///
  /// Overloaded:
  ///   - Provide a vector of weights
  ///   - Provide one weight to apply to every atom
  ///
  /// \param weights_in  The new weights
  /// \param weight_in   A uniform weight for all atoms
  /// \{
  void setWeights(const std::vector<double> &weights_in);
  void setWeights(double weight_in);
  /// \}

  /// \brief Restore uniform weighting.  Shared weights are removed.  Rows of weights for each set
  ///        are reset to one.
  void clearWeights();

  /// \brief Add one or more coordinate sets to the end of the ensemble.  If the ensemble has no
  ///        atoms yet, interlaced coordinates are taken as a single set and establish the atom
  ///        count.  Thereafter, interlaced coordinates may hold any whole number of sets.  An
  ///        atom count mismatch leaves the ensemble unchanged.
  ///
  /// Overloaded:
  ///   - Accept interlaced coordinates (natom, 3) or (k, natom, 3)
  ///   - Accept a single coordinate frame
  ///   - Accept a series of coordinate frames
  ///
  /// \param xyz     Interlaced Cartesian coordinates of the new sets
  /// \param cf      The new coordinate set
  /// \param frames  The new coordinate sets
  /// \param labels  Labels for the new sets (if empty, each set receives a blank label)
  /// \param label   Label for the new set
  /// \{
  void addCoordinateSet(const std::vector<double> &xyz,
                        const std::vector<std::string> &labels = {});
  void addCoordinateSet(const CoordinateFrame &cf, const std::string &label = std::string(""));
  void addCoordinateSet(const std::vector<CoordinateFrame> &frames,
                        const std::vector<std::string> &labels = {});
  /// \}

  /// \brief Delete coordinate sets.  The remaining sets are renumbered contiguously and the
  ///        reference coordinates are not affected.  All indices are checked before anything is
  ///        removed.
  ///
  /// Overloaded:
  ///   - Delete one set
  ///   - Delete a list of sets (repeated indices are deleted once)
  ///   - Delete the sets in the half-open range [low_index, high_index)
  ///
  /// \param index       Index of the set to delete
  /// \param indices     Indices of the sets to delete
  /// \param low_index   Index of the first set to delete
  /// \param high_index  Upper limit of the sets to delete
  /// \{
  void deleteCoordinateSets(int index);
  void deleteCoordinateSets(const std::vector<int> &indices);
  void deleteCoordinateSets(int low_index, int high_index);
  /// \}

  /// \brief Produce a new ensemble with selected coordinate sets, in the order given.  The new
  ///        ensemble carries the same title, reference coordinates, and weights.  Rows of weights
  ///        for each set follow the sets they belong to.
  ///
  /// \param indices     Indices of the sets to take
  /// \param low_index   Index of the first set to take
  /// \param high_index  Upper limit of the sets to take
  /// \{
  Ensemble select(const std::vector<int> &indices) const;
  Ensemble selectRange(int low_index, int high_index) const;
  Ensemble selectAll() const;
  /// \}

  /// \brief Produce a new ensemble with the sets of this ensemble followed by the sets of
  ///        another.  The reference coordinates come from this ensemble.  Weights are kept if
  ///        either ensemble has them, with this ensemble's weights taking precedence:
  ///        - Rows of weights for each set in this ensemble are stacked with rows for the other
  ///          ensemble's sets (its own rows, its shared weights, or ones).
  ///        - Shared weights in this ensemble apply to the result.
  ///        - If this ensemble has no weights, the other ensemble's shared weights apply to the
  ///          result, or its rows are stacked beneath rows of ones for this ensemble's sets.
  ///
  /// \param other  The ensemble to append
  Ensemble concatenate(const Ensemble &other) const;

  /// \brief Superimpose every coordinate set onto the reference coordinates, by weighted
  ///        least-squares fitting.  The transformation moves all atoms of each set.  An ensemble
  ///        with no sets is left as it is.
  ///
  /// \param policy  Action to take if any set has zero total weight: DIE raises an error before
  ///                any set is moved, WARN or SILENT leave that set where it is
  void superpose(ExceptionResponse policy = ExceptionResponse::DIE);

  /// \brief Superimpose the coordinate sets onto the reference coordinates, then repeatedly onto
  ///        the mean structure of the sets, until the mean structure settles.  Returns the number
  ///        of refinement cycles performed.
  ///
  /// \param maxcyc            The maximum number of refinement cycles
  /// \param rmsd_tol          Convergence criterion: the RMSD between successive mean structures
  /// \param update_reference  Replace the reference coordinates with the final mean structure
  /// \param policy            Action to take if any set has zero total weight
  int iterativeSuperpose(int maxcyc = 10, double rmsd_tol = 1.0e-4,
                         bool update_reference = false,
                         ExceptionResponse policy = ExceptionResponse::DIE);

protected:
  std::string title;                      ///< Title of the ensemble
  int atom_count;                         ///< Number of atoms in every set (zero until known)
  int set_count;                          ///< Number of coordinate sets
  CoordinateFrame reference;              ///< Reference coordinates, the target of superposition
  std::vector<double> x_coordinates;      ///< Cartesian X coordinates of all sets, set by set
  std::vector<double> y_coordinates;      ///< Cartesian Y coordinates of all sets, set by set
  std::vector<double> z_coordinates;      ///< Cartesian Z coordinates of all sets, set by set
  std::vector<std::string> labels;        ///< Labels for each coordinate set
  std::vector<double> weights;            ///< Per-atom weights shared by all sets (may be empty)
  bool per_set_weights;                   ///< Flag to indicate that each set has its own weights
  std::vector<double> set_weights;        ///< Weights of every atom in every set, set by set
                                          ///<   (used only if per_set_weights is set)

  /// \brief Get a pointer to the weights for one coordinate set, or nullptr for uniform weights.
  ///
  /// \param index  Index of the coordinate set of interest
  const double* getSetWeightPointer(int index) const;

  /// \brief Rebuild the coordinate sets, their labels, and any rows of weights from a list of
  ///        existing sets.  Indices must have been validated.
  ///
  /// \param indices  Indices of the sets to keep, in their new order
  void gatherSets(const std::vector<int> &indices);

  /// \brief Check that interlaced coordinates hold a whole number of sets for this ensemble,
  ///        with an acceptable number of labels, and return the number of sets.
  ///
  /// \param n_values  Number of coordinate values (three per atom per set)
  /// \param natom_in  Number of atoms in each incoming set, if known (otherwise zero)
  /// \param n_labels  Number of labels provided (zero is accepted)
  /// \param caller    Name of the calling function
  int validateIncomingSets(size_t n_values, int natom_in, size_t n_labels,
                           const char* caller) const;

  /// \brief Append validated, interlaced coordinate sets.  If each set carries its own weights,
  ///        the new sets take the weights provided or, if none are given, weights of one.
  ///
  /// \param xyz         Interlaced coordinates (k, natom, 3)
  /// \param nset        The number of sets in xyz
  /// \param labels_in   Labels for the new sets (if empty, each set receives a blank label)
  /// \param weights_in  Validated (k, natom, 1) weights for the new sets
  void appendSets(const std::vector<double> &xyz, int nset,
                  const std::vector<std::string> &labels_in,
                  const std::vector<double> &weights_in = {});

  /// \brief Append the coordinate sets and labels of another ensemble with the same number of
  ///        atoms.  If each set of this ensemble carries its own weights, the other ensemble's
  ///        sets bring their weights as seen through getSetWeights().
  ///
  /// \param other  The ensemble whose sets shall be appended
  void appendSetsFrom(const Ensemble &other);

  /// \brief Confirm that an index refers to an existing coordinate set.
  ///
  /// \param index   The index to check
  /// \param caller  Name of the calling function
  void validateSetIndex(int index, const char* caller) const;

  /// \brief Confirm that a half-open range of sets is valid.
  ///
  /// \param low_index   Index of the first set in the range
  /// \param high_index  Upper limit of the range
  /// \param caller      Name of the calling function
  void validateSetRange(int low_index, int high_index, const char* caller) const;

  /// \brief Confirm that another ensemble has the same number of atoms as this one.
  ///
  /// \param other   The other ensemble
  /// \param caller  Name of the calling function
  void validateAtomMatch(const Ensemble &other, const char* caller) const;

  /// \brief Check a series of weights for negative values.
  ///
  /// \param w       The weights to check
  /// \param caller  Name of the calling function
  void validateWeightValues(const std::vector<double> &w, const char* caller) const;

  /// \brief Expand a row or block of incoming weights to cover a number of sets, after checking
  ///        its size and values.
  ///
  /// \param weights_in  The incoming weights (natom, or nset x natom)
  /// \param natom       The number of atoms in each set
  /// \param nset        The number of sets to cover
  /// \param caller      Name of the calling function
  std::vector<double> expandWeights(const std::vector<double> &weights_in, int natom, int nset,
                                    const char* caller) const;

  /// \brief Check every coordinate set for a non-zero total weight, returning a mask of the sets
  ///        that can be fitted.  Degenerate sets are handled according to the policy.
  ///
  /// \param policy  Action to take if any set has zero total weight
  /// \param caller  Name of the calling function
  std::vector<bool> findFittableSets(ExceptionResponse policy, const char* caller) const;

  /// \brief Set the atom count, and the reference coordinates if they are not yet known, from
  ///        the first coordinates to arrive.
  ///
  /// \param natom_in  The number of atoms
  /// \param xyz       Interlaced coordinates, of which the first natom_in atoms are used
  void establishAtoms(int natom_in, const std::vector<double> &xyz);
};

} // namespace ensemble
} // namespace conformix

#endif
