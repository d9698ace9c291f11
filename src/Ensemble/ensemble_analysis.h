// -*-c++-*-
#ifndef CONFORMIX_ENSEMBLE_ANALYSIS_H
#define CONFORMIX_ENSEMBLE_ANALYSIS_H

#include <vector>
#include "copyright.h"
#include "Namelists/nml_superpose.h"
#include "ensemble.h"
#include "weighted_ensemble.h"

namespace conformix {
namespace ensemble {

using namelist::SuperposeControls;

/// \brief Compute the sum of weights over all coordinate sets of a weighted ensemble, for each
///        atom.  Only a WeightedEnsemble, or a selection or concatenation that inherited its rows
///        of weights, carries weights for each coordinate set: submitting a plain Ensemble is an
///        error of kind TYPE_MISMATCH.  A weighted ensemble with no
///        coordinate sets produces an empty result.
///
/// Overloaded:
///   - Accept the ensemble by const reference
///   - Accept the ensemble by const pointer
///
/// \param ens  The ensemble of interest
/// \{
std::vector<double> calcSumOfWeights(const Ensemble &ens);
std::vector<double> calcSumOfWeights(const Ensemble *ens);
/// \}

/// \brief Compute the occupancy of each atom across the coordinate sets of a weighted ensemble.
///        This is the sum of weights, optionally normalized by its largest value.
///
/// \param ens     The ensemble of interest
/// \param normed  Flag to have the occupancies divided by their maximum
std::vector<double> calcOccupancies(const Ensemble &ens, bool normed = false);

/// \brief Produce a new weighted ensemble restricted to atoms whose normalized occupancy reaches
///        a threshold.  The reference coordinates, coordinate sets, weights, and labels are all
///        carried over for the surviving atoms.  As with calcSumOfWeights, an ensemble without
///        weights for each coordinate set is an error of kind TYPE_MISMATCH.
///
/// \param ens        The ensemble to trim
/// \param occupancy  The threshold normalized occupancy, in the range [0, 1]
WeightedEnsemble trimWeightedEnsemble(const Ensemble &ens, double occupancy = 0.9);

/// \brief Superimpose the coordinate sets of an ensemble according to a set of user controls.
///        Returns the number of cycles of fitting that were performed.
///
/// \param ens       The ensemble to superimpose (modified and returned)
/// \param spcon     Superposition controls, i.e. from a &superpose namelist
int superposeEnsemble(Ensemble *ens, const SuperposeControls &spcon);

} // namespace ensemble
} // namespace conformix

#endif
