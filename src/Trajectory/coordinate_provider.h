// -*-c++-*-
#ifndef CONFORMIX_COORDINATE_PROVIDER_H
#define CONFORMIX_COORDINATE_PROVIDER_H

#include <string>
#include <vector>
#include "copyright.h"
#include "coordinateframe.h"

namespace conformix {
namespace trajectory {

/// \brief The abstract source of coordinates for one system: a fixed number of atoms, a current
///        (reference) set of coordinates, and any number of alternative coordinate sets.  Objects
///        built from a provider copy what they need at the time of construction.
class CoordinateProvider {
public:

  /// \brief The default destructor suffices for derived classes.
  virtual ~CoordinateProvider() = default;

  /// \brief Get the number of atoms in each set of coordinates.
  virtual int getAtomCount() const = 0;

  /// \brief Get the current, active coordinates of the system.
  virtual CoordinateFrame getCoordinates() const = 0;

  /// \brief Get the number of coordinate sets held by the provider.
  virtual int getCoordinateSetCount() const = 0;

  /// \brief Get one coordinate set.
  ///
  /// \param index  Index of the coordinate set of interest
  virtual CoordinateFrame getCoordinateSet(int index) const = 0;

  /// \brief Get all coordinate sets, interlaced and stacked as (k, natom, 3).  The default
  ///        implementation assembles the result from getCoordinateSet().
  virtual std::vector<double> getCoordinateSets() const;

  /// \brief Get a title for the system.  Providers that carry no title return an empty string.
  virtual std::string getTitle() const;
};

} // namespace trajectory
} // namespace conformix

#endif
