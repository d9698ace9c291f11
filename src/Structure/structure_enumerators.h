// -*-c++-*-
#ifndef CONFORMIX_STRUCTURE_ENUMERATORS_H
#define CONFORMIX_STRUCTURE_ENUMERATORS_H

#include <string>
#include "copyright.h"

namespace conformix {
namespace structure {

/// \brief List methods for computing (positional) Root Mean Squared Deviation (RMSD) between
///        two sets of coordinates.  Either method applies the same per-atom weights.
enum class RMSDMethod {
  ALIGN,     ///< Find the optimal rigid-body superposition of the first set onto the second,
             ///<   then compute the RMSD without moving either set
  NO_ALIGN   ///< Compute the RMSD of the coordinates as they stand
};

/// \brief Produce a human-readable string corresponding to each enumeration.
///
/// \param input  The enumeration of interest
std::string getEnumerationName(RMSDMethod input);

} // namespace structure
} // namespace conformix

#endif
