// -*-c++-*-
#ifndef CONFORMIX_NAMELIST_ENUMERATORS_H
#define CONFORMIX_NAMELIST_ENUMERATORS_H

#include <string>
#include "copyright.h"

namespace conformix {
namespace namelist {

/// \brief Enumerator to describe all types of namelist variables
enum class NamelistType {
  INTEGER, REAL, STRING
};

/// \brief Enumerate the possible ways that input could have come in (or failed to be obtained)
enum class InputStatus {
  USER_SPECIFIED, DEFAULT, MISSING
};

/// \brief Return a string corresponding to the namelist data type enumerations.  Various overloads
///        of this function are also found in other libraries.
///
/// \param input  The enumeration of interest
/// \{
std::string getEnumerationName(NamelistType input);
std::string getEnumerationName(InputStatus input);
/// \}

} // namespace namelist
} // namespace conformix

#endif
