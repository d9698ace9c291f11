// -*-c++-*-
#ifndef CONFORMIX_BEHAVIOR_H
#define CONFORMIX_BEHAVIOR_H

#include <string>
#include "copyright.h"

namespace conformix {
namespace constants {

/// \brief Enumerate the ways in which the code can respond to an exception under a variety of
///        circumstances: die, warn (and continue), or stay silent and continue
enum class ExceptionResponse {
  DIE, WARN, SILENT
};

/// \brief Express choices for the case-sensitivity of various inputs
enum class CaseSensitivity {
  YES,      ///< Case matters
  NO,       ///< Evaluate without case sensitivity--convert everything to uppercase before parsing
  AUTOMATIC ///< Do not impose one style or another--defer to local, default behavior for
            ///<   individual inputs
};

/// \brief Enumerate the Cartesian dimensions
enum class CartesianDimension {
  X = 0, Y, Z
};

/// \brief Convert a string object, possibly supplied by the user, into an ExceptionResponse
///        enumeration to indicate the program's intended behavior.
///
/// \param policy  Human-readable indication of the exception response behavior
ExceptionResponse translateExceptionResponse(const std::string &policy);

/// \brief Translate the exception response behavior into a human-readable string.
///
/// \param policy  The named exception response behavior
std::string getEnumerationName(ExceptionResponse policy);

/// \brief Translate the name of a Cartesian axis.
///
/// \param axis  The axis of interest
std::string getEnumerationName(CartesianDimension axis);

} // namespace constants
} // namespace conformix

#endif
