// -*-c++-*-
#ifndef CONFORMIX_PARSING_ENUMERATORS_H
#define CONFORMIX_PARSING_ENUMERATORS_H

#include <string>
#include "copyright.h"

namespace conformix {
namespace parse {

/// \brief An enumerator for the types of numbers that might be encountered in ASCII input.
enum class NumberFormat {
  SCIENTIFIC,     ///< Exponential, base ten notation
  STANDARD_REAL,  ///< General accounting notation
  INTEGER         ///< Print signed integers
};

/// \brief Specify the way in which to print a standard real number or integer (with or without
///        leading zeros)
enum class NumberPrintStyle {
  STANDARD,      ///< Print without leading zeros
  LEADING_ZEROS  ///< Print with leading zeros
};

/// \brief Produce a human-readable string corresponding to each enumeration.  Various overloads
///        of this function in this and other libraries and namespaces handle different
///        enumerators.
///
/// \param input  The enumeration of interest
/// \{
std::string getEnumerationName(NumberFormat input);
std::string getEnumerationName(NumberPrintStyle input);
/// \}

} // namespace parse
} // namespace conformix

#endif
