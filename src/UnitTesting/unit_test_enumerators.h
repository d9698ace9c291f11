// -*-c++-*-
#ifndef CONFORMIX_UNIT_TEST_ENUMERATORS_H
#define CONFORMIX_UNIT_TEST_ENUMERATORS_H

#include <string>
#include "copyright.h"

namespace conformix {
namespace testing {

/// \brief Enumerate the types of comparisons to make between two numbers
enum class ComparisonType {
  ABSOLUTE,  ///< Maximum tolerated absolute deviation from some target value for a scalar, or
             ///<   absolute deviation of the largest outlier for a vector of numbers
  RELATIVE   ///< Maximum tolerated relative deviation from some target value for a scalar, or
             ///<   relative deviation of the largest outlier for a vector of numbers
};

/// \brief Enumerate the possible results of the function check()
enum class CheckResult {
  SUCCESS, ///< Test passes
  SKIPPED, ///< Test was skipped
  IGNORED, ///< Test failure was ignored
  FAILURE  ///< Test fails
};

/// \brief Enumerate priorities by which a test shall run, which may modulate the results
enum class TestPriority {
  CRITICAL,     ///< The test is assumed to be feasible and must be run, and will return SUCCESS or
                ///<   FAILURE when it does run
  NON_CRITICAL, ///< The test is not essential and will return SUCCESS if it passes but IGNORED
                ///<   rather than FAILURE if it fails
  ABORT         ///< The test should be aborted and will return SKIPPED when run
};

/// \brief Enumerate the relational and comparison operators
enum class RelationalOperator {
  EQUAL, EQ, NOT_EQUAL, NE,
  GREATER_THAN, GT, LESS_THAN, LT,
  GREATER_THAN_OR_EQUAL, GE, LESS_THAN_OR_EQUAL, LE
};

/// \brief Enumerate different levels of verbosity
enum class TestVerbosity {
  FULL,         ///< Print all available messages for the user
  COMPACT,      ///< Print a subset of information for the user
  FAILURE_ONLY  ///< Only alert the user of failures
};

/// \brief Get a string corresponding to a particular enumeration.  Various overloads of this
///        function in this and other libraries and namespaces serve different enumerators.
///
/// \param input  The enumeration to translate
/// \{
std::string getEnumerationName(ComparisonType input);
std::string getEnumerationName(CheckResult input);
std::string getEnumerationName(TestPriority input);
std::string getEnumerationName(RelationalOperator input);
std::string getEnumerationName(TestVerbosity input);
/// \}

} // namespace testing
} // namespace conformix

#endif
