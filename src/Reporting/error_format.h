// -*-c++-*-
#ifndef CONFORMIX_ERROR_FORMAT_H
#define CONFORMIX_ERROR_FORMAT_H

#include <stdexcept>
#include <string>
#include "copyright.h"

namespace conformix {
namespace errors {

/// \brief Enumerate the kinds of errors and tabular information that might be printed to the
///        terminal or a file at runtime.
enum class RTMessageKind {
  ERROR,    ///< Method used for runtime errors, warnings, and alerts
  TABULAR   ///< Method used for printing tabular data
};

/// \brief Classify the errors raised by the library, so that a caller can respond to a bad
///        shape differently than to a degenerate fit.
enum class ErrorKind {
  GENERAL,             ///< Index out of range, bad configuration, or anything not listed below
  SHAPE_MISMATCH,      ///< An array's atom count or layout does not match the receiving object
  DIMENSION_MISMATCH,  ///< Two ensembles with different atom counts cannot be combined
  DEGENERATE_WEIGHTS,  ///< The weights for a fit or RMSD sum to zero
  TYPE_MISMATCH        ///< An operation was applied to an object of the wrong dynamic type
};

/// \brief The exception thrown by rtErr.  It is a standard runtime_error, carrying the formatted
///        message, with the kind of error attached for programmatic responses.
class ConformixError : public std::runtime_error {
public:

  /// \brief The constructor takes the formatted message and the kind of error.
  ///
  /// \param message  The formatted message, as produced by terminalFormat()
  /// \param kind_in  The classification of the error
  ConformixError(const std::string &message, ErrorKind kind_in = ErrorKind::GENERAL);

  /// \brief Get the kind of error that was raised.
  ErrorKind getKind() const;

private:
  ErrorKind kind;  ///< Classification of the error
};

/// \brief Parse output for the terminal screen based on a perceived side and desired indentation.
///
/// \param message          The message to print
/// \param class_caller     The class (or free function) calling this report
/// \param method_caller    A specific class method calling this report
/// \param implicit_indent  Indentation implied by some message printed by another function (i.e.
///                         runtime_error())
/// \param first_indent     First line indentation (after implicit indentation)
/// \param subsq_indent     The degree of indentation for all lines after the first
/// \param width_in         The width to print (defaults to terminal width if <= 0)
/// \param style            The kind of message being formatted
std::string terminalFormat(const std::string &message, const char* class_caller = nullptr,
                           const char* method_caller = nullptr, int implicit_indent = 0,
                           int first_indent = 0, int subsq_indent = 0, int width_in = 0,
                           RTMessageKind style = RTMessageKind::ERROR);

/// \brief The name of this function (abbreviated "runtime error") is deliberately short to permit
///        ease of writing the strings that constitute its arguments within the character limit
///        of each LOC.  This will throw a ConformixError (a std::runtime_error) with a formatted
///        error message designed for the terminal window.
///
/// Overloaded:
///   - Raise a GENERAL error
///   - Raise an error of a specific kind
///
/// \param kind           The classification of the error
/// \param message        The message to print
/// \param class_caller   The class (or free function) calling this error report
/// \param method_caller  A specific class method calling this error report
/// \{
void rtErr(const std::string &message, const char* class_caller = nullptr,
           const char* method_caller = nullptr);

void rtErr(ErrorKind kind, const std::string &message, const char* class_caller = nullptr,
           const char* method_caller = nullptr);
/// \}

/// \brief Runtime warnings print text to stdout (by printf) but throw no exception.  The
///        program will continue to run.
///
/// \param message        The message to print
/// \param class_caller   The class (or free function) calling this error report
/// \param method_caller  A specific class method calling this error report
void rtWarn(const std::string &message, const char* class_caller = nullptr,
            const char* method_caller = nullptr);

/// \brief Extend a string as if it were a verbal list of items, with the Oxford comma convention.
///
/// \param current_item  The index number of the current item in the list
/// \param item_count    The total number of items that the list is expected to contain
std::string listSeparator(int current_item, int item_count);

/// \brief Produce a human-readable name for an error classification.
///
/// \param kind  The kind of error
std::string getEnumerationName(ErrorKind kind);

} // namespace errors
} // namespace conformix

namespace conformix {
  using errors::rtErr;
  using errors::rtWarn;
} // namespace conformix

#endif
