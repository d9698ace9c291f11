// -*-c++-*-
#ifndef CONFORMIX_NAMELIST_ELEMENT_H
#define CONFORMIX_NAMELIST_ELEMENT_H

#include <string>
#include "copyright.h"
#include "Constants/behavior.h"
#include "namelist_enumerators.h"

namespace conformix {
namespace namelist {

using constants::ExceptionResponse;

/// \brief One keyword found in a namelist, ready to store the namelist variable moniker, the
///        type, and the value read from the input text.
class NamelistElement {
public:

  /// \brief The constructor takes the keyword, its type, and an optional default value.  A blank
  ///        default leaves the keyword MISSING until user input arrives.
  ///
  /// \param keyword_in  The name of the namelist variable
  /// \param kind_in     The kind of the namelist element
  /// \param default_in  Default value of the keyword, in text form
  /// \param help_in     User documentation for the keyword
  NamelistElement(const std::string &keyword_in, NamelistType kind_in,
                  const std::string &default_in = std::string(""),
                  const std::string &help_in = std::string("No description provided"));

  /// \brief With no const members and only Standard Template Library components, the default copy
  ///        and move constructors, as well as the copy and move assignment operators, are valid.
  ///
  /// \param original  The pre-existing object to copy or move
  /// \param other     A pre-existing object to fulfill the right hand side of an assignment
  ///                  statement
  /// \{
  NamelistElement(const NamelistElement &original) = default;
  NamelistElement(NamelistElement &&original) = default;
  NamelistElement& operator=(const NamelistElement &other) = default;
  NamelistElement& operator=(NamelistElement &&other) = default;
  /// \}

  /// \brief Get the keyword for a namelist element, i.e. maxcyc in &superpose
  const std::string& getLabel() const;

  /// \brief Get the kind associated with a namelist element, i.e. maxcyc is an INTEGER.
  NamelistType getKind() const;

  /// \brief Get the user documentation for the keyword.
  const std::string& getHelp() const;

  /// \brief Report whether the value came from a default, from user input, or from neither.
  InputStatus getEstablishment() const;

  /// \brief Get the value of the keyword.  The keyword must be of the matching type.
  /// \{
  int getIntValue() const;
  double getRealValue() const;
  const std::string& getStringValue() const;
  /// \}

  /// \brief Set the way that this namelist element will respond if it encounters bad input.  The
  ///        policy is handed down from the NamelistEmulator that holds the element.
  ///
  /// \param policy_in  The policy to set
  void setPolicy(ExceptionResponse policy_in);

  /// \brief Set the user documentation for the keyword.
  ///
  /// \param help_in  The new documentation
  void setHelp(const std::string &help_in);

  /// \brief Set the value of the keyword from user input.  A second value given for the same
  ///        keyword replaces the first, after a complaint according to the policy.
  ///
  /// \param value  The value to set
  /// \{
  void setIntValue(int value);
  void setRealValue(double value);
  void setStringValue(const std::string &value);
  /// \}

  /// \brief Report an error based on an incorrect namelist element data type request.  This is an
  ///        assertion that catches developer mistakes, not something that an end user should
  ///        encounter.  It always ends by throwing a runtime error.
  ///
  /// \param caller     The name of the member function of NamelistElement calling this error
  /// \param data_type  The name of the (erroneously) requested data type
  void reportNamelistTypeProblem(const std::string &caller, const std::string &data_type) const;

private:
  std::string label;          ///< Keyword for the namelist element
  NamelistType kind;          ///< The type of value the keyword accepts
  ExceptionResponse policy;   ///< Response to bad user input
  int int_value;              ///< Value of an INTEGER keyword
  double real_value;          ///< Value of a REAL keyword
  std::string string_value;   ///< Value of a STRING keyword
  std::string help_message;   ///< User documentation for the keyword
  InputStatus establishment;  ///< Origin of the current value
  int user_entries;           ///< Number of values received from user input

  /// \brief Respond to bad user input according to the policy.
  ///
  /// \param errmsg  Description of the problem
  /// \param caller  Name of the calling function
  void badInputResponse(const std::string &errmsg, const char* caller);

  /// \brief Record the arrival of a user-specified value, complaining if one was already given.
  ///
  /// \param prior_value  The value about to be replaced, in text form
  /// \param new_value    The incoming value, in text form
  /// \param caller       Name of the calling function
  void recordUserEntry(const std::string &prior_value, const std::string &new_value,
                       const char* caller);
};

} // namespace namelist
} // namespace conformix

#endif
