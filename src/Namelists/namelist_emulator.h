// -*-c++-*-
#ifndef CONFORMIX_NAMELIST_EMULATOR_H
#define CONFORMIX_NAMELIST_EMULATOR_H

#include <string>
#include <vector>
#include "copyright.h"
#include "Constants/behavior.h"
#include "Reporting/error_format.h"
#include "namelist_element.h"
#include "namelist_enumerators.h"

namespace conformix {
namespace namelist {

using constants::CaseSensitivity;
using constants::ExceptionResponse;

/// \brief Collection of variables to transcribe information contained within a namelist
class NamelistEmulator {
public:

  /// \brief Construct an object to emulate Fortran namelist functionality, with improvements.
  ///
  /// \param title_in   The title of the namelist
  /// \param casing_in  Case sensitivity to abide (default "AUTOMATIC", which in this context means
  ///                   that namelist titles and keywords are case insensitive but values are
  ///                   case sensitive)
  /// \param policy_in  Response to unknown keywords and bad values in user input
  /// \param help_in    User documentation for the namelist as a whole
  NamelistEmulator(const std::string &title_in,
                   CaseSensitivity casing_in = CaseSensitivity::AUTOMATIC,
                   ExceptionResponse policy_in = ExceptionResponse::WARN,
                   const std::string &help_in = std::string("No description provided"));

  /// \brief Obtain the title of this namelist (i.e. &superpose)
  const std::string& getTitle() const;

  /// \brief Obtain the number of parameters catalogged within this namelist emulator.
  int getKeywordCount() const;

  /// \brief Obtain the case sensitivity setting for this namelist.
  CaseSensitivity getCaseSensitivity() const;

  /// \brief Relay the exception handling policy for this namelist.
  ExceptionResponse getPolicy() const;

  /// \brief Get a keyword from this namelist based on an index.  This is for retrieving the
  ///        keyword itself, not a value associated with a keyword.
  ///
  /// \param index  Index of the keyword in the list held by this namelist
  const std::string& getKeyword(size_t index) const;

  /// \brief Get the type of a specific keyword within this namelist.
  ///
  /// \param keyword_query  The keyword of interest
  NamelistType getKeywordKind(const std::string &keyword_query) const;

  /// \brief Test whether a keyword has been set, be that by default or user input.
  ///
  /// \param keyword_query  The keyword of interest
  InputStatus getKeywordStatus(const std::string &keyword_query) const;

  /// \brief Test whether a namelist contains a particular keyword at all.
  ///
  /// \param query  The keyword to search for
  bool hasKeyword(const std::string &query) const;

  /// \brief Get the value of a keyword from within the namelist.  The keyword must exist, must
  ///        have the requested type, and must have been established by a default or user input.
  ///
  /// \param keyword_query  Identifier of the keyword of interest
  /// \{
  int getIntValue(const std::string &keyword_query) const;
  double getRealValue(const std::string &keyword_query) const;
  const std::string& getStringValue(const std::string &keyword_query) const;
  /// \}

  /// \brief Get the documentation for the namelist as a whole, or for one of its keywords.
  ///
  /// \param keyword_query  Identifier of the keyword of interest
  /// \{
  const std::string& getHelp() const;
  const std::string& getHelp(const std::string &keyword_query) const;
  /// \}

  /// \brief Add one or more keywords to the namelist.  Adding a keyword that already exists is a
  ///        developer error.
  ///
  /// \param new_key   The keyword to add
  /// \param new_keys  A series of keywords to add
  /// \{
  void addKeyword(const NamelistElement &new_key);
  void addKeyword(const std::vector<NamelistElement> &new_keys);
  /// \}

  /// \brief Add documentation to a keyword.
  ///
  /// \param keyword_query  Identifier of the keyword of interest
  /// \param help_in        The documentation
  void addHelp(const std::string &keyword_query, const std::string &help_in);

  /// \brief Assign a value from user input to a keyword.  Returns 1 if the value was consumed,
  ///        0 if the keyword was not recognized (in which case the value is not consumed, and the
  ///        next word is taken to be a keyword).  Bad values are handled according to the
  ///        namelist's policy.
  ///
  /// \param key    The keyword
  /// \param value  The value, in text form
  int assignElement(const std::string &key, const std::string &value);

private:
  std::string title;                      ///< Title of the namelist, without the ampersand
  CaseSensitivity casing;                 ///< Case sensitivity of titles and keywords
  ExceptionResponse policy;               ///< Response to bad user input
  std::string help_message;               ///< User documentation for the namelist
  std::vector<NamelistElement> keywords;  ///< Keywords and their values

  /// \brief Find the index of a keyword in the list.  Returns the number of keywords if the
  ///        keyword is not found.
  ///
  /// \param query  The keyword to search for
  size_t findIndexByKeyword(const std::string &query) const;

  /// \brief Find a keyword that must exist, or raise an error.
  ///
  /// \param query   The keyword to search for
  /// \param caller  Name of the calling function
  size_t requireKeyword(const std::string &query, const char* caller) const;

  /// \brief Verify that a keyword has a value, from default or user input, before reporting it.
  ///
  /// \param keyword_query  The keyword of interest
  /// \param p_index        Index of the keyword in the list
  /// \param caller         Name of the calling function
  void verifyEstablishment(const std::string &keyword_query, size_t p_index,
                           const char* caller) const;
};

} // namespace namelist
} // namespace conformix

#endif
