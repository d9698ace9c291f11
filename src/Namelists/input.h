// -*-c++-*-
#ifndef CONFORMIX_INPUT_H
#define CONFORMIX_INPUT_H

#include <string>
#include <vector>
#include "copyright.h"
#include "Constants/behavior.h"
#include "namelist_emulator.h"

namespace conformix {
namespace namelist {

/// \brief Prepare a list of std::strings representing a sequence of delimited words found in the
///        text of an input deck.  Quoted text forms a single word and comments (# or !) run to
///        the end of their line.  The '=', ',', and ';' separators are removed so as not to appear
///        in the output.  The result begins with the title card of the namelist (&title) and
///        ends with its terminator (&end or /), and can then be interpreted as a series of
///        "keyword -> value" pairs.  If the namelist is not found, the result is empty.
///
/// \param text   Text of some input deck
/// \param title  Title of the namelist to search for, without the leading ampersand
std::vector<std::string> pullNamelist(const std::string &text, const std::string &title);

/// \brief Load a namelist with user input obtained from the text of an input deck.  Only the
///        first instance of the namelist is read.
///
/// \param text   Text of some input deck
/// \param nml    The namelist to search for and then fill
/// \param found  A way to pass back the information that a namelist was found in the input.
///               Leaving the variable set to nullptr disables this feature.
void readNamelist(const std::string &text, NamelistEmulator *nml, bool *found = nullptr);

} // namespace namelist
} // namespace conformix

#endif
