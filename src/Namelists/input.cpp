#include "copyright.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "input.h"

namespace conformix {
namespace namelist {

using constants::CaseSensitivity;
using parse::separateText;
using parse::strcmpCased;

//-------------------------------------------------------------------------------------------------
std::vector<std::string> pullNamelist(const std::string &text, const std::string &title) {
  const std::vector<std::string> all_words = separateText(text, { '=', ',', ';' });
  const std::string title_card = "&" + title;
  const size_t n_word = all_words.size();
  size_t start = n_word;
  for (size_t i = 0; i < n_word; i++) {
    if (strcmpCased(all_words[i], title_card, CaseSensitivity::NO)) {
      start = i;
      break;
    }
  }
  std::vector<std::string> result;
  if (start == n_word) {
    return result;
  }
  result.push_back(all_words[start]);
  bool terminated = false;
  for (size_t i = start + 1; i < n_word; i++) {
    if (all_words[i] == "=" || all_words[i] == "," || all_words[i] == ";") {
      continue;
    }
    result.push_back(all_words[i]);
    if (all_words[i] == "/" || strcmpCased(all_words[i], "&end", CaseSensitivity::NO)) {
      terminated = true;
      break;
    }
  }
  if (terminated == false) {
    rtWarn("Namelist &" + title + " is not terminated by &end or /.  The remainder of the input "
           "will be read as part of the namelist.", "pullNamelist");
    result.push_back("&end");
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
void readNamelist(const std::string &text, NamelistEmulator *nml, bool *found) {

  // Get the list of words for this namelist.  The first word of the list will be the title card
  // of the namelist itself, and the last word will be "&end" or "/".  Neither needs
  // interpretation.
  const std::vector<std::string> nml_words = pullNamelist(text, nml->getTitle());
  const int word_count = nml_words.size();
  if (found != nullptr) {
    *found = (word_count > 0);
  }
  int i = 1;
  while (i < word_count - 1) {
    if (i == word_count - 2) {
      switch (nml->getPolicy()) {
      case ExceptionResponse::DIE:
        rtErr("Keyword \"" + nml_words[i] + "\" in namelist &" + nml->getTitle() + " has no "
              "value.", "readNamelist");
      case ExceptionResponse::WARN:
        rtWarn("Keyword \"" + nml_words[i] + "\" in namelist &" + nml->getTitle() + " has no "
               "value and will be ignored.", "readNamelist");
        break;
      case ExceptionResponse::SILENT:
        break;
      }
      break;
    }
    i += 1 + nml->assignElement(nml_words[i], nml_words[i + 1]);
  }
}

} // namespace namelist
} // namespace conformix
