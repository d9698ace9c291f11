#include "copyright.h"
#include "Parsing/parse.h"
#include "namelist_emulator.h"

namespace conformix {
namespace namelist {

using parse::NumberFormat;
using parse::strcmpCased;
using parse::verifyNumberFormat;

//-------------------------------------------------------------------------------------------------
NamelistEmulator::NamelistEmulator(const std::string &title_in, const CaseSensitivity casing_in,
                                   const ExceptionResponse policy_in,
                                   const std::string &help_in) :
    title{title_in}, casing{casing_in}, policy{policy_in}, help_message{help_in}, keywords{}
{}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistEmulator::getTitle() const {
  return title;
}

//-------------------------------------------------------------------------------------------------
int NamelistEmulator::getKeywordCount() const {
  return keywords.size();
}

//-------------------------------------------------------------------------------------------------
CaseSensitivity NamelistEmulator::getCaseSensitivity() const {
  return casing;
}

//-------------------------------------------------------------------------------------------------
ExceptionResponse NamelistEmulator::getPolicy() const {
  return policy;
}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistEmulator::getKeyword(const size_t index) const {
  if (index >= keywords.size()) {
    rtErr("Namelist \"" + title + "\" has " + std::to_string(keywords.size()) + " keywords.  "
          "Index " + std::to_string(index) + " is invalid.", "NamelistEmulator", "getKeyword");
  }
  return keywords[index].getLabel();
}

//-------------------------------------------------------------------------------------------------
NamelistType NamelistEmulator::getKeywordKind(const std::string &keyword_query) const {
  return keywords[requireKeyword(keyword_query, "getKeywordKind")].getKind();
}

//-------------------------------------------------------------------------------------------------
InputStatus NamelistEmulator::getKeywordStatus(const std::string &keyword_query) const {
  return keywords[requireKeyword(keyword_query, "getKeywordStatus")].getEstablishment();
}

//-------------------------------------------------------------------------------------------------
bool NamelistEmulator::hasKeyword(const std::string &query) const {
  return (findIndexByKeyword(query) < keywords.size());
}

//-------------------------------------------------------------------------------------------------
int NamelistEmulator::getIntValue(const std::string &keyword_query) const {
  const size_t p_index = requireKeyword(keyword_query, "getIntValue");
  verifyEstablishment(keyword_query, p_index, "getIntValue");
  return keywords[p_index].getIntValue();
}

//-------------------------------------------------------------------------------------------------
double NamelistEmulator::getRealValue(const std::string &keyword_query) const {
  const size_t p_index = requireKeyword(keyword_query, "getRealValue");
  verifyEstablishment(keyword_query, p_index, "getRealValue");
  return keywords[p_index].getRealValue();
}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistEmulator::getStringValue(const std::string &keyword_query) const {
  const size_t p_index = requireKeyword(keyword_query, "getStringValue");
  verifyEstablishment(keyword_query, p_index, "getStringValue");
  return keywords[p_index].getStringValue();
}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistEmulator::getHelp() const {
  return help_message;
}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistEmulator::getHelp(const std::string &keyword_query) const {
  return keywords[requireKeyword(keyword_query, "getHelp")].getHelp();
}

//-------------------------------------------------------------------------------------------------
void NamelistEmulator::addKeyword(const NamelistElement &new_key) {
  if (hasKeyword(new_key.getLabel())) {
    rtErr("Namelist \"" + title + "\" already has a keyword \"" + new_key.getLabel() + "\".",
          "NamelistEmulator", "addKeyword");
  }
  keywords.push_back(new_key);
  keywords.back().setPolicy(policy);
}

//-------------------------------------------------------------------------------------------------
void NamelistEmulator::addKeyword(const std::vector<NamelistElement> &new_keys) {
  const size_t n_new_key = new_keys.size();
  for (size_t i = 0; i < n_new_key; i++) {
    addKeyword(new_keys[i]);
  }
}

//-------------------------------------------------------------------------------------------------
void NamelistEmulator::addHelp(const std::string &keyword_query, const std::string &help_in) {
  keywords[requireKeyword(keyword_query, "addHelp")].setHelp(help_in);
}

//-------------------------------------------------------------------------------------------------
int NamelistEmulator::assignElement(const std::string &key, const std::string &value) {

  // The inputs presumably contain a keyword and value pair.  The question is what to do with the
  // value, and the answer is to find out what sort of input the namelist element expects.
  const size_t param_index = findIndexByKeyword(key);
  if (param_index >= keywords.size()) {
    switch (policy) {
    case ExceptionResponse::DIE:
      rtErr("Namelist \"" + title + "\" has no keyword \"" + key + "\".", "NamelistEmulator",
            "assignElement");
    case ExceptionResponse::WARN:
      rtWarn("Namelist \"" + title + "\" has no keyword \"" + key + "\".", "NamelistEmulator",
             "assignElement");
      break;
    case ExceptionResponse::SILENT:
      break;
    }
    return 0;
  }
  const NamelistType param_type = keywords[param_index].getKind();
  bool problem = false;
  switch (param_type) {
  case NamelistType::INTEGER:
    if (verifyNumberFormat(value.c_str(), NumberFormat::INTEGER)) {
      keywords[param_index].setIntValue(stol(value));
    }
    else {
      problem = true;
    }
    break;
  case NamelistType::REAL:
    if (verifyNumberFormat(value.c_str(), NumberFormat::STANDARD_REAL) ||
        verifyNumberFormat(value.c_str(), NumberFormat::SCIENTIFIC) ||
        verifyNumberFormat(value.c_str(), NumberFormat::INTEGER)) {
      keywords[param_index].setRealValue(stod(value));
    }
    else {
      problem = true;
    }
    break;
  case NamelistType::STRING:
    keywords[param_index].setStringValue(value);
    break;
  }

  // Respond to input errors
  if (problem) {
    switch (policy) {
    case ExceptionResponse::DIE:
      rtErr("Keyword \"" + key + "\" in namelist \"" + title + "\" accepts " +
            getEnumerationName(param_type) + " values.  " + value + " is invalid.",
            "NamelistEmulator", "assignElement");
    case ExceptionResponse::WARN:
      rtWarn("Keyword \"" + key + "\" in namelist \"" + title + "\" accepts " +
             getEnumerationName(param_type) + " values.  " + value + " is invalid and no new "
             "value will be assigned.", "NamelistEmulator", "assignElement");
      break;
    case ExceptionResponse::SILENT:
      break;
    }
  }
  return 1;
}

//-------------------------------------------------------------------------------------------------
size_t NamelistEmulator::findIndexByKeyword(const std::string &query) const {
  const size_t n_key = keywords.size();
  const CaseSensitivity key_casing = (casing == CaseSensitivity::YES) ? CaseSensitivity::YES :
                                                                        CaseSensitivity::NO;
  for (size_t i = 0; i < n_key; i++) {
    if (strcmpCased(keywords[i].getLabel(), query, key_casing)) {
      return i;
    }
  }
  return n_key;
}

//-------------------------------------------------------------------------------------------------
size_t NamelistEmulator::requireKeyword(const std::string &query, const char* caller) const {
  const size_t p_index = findIndexByKeyword(query);
  if (p_index >= keywords.size()) {
    rtErr("Namelist \"" + title + "\" has no keyword \"" + query + "\".", "NamelistEmulator",
          caller);
  }
  return p_index;
}

//-------------------------------------------------------------------------------------------------
void NamelistEmulator::verifyEstablishment(const std::string &keyword_query, const size_t p_index,
                                           const char* caller) const {
  if (keywords[p_index].getEstablishment() == InputStatus::MISSING) {
    rtErr("Namelist \"" + title + "\" keyword \"" + keyword_query + "\" has not been set by "
          "default or by user input.", "NamelistEmulator", caller);
  }
}

} // namespace namelist
} // namespace conformix
