#include <string>
#include "copyright.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "namelist_element.h"

namespace conformix {
namespace namelist {

using parse::NumberFormat;
using parse::realToString;
using parse::verifyNumberFormat;

//-------------------------------------------------------------------------------------------------
NamelistElement::NamelistElement(const std::string &keyword_in, const NamelistType kind_in,
                                 const std::string &default_in, const std::string &help_in) :
  label{keyword_in},
  kind{kind_in},
  policy{ExceptionResponse::WARN},
  int_value{0},
  real_value{0.0},
  string_value{},
  help_message{help_in},
  establishment{(default_in.size() > 0) ? InputStatus::DEFAULT : InputStatus::MISSING},
  user_entries{0}
{
  // Check that the keyword is valid
  for (size_t i = 0; i < label.size(); i++) {
    const char tc = label[i];
    if (tc == ' ' || tc == '\n' || tc == ',' || tc == '\'' || tc == '\"' || tc == '#' ||
        tc == '!' || tc == '/' || tc == '=') {
      rtErr("Keyword \"" + label + "\" separates into multiple words or may contain comments "
            "or quotations.  The keyword must not contain whitespace or carriage returns and "
            "avoid the namelist restricted characters [ ', \", #, !, =, and / ].",
            "NamelistElement");
    }
  }
  if (default_in.size() == 0) {
    return;
  }

  // Defaults are supplied by the developer, so a default of the wrong type is always an error.
  switch (kind) {
  case NamelistType::INTEGER:
    if (verifyNumberFormat(default_in.c_str(), NumberFormat::INTEGER)) {
      int_value = stol(default_in);
    }
    else {
      rtErr("A default INTEGER cannot be obtained from \"" + default_in + "\" for keyword \"" +
            label + "\".", "NamelistElement");
    }
    break;
  case NamelistType::REAL:
    if (verifyNumberFormat(default_in.c_str(), NumberFormat::SCIENTIFIC) ||
        verifyNumberFormat(default_in.c_str(), NumberFormat::STANDARD_REAL)) {
      real_value = stod(default_in);
    }
    else {
      rtErr("A default REAL number cannot be obtained from \"" + default_in +
            "\" for keyword \"" + label + "\".", "NamelistElement");
    }
    break;
  case NamelistType::STRING:
    string_value = default_in;
    break;
  }
}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistElement::getLabel() const {
  return label;
}

//-------------------------------------------------------------------------------------------------
NamelistType NamelistElement::getKind() const {
  return kind;
}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistElement::getHelp() const {
  return help_message;
}

//-------------------------------------------------------------------------------------------------
InputStatus NamelistElement::getEstablishment() const {
  return establishment;
}

//-------------------------------------------------------------------------------------------------
int NamelistElement::getIntValue() const {
  if (kind != NamelistType::INTEGER) {
    reportNamelistTypeProblem("getIntValue", "int");
  }
  return int_value;
}

//-------------------------------------------------------------------------------------------------
double NamelistElement::getRealValue() const {
  if (kind != NamelistType::REAL) {
    reportNamelistTypeProblem("getRealValue", "double");
  }
  return real_value;
}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistElement::getStringValue() const {
  if (kind != NamelistType::STRING) {
    reportNamelistTypeProblem("getStringValue", "std::string");
  }
  return string_value;
}

//-------------------------------------------------------------------------------------------------
void NamelistElement::setPolicy(const ExceptionResponse policy_in) {
  policy = policy_in;
}

//-------------------------------------------------------------------------------------------------
void NamelistElement::setHelp(const std::string &help_in) {
  help_message = help_in;
}

//-------------------------------------------------------------------------------------------------
void NamelistElement::setIntValue(const int value) {
  if (kind != NamelistType::INTEGER) {
    reportNamelistTypeProblem("setIntValue", "int");
  }
  recordUserEntry(std::to_string(int_value), std::to_string(value), "setIntValue");
  int_value = value;
}

//-------------------------------------------------------------------------------------------------
void NamelistElement::setRealValue(const double value) {
  if (kind != NamelistType::REAL) {
    reportNamelistTypeProblem("setRealValue", "double");
  }
  recordUserEntry(realToString(real_value), realToString(value), "setRealValue");
  real_value = value;
}

//-------------------------------------------------------------------------------------------------
void NamelistElement::setStringValue(const std::string &value) {
  if (kind != NamelistType::STRING) {
    reportNamelistTypeProblem("setStringValue", "std::string");
  }
  recordUserEntry(string_value, value, "setStringValue");
  string_value = value;
}

//-------------------------------------------------------------------------------------------------
void NamelistElement::reportNamelistTypeProblem(const std::string &caller,
                                                const std::string &data_type) const {
  rtErr("Namelist element \"" + label + "\" has type " + getEnumerationName(kind) + ", not " +
        data_type + ".", "NamelistElement", caller.c_str());
}

//-------------------------------------------------------------------------------------------------
void NamelistElement::badInputResponse(const std::string &errmsg, const char* caller) {
  switch (policy) {
  case ExceptionResponse::DIE:
    rtErr(errmsg, "NamelistElement", caller);
  case ExceptionResponse::WARN:
    rtWarn(errmsg, "NamelistElement", caller);
    break;
  case ExceptionResponse::SILENT:
    break;
  }
}

//-------------------------------------------------------------------------------------------------
void NamelistElement::recordUserEntry(const std::string &prior_value,
                                      const std::string &new_value, const char* caller) {
  if (user_entries > 0) {
    badInputResponse("An extra entry was found for keyword \"" + label + "\".  " + new_value +
                     " will replace " + prior_value + ".", caller);
  }
  user_entries += 1;
  establishment = InputStatus::USER_SPECIFIED;
}

} // namespace namelist
} // namespace conformix
