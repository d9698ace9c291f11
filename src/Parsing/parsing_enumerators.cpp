#include "copyright.h"
#include "parsing_enumerators.h"

namespace conformix {
namespace parse {

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const NumberFormat input) {
  switch (input) {
  case NumberFormat::SCIENTIFIC:
    return std::string("SCIENTIFIC");
  case NumberFormat::STANDARD_REAL:
    return std::string("STANDARD_REAL");
  case NumberFormat::INTEGER:
    return std::string("INTEGER");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const NumberPrintStyle input) {
  switch (input) {
  case NumberPrintStyle::STANDARD:
    return std::string("STANDARD");
  case NumberPrintStyle::LEADING_ZEROS:
    return std::string("LEADING_ZEROS");
  }
  __builtin_unreachable();
}

} // namespace parse
} // namespace conformix
