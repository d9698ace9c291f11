#include "copyright.h"
#include "structure_enumerators.h"

namespace conformix {
namespace structure {

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const RMSDMethod input) {
  switch (input) {
  case RMSDMethod::ALIGN:
    return std::string("ALIGN");
  case RMSDMethod::NO_ALIGN:
    return std::string("NO_ALIGN");
  }
  __builtin_unreachable();
}

} // namespace structure
} // namespace conformix
