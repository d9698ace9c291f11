// -*-c++-*-
#include "copyright.h"

namespace conformix {
namespace data_types {

//-------------------------------------------------------------------------------------------------
template <typename T> bool isScalarType() {
  const size_t ct = std::type_index(typeid(T)).hash_code();
  return (ct == int_type_index || ct == llint_type_index || ct == double_type_index ||
          ct == float_type_index || ct == longdouble_type_index);
}

//-------------------------------------------------------------------------------------------------
template <typename T> bool isFloatingPointScalarType() {
  const size_t ct = std::type_index(typeid(T)).hash_code();
  return (ct == double_type_index || ct == float_type_index || ct == longdouble_type_index);
}

//-------------------------------------------------------------------------------------------------
template <typename T> std::string getConformixScalarTypeName() {
  const size_t ct = std::type_index(typeid(T)).hash_code();
  if (ct == int_type_index) return "int";
  else if (ct == longdouble_type_index) return "long double";
  else if (ct == double_type_index) return "double";
  else if (ct == float_type_index) return "float";
  else if (ct == llint_type_index) return "long_long_int";
  else {
    rtErr("Data type " + std::string(std::type_index(typeid(T)).name()) + " is not a recognized "
          "coordinate type.", "getConformixScalarTypeName");
  }
  __builtin_unreachable();
}

} // namespace data_types
} // namespace conformix
