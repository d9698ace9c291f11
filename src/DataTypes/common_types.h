// -*-c++-*-
#ifndef CONFORMIX_COMMON_TYPES_H
#define CONFORMIX_COMMON_TYPES_H

#include <string>
#include <typeinfo>
#include <typeindex>
#include <sys/types.h>
#include "copyright.h"
#include "Reporting/error_format.h"

namespace conformix {
namespace data_types {

/// \brief Integral type casts
/// \{
typedef unsigned int uint;
typedef long long int llint;
typedef unsigned long long int ullint;
/// \}

/// \brief Type indices for the POD types which coordinate and weight arrays may be built from
/// \{
static const size_t int_type_index = std::type_index(typeid(int)).hash_code();
static const size_t longdouble_type_index = std::type_index(typeid(long double)).hash_code();
static const size_t double_type_index = std::type_index(typeid(double)).hash_code();
static const size_t float_type_index = std::type_index(typeid(float)).hash_code();
static const size_t llint_type_index = std::type_index(typeid(llint)).hash_code();
/// \}

/// \brief Test whether some data type is a recognized scalar, integral or real.
template <typename T> bool isScalarType();

/// \brief Test whether some data type is a recognized floating point number.
template <typename T> bool isFloatingPointScalarType();

/// \brief Produce a platform-independent name by which to identify one of the scalar data types.
template <typename T> std::string getConformixScalarTypeName();

} // namespace data_types
} // namespace conformix

#include "common_types.tpp"

namespace conformix {
using data_types::uint;
using data_types::llint;
using data_types::ullint;
} // namespace conformix

#endif
