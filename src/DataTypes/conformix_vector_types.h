// -*-c++-*-
#ifndef CONFORMIX_VECTOR_TYPES_H
#define CONFORMIX_VECTOR_TYPES_H

#include "copyright.h"
#include "common_types.h"

namespace conformix {
namespace data_types {

/// \brief A point or displacement in three dimensions
struct double3 {
  double x;
  double y;
  double z;
};

/// \brief A pair of 64-bit unsigned integers, the state of a 128-bit pseudo-random generator
struct ullint2 {
  ullint x;
  ullint y;
};

} // namespace data_types
} // namespace conformix

namespace conformix {
using data_types::double3;
using data_types::ullint2;
} // namespace conformix

#endif
