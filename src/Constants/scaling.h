// -*-c++-*-
#ifndef CONFORMIX_SCALING_H
#define CONFORMIX_SCALING_H

#include "copyright.h"

namespace conformix {
namespace constants {

/// \brief a value bigger than tiny but still small enough to often be negligible
constexpr double small = 1.0e-8;

/// \brief The default tiny value, below which most quantities are unimportant
constexpr double tiny = 1.0e-10;

/// \brief An even tinier value, for the most stringent comparisons
constexpr double verytiny = 1.0e-12;

/// \brief Singular values smaller than this multiple of the largest singular value are treated
///        as zero when completing the null space of a decomposition.
constexpr double singular_value_cutoff = 1.0e-12;

/// \brief Total fit weights at or below this value are taken to be zero.  Weights are user data
///        and a sum of exact zeros is the common case, but accumulated round-off in a sum of
///        tiny non-zero weights must not be allowed to pass as a meaningful mass.
constexpr double degenerate_weight_sum = 1.0e-14;

} // namespace constants
} // namespace conformix

#endif
