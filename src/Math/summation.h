// -*-c++-*-
#ifndef CONFORMIX_SUMMATION_H
#define CONFORMIX_SUMMATION_H

#include <vector>
#include "copyright.h"
#include "Reporting/error_format.h"

namespace conformix {
namespace stmath {

using errors::rtErr;

/// \brief Sum the elements of an array.  Developers must take care that the sum type have a
///        sufficient range, particularly in cases with integral types.
///
/// Overloaded:
///   - Sum a C-style array with a trusted length
///   - Sum a Standard Template Library vector
///
/// \param v     The vector to sum
/// \param vlen  The length of the vector
/// \{
template <typename TSum, typename TBase>
TSum sum(const TBase* v, size_t vlen);

template <typename TSum, typename TBase>
TSum sum(const std::vector<TBase> &v);
/// \}

/// \brief Sum a series of rows element by element, producing one row.  This is the reduction of a
///        stack of per-atom quantities over all members of the stack.
///
/// \param v           The stack of rows, stored row after row
/// \param row_length  Number of elements in each row
/// \param row_count   Number of rows in the stack
template <typename TSum, typename TBase>
std::vector<TSum> sumRows(const std::vector<TBase> &v, size_t row_length, size_t row_count);

} // namespace stmath
} // namespace conformix

#include "summation.tpp"

#endif
