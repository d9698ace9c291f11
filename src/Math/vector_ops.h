// -*-c++-*-
#ifndef CONFORMIX_VECTOR_OPS_H
#define CONFORMIX_VECTOR_OPS_H

#include <algorithm>
#include <cmath>
#include <typeinfo>
#include <vector>
#include "copyright.h"
#include "Constants/scaling.h"
#include "Reporting/error_format.h"

namespace conformix {
namespace stmath {

/// \brief Check that two vectors of the same data type are compatible for various arithmetic
///        comparisons.  Throws an exception if the vectors cannot be compared.
///
/// \param va      The first vector
/// \param vb      The second vector
/// \param caller  Name of the calling function
template <typename T> void vectorComparisonCheck(const std::vector<T> &va,
                                                 const std::vector<T> &vb, const char* caller);

/// \brief Maximum absolute deviation between two vectors
///
/// Overloaded:
///   - Operate on two C-style vectors of a stated (and trusted) length
///   - Operate on two Standard Template Library vectors
///
/// \param va      The first vector
/// \param vb      The second vector, taken as the reference
/// \param length  The length of the C-style arrays
/// \{
template <typename T> double maxAbsoluteDifference(const T* va, const T* vb, size_t length);
template <typename T> double maxAbsoluteDifference(const std::vector<T> &va,
                                                   const std::vector<T> &vb);
/// \}

/// \brief Compute the mean value of a vector of scalars.
///
/// \param va      The vector of interest
/// \param length  The length of the C-style array
/// \{
template <typename T> double mean(const T* va, size_t length);
template <typename T> double mean(const std::vector<T> &va);
/// \}

/// \brief Find the maximum value of a vector of scalars.
///
/// \param va      The vector of interest
/// \param length  The length of the C-style array
/// \{
template <typename T> T maxValue(const T* va, size_t length);
template <typename T> T maxValue(const std::vector<T> &va);
/// \}

/// \brief Compute the cross product of two three-dimensional vectors, va x vb = vc.
///
/// Overloaded:
///   - Operate on C-style arrays
///   - Operate on Standard Template Library vectors
///
/// \param va  The first vector
/// \param vb  The second vector
/// \param vc  The result (pre-allocated)
/// \{
template <typename T> void crossProduct(const T* va, const T* vb, T* vc);
template <typename T> void crossProduct(const std::vector<T> &va, const std::vector<T> &vb,
                                        std::vector<T> *vc);
/// \}

/// \brief Compute the magnitude of a vector.
///
/// \param va      The vector of interest
/// \param length  The length of the C-style array
/// \{
template <typename T> double magnitude(const T* va, size_t length);
template <typename T> double magnitude(const std::vector<T> &va);
/// \}

/// \brief Normalize a vector in place, returning its original magnitude.
///
/// \param va      The vector of interest
/// \param length  The length of the C-style array
/// \{
template <typename T> double normalize(T* va, size_t length);
template <typename T> double normalize(std::vector<T> *va);
/// \}

/// \brief Compute the dot product of two vectors.
///
/// \param va      The first vector
/// \param vb      The second vector
/// \param length  The length of the C-style arrays
/// \{
template <typename T> double dot(const T* va, const T* vb, size_t length);
template <typename T> double dot(const std::vector<T> &va, const std::vector<T> &vb);
/// \}

} // namespace stmath
} // namespace conformix

#include "vector_ops.tpp"

#endif
