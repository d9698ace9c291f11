// -*-c++-*-
#include "copyright.h"

namespace conformix {
namespace stmath {

//-------------------------------------------------------------------------------------------------
template <typename T> void vectorComparisonCheck(const std::vector<T> &va,
                                                 const std::vector<T> &vb, const char* caller) {
  if (va.size() != vb.size()) {
    rtErr("Comparison requires vectors of identical sizes (" + std::to_string(va.size()) +
          " and " + std::to_string(vb.size()) + " given).", caller);
  }
}

//-------------------------------------------------------------------------------------------------
template <typename T> double maxAbsoluteDifference(const T* va, const T* vb, const size_t length) {
  double mdev = 0.0;
  for (size_t i = 0; i < length; i++) {
    const double tdev = fabs(static_cast<double>(va[i]) - static_cast<double>(vb[i]));
    mdev = std::max(mdev, tdev);
  }
  return mdev;
}

//-------------------------------------------------------------------------------------------------
template <typename T> double maxAbsoluteDifference(const std::vector<T> &va,
                                                   const std::vector<T> &vb) {
  vectorComparisonCheck(va, vb, "maxAbsoluteDifference");
  return maxAbsoluteDifference(va.data(), vb.data(), va.size());
}

//-------------------------------------------------------------------------------------------------
template <typename T> double mean(const T* va, const size_t length) {
  if (length == 0) {
    rtErr("The mean of an empty series is undefined.", "mean");
  }
  double sum_va = 0.0;
  for (size_t i = 0; i < length; i++) {
    sum_va += static_cast<double>(va[i]);
  }
  return sum_va / static_cast<double>(length);
}

//-------------------------------------------------------------------------------------------------
template <typename T> double mean(const std::vector<T> &va) {
  return mean(va.data(), va.size());
}

//-------------------------------------------------------------------------------------------------
template <typename T> T maxValue(const T* va, const size_t length) {
  if (length == 0) {
    rtErr("There is no maximum value in a vector of length zero.", "maxValue");
  }
  T max_value = va[0];
  for (size_t i = 1; i < length; i++) {
    max_value = std::max(max_value, va[i]);
  }
  return max_value;
}

//-------------------------------------------------------------------------------------------------
template <typename T> T maxValue(const std::vector<T> &va) {
  return maxValue(va.data(), va.size());
}

//-------------------------------------------------------------------------------------------------
template <typename T> void crossProduct(const T* va, const T* vb, T* vc) {
  vc[0] = (va[1] * vb[2]) - (va[2] * vb[1]);
  vc[1] = (va[2] * vb[0]) - (va[0] * vb[2]);
  vc[2] = (va[0] * vb[1]) - (va[1] * vb[0]);
}

//-------------------------------------------------------------------------------------------------
template <typename T> void crossProduct(const std::vector<T> &va, const std::vector<T> &vb,
                                        std::vector<T> *vc) {
  if (va.size() != 3 || vb.size() != 3 || vc->size() != 3) {
    rtErr("Cross products are defined for vectors of three elements (" +
          std::to_string(va.size()) + ", " + std::to_string(vb.size()) + ", and " +
          std::to_string(vc->size()) + " provided).", "crossProduct");
  }
  crossProduct(va.data(), vb.data(), vc->data());
}

//-------------------------------------------------------------------------------------------------
template <typename T> double magnitude(const T* va, const size_t length) {
  double result = 0.0;
  for (size_t i = 0; i < length; i++) {
    const double dva = va[i];
    result += dva * dva;
  }
  return sqrt(result);
}

//-------------------------------------------------------------------------------------------------
template <typename T> double magnitude(const std::vector<T> &va) {
  return magnitude(va.data(), va.size());
}

//-------------------------------------------------------------------------------------------------
template <typename T> double normalize(T* va, const size_t length) {
  const double magvec = magnitude(va, length);
  if (magvec < constants::tiny) {
    rtErr("A vector of magnitude " + std::to_string(magvec) + " cannot be normalized.",
          "normalize");
  }
  const double invmag = 1.0 / magvec;
  for (size_t i = 0; i < length; i++) {
    va[i] *= invmag;
  }
  return magvec;
}

//-------------------------------------------------------------------------------------------------
template <typename T> double normalize(std::vector<T> *va) {
  return normalize(va->data(), va->size());
}

//-------------------------------------------------------------------------------------------------
template <typename T> double dot(const T* va, const T* vb, const size_t length) {
  double result = 0.0;
  for (size_t i = 0; i < length; i++) {
    result += static_cast<double>(va[i]) * static_cast<double>(vb[i]);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
template <typename T> double dot(const std::vector<T> &va, const std::vector<T> &vb) {
  vectorComparisonCheck(va, vb, "dot");
  return dot(va.data(), vb.data(), va.size());
}

} // namespace stmath
} // namespace conformix
