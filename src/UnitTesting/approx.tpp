// -*-c++-*-
#include "copyright.h"

namespace conformix {
namespace testing {

//-------------------------------------------------------------------------------------------------
template <typename T> Approx::Approx(const std::vector<T> &values_in,
                                     const ComparisonType style_in, const double tol_in) :
    values{},
    style{style_in},
    dtol{tol_in}
{
  // The vector will get converted to a double-precision floating point representation,
  // irrespective of its input type.
  if (isScalarType<T>() == false) {
    rtErr("Data of type " + std::string(typeid(T).name()) + " cannot be processed for "
          "approximate, real-valued comparisons.", "Approx");
  }
  values = std::vector<double>(values_in.begin(), values_in.end());
  if (dtol < 0.0) {
    rtErr("A negative tolerance (" + std::to_string(dtol) + ") is nonsensical.", "Approx");
  }
}

//-------------------------------------------------------------------------------------------------
template <typename T> bool Approx::test(const std::vector<T> &test_values) const {
  if (isScalarType<T>() == false) {
    rtErr("Real-valued comparisons for a vector of type " + std::string(typeid(T).name()) +
          " are not permitted.", "Approx", "test");
  }
  const size_t nval = values.size();
  if (test_values.size() != nval) {
    return false;
  }

  // The largest outlier decides the comparison
  double max_dev = 0.0;
  for (size_t i = 0; i < nval; i++) {
    max_dev = std::max(deviation(static_cast<double>(test_values[i]), values[i]), max_dev);
  }
  return (max_dev <= dtol);
}

//-------------------------------------------------------------------------------------------------
template <typename T> bool operator==(const std::vector<T> &tvec, const Approx &cr) {
  return cr.test(tvec);
}

//-------------------------------------------------------------------------------------------------
template <typename T> bool operator==(const Approx &cr, const std::vector<T> &tvec) {
  return cr.test(tvec);
}

//-------------------------------------------------------------------------------------------------
template <typename T> bool operator!=(const std::vector<T> &tvec, const Approx &cr) {
  return (cr.test(tvec) == false);
}

//-------------------------------------------------------------------------------------------------
template <typename T> bool operator!=(const Approx &cr, const std::vector<T> &tvec) {
  return (cr.test(tvec) == false);
}

} // namespace testing
} // namespace conformix
