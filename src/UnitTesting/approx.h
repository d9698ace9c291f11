// -*-c++-*-
#ifndef CONFORMIX_APPROX_H
#define CONFORMIX_APPROX_H

#include <algorithm>
#include <cmath>
#include <string>
#include <typeinfo>
#include <vector>
#include "copyright.h"
#include "Constants/scaling.h"
#include "DataTypes/common_types.h"
#include "Reporting/error_format.h"
#include "unit_test_enumerators.h"

namespace conformix {
namespace testing {

using data_types::isScalarType;

/// \brief Class for handling comparisons of floating-point results versus expected values in unit
///        tests.  The general form is to take a vector of real numbers and apply the comparison
///        across all entries.
class Approx {
public:

  /// \brief Constructor for real number comparisons based on a vector of multiple input values.
  ///        Other floating point and integer vectors can be converted to double-precision vectors.
  ///
  /// \param values_in  The values for comparison
  /// \param style_in   Type of comparison, relative or absolute
  /// \param tol_in     Tolerance for deviations that will still yield a correct comparison
  template <typename T> Approx(const std::vector<T> &values_in,
                               ComparisonType style_in = ComparisonType::ABSOLUTE,
                               double tol_in = 1.0e-6);

  /// \brief Constructor for real number comparisons based on a single input value
  ///
  /// Overloaded:
  ///   - Take the comparison style ahead of the tolerance (convenient use of default tolerance)
  ///   - Take the tolerance ahead of the comparison style (tolerance must be specified)
  ///
  /// \param value_in  The value for comparison
  /// \param style_in  The type of comparison, relative or absolute
  /// \param tol_in    Tolerance for deviations that will still yield a correct comparison
  /// \{
  Approx(double value_in, ComparisonType style_in = ComparisonType::ABSOLUTE,
         double tol_in = 1.0e-6);
  Approx(double value_in, double tol_in, ComparisonType style_in = ComparisonType::ABSOLUTE);
  /// \}

  /// \brief Get the size of the collection of numbers in a real number comparison
  int size() const;

  /// \brief Get the expectation value, sans any tolerance
  double getValue() const;

  /// \brief Get all values of an approximate comparison, sans any tolerance
  const std::vector<double>& getValues() const;

  /// \brief Get the style used in this approximate comparison
  ComparisonType getStyle() const;

  /// \brief Get the margin or tolerance associated with this approximate comparison
  /// \{
  double getMargin() const;
  double getTol() const;
  /// \}

  /// \brief Emit a copy of this object with a new tolerance, in the manner of Catch2.  The
  ///        original object is unchanged.
  ///
  /// \param dtol_in  The tolerance to use
  /// \{
  Approx margin(double dtol_in) const;
  Approx tol(double dtol_in) const;
  /// \}

  /// \brief Test whether a real-valued scalar is the same as the value held for comparison.
  ///
  /// \param test_value  The scalar value to test
  bool test(double test_value) const;

  /// \brief Test whether a vector of real-valued scalars is the same as a vector held for
  ///        comparison.  Vectors of different lengths never match.
  ///
  /// \param test_values  The vector of values to test
  template <typename T> bool test(const std::vector<T> &test_values) const;

private:
  std::vector<double> values;  ///< Reference values stored for later testing
  ComparisonType style;        ///< The type of comparison to make, i.e. ABSOLUTE or RELATIVE
  double dtol;                 ///< Tolerance for a succcessful test

  /// \brief Compute the deviation of one test value from one reference value, in the manner
  ///        dictated by the comparison style.
  ///
  /// \param test_value  The value to test
  /// \param ref_value   The reference value
  double deviation(double test_value, double ref_value) const;
};

/// \brief Overload the == and != operators to accommodate an Approx object and a scalar
///
/// \param d   The scalar to compare (everything becomes double precision, so integers to 53 bits)
/// \param cr  Reference data with an associated tolerance
/// \{
bool operator==(double d, const Approx &cr);
bool operator==(const Approx &cr, double d);
bool operator!=(double d, const Approx &cr);
bool operator!=(const Approx &cr, double d);
/// \}

/// \brief Overloads for equal and non equal relational operators using templated vectors
///
/// \param tvec  The vector to compare
/// \param cr    Reference data with an associated tolerance
/// \{
template <typename T> bool operator==(const std::vector<T> &tvec, const Approx &cr);
template <typename T> bool operator==(const Approx &cr, const std::vector<T> &tvec);
template <typename T> bool operator!=(const std::vector<T> &tvec, const Approx &cr);
template <typename T> bool operator!=(const Approx &cr, const std::vector<T> &tvec);
/// \}

} // namespace testing
} // namespace conformix

#include "approx.tpp"

#endif
