#include <algorithm>
#include "copyright.h"
#include "approx.h"

namespace conformix {
namespace testing {

//-------------------------------------------------------------------------------------------------
Approx::Approx(const double value_in, const ComparisonType style_in, const double tol_in) :
    Approx(std::vector<double>(1, value_in), style_in, tol_in)
{}

//-------------------------------------------------------------------------------------------------
Approx::Approx(const double value_in, const double tol_in, const ComparisonType style_in) :
    Approx(std::vector<double>(1, value_in), style_in, tol_in)
{}

//-------------------------------------------------------------------------------------------------
int Approx::size() const {
  return values.size();
}

//-------------------------------------------------------------------------------------------------
double Approx::getValue() const {
  if (values.size() != 1LLU) {
    rtErr("A single value was requested from an approximate comparison holding " +
          std::to_string(values.size()) + " values.", "Approx", "getValue");
  }
  return values[0];
}

//-------------------------------------------------------------------------------------------------
const std::vector<double>& Approx::getValues() const {
  return values;
}

//-------------------------------------------------------------------------------------------------
ComparisonType Approx::getStyle() const {
  return style;
}

//-------------------------------------------------------------------------------------------------
double Approx::getMargin() const {
  return dtol;
}

//-------------------------------------------------------------------------------------------------
double Approx::getTol() const {
  return dtol;
}

//-------------------------------------------------------------------------------------------------
Approx Approx::margin(const double dtol_in) const {
  return Approx(values, style, dtol_in);
}

//-------------------------------------------------------------------------------------------------
Approx Approx::tol(const double dtol_in) const {
  return Approx(values, style, dtol_in);
}

//-------------------------------------------------------------------------------------------------
bool Approx::test(const double test_value) const {
  if (values.size() != 1LLU) {
    return false;
  }
  return (deviation(test_value, values[0]) <= dtol);
}

//-------------------------------------------------------------------------------------------------
double Approx::deviation(const double test_value, const double ref_value) const {
  switch (style) {
  case ComparisonType::ABSOLUTE:
    return fabs(test_value - ref_value);
  case ComparisonType::RELATIVE:
    return fabs(test_value - ref_value) / std::max(fabs(ref_value), constants::tiny);
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
bool operator==(const double d, const Approx &cr) {
  return cr.test(d);
}

//-------------------------------------------------------------------------------------------------
bool operator==(const Approx &cr, const double d) {
  return cr.test(d);
}

//-------------------------------------------------------------------------------------------------
bool operator!=(const double d, const Approx &cr) {
  return (cr.test(d) == false);
}

//-------------------------------------------------------------------------------------------------
bool operator!=(const Approx &cr, const double d) {
  return (cr.test(d) == false);
}

} // namespace testing
} // namespace conformix
