// -*-c++-*-
#include "copyright.h"

namespace conformix {
namespace testing {

//-------------------------------------------------------------------------------------------------
template <typename T>
CheckResult check(const std::vector<T> &lhs, const RelationalOperator relationship,
                  const Approx &rhs, const std::string &error_message,
                  const TestPriority urgency) {
  if (urgency == TestPriority::ABORT) {
    gbl_test_results.logResult(CheckResult::SKIPPED);
    return CheckResult::SKIPPED;
  }
  const std::vector<double> dlhs(lhs.begin(), lhs.end());
  switch (relationship) {
  case RelationalOperator::EQUAL:
  case RelationalOperator::EQ:
    if (rhs.test(dlhs)) {
      gbl_test_results.logResult(CheckResult::SUCCESS);
      return CheckResult::SUCCESS;
    }
    return check(false, error_message + "  " + describeVectorMismatch(dlhs, rhs), urgency);
  case RelationalOperator::NOT_EQUAL:
  case RelationalOperator::NE:
    if (rhs.test(dlhs) == false) {
      gbl_test_results.logResult(CheckResult::SUCCESS);
      return CheckResult::SUCCESS;
    }
    return check(false, error_message + "  The vectors were expected to differ but agree "
                 "within a tolerance of " + std::to_string(rhs.getTol()) + ".", urgency);
  case RelationalOperator::GREATER_THAN:
  case RelationalOperator::GT:
  case RelationalOperator::LESS_THAN:
  case RelationalOperator::LT:
  case RelationalOperator::GREATER_THAN_OR_EQUAL:
  case RelationalOperator::GE:
  case RelationalOperator::LESS_THAN_OR_EQUAL:
  case RelationalOperator::LE:
    rtErr("Vector comparisons are invalid for " + getRelationalOperatorString(relationship) +
          " relationships.", "check");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
template <typename T>
CheckResult check(const Approx &lhs, const RelationalOperator relationship,
                  const std::vector<T> &rhs, const std::string &error_message,
                  const TestPriority urgency) {
  return check(rhs, relationship, lhs, error_message, urgency);
}

//-------------------------------------------------------------------------------------------------
template <typename T1, typename T2>
CheckResult check(const std::vector<T1> &lhs, const RelationalOperator relationship,
                  const std::vector<T2> &rhs, const std::string &error_message,
                  const TestPriority urgency) {
  return check(lhs, relationship, Approx(rhs, ComparisonType::ABSOLUTE, constants::verytiny),
               error_message, urgency);
}

} // namespace testing
} // namespace conformix
