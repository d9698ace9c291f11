#include <string>
#include <vector>
#include "copyright.h"
#include "../../src/Reporting/error_format.h"
#include "../../src/UnitTesting/approx.h"
#include "../../src/UnitTesting/checklist.h"
#include "../../src/UnitTesting/unit_test.h"

using conformix::errors::ErrorKind;
using conformix::errors::rtErr;
using namespace conformix::testing;

//-------------------------------------------------------------------------------------------------
// main
//-------------------------------------------------------------------------------------------------
int main(const int argc, const char* argv[]) {

  // Some baseline initialization
  TestEnvironment oe(argc, argv);

  // Section 1
  section("Approximate comparisons");

  // Section 2
  section("Tallies of test results");

  // Section 3
  section("Trapping of errors");

  // Perform basic checks of the Approx object
  section(1);
  Approx gray_number(9.6, ComparisonType::ABSOLUTE, 0.11);
  check(gray_number.test(9.7), "Approx object fails to perform a real-to-real scalar comparison.");
  check(gray_number.test(9.8) == false, "Approx object accepts a value outside its tolerance.");
  check(gray_number.getValue(), RelationalOperator::EQUAL, 9.6, "Approx object does not return "
        "its target value.");
  Approx gray_vector(std::vector<double>{9.8, 8.1, 8.0, 4.5, 7.3}, ComparisonType::ABSOLUTE,
                     0.011);
  check(gray_vector.size(), RelationalOperator::EQUAL, 5, "Approx object does not report the "
        "length of its target series.");
  check(gray_vector.test(9.7) == false, "A scalar-to-vector approximate comparison was judged "
        "successful.");
  check(gray_vector.test(std::vector<double>{9.79, 8.11, 7.99, 4.49, 7.31}), "Approx object fails "
        "to pass a correct vector-to-vector comparison.");
  check(gray_vector.test(std::vector<double>{9.79, 8.08, 7.99, 4.49, 7.31}) == false,
        "Approx object fails to reject an unacceptable real vector-to-vector comparison.");
  check(gray_vector.test(std::vector<double>{9.8, 8.1, 8.0}) == false, "Approx object performs a "
        "comparison on vectors of different lengths and returns success.");
  check(gray_vector.test(std::vector<int>{10, 8, 8, 4, 7}) == false, "Approx object accepts an "
        "integer series far outside its tolerance.");
  CHECK_THROWS(gray_vector.getValue(), "A single value was taken from an Approx object holding a "
               "series.");
  const Approx relative_number(2000.0, ComparisonType::RELATIVE, 0.01);
  check(relative_number.test(2015.0), "A relative comparison rejects a value within its "
        "tolerance.");
  check(relative_number.test(1975.0) == false, "A relative comparison accepts a value outside "
        "its tolerance.");
  check(relative_number.margin(0.02).test(1975.0), "A relative comparison with an expanded "
        "margin rejects a value within its new tolerance.");
  check(9.65 == gray_number && gray_number != 9.85, "Equality operators for Approx objects give "
        "incorrect results.");
  check(gray_number, RelationalOperator::GREATER_THAN, 9.4, "Approximate comparison fails to "
        "process a scalar greater-than inequality.");
  check(4.5, RelationalOperator::LESS_THAN, gray_number, "Approximate comparison fails to "
        "process a scalar less-than inequality.");
  check(4, RelationalOperator::GREATER_THAN_OR_EQUAL, Approx(4), "Approximate comparison fails "
        "to identify a true greater-than-or-equal scalar comparison.");
  check(6, RelationalOperator::LESS_THAN_OR_EQUAL, Approx(8), "Approximate comparison fails "
        "to identify a true less-than-or-equal scalar comparison.");
  check(9.5, RelationalOperator::GT, Approx(9.6).margin(0.2), "Inequalities should give the "
        "benefit of the doubt, letting the tolerance work in favor of the comparison.");
  check(908153, RelationalOperator::GE, 908153, "Inferred approximate comparison is too harsh in "
        "comparing two medium-sized integer values by greater-than-or-equal inequality.");
  check(-90153, RelationalOperator::LT, 90153, "Inferred approximate comparison misses an obvious "
        "comparison of a significant number with its own negative value.");
  check(std::vector<double>{9.79, 8.11, 7.99, 4.49, 7.31}, RelationalOperator::EQUAL, gray_vector,
        "A vector comparison with an Approx object failed.");
  check(std::vector<int>{1, 2, 3}, RelationalOperator::EQUAL, std::vector<double>{1.0, 2.0, 3.0},
        "Vectors of different types but identical values were judged unequal.");
  check(std::vector<double>{1.0, 2.0}, RelationalOperator::NOT_EQUAL,
        std::vector<double>{1.0, 2.5}, "Vectors with different values were judged equal.");
  CHECK_THROWS(check(std::vector<double>{1.0}, RelationalOperator::LT, gray_vector, "Invalid"),
               "An inequality between vectors was evaluated.");
  CHECK_THROWS(check(std::string("abc"), RelationalOperator::GT, std::string("abd"), "Invalid"),
               "An inequality between strings was evaluated.");
  check(std::string("abc"), RelationalOperator::NE, std::string("abd"), "Different strings were "
        "judged identical.");

  // Tallies kept by a check list separate from the global record
  section(2);
  CheckList clist;
  clist.changeSection("alpha");
  clist.logResult(CheckResult::SUCCESS);
  clist.logResult(CheckResult::SUCCESS);
  clist.logResult(CheckResult::FAILURE);
  clist.changeSection("beta");
  clist.logResult(CheckResult::SKIPPED);
  clist.logResult(CheckResult::IGNORED);
  clist.changeSection("alpha");
  clist.logResult(CheckResult::SUCCESS);
  const int alpha_idx = clist.getSectionIndex("alpha");
  const int beta_idx = clist.getSectionIndex("beta");
  check(clist.getSectionName(beta_idx), RelationalOperator::EQUAL, std::string("beta"),
        "A check list section does not report its name.");
  check(clist.getCurrentSection(), RelationalOperator::EQUAL, alpha_idx, "A check list did not "
        "return to a section it had already created.");
  check(clist.getSuccessCount(alpha_idx), RelationalOperator::EQUAL, 3, "Successes were not "
        "tallied in the correct section.");
  check(clist.getFailureCount(alpha_idx), RelationalOperator::EQUAL, 1, "Failures were not "
        "tallied in the correct section.");
  check(clist.getSkipCount(beta_idx), RelationalOperator::EQUAL, 1, "Skipped tests were not "
        "tallied in the correct section.");
  check(clist.getIgnoredFailureCount(beta_idx), RelationalOperator::EQUAL, 1, "Ignored failures "
        "were not tallied in the correct section.");
  check(clist.getOverallFailureCount(), RelationalOperator::EQUAL, 1, "The overall failure count "
        "is incorrect.");
  check(clist.getOverallSkipCount(), RelationalOperator::EQUAL, 1, "The overall skip count is "
        "incorrect.");
  CHECK_THROWS(clist.getSectionName(12), "A name was returned for a section that does not "
               "exist.");
  check(unitTestSectionName(2), RelationalOperator::EQUAL, std::string("Tallies of test results"),
        "The global record of sections does not report the current section's name.");
  check(unitTestSectionIndex("Trapping of errors"), RelationalOperator::EQUAL, 3, "The global "
        "record of sections does not report the index of a named section.");
  const CheckResult skipped = check(false, "This check is skipped.", TestPriority::ABORT);
  check(skipped == CheckResult::SKIPPED, "A check marked for abortion was not skipped.");

  // Errors are trapped and classified
  section(3);
  CHECK_THROWS(rtErr("A deliberate error.", "main"), "A general error was not thrown.");
  CHECK_THROWS_KIND(rtErr("A deliberate error.", "main"), ErrorKind::GENERAL, "An error raised "
                    "without a classification was not reported as a general error.");
  CHECK_THROWS_KIND(rtErr(ErrorKind::TYPE_MISMATCH, "A deliberate type mismatch.", "main"),
                    ErrorKind::TYPE_MISMATCH, "The classification of an error was lost.");
  CHECK_THROWS_SOFT(rtErr("A deliberate error.", "main"), "A soft check did not trap an error.",
                    TestPriority::NON_CRITICAL);
  check(getRelationalOperatorString(RelationalOperator::GE), RelationalOperator::EQUAL,
        std::string(">="), "The symbol for an inequality is incorrect.");

  // Print results
  printTestSummary(oe.getVerbosity());
  return countGlobalTestFailures();
}
