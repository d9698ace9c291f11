#include <string>
#include <vector>
#include "copyright.h"
#include "../../src/Constants/behavior.h"
#include "../../src/Parsing/parse.h"
#include "../../src/Parsing/parsing_enumerators.h"
#include "../../src/Reporting/error_format.h"
#include "../../src/UnitTesting/unit_test.h"

using conformix::constants::CaseSensitivity;
using namespace conformix::parse;
using namespace conformix::testing;

//-------------------------------------------------------------------------------------------------
// main
//-------------------------------------------------------------------------------------------------
int main(const int argc, const char* argv[]) {

  // Some baseline initialization
  TestEnvironment oe(argc, argv);

  // Section 1
  section("Test number format verification and display");

  // Section 2
  section("Test character conversion and string comparisons");

  // Section 3
  section("Test separation of text into words");

  // Number formats
  section(1);
  check(verifyNumberFormat("-17", NumberFormat::INTEGER), "A negative integer was not "
        "recognized.");
  check(verifyNumberFormat("  42  ", NumberFormat::INTEGER), "An integer flanked by white space "
        "was not recognized.");
  check(verifyNumberFormat("4.2", NumberFormat::INTEGER) == false, "A real number was taken for "
        "an integer.");
  check(verifyNumberFormat("4 2", NumberFormat::INTEGER) == false, "Two numbers were taken for "
        "one integer.");
  check(verifyNumberFormat("0.125", NumberFormat::STANDARD_REAL), "A real number was not "
        "recognized.");
  check(verifyNumberFormat("-.5", NumberFormat::STANDARD_REAL), "A real number without a "
        "leading digit was not recognized.");
  check(verifyNumberFormat("1.0.5", NumberFormat::STANDARD_REAL) == false, "A number with two "
        "decimal points was accepted.");
  check(verifyNumberFormat("6.02e+23", NumberFormat::SCIENTIFIC), "A number in scientific "
        "notation was not recognized.");
  check(verifyNumberFormat("1.0E-6", NumberFormat::SCIENTIFIC), "A number in scientific "
        "notation with a capital exponent marker was not recognized.");
  check(verifyNumberFormat("6.02", NumberFormat::SCIENTIFIC) == false, "A number lacking an "
        "exponent was accepted in scientific notation.");
  check(verifyNumberFormat("e5", NumberFormat::SCIENTIFIC) == false, "An exponent with no "
        "mantissa was accepted.");
  check(verifyNumberFormat("five", NumberFormat::STANDARD_REAL) == false, "A word was accepted "
        "as a number.");
  check(verifyNumberFormat("", NumberFormat::INTEGER) == false, "An empty string was accepted as "
        "a number.");
  check(verifyNumberFormat("xx123xx", NumberFormat::INTEGER, 2, 3), "A number embedded within "
        "a longer string was not recognized.");
  const double dbl_real = 0.000201;
  check(realToString(dbl_real, 4), RelationalOperator::EQUAL, std::string("0.0002"),
        "realToString() reports an incorrect representation.");
  check(realToString(dbl_real, 6), RelationalOperator::EQUAL, std::string("0.000201"),
        "realToString() reports an incorrect representation.");
  check(realToString(dbl_real, 10, 6), RelationalOperator::EQUAL, std::string("  0.000201"),
        "realToString() reports an incorrect representation.");
  check(realToString(686.4, 12, 5, NumberFormat::SCIENTIFIC), RelationalOperator::EQUAL,
        std::string(" 6.86400e+02"), "realToString() reports an incorrect representation.");
  check(realToString(686.4, 12, 5, NumberFormat::SCIENTIFIC, NumberPrintStyle::LEADING_ZEROS),
        RelationalOperator::EQUAL, std::string("06.86400e+02"), "realToString() reports an "
        "incorrect representation.");
  check(realToString(2.5), RelationalOperator::EQUAL, std::string("2.5"), "realToString() with "
        "a free format reports an incorrect representation.");
  CHECK_THROWS(realToString(dbl_real, 15, 4, NumberFormat::INTEGER), "An integer format was "
               "accepted for printing a real number.");
  CHECK_THROWS(realToString(dbl_real, 65), "An excessively long format was accepted.");
  CHECK_THROWS(realToString(dbl_real, 16, 15), "A format with more decimal places than its "
               "width allows was accepted.");
  CHECK_THROWS(realToString(dbl_real, 16, 12, NumberFormat::SCIENTIFIC), "A scientific format "
               "with more decimal places than its width allows was accepted.");
  check(realDecimalPlaces(dbl_real, 4), RelationalOperator::EQUAL, 4, "Incorrect number of "
        "decimal places reported by realDecimalPlaces() for " + realToString(dbl_real, 6) + ".");
  check(realDecimalPlaces(686.4), RelationalOperator::EQUAL, 1, "Incorrect number of decimal "
        "places reported by realDecimalPlaces() for 686.4.");
  check(realDecimalPlaces(12.0), RelationalOperator::EQUAL, 0, "A whole number was reported to "
        "have decimal places.");

  // Characters and string comparisons
  section(2);
  check(uppercase('a') == 'A', "Conversion of 'a' to 'A' failed.");
  check(uppercase('z') == 'Z', "Conversion of 'z' to 'Z' failed.");
  check(uppercase('#') == '#', "Uppercase conversion of '#' changed the character.");
  check(uppercase(std::string("ggz_a@!&%AJOfjoTP782bi!*x")), RelationalOperator::EQUAL,
        std::string("GGZ_A@!&%AJOFJOTP782BI!*X"), "Conversion of a string to uppercase failed.");
  check(strcmpCased("Superpose", "superpose", CaseSensitivity::YES) == false, "Case-sensitive "
        "comparison missed a difference in case.");
  check(strcmpCased("Superpose", "superpose", CaseSensitivity::NO), "Case-insensitive "
        "comparison failed to match two words.");
  check(strcmpCased(std::string("mean"), std::string("means"), CaseSensitivity::NO) == false,
        "Case-insensitive comparison matched words of different lengths.");
  CHECK_THROWS(strcmpCased("a", "A", CaseSensitivity::AUTOMATIC), "A string comparison with no "
               "defined case sensitivity was performed.");
  check(removeFlankingWhiteSpace("  \t flanked words \n "), RelationalOperator::EQUAL,
        std::string("flanked words"), "White space flanking a string was not removed.");
  check(removeFlankingWhiteSpace("   ").size() == 0LLU, "A string of white space was not reduced "
        "to nothing.");
  const std::vector<std::string> roster = { "target", "maxcyc", "rmsd_tol" };
  check(findStringInVector(roster, "maxcyc"), RelationalOperator::EQUAL, 1, "A string was not "
        "found at its position in a list.");
  check(findStringInVector(roster, "update"), RelationalOperator::EQUAL, 3, "A string absent "
        "from a list was not reported at the end of the list.");

  // Separation of text
  section(3);
  check(separateText("  alpha beta\tgamma\n delta "), RelationalOperator::EQUAL,
        std::vector<std::string>({ "alpha", "beta", "gamma", "delta" }), "Text was not separated "
        "at white space.");
  check(separateText("x=1,y = 2", { '=', ',' }), RelationalOperator::EQUAL,
        std::vector<std::string>({ "x", "=", "1", ",", "y", "=", "2" }), "Delimiters were not "
        "kept as words of their own.");
  check(separateText("keep this ! but not this\nnext # nor this"), RelationalOperator::EQUAL,
        std::vector<std::string>({ "keep", "this", "next" }), "Comments were not removed from "
        "separated text.");
  check(separateText("title \"a quoted, phrase\" end", { ',' }), RelationalOperator::EQUAL,
        std::vector<std::string>({ "title", "a quoted, phrase", "end" }), "Quoted text was not "
        "kept as a single word.");
  check(separateText("").size() == 0LLU, "Words were found in an empty string.");
  CHECK_THROWS(separateText("an 'unterminated quote"), "Text with an unterminated quotation was "
               "separated.");

  // Print results
  printTestSummary(oe.getVerbosity());
  return countGlobalTestFailures();
}
