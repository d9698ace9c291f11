// -*-c++-*-
#ifndef CONFORMIX_PARSE_H
#define CONFORMIX_PARSE_H

#include <string>
#include <vector>
#include "copyright.h"
#include "Constants/behavior.h"
#include "parsing_enumerators.h"

namespace conformix {
namespace parse {

using constants::CaseSensitivity;

/// \brief Signal that a number format has no set width or number of decimal places
constexpr int free_number_format = -32788;

/// \brief Verify that the characters of a string conform to a particular number format.  Leading
///        and trailing white space is permitted, but white space within the number is not.
///
/// Overloaded:
///   - Check a C-style character array, possibly from a specific starting position
///   - Check a C++ string
///
/// \param a           The string to check
/// \param cform       The expected number format
/// \param read_begin  Index of the first character to check
/// \param len         The number of characters to check (if zero, check to the end of the string)
/// \{
bool verifyNumberFormat(const char* a, NumberFormat cform, int read_begin = 0, int len = 0);

bool verifyNumberFormat(const std::string &a, NumberFormat cform);
/// \}

/// \brief Convert one or more characters to uppercase, if they are letters between 'a' and 'z'.
///
/// Overloaded:
///   - Convert a single character
///   - Return a new string, an uppercase version of the input
///
/// \param tc  The character to convert
/// \param ts  The string to convert
/// \{
char uppercase(const char tc);
std::string uppercase(const std::string &ts);
/// \}

/// \brief Compare two strings, with or without regard to the case of letters.
///
/// \param sa    The first string
/// \param sb    The second string
/// \param csen  Case sensitivity setting
/// \{
bool strcmpCased(const char* sa, const char* sb, CaseSensitivity csen = CaseSensitivity::YES);

bool strcmpCased(const std::string &sa, const std::string &sb,
                 CaseSensitivity csen = CaseSensitivity::YES);
/// \}

/// \brief Determine the number of decimal places needed to represent a real number, up to a
///        stated limit.
///
/// \param value  The number of interest
/// \param limit  The maximum number of decimal places to report
int realDecimalPlaces(double value, int limit = 10);

/// \brief Convert a real number to a formatted string.
///
/// Overloaded:
///   - Provide both format specifiers.  Printing method defaults to %(a).(b)lf.
///   - Provide just one format specifier (must also provide the printing method)
///
/// \param value     The number to convert
/// \param format_a  First of up to two format specifiers.  If this is given and the second format
///                  specifier is blank, it refers to the number of decimal places to print for
///                  the number.  If the second format specifier is also present, this becomes the
///                  total width of the general format number.
/// \param format_b  If given, this will convert the first format specifier into the total width
///                  and then specify the number of digits after the decimal.
/// \param method    The notation in which to print the number
/// \param style     Whether to print leading zeros when there is more format space than digits
/// \{
std::string realToString(double value, int format_a = free_number_format,
                         int format_b = free_number_format,
                         NumberFormat method = NumberFormat::STANDARD_REAL,
                         NumberPrintStyle style = NumberPrintStyle::STANDARD);

std::string realToString(double value, int format_a, NumberFormat method,
                         NumberPrintStyle style = NumberPrintStyle::STANDARD);
/// \}

/// \brief Remove white space (spaces, tabs, and carriage returns) from either end of a string.
///
/// \param input  The string to trim
std::string removeFlankingWhiteSpace(const std::string &input);

/// \brief Separate a stream of text into words.  Words are delimited by white space and by any of
///        the stated delimiters, which are also returned as words of their own.  Text enclosed in
///        single or double quotes forms one word, stripped of its quotes.  Comment characters
///        void the remainder of their line.
///
/// \param text        The text to separate
/// \param delimiters  Characters which separate words and are kept as words themselves
/// \param comments    Characters which begin a comment running to the end of the line
std::vector<std::string> separateText(const std::string &text,
                                      const std::vector<char> &delimiters = {},
                                      const std::vector<char> &comments = { '!', '#' });

/// \brief Find the index of a string within a vector of strings.  If the string is not found,
///        the length of the vector is returned.
///
/// \param vec    The vector of strings to search
/// \param query  The string to seek
int findStringInVector(const std::vector<std::string> &vec, const std::string &query);

} // namespace parse
} // namespace conformix

#endif
