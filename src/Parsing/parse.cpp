#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include "copyright.h"
#include "Reporting/error_format.h"
#include "parse.h"

namespace conformix {
namespace parse {

//-------------------------------------------------------------------------------------------------
bool verifyNumberFormat(const char* a, const NumberFormat cform, const int read_begin,
                        const int len) {
  const int width = (len > 0) ? len : static_cast<int>(strlen(a)) - read_begin;
  if (width <= 0) {
    return false;
  }

  // Find the extent of the number, then check that there is nothing but white space outside it
  int nbegin = read_begin;
  const int read_end = read_begin + width;
  while (nbegin < read_end && (a[nbegin] == ' ' || a[nbegin] == '\t')) {
    nbegin++;
  }
  int nend = nbegin;
  while (nend < read_end && a[nend] != ' ' && a[nend] != '\t' && a[nend] != '\0') {
    nend++;
  }
  bool problem = (nbegin == nend);
  for (int i = nend; i < read_end; i++) {
    problem = (problem || (a[i] != ' ' && a[i] != '\t' && a[i] != '\0'));
  }

  // Check each character of the number
  bool e_found = false;
  bool dot_found = false;
  int signs_found = 0;
  int digits_found = 0;
  for (int i = nbegin; i < nend; i++) {
    const char tc = a[i];
    if (tc == 'E' || tc == 'e') {
      problem = (problem || e_found || digits_found == 0);
      e_found = true;
    }
    else if (tc == '.') {
      problem = (problem || dot_found || e_found);
      dot_found = true;
    }
    else if (tc == '+' || tc == '-') {
      problem = (problem || (i > nbegin && a[i - 1] != 'E' && a[i - 1] != 'e'));
      signs_found++;
    }
    else if (tc >= '0' && tc <= '9') {
      digits_found++;
    }
    else {
      problem = true;
    }
  }
  problem = (problem || digits_found == 0);
  switch (cform) {
  case NumberFormat::SCIENTIFIC:
    problem = (problem || e_found == false || signs_found > 2);
    break;
  case NumberFormat::STANDARD_REAL:
    problem = (problem || signs_found > 2);
    break;
  case NumberFormat::INTEGER:
    problem = (problem || signs_found > 1 || dot_found || e_found);
    break;
  }
  return (problem == false);
}

//-------------------------------------------------------------------------------------------------
bool verifyNumberFormat(const std::string &a, const NumberFormat cform) {
  return verifyNumberFormat(a.c_str(), cform, 0, a.size());
}

//-------------------------------------------------------------------------------------------------
char uppercase(const char tc) {
  return tc - (tc >= 'a' && tc <= 'z') * 32;
}

//-------------------------------------------------------------------------------------------------
std::string uppercase(const std::string &ts) {
  std::string result = ts;
  const size_t n_char = ts.size();
  for (size_t i = 0; i < n_char; i++) {
    result[i] = uppercase(ts[i]);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
bool strcmpCased(const char* sa, const char* sb, const CaseSensitivity csen) {
  int i = 0;
  switch (csen) {
  case CaseSensitivity::YES:
    return (strcmp(sa, sb) == 0);
  case CaseSensitivity::NO:
    while (uppercase(sa[i]) == uppercase(sb[i])) {
      if (sa[i] == '\0') {
        return true;
      }
      i++;
    }
    return false;
  case CaseSensitivity::AUTOMATIC:
    rtErr("No AUTOMATIC behavior is defined for case-based string comparison.  AUTOMATIC "
          "settings for case sensitivity are defined at higher levels for specific situations, "
          "not the low-level implementation.", "strcmpCased");
    break;
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
bool strcmpCased(const std::string &sa, const std::string &sb, const CaseSensitivity csen) {
  return strcmpCased(sa.c_str(), sb.c_str(), csen);
}

//-------------------------------------------------------------------------------------------------
int realDecimalPlaces(const double value, const int limit) {

  // Determine the fractional component, then count digits until it is negligible
  const double abs_val = fabs(value);
  double frac = abs_val - floor(abs_val);
  const double smallest_significant_amount = pow(0.1, limit);
  int n_place = 0;
  while (n_place < limit && 1.01 * frac > smallest_significant_amount &&
         1.01 * fabs(1.0 - frac) > smallest_significant_amount) {
    frac *= 10.0;
    frac -= floor(frac);
    n_place++;
  }
  return n_place;
}

//-------------------------------------------------------------------------------------------------
std::string realToString(const double value, const int format_a, const int format_b,
                         const NumberFormat method, const NumberPrintStyle style) {

  // Check the overall format
  char fmt_code;
  switch (method) {
  case NumberFormat::SCIENTIFIC:
    if (format_a != free_number_format && format_b != free_number_format &&
        format_b > format_a - 7) {
      rtErr("A real number of format %" + std::to_string(format_a) + "." +
            std::to_string(format_b) + "e has too many decimal places for its overall length.",
            "realToString");
    }
    fmt_code = 'e';
    break;
  case NumberFormat::STANDARD_REAL:
    if (format_a != free_number_format && format_b != free_number_format &&
        format_b > format_a - 2) {
      rtErr("A real number of format %" + std::to_string(format_a) + "." +
            std::to_string(format_b) + "f has too many decimal places for its overall length.",
            "realToString");
    }
    fmt_code = 'f';
    break;
  case NumberFormat::INTEGER:
    rtErr("The printing method for a real number must be either SCIENTIFIC or STANDARD_REAL.",
          "realToString");
  }
  if (format_b < 0 && format_b != free_number_format) {
    rtErr("A nonsensical number of decimal places (" + std::to_string(format_b) +
          ") was specified.", "realToString");
  }
  if (abs(format_a) >= 62 && format_a != free_number_format) {
    rtErr("The requested number exceeds format limits (maximum 64 characters, %" +
          std::to_string(format_a) + "." + std::to_string(format_b) + fmt_code + " requested).",
          "realToString");
  }

  // Assemble the format string.  With only one specifier, it is the number of decimal places.
  std::string fmt("%");
  switch (style) {
  case NumberPrintStyle::STANDARD:
    break;
  case NumberPrintStyle::LEADING_ZEROS:
    fmt += "0";
    break;
  }
  char buffer[64];
  if (format_a != free_number_format && format_b != free_number_format) {
    fmt += "*.*";
    fmt += fmt_code;
    snprintf(buffer, 64, fmt.c_str(), format_a, format_b, value);
  }
  else if (format_a != free_number_format || format_b != free_number_format) {
    fmt += ".*";
    fmt += fmt_code;
    snprintf(buffer, 64, fmt.c_str(), (format_b != free_number_format) ? format_b : format_a,
             value);
  }
  else {
    snprintf(buffer, 64, "%.*f", realDecimalPlaces(value, 8), value);
  }
  return std::string(buffer);
}

//-------------------------------------------------------------------------------------------------
std::string realToString(const double value, const int format_a, const NumberFormat method,
                         const NumberPrintStyle style) {
  return realToString(value, format_a, free_number_format, method, style);
}

//-------------------------------------------------------------------------------------------------
std::string removeFlankingWhiteSpace(const std::string &input) {
  const size_t slen = input.size();
  size_t first = 0;
  while (first < slen && (input[first] == ' ' || input[first] == '\t' || input[first] == '\n')) {
    first++;
  }
  size_t last = slen;
  while (last > first &&
         (input[last - 1] == ' ' || input[last - 1] == '\t' || input[last - 1] == '\n')) {
    last--;
  }
  return input.substr(first, last - first);
}

//-------------------------------------------------------------------------------------------------
std::vector<std::string> separateText(const std::string &text, const std::vector<char> &delimiters,
                                      const std::vector<char> &comments) {
  std::vector<std::string> result;
  const size_t n_char = text.size();
  const size_t n_delim = delimiters.size();
  const size_t n_comm = comments.size();
  std::string word;
  bool word_open = false;
  size_t i = 0;
  while (i < n_char) {
    const char tc = text[i];

    // Quoted text is taken verbatim, including any delimiters or comment characters within it
    if (tc == '"' || tc == '\'') {
      const size_t closure = text.find(tc, i + 1);
      if (closure == std::string::npos) {
        rtErr("Unterminated quotation beginning at character " + std::to_string(i) + " of \"" +
              text + "\".", "separateText");
      }
      word += text.substr(i + 1, closure - i - 1);
      word_open = true;
      i = closure + 1;
      continue;
    }
    bool is_comment = false;
    for (size_t j = 0; j < n_comm; j++) {
      is_comment = (is_comment || tc == comments[j]);
    }
    if (is_comment) {
      while (i < n_char && text[i] != '\n') {
        i++;
      }
      continue;
    }
    bool is_delim = false;
    for (size_t j = 0; j < n_delim; j++) {
      is_delim = (is_delim || tc == delimiters[j]);
    }
    if (is_delim || tc == ' ' || tc == '\t' || tc == '\n' || tc == '\r') {
      if (word_open) {
        result.push_back(word);
        word.clear();
        word_open = false;
      }
      if (is_delim) {
        result.push_back(std::string(1, tc));
      }
    }
    else {
      word += tc;
      word_open = true;
    }
    i++;
  }
  if (word_open) {
    result.push_back(word);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
int findStringInVector(const std::vector<std::string> &vec, const std::string &query) {
  const int vsize = vec.size();
  for (int i = 0; i < vsize; i++) {
    if (vec[i] == query) {
      return i;
    }
  }
  return vsize;
}

} // namespace parse
} // namespace conformix
