#include <algorithm>
#include <cstdio>
#include "copyright.h"
#include "Math/summation.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "checklist.h"

namespace conformix {
namespace testing {

using parse::findStringInVector;
using stmath::sum;

//-------------------------------------------------------------------------------------------------
CheckList::CheckList() :
    current_section{0},
    sections{"General"},
    successes{0},
    skips{0},
    ignored_failures{0},
    failures{0}
{}

//-------------------------------------------------------------------------------------------------
void CheckList::logResult(const CheckResult result) {
  switch (result) {
  case CheckResult::SUCCESS:
    successes[current_section] += 1;
    break;
  case CheckResult::SKIPPED:
    skips[current_section] += 1;
    break;
  case CheckResult::IGNORED:
    ignored_failures[current_section] += 1;
    break;
  case CheckResult::FAILURE:
    failures[current_section] += 1;
    break;
  }
}

//-------------------------------------------------------------------------------------------------
void CheckList::changeSection(const std::string &section_name) {
  const int n_section = sections.size();
  const int index = findStringInVector(sections, section_name);
  if (index < n_section) {
    current_section = index;
    return;
  }

  // If the requested section was not found, make a new one
  sections.push_back(section_name);
  successes.push_back(0);
  skips.push_back(0);
  ignored_failures.push_back(0);
  failures.push_back(0);
  current_section = n_section;
}

//-------------------------------------------------------------------------------------------------
void CheckList::changeSection(const int section_index) {
  if (section_index >= 0 && section_index < static_cast<int>(sections.size())) {
    current_section = section_index;
  }
  else {
    rtWarn("Section index " + std::to_string(section_index) + " was requested from a list of "
           "only " + std::to_string(sections.size()) + " sections.  The current section will "
           "remain unchanged.", "CheckList", "changeSection");
  }
}

//-------------------------------------------------------------------------------------------------
int CheckList::getSectionIndex(const std::string &section_name) const {
  const int index = findStringInVector(sections, section_name);
  if (index >= static_cast<int>(sections.size())) {
    rtErr("There is no section " + section_name + ".", "CheckList", "getSectionIndex");
  }
  return index;
}

//-------------------------------------------------------------------------------------------------
const std::string& CheckList::getSectionName(const int section_index) const {
  return sections[resolveSection(section_index, "getSectionName")];
}

//-------------------------------------------------------------------------------------------------
int CheckList::getCurrentSection() const {
  return current_section;
}

//-------------------------------------------------------------------------------------------------
int CheckList::getSuccessCount(const int section_index) const {
  return successes[resolveSection(section_index, "getSuccessCount")];
}

//-------------------------------------------------------------------------------------------------
int CheckList::getFailureCount(const int section_index) const {
  return failures[resolveSection(section_index, "getFailureCount")];
}

//-------------------------------------------------------------------------------------------------
int CheckList::getSkipCount(const int section_index) const {
  return skips[resolveSection(section_index, "getSkipCount")];
}

//-------------------------------------------------------------------------------------------------
int CheckList::getIgnoredFailureCount(const int section_index) const {
  return ignored_failures[resolveSection(section_index, "getIgnoredFailureCount")];
}

//-------------------------------------------------------------------------------------------------
int CheckList::getOverallFailureCount() const {
  return sum<int>(failures);
}

//-------------------------------------------------------------------------------------------------
int CheckList::getOverallSkipCount() const {
  return sum<int>(skips);
}

//-------------------------------------------------------------------------------------------------
void CheckList::printSummary(const TestVerbosity verbosity) const {
  const int n_succ = sum<int>(successes);
  const int n_fail = sum<int>(failures);
  const int n_skip = sum<int>(skips);
  const int n_ignr = sum<int>(ignored_failures);
  const int n_test = n_succ + n_fail + n_skip + n_ignr;
  const int n_section = sections.size();
  int n_filled_sections = 0;
  for (int i = 0; i < n_section; i++) {
    n_filled_sections += (successes[i] + failures[i] + ignored_failures[i] + skips[i] > 0);
  }
  switch (verbosity) {
  case TestVerbosity::FULL:
    printf("Summary of test results (%2d sections, %4d tests):\n", n_filled_sections, n_test);
    if (n_succ > 0 && n_fail == 0 && n_skip == 0) {
      if (n_ignr == 0) {
        printf("  COMPLETE SUCCESS\n\n");
      }
      else {
        printf("  QUALIFIED SUCCESS (all tests ran, but %4d failures were ignored)\n\n", n_ignr);
      }
    }
    else if (n_succ > 0) {
      printf("  MIXED RESULTS (%4d tests passed, %4d failed, %4d ignored, %4d skipped)\n\n",
             n_succ, n_fail, n_ignr, n_skip);
    }
    else if (n_fail > 0 || n_ignr > 0) {
      printf("  COMPLETE FAILURE (%4d failures can be ignored, %4d tests were skipped)\n\n",
             n_ignr, n_skip);
    }
    else {
      printf("  NO TESTS WERE RUN\n\n");
    }
    {
      int max_name = 17;
      for (int i = 0; i < n_section; i++) {
        max_name = std::max(max_name, static_cast<int>(sections[i].size()));
      }
      max_name = std::min(max_name, 48);
      printf("  %-*.*s  Pass  Fail  Ignored  Skipped\n", max_name, max_name, "Test Section Name");
      for (int i = 0; i < n_section; i++) {
        if (successes[i] + failures[i] + ignored_failures[i] + skips[i] == 0) {
          continue;
        }
        printf("  %-*.*s  %4d  %4d  %7d  %7d\n", max_name, max_name, sections[i].c_str(),
               successes[i], failures[i], ignored_failures[i], skips[i]);
      }
      printf("\n");
    }
    break;
  case TestVerbosity::COMPACT:
    if (n_succ > 0 && n_fail == 0 && n_skip == 0) {
      printf("Success.  %4d tests passed", n_succ);
      if (n_filled_sections > 1) {
        printf(" in %2d sections", n_filled_sections);
      }
      if (n_ignr > 0) {
        printf(" (%4d failures ignored).\n", n_ignr);
      }
      else {
        printf(".\n");
      }
    }
    else if (n_succ > 0) {
      printf("Mixed results (%4d tests passed, %4d failed, %4d ignored, %4d skipped)\n",
             n_succ, n_fail, n_ignr, n_skip);
    }
    else if (n_fail > 0 || n_ignr > 0) {
      printf("Total failure (%4d failures can be ignored, %4d tests were skipped).\n",
             n_ignr, n_skip);
    }
    else {
      printf("No tests were run.\n");
    }
    break;
  case TestVerbosity::FAILURE_ONLY:
    if (n_fail > 0) {
      printf("%4d tests failed out of %4d (%4d ignored, %4d skipped)\n", n_fail, n_test, n_ignr,
             n_skip);
    }
    break;
  }
}

//-------------------------------------------------------------------------------------------------
int CheckList::resolveSection(const int section_index, const char* caller) const {
  if (section_index == -1) {
    return current_section;
  }
  if (section_index < 0 || section_index >= static_cast<int>(sections.size())) {
    rtErr("Index " + std::to_string(section_index) + " does not exist (there are " +
          std::to_string(sections.size()) + " sections in all).", "CheckList", caller);
  }
  return section_index;
}

} // namespace testing
} // namespace conformix
