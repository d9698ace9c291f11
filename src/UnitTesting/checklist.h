// -*-c++-*-
#ifndef CONFORMIX_CHECKLIST_H
#define CONFORMIX_CHECKLIST_H

#include <string>
#include <vector>
#include "copyright.h"
#include "unit_test_enumerators.h"

namespace conformix {
namespace testing {

/// \brief Object for storing a series of test results, with labels
class CheckList {
public:

  /// \brief Constructor for the CheckList object prepares a blank slate with a single "General"
  ///        section
  CheckList();

  /// \brief Log a result in a checklist based on the current section setting
  ///
  /// \param result  The result to log
  void logResult(CheckResult result);

  /// \brief Switch to a new (or previously started) section of the test case CheckList.
  ///
  /// Overloaded:
  ///   - Jump to a section by name, creating it if it does not yet exist
  ///   - Jump to a section by index
  ///
  /// \param section_name   The name of the section to add or jump to
  /// \param section_index  The index of the section to jump to
  /// \{
  void changeSection(const std::string &section_name);
  void changeSection(int section_index);
  /// \}

  /// \brief Get the index of a test section based on its name
  ///
  /// \param section_name  The name of the section of interest
  int getSectionIndex(const std::string &section_name) const;

  /// \brief Get the name of a test section based on its index
  ///
  /// \param section_index  The index of the section of interest
  const std::string& getSectionName(int section_index) const;

  /// \brief Get the current section number
  int getCurrentSection() const;

  /// \brief Get the number of results of some kind in a particular section.  The default value
  ///        of -1 returns the count for the current section.
  ///
  /// \param section_index  Index of the section of interest
  /// \{
  int getSuccessCount(int section_index = -1) const;
  int getFailureCount(int section_index = -1) const;
  int getSkipCount(int section_index = -1) const;
  int getIgnoredFailureCount(int section_index = -1) const;
  /// \}

  /// \brief Get the total number of failures across all sections.
  int getOverallFailureCount() const;

  /// \brief Get the total number of skipped tests across all sections.
  int getOverallSkipCount() const;

  /// \brief Print a summary of test results from this checklist
  ///
  /// \param verbosity  The level of verboseness at which to report
  void printSummary(TestVerbosity verbosity = TestVerbosity::COMPACT) const;

private:
  int current_section;                ///< Index of the current section, for which successes and
                                      ///<   failures can be tabulated
  std::vector<std::string> sections;  ///< List of named sections (default "General")
  std::vector<int> successes;         ///< Successes recorded for tests in each section
  std::vector<int> skips;             ///< Skipped tests recorded in each section
  std::vector<int> ignored_failures;  ///< Tests that failed but were ignored in each section
  std::vector<int> failures;          ///< Failures recorded for tests in each section

  /// \brief Resolve a section index, with -1 indicating the current section.
  ///
  /// \param section_index  The index of interest
  /// \param caller         Name of the calling function
  int resolveSection(int section_index, const char* caller) const;
};

} // namespace testing
} // namespace conformix

#endif
