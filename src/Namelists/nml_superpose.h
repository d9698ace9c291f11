// -*-c++-*-
#ifndef CONFORMIX_NML_SUPERPOSE_H
#define CONFORMIX_NML_SUPERPOSE_H

#include <string>
#include "copyright.h"
#include "Constants/behavior.h"
#include "input.h"
#include "namelist_emulator.h"

namespace conformix {
namespace namelist {

/// \brief Targets onto which the coordinate sets of an ensemble can be superimposed
enum class SuperposeTarget {
  REFERENCE,  ///< Fit every coordinate set onto the ensemble's reference coordinates, once
  MEAN        ///< Fit onto the reference, then iterate onto the evolving (weighted) mean structure
};

/// \brief Default values for ensemble superposition
/// \{
constexpr char default_superpose_target[] = "reference";
constexpr int default_superpose_maxcyc = 10;
constexpr double default_superpose_rmsd_tol = 1.0e-4;
constexpr char default_superpose_degenerate[] = "die";
constexpr char default_superpose_update_ref[] = "false";
/// \}

/// \brief Object to encapsulate ensemble superposition controls.  Like other namelist
///        encapsulators, this object can take input text as part of its construction, or be
///        assembled by a series of setters.  Validation of each piece of data is handled as it
///        appears either in the contructor or via setters.
class SuperposeControls {
public:

  /// \brief The constructor can prepare an object with default settings or read the corresponding
  ///        namelist to accept user input.
  ///
  /// \param input_text  Text of an input deck which may contain a &superpose namelist
  /// \param found_nml   Indication that the namelist was found (passed back to calling function)
  /// \param policy_in   Requested error handling behavior
  /// \{
  SuperposeControls(ExceptionResponse policy_in = ExceptionResponse::DIE);
  SuperposeControls(const std::string &input_text, bool *found_nml,
                    ExceptionResponse policy_in = ExceptionResponse::DIE);
  /// \}

  /// \brief As with other control objects, copy and move constructors, plus copy and move
  ///        assignment operators, can all take their default forms.
  /// \{
  SuperposeControls(const SuperposeControls &original) = default;
  SuperposeControls(SuperposeControls &&original) = default;
  SuperposeControls& operator=(const SuperposeControls &original) = default;
  SuperposeControls& operator=(SuperposeControls &&original) = default;
  /// \}

  /// \brief Get the superposition target.
  SuperposeTarget getTarget() const;

  /// \brief Get the maximum number of cycles for iterative superposition onto the mean structure.
  int getMaximumCycles() const;

  /// \brief Get the convergence tolerance on the RMSD between successive mean structures.
  double getRmsdTolerance() const;

  /// \brief Get the response to coordinate sets with zero total weight.
  ExceptionResponse getDegenerateWeightResponse() const;

  /// \brief Indicate whether the final mean structure of an iterative superposition replaces the
  ///        ensemble's reference coordinates.
  bool getReferenceUpdate() const;

  /// \brief Get the original namelist emulator object as a transcript of the user input.
  const NamelistEmulator& getTranscript() const;

  /// \brief Set the superposition target.
  ///
  /// \param target_in  The requested target, either as an enumeration or as a keyword
  /// \{
  void setTarget(SuperposeTarget target_in);
  void setTarget(const std::string &target_in);
  /// \}

  /// \brief Set the maximum number of iterative superposition cycles.
  ///
  /// \param maxcyc_in  The requested number of cycles (must be at least one)
  void setMaximumCycles(int maxcyc_in);

  /// \brief Set the convergence tolerance for iterative superposition.
  ///
  /// \param rmsd_tol_in  The requested tolerance (must be positive)
  void setRmsdTolerance(double rmsd_tol_in);

  /// \brief Set the response to coordinate sets with zero total weight.
  ///
  /// \param response_in  The requested response, either as an enumeration or as a keyword
  /// \{
  void setDegenerateWeightResponse(ExceptionResponse response_in);
  void setDegenerateWeightResponse(const std::string &response_in);
  /// \}

  /// \brief Set whether iterative superposition updates the reference coordinates.
  ///
  /// \param update_in  The new setting, either as a boolean or as a keyword (true, false, yes,
  ///                   or no)
  /// \{
  void setReferenceUpdate(bool update_in);
  void setReferenceUpdate(const std::string &update_in);
  /// \}

private:
  ExceptionResponse policy;              ///< Set the behavior when bad inputs are encountered.
                                         ///<   DIE = abort program, WARN = warn the user and
                                         ///<   reset to the default value, SILENT = reset to the
                                         ///<   default value without comment.
  SuperposeTarget target;                ///< Target of the superposition
  int maxcyc;                            ///< Maximum number of cycles for iterative fitting
  double rmsd_tol;                       ///< Convergence criterion for iterative fitting
  ExceptionResponse degenerate_response; ///< Response to coordinate sets with zero total weight
  bool update_reference;                 ///< Flag to have the final mean structure become the
                                         ///<   reference coordinates

  /// Store a deep copy of the original namelist emulator as read from the input text.
  NamelistEmulator nml_transcript;

  /// \brief Respond to a bad input according to the object's policy.
  ///
  /// \param message  Description of the problem
  /// \param caller   Name of the calling function
  /// \param remedy   Description of the default setting that will be restored
  void badInputResponse(const std::string &message, const char* caller,
                        const std::string &remedy) const;
};

/// \brief Translate a human-readable keyword into a superposition target.
///
/// \param input  The keyword (reference or mean, case insensitive)
SuperposeTarget translateSuperposeTarget(const std::string &input);

/// \brief Produce a human-readable name for a superposition target.
///
/// \param input  The enumeration to name
std::string getEnumerationName(SuperposeTarget input);

/// \brief Produce a namelist for specifying ensemble superposition protocols.
///
/// \param input_text  Text to scan immediately after the namelist has been created
/// \param found       Indication that the namelist was found (passed back to calling function)
/// \param policy      Reaction to exceptions encountered during namelist reading
NamelistEmulator superposeInput(const std::string &input_text, bool *found,
                                ExceptionResponse policy = ExceptionResponse::DIE);

} // namespace namelist
} // namespace conformix

#endif
