#include "copyright.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "namelist_element.h"
#include "nml_superpose.h"

namespace conformix {
namespace namelist {

using constants::translateExceptionResponse;
using parse::strcmpCased;

//-------------------------------------------------------------------------------------------------
SuperposeControls::SuperposeControls(const ExceptionResponse policy_in) :
    policy{policy_in},
    target{translateSuperposeTarget(default_superpose_target)},
    maxcyc{default_superpose_maxcyc},
    rmsd_tol{default_superpose_rmsd_tol},
    degenerate_response{translateExceptionResponse(default_superpose_degenerate)},
    update_reference{false},
    nml_transcript{"superpose"}
{}

//-------------------------------------------------------------------------------------------------
SuperposeControls::SuperposeControls(const std::string &input_text, bool *found_nml,
                                     const ExceptionResponse policy_in) :
    SuperposeControls(policy_in)
{
  NamelistEmulator t_nml = superposeInput(input_text, found_nml, policy);
  nml_transcript = t_nml;

  // Each setter validates the user input
  setTarget(t_nml.getStringValue("target"));
  setMaximumCycles(t_nml.getIntValue("maxcyc"));
  setRmsdTolerance(t_nml.getRealValue("rmsd_tol"));
  setDegenerateWeightResponse(t_nml.getStringValue("degenerate_weights"));
  setReferenceUpdate(t_nml.getStringValue("update_reference"));
}

//-------------------------------------------------------------------------------------------------
SuperposeTarget SuperposeControls::getTarget() const {
  return target;
}

//-------------------------------------------------------------------------------------------------
int SuperposeControls::getMaximumCycles() const {
  return maxcyc;
}

//-------------------------------------------------------------------------------------------------
double SuperposeControls::getRmsdTolerance() const {
  return rmsd_tol;
}

//-------------------------------------------------------------------------------------------------
ExceptionResponse SuperposeControls::getDegenerateWeightResponse() const {
  return degenerate_response;
}

//-------------------------------------------------------------------------------------------------
bool SuperposeControls::getReferenceUpdate() const {
  return update_reference;
}

//-------------------------------------------------------------------------------------------------
const NamelistEmulator& SuperposeControls::getTranscript() const {
  return nml_transcript;
}

//-------------------------------------------------------------------------------------------------
void SuperposeControls::setTarget(const SuperposeTarget target_in) {
  target = target_in;
}

//-------------------------------------------------------------------------------------------------
void SuperposeControls::setTarget(const std::string &target_in) {
  if (strcmpCased(target_in, "reference", CaseSensitivity::NO) ||
      strcmpCased(target_in, "mean", CaseSensitivity::NO)) {
    target = translateSuperposeTarget(target_in);
  }
  else {
    badInputResponse("Invalid superposition target \"" + target_in + "\".  Valid choices "
                     "include reference and mean.", "setTarget", "The default target " +
                     std::string(default_superpose_target) + " will be restored.");
    target = translateSuperposeTarget(default_superpose_target);
  }
}

//-------------------------------------------------------------------------------------------------
void SuperposeControls::setMaximumCycles(const int maxcyc_in) {
  if (maxcyc_in < 1) {
    badInputResponse("An invalid number of superposition cycles " + std::to_string(maxcyc_in) +
                     " was requested.", "setMaximumCycles", "The default of " +
                     std::to_string(default_superpose_maxcyc) + " will be restored.");
    maxcyc = default_superpose_maxcyc;
  }
  else {
    maxcyc = maxcyc_in;
  }
}

//-------------------------------------------------------------------------------------------------
void SuperposeControls::setRmsdTolerance(const double rmsd_tol_in) {
  if (rmsd_tol_in <= 0.0) {
    badInputResponse("A superposition convergence tolerance of " + std::to_string(rmsd_tol_in) +
                     " is invalid.", "setRmsdTolerance", "The default of " +
                     std::to_string(default_superpose_rmsd_tol) + " will be restored.");
    rmsd_tol = default_superpose_rmsd_tol;
  }
  else {
    rmsd_tol = rmsd_tol_in;
  }
}

//-------------------------------------------------------------------------------------------------
void SuperposeControls::setDegenerateWeightResponse(const ExceptionResponse response_in) {
  degenerate_response = response_in;
}

//-------------------------------------------------------------------------------------------------
void SuperposeControls::setDegenerateWeightResponse(const std::string &response_in) {
  if (strcmpCased(response_in, "die", CaseSensitivity::NO) ||
      strcmpCased(response_in, "warn", CaseSensitivity::NO) ||
      strcmpCased(response_in, "silent", CaseSensitivity::NO)) {
    degenerate_response = translateExceptionResponse(response_in);
  }
  else {
    badInputResponse("Invalid response to degenerate weights \"" + response_in + "\".  Valid "
                     "choices include die, warn, and silent.", "setDegenerateWeightResponse",
                     "The default response " + std::string(default_superpose_degenerate) +
                     " will be restored.");
    degenerate_response = translateExceptionResponse(default_superpose_degenerate);
  }
}

//-------------------------------------------------------------------------------------------------
void SuperposeControls::setReferenceUpdate(const bool update_in) {
  update_reference = update_in;
}

//-------------------------------------------------------------------------------------------------
void SuperposeControls::setReferenceUpdate(const std::string &update_in) {
  if (strcmpCased(update_in, "true", CaseSensitivity::NO) ||
      strcmpCased(update_in, "yes", CaseSensitivity::NO)) {
    update_reference = true;
  }
  else if (strcmpCased(update_in, "false", CaseSensitivity::NO) ||
           strcmpCased(update_in, "no", CaseSensitivity::NO)) {
    update_reference = false;
  }
  else {
    badInputResponse("Invalid reference update directive \"" + update_in + "\".",
                     "setReferenceUpdate", "The reference coordinates will not be updated.");
    update_reference = false;
  }
}

//-------------------------------------------------------------------------------------------------
void SuperposeControls::badInputResponse(const std::string &message, const char* caller,
                                         const std::string &remedy) const {
  switch (policy) {
  case ExceptionResponse::DIE:
    rtErr(message, "SuperposeControls", caller);
  case ExceptionResponse::WARN:
    rtWarn(message + "  " + remedy, "SuperposeControls", caller);
    break;
  case ExceptionResponse::SILENT:
    break;
  }
}

//-------------------------------------------------------------------------------------------------
SuperposeTarget translateSuperposeTarget(const std::string &input) {
  if (strcmpCased(input, "reference", CaseSensitivity::NO)) {
    return SuperposeTarget::REFERENCE;
  }
  else if (strcmpCased(input, "mean", CaseSensitivity::NO)) {
    return SuperposeTarget::MEAN;
  }
  else {
    rtErr("Invalid superposition target " + input + ".", "translateSuperposeTarget");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const SuperposeTarget input) {
  switch (input) {
  case SuperposeTarget::REFERENCE:
    return std::string("REFERENCE");
  case SuperposeTarget::MEAN:
    return std::string("MEAN");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
NamelistEmulator superposeInput(const std::string &input_text, bool *found,
                                const ExceptionResponse policy) {
  NamelistEmulator t_nml("superpose", CaseSensitivity::AUTOMATIC, policy, "Namelist containing "
                         "parameters for the superposition of an ensemble's coordinate sets.");
  t_nml.addKeyword(NamelistElement("target", NamelistType::STRING, default_superpose_target));
  t_nml.addKeyword(NamelistElement("maxcyc", NamelistType::INTEGER,
                                   std::to_string(default_superpose_maxcyc)));
  t_nml.addKeyword(NamelistElement("rmsd_tol", NamelistType::REAL,
                                   std::to_string(default_superpose_rmsd_tol)));
  t_nml.addKeyword(NamelistElement("degenerate_weights", NamelistType::STRING,
                                   default_superpose_degenerate));
  t_nml.addKeyword(NamelistElement("update_reference", NamelistType::STRING,
                                   default_superpose_update_ref));
  t_nml.addHelp("target", "Target of the superposition: \"reference\" fits every coordinate set "
                "onto the ensemble's reference coordinates once, \"mean\" follows the first fit "
                "with repeated fits onto the weighted mean of all coordinate sets.");
  t_nml.addHelp("maxcyc", "Maximum number of cycles of fitting onto the mean structure.");
  t_nml.addHelp("rmsd_tol", "Convergence criterion for fitting onto the mean structure: the "
                "iterations stop once the mean moves by less than this RMSD, in units of the "
                "coordinates, between cycles.");
  t_nml.addHelp("degenerate_weights", "Response to a coordinate set with zero total weight, "
                "which cannot be fitted: \"die\" aborts the superposition before any set is "
                "modified, \"warn\" and \"silent\" leave such sets where they are.");
  t_nml.addHelp("update_reference", "Flag to have the final mean structure of an iterative "
                "superposition replace the ensemble's reference coordinates (true or false).");

  // Search the input text and read the namelist if it can be found
  readNamelist(input_text, &t_nml, found);
  return t_nml;
}

} // namespace namelist
} // namespace conformix
