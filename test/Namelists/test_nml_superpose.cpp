#include <cmath>
#include <string>
#include <vector>
#include "copyright.h"
#include "../../src/Constants/behavior.h"
#include "../../src/Ensemble/ensemble.h"
#include "../../src/Ensemble/ensemble_analysis.h"
#include "../../src/Namelists/input.h"
#include "../../src/Namelists/namelist_element.h"
#include "../../src/Namelists/namelist_emulator.h"
#include "../../src/Namelists/namelist_enumerators.h"
#include "../../src/Namelists/nml_superpose.h"
#include "../../src/Random/random.h"
#include "../../src/Reporting/error_format.h"
#include "../../src/UnitTesting/approx.h"
#include "../../src/UnitTesting/unit_test.h"

using conformix::constants::CaseSensitivity;
using conformix::constants::ExceptionResponse;
using conformix::ensemble::Ensemble;
using conformix::ensemble::superposeEnsemble;
using conformix::errors::ErrorKind;
using conformix::random::Xoroshiro128pGenerator;
using conformix::random::uniformRand;
using namespace conformix::namelist;
using namespace conformix::testing;

//-------------------------------------------------------------------------------------------------
int main(const int argc, const char* argv[]) {

  // Some baseline initialization
  TestEnvironment oe(argc, argv);
  Xoroshiro128pGenerator xrs(oe.getRandomSeed());

  // Section 1
  section("Namelist emulation and extraction from input text");

  // Section 2
  section("Superposition controls from user input");

  // Section 3
  section("Responses to bad input");

  // Section 4
  section("Superposition directed by user input");

  // Basic namelist emulator behavior
  section(1);
  NamelistEmulator t_nml("testing", CaseSensitivity::AUTOMATIC, ExceptionResponse::DIE,
                         "A namelist for testing");
  t_nml.addKeyword(NamelistElement("ncycle", NamelistType::INTEGER, "4"));
  t_nml.addKeyword({ NamelistElement("cutoff", NamelistType::REAL, "8.0"),
                     NamelistElement("style", NamelistType::STRING, "linear") });
  t_nml.addHelp("cutoff", "Cutoff distance");
  check(t_nml.getKeywordCount(), RelationalOperator::EQUAL, 3, "The namelist does not hold the "
        "expected number of keywords.");
  check(t_nml.hasKeyword("CUTOFF"), "Keyword lookup is not case-insensitive.");
  check(t_nml.hasKeyword("missing") == false, "A keyword that was never added was found.");
  check(t_nml.getHelp("cutoff"), RelationalOperator::EQUAL, std::string("Cutoff distance"),
        "Help text for a keyword was not recorded.");
  check(t_nml.getHelp(), RelationalOperator::EQUAL, std::string("A namelist for testing"),
        "Help text for the namelist was not recorded.");
  check(t_nml.getIntValue("ncycle"), RelationalOperator::EQUAL, 4, "The default value of an "
        "integer keyword is incorrect.");
  check(t_nml.getRealValue("cutoff"), RelationalOperator::EQUAL, 8.0, "The default value of a "
        "real-valued keyword is incorrect.");
  check(getEnumerationName(t_nml.getKeywordStatus("style")), RelationalOperator::EQUAL,
        getEnumerationName(InputStatus::DEFAULT), "A keyword with no user input does not report "
        "its default status.");
  check(getEnumerationName(t_nml.getKeywordKind("Style")), RelationalOperator::EQUAL,
        getEnumerationName(NamelistType::STRING), "The type of a keyword was not reported "
        "correctly.");
  check(t_nml.getCaseSensitivity() == CaseSensitivity::AUTOMATIC, "The namelist does not "
        "report the case sensitivity it was created with.");
  CHECK_THROWS(t_nml.getKeywordKind("missing"), "A type was reported for a keyword that does "
               "not exist.");
  CHECK_THROWS(t_nml.addKeyword(NamelistElement("ncycle", NamelistType::REAL, "1.0")), "A "
               "duplicate keyword was added to a namelist.");
  CHECK_THROWS(t_nml.getRealValue("missing"), "A value was returned for a keyword that does not "
               "exist.");
  const std::string t_input("Some preamble text\n"
                            "&Testing\n"
                            "  ncycle = 12, cutoff = 1.5e1  # trailing comment\n"
                            "  style = quadratic,\n"
                            "/\n"
                            "&testing ncycle 99 /\n");
  const std::vector<std::string> t_words = pullNamelist(t_input, "testing");
  check(t_words, RelationalOperator::EQUAL,
        std::vector<std::string>({ "&Testing", "ncycle", "12", "cutoff", "1.5e1", "style",
                                   "quadratic", "/" }),
        "Words of a namelist were not extracted from the input as expected.");
  check(pullNamelist(t_input, "absent").size() == 0LLU, "Words were extracted for a namelist "
        "that is not present in the input.");
  bool t_found = false;
  readNamelist(t_input, &t_nml, &t_found);
  check(t_found, "A namelist present in the input was not found.");
  check(t_nml.getIntValue("ncycle"), RelationalOperator::EQUAL, 12, "An integer keyword was not "
        "read from the first instance of the namelist.");
  check(t_nml.getRealValue("cutoff"), RelationalOperator::EQUAL, 15.0, "A real-valued keyword "
        "given in scientific notation was not read correctly.");
  check(t_nml.getStringValue("style"), RelationalOperator::EQUAL, std::string("quadratic"),
        "A string keyword was not read correctly.");
  check(getEnumerationName(t_nml.getKeywordStatus("style")), RelationalOperator::EQUAL,
        getEnumerationName(InputStatus::USER_SPECIFIED), "A keyword read from input does not "
        "report that the user specified it.");
  CHECK_THROWS(readNamelist("&testing ncycle 1.5 /", &t_nml), "A real number was accepted for "
               "an integer keyword.");
  CHECK_THROWS(readNamelist("&testing cutoff short /", &t_nml), "Text was accepted for a "
               "real-valued keyword.");
  CHECK_THROWS(readNamelist("&testing bogus 3 /", &t_nml), "An unknown keyword was accepted.");
  CHECK_THROWS(readNamelist("&testing ncycle 3 style /", &t_nml), "A keyword with no value was "
               "accepted.");

  // Default controls, and controls read from input lacking the namelist
  section(2);
  const SuperposeControls spcon_def;
  check(spcon_def.getTarget() == SuperposeTarget::REFERENCE, "The default superposition target "
        "is not the reference structure.");
  check(spcon_def.getMaximumCycles(), RelationalOperator::EQUAL, default_superpose_maxcyc,
        "The default number of superposition cycles is incorrect.");
  check(spcon_def.getRmsdTolerance(), RelationalOperator::EQUAL, default_superpose_rmsd_tol,
        "The default superposition tolerance is incorrect.");
  check(spcon_def.getDegenerateWeightResponse() == ExceptionResponse::DIE, "The default response "
        "to degenerate weights is incorrect.");
  check(spcon_def.getReferenceUpdate() == false, "By default, the reference is updated.");
  bool sp_found = true;
  const SuperposeControls spcon_none("&other key value /", &sp_found);
  check(sp_found == false, "A &superpose namelist was reported in input that lacks one.");
  check(spcon_none.getMaximumCycles(), RelationalOperator::EQUAL, default_superpose_maxcyc,
        "Controls read from input lacking the namelist do not hold default values.");
  const std::string sp_input("&SUPERPOSE target mean, maxcyc 5, rmsd_tol 1.0e-6,\n"
                             "  degenerate_weights warn, update_reference true &end\n");
  const SuperposeControls spcon(sp_input, &sp_found);
  check(sp_found, "A &superpose namelist in the input was not found.");
  check(spcon.getTarget() == SuperposeTarget::MEAN, "The superposition target was not read "
        "from input.");
  check(getEnumerationName(spcon.getTarget()), RelationalOperator::EQUAL, std::string("MEAN"),
        "The name of the superposition target is incorrect.");
  check(spcon.getMaximumCycles(), RelationalOperator::EQUAL, 5, "The number of superposition "
        "cycles was not read from input.");
  check(spcon.getRmsdTolerance(), RelationalOperator::EQUAL, Approx(1.0e-6).margin(1.0e-15),
        "The superposition tolerance was not read from input.");
  check(spcon.getDegenerateWeightResponse() == ExceptionResponse::WARN, "The response to "
        "degenerate weights was not read from input.");
  check(spcon.getReferenceUpdate(), "The reference update directive was not read from input.");
  check(getEnumerationName(spcon.getTranscript().getKeywordStatus("maxcyc")),
        RelationalOperator::EQUAL, getEnumerationName(InputStatus::USER_SPECIFIED),
        "The transcript of user input does not record a keyword the user specified.");
  const NamelistEmulator sp_nml = superposeInput("&superpose maxcyc 3 /", &sp_found);
  check(getEnumerationName(sp_nml.getKeywordStatus("target")), RelationalOperator::EQUAL,
        getEnumerationName(InputStatus::DEFAULT), "A keyword absent from the user input does not "
        "report its default status.");
  check(sp_nml.getHelp("rmsd_tol").size() > 0LLU, "No help was provided for a keyword of the "
        "&superpose namelist.");
  SuperposeControls spcon_set;
  spcon_set.setTarget("Mean");
  spcon_set.setDegenerateWeightResponse("SILENT");
  spcon_set.setReferenceUpdate("yes");
  check(spcon_set.getTarget() == SuperposeTarget::MEAN && spcon_set.getReferenceUpdate() &&
        spcon_set.getDegenerateWeightResponse() == ExceptionResponse::SILENT, "Controls were not "
        "set from strings in mixed case.");
  check(translateSuperposeTarget("REFERENCE") == SuperposeTarget::REFERENCE, "A superposition "
        "target name was not translated.");
  CHECK_THROWS(translateSuperposeTarget("centroid"), "An invalid superposition target name was "
               "translated.");

  // Bad input is fatal under the default policy and is otherwise replaced by default values
  section(3);
  CHECK_THROWS(SuperposeControls("&superpose maxcyc 0 /", &sp_found), "A superposition with "
               "zero cycles was accepted.");
  CHECK_THROWS(SuperposeControls("&superpose rmsd_tol -0.5 /", &sp_found), "A negative "
               "superposition tolerance was accepted.");
  CHECK_THROWS(SuperposeControls("&superpose target median /", &sp_found), "An invalid "
               "superposition target was accepted.");
  CHECK_THROWS(SuperposeControls("&superpose degenerate_weights ignore /", &sp_found), "An "
               "invalid response to degenerate weights was accepted.");
  CHECK_THROWS(SuperposeControls("&superpose update_reference maybe /", &sp_found), "An invalid "
               "reference update directive was accepted.");
  CHECK_THROWS(SuperposeControls("&superpose maxcyc five /", &sp_found), "A word was accepted "
               "for the number of superposition cycles.");
  CHECK_THROWS(SuperposeControls("&superpose cycles 5 /", &sp_found), "An unknown keyword was "
               "accepted in the &superpose namelist.");
  const SuperposeControls spcon_bad("&superpose maxcyc -2, rmsd_tol 0.0, target median,\n"
                                    "  degenerate_weights ignore, update_reference maybe /",
                                    &sp_found, ExceptionResponse::SILENT);
  check(spcon_bad.getMaximumCycles(), RelationalOperator::EQUAL, default_superpose_maxcyc,
        "An invalid number of cycles was not replaced by the default.");
  check(spcon_bad.getRmsdTolerance(), RelationalOperator::EQUAL, default_superpose_rmsd_tol,
        "An invalid tolerance was not replaced by the default.");
  check(spcon_bad.getTarget() == SuperposeTarget::REFERENCE, "An invalid target was not "
        "replaced by the default.");
  check(spcon_bad.getDegenerateWeightResponse() == ExceptionResponse::DIE, "An invalid response "
        "to degenerate weights was not replaced by the default.");
  check(spcon_bad.getReferenceUpdate() == false, "An invalid reference update directive was "
        "not replaced by the default.");
  const SuperposeControls spcon_unk("&superpose cycles 7, maxcyc 6 /", &sp_found,
                                    ExceptionResponse::SILENT);
  check(spcon_unk.getMaximumCycles(), RelationalOperator::EQUAL, 6, "A valid keyword following "
        "an unknown one was not read.");

  // Superposition as directed by the controls
  section(4);
  const int natom = 12;
  const std::vector<double> base_xyz = uniformRand(&xrs, 3 * natom, 8.0);
  Ensemble ens("directed");
  ens.addCoordinateSet(base_xyz);
  for (int i = 1; i < 5; i++) {
    std::vector<double> moved_xyz(3 * natom);
    for (int j = 0; j < natom; j++) {
      moved_xyz[(3 * j)    ] = base_xyz[(3 * j) + 1] + static_cast<double>(i);
      moved_xyz[(3 * j) + 1] = -base_xyz[3 * j];
      moved_xyz[(3 * j) + 2] = base_xyz[(3 * j) + 2] - static_cast<double>(2 * i);
    }
    ens.addCoordinateSet(moved_xyz);
  }
  Ensemble ens_ref = ens;
  check(superposeEnsemble(&ens_ref, SuperposeControls()), RelationalOperator::EQUAL, 1,
        "Superposition onto the reference reported more than one pass.");
  check(ens_ref.getRMSDs(), RelationalOperator::EQUAL,
        Approx(std::vector<double>(5, 0.0), ComparisonType::ABSOLUTE, 1.0e-8), "Superposition "
        "directed by default controls did not fit the coordinate sets onto the reference.");
  Ensemble ens_mean = ens;
  const int ncyc = superposeEnsemble(&ens_mean, spcon);
  check(ncyc >= 1 && ncyc <= spcon.getMaximumCycles(), "Iterative superposition directed by "
        "user input ran " + std::to_string(ncyc) + " cycles.");
  check(ens_mean.getRMSDs(), RelationalOperator::EQUAL,
        Approx(std::vector<double>(5, 0.0), ComparisonType::ABSOLUTE, 1.0e-6), "Iterative "
        "superposition directed by user input did not converge for rigid copies.");
  Ensemble ens_degen = ens;
  ens_degen.setWeights(0.0);
  CHECK_THROWS_KIND(superposeEnsemble(&ens_degen, SuperposeControls()),
                    ErrorKind::DEGENERATE_WEIGHTS, "Superposition with zero weights proceeded "
                    "under default controls.");
  SuperposeControls spcon_quiet;
  spcon_quiet.setDegenerateWeightResponse(ExceptionResponse::SILENT);
  const std::vector<double> degen_xyz = ens_degen.getCoordinateSets();
  superposeEnsemble(&ens_degen, spcon_quiet);
  check(ens_degen.getCoordinateSets(), RelationalOperator::EQUAL, degen_xyz, "Coordinate sets "
        "with zero weight were moved when the controls allowed the superposition to proceed.");

  // Print results
  printTestSummary(oe.getVerbosity());
  return countGlobalTestFailures();
}
