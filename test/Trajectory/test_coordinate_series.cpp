#include <vector>
#include "copyright.h"
#include "../../src/Constants/behavior.h"
#include "../../src/DataTypes/conformix_vector_types.h"
#include "../../src/Random/random.h"
#include "../../src/Reporting/error_format.h"
#include "../../src/Trajectory/coordinate_provider.h"
#include "../../src/Trajectory/coordinate_series.h"
#include "../../src/Trajectory/coordinateframe.h"
#include "../../src/UnitTesting/approx.h"
#include "../../src/UnitTesting/unit_test.h"

using conformix::double3;
using conformix::constants::CartesianDimension;
using conformix::errors::ErrorKind;
using conformix::random::Xoroshiro128pGenerator;
using conformix::random::uniformRand;
using namespace conformix::trajectory;
using namespace conformix::testing;

//-------------------------------------------------------------------------------------------------
// main
//-------------------------------------------------------------------------------------------------
int main(const int argc, const char* argv[]) {

  // Some baseline initialization
  TestEnvironment oe(argc, argv);
  Xoroshiro128pGenerator xrs(oe.getRandomSeed());

  // Section 1
  section("Single coordinate frames");

  // Section 2
  section("Series of coordinate frames");

  // Frames hold coordinates in separate Cartesian arrays but accept and present them interlaced
  section(1);
  const int natom = 7;
  const std::vector<double> xyz = uniformRand(&xrs, 3 * natom, 10.0);
  CoordinateFrame cf(xyz);
  check(cf.getAtomCount(), RelationalOperator::EQUAL, natom, "A frame built from interlaced "
        "coordinates holds the wrong number of atoms.");
  check(cf.getInterlacedCoordinates(), RelationalOperator::EQUAL, xyz, "Interlaced coordinates "
        "did not survive storage in a frame.");
  std::vector<double> y_only(natom);
  for (int i = 0; i < natom; i++) {
    y_only[i] = xyz[(3 * i) + 1];
  }
  check(cf.getCartesianCoordinates(CartesianDimension::Y), RelationalOperator::EQUAL, y_only,
        "Cartesian Y coordinates were not separated from the interlaced input.");
  const double3 loc = cf.getAtomLocation(4);
  check(std::vector<double>({ loc.x, loc.y, loc.z }), RelationalOperator::EQUAL,
        std::vector<double>(xyz.begin() + 12, xyz.begin() + 15), "The location of a single atom "
        "is incorrect.");
  check(cf.getInterlacedCoordinates(2, 4), RelationalOperator::EQUAL,
        std::vector<double>(xyz.begin() + 6, xyz.begin() + 12), "A subset of interlaced "
        "coordinates is incorrect.");
  CHECK_THROWS(cf.getAtomLocation(natom), "The location of an atom beyond the end of the frame "
               "was returned.");
  CHECK_THROWS(cf.getInterlacedCoordinates(3, 9), "An invalid range of atoms was returned.");
  CHECK_THROWS_KIND(CoordinateFrame(std::vector<double>(10, 0.0)), ErrorKind::SHAPE_MISMATCH,
                    "A frame was built from coordinates not divisible into three dimensions.");
  CHECK_THROWS_KIND(cf.setInterlacedCoordinates(std::vector<double>(3 * (natom - 1), 0.0)),
                    ErrorKind::SHAPE_MISMATCH, "A frame accepted coordinates for the wrong number "
                    "of atoms.");
  CHECK_THROWS(CoordinateFrame(-3), "A frame with a negative number of atoms was created.");
  const std::vector<double> xyz_b = uniformRand(&xrs, 3 * natom, 10.0);
  CoordinateFrame cf_b(natom);
  cf_b.setInterlacedCoordinates(xyz_b);
  CoordinateFrameWriter cfw = cf_b.data();
  cfw.zcrd[0] = -1.5;
  check(cf_b.getAtomLocation(0).z, RelationalOperator::EQUAL, -1.5, "Changes made through a "
        "frame's writeable abstract were not reflected in the frame.");
  check(interlacedAtomCount(xyz_b), RelationalOperator::EQUAL, natom, "The number of atoms in "
        "an interlaced coordinate array is incorrect.");

  // Series of frames present every frame in double precision through the provider interface
  section(2);
  CoordinateSeries<double> cs(cf, 3, "three frames");
  check(cs.getFrameCount(), RelationalOperator::EQUAL, 3, "A series replicating one frame holds "
        "the wrong number of frames.");
  cs.import(CoordinateFrame(xyz_b), 1);
  cs.import(cf_b);
  check(cs.getFrameCount(), RelationalOperator::EQUAL, 4, "Importing a frame did not extend the "
        "series.");
  check(cs.getInterlacedCoordinates(1), RelationalOperator::EQUAL, xyz_b, "A frame imported "
        "into an existing position of the series was not stored.");
  check(cs.getInterlacedCoordinates(3), RelationalOperator::EQUAL,
        cf_b.getInterlacedCoordinates(), "A frame appended to the series was not stored.");
  check(cs.getCoordinates().getInterlacedCoordinates(), RelationalOperator::EQUAL, xyz,
        "The first frame of a series is not its active frame by default.");
  cs.setActiveFrame(1);
  check(cs.getActiveFrame(), RelationalOperator::EQUAL, 1, "The active frame was not changed.");
  const CoordinateProvider &provider = cs;
  check(provider.getTitle(), RelationalOperator::EQUAL, std::string("three frames"), "A series "
        "does not present its title through the provider interface.");
  check(provider.getCoordinates().getInterlacedCoordinates(), RelationalOperator::EQUAL, xyz_b,
        "A series does not present its active frame through the provider interface.");
  std::vector<double> all_xyz = xyz;
  all_xyz.insert(all_xyz.end(), xyz_b.begin(), xyz_b.end());
  all_xyz.insert(all_xyz.end(), xyz.begin(), xyz.end());
  const std::vector<double> cf_b_xyz = cf_b.getInterlacedCoordinates();
  all_xyz.insert(all_xyz.end(), cf_b_xyz.begin(), cf_b_xyz.end());
  check(provider.getCoordinateSets(), RelationalOperator::EQUAL, all_xyz, "A series does not "
        "present all of its frames through the provider interface.");
  CHECK_THROWS_KIND(cs.import(CoordinateFrame(natom + 1)), ErrorKind::SHAPE_MISMATCH, "A frame "
                    "with the wrong number of atoms was imported.");
  CHECK_THROWS(cs.setActiveFrame(4), "A frame beyond the end of the series was made active.");
  CHECK_THROWS(cs.getCoordinateSet(-1), "A frame with a negative index was returned.");
  CHECK_THROWS(CoordinateSeries<int>(natom, 2), "A series of frames was created with integer "
               "coordinates.");
  CoordinateSeries<float> cs_f(cf, 2);
  check(cs_f.getInterlacedCoordinates(1), RelationalOperator::EQUAL,
        Approx(xyz, ComparisonType::ABSOLUTE, 1.0e-5), "Coordinates stored in single precision "
        "differ from the original frame by more than the precision allows.");
  const CoordinateSeries<double> empty_cs(natom, 0);
  check(empty_cs.getCoordinates().getAtomCount(), RelationalOperator::EQUAL, natom, "A series "
        "with no frames does not present an empty frame of the correct size.");

  // Print results
  printTestSummary(oe.getVerbosity());
  return countGlobalTestFailures();
}
