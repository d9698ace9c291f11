#include "copyright.h"
#include "coordinateframe.h"

namespace conformix {
namespace trajectory {

using errors::ErrorKind;

//-------------------------------------------------------------------------------------------------
CoordinateFrameWriter::CoordinateFrameWriter(const int natom_in, double* xcrd_in, double* ycrd_in,
                                             double* zcrd_in) :
    natom{natom_in}, xcrd{xcrd_in}, ycrd{ycrd_in}, zcrd{zcrd_in}
{}

//-------------------------------------------------------------------------------------------------
CoordinateFrameReader::CoordinateFrameReader(const int natom_in, const double* xcrd_in,
                                             const double* ycrd_in, const double* zcrd_in) :
    natom{natom_in}, xcrd{xcrd_in}, ycrd{ycrd_in}, zcrd{zcrd_in}
{}

//-------------------------------------------------------------------------------------------------
CoordinateFrameReader::CoordinateFrameReader(const CoordinateFrameWriter &cfw) :
    natom{cfw.natom}, xcrd{cfw.xcrd}, ycrd{cfw.ycrd}, zcrd{cfw.zcrd}
{}

//-------------------------------------------------------------------------------------------------
CoordinateFrame::CoordinateFrame(const int natom_in) :
    atom_count{natom_in}, x_coordinates{}, y_coordinates{}, z_coordinates{}
{
  if (natom_in < 0) {
    rtErr("A frame cannot hold " + std::to_string(natom_in) + " atoms.", "CoordinateFrame");
  }
  x_coordinates.resize(atom_count, 0.0);
  y_coordinates.resize(atom_count, 0.0);
  z_coordinates.resize(atom_count, 0.0);
}

//-------------------------------------------------------------------------------------------------
CoordinateFrame::CoordinateFrame(const int natom_in, const double* xcrd_in, const double* ycrd_in,
                                 const double* zcrd_in) :
    CoordinateFrame(natom_in)
{
  fill(xcrd_in, ycrd_in, zcrd_in);
}

//-------------------------------------------------------------------------------------------------
CoordinateFrame::CoordinateFrame(const std::vector<double> &xyz_in) :
    CoordinateFrame(interlacedAtomCount(xyz_in, "CoordinateFrame"))
{
  setInterlacedCoordinates(xyz_in);
}

//-------------------------------------------------------------------------------------------------
int CoordinateFrame::getAtomCount() const {
  return atom_count;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> CoordinateFrame::getInterlacedCoordinates() const {
  return getInterlacedCoordinates(0, atom_count);
}

//-------------------------------------------------------------------------------------------------
std::vector<double> CoordinateFrame::getInterlacedCoordinates(const int low_index,
                                                              const int high_index) const {
  if (low_index < 0 || high_index > atom_count || low_index > high_index) {
    rtErr("Atom range " + std::to_string(low_index) + " to " + std::to_string(high_index) +
          " is invalid for a frame of " + std::to_string(atom_count) + " atoms.",
          "CoordinateFrame", "getInterlacedCoordinates");
  }
  std::vector<double> result(3 * (high_index - low_index));
  for (int i = low_index; i < high_index; i++) {
    const size_t ridx = 3 * (i - low_index);
    result[ridx    ] = x_coordinates[i];
    result[ridx + 1] = y_coordinates[i];
    result[ridx + 2] = z_coordinates[i];
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
double3 CoordinateFrame::getAtomLocation(const int atom_index) const {
  validateAtomIndex(atom_index, "getAtomLocation");
  return { x_coordinates[atom_index], y_coordinates[atom_index], z_coordinates[atom_index] };
}

//-------------------------------------------------------------------------------------------------
const std::vector<double>&
CoordinateFrame::getCartesianCoordinates(const CartesianDimension dim) const {
  switch (dim) {
  case CartesianDimension::X:
    return x_coordinates;
  case CartesianDimension::Y:
    return y_coordinates;
  case CartesianDimension::Z:
    return z_coordinates;
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
void CoordinateFrame::setInterlacedCoordinates(const std::vector<double> &xyz_in) {
  if (xyz_in.size() != 3LLU * static_cast<size_t>(atom_count)) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "An array of " + std::to_string(xyz_in.size()) +
          " values cannot set the coordinates of " + std::to_string(atom_count) + " atoms.",
          "CoordinateFrame", "setInterlacedCoordinates");
  }
  for (int i = 0; i < atom_count; i++) {
    x_coordinates[i] = xyz_in[(3 * i)    ];
    y_coordinates[i] = xyz_in[(3 * i) + 1];
    z_coordinates[i] = xyz_in[(3 * i) + 2];
  }
}

//-------------------------------------------------------------------------------------------------
const CoordinateFrameReader CoordinateFrame::data() const {
  return CoordinateFrameReader(atom_count, x_coordinates.data(), y_coordinates.data(),
                               z_coordinates.data());
}

//-------------------------------------------------------------------------------------------------
CoordinateFrameWriter CoordinateFrame::data() {
  return CoordinateFrameWriter(atom_count, x_coordinates.data(), y_coordinates.data(),
                               z_coordinates.data());
}

//-------------------------------------------------------------------------------------------------
void CoordinateFrame::validateAtomIndex(const int index, const char* caller) const {
  if (index < 0 || index >= atom_count) {
    rtErr("Atom index " + std::to_string(index) + " is invalid for a frame of " +
          std::to_string(atom_count) + " atoms.", "CoordinateFrame", caller);
  }
}

//-------------------------------------------------------------------------------------------------
int interlacedAtomCount(const std::vector<double> &xyz, const char* caller) {
  if (xyz.size() % 3LLU != 0LLU) {
    rtErr(ErrorKind::SHAPE_MISMATCH, "An interlaced coordinate array must hold three values per "
          "atom (" + std::to_string(xyz.size()) + " values found).", caller);
  }
  return xyz.size() / 3LLU;
}

} // namespace trajectory
} // namespace conformix
