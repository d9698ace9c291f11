// -*-c++-*-
#include "copyright.h"

namespace conformix {
namespace trajectory {

//-------------------------------------------------------------------------------------------------
template <typename T> void CoordinateFrame::fill(const T* xcrd, const T* ycrd, const T* zcrd) {
  for (int i = 0; i < atom_count; i++) {
    x_coordinates[i] = xcrd[i];
    y_coordinates[i] = ycrd[i];
    z_coordinates[i] = zcrd[i];
  }
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void CoordinateFrame::fill(const std::vector<T> &xcrd, const std::vector<T> &ycrd,
                           const std::vector<T> &zcrd) {
  if (static_cast<int>(xcrd.size()) != atom_count ||
      static_cast<int>(ycrd.size()) != atom_count ||
      static_cast<int>(zcrd.size()) != atom_count) {
    rtErr(errors::ErrorKind::SHAPE_MISMATCH, "Coordinate arrays of lengths " +
          std::to_string(xcrd.size()) + ", " + std::to_string(ycrd.size()) + ", and " +
          std::to_string(zcrd.size()) + " cannot fill a frame of " + std::to_string(atom_count) +
          " atoms.", "CoordinateFrame", "fill");
  }
  fill(xcrd.data(), ycrd.data(), zcrd.data());
}

} // namespace trajectory
} // namespace conformix
