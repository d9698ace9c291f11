// -*-c++-*-
#ifndef CONFORMIX_COORDINATE_FRAME_H
#define CONFORMIX_COORDINATE_FRAME_H

#include <string>
#include <vector>
#include "copyright.h"
#include "Constants/behavior.h"
#include "DataTypes/conformix_vector_types.h"
#include "Reporting/error_format.h"

namespace conformix {
namespace trajectory {

using constants::CartesianDimension;

/// \brief Collect C-style pointers for the elements of a writable CoordinateFrame object.
struct CoordinateFrameWriter {

  /// \brief The constructor feeds all arguments straight to the inline initialization list.
  CoordinateFrameWriter(int natom_in, double* xcrd_in, double* ycrd_in, double* zcrd_in);

  /// \brief Copy and move constructors.  The move assignment operator is implicitly deleted.
  /// \{
  CoordinateFrameWriter(const CoordinateFrameWriter &original) = default;
  CoordinateFrameWriter(CoordinateFrameWriter &&original) = default;
  /// \}

  const int natom;  ///< The number of atoms in the system
  double* xcrd;     ///< Cartesian X coordinates of all atoms
  double* ycrd;     ///< Cartesian Y coordinates of all atoms
  double* zcrd;     ///< Cartesian Z coordinates of all atoms
};

/// \brief Collect C-style pointers for the elements of a read-only CoordinateFrame object.
struct CoordinateFrameReader {

  /// \brief The constructor feeds all arguments straight to the inline initialization list.
  ///
  /// Overloaded:
  ///   - Take all arguments piecemeal
  ///   - Take a CoordinateFrameWriter
  /// \{
  CoordinateFrameReader(int natom_in, const double* xcrd_in, const double* ycrd_in,
                        const double* zcrd_in);
  CoordinateFrameReader(const CoordinateFrameWriter &cfw);
  /// \}

  /// \brief Copy and move constructors.  The move assignment operator is implicitly deleted.
  /// \{
  CoordinateFrameReader(const CoordinateFrameReader &original) = default;
  CoordinateFrameReader(CoordinateFrameReader &&original) = default;
  /// \}

  const int natom;      ///< The number of atoms in the system
  const double* xcrd;   ///< Cartesian X coordinates of all atoms
  const double* ycrd;   ///< Cartesian Y coordinates of all atoms
  const double* zcrd;   ///< Cartesian Z coordinates of all atoms
};

/// \brief Store the Cartesian coordinates of one set of atoms, one conformation of a system.
///        Coordinates are held in three separate arrays, X, Y, and Z, but can be exchanged with
///        other code in the interlaced (natom, 3) format, row-major: x0 y0 z0 x1 y1 z1 ...
class CoordinateFrame {
public:

  /// \brief There are several options for construction of this coordinate-only object.
  ///
  /// Overloaded:
  ///   - Allocate to hold a given number of atoms, all at the origin
  ///   - From an atom count and a set of double-precision C-style arrays
  ///   - From an interlaced array of (natom, 3) coordinates
  ///
  /// \param natom_in  The number of atoms expected
  /// \param xcrd_in   Cartesian X coordinates of all particles
  /// \param ycrd_in   Cartesian Y coordinates of all particles
  /// \param zcrd_in   Cartesian Z coordinates of all particles
  /// \param xyz_in    Interlaced Cartesian coordinates of all particles
  /// \{
  explicit CoordinateFrame(int natom_in = 0);
  CoordinateFrame(int natom_in, const double* xcrd_in, const double* ycrd_in,
                  const double* zcrd_in);
  explicit CoordinateFrame(const std::vector<double> &xyz_in);
  /// \}

  /// \brief With no pointers to repair, the default copy and move constructors and assignment
  ///        operators apply.
  /// \{
  CoordinateFrame(const CoordinateFrame &original) = default;
  CoordinateFrame(CoordinateFrame &&original) = default;
  CoordinateFrame& operator=(const CoordinateFrame &other) = default;
  CoordinateFrame& operator=(CoordinateFrame &&other) = default;
  /// \}

  /// \brief Fill the object from information in three arrays.  The number of atoms does not
  ///        change.
  ///
  /// Overloaded:
  ///   - Fill from three C-style arrays of trusted length
  ///   - Fill from three Standard Template Library vector objects
  ///
  /// \param xcrd  Cartesian X coordinates of all particles
  /// \param ycrd  Cartesian Y coordinates of all particles
  /// \param zcrd  Cartesian Z coordinates of all particles
  /// \{
  template <typename T> void fill(const T* xcrd, const T* ycrd, const T* zcrd);

  template <typename T>
  void fill(const std::vector<T> &xcrd, const std::vector<T> &ycrd, const std::vector<T> &zcrd);
  /// \}

  /// \brief Get the number of atoms in the frame
  int getAtomCount() const;

  /// \brief Get the coordinates returned in an X/Y/Z interlaced manner
  ///
  /// Overloaded:
  ///   - Get all coordinates
  ///   - Get coordinates for a range of atoms
  ///
  /// \param low_index   The lower atom index of a range
  /// \param high_index  The upper atom index of a range
  /// \{
  std::vector<double> getInterlacedCoordinates() const;
  std::vector<double> getInterlacedCoordinates(int low_index, int high_index) const;
  /// \}

  /// \brief Get the coordinates of one atom.
  ///
  /// \param atom_index  Index of the atom of interest
  double3 getAtomLocation(int atom_index) const;

  /// \brief Get one Cartesian dimension of all coordinates.
  ///
  /// \param dim  The Cartesian dimension of interest
  const std::vector<double>& getCartesianCoordinates(CartesianDimension dim) const;

  /// \brief Set the coordinates from an interlaced array of (natom, 3) values.  The length of
  ///        the array must match the existing atom count.
  ///
  /// \param xyz_in  The new coordinates
  void setInterlacedCoordinates(const std::vector<double> &xyz_in);

  /// \brief Get the abstract for this object, containing C-style pointers for the most rapid
  ///        access to any of its member variables.
  ///
  /// Overloaded:
  ///   - Get a read-only abstract from a const object
  ///   - Get a writeable abstract from a mutable object
  /// \{
  const CoordinateFrameReader data() const;
  CoordinateFrameWriter data();
  /// \}

private:
  int atom_count;                     ///< The number of atoms in the system
  std::vector<double> x_coordinates;  ///< Cartesian X coordinates of all particles
  std::vector<double> y_coordinates;  ///< Cartesian Y coordinates of all particles
  std::vector<double> z_coordinates;  ///< Cartesian Z coordinates of all particles

  /// \brief Check that an atom index lies within the frame.
  ///
  /// \param index   The atom index in question
  /// \param caller  Name of the calling member function
  void validateAtomIndex(int index, const char* caller) const;
};

/// \brief Check that an interlaced coordinate array describes whole atoms, and return the number
///        of atoms it holds.
///
/// \param xyz     The interlaced coordinates
/// \param caller  Name of the calling function
int interlacedAtomCount(const std::vector<double> &xyz, const char* caller = nullptr);

} // namespace trajectory
} // namespace conformix

#include "coordinateframe.tpp"

#endif
