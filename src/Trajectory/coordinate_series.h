// -*-c++-*-
#ifndef CONFORMIX_COORDINATE_SERIES_H
#define CONFORMIX_COORDINATE_SERIES_H

#include <string>
#include <vector>
#include "copyright.h"
#include "DataTypes/common_types.h"
#include "Reporting/error_format.h"
#include "coordinate_provider.h"
#include "coordinateframe.h"

namespace conformix {
namespace trajectory {

using data_types::getConformixScalarTypeName;
using data_types::isFloatingPointScalarType;

/// \brief Collect C-style pointers and critical constants for a writeable CoordinateSeries.
template <typename T> struct CoordinateSeriesWriter {

  /// \brief The constructor feeds all arguments straight to the inline initialization list.
  CoordinateSeriesWriter(int natom_in, int nframe_in, T* xcrd_in, T* ycrd_in, T* zcrd_in);

  /// \brief Copy and move constructors.  The move assignment operator is implicitly deleted.
  /// \{
  CoordinateSeriesWriter(const CoordinateSeriesWriter &original) = default;
  CoordinateSeriesWriter(CoordinateSeriesWriter &&original) = default;
  /// \}

  const int natom;   ///< The number of atoms in each frame
  const int nframe;  ///< The number of frames in the series
  T* xcrd;           ///< Cartesian X coordinates of all atoms in all frames, frame after frame
  T* ycrd;           ///< Cartesian Y coordinates of all atoms in all frames, frame after frame
  T* zcrd;           ///< Cartesian Z coordinates of all atoms in all frames, frame after frame
};

/// \brief Collect C-style pointers and critical constants for a read-only CoordinateSeries.
template <typename T> struct CoordinateSeriesReader {

  /// \brief The constructor feeds all arguments straight to the inline initialization list.
  ///
  /// Overloaded:
  ///   - Take all arguments piecemeal
  ///   - Take a writeable abstract of the same object
  /// \{
  CoordinateSeriesReader(int natom_in, int nframe_in, const T* xcrd_in, const T* ycrd_in,
                         const T* zcrd_in);
  CoordinateSeriesReader(const CoordinateSeriesWriter<T> &csw);
  /// \}

  /// \brief Copy and move constructors.  The move assignment operator is implicitly deleted.
  /// \{
  CoordinateSeriesReader(const CoordinateSeriesReader &original) = default;
  CoordinateSeriesReader(CoordinateSeriesReader &&original) = default;
  /// \}

  const int natom;   ///< The number of atoms in each frame
  const int nframe;  ///< The number of frames in the series
  const T* xcrd;     ///< Cartesian X coordinates of all atoms in all frames, frame after frame
  const T* ycrd;     ///< Cartesian Y coordinates of all atoms in all frames, frame after frame
  const T* zcrd;     ///< Cartesian Z coordinates of all atoms in all frames, frame after frame
};

/// \brief Store a series of coordinate sets for one system, as might be read from a trajectory.
///        The series is templated on the storage type of its coordinates and always presents
///        them to the rest of the program in double precision.  One frame is designated active,
///        and serves as the system's current coordinates.
template <typename T> class CoordinateSeries : public CoordinateProvider {
public:

  /// \brief The constructor can allocate an empty series or replicate one frame.
  ///
  /// Overloaded:
  ///   - Allocate a series with a given number of atoms and frames, all coordinates zero
  ///   - Replicate a single frame a number of times
  ///
  /// \param natom_in   The number of atoms in each frame
  /// \param nframe_in  The number of frames to allocate or replicate
  /// \param cf         The frame to replicate
  /// \param title_in   Title of the system
  /// \{
  explicit CoordinateSeries(int natom_in = 0, int nframe_in = 0,
                            const std::string &title_in = std::string(""));
  CoordinateSeries(const CoordinateFrame &cf, int nframe_in,
                   const std::string &title_in = std::string(""));
  /// \}

  /// \brief With no pointers to repair, the default copy and move constructors and assignment
  ///        operators apply.
  /// \{
  CoordinateSeries(const CoordinateSeries &original) = default;
  CoordinateSeries(CoordinateSeries &&original) = default;
  CoordinateSeries& operator=(const CoordinateSeries &other) = default;
  CoordinateSeries& operator=(CoordinateSeries &&other) = default;
  /// \}

  /// \brief Get the number of atoms in each frame.
  int getAtomCount() const override;

  /// \brief Get the number of frames in the series.
  int getFrameCount() const;

  /// \brief Get the index of the active frame.
  int getActiveFrame() const;

  /// \brief Get the coordinates of the active frame.
  CoordinateFrame getCoordinates() const override;

  /// \brief Get the number of coordinate sets (frames) in the series.
  int getCoordinateSetCount() const override;

  /// \brief Get one frame of the series as a double-precision coordinate set.
  ///
  /// \param index  The frame of interest
  CoordinateFrame getCoordinateSet(int index) const override;

  /// \brief Get the title of the series.
  std::string getTitle() const override;

  /// \brief Get the interlaced coordinates of one frame.
  ///
  /// \param frame_index  The frame of interest
  std::vector<double> getInterlacedCoordinates(int frame_index) const;

  /// \brief Import coordinates from a CoordinateFrame into the series.
  ///
  /// Overloaded:
  ///   - Import from a read-only frame abstract
  ///   - Import from a CoordinateFrame object
  ///
  /// \param cfr          Abstract of the frame to import
  /// \param cf           The frame to import
  /// \param frame_index  Index of the frame to overwrite.  A value of -1 appends a new frame.
  /// \{
  void import(const CoordinateFrameReader &cfr, int frame_index = -1);
  void import(const CoordinateFrame &cf, int frame_index = -1);
  /// \}

  /// \brief Designate a frame as the active one.
  ///
  /// \param frame_index  The frame to make active
  void setActiveFrame(int frame_index);

  /// \brief Set the title of the series.
  ///
  /// \param title_in  The new title
  void setTitle(const std::string &title_in);

  /// \brief Get the abstract for this object, containing C-style pointers for the most rapid
  ///        access to any of its member variables.
  ///
  /// Overloaded:
  ///   - Get a read-only abstract from a const object
  ///   - Get a writeable abstract from a mutable object
  /// \{
  const CoordinateSeriesReader<T> data() const;
  CoordinateSeriesWriter<T> data();
  /// \}

private:
  std::string title;              ///< Title of the system
  int atom_count;                 ///< Number of atoms in each frame
  int frame_count;                ///< Number of frames in the series
  int active_frame;               ///< Index of the frame serving as the current coordinates
  std::vector<T> x_coordinates;   ///< Cartesian X coordinates of all frames, frame after frame
  std::vector<T> y_coordinates;   ///< Cartesian Y coordinates of all frames, frame after frame
  std::vector<T> z_coordinates;   ///< Cartesian Z coordinates of all frames, frame after frame

  /// \brief Check that a frame index lies within the series.
  ///
  /// \param frame_index  The frame index in question
  /// \param caller       Name of the calling member function
  void validateFrameIndex(int frame_index, const char* caller) const;
};

} // namespace trajectory
} // namespace conformix

#include "coordinate_series.tpp"

#endif
