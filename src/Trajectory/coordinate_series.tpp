// -*-c++-*-
#include "copyright.h"

namespace conformix {
namespace trajectory {

//-------------------------------------------------------------------------------------------------
template <typename T>
CoordinateSeriesWriter<T>::CoordinateSeriesWriter(const int natom_in, const int nframe_in,
                                                  T* xcrd_in, T* ycrd_in, T* zcrd_in) :
    natom{natom_in}, nframe{nframe_in}, xcrd{xcrd_in}, ycrd{ycrd_in}, zcrd{zcrd_in}
{}

//-------------------------------------------------------------------------------------------------
template <typename T>
CoordinateSeriesReader<T>::CoordinateSeriesReader(const int natom_in, const int nframe_in,
                                                  const T* xcrd_in, const T* ycrd_in,
                                                  const T* zcrd_in) :
    natom{natom_in}, nframe{nframe_in}, xcrd{xcrd_in}, ycrd{ycrd_in}, zcrd{zcrd_in}
{}

//-------------------------------------------------------------------------------------------------
template <typename T>
CoordinateSeriesReader<T>::CoordinateSeriesReader(const CoordinateSeriesWriter<T> &csw) :
    natom{csw.natom}, nframe{csw.nframe}, xcrd{csw.xcrd}, ycrd{csw.ycrd}, zcrd{csw.zcrd}
{}

//-------------------------------------------------------------------------------------------------
template <typename T>
CoordinateSeries<T>::CoordinateSeries(const int natom_in, const int nframe_in,
                                      const std::string &title_in) :
    title{title_in}, atom_count{natom_in}, frame_count{nframe_in}, active_frame{0},
    x_coordinates{}, y_coordinates{}, z_coordinates{}
{
  if (isFloatingPointScalarType<T>() == false) {
    rtErr("A coordinate series cannot store data in " + getConformixScalarTypeName<T>() +
          " format.", "CoordinateSeries");
  }
  if (natom_in < 0 || nframe_in < 0) {
    rtErr("A series of " + std::to_string(nframe_in) + " frames with " +
          std::to_string(natom_in) + " atoms each is invalid.", "CoordinateSeries");
  }
  const size_t total_atoms = static_cast<size_t>(atom_count) * static_cast<size_t>(frame_count);
  x_coordinates.resize(total_atoms, 0.0);
  y_coordinates.resize(total_atoms, 0.0);
  z_coordinates.resize(total_atoms, 0.0);
}

//-------------------------------------------------------------------------------------------------
template <typename T>
CoordinateSeries<T>::CoordinateSeries(const CoordinateFrame &cf, const int nframe_in,
                                      const std::string &title_in) :
    CoordinateSeries(cf.getAtomCount(), 0, title_in)
{
  for (int i = 0; i < nframe_in; i++) {
    import(cf);
  }
}

//-------------------------------------------------------------------------------------------------
template <typename T> int CoordinateSeries<T>::getAtomCount() const {
  return atom_count;
}

//-------------------------------------------------------------------------------------------------
template <typename T> int CoordinateSeries<T>::getFrameCount() const {
  return frame_count;
}

//-------------------------------------------------------------------------------------------------
template <typename T> int CoordinateSeries<T>::getActiveFrame() const {
  return active_frame;
}

//-------------------------------------------------------------------------------------------------
template <typename T> CoordinateFrame CoordinateSeries<T>::getCoordinates() const {
  if (frame_count == 0) {
    return CoordinateFrame(atom_count);
  }
  return getCoordinateSet(active_frame);
}

//-------------------------------------------------------------------------------------------------
template <typename T> int CoordinateSeries<T>::getCoordinateSetCount() const {
  return frame_count;
}

//-------------------------------------------------------------------------------------------------
template <typename T> CoordinateFrame CoordinateSeries<T>::getCoordinateSet(const int index) const {
  validateFrameIndex(index, "getCoordinateSet");
  CoordinateFrame result(atom_count);
  const size_t frame_offset = static_cast<size_t>(index) * static_cast<size_t>(atom_count);
  result.fill(x_coordinates.data() + frame_offset, y_coordinates.data() + frame_offset,
              z_coordinates.data() + frame_offset);
  return result;
}

//-------------------------------------------------------------------------------------------------
template <typename T> std::string CoordinateSeries<T>::getTitle() const {
  return title;
}

//-------------------------------------------------------------------------------------------------
template <typename T>
std::vector<double> CoordinateSeries<T>::getInterlacedCoordinates(const int frame_index) const {
  return getCoordinateSet(frame_index).getInterlacedCoordinates();
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void CoordinateSeries<T>::import(const CoordinateFrameReader &cfr, const int frame_index) {
  if (cfr.natom != atom_count) {
    rtErr(errors::ErrorKind::SHAPE_MISMATCH, "A frame of " + std::to_string(cfr.natom) +
          " atoms cannot be imported into a series of " + std::to_string(atom_count) +
          "-atom frames.", "CoordinateSeries", "import");
  }
  size_t frame_offset;
  if (frame_index < 0) {
    frame_offset = static_cast<size_t>(frame_count) * static_cast<size_t>(atom_count);
    const size_t new_size = frame_offset + static_cast<size_t>(atom_count);
    x_coordinates.resize(new_size);
    y_coordinates.resize(new_size);
    z_coordinates.resize(new_size);
    frame_count += 1;
  }
  else {
    validateFrameIndex(frame_index, "import");
    frame_offset = static_cast<size_t>(frame_index) * static_cast<size_t>(atom_count);
  }
  for (int i = 0; i < atom_count; i++) {
    x_coordinates[frame_offset + i] = cfr.xcrd[i];
    y_coordinates[frame_offset + i] = cfr.ycrd[i];
    z_coordinates[frame_offset + i] = cfr.zcrd[i];
  }
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void CoordinateSeries<T>::import(const CoordinateFrame &cf, const int frame_index) {
  import(cf.data(), frame_index);
}

//-------------------------------------------------------------------------------------------------
template <typename T> void CoordinateSeries<T>::setActiveFrame(const int frame_index) {
  validateFrameIndex(frame_index, "setActiveFrame");
  active_frame = frame_index;
}

//-------------------------------------------------------------------------------------------------
template <typename T> void CoordinateSeries<T>::setTitle(const std::string &title_in) {
  title = title_in;
}

//-------------------------------------------------------------------------------------------------
template <typename T> const CoordinateSeriesReader<T> CoordinateSeries<T>::data() const {
  return CoordinateSeriesReader<T>(atom_count, frame_count, x_coordinates.data(),
                                   y_coordinates.data(), z_coordinates.data());
}

//-------------------------------------------------------------------------------------------------
template <typename T> CoordinateSeriesWriter<T> CoordinateSeries<T>::data() {
  return CoordinateSeriesWriter<T>(atom_count, frame_count, x_coordinates.data(),
                                   y_coordinates.data(), z_coordinates.data());
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void CoordinateSeries<T>::validateFrameIndex(const int frame_index, const char* caller) const {
  if (frame_index < 0 || frame_index >= frame_count) {
    rtErr("Frame index " + std::to_string(frame_index) + " is invalid for a series of " +
          std::to_string(frame_count) + " frames.", "CoordinateSeries", caller);
  }
}

} // namespace trajectory
} // namespace conformix
