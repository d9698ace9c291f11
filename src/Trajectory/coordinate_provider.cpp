#include "copyright.h"
#include "coordinate_provider.h"

namespace conformix {
namespace trajectory {

//-------------------------------------------------------------------------------------------------
std::vector<double> CoordinateProvider::getCoordinateSets() const {
  const int nset = getCoordinateSetCount();
  const size_t stride = 3LLU * static_cast<size_t>(getAtomCount());
  std::vector<double> result;
  result.reserve(stride * static_cast<size_t>(nset));
  for (int i = 0; i < nset; i++) {
    const std::vector<double> xyz = getCoordinateSet(i).getInterlacedCoordinates();
    result.insert(result.end(), xyz.begin(), xyz.end());
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::string CoordinateProvider::getTitle() const {
  return std::string("");
}

} // namespace trajectory
} // namespace conformix
