// -*-c++-*-
#include "copyright.h"

namespace conformix {
namespace random {

//-------------------------------------------------------------------------------------------------
template <typename Tprng> double uniformRand(Tprng *rng, const double scale) {
  return rng->uniformRandomNumber() * scale;
}

//-------------------------------------------------------------------------------------------------
template <typename Tprng>
std::vector<double> uniformRand(Tprng *rng, const size_t count, const double scale) {
  std::vector<double> result(count);
  for (size_t i = 0; i < count; i++) {
    result[i] = rng->uniformRandomNumber() * scale;
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
template <typename Tprng> double gaussianRand(Tprng *rng, const double scale) {
  return rng->gaussianRandomNumber() * scale;
}

//-------------------------------------------------------------------------------------------------
template <typename Tprng>
std::vector<double> gaussianRand(Tprng *rng, const size_t count, const double scale) {
  std::vector<double> result(count);
  for (size_t i = 0; i < count; i++) {
    result[i] = rng->gaussianRandomNumber() * scale;
  }
  return result;
}

} // namespace random
} // namespace conformix
