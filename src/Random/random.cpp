#include <cmath>
#include "copyright.h"
#include "Constants/symbol_values.h"
#include "Reporting/error_format.h"
#include "random.h"

namespace conformix {
namespace random {

//-------------------------------------------------------------------------------------------------
Xoroshiro128pGenerator::Xoroshiro128pGenerator(const int igseed, const int niter) :
    state{seed128(igseed)}
{
  // Trap cases where the bit widths of the underlying types would break the generator
  if (sizeof(ullint) != 8 || sizeof(double) != 8) {
    rtErr("The xoroshiro128+ generator requires 64-bit unsigned long long integers and 64-bit "
          "double-precision reals.", "Xoroshiro128pGenerator");
  }

  // Run some iterations to get the bit occupancy to roughly half zeros and half ones
  for (int i = 0; i < niter; i++) {
    next();
  }
}

//-------------------------------------------------------------------------------------------------
double Xoroshiro128pGenerator::uniformRandomNumber() {
  const ullint rndbits = next();
  return static_cast<double>(rndbits >> 11) * rng_unit_bin_offset;
}

//-------------------------------------------------------------------------------------------------
double Xoroshiro128pGenerator::gaussianRandomNumber() {
  const double x1 = sqrt(-2.0 * log(1.0 - uniformRandomNumber()));
  const double x2 = sin(symbols::twopi * uniformRandomNumber());
  return x1 * x2;
}

//-------------------------------------------------------------------------------------------------
ullint2 Xoroshiro128pGenerator::seed128(const int igseed) {

  // Interleave the bits of the 32-bit seed into both 64-bit halves of the state, offsetting the
  // pattern in the second half so that the two words differ.
  const ullint uiseed = static_cast<uint>(igseed);
  const int nbits = sizeof(uint) * 8;
  ullint2 result = { 0LLU, 0LLU };
  for (int i = 0; i < nbits; i++) {
    const ullint bit = ((uiseed >> i) & 0x1LLU);
    result.x |= (bit << (2 * i));
    result.y |= (bit << ((2 * i) + 1));
  }

  // An all-zero state would never advance
  if (result.x == 0LLU && result.y == 0LLU) {
    result.x = xrs128p_fallback_i;
    result.y = xrs128p_fallback_ii;
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
ullint Xoroshiro128pGenerator::next() {
  const ullint s0 = state.x;
  ullint       s1 = state.y;
  const ullint result = s0 + s1;
  s1 ^= s0;
  state.x = (((s0 << 24) | (s0 >> (64 - 24))) ^ s1 ^ (s1 << 16));
  state.y =  ((s1 << 37) | (s1 >> (64 - 37)));
  return result;
}

} // namespace random
} // namespace conformix
