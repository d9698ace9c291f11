// -*-c++-*-
#ifndef CONFORMIX_RANDOM_H
#define CONFORMIX_RANDOM_H

#include <vector>
#include "copyright.h"
#include "DataTypes/common_types.h"
#include "DataTypes/conformix_vector_types.h"

namespace conformix {
namespace random {

/// \brief The default random seed for conformix
constexpr int default_random_seed = 827493;

/// \brief Number of "scrub cycles" expected to sufficiently randomize non-zero seeds in the
///        XOR-shift generator.
constexpr int default_xoroshiro128p_scrub = 25;

/// \brief The width of one bin in the unit interval when the top 53 bits of a 64-bit integer are
///        taken as a fraction
constexpr double rng_unit_bin_offset = 1.1102230246251565404236316680908203125e-16;

/// \brief Fallback state for the xoroshiro128+ generator, used if a seed would leave every bit
///        of the state at zero
/// \{
constexpr ullint xrs128p_fallback_i  = 0xdf900294d8f554a5LLU;
constexpr ullint xrs128p_fallback_ii = 0x170865df4b3201fcLLU;
/// \}

/// \brief The "xoroshiro128+" random number generator.  It is not cryptographically useful, but
///        it produces reproducible, high-quality streams of random numbers on any platform.
class Xoroshiro128pGenerator {
public:

  /// \brief The constructor seeds the generator and runs it for a number of iterations to
  ///        scrub any pattern from the seed.
  ///
  /// \param igseed  The pseudo-random number seed
  /// \param niter   Number of iterations to run through while equilibrating the generator
  Xoroshiro128pGenerator(int igseed = default_random_seed,
                         int niter = default_xoroshiro128p_scrub);

  /// \brief Return a single random number distributed over a uniform distribution [0, 1).
  double uniformRandomNumber();

  /// \brief Return a normally distributed random number with standard deviation 1.0.  This works
  ///        off of the uniform random number generator and will thus advance the state vector of
  ///        the random number generator that produces the result.
  double gaussianRandomNumber();

private:
  ullint2 state;  ///< 128-bit state vector for the generator

  /// \brief Transform a 32-bit int into 128 well-spaced bits for the seed
  ///
  /// \param igseed  Random seed passed down from the constructor
  ullint2 seed128(int igseed);

  /// \brief Iterate to the next random number
  ullint next();
};

/// \brief Produce a series of uniform random numbers on the interval [0, scale).
///
/// Overloaded:
///   - Produce a single number
///   - Produce a vector of numbers
///
/// \param rng    The random number generator (its state will advance)
/// \param count  The number of values to produce
/// \param scale  Width of the interval
/// \{
template <typename Tprng> double uniformRand(Tprng *rng, double scale);

template <typename Tprng>
std::vector<double> uniformRand(Tprng *rng, size_t count, double scale);
/// \}

/// \brief Produce a series of normally distributed random numbers with a given standard
///        deviation.
///
/// Overloaded:
///   - Produce a single number
///   - Produce a vector of numbers
///
/// \param rng    The random number generator (its state will advance)
/// \param count  The number of values to produce
/// \param scale  Standard deviation of the distribution
/// \{
template <typename Tprng> double gaussianRand(Tprng *rng, double scale);

template <typename Tprng>
std::vector<double> gaussianRand(Tprng *rng, size_t count, double scale);
/// \}

} // namespace random
} // namespace conformix

#include "random.tpp"

#endif
