/*!
  \file gpk_random.hpp
  \rst
  Pseudo-random number generation for tests: UniformRandomGenerator (a container for a PRNG "engine") and a helper
  that fills batches of difference vectors.

  UniformRandomGenerator remembers its most recent seed so that "rollbacks" are easy, making test failures
  reproducible.  It wraps ``boost::mt19937``, the mersenne twister with a common set of parameters.  It is not a
  functor since the range and even type of the draws change frequently; construct the distribution as needed
  (e.g., ``boost::uniform_real<double>``) and pass it ``uniform_generator.engine``.
\endrst*/

#ifndef GPKERNEL_CPP_GPK_RANDOM_HPP_
#define GPKERNEL_CPP_GPK_RANDOM_HPP_

#include <boost/random/mersenne_twister.hpp>  // NOLINT(build/include_order)
#include <boost/random/uniform_real.hpp>  // NOLINT(build/include_order)

#include "gpk_common.hpp"

namespace gpkernel {

/*!\rst
  Container for an uniform random generator (e.g., mersenne twister).

  .. Note:: seed values take type ``EngineType::result_type``. Do not pass in a wider integer type!

  .. WARNING:: this class is NOT THREAD-SAFE. You must construct one object per thread.
\endrst*/
struct UniformRandomGenerator final {
  using EngineType = boost::mt19937;

  //! Default seed value to make reproducing test results simple.
  static constexpr EngineType::result_type kDefaultSeed = 314;

  /*!\rst
    Default-constructs a UniformRandomGenerator, seeding with kDefaultSeed.
  \endrst*/
  UniformRandomGenerator() noexcept;

  /*!\rst
    Construct a UniformRandomGenerator, seeding with the specified seed.

    \param
      :seed: new seed to set
  \endrst*/
  explicit UniformRandomGenerator(EngineType::result_type seed) noexcept;

  EngineType::result_type last_seed() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return last_seed_;
  }

  /*!\rst
    Seed the random number generator with the input value.

    \param
      :seed: new seed to set
  \endrst*/
  void SetExplicitSeed(EngineType::result_type seed) noexcept;

  /*!\rst
    Reseeds the generator with its most recently specified seed value.
    Useful for testing--e.g., can conduct multiple runs with the same initial conditions
  \endrst*/
  void ResetToMostRecentSeed() noexcept;

  //! the PRNG engine; pass to boost distributions
  EngineType engine;

 private:
  //! the last seed used to seed the engine
  EngineType::result_type last_seed_;
};

/*!\rst
  Fill ``num_points`` difference vectors with random coordinates whose magnitudes are drawn from
  ``uniform_double_magnitude`` and whose signs are chosen uniformly at random.  With a positive lower bound on the
  magnitude, no point lies on a coordinate hyperplane (in particular, none is at the origin).

  \param
    :uniform_double_magnitude: an uniform range, ``[min, max]``, from which to draw coordinate magnitudes
    :dim: number of coordinates per point
    :num_points: number of points
    :uniform_generator[1]: a UniformRandomGenerator object providing the random engine for uniform random numbers
  \output
    :uniform_generator[1]: UniformRandomGenerator object will have its state changed due to ``2*dim*num_points`` random draws
    :tau[dim][num_points]: random difference vectors
\endrst*/
void FillRandomDifferenceVectors(const boost::uniform_real<double>& uniform_double_magnitude, int dim, int num_points,
                                 UniformRandomGenerator * uniform_generator, double * restrict tau) GPK_NONNULL_POINTERS;

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_RANDOM_HPP_
