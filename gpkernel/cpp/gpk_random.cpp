/*!
  \file gpk_random.cpp
  \rst
  Definitions of the seeding functions of UniformRandomGenerator and of the random difference-vector generator.
\endrst*/

#include "gpk_random.hpp"

#include <boost/random/uniform_real.hpp>  // NOLINT(build/include_order)

#include "gpk_common.hpp"

namespace gpkernel {

UniformRandomGenerator::UniformRandomGenerator(EngineType::result_type seed) noexcept
    : engine(seed), last_seed_(seed) {
  SetExplicitSeed(seed);
}

UniformRandomGenerator::UniformRandomGenerator() noexcept : UniformRandomGenerator(kDefaultSeed) {
}

void UniformRandomGenerator::SetExplicitSeed(EngineType::result_type seed) noexcept {
  engine.seed(seed);
  last_seed_ = seed;
}

void UniformRandomGenerator::ResetToMostRecentSeed() noexcept {
  SetExplicitSeed(last_seed_);
}

void FillRandomDifferenceVectors(const boost::uniform_real<double>& uniform_double_magnitude, int dim, int num_points,
                                 UniformRandomGenerator * uniform_generator, double * restrict tau) {
  boost::uniform_real<double> uniform_double_sign(-1.0, 1.0);
  for (int i = 0; i < num_points; ++i) {
    for (int d = 0; d < dim; ++d) {
      const double magnitude = uniform_double_magnitude(uniform_generator->engine);
      tau[d] = uniform_double_sign(uniform_generator->engine) < 0.0 ? -magnitude : magnitude;
    }
    tau += dim;
  }
}

}  // end namespace gpkernel
