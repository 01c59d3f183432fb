/*!
  \file gpk_random_test.cpp
  \rst
  This file contains functions for testing the functions and classes in gpk_random.hpp.
\endrst*/

#include "gpk_random_test.hpp"

#include <cmath>

#include <vector>

#include <boost/random/uniform_real.hpp>  // NOLINT(build/include_order)

#include "gpk_common.hpp"
#include "gpk_logging.hpp"
#include "gpk_random.hpp"
#include "gpk_test_utils.hpp"

namespace gpkernel {

namespace {

/*!\rst
  Checks that SetExplicitSeed() records the seed and that ResetToMostRecentSeed() replays the same draws.

  \return
    number of test failures
\endrst*/
GPK_WARN_UNUSED_RESULT int UniformRandomGeneratorSeedTest() {
  const int num_draws = 20;
  int total_errors = 0;

  UniformRandomGenerator uniform_generator;
  if (!CheckIntEquals(uniform_generator.last_seed(), UniformRandomGenerator::kDefaultSeed)) {
    ++total_errors;
  }

  const UniformRandomGenerator::EngineType::result_type seed = 87131;
  uniform_generator.SetExplicitSeed(seed);
  if (!CheckIntEquals(uniform_generator.last_seed(), seed)) {
    ++total_errors;
  }

  boost::uniform_real<double> uniform_double(-3.0, 3.0);
  std::vector<double> draws(num_draws);
  for (auto& draw : draws) {
    draw = uniform_double(uniform_generator.engine);
  }

  uniform_generator.ResetToMostRecentSeed();
  for (const auto draw : draws) {
    if (!CheckDoubleWithin(uniform_double(uniform_generator.engine), draw, 0.0)) {
      ++total_errors;
    }
  }

  UniformRandomGenerator uniform_generator_same_seed(seed);
  uniform_generator.ResetToMostRecentSeed();
  if (uniform_generator.engine != uniform_generator_same_seed.engine) {
    GPK_ERROR_PRINTF("engines seeded with the same value differ\n");
    ++total_errors;
  }

  if (total_errors != 0) {
    GPK_PARTIAL_FAILURE_PRINTF("UniformRandomGenerator seeding failed with %d errors\n", total_errors);
  }
  return total_errors;
}

/*!\rst
  Checks that every coordinate from FillRandomDifferenceVectors() has magnitude in the requested range and that both
  signs occur.

  \return
    number of test failures
\endrst*/
GPK_WARN_UNUSED_RESULT int RandomDifferenceVectorTest() {
  const int dim = 4;
  const int num_points = 50;
  const double min_magnitude = 0.2;
  const double max_magnitude = 1.5;
  int total_errors = 0;

  UniformRandomGenerator uniform_generator(314);
  boost::uniform_real<double> uniform_double_magnitude(min_magnitude, max_magnitude);
  std::vector<double> tau(dim*num_points);
  FillRandomDifferenceVectors(uniform_double_magnitude, dim, num_points, &uniform_generator, tau.data());

  int num_negative = 0;
  for (const auto coordinate : tau) {
    const double magnitude = std::fabs(coordinate);
    if (magnitude < min_magnitude || magnitude > max_magnitude) {
      ++total_errors;
    }
    if (coordinate < 0.0) {
      ++num_negative;
    }
  }

  if (num_negative == 0 || num_negative == dim*num_points) {
    GPK_ERROR_PRINTF("difference vectors have only one sign: %d negative of %d\n", num_negative, dim*num_points);
    ++total_errors;
  }

  if (total_errors != 0) {
    GPK_PARTIAL_FAILURE_PRINTF("random difference vectors failed with %d errors\n", total_errors);
  }
  return total_errors;
}

}  // end unnamed namespace

int RunRandomTests() {
  int current_errors;
  int total_errors = 0;

  current_errors = UniformRandomGeneratorSeedTest();
  total_errors += current_errors;
  if (current_errors != 0) {
    GPK_PARTIAL_FAILURE_PRINTF("Uniform random generator errors = %d\n", current_errors);
  }

  current_errors = RandomDifferenceVectorTest();
  total_errors += current_errors;
  if (current_errors != 0) {
    GPK_PARTIAL_FAILURE_PRINTF("Random difference vector errors = %d\n", current_errors);
  }

  return total_errors;
}

}  // end namespace gpkernel
