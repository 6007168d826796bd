#ifndef _TDCORE_RANDOM_H_
#define _TDCORE_RANDOM_H_

#include <random>

/** \file
    Random number source shared by environments, exploration policies
    and experiment drivers. */

/** A seeded pseudo-random number generator.  Components that need
    randomness hold a reference to one instance owned by the driver, so
    seeding that instance once makes a whole run repeatable. */
class Random {
public:
  /** Seeds the generator with a fixed default seed. */
  Random(): engine(1) {}

  /** Seeds the generator with the given seed. */
  explicit Random(unsigned seed): engine(seed) {}

  /** Reseeds the generator. */
  void seed(unsigned s) { engine.seed(s); }

  /** \return A double drawn uniformly from [0, 1). */
  double uniform() {
    return std::uniform_real_distribution<double>(0.0, 1.0)(engine);
  }

  /** \return An integer drawn uniformly from [a, b], inclusive. */
  int uniformDiscrete(int a, int b) {
    return std::uniform_int_distribution<int>(a, b)(engine);
  }

  /** \return true with probability p. */
  bool bernoulli(double p) {
    return uniform() < p;
  }

private:
  std::mt19937 engine;
};

#endif
