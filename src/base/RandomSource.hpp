#ifndef __FJ_RANDOM_SOURCE__
#define __FJ_RANDOM_SOURCE__

#include <random>

#include "Headers.hpp"

namespace fj {
/**
 * @brief Source of the uniform draws behind chunk counts, jitter, truncation
 * and sample field values.
 */
class RandomSource {
 public:
  virtual ~RandomSource() {}

  /**
   * @brief Returns an integer uniformly distributed in [lo, hi].
   * @throws InvalidArgument when hi < lo.
   */
  virtual int64_t uniformInt(int64_t lo, int64_t hi) = 0;

  /** @brief Returns a real uniformly distributed in [lo, hi]. */
  virtual double uniformReal(double lo, double hi) = 0;
};

/**
 * @brief Non-deterministic draws backed by libsodium's CSPRNG.
 */
class SodiumRandomSource : public RandomSource {
 public:
  SodiumRandomSource();
  virtual ~SodiumRandomSource() {}

  virtual int64_t uniformInt(int64_t lo, int64_t hi);
  virtual double uniformReal(double lo, double hi);
};

/**
 * @brief Reproducible draws from a seeded Mersenne Twister.  Two sources
 * built with the same seed yield the same sequence.
 */
class SeededRandomSource : public RandomSource {
 public:
  explicit SeededRandomSource(uint64_t seed);
  virtual ~SeededRandomSource() {}

  virtual int64_t uniformInt(int64_t lo, int64_t hi);
  virtual double uniformReal(double lo, double hi);

 protected:
  std::mt19937_64 engine;
};
}  // namespace fj

#endif  // __FJ_RANDOM_SOURCE__
