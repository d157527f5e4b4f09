#include "RandomSource.hpp"

#include "DeliveryErrors.hpp"

namespace fj {
namespace {
void checkRange(int64_t lo, int64_t hi) {
  if (hi < lo) {
    throw InvalidArgument("Invalid random range [" + to_string(lo) + ", " +
                          to_string(hi) + "]");
  }
}
}  // namespace

SodiumRandomSource::SodiumRandomSource() {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
}

int64_t SodiumRandomSource::uniformInt(int64_t lo, int64_t hi) {
  checkRange(lo, hi);
  uint64_t span = uint64_t(hi - lo);
  if (span >= UINT32_MAX) {
    // randombytes_uniform tops out at 2^32 - 1 values
    throw InvalidArgument("Random range too wide: " + to_string(span));
  }
  return lo + int64_t(randombytes_uniform(uint32_t(span + 1)));
}

double SodiumRandomSource::uniformReal(double lo, double hi) {
  double unit = double(randombytes_random()) / double(UINT32_MAX);
  return lo + unit * (hi - lo);
}

SeededRandomSource::SeededRandomSource(uint64_t seed) : engine(seed) {}

int64_t SeededRandomSource::uniformInt(int64_t lo, int64_t hi) {
  checkRange(lo, hi);
  std::uniform_int_distribution<int64_t> dist(lo, hi);
  return dist(engine);
}

double SeededRandomSource::uniformReal(double lo, double hi) {
  if (hi <= lo) {
    return lo;
  }
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(engine);
}
}  // namespace fj
