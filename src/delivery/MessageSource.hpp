#ifndef __FJ_MESSAGE_SOURCE__
#define __FJ_MESSAGE_SOURCE__

#include "Headers.hpp"
#include "RandomSource.hpp"

namespace fj {
/**
 * @brief Driver command record published to the receiver under test.
 *
 * Field values only shape the payload length; framing behavior does not
 * depend on them.
 */
struct SampleMessage {
  int responseCode = 0;
  int driverInstanceId = 1;
  int64_t seqNo = 0;
  int64_t pubTimestampMs = 0;
  int command = 0;
  int measure = 0;
  int workType = 0;
  int forkHeightMm = 0;
  int forkForwardMm = 0;
  string note = "hello_tablet";
};

/**
 * @brief Produces the message record for a sequence number and response
 * code.
 */
class MessageSource {
 public:
  virtual ~MessageSource() {}

  virtual SampleMessage generate(int64_t seqNo, int responseCode) = 0;
};

/**
 * @brief Fills the variable fields with random values and stamps the
 * current wall clock time.
 */
class RandomMessageSource : public MessageSource {
 public:
  explicit RandomMessageSource(shared_ptr<RandomSource> _rng) : rng(_rng) {}
  virtual ~RandomMessageSource() {}

  virtual SampleMessage generate(int64_t seqNo, int responseCode);

 protected:
  shared_ptr<RandomSource> rng;
};
}  // namespace fj

#endif  // __FJ_MESSAGE_SOURCE__
