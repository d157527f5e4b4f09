#ifndef __FJ_FIXED_MESSAGE_SOURCE__
#define __FJ_FIXED_MESSAGE_SOURCE__

#include "MessageSource.hpp"

namespace fj {
/**
 * @brief Deterministic records: fixed timestamp and field values, with the
 * note padded so payload length is easy to steer.
 */
class FixedMessageSource : public MessageSource {
 public:
  explicit FixedMessageSource(const string& _note = "hello_tablet")
      : note(_note), generated(0) {}

  SampleMessage generate(int64_t seqNo, int responseCode) override {
    generated++;
    SampleMessage message;
    message.responseCode = responseCode;
    message.seqNo = seqNo;
    message.pubTimestampMs = 1700000000000LL;
    message.command = 3;
    message.measure = 1;
    message.workType = 2;
    message.forkHeightMm = 750;
    message.forkForwardMm = 1200;
    message.note = note;
    return message;
  }

  string note;
  int generated;
};
}  // namespace fj

#endif  // __FJ_FIXED_MESSAGE_SOURCE__
