#include "MessageSource.hpp"

namespace fj {
namespace {
const int COMMAND_CHOICES[] = {0, 3};
const int MAX_FORK_HEIGHT_MM = 1500;
const int MAX_FORK_FORWARD_MM = 3000;
}  // namespace

SampleMessage RandomMessageSource::generate(int64_t seqNo, int responseCode) {
  SampleMessage message;
  message.responseCode = responseCode;
  message.seqNo = seqNo;
  message.pubTimestampMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count();
  message.command = COMMAND_CHOICES[rng->uniformInt(0, 1)];
  message.measure = int(rng->uniformInt(0, 1));
  message.workType = int(rng->uniformInt(0, 2));
  message.forkHeightMm = int(rng->uniformInt(0, MAX_FORK_HEIGHT_MM));
  message.forkForwardMm = int(rng->uniformInt(0, MAX_FORK_FORWARD_MM));
  return message;
}
}  // namespace fj
