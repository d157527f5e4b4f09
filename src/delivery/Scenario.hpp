#ifndef __FJ_SCENARIO__
#define __FJ_SCENARIO__

#include "Headers.hpp"

namespace fj {
/**
 * @brief Delivery edge case exercised against the receiver's frame reader.
 */
enum class Scenario {
  // One frame, one write
  ATOMIC_FRAME = 1,
  // One frame, several writes separated by jitter
  FRAGMENTED_FRAME = 2,
  // A frame with its tail withheld
  INCOMPLETE_FRAME = 3,
  // Two frames in one write
  COALESCED_FRAMES = 4,
};

inline string scenarioName(Scenario scenario) {
  switch (scenario) {
    case Scenario::ATOMIC_FRAME:
      return "AtomicFrame";
    case Scenario::FRAGMENTED_FRAME:
      return "FragmentedFrame";
    case Scenario::INCOMPLETE_FRAME:
      return "IncompleteFrame";
    case Scenario::COALESCED_FRAMES:
      return "CoalescedFrames";
  }
  STFATAL << "Unknown scenario: " << int(scenario);
  return "";
}

/**
 * @brief Maps an interactive command key ("1" through "4") to a scenario.
 * @return false when the key does not name a scenario.
 */
inline bool scenarioFromKey(const string &key, Scenario *scenario) {
  if (key.length() != 1 || key[0] < '1' || key[0] > '4') {
    return false;
  }
  *scenario = Scenario(key[0] - '0');
  return true;
}

inline ostream &operator<<(ostream &os, Scenario scenario) {
  return os << scenarioName(scenario);
}
}  // namespace fj

#endif  // __FJ_SCENARIO__
