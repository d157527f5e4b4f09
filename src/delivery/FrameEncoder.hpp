#ifndef __FJ_FRAME_ENCODER__
#define __FJ_FRAME_ENCODER__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "MessageSource.hpp"

namespace fj {
/** @brief What, if anything, follows each serialized message. */
enum class TerminatorMode {
  NONE,
  NEWLINE,
};

/**
 * @brief Parses "none" or "newline".
 * @throws InvalidArgument for any other value.
 */
TerminatorMode parseTerminatorMode(const string &mode);

string terminatorModeName(TerminatorMode mode);

/**
 * @brief Turns message records into frame payloads: compact JSON with keys in
 * wire order, plus the optional newline terminator.
 */
class FrameEncoder {
 public:
  explicit FrameEncoder(shared_ptr<MessageSource> _messageSource)
      : messageSource(_messageSource) {}
  virtual ~FrameEncoder() {}

  /**
   * @brief Generates and serializes the message for `seqNo`.
   * @throws EncodingError when the record cannot be serialized.
   */
  virtual string encode(int64_t seqNo, int responseCode,
                        TerminatorMode terminator);

  static ordered_json toJson(const SampleMessage &message);

  /**
   * @brief Serializes a record without whitespace.
   * @throws EncodingError when the record cannot be serialized.
   */
  static string serialize(const SampleMessage &message,
                          TerminatorMode terminator);

 protected:
  shared_ptr<MessageSource> messageSource;
};
}  // namespace fj

#endif  // __FJ_FRAME_ENCODER__
