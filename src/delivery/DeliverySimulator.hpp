#ifndef __FJ_DELIVERY_SIMULATOR__
#define __FJ_DELIVERY_SIMULATOR__

#include "ChunkSplitter.hpp"
#include "FrameEncoder.hpp"
#include "Headers.hpp"
#include "PacedWriter.hpp"
#include "RandomSource.hpp"
#include "Scenario.hpp"

namespace fj {
/** @brief Knobs shared by every delivery of a session. */
struct DeliveryConfig {
  // Inclusive range the fragmented chunk count is drawn from
  int64_t minChunk = 1;
  int64_t maxChunk = 16;
  // Upper bound of the pause between fragments, in milliseconds
  int64_t jitterMs = 5;
  TerminatorMode terminator = TerminatorMode::NONE;

  /** @throws InvalidArgument for an unusable combination. */
  void validate() const;
};

/** @brief What a single deliver() call put on the wire. */
struct DeliveryReport {
  Scenario scenario = Scenario::ATOMIC_FRAME;
  int responseCode = 0;
  // Sequence numbers carried, inclusive
  int64_t firstSequenceNumber = 0;
  int64_t lastSequenceNumber = 0;
  int64_t nextSequenceNumber = 0;
  // Length of the full encoded payload before any truncation
  size_t encodedBytes = 0;
  size_t bytesWritten = 0;
  size_t chunkCount = 0;
};

/**
 * @brief Runs the four delivery scenarios against a paced writer.
 */
class DeliverySimulator {
 public:
  /** @brief Bounds of the tail withheld by an incomplete frame. */
  static const int64_t MIN_WITHHELD_BYTES = 1;
  static const int64_t MAX_WITHHELD_BYTES = 12;

  DeliverySimulator(shared_ptr<FrameEncoder> _encoder,
                    shared_ptr<RandomSource> _rng);

  /**
   * @brief Encodes and writes the frame(s) for `scenario`.
   *
   * The writer is used exclusively until this returns.  Nothing is written
   * when the config is invalid.
   * @return Report whose nextSequenceNumber is sequenceNumber + 1, or + 2 for
   * CoalescedFrames.
   * @throws InvalidArgument, EncodingError, TransportError
   */
  DeliveryReport deliver(Scenario scenario, int64_t sequenceNumber,
                         int responseCode, const DeliveryConfig& config,
                         PacedWriter* writer);

 protected:
  void deliverAtomic(const DeliveryConfig& config, PacedWriter* writer,
                     DeliveryReport* report);
  void deliverFragmented(const DeliveryConfig& config, PacedWriter* writer,
                         DeliveryReport* report);
  void deliverIncomplete(const DeliveryConfig& config, PacedWriter* writer,
                         DeliveryReport* report);
  void deliverCoalesced(const DeliveryConfig& config, PacedWriter* writer,
                        DeliveryReport* report);

  shared_ptr<FrameEncoder> encoder;
  shared_ptr<RandomSource> rng;
};
}  // namespace fj

#endif  // __FJ_DELIVERY_SIMULATOR__
