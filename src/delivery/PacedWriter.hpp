#ifndef __FJ_PACED_WRITER__
#define __FJ_PACED_WRITER__

#include "ChunkSplitter.hpp"
#include "Headers.hpp"
#include "RandomSource.hpp"
#include "SocketHandler.hpp"

namespace fj {
/**
 * @brief Writes chunk plans to one connected socket, in order, with random
 * pauses between chunks.
 *
 * Each chunk is handed to the transport until fully accepted before the next
 * one starts.  A hand-off that accepts nothing aborts the whole plan.
 */
class PacedWriter {
 public:
  PacedWriter(shared_ptr<SocketHandler> _socketHandler, int _socketFd,
              shared_ptr<RandomSource> _rng);
  virtual ~PacedWriter() {}

  /**
   * @brief Writes every slice of `plan`, sleeping U[0, maxJitterMs] ms
   * between consecutive slices (never after the last one).
   * @throws TransportError when a hand-off reports <= 0 bytes accepted.
   */
  void writeChunks(const string& payload, const ChunkPlan& plan,
                   int64_t maxJitterMs);

  /** @brief Writes `payload` as a single chunk with no pacing. */
  void writeAll(const string& payload);

  /** @brief Bytes accepted by the transport over this writer's lifetime. */
  int64_t getBytesWritten() const { return bytesWritten; }

 protected:
  void writeChunk(const char* buf, size_t count);

  /** @brief Blocks for `delay`.  Overridden in tests to record pacing. */
  virtual void pause(std::chrono::microseconds delay);

  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  shared_ptr<RandomSource> rng;
  int64_t bytesWritten;
};
}  // namespace fj

#endif  // __FJ_PACED_WRITER__
