#ifndef __FJ_CHUNK_SPLITTER__
#define __FJ_CHUNK_SPLITTER__

#include "Headers.hpp"

namespace fj {
/** @brief A contiguous byte range of a payload, written as one hand-off. */
struct ChunkSlice {
  size_t offset;
  size_t length;
};

inline bool operator==(const ChunkSlice &a, const ChunkSlice &b) {
  return a.offset == b.offset && a.length == b.length;
}

/**
 * @brief Ordered, gap-free slices covering a payload from left to right.
 */
typedef vector<ChunkSlice> ChunkPlan;

/**
 * @brief Partitions payloads into near-equal contiguous chunks.
 */
class ChunkSplitter {
 public:
  /**
   * @brief Plans `min(chunkCount, length)` slices over `length` bytes.
   *
   * The first `length % n` slices carry one extra byte, so slice sizes
   * differ by at most one.  An empty payload yields a single empty slice.
   * @throws InvalidArgument when chunkCount <= 0.
   */
  static ChunkPlan split(size_t length, int64_t chunkCount);

  /** @brief Copies the bytes named by `slice` out of `payload`. */
  static string slice(const string &payload, const ChunkSlice &slice);
};
}  // namespace fj

#endif  // __FJ_CHUNK_SPLITTER__
