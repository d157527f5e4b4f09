#include "ChunkSplitter.hpp"

#include "DeliveryErrors.hpp"

namespace fj {
ChunkPlan ChunkSplitter::split(size_t length, int64_t chunkCount) {
  if (chunkCount <= 0) {
    throw InvalidArgument("Chunk count must be >= 1, got " +
                          to_string(chunkCount));
  }
  if (length == 0) {
    return ChunkPlan{{0, 0}};
  }

  // More chunks than bytes would produce empty writes
  size_t n = std::min(size_t(chunkCount), length);
  size_t base = length / n;
  size_t remainder = length % n;

  ChunkPlan plan;
  plan.reserve(n);
  size_t offset = 0;
  for (size_t i = 0; i < n; ++i) {
    size_t size = base + (i < remainder ? 1 : 0);
    plan.push_back({offset, size});
    offset += size;
  }
  return plan;
}

string ChunkSplitter::slice(const string &payload, const ChunkSlice &slice) {
  if (slice.offset + slice.length > payload.length()) {
    STFATAL << "Slice " << slice.offset << "+" << slice.length
            << " runs past payload of " << payload.length() << " bytes";
  }
  return payload.substr(slice.offset, slice.length);
}
}  // namespace fj
