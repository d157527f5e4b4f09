#include "PacedWriter.hpp"

#include "DeliveryErrors.hpp"

namespace fj {
PacedWriter::PacedWriter(shared_ptr<SocketHandler> _socketHandler,
                         int _socketFd, shared_ptr<RandomSource> _rng)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      rng(_rng),
      bytesWritten(0) {}

void PacedWriter::writeChunks(const string& payload, const ChunkPlan& plan,
                              int64_t maxJitterMs) {
  for (size_t i = 0; i < plan.size(); ++i) {
    const ChunkSlice& slice = plan[i];
    if (slice.offset + slice.length > payload.length()) {
      STFATAL << "Chunk " << i << " runs past payload of " << payload.length()
              << " bytes";
    }
    VLOG(1) << "Writing chunk " << (i + 1) << "/" << plan.size() << " ("
            << slice.length << " bytes) to fd " << socketFd;
    writeChunk(payload.data() + slice.offset, slice.length);

    if (maxJitterMs > 0 && i + 1 < plan.size()) {
      double delayMs = rng->uniformReal(0.0, double(maxJitterMs));
      pause(std::chrono::microseconds(int64_t(delayMs * 1000.0)));
    }
  }
}

void PacedWriter::writeAll(const string& payload) {
  writeChunks(payload, ChunkPlan{{0, payload.length()}}, 0);
}

void PacedWriter::writeChunk(const char* buf, size_t count) {
  size_t pos = 0;
  while (pos < count) {
    ssize_t accepted = socketHandler->write(socketFd, buf + pos, count - pos);
    if (accepted < 0) {
      auto localErrno = GetErrno();
      LOG(WARNING) << "Write to fd " << socketFd
                   << " failed: " << strerror(localErrno);
      throw TransportError(string("Socket write failed: ") +
                           strerror(localErrno));
    }
    if (accepted == 0) {
      throw TransportError("Socket write returned 0 (stalled or closed)");
    }
    pos += accepted;
    bytesWritten += accepted;
  }
}

void PacedWriter::pause(std::chrono::microseconds delay) {
  VLOG(2) << "Pausing " << delay.count() << "us between chunks";
  std::this_thread::sleep_for(delay);
}
}  // namespace fj
