#include "SocketHandler.hpp"

namespace fj {
#define SOCKET_DATA_TRANSFER_TIMEOUT (10)

void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  char* out = (char*)buf;
  size_t received = 0;
  time_t lastProgress = time(NULL);
  while (received < count) {
    if (timeout && time(NULL) > lastProgress + SOCKET_DATA_TRANSFER_TIMEOUT) {
      throw std::runtime_error("Socket Timeout");
    }
    if (!hasData(fd)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      continue;
    }

    ssize_t n = read(fd, out + received, count - received);
    if (n > 0) {
      received += n;
      lastProgress = time(NULL);
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      VLOG(3) << "Got EAGAIN, waiting...";
      continue;
    }
    // A zero-byte read means the peer closed before we got everything
    int readErrno = (n == 0) ? EPIPE : errno;
    VLOG(1) << "readAll on fd " << fd << " stopped after " << received << "/"
            << count << " bytes: " << strerror(readErrno);
    throw std::runtime_error("Failed a call to readAll");
  }
}
}  // namespace fj
