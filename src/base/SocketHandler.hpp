#ifndef __FJ_SOCKET_HANDLER__
#define __FJ_SOCKET_HANDLER__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace fj {
/**
 * @brief Transport seam between the publisher and the kernel.
 *
 * The publisher only needs connect/write/close.  The listening half exists
 * so a loopback receiver can be built from the same handler.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Hands up to `count` bytes to the transport.
   * @return Bytes accepted, 0 when the peer stalled or closed, -1 on error
   * (errno is set).
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /** @brief Connects to `endpoint`, returning the fd or -1. */
  virtual int connect(const SocketEndpoint& endpoint) = 0;

  virtual void close(int fd) = 0;

  virtual bool hasData(int fd) = 0;
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;

  /**
   * @brief Blocks until exactly `count` bytes arrived on `fd`.
   * @param timeout Give up after SOCKET_DATA_TRANSFER_TIMEOUT seconds without
   * progress.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);

  /** @brief Binds `endpoint` and returns the listening fds. */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /** @brief Returns an accepted fd, or -1 when nothing is pending. */
  virtual int accept(int fd) = 0;
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
};
}  // namespace fj

#endif  // __FJ_SOCKET_HANDLER__
