#ifndef __FJ_UNIX_SOCKET_HANDLER__
#define __FJ_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace fj {
/**
 * @brief POSIX descriptor operations shared by the TCP handler.
 *
 * Every fd the handler owns gets its own mutex so a write and a close on the
 * same socket never interleave.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /**
   * @brief One send() of up to `count` bytes.
   *
   * EAGAIN is retried for a few seconds.  The kernel's answer is returned
   * unchanged otherwise, so a short send shows up as a short count.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual void close(int fd);

  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual int accept(int fd);

 protected:
  /** @brief select() for readability, up to `timeoutMs`. */
  bool waitForData(int fd, int64_t timeoutMs);

  void addToActiveSockets(int fd);
  /** @brief The fd's mutex, or null when the fd is not (or no longer) ours. */
  shared_ptr<recursive_mutex> getSocketMutex(int fd);

  virtual void initSocket(int fd);
  virtual void initServerSocket(int fd);
  void setBlocking(int sockFd, bool blocking);

  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  recursive_mutex globalMutex;
};
}  // namespace fj

#endif  // __FJ_UNIX_SOCKET_HANDLER__
