#ifndef __FJ_TCP_SOCKET_HANDLER__
#define __FJ_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace fj {
/**
 * @brief TCP transport with Nagle disabled, so each chunk hand-off leaves as
 * its own segment.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Tries every resolved address with a CONNECT_TIMEOUT_SECONDS
   * non-blocking connect.  The returned socket is blocking.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /** @brief Binds the endpoint's host (all interfaces when empty). */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Returns a connected fd for one address, or -1. */
  int connectWithTimeout(const addrinfo* address,
                         const SocketEndpoint& endpoint);

  virtual void initSocket(int fd);
  void setNoDelay(int fd);

  /** @brief Listening fds per port. */
  map<int, set<int>> listenSockets;
};
}  // namespace fj

#endif  // __FJ_TCP_SOCKET_HANDLER__
