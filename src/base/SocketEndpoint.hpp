#ifndef __FJ_SOCKET_ENDPOINT__
#define __FJ_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace fj {
/**
 * @brief Host and TCP port of a receiver.  An empty host means every local
 * interface when listening.
 */
class SocketEndpoint {
 public:
  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  return os << self.getName() << ":" << self.getPort();
}
}  // namespace fj

#endif  // __FJ_SOCKET_ENDPOINT__
