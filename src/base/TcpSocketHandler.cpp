#include "TcpSocketHandler.hpp"

namespace fj {
TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *results = NULL;
  string port = to_string(endpoint.getPort());
  int rc = getaddrinfo(endpoint.getName().c_str(), port.c_str(), &hints,
                       &results);
  if (rc != 0) {
    LOG_EVERY_N(10, ERROR) << "Cannot resolve " << endpoint << ": "
                           << gai_strerror(rc);
    return -1;
  }

  int sockFd = -1;
  for (addrinfo *p = results; p != NULL && sockFd == -1; p = p->ai_next) {
    sockFd = connectWithTimeout(p, endpoint);
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    VLOG(1) << "No address of " << endpoint << " accepted the connection";
    return -1;
  }
#if !defined(MSG_NOSIGNAL)
  ::signal(SIGPIPE, SIG_IGN);
#endif
  addToActiveSockets(sockFd);
  LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
  return sockFd;
}

int TcpSocketHandler::connectWithTimeout(const addrinfo *address,
                                         const SocketEndpoint &endpoint) {
  int sockFd =
      socket(address->ai_family, address->ai_socktype, address->ai_protocol);
  if (sockFd == -1) {
    LOG(INFO) << "Error creating socket: " << strerror(errno);
    return -1;
  }

  setBlocking(sockFd, false);
  int connectErrno = 0;
  if (::connect(sockFd, address->ai_addr, address->ai_addrlen) == -1) {
    connectErrno = errno;
  }
  if (connectErrno == EINPROGRESS) {
    fd_set writable;
    FD_ZERO(&writable);
    FD_SET(sockFd, &writable);
    timeval tv;
    tv.tv_sec = CONNECT_TIMEOUT_SECONDS;
    tv.tv_usec = 0;
    if (select(sockFd + 1, NULL, &writable, NULL, &tv) <= 0) {
      connectErrno = ETIMEDOUT;
    } else {
      socklen_t len = sizeof(connectErrno);
      FATAL_FAIL(
          ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &connectErrno, &len));
    }
  }
  if (connectErrno != 0) {
    LOG(INFO) << "Error connecting to " << endpoint << ": "
              << strerror(connectErrno);
    ::close(sockFd);
    return -1;
  }

  // Chunk hand-offs block once connected
  setBlocking(sockFd, true);
  setNoDelay(sockFd);
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);
  int port = endpoint.getPort();
  if (listenSockets.count(port)) {
    STFATAL << "Tried to listen twice on port " << port;
  }

  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  addrinfo *results = NULL;
  string portName = to_string(port);
  const char *host =
      endpoint.getName().empty() ? NULL : endpoint.getName().c_str();
  int rc = getaddrinfo(host, portName.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(ERROR) << "Cannot resolve listen address " << endpoint << ": "
               << gai_strerror(rc);
    throw std::runtime_error("Cannot resolve listen address");
  }

  set<int> fds;
  for (addrinfo *p = results; p != NULL; p = p->ai_next) {
    int sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (sockFd == -1) {
      continue;
    }
    initServerSocket(sockFd);
    if (p->ai_family == AF_INET6) {
      // Leave the IPv4 wildcard to its own socket
      int v6only = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, &v6only,
                            sizeof(v6only)));
    }
    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      string error = "Error binding port " + portName + ": " + strerror(errno);
      LOG(ERROR) << error;
      ::close(sockFd);
      for (int fd : fds) {
        ::close(fd);
      }
      freeaddrinfo(results);
      throw std::runtime_error(error);
    }
    FATAL_FAIL(::listen(sockFd, 32));
    fds.insert(sockFd);
  }
  freeaddrinfo(results);

  if (fds.empty()) {
    throw std::runtime_error("Could not listen on " + portName);
  }
  LOG(INFO) << "Listening on " << endpoint << " with " << fds.size()
            << " socket(s)";
  listenSockets[port] = fds;
  return fds;
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);
  auto it = listenSockets.find(endpoint.getPort());
  if (it == listenSockets.end()) {
    STFATAL << "Not listening on " << endpoint;
  }
  for (int fd : it->second) {
    FATAL_FAIL(::close(fd));
  }
  listenSockets.erase(it);
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  setNoDelay(fd);
}

void TcpSocketHandler::setNoDelay(int fd) {
  int noDelay = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)));
}
}  // namespace fj
