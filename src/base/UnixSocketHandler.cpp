#include "UnixSocketHandler.hpp"

namespace fj {
namespace {
// How long write() keeps retrying a full send buffer
const int WRITE_EAGAIN_SECONDS = 5;
}  // namespace

UnixSocketHandler::UnixSocketHandler() {}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    LOG(INFO) << "Tried to write to a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  VLOG(4) << "Handing " << count << " bytes to fd " << fd;

  time_t deadline = time(NULL) + WRITE_EAGAIN_SECONDS;
  while (true) {
    ssize_t sent;
    {
      lock_guard<recursive_mutex> guard(*socketMutex);
#ifdef MSG_NOSIGNAL
      sent = ::send(fd, buf, count, MSG_NOSIGNAL);
#else
      sent = ::write(fd, buf, count);
#endif
    }
    if (sent >= 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
      return sent;
    }
    if (time(NULL) > deadline) {
      VLOG(1) << "Send buffer on fd " << fd << " stayed full, giving up";
      return -1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

void UnixSocketHandler::close(int fd) {
  if (fd == -1) {
    return;
  }
  lock_guard<recursive_mutex> globalGuard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  {
    lock_guard<recursive_mutex> guard(*(it->second));
    VLOG(1) << "Closing connection: " << fd;
    FATAL_FAIL(::close(fd));
  }
  activeSocketMutexes.erase(it);
}

bool UnixSocketHandler::hasData(int fd) { return waitForData(fd, 0); }

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    LOG(INFO) << "Tried to read from a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ssize_t n = ::read(fd, buf, count);
  int readErrno = errno;
  if (n < 0 && readErrno != EAGAIN && readErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading fd " << fd << ": " << strerror(readErrno);
  }
  errno = readErrno;
  return n;
}

int UnixSocketHandler::accept(int listenFd) {
  sockaddr_storage peer;
  socklen_t peerLength = sizeof(peer);
  int fd = ::accept(listenFd, (sockaddr *)&peer, &peerLength);
  if (fd < 0) {
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      FATAL_FAIL(-1);
    }
    return -1;
  }
  VLOG(3) << "Accepted fd " << fd << " on listen fd " << listenFd;
  addToActiveSockets(fd);
  initSocket(fd);
  return fd;
}

bool UnixSocketHandler::waitForData(int fd, int64_t timeoutMs) {
  fd_set readable;
  FD_ZERO(&readable);
  FD_SET(fd, &readable);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int ready = select(fd + 1, &readable, NULL, NULL, &tv);
  if (ready <= 0) {
    return false;
  }
  return FD_ISSET(fd, &readable);
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  if (!activeSocketMutexes
           .insert(make_pair(fd, make_shared<recursive_mutex>()))
           .second) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
}

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketMutex(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return shared_ptr<recursive_mutex>();
  }
  return it->second;
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  // Without MSG_NOSIGNAL a reset peer would raise SIGPIPE on write
  int noSigPipe = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &noSigPipe,
                 sizeof(noSigPipe)) == -1) {
    ::signal(SIGPIPE, SIG_IGN);
  }
#endif
  setBlocking(fd, false);
}

void UnixSocketHandler::initServerSocket(int fd) {
  initSocket(fd);
  int reuse = 1;
  FATAL_FAIL(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)));
}

void UnixSocketHandler::setBlocking(int sockFd, bool blocking) {
  int flags = fcntl(sockFd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(flags);
  flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  FATAL_FAIL_UNLESS_EINVAL(fcntl(sockFd, F_SETFL, flags));
}
}  // namespace fj
