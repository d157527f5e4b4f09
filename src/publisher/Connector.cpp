#include "Connector.hpp"

namespace fj {
RetryingConnector::RetryingConnector(shared_ptr<SocketHandler> _socketHandler,
                                     const SocketEndpoint& _endpoint,
                                     std::chrono::milliseconds _backoff)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      backoff(_backoff),
      failedAttempts(0) {}

int RetryingConnector::connect() {
  while (true) {
    int fd = socketHandler->connect(endpoint);
    if (fd != -1) {
      CLOG(INFO, "stdout") << "[publisher] connected to " << endpoint << endl;
      return fd;
    }
    failedAttempts++;
    LOG_EVERY_N(10, INFO) << "In reconnect loop " << endpoint;
    CLOG(INFO, "stdout") << "[publisher] connect failed: " << endpoint
                         << " -> retry in " << backoff.count() << "ms" << endl;
    waitBeforeRetry();
  }
}

void RetryingConnector::waitBeforeRetry() {
  std::this_thread::sleep_for(backoff);
}
}  // namespace fj
