#ifndef __FJ_CONNECTOR__
#define __FJ_CONNECTOR__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"
#include "SocketHandler.hpp"

namespace fj {
/**
 * @brief Establishes the transport a publisher session writes to.
 */
class Connector {
 public:
  virtual ~Connector() {}

  /** @brief Blocks until a connected fd is available. */
  virtual int connect() = 0;
};

/**
 * @brief Retries SocketHandler::connect forever with a fixed backoff.
 */
class RetryingConnector : public Connector {
 public:
  RetryingConnector(shared_ptr<SocketHandler> _socketHandler,
                    const SocketEndpoint& _endpoint,
                    std::chrono::milliseconds _backoff);
  virtual ~RetryingConnector() {}

  virtual int connect();

  /** @brief Number of failed attempts since construction. */
  int64_t getFailedAttempts() const { return failedAttempts; }

 protected:
  virtual void waitBeforeRetry();

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  std::chrono::milliseconds backoff;
  int64_t failedAttempts;
};
}  // namespace fj

#endif  // __FJ_CONNECTOR__
