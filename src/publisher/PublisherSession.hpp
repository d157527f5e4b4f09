#ifndef __FJ_PUBLISHER_SESSION__
#define __FJ_PUBLISHER_SESSION__

#include "Connector.hpp"
#include "DeliverySimulator.hpp"
#include "Headers.hpp"
#include "PacedWriter.hpp"
#include "RandomSource.hpp"
#include "SocketHandler.hpp"

namespace fj {
/**
 * @brief Interactive driver: one scenario per command over one persistent
 * connection.
 *
 * Owns the sequence counter, the response code cycle and the connection.
 * A failed delivery drops the connection; the next command reconnects.
 */
class PublisherSession {
 public:
  /** @brief Response codes handed out round robin, one per command. */
  static const vector<int> RESPONSE_CODE_CYCLE;

  PublisherSession(shared_ptr<SocketHandler> _socketHandler,
                   shared_ptr<Connector> _connector,
                   shared_ptr<DeliverySimulator> _simulator,
                   shared_ptr<RandomSource> _rng,
                   const DeliveryConfig& _config);
  virtual ~PublisherSession();

  /**
   * @brief Runs the scenario named by `line` ("1".."4").
   * @return true when the delivery completed.  Invalid keys and failed
   * deliveries return false.
   */
  bool handleCommand(const string& line);

  /** @brief Processes commands from `in` until end of input. */
  void run(istream& in);

  /** @brief Closes the connection, if any. */
  void disconnect();

  bool isConnected() const { return socketFd != -1; }

  int64_t getSequenceNumber() const { return sequenceNumber; }

  int64_t getCommandCount() const { return commandCount; }

  const DeliveryReport& getLastReport() const { return lastReport; }

  /** @brief Prints the key legend shown before the first prompt. */
  static void printBanner();

  static string describe(const DeliveryReport& report);

 protected:
  int takeResponseCode();
  void ensureConnected();
  virtual shared_ptr<PacedWriter> createWriter(int fd);

  shared_ptr<SocketHandler> socketHandler;
  shared_ptr<Connector> connector;
  shared_ptr<DeliverySimulator> simulator;
  shared_ptr<RandomSource> rng;
  DeliveryConfig config;

  int socketFd;
  shared_ptr<PacedWriter> writer;
  int64_t sequenceNumber;
  int64_t commandCount;
  DeliveryReport lastReport;
};
}  // namespace fj

#endif  // __FJ_PUBLISHER_SESSION__
