#include "PublisherSession.hpp"

#include "DeliveryErrors.hpp"

namespace fj {
const vector<int> PublisherSession::RESPONSE_CODE_CYCLE = {0, 1, 2, 99};

PublisherSession::PublisherSession(shared_ptr<SocketHandler> _socketHandler,
                                   shared_ptr<Connector> _connector,
                                   shared_ptr<DeliverySimulator> _simulator,
                                   shared_ptr<RandomSource> _rng,
                                   const DeliveryConfig& _config)
    : socketHandler(_socketHandler),
      connector(_connector),
      simulator(_simulator),
      rng(_rng),
      config(_config),
      socketFd(-1),
      sequenceNumber(1),
      commandCount(0) {}

PublisherSession::~PublisherSession() { disconnect(); }

bool PublisherSession::handleCommand(const string& line) {
  Scenario scenario;
  if (!scenarioFromKey(trim(line), &scenario)) {
    CLOG(INFO, "stdout") << "[publisher] input must be 1/2/3/4" << endl;
    return false;
  }

  try {
    // Checked before any I/O
    config.validate();
  } catch (const std::invalid_argument& e) {
    STERROR << "Rejected " << scenario << ": " << e.what();
    CLOG(INFO, "stdout") << "[publisher] invalid configuration: " << e.what()
                         << endl;
    return false;
  }

  int responseCode = takeResponseCode();
  ensureConnected();

  try {
    lastReport = simulator->deliver(scenario, sequenceNumber, responseCode,
                                    config, writer.get());
  } catch (const std::runtime_error& e) {
    LOG(WARNING) << "Delivery of " << scenario << " failed: " << e.what();
    CLOG(INFO, "stdout") << "[publisher] connection lost: " << e.what()
                         << endl;
    disconnect();
    return false;
  }

  sequenceNumber = lastReport.nextSequenceNumber;
  CLOG(INFO, "stdout") << describe(lastReport) << endl;
  return true;
}

void PublisherSession::run(istream& in) {
  string line;
  while (std::getline(in, line)) {
    handleCommand(line);
  }
  CLOG(INFO, "stdout") << "[publisher] EOF received. exit." << endl;
  disconnect();
}

void PublisherSession::disconnect() {
  if (socketFd == -1) {
    return;
  }
  VLOG(1) << "Closing publisher connection on fd " << socketFd;
  writer.reset();
  socketHandler->close(socketFd);
  socketFd = -1;
}

void PublisherSession::printBanner() {
  CLOG(INFO, "stdout") << "[publisher] 1=AtomicFrame 2=FragmentedFrame "
                          "3=IncompleteFrame 4=CoalescedFrames"
                       << endl;
  CLOG(INFO, "stdout") << "[publisher] res cycles as [0,1,2,99] by input count"
                       << endl;
  CLOG(INFO, "stdout") << "[publisher] Ctrl+D to exit." << endl;
}

string PublisherSession::describe(const DeliveryReport& report) {
  stringstream ss;
  ss << "[publisher] " << report.scenario;
  switch (report.scenario) {
    case Scenario::INCOMPLETE_FRAME:
      ss << " PARTIAL";
      break;
    case Scenario::COALESCED_FRAMES:
      ss << " CONCAT";
      break;
    default:
      break;
  }
  ss << " res=" << report.responseCode << " seq_no=";
  if (report.lastSequenceNumber != report.firstSequenceNumber) {
    ss << report.firstSequenceNumber << "," << report.lastSequenceNumber;
  } else {
    ss << report.firstSequenceNumber;
  }
  ss << " bytes=" << report.bytesWritten;
  if (report.scenario == Scenario::FRAGMENTED_FRAME) {
    ss << " chunk_count=" << report.chunkCount;
  } else if (report.scenario == Scenario::INCOMPLETE_FRAME) {
    ss << " (cut from " << report.encodedBytes << ")";
  }
  return ss.str();
}

int PublisherSession::takeResponseCode() {
  int code = RESPONSE_CODE_CYCLE[commandCount % RESPONSE_CODE_CYCLE.size()];
  commandCount++;
  return code;
}

void PublisherSession::ensureConnected() {
  if (socketFd != -1) {
    return;
  }
  socketFd = connector->connect();
  if (socketFd == -1) {
    STFATAL << "Connector returned an invalid fd";
  }
  writer = createWriter(socketFd);
}

shared_ptr<PacedWriter> PublisherSession::createWriter(int fd) {
  return shared_ptr<PacedWriter>(new PacedWriter(socketHandler, fd, rng));
}
}  // namespace fj
