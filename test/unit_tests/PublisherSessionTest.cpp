#include "FixedMessageSource.hpp"
#include "JsonLib.hpp"
#include "PublisherSession.hpp"
#include "RecordingSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace fj;

namespace {
// Collects everything written to the "stdout" logger
class StdoutCapture : public el::LogDispatchCallback {
 public:
  bool contains(const string& text) const {
    lock_guard<std::mutex> guard(linesMutex);
    for (const auto& line : lines) {
      if (line.find(text) != string::npos) {
        return true;
      }
    }
    return false;
  }

 protected:
  void handle(const el::LogDispatchData* data) override {
    if (data->logMessage()->logger()->id() != "stdout") {
      return;
    }
    lock_guard<std::mutex> guard(linesMutex);
    lines.push_back(data->logMessage()->message());
  }

 private:
  mutable std::mutex linesMutex;
  vector<string> lines;
};

const char* STDOUT_CAPTURE_ID = "fj-test-stdout-capture";

struct ScopedStdoutCapture {
  ScopedStdoutCapture() {
    el::Helpers::installLogDispatchCallback<StdoutCapture>(STDOUT_CAPTURE_ID);
    capture = el::Helpers::logDispatchCallback<StdoutCapture>(STDOUT_CAPTURE_ID);
  }
  ~ScopedStdoutCapture() {
    el::Helpers::uninstallLogDispatchCallback<StdoutCapture>(
        STDOUT_CAPTURE_ID);
  }

  StdoutCapture* capture;
};

struct SessionFixture {
  explicit SessionFixture(DeliveryConfig config = quietConfig())
      : handler(make_shared<RecordingSocketHandler>()),
        rng(make_shared<SeededRandomSource>(17)) {
    connector = make_shared<RetryingConnector>(
        handler, SocketEndpoint("127.0.0.1", 8051),
        std::chrono::milliseconds(0));
    auto encoder = make_shared<FrameEncoder>(make_shared<FixedMessageSource>());
    auto simulator = make_shared<DeliverySimulator>(encoder, rng);
    session.reset(
        new PublisherSession(handler, connector, simulator, rng, config));
  }

  static DeliveryConfig quietConfig() {
    DeliveryConfig config;
    config.jitterMs = 0;
    return config;
  }

  json lastFrame() const { return json::parse(handler->writes.back()); }

  shared_ptr<RecordingSocketHandler> handler;
  shared_ptr<SeededRandomSource> rng;
  shared_ptr<RetryingConnector> connector;
  unique_ptr<PublisherSession> session;
};
}  // namespace

TEST_CASE("PublisherSession ignores unknown keys", "[PublisherSession]") {
  SessionFixture f;
  REQUIRE_FALSE(f.session->handleCommand("5"));
  REQUIRE_FALSE(f.session->handleCommand(""));
  REQUIRE_FALSE(f.session->handleCommand("12"));
  REQUIRE(f.session->getCommandCount() == 0);
  REQUIRE(f.handler->connectAttempts == 0);
  REQUIRE_FALSE(f.session->isConnected());
}

TEST_CASE("PublisherSession cycles response codes per command",
          "[PublisherSession]") {
  SessionFixture f;
  vector<int> codes;
  vector<int64_t> seqNos;
  for (int i = 0; i < 6; ++i) {
    REQUIRE(f.session->handleCommand("1"));
    codes.push_back(f.lastFrame()["res"].get<int>());
    seqNos.push_back(f.lastFrame()["seq_no"].get<int64_t>());
    if (i == 2) {
      // Invalid keys do not consume a response code
      REQUIRE_FALSE(f.session->handleCommand("x"));
    }
  }
  REQUIRE(codes == vector<int>({0, 1, 2, 99, 0, 1}));
  REQUIRE(seqNos == vector<int64_t>({1, 2, 3, 4, 5, 6}));
  REQUIRE(f.session->getSequenceNumber() == 7);
  REQUIRE(f.handler->connectAttempts == 1);
}

TEST_CASE("PublisherSession trims command input", "[PublisherSession]") {
  SessionFixture f;
  REQUIRE(f.session->handleCommand("  2 \r\n"));
  REQUIRE(f.session->getLastReport().scenario == Scenario::FRAGMENTED_FRAME);
}

TEST_CASE("PublisherSession advances by two for coalesced frames",
          "[PublisherSession]") {
  SessionFixture f;
  REQUIRE(f.session->handleCommand("4"));
  REQUIRE(f.session->getSequenceNumber() == 3);
  REQUIRE(f.session->handleCommand("3"));
  REQUIRE(f.session->getSequenceNumber() == 4);
  REQUIRE(f.session->handleCommand("1"));
  REQUIRE(f.lastFrame()["seq_no"] == 4);
}

TEST_CASE("PublisherSession retries the connection until it succeeds",
          "[PublisherSession]") {
  SessionFixture f;
  f.handler->connectResults = {false, false, true};
  REQUIRE(f.session->handleCommand("1"));
  REQUIRE(f.handler->connectAttempts == 3);
  REQUIRE(f.connector->getFailedAttempts() == 2);
  REQUIRE(f.session->isConnected());
}

TEST_CASE("PublisherSession drops the connection after a transport failure",
          "[PublisherSession]") {
  SessionFixture f;
  REQUIRE(f.session->handleCommand("1"));
  int firstFd = f.handler->writeFds.back();

  f.handler->failOnWrite = 1;
  f.handler->failureResult = 0;
  REQUIRE_FALSE(f.session->handleCommand("1"));
  REQUIRE_FALSE(f.session->isConnected());
  REQUIRE(f.handler->closedFds == vector<int>({firstFd}));
  // The failed delivery does not consume a sequence number
  REQUIRE(f.session->getSequenceNumber() == 2);

  REQUIRE(f.session->handleCommand("1"));
  REQUIRE(f.handler->connectAttempts == 2);
  REQUIRE(f.handler->writeFds.back() != firstFd);
  REQUIRE(f.lastFrame()["seq_no"] == 2);
  // ... but it does consume a response code
  REQUIRE(f.lastFrame()["res"] == 2);
}

TEST_CASE("PublisherSession reports failures on the stdout logger",
          "[PublisherSession]") {
  ScopedStdoutCapture stdoutCapture;
  SessionFixture f;

  SECTION("Connect failures before a retry") {
    f.handler->connectResults = {false, true};
    REQUIRE(f.session->handleCommand("1"));
    REQUIRE(stdoutCapture.capture->contains(
        "[publisher] connect failed: 127.0.0.1:8051 -> retry in 0ms"));
    REQUIRE(stdoutCapture.capture->contains(
        "[publisher] connected to 127.0.0.1:8051"));
  }

  SECTION("A lost connection") {
    f.handler->failOnWrite = 0;
    f.handler->failureResult = 0;
    REQUIRE_FALSE(f.session->handleCommand("1"));
    REQUIRE(stdoutCapture.capture->contains("[publisher] connection lost: "));
  }
}

TEST_CASE("PublisherSession rejects an invalid config without connecting",
          "[PublisherSession]") {
  ScopedStdoutCapture stdoutCapture;
  DeliveryConfig config = SessionFixture::quietConfig();
  config.minChunk = 4;
  config.maxChunk = 2;
  SessionFixture f(config);
  // Any trip to the connector shows up as a failed attempt
  f.handler->connectResults = {false, false, false};

  REQUIRE_FALSE(f.session->handleCommand("2"));
  REQUIRE(f.handler->connectAttempts == 0);
  REQUIRE(f.handler->writes.empty());
  REQUIRE(f.session->getSequenceNumber() == 1);
  REQUIRE(f.session->getCommandCount() == 0);
  REQUIRE(stdoutCapture.capture->contains("[publisher] invalid configuration"));
}

TEST_CASE("PublisherSession runs until end of input", "[PublisherSession]") {
  SessionFixture f;
  std::istringstream input("1\n9\n2\n4\n");
  f.session->run(input);
  REQUIRE(f.session->getCommandCount() == 3);
  REQUIRE(f.session->getSequenceNumber() == 5);
  REQUIRE_FALSE(f.session->isConnected());
  REQUIRE(f.handler->openFds.empty());
}

TEST_CASE("PublisherSession describes deliveries", "[PublisherSession]") {
  DeliveryReport report;
  report.scenario = Scenario::INCOMPLETE_FRAME;
  report.responseCode = 2;
  report.firstSequenceNumber = report.lastSequenceNumber = 8;
  report.bytesWritten = 150;
  report.encodedBytes = 158;
  REQUIRE(PublisherSession::describe(report) ==
          "[publisher] IncompleteFrame PARTIAL res=2 seq_no=8 bytes=150 (cut "
          "from 158)");

  report.scenario = Scenario::COALESCED_FRAMES;
  report.lastSequenceNumber = 9;
  report.bytesWritten = 320;
  REQUIRE(PublisherSession::describe(report) ==
          "[publisher] CoalescedFrames CONCAT res=2 seq_no=8,9 bytes=320");

  report.scenario = Scenario::FRAGMENTED_FRAME;
  report.lastSequenceNumber = 8;
  report.bytesWritten = 158;
  report.chunkCount = 6;
  REQUIRE(PublisherSession::describe(report) ==
          "[publisher] FragmentedFrame res=2 seq_no=8 bytes=158 chunk_count=6");
}
