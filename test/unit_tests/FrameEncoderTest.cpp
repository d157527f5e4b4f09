#include "DeliveryErrors.hpp"
#include "FixedMessageSource.hpp"
#include "FrameEncoder.hpp"
#include "TestHeaders.hpp"

using namespace fj;

namespace {
const string EXPECTED_SEQ_7 =
    "{\"res\":1,\"driver_instance_id\":1,\"seq_no\":7,"
    "\"pub_timestamp\":1700000000000,\"command\":3,\"measure\":1,"
    "\"work_type\":2,\"payload\":{\"fork_height_mm\":750,"
    "\"fork_forward_mm\":1200,\"note\":\"hello_tablet\"}}";
}

TEST_CASE("FrameEncoder emits compact JSON in wire order", "[FrameEncoder]") {
  FrameEncoder encoder(make_shared<FixedMessageSource>());
  string frame = encoder.encode(7, 1, TerminatorMode::NONE);
  REQUIRE(frame == EXPECTED_SEQ_7);
  REQUIRE(frame.find(' ') == string::npos);
  REQUIRE(frame.find('\n') == string::npos);
}

TEST_CASE("FrameEncoder appends a single newline terminator",
          "[FrameEncoder]") {
  FrameEncoder encoder(make_shared<FixedMessageSource>());
  string frame = encoder.encode(7, 1, TerminatorMode::NEWLINE);
  REQUIRE(frame == EXPECTED_SEQ_7 + "\n");
  REQUIRE(std::count(frame.begin(), frame.end(), '\n') == 1);
}

TEST_CASE("FrameEncoder passes UTF-8 through unescaped", "[FrameEncoder]") {
  SampleMessage message;
  message.note = "\xED\x83\x9C\xEB\xB8\x94\xEB\xA6\xBF";
  string frame = FrameEncoder::serialize(message, TerminatorMode::NONE);
  REQUIRE(frame.find(message.note) != string::npos);
  REQUIRE(frame.find("\\u") == string::npos);
}

TEST_CASE("FrameEncoder reports unserializable records", "[FrameEncoder]") {
  // A lone continuation byte is not valid UTF-8
  FrameEncoder encoder(make_shared<FixedMessageSource>("bad\x80note"));
  REQUIRE_THROWS_AS(encoder.encode(1, 0, TerminatorMode::NONE), EncodingError);
}

TEST_CASE("Terminator modes parse by name", "[FrameEncoder]") {
  REQUIRE(parseTerminatorMode("none") == TerminatorMode::NONE);
  REQUIRE(parseTerminatorMode("newline") == TerminatorMode::NEWLINE);
  REQUIRE(terminatorModeName(TerminatorMode::NEWLINE) == "newline");
  REQUIRE_THROWS_AS(parseTerminatorMode("crlf"), InvalidArgument);
  REQUIRE_THROWS_AS(parseTerminatorMode(""), InvalidArgument);
}

TEST_CASE("RandomMessageSource fills fields inside their ranges",
          "[FrameEncoder]") {
  RandomMessageSource source(make_shared<SeededRandomSource>(99));
  for (int i = 0; i < 200; ++i) {
    SampleMessage message = source.generate(i + 1, 99);
    REQUIRE(message.seqNo == i + 1);
    REQUIRE(message.responseCode == 99);
    REQUIRE(message.driverInstanceId == 1);
    REQUIRE((message.command == 0 || message.command == 3));
    REQUIRE(message.measure >= 0);
    REQUIRE(message.measure <= 1);
    REQUIRE(message.workType >= 0);
    REQUIRE(message.workType <= 2);
    REQUIRE(message.forkHeightMm >= 0);
    REQUIRE(message.forkHeightMm <= 1500);
    REQUIRE(message.forkForwardMm >= 0);
    REQUIRE(message.forkForwardMm <= 3000);
    REQUIRE(message.pubTimestampMs > 0);
    REQUIRE(message.note == "hello_tablet");
  }

  auto parsed = json::parse(
      FrameEncoder::serialize(source.generate(5, 2), TerminatorMode::NONE));
  REQUIRE(parsed["seq_no"] == 5);
  REQUIRE(parsed["res"] == 2);
  REQUIRE(parsed["payload"]["note"] == "hello_tablet");
}
