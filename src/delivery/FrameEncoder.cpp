#include "FrameEncoder.hpp"

#include "DeliveryErrors.hpp"

namespace fj {
TerminatorMode parseTerminatorMode(const string &mode) {
  if (mode == "none") {
    return TerminatorMode::NONE;
  }
  if (mode == "newline") {
    return TerminatorMode::NEWLINE;
  }
  throw InvalidArgument("Invalid delimiter (expected none|newline): " + mode);
}

string terminatorModeName(TerminatorMode mode) {
  return mode == TerminatorMode::NEWLINE ? "newline" : "none";
}

string FrameEncoder::encode(int64_t seqNo, int responseCode,
                            TerminatorMode terminator) {
  return serialize(messageSource->generate(seqNo, responseCode), terminator);
}

ordered_json FrameEncoder::toJson(const SampleMessage &message) {
  ordered_json j;
  j["res"] = message.responseCode;
  j["driver_instance_id"] = message.driverInstanceId;
  j["seq_no"] = message.seqNo;
  j["pub_timestamp"] = message.pubTimestampMs;
  j["command"] = message.command;
  j["measure"] = message.measure;
  j["work_type"] = message.workType;
  j["payload"]["fork_height_mm"] = message.forkHeightMm;
  j["payload"]["fork_forward_mm"] = message.forkForwardMm;
  j["payload"]["note"] = message.note;
  return j;
}

string FrameEncoder::serialize(const SampleMessage &message,
                               TerminatorMode terminator) {
  string body;
  try {
    // dump() with no indent emits no whitespace between tokens and passes
    // UTF-8 through unescaped.
    body = toJson(message).dump();
  } catch (const nlohmann::json::exception &e) {
    throw EncodingError(string("Cannot serialize message seq_no=") +
                        to_string(message.seqNo) + ": " + e.what());
  }
  if (terminator == TerminatorMode::NEWLINE) {
    body += '\n';
  }
  VLOG(2) << "Encoded seq_no=" << message.seqNo << " into " << body.length()
          << " bytes";
  return body;
}
}  // namespace fj
