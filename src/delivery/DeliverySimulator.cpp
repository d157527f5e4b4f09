#include "DeliverySimulator.hpp"

#include "DeliveryErrors.hpp"

namespace fj {
void DeliveryConfig::validate() const {
  if (minChunk <= 0) {
    throw InvalidArgument("min_chunk must be >= 1");
  }
  if (maxChunk < minChunk) {
    throw InvalidArgument("max_chunk must be >= min_chunk");
  }
  if (jitterMs < 0) {
    throw InvalidArgument("jitter_ms must be >= 0");
  }
}

const int64_t DeliverySimulator::MIN_WITHHELD_BYTES;
const int64_t DeliverySimulator::MAX_WITHHELD_BYTES;

DeliverySimulator::DeliverySimulator(shared_ptr<FrameEncoder> _encoder,
                                     shared_ptr<RandomSource> _rng)
    : encoder(_encoder), rng(_rng) {}

DeliveryReport DeliverySimulator::deliver(Scenario scenario,
                                          int64_t sequenceNumber,
                                          int responseCode,
                                          const DeliveryConfig& config,
                                          PacedWriter* writer) {
  config.validate();

  DeliveryReport report;
  report.scenario = scenario;
  report.responseCode = responseCode;
  report.firstSequenceNumber = sequenceNumber;
  report.lastSequenceNumber = sequenceNumber;
  report.nextSequenceNumber = sequenceNumber + 1;

  switch (scenario) {
    case Scenario::ATOMIC_FRAME:
      deliverAtomic(config, writer, &report);
      break;
    case Scenario::FRAGMENTED_FRAME:
      deliverFragmented(config, writer, &report);
      break;
    case Scenario::INCOMPLETE_FRAME:
      deliverIncomplete(config, writer, &report);
      break;
    case Scenario::COALESCED_FRAMES:
      report.lastSequenceNumber = sequenceNumber + 1;
      report.nextSequenceNumber = sequenceNumber + 2;
      deliverCoalesced(config, writer, &report);
      break;
    default:
      throw InvalidArgument("Unknown scenario: " + to_string(int(scenario)));
  }

  LOG(INFO) << scenario << " res=" << responseCode
            << " seq_no=" << report.firstSequenceNumber << ".."
            << report.lastSequenceNumber << " wrote " << report.bytesWritten
            << "/" << report.encodedBytes << " bytes in " << report.chunkCount
            << " chunk(s)";
  return report;
}

void DeliverySimulator::deliverAtomic(const DeliveryConfig& config,
                                      PacedWriter* writer,
                                      DeliveryReport* report) {
  string payload = encoder->encode(report->firstSequenceNumber,
                                   report->responseCode, config.terminator);
  report->encodedBytes = payload.length();
  writer->writeAll(payload);
  report->bytesWritten = payload.length();
  report->chunkCount = 1;
}

void DeliverySimulator::deliverFragmented(const DeliveryConfig& config,
                                          PacedWriter* writer,
                                          DeliveryReport* report) {
  string payload = encoder->encode(report->firstSequenceNumber,
                                   report->responseCode, config.terminator);
  report->encodedBytes = payload.length();

  int64_t requested = rng->uniformInt(config.minChunk, config.maxChunk);
  ChunkPlan plan = ChunkSplitter::split(payload.length(), requested);
  VLOG(1) << "Fragmenting " << payload.length() << " bytes: requested "
          << requested << " chunks, planned " << plan.size();

  writer->writeChunks(payload, plan, config.jitterMs);
  report->bytesWritten = payload.length();
  report->chunkCount = plan.size();
}

void DeliverySimulator::deliverIncomplete(const DeliveryConfig& config,
                                          PacedWriter* writer,
                                          DeliveryReport* report) {
  string payload = encoder->encode(report->firstSequenceNumber,
                                   report->responseCode, config.terminator);
  int64_t length = int64_t(payload.length());
  report->encodedBytes = payload.length();
  if (length == 0) {
    report->chunkCount = 0;
    return;
  }

  int64_t withheld = rng->uniformInt(MIN_WITHHELD_BYTES, MAX_WITHHELD_BYTES);
  // At least one byte always goes out, even if that leaves nothing withheld
  // for a one byte payload.
  int64_t cut = std::min(length, std::max(int64_t(1), length - withheld));
  writer->writeAll(payload.substr(0, cut));
  report->bytesWritten = size_t(cut);
  report->chunkCount = 1;
}

void DeliverySimulator::deliverCoalesced(const DeliveryConfig& config,
                                         PacedWriter* writer,
                                         DeliveryReport* report) {
  string first = encoder->encode(report->firstSequenceNumber,
                                 report->responseCode, config.terminator);
  string second = encoder->encode(report->lastSequenceNumber,
                                  report->responseCode, config.terminator);
  string payload = first + second;
  report->encodedBytes = payload.length();
  writer->writeAll(payload);
  report->bytesWritten = payload.length();
  report->chunkCount = 1;
}
}  // namespace fj
