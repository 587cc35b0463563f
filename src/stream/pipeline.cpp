#include "stream_ingest/pipeline.hpp"
#include "stream_ingest/chunk_channel.hpp"
#include "stream_ingest/chunk_source.hpp"
#include "stream_ingest/stream_digest.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <thread>

namespace si {

const char* to_string(RunStatus s) noexcept {
  switch (s) {
    case RunStatus::Ok:          return "ok";
    case RunStatus::Cancelled:   return "cancelled";
    case RunStatus::ReadError:   return "read_error";
    case RunStatus::ConfigError: return "config_error";
  }
  return "unknown";
}

IngestPipeline::IngestPipeline(PositionalReader& reader, IngestConfig cfg)
  : reader_(reader), cfg_(std::move(cfg)) {}

RunResult IngestPipeline::run(const RecordHandler& handler, const CancelToken& cancel,
                              const ErrorCallback& on_error) {
  namespace ch = std::chrono;
  using Clock = CancelToken::Clock;
  RunResult out;

  MetricsRegistry metrics;
  metrics.set_chunk_bytes(cfg_.chunk_bytes);
  ErrorCallback collect = [&](const IngestError& e) {
    metrics.add_error(to_string(e.kind));
    if (out.errors.size() < cfg_.max_reported_errors) out.errors.push_back(e);
    else ++out.errors_dropped;
    if (on_error) on_error(e);
  };

  std::string err;
  if (!validate(cfg_, &err)) {
    out.status = RunStatus::ConfigError;
    out.error = err;
    collect(IngestError{IngestError::Kind::Config, err, 0});
    out.stats = metrics.snapshot(0.0);
    return out;
  }

  // Run-local token: fires on the caller's token, its deadline, or our timeout.
  std::optional<Clock::time_point> deadline = cancel.deadline();
  if (cfg_.timeout_ms > 0) {
    auto t = Clock::now() + ch::milliseconds(cfg_.timeout_ms);
    deadline = deadline ? std::min(*deadline, t) : t;
  }
  CancelToken run_cancel = deadline ? CancelToken::with_deadline(*deadline) : CancelToken();
  CancelRegistration link(cancel, [run_cancel]{ run_cancel.cancel(); });
  if (cancel.cancel_requested()) run_cancel.cancel();

  RecordReassembler reassembler(cfg_.reassembly, handler, collect);
  ChunkChannel channel;
  ChunkSource source(reader_, ChunkSource::Config{cfg_.chunk_bytes});
  std::optional<StreamDigest> digest;
  bool digest_ok = cfg_.digest;
  if (cfg_.digest) digest.emplace();

  const auto t0 = Clock::now();

  SourceStatus src_status = SourceStatus::Exhausted;
  std::string producer_error;
  double produce_ms = 0.0;
  std::thread producer([&]{
    const auto p0 = Clock::now();
    try {
      src_status = source.run(channel, run_cancel);
    } catch (const std::exception& e) {
      producer_error = e.what();
      src_status = SourceStatus::ReadError;
      channel.fail();
    }
    produce_ms = ch::duration<double, std::milli>(Clock::now() - p0).count();
  });

  ConsumeStatus consumed = ConsumeStatus::Completed;
  metrics.start_stage("consume");
  try {
    consumed = reassembler.consume(channel, run_cancel, [&](const Chunk& c){
      metrics.add_chunk(c.size());
      if (digest && digest_ok) digest_ok = digest->update(c.view());
    });
  } catch (const std::exception&) {
    // Release the producer before unwinding past its thread.
    run_cancel.cancel();
    channel.close();
    producer.join();
    throw;
  }
  metrics.end_stage("consume");
  producer.join();
  metrics.add_stage_ms("produce", produce_ms);

  if (src_status == SourceStatus::ReadError) {
    out.status = RunStatus::ReadError;
    out.error = producer_error.empty() ? source.last_error() : producer_error;
    collect(IngestError{IngestError::Kind::Read, out.error, source.offset()});
  } else if (consumed == ConsumeStatus::Cancelled || src_status == SourceStatus::Cancelled) {
    out.status = RunStatus::Cancelled;
    out.error = cancel.cancel_requested() ? "cancelled" : "deadline exceeded";
  } else {
    out.status = RunStatus::Ok;
    if (digest && digest_ok) out.sha256 = digest->finish_hex();
    else if (digest) std::cerr << "[ingest] digest disabled: " << digest->error() << "\n";
  }

  metrics.set_records(reassembler.records());
  metrics.set_parse_errors(reassembler.parse_errors());
  metrics.set_handler_errors(reassembler.handler_errors());
  metrics.set_carry_high_water(reassembler.carry_high_water());
  const double wall_ms = ch::duration<double, std::milli>(Clock::now() - t0).count();
  out.stats = metrics.snapshot(wall_ms);
  return out;
}

}
