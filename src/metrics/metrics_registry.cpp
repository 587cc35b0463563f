#include "stream_ingest/metrics.hpp"
#include <chrono>

namespace si {

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  const double ms = std::chrono::duration<double, std::milli>(
                      std::chrono::steady_clock::now() - it->second).count();
  stage_starts_.erase(it);
  add_stage_ms(key, ms);
}

void MetricsRegistry::add_stage_ms(std::string_view name, double ms) {
  auto key = std::string(name);
  if (stage_accum_ms_.find(key) == stage_accum_ms_.end()) stage_order_.push_back(key);
  stage_accum_ms_[key] += ms;
}

void MetricsRegistry::add_error(std::string_view kind) {
  ++errs_[std::string(kind)];
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.records = records_;
  r.bytes = bytes_;
  r.chunks = chunks_;
  r.parse_errors = parse_errors_;
  r.handler_errors = handler_errors_;
  r.chunk_bytes = chunk_bytes_;
  r.carry_high_water = carry_high_water_;
  r.wall_ms = wall_ms;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0 * 1024.0)) / sec : 0.0;
  r.records_per_sec = (sec > 0.0) ? records_ / sec : 0.0;

  r.errors_by_kind = errs_;
  r.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) r.stages.push_back(StageTiming{name, stage_accum_ms_.at(name)});
  return r;
}

}
