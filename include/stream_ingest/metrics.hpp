#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace si {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct RunStats {
  std::uint64_t records = 0;
  std::uint64_t bytes = 0;
  std::uint64_t chunks = 0;
  std::uint64_t parse_errors = 0;
  std::uint64_t handler_errors = 0;
  std::size_t chunk_bytes = 0;
  std::size_t carry_high_water = 0;
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
};

// Single-threaded accumulator; the pipeline feeds it from the consumer side
// and merges producer figures after the producer has been joined.
class MetricsRegistry {
public:
  void add_chunk(std::uint64_t bytes) noexcept { ++chunks_; bytes_ += bytes; }
  void set_records(std::uint64_t n) noexcept { records_ = n; }
  void set_parse_errors(std::uint64_t n) noexcept { parse_errors_ = n; }
  void set_handler_errors(std::uint64_t n) noexcept { handler_errors_ = n; }
  void set_chunk_bytes(std::size_t n) noexcept { chunk_bytes_ = n; }
  void set_carry_high_water(std::size_t n) noexcept { carry_high_water_ = n; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);
  void add_stage_ms(std::string_view name, double ms);

  void add_error(std::string_view kind);
  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t records_{0};
  std::uint64_t bytes_{0};
  std::uint64_t chunks_{0};
  std::uint64_t parse_errors_{0};
  std::uint64_t handler_errors_{0};
  std::size_t chunk_bytes_{0};
  std::size_t carry_high_water_{0};
  std::unordered_map<std::string, std::uint64_t> errs_;
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
