#pragma once

// sortie/observability.hpp: Engine events and aggregated statistics.
//
// DESIGN:
//   EngineEvent is the observable unit. The orchestrator emits one per goal
//   and candidate lifecycle transition and one per plan step. Each event is
//   recorded in the owning engine's EngineStats and then forwarded to the
//   process-wide hook, or, when no hook is set, appended as a JSONL line to
//   the file named by SORTIE_EVENT_LOG.
//
// INVARIANT: emission never throws and never blocks on more than a short
// in-memory lock and one file append.

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace sortie {

enum class EventKind {
  goal_submitted,
  planning_started,
  plan_created,
  candidate_started,
  step_started,
  step_completed,
  step_rejected,
  candidate_finished,
  goal_completed,
  goal_failed,
  goal_cancelled,
};

std::string to_string(EventKind kind);

struct EngineEvent {
  EventKind kind{EventKind::goal_submitted};
  std::string goal_id;
  std::string plan_id;
  std::string step_id;
  std::string tool_id;
  bool ok{true};
  std::uint64_t duration_ns{0};
  std::string detail;
  std::uint64_t timestamp_ms{0};
};

std::string event_to_json(const EngineEvent& ev);

// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);
  // p in [0.0, 1.0]. Returns microseconds, 0.0 with no samples.
  double percentile(double p) const;
  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;
  std::string to_json() const;

 private:
  std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  std::atomic<std::uint64_t> count_{0};
  std::atomic<std::uint64_t> sum_us_{0};
};

// Per-engine statistics. Counters are atomic; the recent-event ring is
// guarded by its own mutex.
class EngineStats {
 public:
  static constexpr std::size_t kMaxRecentEvents = 1000;

  void record(const EngineEvent& ev);
  std::vector<EngineEvent> recent_events_snapshot() const;
  std::string to_json() const;

  std::atomic<std::uint64_t> goals_submitted{0};
  std::atomic<std::uint64_t> goals_completed{0};
  std::atomic<std::uint64_t> goals_failed{0};
  std::atomic<std::uint64_t> goals_cancelled{0};
  std::atomic<std::uint64_t> candidates_run{0};
  std::atomic<std::uint64_t> steps_ok{0};
  std::atomic<std::uint64_t> steps_failed{0};
  std::atomic<std::uint64_t> steps_rejected{0};
  std::atomic<std::uint64_t> sandboxes_created{0};
  std::atomic<std::uint64_t> sandboxes_cleaned{0};
  std::atomic<std::uint64_t> cleanup_failures{0};

  LatencyHistogram step_latency;

 private:
  mutable std::mutex ring_mu_;
  std::vector<EngineEvent> ring_buffer_;
  std::size_t ring_head_{0};
};

using EngineEventHook = void (*)(const EngineEvent&);
void set_engine_event_hook(EngineEventHook hook);

// Records into `stats` (when non-null) and forwards to the sink.
void emit_engine_event(EngineStats* stats, EngineEvent ev);

struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace sortie
