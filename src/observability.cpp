#include "sortie/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <exception>

#include "sortie/jsonlite.hpp"
#include "sortie/log.hpp"
#include "sortie/types.hpp"

namespace sortie {

namespace {

inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_us));
  return b >= LatencyHistogram::kBuckets ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<EngineEventHook> g_event_hook{nullptr};

}  // namespace

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::goal_submitted: return "goal_submitted";
    case EventKind::planning_started: return "planning_started";
    case EventKind::plan_created: return "plan_created";
    case EventKind::candidate_started: return "candidate_started";
    case EventKind::step_started: return "step_started";
    case EventKind::step_completed: return "step_completed";
    case EventKind::step_rejected: return "step_rejected";
    case EventKind::candidate_finished: return "candidate_finished";
    case EventKind::goal_completed: return "goal_completed";
    case EventKind::goal_failed: return "goal_failed";
    case EventKind::goal_cancelled: return "goal_cancelled";
  }
  return "unknown";
}

std::string event_to_json(const EngineEvent& ev) {
  jsonlite::Object o;
  o["kind"] = to_string(ev.kind);
  o["goal_id"] = ev.goal_id;
  if (!ev.plan_id.empty()) o["plan_id"] = ev.plan_id;
  if (!ev.step_id.empty()) o["step_id"] = ev.step_id;
  if (!ev.tool_id.empty()) o["tool_id"] = ev.tool_id;
  o["ok"] = ev.ok;
  o["duration_ns"] = jsonlite::Value{ev.duration_ns};
  if (!ev.detail.empty()) o["detail"] = ev.detail;
  o["ts_ms"] = jsonlite::Value{ev.timestamp_ms};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  const auto target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = i == 0 ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  jsonlite::Object o;
  o["count"] = jsonlite::Value{count()};
  o["mean_us"] = mean_us();
  o["p50_us"] = percentile(0.50);
  o["p95_us"] = percentile(0.95);
  o["p99_us"] = percentile(0.99);
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record(const EngineEvent& ev) {
  switch (ev.kind) {
    case EventKind::goal_submitted: goals_submitted.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::goal_completed: goals_completed.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::goal_failed: goals_failed.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::goal_cancelled: goals_cancelled.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::candidate_started: candidates_run.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::step_rejected: steps_rejected.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::step_completed:
      (ev.ok ? steps_ok : steps_failed).fetch_add(1, std::memory_order_relaxed);
      step_latency.record(ev.duration_ns);
      break;
    default: break;
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::vector<EngineEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  std::vector<EngineEvent> out;
  out.reserve(ring_buffer_.size());
  // Oldest first.
  for (std::size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string EngineStats::to_json() const {
  auto u = [](const std::atomic<std::uint64_t>& a) {
    return jsonlite::Value{a.load(std::memory_order_relaxed)};
  };
  jsonlite::Object goals{{"submitted", u(goals_submitted)},
                         {"completed", u(goals_completed)},
                         {"failed", u(goals_failed)},
                         {"cancelled", u(goals_cancelled)}};
  jsonlite::Object steps{{"ok", u(steps_ok)}, {"failed", u(steps_failed)}, {"rejected", u(steps_rejected)}};
  jsonlite::Object sandboxes{{"created", u(sandboxes_created)},
                             {"cleaned", u(sandboxes_cleaned)},
                             {"cleanup_failures", u(cleanup_failures)}};
  std::optional<jsonlite::JsonError> err;
  auto latency = jsonlite::parse_value(step_latency.to_json(), &err);

  jsonlite::Object o;
  o["goals"] = std::move(goals);
  o["candidates_run"] = u(candidates_run);
  o["steps"] = std::move(steps);
  o["sandboxes"] = std::move(sandboxes);
  o["step_latency"] = latency ? *latency : jsonlite::Value{};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

// ---------------------------------------------------------------------------
// Event emission
// ---------------------------------------------------------------------------

void set_engine_event_hook(EngineEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_engine_event(EngineStats* stats, EngineEvent ev) {
  if (ev.timestamp_ms == 0) ev.timestamp_ms = now_unix_ms();
  if (stats) stats->record(ev);

  if (EngineEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    try {
      hook(ev);
    } catch (const std::exception& e) {
      log_warn("observability", "event hook failed for " + to_string(ev.kind) + ": " + e.what());
    }
    return;
  }

  // Activation: SORTIE_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("SORTIE_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';
  // O_APPEND writes below PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace sortie
