#include "sortie/comparator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

#include "sortie/hash.hpp"
#include "sortie/serialize.hpp"

namespace sortie {

namespace {

std::string fmt(const char* format, double v) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), format, v);
  return buf;
}

bool ranks_before(const ScoredResult& a, const ScoredResult& b) {
  const bool a_ok = std::isfinite(a.score);
  const bool b_ok = std::isfinite(b.score);
  if (a_ok != b_ok) return a_ok;
  if (a_ok && a.score != b.score) return a.score > b.score;
  if (a.result.plan_id != b.result.plan_id) return a.result.plan_id < b.result.plan_id;
  return a.result.sandbox_id < b.result.sandbox_id;
}

}  // namespace

ScoredResult score_result(const ExecutionResult& result) {
  ScoredResult s;
  s.result = result;
  double score = 0.0;

  if (result.success) {
    score += 50.0;
    s.reasons.push_back("Task completed successfully");
  } else {
    score += 10.0;
    s.reasons.push_back("Task failed");
    if (result.error && !result.error->empty()) s.reasons.push_back("Error: " + *result.error);
  }

  const std::size_t total = result.steps_completed + result.steps_failed;
  if (total > 0) {
    const double rate = static_cast<double>(result.steps_completed) / static_cast<double>(total);
    const double bonus = rate * 30.0;
    if (bonus > 0.0) {
      score += bonus;
      s.reasons.push_back(fmt("Completion rate %.1f%%", rate * 100.0) + fmt(" (+%.1f)", bonus));
    }
  }

  if (result.execution_time_ms < 30000) {
    score += 10.0;
    s.reasons.push_back("Fast execution (<30s)");
  } else if (result.execution_time_ms < 60000) {
    score += 5.0;
    s.reasons.push_back("Moderate execution time (<60s)");
  }

  if (result.cost) {
    const double cost = *result.cost;
    if (!std::isfinite(cost)) {
      s.reasons.push_back("Cost unavailable (non-finite value ignored)");
    } else if (cost < 0.01) {
      score += 10.0;
      s.reasons.push_back(fmt("Low cost ($%.4f)", cost));
    } else if (cost < 0.05) {
      score += 5.0;
      s.reasons.push_back(fmt("Moderate cost ($%.4f)", cost));
    }
  }

  s.score = score;
  return s;
}

std::vector<ScoredResult> compare_and_rank(std::vector<ExecutionResult> results) {
  std::vector<ScoredResult> scored;
  scored.reserve(results.size());
  for (auto& r : results) scored.push_back(score_result(r));
  std::sort(scored.begin(), scored.end(), ranks_before);
  for (std::size_t i = 0; i < scored.size(); ++i) scored[i].rank = i + 1;
  return scored;
}

std::optional<ScoredResult> get_best_result(std::vector<ExecutionResult> results) {
  auto ranked = compare_and_rank(std::move(results));
  if (ranked.empty()) return std::nullopt;
  return ranked.front();
}

std::string format_comparison(const std::vector<ScoredResult>& ranked) {
  std::ostringstream oss;
  oss << "Result comparison (" << ranked.size() << " candidate" << (ranked.size() == 1 ? "" : "s")
      << ")\n";
  for (const auto& s : ranked) {
    oss << "#" << s.rank << " plan " << s.result.plan_id;
    if (!s.result.sandbox_id.empty()) oss << " [" << s.result.sandbox_id << "]";
    oss << " score " << fmt("%.2f", s.score) << (s.result.success ? " ok" : " failed") << "\n";
    oss << "   steps " << s.result.steps_completed << " completed, " << s.result.steps_failed
        << " failed, " << s.result.execution_time_ms << " ms\n";
    for (const auto& reason : s.reasons) oss << "   - " << reason << "\n";
  }
  return oss.str();
}

std::string ranking_digest(const std::vector<ScoredResult>& ranked) {
  jsonlite::Array arr;
  arr.reserve(ranked.size());
  for (const auto& s : ranked) arr.push_back(to_value(s));
  return hash_domain("rank:", jsonlite::to_json(jsonlite::Value{std::move(arr)}));
}

}  // namespace sortie
