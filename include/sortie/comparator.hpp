#pragma once

// sortie/comparator.hpp: Deterministic scoring and ranking of candidate outcomes.
//
// SCORING (additive; one reason per non-zero contribution):
//   base        success +50, failure +10 (error text added as a reason)
//   completion  completed / (completed + failed) * 30, 0 when nothing ran
//   time        < 30,000 ms +10, < 60,000 ms +5
//   cost        only when present: < $0.01 +10, < $0.05 +5
//
// ORDERING:
//   Descending score. A non-finite score sorts after every finite one. Ties
//   break by plan_id then sandbox_id, so the ranking is a pure function of
//   the input set and does not depend on completion order. Ranks are 1..N.
//
// A non-finite cost earns no cost bonus and is reported as a reason.

#include <optional>
#include <string>
#include <vector>

#include "sortie/types.hpp"

namespace sortie {

ScoredResult score_result(const ExecutionResult& result);

std::vector<ScoredResult> compare_and_rank(std::vector<ExecutionResult> results);

// Rank-1 entry of compare_and_rank(), or nullopt for empty input.
std::optional<ScoredResult> get_best_result(std::vector<ExecutionResult> results);

std::string format_comparison(const std::vector<ScoredResult>& ranked);

// BLAKE3 over the canonical JSON of a ranking.
std::string ranking_digest(const std::vector<ScoredResult>& ranked);

}  // namespace sortie
