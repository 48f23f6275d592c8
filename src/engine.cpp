#include "sortie/engine.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "sortie/comparator.hpp"
#include "sortie/hash.hpp"
#include "sortie/log.hpp"
#include "sortie/serialize.hpp"

namespace sortie {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kPlanningHistory = 20;

double importance_for(Priority p) {
  switch (p) {
    case Priority::low: return 0.25;
    case Priority::medium: return 0.5;
    case Priority::high: return 0.75;
    case Priority::critical: return 1.0;
  }
  return 0.5;
}

EventKind terminal_event(GoalState s) {
  switch (s) {
    case GoalState::completed: return EventKind::goal_completed;
    case GoalState::cancelled: return EventKind::goal_cancelled;
    default: return EventKind::goal_failed;
  }
}

ContextEntry entry(std::string event, jsonlite::Value data) {
  return ContextEntry{now_unix_ms(), std::move(event), std::move(data)};
}

}  // namespace

Engine::Engine(EngineConfig config, std::shared_ptr<IPlanOracle> oracle,
               std::shared_ptr<IToolRegistry> tools, std::shared_ptr<ICriteriaEvaluator> criteria)
    : config_(std::move(config)),
      oracle_(std::move(oracle)),
      tools_(std::move(tools)),
      criteria_(std::move(criteria)),
      sandboxes_(SandboxConfig{config_.sandbox_root, config_.repo_dir}),
      resources_(config_.resource_limits),
      learning_(LearningConfig{config_.enable_learning, config_.enable_self_improvement,
                               config_.max_experiences}),
      memory_(config_.memory_max_entries),
      executor_(sandboxes_, resources_, learning_, memory_,
                tools_ ? *tools_ : throw std::invalid_argument("Engine requires a tool registry"),
                criteria_.get(), &stats_) {
  if (!oracle_) throw std::invalid_argument("Engine requires a plan oracle");
}

Engine::~Engine() { stop(); }

bool Engine::start(std::string* error) {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (started_ || stopped_) {
    if (error) *error = stopped_ ? to_string(ErrorCode::engine_stopped) : "engine already started";
    return false;
  }
  auto validation = config_.validate();
  for (const auto& w : validation.warnings) log_warn("config", w);
  if (!validation.ok) {
    if (error) {
      std::string joined;
      for (const auto& e : validation.errors) joined += (joined.empty() ? "" : "; ") + e;
      *error = "invalid configuration: " + joined;
    }
    return false;
  }
  goal_pool_ = std::make_unique<WorkerPool>(config_.max_concurrent_goals);
  candidate_pool_ = std::make_unique<WorkerPool>(config_.worker_threads);
  owner_ = std::thread([this] { owner_loop(); });
  started_ = true;
  log_info("engine", "started with " + std::to_string(config_.worker_threads) +
                         " candidate workers, " + std::to_string(config_.max_concurrent_goals) +
                         " concurrent goals");
  return true;
}

bool Engine::running() const {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  return started_ && !stopped_;
}

void Engine::stop() {
  {
    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    if (stopped_) return;
    stopped_ = true;
    if (!started_) return;
  }
  inbox_.push(ShutdownCmd{});
  if (owner_.joinable()) owner_.join();
  goal_pool_->shutdown();
  candidate_pool_->shutdown();
  const std::size_t failures = sandboxes_.cleanup_all();
  if (failures > 0) {
    stats_.cleanup_failures.fetch_add(failures, std::memory_order_relaxed);
    log_error("engine", std::to_string(failures) + " sandbox(es) could not be removed at shutdown");
  }
  log_info("engine", "stopped");
}

void Engine::post(Command cmd) {
  if (!inbox_.push(std::move(cmd))) {
    log_debug("engine", "message dropped after shutdown");
  }
}

// ---------------------------------------------------------------------------
// Public API: each call is one round trip to the owner thread.
// ---------------------------------------------------------------------------

std::optional<std::string> Engine::submit_goal(Goal goal, std::string* error) {
  if (goal.description.empty()) {
    if (error) *error = to_string(ErrorCode::invalid_goal) + ": description is required";
    return std::nullopt;
  }
  if (!running()) {
    if (error) *error = to_string(ErrorCode::engine_stopped) + ": engine is not running";
    return std::nullopt;
  }
  SubmitCmd cmd{std::move(goal), {}};
  auto fut = cmd.reply.get_future();
  if (!inbox_.push(std::move(cmd))) {
    if (error) *error = to_string(ErrorCode::engine_stopped);
    return std::nullopt;
  }
  SubmitReply reply = fut.get();
  if (reply.goal_id.empty()) {
    if (error) *error = reply.error;
    return std::nullopt;
  }
  return reply.goal_id;
}

std::optional<ExecutionContext> Engine::get_goal_status(const std::string& goal_id) {
  QueryCmd cmd{goal_id, {}};
  auto fut = cmd.reply.get_future();
  if (!inbox_.push(std::move(cmd))) return std::nullopt;
  return fut.get();
}

std::vector<Goal> Engine::list_goals() {
  ListCmd cmd;
  auto fut = cmd.reply.get_future();
  if (!inbox_.push(std::move(cmd))) return {};
  return fut.get();
}

bool Engine::cancel_goal(const std::string& goal_id) {
  CancelCmd cmd{goal_id, {}};
  auto fut = cmd.reply.get_future();
  if (!inbox_.push(std::move(cmd))) return false;
  return fut.get();
}

std::optional<GoalState> Engine::wait_for_goal(const std::string& goal_id,
                                               std::chrono::milliseconds timeout) {
  WaitCmd cmd{goal_id, {}};
  auto fut = cmd.reply.get_future();
  if (!inbox_.push(std::move(cmd))) return std::nullopt;
  if (fut.wait_for(timeout) != std::future_status::ready) return std::nullopt;
  return fut.get();
}

// ---------------------------------------------------------------------------
// Owner thread
// ---------------------------------------------------------------------------

void Engine::owner_loop() {
  const auto interval = std::chrono::milliseconds(config_.learning_update_interval_ms);
  auto last_tick = Clock::now();
  while (true) {
    if (auto cmd = inbox_.pop_for(interval)) handle(*cmd);
    if (Clock::now() - last_tick >= interval) {
      learning_.update();
      last_tick = Clock::now();
    }
    if (shutting_down_ && running_goals_ == 0) break;
  }
  inbox_.close();
  while (auto cmd = inbox_.pop_for(std::chrono::milliseconds(0))) reply_stopped(*cmd);
}

void Engine::reply_stopped(Command& cmd) {
  if (auto* c = std::get_if<SubmitCmd>(&cmd)) {
    c->reply.set_value(SubmitReply{{}, to_string(ErrorCode::engine_stopped)});
  } else if (auto* c = std::get_if<QueryCmd>(&cmd)) {
    c->reply.set_value(std::nullopt);
  } else if (auto* c = std::get_if<ListCmd>(&cmd)) {
    c->reply.set_value({});
  } else if (auto* c = std::get_if<CancelCmd>(&cmd)) {
    c->reply.set_value(false);
  } else if (auto* c = std::get_if<WaitCmd>(&cmd)) {
    c->reply.set_value(std::nullopt);
  }
}

void Engine::handle(Command& cmd) {
  if (auto* c = std::get_if<SubmitCmd>(&cmd)) {
    handle_submit(*c);
  } else if (auto* c = std::get_if<QueryCmd>(&cmd)) {
    auto it = goals_.find(c->goal_id);
    if (it == goals_.end()) {
      c->reply.set_value(std::nullopt);
      return;
    }
    ExecutionContext snapshot = it->second.ctx;
    snapshot.resources = resources_.get_state();
    snapshot.resources.available_tools = tools_->list_tools();
    c->reply.set_value(std::move(snapshot));
  } else if (auto* c = std::get_if<ListCmd>(&cmd)) {
    std::vector<Goal> out;
    out.reserve(order_.size());
    for (const auto& id : order_) out.push_back(goals_.at(id).ctx.goal);
    c->reply.set_value(std::move(out));
  } else if (auto* c = std::get_if<CancelCmd>(&cmd)) {
    handle_cancel(*c);
  } else if (auto* c = std::get_if<WaitCmd>(&cmd)) {
    auto it = goals_.find(c->goal_id);
    if (it == goals_.end()) {
      c->reply.set_value(std::nullopt);
    } else if (is_terminal(it->second.ctx.state)) {
      c->reply.set_value(it->second.ctx.state);
    } else {
      it->second.waiters.push_back(std::move(c->reply));
    }
  } else if (std::holds_alternative<ShutdownCmd>(cmd)) {
    shutting_down_ = true;
    for (auto& [id, rec] : goals_) {
      if (is_terminal(rec.ctx.state)) continue;
      rec.cancel->cancel();
      if (!rec.dispatched) finalize(rec, GoalState::cancelled, "cancelled: engine stopped");
    }
  } else if (auto* c = std::get_if<StateChanged>(&cmd)) {
    auto it = goals_.find(c->goal_id);
    if (it != goals_.end() && !is_terminal(it->second.ctx.state)) it->second.ctx.state = c->state;
  } else if (auto* c = std::get_if<HistoryAppended>(&cmd)) {
    auto it = goals_.find(c->goal_id);
    if (it != goals_.end()) it->second.ctx.history.push_back(std::move(c->entry));
  } else if (auto* c = std::get_if<StepRecorded>(&cmd)) {
    auto it = goals_.find(c->goal_id);
    if (it == goals_.end()) return;
    GoalRecord& rec = it->second;
    ++rec.steps_seen;
    rec.ctx.history.push_back(entry("step_" + std::to_string(rec.steps_seen) + "_executed",
                                    jsonlite::Object{{"step_id", c->result.step_id},
                                                     {"tool_id", c->result.tool_id},
                                                     {"success", c->result.success}}));
    rec.ctx.tool_results.push_back(std::move(c->result));
  } else if (auto* c = std::get_if<Finished>(&cmd)) {
    handle_finished(*c);
  }
}

void Engine::handle_submit(SubmitCmd& cmd) {
  if (shutting_down_) {
    cmd.reply.set_value(SubmitReply{{}, to_string(ErrorCode::engine_stopped)});
    return;
  }
  Goal goal = std::move(cmd.goal);
  if (goal.id.empty()) goal.id = make_id("goal", goal.description);
  if (goals_.contains(goal.id)) {
    cmd.reply.set_value(SubmitReply{{}, to_string(ErrorCode::invalid_goal) + ": duplicate goal id " + goal.id});
    return;
  }

  GoalRecord rec;
  rec.ctx.goal = goal;
  rec.ctx.state = GoalState::submitted;
  rec.ctx.submitted_at_ms = now_unix_ms();
  rec.cancel = std::make_shared<CancellationToken>();
  rec.seq = next_seq_++;
  rec.ctx.history.push_back(entry("goal_submitted", jsonlite::Object{{"priority", to_string(goal.priority)}}));

  memory_.add("goal_submitted",
              jsonlite::Object{{"goal_id", goal.id}, {"description", goal.description}},
              importance_for(goal.priority));
  emit_engine_event(&stats_, EngineEvent{EventKind::goal_submitted, goal.id, {}, {}, {}, true, 0,
                                         goal.description, 0});

  const std::string id = goal.id;
  order_.push_back(id);
  goals_.emplace(id, std::move(rec));
  cmd.reply.set_value(SubmitReply{id, {}});
  dispatch_pending();
}

void Engine::handle_cancel(CancelCmd& cmd) {
  auto it = goals_.find(cmd.goal_id);
  if (it == goals_.end() || is_terminal(it->second.ctx.state)) {
    cmd.reply.set_value(false);
    return;
  }
  GoalRecord& rec = it->second;
  rec.cancel->cancel();
  // A running goal is finalized when its driver reports back.
  if (!rec.dispatched) finalize(rec, GoalState::cancelled, to_string(ErrorCode::cancelled));
  cmd.reply.set_value(true);
}

void Engine::handle_finished(Finished& msg) {
  auto it = goals_.find(msg.goal_id);
  if (it == goals_.end()) return;
  GoalRecord& rec = it->second;
  if (running_goals_ > 0) --running_goals_;

  GoalState state = msg.state;
  std::optional<std::string> error = std::move(msg.error);
  if (rec.cancel->cancelled() && state != GoalState::cancelled) {
    // Cancelled after the driver's last check: honour the request.
    state = GoalState::cancelled;
    error = to_string(ErrorCode::cancelled);
    auto sb_it = msg.state_updates.find("winning_sandbox_id");
    if (sb_it != msg.state_updates.end() && sb_it->second.is_string()) {
      if (auto sb = sandboxes_.find(std::get<std::string>(sb_it->second.v))) release_sandbox(*sb);
    }
  }

  rec.ctx.ranked_results = std::move(msg.ranked);
  for (auto& [k, v] : msg.state_updates) rec.ctx.state_map[k] = std::move(v);
  finalize(rec, state, std::move(error));
  dispatch_pending();
}

void Engine::dispatch_pending() {
  while (!shutting_down_ && running_goals_ < config_.max_concurrent_goals) {
    GoalRecord* best = nullptr;
    for (auto& [id, rec] : goals_) {
      if (rec.dispatched || rec.ctx.state != GoalState::submitted) continue;
      if (!best || rec.ctx.goal.priority > best->ctx.goal.priority ||
          (rec.ctx.goal.priority == best->ctx.goal.priority && rec.seq < best->seq)) {
        best = &rec;
      }
    }
    if (!best) return;

    best->dispatched = true;
    ++running_goals_;
    auto fut = goal_pool_->submit(
        [this, goal = best->ctx.goal, cancel = best->cancel] { drive_goal(goal, cancel); });
    if (!fut.valid()) {
      --running_goals_;
      finalize(*best, GoalState::failed, to_string(ErrorCode::engine_stopped));
    }
  }
}

void Engine::finalize(GoalRecord& rec, GoalState state, std::optional<std::string> error) {
  if (is_terminal(rec.ctx.state)) return;
  rec.ctx.state = state;
  rec.ctx.error = std::move(error);
  rec.ctx.finished_at_ms = now_unix_ms();

  jsonlite::Object data{{"state", to_string(state)}};
  if (rec.ctx.error) data["error"] = *rec.ctx.error;
  rec.ctx.history.push_back(entry("goal_" + to_string(state), data));
  memory_.add("goal_" + to_string(state),
              jsonlite::Object{{"goal_id", rec.ctx.goal.id}, {"state", to_string(state)}},
              state == GoalState::completed ? 0.6 : 0.9);
  emit_engine_event(&stats_, EngineEvent{terminal_event(state), rec.ctx.goal.id, {}, {}, {},
                                         state == GoalState::completed,
                                         (rec.ctx.finished_at_ms - rec.ctx.submitted_at_ms) * 1000000ULL,
                                         rec.ctx.error.value_or(""), 0});
  log_info("engine", "goal " + rec.ctx.goal.id + " " + to_string(state) +
                         (rec.ctx.error ? " (" + *rec.ctx.error + ")" : std::string()));

  for (auto& w : rec.waiters) w.set_value(state);
  rec.waiters.clear();
}

// ---------------------------------------------------------------------------
// Goal driver (goal pool)
// ---------------------------------------------------------------------------

void Engine::release_sandbox(const Sandbox& sb) {
  std::string err;
  if (sandboxes_.cleanup_sandbox(sb, &err)) {
    stats_.sandboxes_cleaned.fetch_add(1, std::memory_order_relaxed);
  } else {
    stats_.cleanup_failures.fetch_add(1, std::memory_order_relaxed);
  }
}

void Engine::drive_goal(Goal goal, std::shared_ptr<CancellationToken> cancel) {
  const std::string gid = goal.id;
  auto finish = [&](GoalState state, std::optional<std::string> error,
                    std::vector<ScoredResult> ranked = {},
                    std::map<std::string, jsonlite::Value> updates = {}) {
    post(Finished{gid, state, std::move(ranked), std::move(error), std::move(updates)});
  };

  try {
    post(StateChanged{gid, GoalState::planning});
    emit_engine_event(&stats_, EngineEvent{EventKind::planning_started, gid, {}, {}, {}, true, 0, {}, 0});
    if (cancel->cancelled()) return finish(GoalState::cancelled, to_string(ErrorCode::cancelled));

    PlanningContext planning{goal, memory_.get_recent(kPlanningHistory), learning_.get_all_strategies()};
    std::vector<Plan> plans;
    try {
      plans = oracle_->propose_plans(planning);
    } catch (const std::exception& e) {
      return finish(GoalState::failed, to_string(ErrorCode::planning_failed) + ": " + e.what());
    }
    if (cancel->cancelled()) return finish(GoalState::cancelled, to_string(ErrorCode::cancelled));
    if (plans.empty()) {
      return finish(GoalState::failed, to_string(ErrorCode::no_plans) + ": oracle returned no candidate plans");
    }
    normalize_plans(plans, gid);

    jsonlite::Array plan_ids;
    for (const auto& p : plans) {
      plan_ids.emplace_back(p.id);
      emit_engine_event(&stats_, EngineEvent{EventKind::plan_created, gid, p.id, {}, {}, true, 0,
                                             std::to_string(p.steps.size()) + " step(s)", 0});
    }
    memory_.add("plans_created",
                jsonlite::Object{{"goal_id", gid}, {"count", jsonlite::Value{static_cast<std::uint64_t>(plans.size())}}},
                0.5);
    post(HistoryAppended{gid, entry("plans_created",
                                    jsonlite::Object{{"count", jsonlite::Value{static_cast<std::uint64_t>(plans.size())}},
                                                     {"plan_ids", std::move(plan_ids)}})});
    post(StateChanged{gid, GoalState::executing});

    ExecutorOptions options;
    options.use_isolated_branch = config_.use_isolated_branch;
    options.abort_on_step_failure = config_.abort_candidate_on_step_failure;
    options.reservation_retries = config_.reservation_retries;
    options.reservation_backoff_ms = config_.reservation_backoff_ms;
    options.deadline = effective_deadline(goal, Clock::now());

    const StepSink sink = [this, gid](const std::string&, const ToolExecutionResult& r) {
      post(StepRecorded{gid, r});
    };

    std::vector<std::future<CandidateOutcome>> futures;
    futures.reserve(plans.size());
    for (const auto& plan : plans) {
      futures.push_back(candidate_pool_->submit(
          [this, &goal, &plan, &options, &cancel, &sink] {
            return executor_.run(goal, plan, options, *cancel, sink);
          }));
    }

    std::vector<CandidateOutcome> outcomes;
    outcomes.reserve(plans.size());
    for (std::size_t i = 0; i < futures.size(); ++i) {
      CandidateOutcome o;
      if (!futures[i].valid()) {
        o.result.plan_id = plans[i].id;
        o.result.error = to_string(ErrorCode::engine_stopped);
      } else {
        try {
          o = futures[i].get();
        } catch (const std::exception& e) {
          o.result.plan_id = plans[i].id;
          o.result.error = std::string("candidate aborted: ") + e.what();
        }
      }
      post(HistoryAppended{gid, entry("candidate_finished",
                                      jsonlite::Object{{"plan_id", o.result.plan_id},
                                                       {"sandbox_id", o.result.sandbox_id},
                                                       {"success", o.result.success},
                                                       {"steps_completed", jsonlite::Value{static_cast<std::uint64_t>(o.result.steps_completed)}},
                                                       {"steps_failed", jsonlite::Value{static_cast<std::uint64_t>(o.result.steps_failed)}}})});
      outcomes.push_back(std::move(o));
    }

    if (cancel->cancelled()) {
      for (const auto& o : outcomes) {
        if (o.sandbox) release_sandbox(*o.sandbox);
      }
      return finish(GoalState::cancelled, to_string(ErrorCode::cancelled));
    }

    post(StateChanged{gid, GoalState::comparing});
    std::vector<ExecutionResult> results;
    results.reserve(outcomes.size());
    for (const auto& o : outcomes) results.push_back(o.result);
    std::vector<ScoredResult> ranked = compare_and_rank(std::move(results));
    const ScoredResult& best = ranked.front();

    bool winner_retained = false;
    for (const auto& o : outcomes) {
      if (!o.sandbox) continue;
      if (config_.retain_winning_sandbox && o.sandbox->id == best.result.sandbox_id) {
        winner_retained = true;
        continue;
      }
      release_sandbox(*o.sandbox);
    }

    std::map<std::string, jsonlite::Value> updates;
    updates["candidates"] = jsonlite::Value{static_cast<std::uint64_t>(outcomes.size())};
    updates["winning_plan_id"] = best.result.plan_id;
    updates["best_score"] = best.score;
    updates["ranking_digest"] = ranking_digest(ranked);
    if (winner_retained) {
      updates["winning_sandbox_id"] = best.result.sandbox_id;
      if (auto sb = sandboxes_.find(best.result.sandbox_id)) updates["winning_workspace"] = sb->working_dir();
    }
    bool has_threshold = false;
    double threshold = 0.0;
    for (const auto& c : goal.constraints) {
      if (c.kind != ConstraintKind::quality_threshold) continue;
      threshold = has_threshold ? std::max(threshold, c.threshold) : c.threshold;
      has_threshold = true;
    }
    if (has_threshold) updates["quality_threshold_met"] = best.score >= threshold;

    // Total execution failure: no candidate completed a step or met the criteria.
    const bool any_progress = std::any_of(outcomes.begin(), outcomes.end(), [](const CandidateOutcome& o) {
      return o.criteria_met || o.result.steps_completed > 0;
    });
    if (!any_progress) {
      std::string why = to_string(ErrorCode::all_candidates_failed);
      if (best.result.error) why += ": " + *best.result.error;
      if (winner_retained) {
        if (auto sb = sandboxes_.find(best.result.sandbox_id)) release_sandbox(*sb);
        updates.erase("winning_sandbox_id");
        updates.erase("winning_workspace");
      }
      return finish(GoalState::failed, why, std::move(ranked), std::move(updates));
    }
    finish(GoalState::completed, std::nullopt, std::move(ranked), std::move(updates));
  } catch (const std::exception& e) {
    log_error("engine", "goal " + gid + " driver error: " + e.what());
    finish(GoalState::failed, std::string("internal error: ") + e.what());
  }
}

}  // namespace sortie
