#include "cat/session_engine.hpp"

#include "../scoring/scoring.hpp"
#include "cat/errors.hpp"
#include "cat/item_selector.hpp"
#include "cat/stopping_rule.hpp"
#include "debug_log.hpp"
#include "json_bridge.hpp"

#include <atomic>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cat {
namespace {

bool transition_allowed(SessionStatus from, SessionStatus to) {
  switch (from) {
    case SessionStatus::Created:
      return to == SessionStatus::InProgress;
    case SessionStatus::InProgress:
      return to == SessionStatus::Completed || to == SessionStatus::Abandoned;
    case SessionStatus::Completed:
    case SessionStatus::Abandoned:
      return false;
  }
  return false;
}

void transition(Session& session, SessionStatus to) {
  if (!transition_allowed(session.status, to)) {
    throw InvalidStateTransitionError("Session " + session.id + " cannot move from " +
                                      to_string(session.status) + " to " + to_string(to));
  }
  session.status = to;
}

std::string format_theta(double theta, double se) {
  std::ostringstream oss;
  oss << "theta=" << theta << " se=" << se;
  return oss.str();
}

} // namespace

class SessionEngineImpl : public SessionEngine {
public:
  SessionEngineImpl(std::shared_ptr<Persistence> persistence, EngineOptions options)
      : persistence_(std::move(persistence)),
        options_(std::move(options)),
        reports_(options_.report),
        stopping_(selector_) {
    if (!persistence_) {
      throw std::invalid_argument("SessionEngine requires a persistence backend");
    }
    options_.estimator.validate();
  }

  std::string start_session(const std::string& pool_id, const std::string& examinee_id,
                            const SessionConfig& config) override {
    config.validate();
    auto pool = persistence_->load_pool(pool_id);

    if (auto existing = persistence_->find_active_session(pool_id, examinee_id)) {
      detail::debug_log("engine", "reusing active session " + *existing + " for " + examinee_id);
      return *existing;
    }

    Session session;
    session.id = generate_session_id();
    session.pool_id = pool_id;
    session.examinee_id = examinee_id;
    session.config = config;
    session.theta = config.initial_ability;
    session.standard_error = unbounded_se();
    session.ability_history.push_back(config.initial_ability);
    session.rng_state = config.seed == 0 ? 1 : config.seed;
    transition(session, SessionStatus::InProgress);

    persistence_->save_session(session);
    pool->record_session_start();
    detail::debug_log("engine", "started " + session.id + " on pool " + pool_id);
    return session.id;
  }

  Next get_next_question(const std::string& session_id) override {
    Session session = persistence_->load_session(session_id);
    if (session.status == SessionStatus::Completed) {
      return StopSignal{session.id, session.stop_reason};
    }
    if (session.status != SessionStatus::InProgress) {
      throw InvalidStateTransitionError("Session " + session.id + " is " +
                                        to_string(session.status));
    }

    auto pool = persistence_->load_pool(session.pool_id);
    if (session.pending_item_id.has_value()) {
      return pool->get_item(*session.pending_item_id);
    }

    const auto decision = stopping_.should_stop(session, *pool);
    if (decision.stop) {
      finish(session, decision.reason);
      return StopSignal{session.id, decision.reason};
    }

    const Item* item = nullptr;
    try {
      item = &next_item(session, *pool);
    } catch (const NoEligibleItemsError&) {
      finish(session, StopReason::PoolExhausted);
      return StopSignal{session.id, StopReason::PoolExhausted};
    }

    session.pending_item_id = item->id;
    persistence_->save_session(session);
    pool->record_exposure(item->id);
    detail::debug_log("engine", session.id + " serving " + item->id);
    return *item;
  }

  SubmitOutcome submit_response(const std::string& session_id, const std::string& item_id,
                                const nlohmann::json& answer,
                                std::optional<double> response_time) override {
    const Session stored = persistence_->load_session(session_id);
    if (stored.status != SessionStatus::InProgress) {
      throw InvalidStateTransitionError("Cannot submit to session " + stored.id + " in state " +
                                        to_string(stored.status));
    }
    if (!stored.pending_item_id.has_value() || *stored.pending_item_id != item_id) {
      throw UnknownItemError("Item '" + item_id + "' is not pending in session " + stored.id);
    }
    if (response_time.has_value() && (!std::isfinite(*response_time) || *response_time < 0.0)) {
      throw std::invalid_argument("response_time must be a non-negative number of seconds");
    }

    auto pool = persistence_->load_pool(stored.pool_id);
    const Item& item = pool->get_item(item_id);

    Session session = stored;
    const bool correct = scoring::score_answer(item, answer);

    Response response;
    response.question_id = item.id;
    response.answer = answer;
    response.is_correct = correct;
    response.response_time = response_time;
    response.theta_before = session.theta;
    response.question_number = static_cast<int>(session.responses.size()) + 1;
    response.parameters = item.parameters();
    response.topic = item.topic;

    const auto history = scored_history(session);
    const auto estimate =
        estimator_for(session).update(session.theta, history, {item.parameters(), correct});

    response.theta_after = estimate.theta;
    response.se_after = estimate.standard_error;

    session.responses.push_back(response);
    session.administered_item_ids.push_back(item.id);
    if (!item.topic.empty()) {
      ++session.topic_coverage[item.topic];
    }
    session.theta = estimate.theta;
    session.standard_error = estimate.standard_error;
    session.ability_history.push_back(estimate.theta);
    session.pending_item_id.reset();
    if (response_time.has_value()) {
      session.elapsed_seconds += *response_time;
    }
    detail::debug_log("engine", session.id + " answered " + item.id +
                                    (correct ? " correctly; " : " incorrectly; ") +
                                    format_theta(estimate.theta, estimate.standard_error));

    SubmitOutcome outcome;
    outcome.is_correct = correct;
    outcome.theta = session.theta;
    outcome.standard_error = session.standard_error;

    const auto decision = stopping_.should_stop(session, *pool);
    std::optional<Report> report;
    if (decision.stop) {
      seal(session, decision.reason);
      report = reports_.generate(session);
      outcome.completed = true;
      outcome.stop_reason = decision.reason;
    }

    persistence_->save_session(session);
    try {
      persistence_->append_response(session.id, response);
    } catch (const std::exception& ex) {
      detail::debug_log("engine", "journal write failed for " + session.id + ": " + ex.what());
      persistence_->save_session(stored);
      throw;
    }
    pool->record_usage(item.id, correct, response_time);
    // A missing report is regenerated by complete_session.
    if (report.has_value()) {
      persistence_->save_report(*report);
    }
    return outcome;
  }

  Report complete_session(const std::string& session_id) override {
    Session session = persistence_->load_session(session_id);
    if (session.status == SessionStatus::Completed) {
      if (auto stored = persistence_->load_report(session_id)) {
        return *stored;
      }
      Report report = reports_.generate(session);
      persistence_->save_report(report);
      return report;
    }
    return finish(session, StopReason::CompletedByCaller);
  }

  void abandon_session(const std::string& session_id) override {
    Session session = persistence_->load_session(session_id);
    transition(session, SessionStatus::Abandoned);
    session.pending_item_id.reset();
    persistence_->save_session(session);
    detail::debug_log("engine", "abandoned " + session.id);
  }

  Session session(const std::string& session_id) override {
    return persistence_->load_session(session_id);
  }

  nlohmann::json debug_state(const std::string& session_id) override {
    const Session session = persistence_->load_session(session_id);
    nlohmann::json info = nlohmann::json::object();
    info["session"] = bridge::to_json(session);
    info["degenerate"] = AbilityEstimator::is_degenerate(scored_history(session));
    if (session.status == SessionStatus::InProgress) {
      auto pool = persistence_->load_pool(session.pool_id);
      info["candidates"] = selector_.describe(session, *pool);
      info["sessions_started"] = pool->sessions_started();
      const auto decision = stopping_.should_stop(session, *pool);
      info["would_stop"] = decision.stop;
      info["stop_reason"] = to_string(decision.reason);
    }
    return info;
  }

private:
  AbilityEstimator estimator_for(const Session& session) const {
    EstimatorOptions options = options_.estimator;
    options.ability_step = session.config.ability_step;
    return AbilityEstimator(options);
  }

  const Item& next_item(Session& session, QuestionPool& pool) const {
    const Item* item = selector_.select_next(session, pool);
    if (item == nullptr) {
      throw NoEligibleItemsError("No eligible items left for session " + session.id);
    }
    return *item;
  }

  void seal(Session& session, StopReason reason) const {
    transition(session, SessionStatus::Completed);
    session.pending_item_id.reset();
    session.stop_reason = reason;
    session.final_theta = session.theta;
    session.final_se = session.standard_error;
  }

  Report finish(Session& session, StopReason reason) {
    seal(session, reason);
    Report report = reports_.generate(session);
    persistence_->save_session(session);
    persistence_->save_report(report);
    detail::debug_log("engine", "completed " + session.id + " (" + to_string(reason) + ") " +
                                    format_theta(session.theta, session.standard_error));
    return report;
  }

  std::string generate_session_id() {
    std::ostringstream oss;
    oss << "sess-" << (++session_counter_);
    return oss.str();
  }

  std::shared_ptr<Persistence> persistence_;
  EngineOptions options_;
  ItemSelector selector_;
  ReportGenerator reports_;
  StoppingRule stopping_;
  std::atomic<std::uint64_t> session_counter_{0};
};

std::unique_ptr<SessionEngine> make_engine(std::shared_ptr<Persistence> persistence,
                                           EngineOptions options) {
  return std::make_unique<SessionEngineImpl>(std::move(persistence), std::move(options));
}

} // namespace cat
