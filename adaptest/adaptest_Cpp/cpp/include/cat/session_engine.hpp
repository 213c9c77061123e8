#pragma once

#include "ability_estimator.hpp"
#include "persistence.hpp"
#include "report_generator.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace cat {

struct EngineOptions {
  // ability_step is taken from each session's config.
  EstimatorOptions estimator;
  ReportConfig report;
};

// Session lifecycle: created -> in_progress -> {completed, abandoned}. Terminal states
// are final. Each call runs to completion before the next one on the same session.
class SessionEngine {
public:
  virtual ~SessionEngine() = default;

  // Returns the id of an existing in-progress session for the same pool and examinee
  // instead of opening a second one.
  virtual std::string start_session(const std::string& pool_id, const std::string& examinee_id,
                                    const SessionConfig& config) = 0;

  using Next = std::variant<Item, StopSignal>;

  // Re-serves the pending item until it is answered. A stop condition completes the
  // session and yields a StopSignal.
  virtual Next get_next_question(const std::string& session_id) = 0;

  // Either the whole step (score, estimate, stop check, persistence) applies or the
  // stored session is left untouched.
  virtual SubmitOutcome submit_response(const std::string& session_id,
                                        const std::string& item_id,
                                        const nlohmann::json& answer,
                                        std::optional<double> response_time) = 0;

  // Idempotent on completed sessions.
  virtual Report complete_session(const std::string& session_id) = 0;

  virtual void abandon_session(const std::string& session_id) = 0;

  virtual Session session(const std::string& session_id) = 0;

  virtual nlohmann::json debug_state(const std::string& session_id) = 0;
};

std::unique_ptr<SessionEngine> make_engine(std::shared_ptr<Persistence> persistence,
                                           EngineOptions options = {});

} // namespace cat
