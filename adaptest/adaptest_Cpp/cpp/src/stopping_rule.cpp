#include "cat/stopping_rule.hpp"

namespace cat {

StopDecision StoppingRule::should_stop(const Session& session, const QuestionPool& pool) const {
  const auto& config = session.config;
  const auto administered = static_cast<int>(session.administered_item_ids.size());

  if (administered >= config.max_questions) {
    return {true, StopReason::MaxQuestionsReached};
  }
  if (administered >= config.min_questions && session.standard_error <= config.se_threshold) {
    return {true, StopReason::PrecisionReached};
  }
  if (config.max_time_seconds.has_value() && session.elapsed_seconds >= *config.max_time_seconds) {
    return {true, StopReason::TimeLimitReached};
  }
  if (selector_.peek_next(session, pool) == nullptr) {
    return {true, StopReason::PoolExhausted};
  }
  return {};
}

} // namespace cat
