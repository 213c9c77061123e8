#include "cat/types.hpp"

#include <cmath>
#include <stdexcept>

namespace cat {

void SessionConfig::validate() const {
  if (max_questions < 1) {
    throw std::invalid_argument("max_questions must be at least 1");
  }
  if (min_questions < 0 || min_questions > max_questions) {
    throw std::invalid_argument("min_questions must be within [0, max_questions]");
  }
  if (!(se_threshold > 0.0)) {
    throw std::invalid_argument("se_threshold must be positive");
  }
  if (!std::isfinite(initial_ability) || initial_ability < kMinTheta ||
      initial_ability > kMaxTheta) {
    throw std::invalid_argument("initial_ability must be within [-4, 4]");
  }
  if (!(max_exposure_rate > 0.0) || max_exposure_rate > 1.0) {
    throw std::invalid_argument("max_exposure_rate must be within (0, 1]");
  }
  if (exposure_warmup_sessions < 0) {
    throw std::invalid_argument("exposure_warmup_sessions must not be negative");
  }
  if (!(topic_balance_weight >= 0.0)) {
    throw std::invalid_argument("topic_balance_weight must not be negative");
  }
  for (const auto& kv : topic_targets) {
    if (!(kv.second >= 0.0)) {
      throw std::invalid_argument("topic target weight for '" + kv.first + "' must not be negative");
    }
  }
  if (max_time_seconds.has_value() && !(*max_time_seconds > 0.0)) {
    throw std::invalid_argument("max_time_seconds must be positive when set");
  }
  if (!(ability_step > 0.0)) {
    throw std::invalid_argument("ability_step must be positive");
  }
}

} // namespace cat
