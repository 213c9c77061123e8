#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cat {

// Ability scale bounds shared by the estimator, the selector and the report.
constexpr double kMinTheta = -4.0;
constexpr double kMaxTheta = 4.0;

inline double unbounded_se() {
  return std::numeric_limits<double>::infinity();
}

enum class ItemType {
  MultipleChoice,
  TrueFalse
};

inline std::string to_string(ItemType type) {
  switch (type) {
    case ItemType::MultipleChoice: return "multiple_choice";
    case ItemType::TrueFalse: return "true_false";
  }
  return "multiple_choice";
}

inline ItemType item_type_from_string(const std::string& value) {
  if (value == "multiple_choice") {
    return ItemType::MultipleChoice;
  }
  if (value == "true_false") {
    return ItemType::TrueFalse;
  }
  throw std::invalid_argument("Unknown item type: " + value);
}

enum class SessionStatus {
  Created,
  InProgress,
  Completed,
  Abandoned
};

inline std::string to_string(SessionStatus status) {
  switch (status) {
    case SessionStatus::Created: return "created";
    case SessionStatus::InProgress: return "in_progress";
    case SessionStatus::Completed: return "completed";
    case SessionStatus::Abandoned: return "abandoned";
  }
  return "created";
}

enum class SelectionMethod {
  MaximumInformation,
  ClosestDifficulty,
  Random
};

inline std::string to_string(SelectionMethod method) {
  switch (method) {
    case SelectionMethod::MaximumInformation: return "maximum_information";
    case SelectionMethod::ClosestDifficulty: return "closest_difficulty";
    case SelectionMethod::Random: return "random";
  }
  return "maximum_information";
}

inline SelectionMethod selection_method_from_string(const std::string& value) {
  if (value == "maximum_information") {
    return SelectionMethod::MaximumInformation;
  }
  if (value == "closest_difficulty") {
    return SelectionMethod::ClosestDifficulty;
  }
  if (value == "random") {
    return SelectionMethod::Random;
  }
  throw std::invalid_argument("Unknown selection method: " + value);
}

enum class StopReason {
  None,
  MaxQuestionsReached,
  PrecisionReached,
  TimeLimitReached,
  PoolExhausted,
  CompletedByCaller
};

inline std::string to_string(StopReason reason) {
  switch (reason) {
    case StopReason::None: return "none";
    case StopReason::MaxQuestionsReached: return "max_questions_reached";
    case StopReason::PrecisionReached: return "precision_reached";
    case StopReason::TimeLimitReached: return "time_limit_reached";
    case StopReason::PoolExhausted: return "pool_exhausted";
    case StopReason::CompletedByCaller: return "completed_by_caller";
  }
  return "none";
}

// 3PL parameters: discrimination a, difficulty b, pseudo-guessing c.
struct ItemParameters {
  double discrimination = 1.0;
  double difficulty = 0.0;
  double guessing = 0.0;
};

struct Item {
  std::string id;
  std::string text;
  ItemType type = ItemType::MultipleChoice;
  double difficulty = 0.0;
  double discrimination = 1.0;
  double guessing = 0.0;
  std::string topic;
  std::string subtopic;
  std::string cognitive_level;
  std::vector<std::string> options;
  nlohmann::json correct_answer;
  std::string explanation;
  int difficulty_level = 5;

  ItemParameters parameters() const { return {discrimination, difficulty, guessing}; }
};

struct SessionConfig {
  int max_questions = 20;
  int min_questions = 5;
  double se_threshold = 0.3;
  double initial_ability = 0.0;
  bool topic_balancing = true;
  bool exposure_control = true;

  SelectionMethod selection_method = SelectionMethod::MaximumInformation;
  double max_exposure_rate = 0.3;
  int exposure_warmup_sessions = 10;
  double topic_balance_weight = 1.0;
  // Explicit topic -> relative weight. Empty means uniform over the pool's topics.
  std::map<std::string, double> topic_targets;
  // Limit on accumulated response time, in seconds.
  std::optional<double> max_time_seconds;
  // Shift applied while the response pattern is all-correct or all-incorrect.
  double ability_step = 1.0;
  std::uint64_t seed = 1;

  void validate() const;
};

struct Response {
  std::string question_id;
  nlohmann::json answer;
  bool is_correct = false;
  std::optional<double> response_time;
  double theta_before = 0.0;
  double theta_after = 0.0;
  double se_after = unbounded_se();
  int question_number = 0;

  // Item snapshot taken at answer time; estimation and reporting never re-read the pool.
  ItemParameters parameters;
  std::string topic;
};

struct Session {
  std::string id;
  std::string pool_id;
  std::string examinee_id;
  SessionStatus status = SessionStatus::Created;
  SessionConfig config;

  double theta = 0.0;
  double standard_error = unbounded_se();
  std::vector<std::string> administered_item_ids;
  std::vector<Response> responses;
  std::optional<std::string> pending_item_id;

  std::vector<double> ability_history;
  std::map<std::string, int> topic_coverage;
  double elapsed_seconds = 0.0;
  std::uint64_t rng_state = 1;

  StopReason stop_reason = StopReason::None;
  std::optional<double> final_theta;
  std::optional<double> final_se;

  bool is_terminal() const {
    return status == SessionStatus::Completed || status == SessionStatus::Abandoned;
  }
};

struct StopSignal {
  std::string session_id;
  StopReason reason = StopReason::None;
};

struct SubmitOutcome {
  bool is_correct = false;
  double theta = 0.0;
  double standard_error = unbounded_se();
  bool completed = false;
  StopReason stop_reason = StopReason::None;
};

struct TopicScore {
  std::string topic;
  int total_questions = 0;
  int correct_answers = 0;
  double accuracy = 0.0;
  double average_difficulty = 0.0;
  double information = 0.0;
};

struct ResponsePatterns {
  std::optional<std::string> response_time_trend;
  std::optional<std::string> accuracy_trend;
  std::optional<std::string> difficulty_adaptation;
};

struct Report {
  std::string session_id;
  double final_theta = 0.0;
  double final_se = unbounded_se();
  double confidence_lower = kMinTheta;
  double confidence_upper = kMaxTheta;
  std::string performance_level;
  double ability_percentile = 50.0;

  std::vector<std::string> topic_strengths;
  std::vector<std::string> topic_weaknesses;
  std::vector<TopicScore> topic_scores;
  std::vector<std::string> recommended_topics;
  double recommended_difficulty = 0.0;
  std::vector<std::string> next_steps;

  int total_questions = 0;
  int correct_answers = 0;
  double average_difficulty = 0.0;
  ResponsePatterns response_patterns;
  double response_consistency = 1.0;
  StopReason stop_reason = StopReason::None;
};

} // namespace cat
