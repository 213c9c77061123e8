#include "json_bridge.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cat::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj[key];
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<int>();
  }
  if (value.is_number_float()) {
    return static_cast<int>(std::lround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const int v = value.get<int>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<std::string> json_to_string_vector(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<string> for field '" + std::string(key) + "'");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    out.push_back(json_to_string(entry, key));
  }
  return out;
}

std::uint64_t json_to_seed(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(value.get<std::int64_t>());
  }
  throw std::invalid_argument("Expected non-negative integer for field '" + std::string(key) + "'");
}

nlohmann::json number_or_null(double value) {
  if (!std::isfinite(value)) {
    return nullptr;
  }
  return value;
}

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return *value;
}

nlohmann::json optional_number(const std::optional<double>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return number_or_null(*value);
}

nlohmann::json strings_to_json_array(const std::vector<std::string>& values) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& v : values) {
    arr.push_back(v);
  }
  return arr;
}

} // namespace

nlohmann::json to_json(const Item& item) {
  nlohmann::json j = nlohmann::json::object();
  j["id"] = item.id;
  j["text"] = item.text;
  j["type"] = to_string(item.type);
  j["difficulty"] = item.difficulty;
  j["discrimination"] = item.discrimination;
  j["guessing"] = item.guessing;
  j["topic"] = item.topic;
  j["subtopic"] = item.subtopic;
  j["cognitive_level"] = item.cognitive_level;
  j["options"] = strings_to_json_array(item.options);
  j["correct_answer"] = item.correct_answer;
  j["explanation"] = item.explanation;
  j["difficulty_level"] = item.difficulty_level;
  return j;
}

Item item_from_json(const nlohmann::json& json_item) {
  if (!json_item.is_object()) {
    throw std::invalid_argument("Item must be a JSON object");
  }
  Item item;
  assign_if_present(json_item, "id", [&](const nlohmann::json& v) { item.id = json_to_string(v, "id"); });
  assign_if_present(json_item, "text",
                    [&](const nlohmann::json& v) { item.text = json_to_string(v, "text"); });
  assign_if_present(json_item, "type", [&](const nlohmann::json& v) {
    item.type = item_type_from_string(json_to_string(v, "type"));
  });
  assign_if_present(json_item, "difficulty",
                    [&](const nlohmann::json& v) { item.difficulty = json_to_double(v, "difficulty"); });
  assign_if_present(json_item, "discrimination", [&](const nlohmann::json& v) {
    item.discrimination = json_to_double(v, "discrimination");
  });
  assign_if_present(json_item, "guessing",
                    [&](const nlohmann::json& v) { item.guessing = json_to_double(v, "guessing"); });
  assign_if_present(json_item, "topic",
                    [&](const nlohmann::json& v) { item.topic = json_to_string(v, "topic"); });
  assign_if_present(json_item, "subtopic",
                    [&](const nlohmann::json& v) { item.subtopic = json_to_string(v, "subtopic"); });
  assign_if_present(json_item, "cognitive_level", [&](const nlohmann::json& v) {
    item.cognitive_level = json_to_string(v, "cognitive_level");
  });
  assign_if_present(json_item, "options", [&](const nlohmann::json& v) {
    item.options = json_to_string_vector(v, "options");
  });
  if (json_item.contains("correct_answer")) {
    item.correct_answer = json_item["correct_answer"];
  }
  assign_if_present(json_item, "explanation", [&](const nlohmann::json& v) {
    item.explanation = json_to_string(v, "explanation");
  });
  assign_if_present(json_item, "difficulty_level", [&](const nlohmann::json& v) {
    item.difficulty_level = json_to_int(v, "difficulty_level");
  });
  return item;
}

nlohmann::json question_to_json(const Item& item) {
  nlohmann::json j = nlohmann::json::object();
  j["id"] = item.id;
  j["text"] = item.text;
  j["type"] = to_string(item.type);
  j["topic"] = item.topic;
  j["subtopic"] = item.subtopic;
  j["options"] = strings_to_json_array(item.options);
  j["difficulty_level"] = item.difficulty_level;
  return j;
}

nlohmann::json to_json(const SessionConfig& config) {
  nlohmann::json j = nlohmann::json::object();
  j["max_questions"] = config.max_questions;
  j["min_questions"] = config.min_questions;
  j["se_threshold"] = config.se_threshold;
  j["initial_ability"] = config.initial_ability;
  j["topic_balancing"] = config.topic_balancing;
  j["exposure_control"] = config.exposure_control;
  j["selection_method"] = to_string(config.selection_method);
  j["max_exposure_rate"] = config.max_exposure_rate;
  j["exposure_warmup_sessions"] = config.exposure_warmup_sessions;
  j["topic_balance_weight"] = config.topic_balance_weight;
  nlohmann::json targets = nlohmann::json::object();
  for (const auto& kv : config.topic_targets) {
    targets[kv.first] = kv.second;
  }
  j["topic_targets"] = targets;
  j["max_time_seconds"] = optional_to_json(config.max_time_seconds);
  j["ability_step"] = config.ability_step;
  j["seed"] = config.seed;
  return j;
}

SessionConfig session_config_from_json(const nlohmann::json& json_config) {
  SessionConfig config;
  if (json_config.is_null()) {
    return config;
  }
  if (!json_config.is_object()) {
    throw std::invalid_argument("Session config must be a JSON object");
  }
  assign_if_present(json_config, "max_questions", [&](const nlohmann::json& v) {
    config.max_questions = json_to_int(v, "max_questions");
  });
  assign_if_present(json_config, "min_questions", [&](const nlohmann::json& v) {
    config.min_questions = json_to_int(v, "min_questions");
  });
  assign_if_present(json_config, "se_threshold", [&](const nlohmann::json& v) {
    config.se_threshold = json_to_double(v, "se_threshold");
  });
  assign_if_present(json_config, "initial_ability", [&](const nlohmann::json& v) {
    config.initial_ability = json_to_double(v, "initial_ability");
  });
  assign_if_present(json_config, "topic_balancing", [&](const nlohmann::json& v) {
    config.topic_balancing = json_to_bool(v, "topic_balancing");
  });
  assign_if_present(json_config, "exposure_control", [&](const nlohmann::json& v) {
    config.exposure_control = json_to_bool(v, "exposure_control");
  });
  assign_if_present(json_config, "selection_method", [&](const nlohmann::json& v) {
    config.selection_method = selection_method_from_string(json_to_string(v, "selection_method"));
  });
  assign_if_present(json_config, "max_exposure_rate", [&](const nlohmann::json& v) {
    config.max_exposure_rate = json_to_double(v, "max_exposure_rate");
  });
  assign_if_present(json_config, "exposure_warmup_sessions", [&](const nlohmann::json& v) {
    config.exposure_warmup_sessions = json_to_int(v, "exposure_warmup_sessions");
  });
  assign_if_present(json_config, "topic_balance_weight", [&](const nlohmann::json& v) {
    config.topic_balance_weight = json_to_double(v, "topic_balance_weight");
  });
  assign_if_present(json_config, "topic_targets", [&](const nlohmann::json& v) {
    if (!v.is_object()) {
      throw std::invalid_argument("Expected object for field 'topic_targets'");
    }
    config.topic_targets.clear();
    for (const auto& entry : v.items()) {
      config.topic_targets[entry.key()] = json_to_double(entry.value(), "topic_targets");
    }
  });
  assign_if_present(json_config, "max_time_seconds", [&](const nlohmann::json& v) {
    config.max_time_seconds = json_to_double(v, "max_time_seconds");
  });
  assign_if_present(json_config, "ability_step", [&](const nlohmann::json& v) {
    config.ability_step = json_to_double(v, "ability_step");
  });
  assign_if_present(json_config, "seed",
                    [&](const nlohmann::json& v) { config.seed = json_to_seed(v, "seed"); });
  return config;
}

nlohmann::json to_json(const PoolInfo& info) {
  nlohmann::json j = nlohmann::json::object();
  j["id"] = info.id;
  j["tenant_id"] = info.tenant_id;
  j["name"] = info.name;
  j["subject"] = info.subject;
  j["grade_level"] = info.grade_level;
  return j;
}

PoolInfo pool_info_from_json(const nlohmann::json& json_info) {
  if (!json_info.is_object()) {
    throw std::invalid_argument("Pool must be a JSON object");
  }
  PoolInfo info;
  assign_if_present(json_info, "id", [&](const nlohmann::json& v) { info.id = json_to_string(v, "id"); });
  assign_if_present(json_info, "tenant_id",
                    [&](const nlohmann::json& v) { info.tenant_id = json_to_string(v, "tenant_id"); });
  assign_if_present(json_info, "name",
                    [&](const nlohmann::json& v) { info.name = json_to_string(v, "name"); });
  assign_if_present(json_info, "subject",
                    [&](const nlohmann::json& v) { info.subject = json_to_string(v, "subject"); });
  assign_if_present(json_info, "grade_level", [&](const nlohmann::json& v) {
    info.grade_level = json_to_string(v, "grade_level");
  });
  if (info.id.empty()) {
    throw std::invalid_argument("Pool requires a non-empty 'id'");
  }
  return info;
}

nlohmann::json to_json(const Response& response) {
  nlohmann::json j = nlohmann::json::object();
  j["question_id"] = response.question_id;
  j["answer"] = response.answer;
  j["is_correct"] = response.is_correct;
  j["response_time"] = optional_number(response.response_time);
  j["theta_before"] = response.theta_before;
  j["theta_after"] = response.theta_after;
  j["se_after"] = number_or_null(response.se_after);
  j["question_number"] = response.question_number;
  j["difficulty"] = response.parameters.difficulty;
  j["discrimination"] = response.parameters.discrimination;
  j["guessing"] = response.parameters.guessing;
  j["topic"] = response.topic;
  return j;
}

nlohmann::json to_json(const Session& session) {
  nlohmann::json j = nlohmann::json::object();
  j["id"] = session.id;
  j["pool_id"] = session.pool_id;
  j["examinee_id"] = session.examinee_id;
  j["status"] = to_string(session.status);
  j["config"] = to_json(session.config);
  j["theta"] = session.theta;
  j["standard_error"] = number_or_null(session.standard_error);
  j["administered_item_ids"] = strings_to_json_array(session.administered_item_ids);
  nlohmann::json responses = nlohmann::json::array();
  for (const auto& r : session.responses) {
    responses.push_back(to_json(r));
  }
  j["responses"] = responses;
  j["pending_item_id"] = optional_to_json(session.pending_item_id);
  nlohmann::json history = nlohmann::json::array();
  for (double theta : session.ability_history) {
    history.push_back(theta);
  }
  j["ability_history"] = history;
  nlohmann::json coverage = nlohmann::json::object();
  for (const auto& kv : session.topic_coverage) {
    coverage[kv.first] = kv.second;
  }
  j["topic_coverage"] = coverage;
  j["elapsed_seconds"] = session.elapsed_seconds;
  j["stop_reason"] = session.stop_reason == StopReason::None
                         ? nlohmann::json(nullptr)
                         : nlohmann::json(to_string(session.stop_reason));
  j["final_theta"] = optional_number(session.final_theta);
  j["final_se"] = optional_number(session.final_se);
  return j;
}

nlohmann::json to_json(const Report& report) {
  nlohmann::json j = nlohmann::json::object();
  j["session_id"] = report.session_id;
  j["final_theta"] = report.final_theta;
  j["final_se"] = number_or_null(report.final_se);
  j["confidence_interval"] =
      nlohmann::json::array({report.confidence_lower, report.confidence_upper});
  j["performance_level"] = report.performance_level;
  j["ability_percentile"] = report.ability_percentile;
  j["topic_strengths"] = strings_to_json_array(report.topic_strengths);
  j["topic_weaknesses"] = strings_to_json_array(report.topic_weaknesses);

  nlohmann::json topics = nlohmann::json::array();
  for (const auto& score : report.topic_scores) {
    nlohmann::json entry = nlohmann::json::object();
    entry["topic"] = score.topic;
    entry["total_questions"] = score.total_questions;
    entry["correct_answers"] = score.correct_answers;
    entry["accuracy"] = score.accuracy;
    entry["average_difficulty"] = score.average_difficulty;
    entry["information"] = score.information;
    topics.push_back(entry);
  }
  j["topic_scores"] = topics;
  j["recommended_topics"] = strings_to_json_array(report.recommended_topics);
  j["recommended_difficulty"] = report.recommended_difficulty;
  j["next_steps"] = strings_to_json_array(report.next_steps);
  j["total_questions"] = report.total_questions;
  j["correct_answers"] = report.correct_answers;
  j["average_difficulty"] = report.average_difficulty;

  nlohmann::json patterns = nlohmann::json::object();
  patterns["response_time_trend"] = optional_to_json(report.response_patterns.response_time_trend);
  patterns["accuracy_trend"] = optional_to_json(report.response_patterns.accuracy_trend);
  patterns["difficulty_adaptation"] =
      optional_to_json(report.response_patterns.difficulty_adaptation);
  j["response_patterns"] = patterns;
  j["response_consistency"] = report.response_consistency;
  j["stop_reason"] = to_string(report.stop_reason);
  return j;
}

nlohmann::json to_json(const StopSignal& signal) {
  nlohmann::json j = nlohmann::json::object();
  j["type"] = "stop";
  j["session_id"] = signal.session_id;
  j["reason"] = to_string(signal.reason);
  return j;
}

nlohmann::json to_json(const SubmitOutcome& outcome) {
  nlohmann::json j = nlohmann::json::object();
  j["is_correct"] = outcome.is_correct;
  j["theta"] = outcome.theta;
  j["standard_error"] = number_or_null(outcome.standard_error);
  j["completed"] = outcome.completed;
  j["stop_reason"] = outcome.completed ? nlohmann::json(to_string(outcome.stop_reason))
                                       : nlohmann::json(nullptr);
  return j;
}

nlohmann::json to_json(const ItemStatistics& stats) {
  nlohmann::json j = nlohmann::json::object();
  j["item_id"] = stats.item_id;
  j["exposure_count"] = stats.exposure_count;
  j["usage_count"] = stats.usage_count;
  j["correct_count"] = stats.correct_count;
  j["correct_rate"] = stats.correct_rate;
  j["average_response_time"] = stats.average_response_time;
  j["exposure_rate"] = stats.exposure_rate;
  nlohmann::json curve = nlohmann::json::array();
  for (const auto& point : stats.information_curve) {
    curve.push_back(nlohmann::json::array({point.first, point.second}));
  }
  j["information_curve"] = curve;
  return j;
}

} // namespace cat::bridge
