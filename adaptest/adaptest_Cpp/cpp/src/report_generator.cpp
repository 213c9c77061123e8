#include "cat/report_generator.hpp"

#include "cat/errors.hpp"
#include "cat/irt.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <utility>

namespace cat {
namespace {

struct TopicTally {
  int total = 0;
  int correct = 0;
  double difficulty_sum = 0.0;
  double information = 0.0;
};

std::size_t band_index(const std::vector<PerformanceBand>& bands, double theta) {
  std::size_t index = 0;
  for (std::size_t i = 0; i < bands.size(); ++i) {
    if (theta >= bands[i].lower_bound) {
      index = i;
    }
  }
  return index;
}

double mean(const std::vector<double>& values, std::size_t begin, std::size_t end) {
  if (end <= begin) {
    return 0.0;
  }
  double total = 0.0;
  for (std::size_t i = begin; i < end; ++i) {
    total += values[i];
  }
  return total / static_cast<double>(end - begin);
}

} // namespace

void ReportConfig::validate() const {
  if (bands.empty()) {
    throw std::invalid_argument("report needs at least one performance band");
  }
  for (std::size_t i = 1; i < bands.size(); ++i) {
    if (!(bands[i - 1].lower_bound < bands[i].lower_bound)) {
      throw std::invalid_argument("performance bands must be sorted by strictly increasing bound");
    }
  }
  if (weakness_threshold > strength_threshold) {
    throw std::invalid_argument("weakness_threshold must not exceed strength_threshold");
  }
  if (!(z_score > 0.0)) {
    throw std::invalid_argument("z_score must be positive");
  }
}

ReportGenerator::ReportGenerator() {
  config_.validate();
}

ReportGenerator::ReportGenerator(ReportConfig config) : config_(std::move(config)) {
  config_.validate();
}

std::string ReportGenerator::performance_level(double theta) const {
  return config_.bands[band_index(config_.bands, theta)].label;
}

std::vector<std::string> ReportGenerator::next_steps(
    double theta, const std::vector<std::string>& weaknesses) const {
  const auto index = band_index(config_.bands, theta);
  const auto top = config_.bands.size() - 1;
  std::vector<std::string> steps;
  if (index == top && top > 0) {
    steps.emplace_back("Consider advanced topics and challenging materials");
    steps.emplace_back("Explore teaching or mentoring opportunities");
  } else if (top > 0 && index + 1 == top) {
    steps.emplace_back("Focus on mastering remaining concepts");
    steps.emplace_back("Challenge yourself with harder problems");
  } else {
    steps.emplace_back("Review fundamental concepts");
    steps.emplace_back("Practice regularly with guided exercises");
  }
  if (!weaknesses.empty() && index != top) {
    std::string focus = "Focus on improving: " + weaknesses.front();
    if (weaknesses.size() > 1) {
      focus += ", " + weaknesses[1];
    }
    steps.push_back(std::move(focus));
  }
  return steps;
}

Report ReportGenerator::generate(const Session& session) const {
  if (session.status != SessionStatus::Completed) {
    throw InvalidStateTransitionError("Report requested for session " + session.id + " in state " +
                                      to_string(session.status));
  }

  Report report;
  report.session_id = session.id;
  report.final_theta = session.final_theta.value_or(session.theta);
  report.final_se = session.final_se.value_or(session.standard_error);
  report.stop_reason = session.stop_reason;

  if (std::isfinite(report.final_se)) {
    report.confidence_lower =
        std::max(kMinTheta, report.final_theta - config_.z_score * report.final_se);
    report.confidence_upper =
        std::min(kMaxTheta, report.final_theta + config_.z_score * report.final_se);
  } else {
    report.confidence_lower = kMinTheta;
    report.confidence_upper = kMaxTheta;
  }
  report.ability_percentile = ability_percentile(report.final_theta);
  report.performance_level = performance_level(report.final_theta);

  const auto& responses = session.responses;
  report.total_questions = static_cast<int>(responses.size());
  double difficulty_sum = 0.0;
  std::map<std::string, TopicTally> tallies;
  for (const auto& r : responses) {
    if (r.is_correct) {
      ++report.correct_answers;
    }
    difficulty_sum += r.parameters.difficulty;
    if (r.topic.empty()) {
      continue;
    }
    auto& tally = tallies[r.topic];
    tally.total += 1;
    tally.correct += r.is_correct ? 1 : 0;
    tally.difficulty_sum += r.parameters.difficulty;
    tally.information += irt::information(report.final_theta, r.parameters);
  }
  if (!responses.empty()) {
    report.average_difficulty = difficulty_sum / static_cast<double>(responses.size());
  }

  std::vector<const TopicScore*> weak;
  report.topic_scores.reserve(tallies.size());
  for (const auto& kv : tallies) {
    TopicScore score;
    score.topic = kv.first;
    score.total_questions = kv.second.total;
    score.correct_answers = kv.second.correct;
    score.accuracy = static_cast<double>(kv.second.correct) / static_cast<double>(kv.second.total);
    score.average_difficulty = kv.second.difficulty_sum / static_cast<double>(kv.second.total);
    score.information = kv.second.information;
    report.topic_scores.push_back(std::move(score));
  }
  for (const auto& score : report.topic_scores) {
    if (score.accuracy >= config_.strength_threshold) {
      report.topic_strengths.push_back(score.topic);
    } else if (score.accuracy < config_.weakness_threshold) {
      report.topic_weaknesses.push_back(score.topic);
      weak.push_back(&score);
    }
  }

  std::stable_sort(weak.begin(), weak.end(), [](const TopicScore* a, const TopicScore* b) {
    return a->accuracy < b->accuracy;
  });
  for (const auto* score : weak) {
    if (report.recommended_topics.size() >= config_.max_recommended_topics) {
      break;
    }
    report.recommended_topics.push_back(score->topic);
  }
  report.recommended_difficulty =
      std::min(kMaxTheta, report.final_theta + config_.recommended_difficulty_offset);
  report.next_steps = next_steps(report.final_theta, report.recommended_topics);

  report.response_patterns = analyze_response_patterns(responses);
  report.response_consistency = response_consistency(responses);
  return report;
}

double ability_percentile(double theta) {
  return 50.0 * std::erfc(-theta / std::sqrt(2.0));
}

ResponsePatterns analyze_response_patterns(const std::vector<Response>& responses) {
  ResponsePatterns patterns;
  if (responses.size() < 3) {
    return patterns;
  }

  std::vector<double> times;
  for (const auto& r : responses) {
    if (r.response_time.has_value() && *r.response_time > 0.0) {
      times.push_back(*r.response_time);
    }
  }
  if (times.size() > 3) {
    const double slope = (times.back() - times.front()) / static_cast<double>(times.size() - 1);
    patterns.response_time_trend = slope > 1.0 ? "increasing" : slope < -1.0 ? "decreasing" : "stable";
  }

  constexpr std::size_t kWindow = 3;
  std::vector<double> windows;
  for (std::size_t i = 0; i + kWindow <= responses.size(); ++i) {
    int correct = 0;
    for (std::size_t j = i; j < i + kWindow; ++j) {
      correct += responses[j].is_correct ? 1 : 0;
    }
    windows.push_back(static_cast<double>(correct) / static_cast<double>(kWindow));
  }
  if (windows.back() > windows.front() + 0.2) {
    patterns.accuracy_trend = "improving";
  } else if (windows.back() < windows.front() - 0.2) {
    patterns.accuracy_trend = "declining";
  } else {
    patterns.accuracy_trend = "stable";
  }

  std::vector<double> difficulties;
  difficulties.reserve(responses.size());
  for (const auto& r : responses) {
    difficulties.push_back(r.parameters.difficulty);
  }
  const std::size_t half = difficulties.size() / 2;
  const double first = mean(difficulties, 0, half);
  const double second = mean(difficulties, half, difficulties.size());
  if (second > first + 0.3) {
    patterns.difficulty_adaptation = "increased";
  } else if (second < first - 0.3) {
    patterns.difficulty_adaptation = "decreased";
  } else {
    patterns.difficulty_adaptation = "stable";
  }
  return patterns;
}

// Agreement between observed and model-expected accuracy within easy/medium/hard bands.
double response_consistency(const std::vector<Response>& responses) {
  if (responses.size() < 5) {
    return 1.0;
  }
  const std::pair<double, double> ranges[] = {{-3.0, -1.0}, {-1.0, 1.0}, {1.0, 3.0}};
  std::vector<double> scores;
  for (const auto& range : ranges) {
    int count = 0;
    int correct = 0;
    double expected = 0.0;
    for (const auto& r : responses) {
      const double b = r.parameters.difficulty;
      if (b < range.first || b > range.second) {
        continue;
      }
      ++count;
      correct += r.is_correct ? 1 : 0;
      expected += irt::probability(r.theta_before, r.parameters);
    }
    if (count >= 2) {
      const double actual = static_cast<double>(correct) / count;
      scores.push_back(1.0 - std::abs(actual - expected / count));
    }
  }
  if (scores.empty()) {
    return 1.0;
  }
  double total = 0.0;
  for (double s : scores) {
    total += s;
  }
  return total / static_cast<double>(scores.size());
}

} // namespace cat
