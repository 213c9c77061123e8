#pragma once

#include "types.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace cat {

// A session whose final theta is >= lower_bound belongs to this band (the highest such band wins).
struct PerformanceBand {
  double lower_bound = -std::numeric_limits<double>::infinity();
  std::string label;
};

struct ReportConfig {
  std::vector<PerformanceBand> bands = {
      {-std::numeric_limits<double>::infinity(), "low"},
      {-1.0, "medium"},
      {1.0, "high"},
  };
  double strength_threshold = 0.8;
  double weakness_threshold = 0.5;
  double z_score = 1.96;
  std::size_t max_recommended_topics = 3;
  double recommended_difficulty_offset = 0.5;

  void validate() const;
};

class ReportGenerator {
public:
  ReportGenerator();
  explicit ReportGenerator(ReportConfig config);

  const ReportConfig& config() const noexcept { return config_; }

  // Only valid for completed sessions. Pure: the same session always yields the same report.
  Report generate(const Session& session) const;

  std::string performance_level(double theta) const;

private:
  std::vector<std::string> next_steps(double theta,
                                      const std::vector<std::string>& weaknesses) const;

  ReportConfig config_;
};

double ability_percentile(double theta);

ResponsePatterns analyze_response_patterns(const std::vector<Response>& responses);

double response_consistency(const std::vector<Response>& responses);

} // namespace cat
