#pragma once

#include "irt.hpp"
#include "types.hpp"

#include <vector>

namespace cat {

struct EstimatorOptions {
  double min_theta = kMinTheta;
  double max_theta = kMaxTheta;
  double tolerance = 1e-4;
  int max_iterations = 50;
  double ability_step = 1.0;

  void validate() const;
};

struct AbilityEstimate {
  double theta = 0.0;
  double standard_error = unbounded_se();
  // True when the pattern was all-correct or all-incorrect and the step fallback was used.
  bool degenerate = false;
  int iterations = 0;
};

class AbilityEstimator {
public:
  AbilityEstimator();
  explicit AbilityEstimator(EstimatorOptions options);

  const EstimatorOptions& options() const noexcept { return options_; }

  // Estimate after appending `next` to `history`. Depends only on its arguments.
  AbilityEstimate update(double prior_theta, const std::vector<irt::ScoredItem>& history,
                         const irt::ScoredItem& next) const;

  // Replays a whole history from `start_theta`, one response at a time.
  AbilityEstimate estimate(double start_theta, const std::vector<irt::ScoredItem>& history) const;

  // sqrt(1 / total information); +inf when the history carries no information.
  double standard_error(double theta, const std::vector<irt::ScoredItem>& history) const;

  static bool is_degenerate(const std::vector<irt::ScoredItem>& history);

private:
  double maximum_likelihood(double start_theta, const std::vector<irt::ScoredItem>& history,
                            int& iterations) const;
  double clamp(double theta) const;

  EstimatorOptions options_;
};

std::vector<irt::ScoredItem> scored_history(const Session& session);

} // namespace cat
