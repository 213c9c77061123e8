#include "cat/ability_estimator.hpp"

#include "cat/errors.hpp"
#include "debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace cat {
namespace {

constexpr double kMinInformation = 1e-10;

} // namespace

void EstimatorOptions::validate() const {
  if (!(min_theta < max_theta)) {
    throw std::invalid_argument("min_theta must be less than max_theta");
  }
  if (tolerance <= 0.0) {
    throw std::invalid_argument("tolerance must be positive");
  }
  if (max_iterations <= 0) {
    throw std::invalid_argument("max_iterations must be positive");
  }
  if (!(ability_step > 0.0)) {
    throw std::invalid_argument("ability_step must be positive");
  }
}

AbilityEstimator::AbilityEstimator() {
  options_.validate();
}

AbilityEstimator::AbilityEstimator(EstimatorOptions options) : options_(options) {
  options_.validate();
}

double AbilityEstimator::clamp(double theta) const {
  return std::clamp(theta, options_.min_theta, options_.max_theta);
}

bool AbilityEstimator::is_degenerate(const std::vector<irt::ScoredItem>& history) {
  bool any_correct = false;
  bool any_incorrect = false;
  for (const auto& entry : history) {
    if (entry.correct) {
      any_correct = true;
    } else {
      any_incorrect = true;
    }
  }
  return !(any_correct && any_incorrect);
}

double AbilityEstimator::standard_error(double theta,
                                        const std::vector<irt::ScoredItem>& history) const {
  const double info = irt::test_information(theta, history);
  if (info <= 0.0) {
    return unbounded_se();
  }
  return std::sqrt(1.0 / info);
}

// Newton-Raphson on the log-likelihood, with the second derivative replaced by
// minus the test information (Fisher scoring).
double AbilityEstimator::maximum_likelihood(double start_theta,
                                            const std::vector<irt::ScoredItem>& history,
                                            int& iterations) const {
  double theta = clamp(start_theta);
  iterations = 0;
  for (int i = 0; i < options_.max_iterations; ++i) {
    ++iterations;
    const double score = irt::score_function(theta, history);
    const double info = irt::test_information(theta, history);
    if (info < kMinInformation) {
      break;
    }
    const double next = clamp(theta + score / info);
    if (!std::isfinite(next)) {
      std::ostringstream oss;
      oss << "Ability estimate diverged at iteration " << iterations << " from theta " << theta;
      throw EstimationDivergenceError(oss.str());
    }
    const double delta = next - theta;
    theta = next;
    if (std::abs(delta) < options_.tolerance) {
      break;
    }
  }
  return theta;
}

AbilityEstimate AbilityEstimator::update(double prior_theta,
                                         const std::vector<irt::ScoredItem>& history,
                                         const irt::ScoredItem& next) const {
  if (!std::isfinite(prior_theta)) {
    throw EstimationDivergenceError("Prior ability estimate is not finite");
  }
  std::vector<irt::ScoredItem> all = history;
  all.push_back(next);

  AbilityEstimate estimate;
  if (is_degenerate(all)) {
    const double step = next.correct ? options_.ability_step : -options_.ability_step;
    estimate.theta = clamp(prior_theta + step);
    estimate.degenerate = true;
  } else {
    estimate.theta = maximum_likelihood(prior_theta, all, estimate.iterations);
  }
  estimate.standard_error = standard_error(estimate.theta, all);

  if (detail::debug_enabled()) {
    std::ostringstream oss;
    oss << "theta " << prior_theta << " -> " << estimate.theta << " se=" << estimate.standard_error
        << (estimate.degenerate ? " (step)" : " (mle)") << " n=" << all.size()
        << " iterations=" << estimate.iterations;
    detail::debug_log("estimator", oss.str());
  }
  return estimate;
}

AbilityEstimate AbilityEstimator::estimate(double start_theta,
                                           const std::vector<irt::ScoredItem>& history) const {
  AbilityEstimate result;
  result.theta = clamp(start_theta);
  std::vector<irt::ScoredItem> seen;
  seen.reserve(history.size());
  for (const auto& entry : history) {
    result = update(result.theta, seen, entry);
    seen.push_back(entry);
  }
  return result;
}

std::vector<irt::ScoredItem> scored_history(const Session& session) {
  std::vector<irt::ScoredItem> history;
  history.reserve(session.responses.size());
  for (const auto& r : session.responses) {
    history.push_back({r.parameters, r.is_correct});
  }
  return history;
}

} // namespace cat
