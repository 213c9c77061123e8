#include "cat/irt.hpp"

#include <algorithm>
#include <cmath>

namespace cat::irt {
namespace {

constexpr double kProbabilityFloor = 1e-12;

// Logistic value and its complement, each computed without cancellation.
struct Logistic {
  double value;
  double complement;
};

Logistic logistic(double z) {
  if (z >= 0.0) {
    const double e = std::exp(-z);
    return {1.0 / (1.0 + e), e / (1.0 + e)};
  }
  const double e = std::exp(z);
  return {e / (1.0 + e), 1.0 / (1.0 + e)};
}

Logistic item_logistic(double theta, const ItemParameters& params) {
  return logistic(params.discrimination * (theta - params.difficulty));
}

} // namespace

double probability(double theta, const ItemParameters& params) {
  const auto l = item_logistic(theta, params);
  return params.guessing + (1.0 - params.guessing) * l.value;
}

double probability(double theta, const Item& item) {
  return probability(theta, item.parameters());
}

double information(double theta, const ItemParameters& params) {
  const auto l = item_logistic(theta, params);
  const double p = params.guessing + (1.0 - params.guessing) * l.value;
  const double q = (1.0 - params.guessing) * l.complement;
  if (p <= 0.0 || q <= 0.0) {
    return 0.0;
  }
  const double a = params.discrimination;
  // ((p - c) / (1 - c))^2 reduces to the logistic value squared.
  return a * a * l.value * l.value * q / p;
}

double information(double theta, const Item& item) {
  return information(theta, item.parameters());
}

double test_information(double theta, const std::vector<ScoredItem>& history) {
  double total = 0.0;
  for (const auto& entry : history) {
    total += information(theta, entry.params);
  }
  return total;
}

double log_likelihood(double theta, const std::vector<ScoredItem>& history) {
  double total = 0.0;
  for (const auto& entry : history) {
    const auto l = item_logistic(theta, entry.params);
    const double c = entry.params.guessing;
    const double p = std::max(c + (1.0 - c) * l.value, kProbabilityFloor);
    const double q = std::max((1.0 - c) * l.complement, kProbabilityFloor);
    total += entry.correct ? std::log(p) : std::log(q);
  }
  return total;
}

double score_function(double theta, const std::vector<ScoredItem>& history) {
  double total = 0.0;
  for (const auto& entry : history) {
    const auto l = item_logistic(theta, entry.params);
    const double c = entry.params.guessing;
    const double p = c + (1.0 - c) * l.value;
    if (p <= 0.0) {
      continue;
    }
    const double r = entry.correct ? 1.0 : 0.0;
    total += entry.params.discrimination * (r - p) * l.value / p;
  }
  return total;
}

} // namespace cat::irt
