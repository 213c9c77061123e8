#pragma once

#include "types.hpp"

#include <vector>

namespace cat::irt {

// Three-parameter logistic probability of a correct response.
// Strictly increasing in theta for a > 0; tends to c as theta -> -inf and 1 as theta -> +inf.
double probability(double theta, const ItemParameters& params);
double probability(double theta, const Item& item);

// Fisher information of one item at theta. Peaks near b (shifted slightly up by c).
double information(double theta, const ItemParameters& params);
double information(double theta, const Item& item);

struct ScoredItem {
  ItemParameters params;
  bool correct = false;
};

double test_information(double theta, const std::vector<ScoredItem>& history);

double log_likelihood(double theta, const std::vector<ScoredItem>& history);

// First derivative of the log-likelihood with respect to theta.
double score_function(double theta, const std::vector<ScoredItem>& history);

} // namespace cat::irt
