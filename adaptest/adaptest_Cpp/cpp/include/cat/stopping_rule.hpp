#pragma once

#include "item_selector.hpp"
#include "question_pool.hpp"
#include "types.hpp"

namespace cat {

struct StopDecision {
  bool stop = false;
  StopReason reason = StopReason::None;
};

// Rules in priority order: max questions, precision, time limit, pool exhausted.
class StoppingRule {
public:
  explicit StoppingRule(const ItemSelector& selector) : selector_(selector) {}

  StopDecision should_stop(const Session& session, const QuestionPool& pool) const;

private:
  const ItemSelector& selector_;
};

} // namespace cat
