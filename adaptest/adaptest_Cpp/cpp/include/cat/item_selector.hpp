#pragma once

#include "question_pool.hpp"
#include "types.hpp"

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

namespace cat {

struct SelectionCandidate {
  const Item* item = nullptr;
  double information = 0.0;
  // Topic balancing multiplier; 1.0 when balancing is off or the item has no topic.
  double balance_factor = 1.0;
  // Higher is better for every selection method.
  double score = 0.0;
};

class ItemSelector {
public:
  // Picks the next item. Advances the session's random state for SelectionMethod::Random.
  // The caller records exposure once the choice is stored. Returns nullptr when nothing
  // is eligible.
  const Item* select_next(Session& session, const QuestionPool& pool) const;

  // Same choice as select_next, without side effects.
  const Item* peek_next(const Session& session, const QuestionPool& pool) const;

  // Eligible candidates, best first. Random selection ignores this order.
  std::vector<SelectionCandidate> rank_candidates(const Session& session,
                                                  const QuestionPool& pool) const;

  nlohmann::json describe(const Session& session, const QuestionPool& pool,
                          std::size_t limit = 5) const;

private:
  std::vector<const Item*> eligible_items(const Session& session, const QuestionPool& pool) const;
  const Item* choose(const Session& session, const QuestionPool& pool,
                     std::uint64_t& rng_state) const;
};

} // namespace cat
