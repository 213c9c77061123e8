#include "cat/item_selector.hpp"

#include "cat/irt.hpp"
#include "debug_log.hpp"
#include "rng.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>

namespace cat {
namespace {

constexpr double kMinBalanceFactor = 0.05;

std::map<std::string, double> target_shares(const SessionConfig& config,
                                            const QuestionPool& pool) {
  std::map<std::string, double> shares;
  if (!config.topic_targets.empty()) {
    double total = 0.0;
    for (const auto& kv : config.topic_targets) {
      total += kv.second;
    }
    if (total > 0.0) {
      for (const auto& kv : config.topic_targets) {
        shares[kv.first] = kv.second / total;
      }
    }
    return shares;
  }
  const auto topics = pool.topics();
  for (const auto& topic : topics) {
    shares[topic] = 1.0 / static_cast<double>(topics.size());
  }
  return shares;
}

double balance_factor(const Item& item, const Session& session,
                      const std::map<std::string, double>& targets) {
  if (item.topic.empty()) {
    return 1.0;
  }
  auto target_it = targets.find(item.topic);
  const double target = target_it != targets.end() ? target_it->second : 0.0;
  double observed = 0.0;
  const auto administered = session.administered_item_ids.size();
  if (administered > 0) {
    auto it = session.topic_coverage.find(item.topic);
    if (it != session.topic_coverage.end()) {
      observed = static_cast<double>(it->second) / static_cast<double>(administered);
    }
  }
  return std::max(kMinBalanceFactor,
                  1.0 + session.config.topic_balance_weight * (target - observed));
}

} // namespace

std::vector<const Item*> ItemSelector::eligible_items(const Session& session,
                                                      const QuestionPool& pool) const {
  auto candidates = pool.unadministered_items(session);
  const auto& config = session.config;
  if (!config.exposure_control || candidates.empty()) {
    return candidates;
  }
  const auto sessions = pool.sessions_started();
  if (sessions < static_cast<std::uint64_t>(std::max(config.exposure_warmup_sessions, 0))) {
    return candidates;
  }
  std::vector<const Item*> allowed;
  allowed.reserve(candidates.size());
  for (const auto* item : candidates) {
    if (pool.exposure_rate(item->id) <= config.max_exposure_rate) {
      allowed.push_back(item);
    }
  }
  if (allowed.empty()) {
    // Exposure control only reorders fairness; it never empties an otherwise valid pool.
    detail::debug_log("selector", "every candidate over exposure cap; filter relaxed");
    return candidates;
  }
  return allowed;
}

std::vector<SelectionCandidate> ItemSelector::rank_candidates(const Session& session,
                                                              const QuestionPool& pool) const {
  const auto items = eligible_items(session, pool);
  std::map<std::string, double> targets;
  if (session.config.topic_balancing) {
    targets = target_shares(session.config, pool);
  }

  std::vector<SelectionCandidate> ranked;
  ranked.reserve(items.size());
  for (const auto* item : items) {
    SelectionCandidate candidate;
    candidate.item = item;
    candidate.information = irt::information(session.theta, *item);
    if (session.config.topic_balancing) {
      candidate.balance_factor = balance_factor(*item, session, targets);
    }
    switch (session.config.selection_method) {
      case SelectionMethod::ClosestDifficulty:
        candidate.score = -std::abs(item->difficulty - session.theta) / candidate.balance_factor;
        break;
      case SelectionMethod::MaximumInformation:
      case SelectionMethod::Random:
        candidate.score = candidate.information * candidate.balance_factor;
        break;
    }
    ranked.push_back(candidate);
  }

  std::sort(ranked.begin(), ranked.end(),
            [](const SelectionCandidate& a, const SelectionCandidate& b) {
              if (a.score != b.score) {
                return a.score > b.score;
              }
              return a.item->id < b.item->id;
            });
  return ranked;
}

const Item* ItemSelector::choose(const Session& session, const QuestionPool& pool,
                                 std::uint64_t& rng_state) const {
  const auto ranked = rank_candidates(session, pool);
  if (ranked.empty()) {
    return nullptr;
  }
  if (session.config.selection_method != SelectionMethod::Random) {
    return ranked.front().item;
  }

  // Weighted by the balance factor so topic balancing still applies.
  double total = 0.0;
  for (const auto& candidate : ranked) {
    total += candidate.balance_factor;
  }
  double pick = rand_unit(rng_state) * total;
  for (const auto& candidate : ranked) {
    pick -= candidate.balance_factor;
    if (pick < 0.0) {
      return candidate.item;
    }
  }
  return ranked.back().item;
}

const Item* ItemSelector::select_next(Session& session, const QuestionPool& pool) const {
  return choose(session, pool, session.rng_state);
}

const Item* ItemSelector::peek_next(const Session& session, const QuestionPool& pool) const {
  std::uint64_t rng_state = session.rng_state;
  return choose(session, pool, rng_state);
}

nlohmann::json ItemSelector::describe(const Session& session, const QuestionPool& pool,
                                      std::size_t limit) const {
  nlohmann::json out = nlohmann::json::array();
  const auto ranked = rank_candidates(session, pool);
  for (std::size_t i = 0; i < ranked.size() && i < limit; ++i) {
    nlohmann::json entry = nlohmann::json::object();
    entry["item_id"] = ranked[i].item->id;
    entry["information"] = ranked[i].information;
    entry["balance_factor"] = ranked[i].balance_factor;
    entry["score"] = ranked[i].score;
    entry["exposure_rate"] = pool.exposure_rate(ranked[i].item->id);
    out.push_back(std::move(entry));
  }
  return out;
}

} // namespace cat
