#pragma once

#include "../include/cat/question_pool.hpp"
#include "../include/cat/types.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cat::testing {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  } catch (const std::exception& ex) {
    std::cerr << "  unexpected exception: " << ex.what() << std::endl;
    return false;
  }
  return false;
}

// Two-option multiple choice item keyed "x".
inline Item make_item(const std::string& id, double a, double b, double c = 0.0,
                      const std::string& topic = "") {
  Item item;
  item.id = id;
  item.text = "Question " + id;
  item.type = ItemType::MultipleChoice;
  item.discrimination = a;
  item.difficulty = b;
  item.guessing = c;
  item.topic = topic;
  item.options = {"x", "y"};
  item.correct_answer = "x";
  return item;
}

inline std::shared_ptr<QuestionPool> make_pool(const std::string& id, std::vector<Item> items) {
  PoolInfo info;
  info.id = id;
  info.name = "Pool " + id;
  auto pool = std::make_shared<QuestionPool>(std::move(info));
  for (auto& item : items) {
    pool->add_item(std::move(item));
  }
  return pool;
}

inline Session make_session(const std::string& pool_id, const SessionConfig& config) {
  Session session;
  session.id = "sess-test";
  session.pool_id = pool_id;
  session.examinee_id = "examinee";
  session.status = SessionStatus::InProgress;
  session.config = config;
  session.theta = config.initial_ability;
  session.rng_state = config.seed == 0 ? 1 : config.seed;
  return session;
}

inline void administer(Session& session, const Item& item) {
  session.administered_item_ids.push_back(item.id);
  if (!item.topic.empty()) {
    ++session.topic_coverage[item.topic];
  }
}

} // namespace cat::testing
