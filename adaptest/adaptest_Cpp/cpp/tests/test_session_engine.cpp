#include "../include/cat/errors.hpp"
#include "../include/cat/irt.hpp"
#include "../include/cat/memory_persistence.hpp"
#include "../include/cat/session_engine.hpp"

#include "test_support.hpp"

#include <cmath>
#include <memory>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

using cat::testing::TestSuite;
using cat::testing::make_item;
using cat::testing::make_pool;
using cat::testing::throws;

// Memory backend whose writes can be made to fail.
class FlakyPersistence : public cat::MemoryPersistence {
public:
  bool fail_save_session = false;
  bool fail_append = false;

  void save_session(const cat::Session& session) override {
    if (fail_save_session) {
      throw std::runtime_error("disk full");
    }
    MemoryPersistence::save_session(session);
  }

  void append_response(const std::string& session_id, const cat::Response& response) override {
    if (fail_append) {
      throw std::runtime_error("journal unavailable");
    }
    MemoryPersistence::append_response(session_id, response);
  }
};

struct Harness {
  std::shared_ptr<cat::MemoryPersistence> persistence = std::make_shared<cat::MemoryPersistence>();
  std::unique_ptr<cat::SessionEngine> engine;

  explicit Harness(std::shared_ptr<cat::QuestionPool> pool) {
    persistence->add_pool(std::move(pool));
    engine = cat::make_engine(persistence);
  }
};

std::shared_ptr<cat::QuestionPool> scenario_pool() {
  return make_pool("abc", {make_item("A", 1.2, -2.0, 0.25), make_item("B", 1.5, 0.0, 0.25),
                           make_item("C", 1.8, 2.0, 0.25)});
}

cat::SessionConfig scenario_config() {
  cat::SessionConfig config;
  config.max_questions = 3;
  config.min_questions = 1;
  config.se_threshold = 0.01;
  config.initial_ability = 0.0;
  return config;
}

std::shared_ptr<cat::QuestionPool> spread_pool(const std::string& id, int count, double a) {
  std::vector<cat::Item> items;
  for (int i = 0; i < count; ++i) {
    const double b = -3.0 + 6.0 * static_cast<double>(i) / static_cast<double>(count - 1);
    items.push_back(make_item(id + "-" + std::to_string(i), a, b));
  }
  return make_pool(id, std::move(items));
}

const cat::Item* as_item(const cat::SessionEngine::Next& next) {
  return std::get_if<cat::Item>(&next);
}

// Answers "x" for correct and "y" for incorrect until the engine stops.
template <typename Decide>
cat::StopSignal run_session(cat::SessionEngine& engine, const std::string& session_id,
                            Decide&& decide, std::vector<std::string>* served = nullptr) {
  for (int guard = 0; guard < 500; ++guard) {
    auto next = engine.get_next_question(session_id);
    if (auto* stop = std::get_if<cat::StopSignal>(&next)) {
      return *stop;
    }
    const auto& item = std::get<cat::Item>(next);
    if (served) {
      served->push_back(item.id);
    }
    const bool correct = decide(item);
    engine.submit_response(session_id, item.id, correct ? "x" : "y", 5.0);
  }
  return {session_id, cat::StopReason::None};
}

void test_concrete_scenario(TestSuite& suite) {
  Harness strong(scenario_pool());
  const auto id = strong.engine->start_session("abc", "alice", scenario_config());

  auto first = strong.engine->get_next_question(id);
  suite.require(as_item(first) && as_item(first)->id == "B", "first item is B");
  auto outcome = strong.engine->submit_response(id, "B", "x", 10.0);
  suite.require(outcome.is_correct && outcome.theta > 0.0, "correct answer raises theta");

  auto second = strong.engine->get_next_question(id);
  suite.require(as_item(second) && as_item(second)->id == "C",
                "after a correct answer the harder item C is favoured");
  strong.engine->submit_response(id, "C", "x", 10.0);
  auto third = strong.engine->get_next_question(id);
  suite.require(as_item(third) && as_item(third)->id == "A", "A is administered last");
  outcome = strong.engine->submit_response(id, "A", "x", 10.0);
  suite.require(outcome.completed && outcome.stop_reason == cat::StopReason::MaxQuestionsReached,
                "three answers exhaust max_questions");
  const double all_correct = strong.engine->session(id).final_theta.value_or(-99.0);

  Harness mixed(scenario_pool());
  const auto mixed_id = mixed.engine->start_session("abc", "bob", scenario_config());
  suite.require(as_item(mixed.engine->get_next_question(mixed_id))->id == "B", "mixed: B first");
  mixed.engine->submit_response(mixed_id, "B", "x", 10.0);
  suite.require(as_item(mixed.engine->get_next_question(mixed_id))->id == "C", "mixed: C second");
  mixed.engine->submit_response(mixed_id, "C", "y", 10.0);
  suite.require(as_item(mixed.engine->get_next_question(mixed_id))->id == "A", "mixed: A third");
  mixed.engine->submit_response(mixed_id, "A", "x", 10.0);
  const auto mixed_session = mixed.engine->session(mixed_id);
  suite.require(mixed_session.status == cat::SessionStatus::Completed, "mixed session completes");
  suite.require(all_correct > mixed_session.final_theta.value_or(99.0),
                "all-correct final theta exceeds the mixed pattern's");
}

void test_half_step_reselects_easy_item(TestSuite& suite) {
  Harness h(scenario_pool());
  auto config = scenario_config();
  config.ability_step = 0.5;
  const auto id = h.engine->start_session("abc", "lena", config);
  suite.require(as_item(h.engine->get_next_question(id))->id == "B", "half step: B first");
  const auto outcome = h.engine->submit_response(id, "B", "x", 10.0);
  suite.require(std::abs(outcome.theta - 0.5) < 1e-12, "degenerate pattern moves theta by the step");
  // At theta 0.5 item A still carries more information than C.
  suite.require(as_item(h.engine->get_next_question(id))->id == "A",
                "with a half step the easy item A comes second");
}

void test_stops_at_max_questions(TestSuite& suite) {
  Harness h(spread_pool("deep", 40, 1.2));
  cat::SessionConfig config;
  config.max_questions = 10;
  config.min_questions = 1;
  config.se_threshold = 0.001;
  const auto id = h.engine->start_session("deep", "carol", config);
  int count = 0;
  std::vector<std::string> served;
  const auto stop = run_session(
      *h.engine, id, [&count](const cat::Item&) { return (count++ % 2) == 0; }, &served);
  suite.require(stop.reason == cat::StopReason::MaxQuestionsReached, "stopped on max questions");
  suite.require(served.size() == 10, "exactly max_questions items administered");
  const auto session = h.engine->session(id);
  suite.require(session.responses.size() == 10, "ten responses recorded");
  suite.require(session.ability_history.size() == 11,
                "ability history holds the initial estimate plus one per response");
}

void test_stops_on_precision(TestSuite& suite) {
  Harness h(spread_pool("wide", 60, 1.5));
  cat::SessionConfig config;
  config.max_questions = 30;
  config.min_questions = 5;
  config.se_threshold = 0.8;
  const auto id = h.engine->start_session("wide", "dave", config);
  int count = 0;
  std::vector<std::string> served;
  const auto stop = run_session(
      *h.engine, id, [&count](const cat::Item&) { return (count++ % 2) == 0; }, &served);
  suite.require(stop.reason == cat::StopReason::PrecisionReached, "stopped on precision");
  suite.require(served.size() >= 5 && served.size() <= 30,
                "precision stop respects min and max questions");
  suite.require(h.engine->session(id).standard_error <= 0.8, "SE at or below the threshold");

  const std::set<std::string> unique(served.begin(), served.end());
  suite.require(unique.size() == served.size(), "no item is administered twice");
}

void test_time_limit(TestSuite& suite) {
  Harness h(spread_pool("timed", 20, 1.0));
  cat::SessionConfig config;
  config.max_questions = 15;
  config.min_questions = 1;
  config.se_threshold = 0.001;
  config.max_time_seconds = 12.0;
  const auto id = h.engine->start_session("timed", "erin", config);
  // Each answer takes 5 seconds.
  const auto stop = run_session(*h.engine, id, [](const cat::Item& item) {
    return item.difficulty < 0.0;
  });
  suite.require(stop.reason == cat::StopReason::TimeLimitReached, "stopped on the time limit");
  suite.require(h.engine->session(id).responses.size() == 3, "third answer crosses the limit");
}

void test_pool_exhausted(TestSuite& suite) {
  Harness h(make_pool("tiny", {make_item("t1", 1.0, 0.0), make_item("t2", 1.0, 1.0)}));
  cat::SessionConfig config;
  config.max_questions = 5;
  config.min_questions = 1;
  config.se_threshold = 0.001;
  const auto id = h.engine->start_session("tiny", "frank", config);
  const auto stop = run_session(*h.engine, id, [](const cat::Item&) { return true; });
  suite.require(stop.reason == cat::StopReason::PoolExhausted, "pool exhaustion ends the session");
  const auto again = h.engine->get_next_question(id);
  const auto* signal = std::get_if<cat::StopSignal>(&again);
  suite.require(signal && signal->reason == cat::StopReason::PoolExhausted,
                "completed session keeps answering with a stop signal");
}

void test_pending_item_and_atomic_submit(TestSuite& suite) {
  Harness h(spread_pool("atomic", 10, 1.0));
  cat::SessionConfig config;
  config.exposure_control = false;
  const auto id = h.engine->start_session("atomic", "grace", config);

  const auto first = h.engine->get_next_question(id);
  const auto repeat = h.engine->get_next_question(id);
  suite.require(as_item(first) && as_item(repeat) && as_item(first)->id == as_item(repeat)->id,
                "pending item is served again until answered");
  const auto serving = h.engine->session(id);
  suite.require(serving.administered_item_ids.empty() &&
                    serving.pending_item_id == as_item(first)->id,
                "a served item counts as administered only once answered");

  const auto before = h.engine->session(id);
  const auto other = as_item(first)->id == "atomic-0" ? "atomic-1" : "atomic-0";
  suite.require(throws<cat::UnknownItemError>([&] { h.engine->submit_response(id, other, "x", 1.0); }),
                "answering an item that is not pending fails");
  suite.require(throws<std::invalid_argument>([&] {
                  h.engine->submit_response(id, as_item(first)->id, "x", -3.0);
                }),
                "negative response time rejected");
  const auto after = h.engine->session(id);
  suite.require(after.responses.size() == before.responses.size() && after.theta == before.theta &&
                    after.pending_item_id == before.pending_item_id,
                "failed submits leave the session untouched");
  suite.require(h.persistence->response_log(id).empty(), "failed submits append nothing");

  const auto outcome = h.engine->submit_response(id, as_item(first)->id, "x", 4.0);
  suite.require(outcome.is_correct && !outcome.completed, "valid submit is applied");
  const auto answered = h.engine->session(id);
  suite.require(answered.administered_item_ids.size() == 1 &&
                    answered.administered_item_ids[0] == answered.responses[0].question_id,
                "administered ids follow the responses");
  const auto log = h.persistence->response_log(id);
  suite.require(log.size() == 1 && log[0].question_number == 1 && log[0].theta_before == 0.0,
                "response journal records the step");
  suite.require(throws<cat::UnknownItemError>([&] {
                  h.engine->submit_response(id, as_item(first)->id, "x", 4.0);
                }),
                "the same item cannot be answered twice");

  const auto stats = h.persistence->load_pool("atomic")->item_statistics(as_item(first)->id);
  suite.require(stats.exposure_count == 1 && stats.usage_count == 1 && stats.correct_count == 1,
                "item statistics updated once");
}

void test_failed_writes_leave_no_trace(TestSuite& suite) {
  auto persistence = std::make_shared<FlakyPersistence>();
  persistence->add_pool(spread_pool("flaky", 10, 1.0));
  auto engine = cat::make_engine(persistence);
  cat::SessionConfig config;
  config.exposure_control = false;
  const auto id = engine->start_session("flaky", "olga", config);
  const auto pool = persistence->load_pool("flaky");

  persistence->fail_save_session = true;
  suite.require(throws<std::runtime_error>([&] { engine->get_next_question(id); }),
                "serving fails when the session cannot be stored");
  persistence->fail_save_session = false;
  suite.require(pool->total_exposures() == 0, "a failed serve records no exposure");
  suite.require(!engine->session(id).pending_item_id.has_value(),
                "a failed serve leaves nothing pending");

  const auto item_id = as_item(engine->get_next_question(id))->id;
  const auto before = engine->session(id);
  auto unchanged = [&](const std::string& label) {
    const auto after = engine->session(id);
    suite.require(after.responses.empty() && after.administered_item_ids.empty() &&
                      after.theta == before.theta && after.pending_item_id == item_id,
                  label + ": session unchanged");
    suite.require(persistence->response_log(id).empty(), label + ": journal unchanged");
    suite.require(pool->item_statistics(item_id).usage_count == 0, label + ": usage unchanged");
  };

  persistence->fail_save_session = true;
  suite.require(throws<std::runtime_error>([&] { engine->submit_response(id, item_id, "x", 3.0); }),
                "submit fails when the session cannot be stored");
  persistence->fail_save_session = false;
  unchanged("session write failure");

  persistence->fail_append = true;
  suite.require(throws<std::runtime_error>([&] { engine->submit_response(id, item_id, "x", 3.0); }),
                "submit fails when the journal cannot be written");
  persistence->fail_append = false;
  unchanged("journal write failure");

  const auto outcome = engine->submit_response(id, item_id, "x", 3.0);
  const auto stored = engine->session(id);
  suite.require(outcome.is_correct && stored.responses.size() == 1 &&
                    persistence->response_log(id).size() == 1,
                "retry after the failures is applied once");
  const auto stats = pool->item_statistics(item_id);
  suite.require(stats.exposure_count == 1 && stats.usage_count == 1,
                "retry counts one exposure and one use");
}

void test_state_machine(TestSuite& suite) {
  Harness h(spread_pool("states", 12, 1.0));
  cat::SessionConfig config;

  suite.require(throws<cat::UnknownSessionError>([&] { h.engine->get_next_question("sess-404"); }),
                "unknown session id");
  suite.require(throws<cat::UnknownPoolError>([&] { h.engine->start_session("nope", "x", config); }),
                "unknown pool id");
  cat::SessionConfig bad;
  bad.min_questions = 50;
  bad.max_questions = 10;
  suite.require(throws<std::invalid_argument>([&] { h.engine->start_session("states", "x", bad); }),
                "invalid config rejected");

  const auto id = h.engine->start_session("states", "heidi", config);
  suite.require(h.engine->session(id).status == cat::SessionStatus::InProgress,
                "started sessions are in progress");
  suite.require(h.engine->start_session("states", "heidi", config) == id,
                "an active session is reused for the same examinee");
  suite.require(h.engine->start_session("states", "ivan", config) != id,
                "other examinees get their own session");

  const auto next = h.engine->get_next_question(id);
  const auto item_id = as_item(next)->id;
  h.engine->submit_response(id, item_id, "x", 2.0);

  const auto report = h.engine->complete_session(id);
  const auto completed = h.engine->session(id);
  suite.require(completed.status == cat::SessionStatus::Completed &&
                    completed.stop_reason == cat::StopReason::CompletedByCaller,
                "caller completion recorded");
  suite.require(report.stop_reason == cat::StopReason::CompletedByCaller &&
                    report.total_questions == 1,
                "report reflects the answered items");
  const auto again = h.engine->complete_session(id);
  suite.require(again.final_theta == report.final_theta &&
                    again.confidence_upper == report.confidence_upper &&
                    again.next_steps == report.next_steps,
                "completing twice returns the same report");
  suite.require(throws<cat::InvalidStateTransitionError>([&] {
                  h.engine->submit_response(id, item_id, "x", 1.0);
                }),
                "completed sessions reject answers");
  suite.require(throws<cat::InvalidStateTransitionError>([&] { h.engine->abandon_session(id); }),
                "completed sessions cannot be abandoned");
  suite.require(h.engine->start_session("states", "heidi", config) != id,
                "a new session opens once the previous one is complete");

  const auto dropped = h.engine->start_session("states", "judy", config);
  const auto answered_id = as_item(h.engine->get_next_question(dropped))->id;
  h.engine->submit_response(dropped, answered_id, "x", 2.0);
  h.engine->get_next_question(dropped);
  const auto partial = h.engine->session(dropped);
  h.engine->abandon_session(dropped);
  const auto abandoned = h.engine->session(dropped);
  suite.require(abandoned.status == cat::SessionStatus::Abandoned &&
                    !abandoned.pending_item_id.has_value(),
                "abandon moves the session to abandoned");
  suite.require(abandoned.theta == partial.theta &&
                    abandoned.standard_error == partial.standard_error &&
                    abandoned.ability_history == partial.ability_history &&
                    abandoned.responses.size() == 1,
                "abandon keeps the partial estimate and history");
  suite.require(abandoned.administered_item_ids.size() == abandoned.responses.size() &&
                    abandoned.administered_item_ids[0] == answered_id,
                "the unanswered item is not counted as administered");
  suite.require(throws<cat::InvalidStateTransitionError>([&] { h.engine->get_next_question(dropped); }),
                "abandoned sessions serve no items");
  suite.require(throws<cat::InvalidStateTransitionError>([&] { h.engine->complete_session(dropped); }),
                "abandoned sessions cannot be completed");
  suite.require(!h.persistence->load_report(dropped).has_value(), "abandoned sessions have no report");
}

void test_debug_state(TestSuite& suite) {
  Harness h(spread_pool("debug", 8, 1.0));
  const auto id = h.engine->start_session("debug", "ken", cat::SessionConfig{});
  const auto state = h.engine->debug_state(id);
  suite.require(state.contains("session") && state["session"]["status"] == "in_progress",
                "debug state embeds the session");
  suite.require(state["session"]["standard_error"].is_null(), "unbounded SE serialises as null");
  suite.require(state.contains("candidates") && state["candidates"].is_array() &&
                    !state["candidates"].empty(),
                "debug state lists the next candidates");
}

void test_convergence(TestSuite& suite) {
  constexpr int kSimulations = 50;
  constexpr double kTrueTheta = 1.0;
  auto pool = spread_pool("calibrated", 200, 2.0);
  Harness h(pool);
  cat::SessionConfig config;
  config.max_questions = 80;
  config.min_questions = 20;
  config.se_threshold = 0.15;
  config.exposure_control = false;
  config.topic_balancing = false;

  int close = 0;
  int short_sessions = 0;
  for (int sim = 0; sim < kSimulations; ++sim) {
    std::mt19937_64 rng(1000 + sim);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    const auto id = h.engine->start_session("calibrated", "sim-" + std::to_string(sim), config);
    run_session(*h.engine, id, [&](const cat::Item& item) {
      return uniform(rng) < cat::irt::probability(kTrueTheta, item);
    });
    const auto session = h.engine->session(id);
    if (session.responses.size() < 20) {
      ++short_sessions;
    }
    if (std::abs(session.final_theta.value_or(99.0) - kTrueTheta) <= 0.3) {
      ++close;
    }
  }
  suite.require(short_sessions == 0, "every simulated session answers at least 20 items");
  suite.require(close * 4 >= kSimulations * 3,
                "at least 75% of simulated estimates land within 0.3 of the true ability (" +
                    std::to_string(close) + "/" + std::to_string(kSimulations) + ")");
}

} // namespace

int main() {
  TestSuite suite;
  test_concrete_scenario(suite);
  test_half_step_reselects_easy_item(suite);
  test_stops_at_max_questions(suite);
  test_stops_on_precision(suite);
  test_time_limit(suite);
  test_pool_exhausted(suite);
  test_pending_item_and_atomic_submit(suite);
  test_failed_writes_leave_no_trace(suite);
  test_state_machine(suite);
  test_debug_state(suite);
  test_convergence(suite);
  if (!suite.ok) {
    return 1;
  }
  std::cout << "session engine tests passed" << std::endl;
  return 0;
}
