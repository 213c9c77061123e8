#include "cat/question_pool.hpp"

#include "cat/errors.hpp"
#include "cat/irt.hpp"
#include "../scoring/scoring.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <set>
#include <unordered_set>

namespace cat {

void validate_item(const Item& item) {
  if (item.id.empty()) {
    throw InvalidItemParameters("Item id is required");
  }
  if (item.text.empty()) {
    throw InvalidItemParameters("Item '" + item.id + "': text is required");
  }
  if (!std::isfinite(item.discrimination) || item.discrimination <= 0.0) {
    throw InvalidItemParameters("Item '" + item.id + "': discrimination must be > 0");
  }
  if (!std::isfinite(item.guessing) || item.guessing < 0.0 || item.guessing >= 1.0) {
    throw InvalidItemParameters("Item '" + item.id + "': guessing must be within [0, 1)");
  }
  if (!std::isfinite(item.difficulty)) {
    throw InvalidItemParameters("Item '" + item.id + "': difficulty must be finite");
  }
  scoring::validate_answer_key(item);
}

QuestionPool::QuestionPool(PoolInfo info) : info_(std::move(info)) {
  if (info_.id.empty()) {
    throw std::invalid_argument("Question pool id is required");
  }
}

void QuestionPool::add_item(Item item) {
  validate_item(item);
  std::unique_lock lock(mutex_);
  if (index_.count(item.id) != 0) {
    throw InvalidItemParameters("Item '" + item.id + "' already exists in pool " + info_.id);
  }
  index_.emplace(item.id, entries_.size());
  entries_.push_back(std::make_unique<Entry>(std::move(item)));
}

const QuestionPool::Entry& QuestionPool::entry(const std::string& item_id) const {
  std::shared_lock lock(mutex_);
  auto it = index_.find(item_id);
  if (it == index_.end()) {
    throw UnknownItemError("Unknown item id '" + item_id + "' in pool " + info_.id);
  }
  return *entries_[it->second];
}

QuestionPool::Entry& QuestionPool::entry(const std::string& item_id) {
  std::shared_lock lock(mutex_);
  auto it = index_.find(item_id);
  if (it == index_.end()) {
    throw UnknownItemError("Unknown item id '" + item_id + "' in pool " + info_.id);
  }
  return *entries_[it->second];
}

const Item& QuestionPool::get_item(const std::string& item_id) const {
  return entry(item_id).item;
}

bool QuestionPool::contains(const std::string& item_id) const {
  std::shared_lock lock(mutex_);
  return index_.count(item_id) != 0;
}

std::size_t QuestionPool::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

std::vector<const Item*> QuestionPool::items() const {
  std::shared_lock lock(mutex_);
  std::vector<const Item*> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) {
    out.push_back(&e->item);
  }
  return out;
}

std::vector<const Item*> QuestionPool::unadministered_items(const Session& session) const {
  std::unordered_set<std::string> administered(session.administered_item_ids.begin(),
                                               session.administered_item_ids.end());
  if (session.pending_item_id.has_value()) {
    administered.insert(*session.pending_item_id);
  }
  std::shared_lock lock(mutex_);
  std::vector<const Item*> out;
  for (const auto& e : entries_) {
    if (administered.count(e->item.id) == 0) {
      out.push_back(&e->item);
    }
  }
  return out;
}

std::vector<std::string> QuestionPool::topics() const {
  std::shared_lock lock(mutex_);
  std::set<std::string> topics;
  for (const auto& e : entries_) {
    if (!e->item.topic.empty()) {
      topics.insert(e->item.topic);
    }
  }
  return {topics.begin(), topics.end()};
}

void QuestionPool::record_exposure(const std::string& item_id) {
  entry(item_id).exposure_count.fetch_add(1, std::memory_order_relaxed);
  total_exposures_.fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t QuestionPool::exposure_count(const std::string& item_id) const {
  return entry(item_id).exposure_count.load(std::memory_order_relaxed);
}

double QuestionPool::exposure_rate(const std::string& item_id) const {
  const auto count = exposure_count(item_id);
  const auto sessions = sessions_started_.load(std::memory_order_relaxed);
  if (sessions == 0) {
    return 0.0;
  }
  return static_cast<double>(count) / static_cast<double>(sessions);
}

void QuestionPool::record_session_start() {
  sessions_started_.fetch_add(1, std::memory_order_relaxed);
}

void QuestionPool::record_usage(const std::string& item_id, bool correct,
                                std::optional<double> response_time) {
  auto& e = entry(item_id);
  e.usage_count.fetch_add(1, std::memory_order_relaxed);
  if (correct) {
    e.correct_count.fetch_add(1, std::memory_order_relaxed);
  }
  if (response_time.has_value() && *response_time >= 0.0) {
    e.timed_count.fetch_add(1, std::memory_order_relaxed);
    e.response_time_ms.fetch_add(static_cast<std::uint64_t>(std::llround(*response_time * 1000.0)),
                                 std::memory_order_relaxed);
  }
}

ItemStatistics QuestionPool::item_statistics(const std::string& item_id) const {
  const auto& e = entry(item_id);
  ItemStatistics stats;
  stats.item_id = item_id;
  stats.exposure_count = e.exposure_count.load(std::memory_order_relaxed);
  stats.usage_count = e.usage_count.load(std::memory_order_relaxed);
  stats.correct_count = e.correct_count.load(std::memory_order_relaxed);
  if (stats.usage_count > 0) {
    stats.correct_rate =
        static_cast<double>(stats.correct_count) / static_cast<double>(stats.usage_count);
  }
  const auto timed = e.timed_count.load(std::memory_order_relaxed);
  if (timed > 0) {
    stats.average_response_time =
        static_cast<double>(e.response_time_ms.load(std::memory_order_relaxed)) / 1000.0 /
        static_cast<double>(timed);
  }
  stats.exposure_rate = exposure_rate(item_id);
  for (int theta = -3; theta <= 3; ++theta) {
    stats.information_curve.emplace_back(theta, irt::information(theta, e.item));
  }
  return stats;
}

} // namespace cat
