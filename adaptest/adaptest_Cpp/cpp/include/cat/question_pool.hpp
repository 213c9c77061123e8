#pragma once

#include "types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cat {

struct PoolInfo {
  std::string id;
  std::string tenant_id;
  std::string name;
  std::string subject;
  std::string grade_level;
};

struct ItemStatistics {
  std::string item_id;
  std::uint64_t exposure_count = 0;
  std::uint64_t usage_count = 0;
  std::uint64_t correct_count = 0;
  double correct_rate = 0.0;
  double average_response_time = 0.0;
  double exposure_rate = 0.0;
  // (theta, information) pairs for theta in -3..3.
  std::vector<std::pair<double, double>> information_curve;
};

// Throws InvalidItemParameters: a <= 0, c outside [0, 1), missing id/text, or a key
// that does not fit the item type.
void validate_item(const Item& item);

// Append-only arena of calibrated items. Every item carries its own atomic counters,
// so concurrent sessions update exposure without a pool-wide lock. The shared mutex
// only guards the arena layout against concurrent add_item calls.
class QuestionPool {
public:
  explicit QuestionPool(PoolInfo info);

  QuestionPool(const QuestionPool&) = delete;
  QuestionPool& operator=(const QuestionPool&) = delete;

  const PoolInfo& info() const noexcept { return info_; }
  const std::string& id() const noexcept { return info_.id; }

  void add_item(Item item);

  const Item& get_item(const std::string& item_id) const;
  bool contains(const std::string& item_id) const;
  std::size_t size() const;

  // Items in insertion order. Pointers stay valid for the lifetime of the pool.
  std::vector<const Item*> items() const;
  // Excludes answered items and the session's pending item.
  std::vector<const Item*> unadministered_items(const Session& session) const;
  std::vector<std::string> topics() const;

  void record_exposure(const std::string& item_id);
  std::uint64_t exposure_count(const std::string& item_id) const;
  // Share of started sessions that were shown the item.
  double exposure_rate(const std::string& item_id) const;

  void record_session_start();
  std::uint64_t sessions_started() const { return sessions_started_.load(); }
  std::uint64_t total_exposures() const { return total_exposures_.load(); }

  void record_usage(const std::string& item_id, bool correct,
                    std::optional<double> response_time);
  ItemStatistics item_statistics(const std::string& item_id) const;

private:
  struct Entry {
    explicit Entry(Item value) : item(std::move(value)) {}

    const Item item;
    std::atomic<std::uint64_t> exposure_count{0};
    std::atomic<std::uint64_t> usage_count{0};
    std::atomic<std::uint64_t> correct_count{0};
    std::atomic<std::uint64_t> timed_count{0};
    std::atomic<std::uint64_t> response_time_ms{0};
  };

  const Entry& entry(const std::string& item_id) const;
  Entry& entry(const std::string& item_id);

  PoolInfo info_;
  mutable std::shared_mutex mutex_;
  std::vector<std::unique_ptr<Entry>> entries_;
  std::unordered_map<std::string, std::size_t> index_;
  std::atomic<std::uint64_t> sessions_started_{0};
  std::atomic<std::uint64_t> total_exposures_{0};
};

} // namespace cat
