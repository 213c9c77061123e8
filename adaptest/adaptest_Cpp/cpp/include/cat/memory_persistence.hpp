#pragma once

#include "persistence.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cat {

class MemoryPersistence : public Persistence {
public:
  void add_pool(std::shared_ptr<QuestionPool> pool);

  std::shared_ptr<QuestionPool> load_pool(const std::string& pool_id) override;
  Session load_session(const std::string& session_id) override;
  void save_session(const Session& session) override;
  void append_response(const std::string& session_id, const Response& response) override;
  void save_report(const Report& report) override;
  std::optional<Report> load_report(const std::string& session_id) override;
  std::optional<std::string> find_active_session(const std::string& pool_id,
                                                 const std::string& examinee_id) override;

  // Journal of append_response calls for one session.
  std::vector<Response> response_log(const std::string& session_id) const;
  std::size_t session_count() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<QuestionPool>> pools_;
  std::map<std::string, Session> sessions_;
  std::unordered_map<std::string, std::vector<Response>> responses_;
  std::unordered_map<std::string, Report> reports_;
};

} // namespace cat
