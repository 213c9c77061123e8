#include "cat/memory_persistence.hpp"

#include "cat/errors.hpp"

#include <stdexcept>
#include <utility>

namespace cat {

void MemoryPersistence::add_pool(std::shared_ptr<QuestionPool> pool) {
  if (!pool) {
    throw std::invalid_argument("MemoryPersistence: null pool");
  }
  std::scoped_lock guard(mutex_);
  const std::string id = pool->id();
  pools_[id] = std::move(pool);
}

std::shared_ptr<QuestionPool> MemoryPersistence::load_pool(const std::string& pool_id) {
  std::scoped_lock guard(mutex_);
  auto it = pools_.find(pool_id);
  if (it == pools_.end()) {
    throw UnknownPoolError("Unknown pool id '" + pool_id + "'");
  }
  return it->second;
}

Session MemoryPersistence::load_session(const std::string& session_id) {
  std::scoped_lock guard(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw UnknownSessionError("Unknown session id '" + session_id + "'");
  }
  return it->second;
}

void MemoryPersistence::save_session(const Session& session) {
  std::scoped_lock guard(mutex_);
  sessions_[session.id] = session;
}

void MemoryPersistence::append_response(const std::string& session_id, const Response& response) {
  std::scoped_lock guard(mutex_);
  responses_[session_id].push_back(response);
}

void MemoryPersistence::save_report(const Report& report) {
  std::scoped_lock guard(mutex_);
  reports_[report.session_id] = report;
}

std::optional<Report> MemoryPersistence::load_report(const std::string& session_id) {
  std::scoped_lock guard(mutex_);
  auto it = reports_.find(session_id);
  if (it == reports_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> MemoryPersistence::find_active_session(const std::string& pool_id,
                                                                  const std::string& examinee_id) {
  std::scoped_lock guard(mutex_);
  for (const auto& kv : sessions_) {
    const auto& session = kv.second;
    if (session.pool_id == pool_id && session.examinee_id == examinee_id &&
        session.status == SessionStatus::InProgress) {
      return session.id;
    }
  }
  return std::nullopt;
}

std::vector<Response> MemoryPersistence::response_log(const std::string& session_id) const {
  std::scoped_lock guard(mutex_);
  auto it = responses_.find(session_id);
  if (it == responses_.end()) {
    return {};
  }
  return it->second;
}

std::size_t MemoryPersistence::session_count() const {
  std::scoped_lock guard(mutex_);
  return sessions_.size();
}

} // namespace cat
