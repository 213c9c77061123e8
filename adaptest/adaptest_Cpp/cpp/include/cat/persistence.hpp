#pragma once

#include "question_pool.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace cat {

// Storage collaborator. The engine calls it at the boundaries of every entry point and
// never keeps session state of its own.
class Persistence {
public:
  virtual ~Persistence() = default;

  // Throws UnknownPoolError.
  virtual std::shared_ptr<QuestionPool> load_pool(const std::string& pool_id) = 0;

  // Throws UnknownSessionError.
  virtual Session load_session(const std::string& session_id) = 0;

  virtual void save_session(const Session& session) = 0;

  virtual void append_response(const std::string& session_id, const Response& response) = 0;

  virtual void save_report(const Report& report) = 0;

  virtual std::optional<Report> load_report(const std::string& session_id) = 0;

  // In-progress session of this examinee on this pool, if any.
  virtual std::optional<std::string> find_active_session(const std::string& pool_id,
                                                         const std::string& examinee_id) = 0;
};

} // namespace cat
