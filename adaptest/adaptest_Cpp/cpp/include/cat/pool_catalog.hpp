#pragma once

#include "question_pool.hpp"

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace cat {

// Document shape: {id, tenant_id, name, subject, grade_level, items: [...]}.
// Every item is validated; the first invalid one aborts the load.
std::shared_ptr<QuestionPool> load_pool_json(const nlohmann::json& document);

std::shared_ptr<QuestionPool> load_pool_file(const std::string& pool_path);

} // namespace cat
