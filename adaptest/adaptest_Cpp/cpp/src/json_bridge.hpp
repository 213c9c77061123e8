#pragma once

#include "../include/cat/question_pool.hpp"
#include "../include/cat/types.hpp"

#include <nlohmann/json.hpp>

namespace cat::bridge {

nlohmann::json to_json(const Item& item);
Item item_from_json(const nlohmann::json& json_item);

// Client-facing view of an item: no answer key, no explanation, no calibration.
nlohmann::json question_to_json(const Item& item);

nlohmann::json to_json(const SessionConfig& config);
SessionConfig session_config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const PoolInfo& info);
PoolInfo pool_info_from_json(const nlohmann::json& json_info);

nlohmann::json to_json(const Response& response);
nlohmann::json to_json(const Session& session);
nlohmann::json to_json(const Report& report);
nlohmann::json to_json(const StopSignal& signal);
nlohmann::json to_json(const SubmitOutcome& outcome);
nlohmann::json to_json(const ItemStatistics& stats);

} // namespace cat::bridge
