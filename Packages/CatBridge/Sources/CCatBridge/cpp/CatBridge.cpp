#include "CatBridge.h"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "cat/errors.hpp"
#include "cat/memory_persistence.hpp"
#include "cat/pool_catalog.hpp"
#include "cat/session_engine.hpp"
#include "src/json_bridge.hpp"

namespace {

struct EngineState {
  std::mutex mutex;
  std::shared_ptr<cat::MemoryPersistence> persistence;
  std::unique_ptr<cat::SessionEngine> engine;
};

EngineState& state() {
  static EngineState instance;
  return instance;
}

cat::SessionEngine& ensure_engine() {
  auto& s = state();
  if (!s.engine) {
    s.persistence = std::make_shared<cat::MemoryPersistence>();
    s.engine = cat::make_engine(s.persistence);
  }
  return *s.engine;
}

char* copy_string(const std::string& value) {
  char* buffer = static_cast<char*>(std::malloc(value.size() + 1));
  if (!buffer) {
    return nullptr;
  }
  std::memcpy(buffer, value.c_str(), value.size());
  buffer[value.size()] = '\0';
  return buffer;
}

char* copy_json(const nlohmann::json& json) {
  return copy_string(json.dump());
}

nlohmann::json ok_envelope() {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "ok";
  return payload;
}

nlohmann::json error_envelope(const std::string& kind, const std::string& message) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["error"] = kind;
  payload["message"] = message;
  return payload;
}

const char* error_kind(const std::exception& ex) {
  if (dynamic_cast<const cat::InvalidItemParameters*>(&ex)) {
    return "invalid_item_parameters";
  }
  if (dynamic_cast<const cat::NoEligibleItemsError*>(&ex)) {
    return "no_eligible_items";
  }
  if (dynamic_cast<const cat::InvalidStateTransitionError*>(&ex)) {
    return "invalid_state_transition";
  }
  if (dynamic_cast<const cat::EstimationDivergenceError*>(&ex)) {
    return "estimation_divergence";
  }
  if (dynamic_cast<const cat::UnknownItemError*>(&ex)) {
    return "unknown_item";
  }
  if (dynamic_cast<const cat::UnknownSessionError*>(&ex)) {
    return "unknown_session";
  }
  if (dynamic_cast<const cat::UnknownPoolError*>(&ex)) {
    return "unknown_pool";
  }
  if (dynamic_cast<const nlohmann::json::exception*>(&ex) ||
      dynamic_cast<const std::invalid_argument*>(&ex)) {
    return "invalid_argument";
  }
  return "internal";
}

// Runs `fn` under the bridge mutex and turns exceptions into error envelopes.
template <typename Fn>
char* guarded(Fn&& fn) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    return copy_json(fn(ensure_engine()));
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(error_kind(ex), ex.what()));
  } catch (...) {
    return copy_json(error_envelope("internal", "Unknown error"));
  }
}

std::string require_session_id(const char* session_id) {
  if (!session_id || *session_id == '\0') {
    throw std::invalid_argument("Missing session id");
  }
  return std::string(session_id);
}

nlohmann::json parse_document(const char* json, const char* what) {
  if (!json) {
    throw std::invalid_argument(std::string("Missing ") + what + " json");
  }
  return nlohmann::json::parse(json);
}

} // namespace

extern "C" {

char* cat_load_pool(const char* pool_json) {
  return guarded([&](cat::SessionEngine&) {
    auto pool = cat::load_pool_json(parse_document(pool_json, "pool"));
    nlohmann::json payload = ok_envelope();
    payload["pool"] = cat::bridge::to_json(pool->info());
    payload["item_count"] = pool->size();
    state().persistence->add_pool(std::move(pool));
    return payload;
  });
}

char* cat_start_session(const char* request_json) {
  return guarded([&](cat::SessionEngine& engine) {
    const auto request = parse_document(request_json, "session request");
    if (!request.is_object() || !request.contains("pool_id") || !request["pool_id"].is_string()) {
      throw std::invalid_argument("Session request requires a 'pool_id' string");
    }
    if (!request.contains("examinee_id") || !request["examinee_id"].is_string()) {
      throw std::invalid_argument("Session request requires an 'examinee_id' string");
    }
    nlohmann::json config_json = nullptr;
    if (request.contains("config")) {
      config_json = request["config"];
    }
    const auto config = cat::bridge::session_config_from_json(config_json);
    const auto session_id = engine.start_session(request["pool_id"].get<std::string>(),
                                                 request["examinee_id"].get<std::string>(), config);
    nlohmann::json payload = ok_envelope();
    payload["session_id"] = session_id;
    return payload;
  });
}

char* cat_next_question(const char* session_id) {
  return guarded([&](cat::SessionEngine& engine) {
    const auto next = engine.get_next_question(require_session_id(session_id));
    nlohmann::json payload = ok_envelope();
    std::visit(
        [&payload](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, cat::Item>) {
            payload["type"] = "question";
            payload["question"] = cat::bridge::question_to_json(value);
          } else {
            payload["type"] = "stop";
            payload["stop"] = cat::bridge::to_json(value);
          }
        },
        next);
    return payload;
  });
}

char* cat_submit_response(const char* session_id, const char* response_json) {
  return guarded([&](cat::SessionEngine& engine) {
    const auto id = require_session_id(session_id);
    const auto response = parse_document(response_json, "response");
    if (!response.is_object() || !response.contains("item_id") || !response["item_id"].is_string()) {
      throw std::invalid_argument("Response requires an 'item_id' string");
    }
    nlohmann::json answer = nullptr;
    if (response.contains("answer")) {
      answer = response["answer"];
    }
    std::optional<double> response_time;
    if (response.contains("response_time") && !response["response_time"].is_null()) {
      if (!response["response_time"].is_number()) {
        throw std::invalid_argument("Expected number for field 'response_time'");
      }
      response_time = response["response_time"].get<double>();
    }
    const auto outcome =
        engine.submit_response(id, response["item_id"].get<std::string>(), answer, response_time);
    nlohmann::json payload = ok_envelope();
    payload["result"] = cat::bridge::to_json(outcome);
    return payload;
  });
}

char* cat_complete_session(const char* session_id) {
  return guarded([&](cat::SessionEngine& engine) {
    const auto report = engine.complete_session(require_session_id(session_id));
    nlohmann::json payload = ok_envelope();
    payload["report"] = cat::bridge::to_json(report);
    return payload;
  });
}

char* cat_abandon_session(const char* session_id) {
  return guarded([&](cat::SessionEngine& engine) {
    engine.abandon_session(require_session_id(session_id));
    return ok_envelope();
  });
}

char* cat_session_state(const char* session_id) {
  return guarded([&](cat::SessionEngine& engine) {
    nlohmann::json payload = ok_envelope();
    payload["state"] = engine.debug_state(require_session_id(session_id));
    return payload;
  });
}

void cat_reset(void) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  s.engine.reset();
  s.persistence.reset();
}

void cat_free_string(char* ptr) {
  std::free(ptr);
}

} // extern "C"
