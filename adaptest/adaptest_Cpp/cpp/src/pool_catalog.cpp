#include "cat/pool_catalog.hpp"

#include "debug_log.hpp"
#include "json_bridge.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace cat {

std::shared_ptr<QuestionPool> load_pool_json(const nlohmann::json& document) {
  auto pool = std::make_shared<QuestionPool>(bridge::pool_info_from_json(document));
  if (!document.contains("items") || !document["items"].is_array()) {
    throw std::invalid_argument("Pool JSON must contain an 'items' array");
  }
  for (const auto& entry : document["items"]) {
    pool->add_item(bridge::item_from_json(entry));
  }
  detail::debug_log("pool", "loaded pool " + pool->id() + " with " +
                                std::to_string(pool->size()) + " items");
  return pool;
}

std::shared_ptr<QuestionPool> load_pool_file(const std::string& pool_path) {
  if (pool_path.empty()) {
    throw std::invalid_argument("Pool path is empty");
  }

  std::filesystem::path path{pool_path};
  if (!path.is_absolute()) {
    path = std::filesystem::current_path() / path;
  }
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Pool file not found at: " + path.string());
  }
  if (path.extension() != ".json") {
    throw std::runtime_error("Pool must be provided as JSON: " + path.string());
  }

  std::ifstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open pool file: " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::invalid_argument("Malformed pool JSON in " + path.string() + ": " + ex.what());
  }
  return load_pool_json(document);
}

} // namespace cat
