#pragma once

#include "cat/types.hpp"

#include <vector>

#include <nlohmann/json.hpp>

namespace cat::scoring {

// One entry per ItemType: how its answer key is validated and how answers are scored.
struct ItemTypeRules {
  ItemType type;
  void (*validate_key)(const Item& item);
  bool (*score)(const Item& item, const nlohmann::json& answer);
};

const ItemTypeRules& rules_for(ItemType type);

// Throws InvalidItemParameters when the options or key do not fit the item type.
void validate_answer_key(const Item& item);

// Malformed answers score as incorrect.
bool score_answer(const Item& item, const nlohmann::json& answer);

double aggregate_accuracy(const std::vector<Response>& responses);

double average_response_time(const std::vector<Response>& responses);

} // namespace cat::scoring
