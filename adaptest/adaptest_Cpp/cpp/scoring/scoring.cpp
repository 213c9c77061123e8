#include "scoring.hpp"

#include "cat/errors.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>
#include <string>

namespace cat::scoring {
namespace {

std::string lowercase(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

std::optional<bool> parse_bool(const nlohmann::json& value) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_string()) {
    const auto text = lowercase(value.get<std::string>());
    if (text == "true") {
      return true;
    }
    if (text == "false") {
      return false;
    }
  }
  return std::nullopt;
}

std::optional<std::vector<std::string>> string_list(const nlohmann::json& value) {
  if (value.is_string()) {
    return std::vector<std::string>{value.get<std::string>()};
  }
  if (!value.is_array()) {
    return std::nullopt;
  }
  std::vector<std::string> out;
  for (const auto& entry : value) {
    if (!entry.is_string()) {
      return std::nullopt;
    }
    out.push_back(entry.get<std::string>());
  }
  std::sort(out.begin(), out.end());
  return out;
}

void validate_multiple_choice(const Item& item) {
  if (item.options.size() < 2) {
    throw InvalidItemParameters("Item '" + item.id +
                                "': multiple_choice needs at least two options");
  }
  std::set<std::string> options;
  for (const auto& option : item.options) {
    if (option.empty()) {
      throw InvalidItemParameters("Item '" + item.id + "': empty answer option");
    }
    if (!options.insert(option).second) {
      throw InvalidItemParameters("Item '" + item.id + "': duplicate answer option '" + option +
                                  "'");
    }
  }

  const auto key = string_list(item.correct_answer);
  if (!key.has_value() || key->empty()) {
    throw InvalidItemParameters("Item '" + item.id +
                                "': multiple_choice key must be an option or a list of options");
  }
  if (std::adjacent_find(key->begin(), key->end()) != key->end()) {
    throw InvalidItemParameters("Item '" + item.id + "': duplicate entries in answer key");
  }
  for (const auto& entry : *key) {
    if (options.count(entry) == 0) {
      throw InvalidItemParameters("Item '" + item.id + "': answer key '" + entry +
                                  "' is not one of the options");
    }
  }
}

bool score_multiple_choice(const Item& item, const nlohmann::json& answer) {
  const auto key = string_list(item.correct_answer);
  const auto given = string_list(answer);
  if (!key.has_value() || !given.has_value()) {
    return false;
  }
  return *key == *given;
}

void validate_true_false(const Item& item) {
  if (!item.options.empty()) {
    std::set<std::string> options;
    for (const auto& option : item.options) {
      options.insert(lowercase(option));
    }
    if (item.options.size() != 2 || options != std::set<std::string>{"true", "false"}) {
      throw InvalidItemParameters("Item '" + item.id +
                                  "': true_false options must be exactly true and false");
    }
  }
  if (!parse_bool(item.correct_answer).has_value()) {
    throw InvalidItemParameters("Item '" + item.id + "': true_false key must be a boolean");
  }
}

bool score_true_false(const Item& item, const nlohmann::json& answer) {
  const auto key = parse_bool(item.correct_answer);
  const auto given = parse_bool(answer);
  return key.has_value() && given.has_value() && *key == *given;
}

const ItemTypeRules kRules[] = {
    {ItemType::MultipleChoice, &validate_multiple_choice, &score_multiple_choice},
    {ItemType::TrueFalse, &validate_true_false, &score_true_false},
};

} // namespace

const ItemTypeRules& rules_for(ItemType type) {
  for (const auto& rules : kRules) {
    if (rules.type == type) {
      return rules;
    }
  }
  throw std::invalid_argument("No scoring rules for item type " + to_string(type));
}

void validate_answer_key(const Item& item) {
  rules_for(item.type).validate_key(item);
}

bool score_answer(const Item& item, const nlohmann::json& answer) {
  return rules_for(item.type).score(item, answer);
}

double aggregate_accuracy(const std::vector<Response>& responses) {
  if (responses.empty()) {
    return 0.0;
  }
  const auto correct = std::count_if(responses.begin(), responses.end(),
                                     [](const Response& r) { return r.is_correct; });
  return static_cast<double>(correct) / static_cast<double>(responses.size());
}

double average_response_time(const std::vector<Response>& responses) {
  double total = 0.0;
  std::size_t count = 0;
  for (const auto& r : responses) {
    if (r.response_time.has_value()) {
      total += *r.response_time;
      ++count;
    }
  }
  return count == 0 ? 0.0 : total / static_cast<double>(count);
}

} // namespace cat::scoring
