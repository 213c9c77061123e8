#pragma once

#include <stdexcept>
#include <string>

namespace cat {

// Raised while authoring a pool; never raised mid-session.
class InvalidItemParameters : public std::invalid_argument {
public:
  explicit InvalidItemParameters(const std::string& message)
      : std::invalid_argument(message) {}
};

// Expected condition: the caller should complete the session.
class NoEligibleItemsError : public std::runtime_error {
public:
  explicit NoEligibleItemsError(const std::string& message)
      : std::runtime_error(message) {}
};

class InvalidStateTransitionError : public std::runtime_error {
public:
  explicit InvalidStateTransitionError(const std::string& message)
      : std::runtime_error(message) {}
};

// Safety net only. Theta is clamped on every iteration, so this should never surface.
class EstimationDivergenceError : public std::runtime_error {
public:
  explicit EstimationDivergenceError(const std::string& message)
      : std::runtime_error(message) {}
};

class UnknownItemError : public std::runtime_error {
public:
  explicit UnknownItemError(const std::string& message)
      : std::runtime_error(message) {}
};

class UnknownSessionError : public std::runtime_error {
public:
  explicit UnknownSessionError(const std::string& message)
      : std::runtime_error(message) {}
};

class UnknownPoolError : public std::runtime_error {
public:
  explicit UnknownPoolError(const std::string& message)
      : std::runtime_error(message) {}
};

} // namespace cat
