#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// Missing or malformed input. Maps to 400.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Email already held by another customer. Maps to 409.
class ConflictError : public std::runtime_error {
 public:
  ConflictError(const std::string& msg, std::string existing_id)
      : std::runtime_error(msg), existing_id_(std::move(existing_id)) {}

  const std::string& existing_id() const { return existing_id_; }

 private:
  std::string existing_id_;
};
