#pragma once

#include <exception>
#include <functional>
#include <stdexcept>
#include <string>

namespace tether {

struct error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// get/set of a key the root store was not constructed with.
class unknown_key_error : public error {
  std::string key_;

public:
  explicit unknown_key_error(std::string key);
  const std::string &key() const { return key_; }
};

// Write to a computed property that has no setter.
class no_setter_error : public error {
  std::string name_;

public:
  explicit no_setter_error(std::string name);
  const std::string &name() const { return name_; }
};

// Watch expression that cannot be resolved (strict paths only).
class invalid_path_error : public error {
  std::string path_;

public:
  invalid_path_error(std::string path, const std::string &reason);
  const std::string &path() const { return path_; }
};

struct type_error : error {
  using error::error;
};

struct definition_error : error {
  using error::error;
};

struct lifecycle_error : error {
  using error::error;
};

struct cycle_error : error {
  using error::error;
};

struct flush_limit_error : error {
  using error::error;
};

// An exception caught at an evaluator, hook or tick boundary.
struct reported_error {
  std::string origin;
  std::string message;
  std::exception_ptr exception;
};

using error_handler_t = std::function<void(const reported_error &)>;

// Builds a reported_error from the exception currently being handled.
// Must be called from inside a catch block.
reported_error capture_error(std::string origin);

} // namespace tether
