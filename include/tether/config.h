#pragma once

#include <tether/errors.h>

namespace tether {

struct config_t {
  // Raise invalid_path_error when a watch path does not resolve at
  // registration, instead of watching undefined.
  bool strict_paths = false;

  // Receives every exception caught at an evaluator or hook boundary of the
  // instance. When empty, the context's on_error is used, and without that
  // the error is recorded on the instance and logged.
  error_handler_t on_error;
};

} // namespace tether
