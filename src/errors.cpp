#include <tether/errors.h>

#include <format>

namespace tether {

unknown_key_error::unknown_key_error(std::string key)
    : error{std::format("unknown key \"{}\"", key)}, key_{std::move(key)} {}

no_setter_error::no_setter_error(std::string name)
    : error{std::format("computed property \"{}\" has no setter", name)},
      name_{std::move(name)} {}

invalid_path_error::invalid_path_error(std::string path,
                                       const std::string &reason)
    : error{std::format("invalid path \"{}\": {}", path, reason)},
      path_{std::move(path)} {}

reported_error capture_error(std::string origin) {
  auto exception = std::current_exception();
  auto message = std::string{"unknown exception"};
  try {
    std::rethrow_exception(exception);
  } catch (const std::exception &e) {
    message = e.what();
  } catch (...) {
    // Non-standard exception types keep the generic message; the original
    // is still carried in `exception`.
  }

  return {std::move(origin), std::move(message), std::move(exception)};
}

} // namespace tether
